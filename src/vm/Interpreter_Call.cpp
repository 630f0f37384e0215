//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Interpreter_Call.cpp
// Purpose: Name resolution and function invocation for the native
//          interpreter.
// Key invariants: Lookup order is local scope, enclosing scopes, globals,
//                 builtins. Stores go to the innermost scope unless the name
//                 was declared `global`.
// Ownership/Lifetime: Frames are shared with closures created inside them.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "vm/Interpreter.hpp"

#include "vm/Builtins.hpp"

#include <string_view>
#include <utility>
#include <vector>

namespace fusion::vm
{

using namespace frontends::py;

namespace
{

std::string joinMissing(const std::vector<std::string_view> &names)
{
    std::string out;
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (i > 0)
            out += i + 1 == names.size() ? " and " : ", ";
        out += "'" + std::string(names[i]) + "'";
    }
    return out;
}

} // namespace

bool Interpreter::isLocal(const std::string &name) const
{
    for (const Frame *f = frame_.get(); f; f = f->parent.get())
    {
        if (f->globals.count(name))
            return false;
        if (f->locals.count(name))
            return true;
    }
    return false;
}

Value Interpreter::lookupName(const std::string &name)
{
    for (const Frame *f = frame_.get(); f; f = f->parent.get())
    {
        if (f->globals.count(name))
            break;
        auto it = f->locals.find(name);
        if (it != f->locals.end())
            return it->second;
    }
    if (const Value *v = env_.lookup(name))
        return *v;
    const auto &builtins = builtinTable();
    auto it = builtins.find(name);
    if (it != builtins.end())
        return it->second;
    throwNative(NativeErrorKind::NameError, "name '" + name + "' is not defined");
}

void Interpreter::storeName(const std::string &name, Value value)
{
    if (frame_ && !frame_->globals.count(name))
    {
        frame_->locals[name] = std::move(value);
        return;
    }
    env_.assign(name, std::move(value));
}

void Interpreter::deleteName(const std::string &name)
{
    if (frame_ && !frame_->globals.count(name))
    {
        if (frame_->locals.erase(name) == 0)
            throwNative(NativeErrorKind::NameError, "name '" + name + "' is not defined");
        return;
    }
    if (!env_.erase(name))
        throwNative(NativeErrorKind::NameError, "name '" + name + "' is not defined");
}

Value Interpreter::call(const Value &callee, ValueList args, KeywordArgs kwargs)
{
    if (callee.kind() != Value::Kind::Function)
        throwNative(NativeErrorKind::TypeError, "'" + std::string(callee.typeName()) + "' object is not callable");
    // Hold the callee so rebinding its name during the call cannot free it.
    const Value hold = callee;
    return callFunction(hold.asFunction(), args, kwargs);
}

Value Interpreter::callFunction(const FunctionObject &fn, ValueList &args, KeywordArgs &kwargs)
{
    if (!fn.self.isNone())
        return callMethod(*this, fn.self, fn.name, args, kwargs);
    if (fn.isBuiltin())
        return fn.builtin(*this, args, kwargs);

    std::vector<std::string_view> params;
    if (fn.def)
    {
        for (const auto &p : fn.def->params)
            params.push_back(p.name);
    }
    else if (fn.lambda)
    {
        for (const auto &p : fn.lambda->params)
            params.push_back(p);
    }
    else
    {
        throwNative(NativeErrorKind::TypeError, "'" + fn.name + "' is not callable");
    }

    if (args.size() > params.size())
        throwNative(NativeErrorKind::TypeError,
                    fn.name + "() takes " + std::to_string(params.size()) + " positional argument" +
                        (params.size() == 1 ? "" : "s") + " but " + std::to_string(args.size()) +
                        (args.size() == 1 ? " was" : " were") + " given");

    auto frame = std::make_shared<Frame>();
    frame->parent = fn.closure;
    std::vector<bool> bound(params.size(), false);
    for (size_t i = 0; i < args.size(); ++i)
    {
        frame->locals[std::string(params[i])] = std::move(args[i]);
        bound[i] = true;
    }
    for (auto &[name, value] : kwargs)
    {
        size_t idx = params.size();
        for (size_t i = 0; i < params.size(); ++i)
        {
            if (params[i] == name)
                idx = i;
        }
        if (idx == params.size())
            throwNative(NativeErrorKind::TypeError, fn.name + "() got an unexpected keyword argument '" + name + "'");
        if (bound[idx])
            throwNative(NativeErrorKind::TypeError, fn.name + "() got multiple values for argument '" + name + "'");
        frame->locals[name] = std::move(value);
        bound[idx] = true;
    }
    const size_t firstDefault = params.size() - fn.defaults.size();
    std::vector<std::string_view> missing;
    for (size_t i = 0; i < params.size(); ++i)
    {
        if (bound[i])
            continue;
        if (i >= firstDefault)
            frame->locals[std::string(params[i])] = fn.defaults[i - firstDefault];
        else
            missing.push_back(params[i]);
    }
    if (!missing.empty())
        throwNative(NativeErrorKind::TypeError,
                    fn.name + "() missing " + std::to_string(missing.size()) + " required positional argument" +
                        (missing.size() == 1 ? "" : "s") + ": " + joinMissing(missing));

    if (callDepth_ >= limits_.maxCallDepth)
        throwNative(NativeErrorKind::RecursionError, "maximum recursion depth exceeded");

    struct DepthScope
    {
        Interpreter &in;
        std::shared_ptr<const void> savedOwner;

        ~DepthScope()
        {
            --in.callDepth_;
            in.owner_ = std::move(savedOwner);
        }
    } depth{*this, owner_};
    ++callDepth_;
    if (fn.keepAlive)
        owner_ = fn.keepAlive;

    FrameScope scope(*this, std::move(frame));
    if (fn.lambda)
        return eval(*fn.lambda->body);

    const Flow flow = execBlock(fn.def->body);
    if (flow == Flow::Break || flow == Flow::Continue)
        throwNative(NativeErrorKind::SyntaxError, "'break' or 'continue' outside loop");
    if (flow == Flow::Return)
        return std::exchange(returnValue_, Value::none());
    return Value::none();
}

} // namespace fusion::vm
