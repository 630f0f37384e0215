//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Interpreter.cpp
// Purpose: Statement execution, limits and module loading for the native
//          interpreter.
// Key invariants: A trap leaving a statement carries the line of the
//                 innermost statement that raised it.
// Ownership/Lifetime: See Interpreter.hpp.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "vm/Interpreter.hpp"

#include "vm/Builtins.hpp"
#include "vm/Format.hpp"
#include "vm/Operators.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace fusion::vm
{

using namespace frontends::py;

namespace
{

constexpr size_t kMaxOutputBytes = 16u << 20;
constexpr uint64_t kClockCheckInterval = 64;

/// Restores a Value slot when a handler scope ends.
class RestoreValue
{
  public:
    RestoreValue(Value &slot, Value next) : slot_(slot), saved_(std::exchange(slot, std::move(next))) {}

    ~RestoreValue()
    {
        slot_ = std::move(saved_);
    }

    RestoreValue(const RestoreValue &) = delete;
    RestoreValue &operator=(const RestoreValue &) = delete;

  private:
    Value &slot_;
    Value saved_;
};

} // namespace

Interpreter::Interpreter(Environment &env, InterpreterLimits limits, const common::CancelToken *cancel)
    : env_(env), limits_(limits), cancel_(cancel),
      deadline_(std::chrono::steady_clock::now() + limits.timeout)
{
}

Interpreter::FrameScope::FrameScope(Interpreter &interp, std::shared_ptr<Frame> frame)
    : interp_(interp), saved_(std::exchange(interp.frame_, std::move(frame)))
{
}

Interpreter::FrameScope::~FrameScope()
{
    interp_.frame_ = std::move(saved_);
}

void Interpreter::execute(const std::shared_ptr<const Module> &module)
{
    if (!module)
        return;
    owner_ = module;
    const Flow flow = execBlock(module->body);
    if (flow == Flow::Break || flow == Flow::Continue)
        throwNative(NativeErrorKind::SyntaxError, "'break' or 'continue' outside loop");
}

Value Interpreter::evaluate(const Expr &expr)
{
    checkLimits();
    return eval(expr);
}

void Interpreter::write(std::string_view text)
{
    if (output_.size() + text.size() > kMaxOutputBytes)
        throwNative(NativeErrorKind::RuntimeError, "output limit exceeded");
    output_.append(text);
}

void Interpreter::checkLimits()
{
    if (common::isCancelled(cancel_))
        throwNative(NativeErrorKind::Cancelled, "run cancelled");
    if (steps_ > limits_.maxSteps)
        throwNative(NativeErrorKind::Timeout,
                    "step budget of " + std::to_string(limits_.maxSteps) + " statements exhausted");
    if (std::chrono::steady_clock::now() >= deadline_)
        throwNative(NativeErrorKind::Timeout,
                    "native block exceeded " + std::to_string(limits_.timeout.count()) + " ms");
}

void Interpreter::tick()
{
    ++steps_;
    if (steps_ > limits_.maxSteps || steps_ % kClockCheckInterval == 1)
    {
        checkLimits();
        return;
    }
    if (common::isCancelled(cancel_))
        throwNative(NativeErrorKind::Cancelled, "run cancelled");
}

Interpreter::Flow Interpreter::execBlock(const StmtList &body)
{
    for (const auto &stmt : body)
    {
        const Flow flow = execStmt(*stmt);
        if (flow != Flow::Normal)
            return flow;
    }
    return Flow::Normal;
}

Interpreter::Flow Interpreter::execStmt(const Stmt &stmt)
{
    try
    {
        tick();
        return execStmtKind(stmt);
    }
    catch (NativeTrap &trap)
    {
        trap.setLineIfUnknown(stmt.loc.line);
        throw;
    }
}

Interpreter::Flow Interpreter::execStmtKind(const Stmt &stmt)
{
    switch (stmt.kind)
    {
        case StmtKind::Expr:
            eval(*static_cast<const ExprStmt &>(stmt).expr);
            return Flow::Normal;
        case StmtKind::Assign:
        {
            const auto &s = static_cast<const AssignStmt &>(stmt);
            Value value = eval(*s.value);
            for (const auto &target : s.targets)
                assign(*target, value);
            return Flow::Normal;
        }
        case StmtKind::AugAssign:
            execAugAssign(static_cast<const AugAssignStmt &>(stmt));
            return Flow::Normal;
        case StmtKind::If:
        {
            const auto &s = static_cast<const IfStmt &>(stmt);
            if (eval(*s.condition).truthy())
                return execBlock(s.body);
            return execBlock(s.orelse);
        }
        case StmtKind::While:
            return execWhile(static_cast<const WhileStmt &>(stmt));
        case StmtKind::For:
            return execFor(static_cast<const ForStmt &>(stmt));
        case StmtKind::Break:
            return Flow::Break;
        case StmtKind::Continue:
            return Flow::Continue;
        case StmtKind::Pass:
            return Flow::Normal;
        case StmtKind::Return:
        {
            if (!frame_)
                throwNative(NativeErrorKind::SyntaxError, "'return' outside function");
            const auto &s = static_cast<const ReturnStmt &>(stmt);
            returnValue_ = s.value ? eval(*s.value) : Value::none();
            return Flow::Return;
        }
        case StmtKind::FunctionDef:
            defineFunction(static_cast<const FunctionDefStmt &>(stmt));
            return Flow::Normal;
        case StmtKind::Global:
            if (frame_)
            {
                for (const auto &name : static_cast<const GlobalStmt &>(stmt).names)
                {
                    frame_->locals.erase(name);
                    frame_->globals.insert(name);
                }
            }
            return Flow::Normal;
        case StmtKind::Import:
            execImport(static_cast<const ImportStmt &>(stmt));
            return Flow::Normal;
        case StmtKind::ImportFrom:
            execImportFrom(static_cast<const ImportFromStmt &>(stmt));
            return Flow::Normal;
        case StmtKind::Try:
            return execTry(static_cast<const TryStmt &>(stmt));
        case StmtKind::Raise:
            execRaise(static_cast<const RaiseStmt &>(stmt));
            return Flow::Normal;
        case StmtKind::Del:
            for (const auto &target : static_cast<const DelStmt &>(stmt).targets)
                deleteTarget(*target);
            return Flow::Normal;
    }
    throwNative(NativeErrorKind::RuntimeError, "unsupported statement");
}

void Interpreter::execAugAssign(const AugAssignStmt &stmt)
{
    const Expr &target = *stmt.target;
    switch (target.kind)
    {
        case ExprKind::Name:
        {
            const auto &name = static_cast<const NameExpr &>(target).name;
            Value current = lookupName(name);
            Value rhs = eval(*stmt.value);
            if (current.kind() == Value::Kind::List && stmt.op == BinaryOp::Add)
            {
                ValueList extra = iterate(rhs);
                auto &items = current.asList();
                items.insert(items.end(), extra.begin(), extra.end());
                storeName(name, std::move(current));
                return;
            }
            storeName(name, binaryOp(stmt.op, current, rhs));
            return;
        }
        case ExprKind::Subscript:
        {
            const auto &sub = static_cast<const SubscriptExpr &>(target);
            if (sub.index->kind == ExprKind::Slice)
                throwNative(NativeErrorKind::TypeError, "augmented assignment to a slice is not supported");
            Value object = eval(*sub.object);
            Value index = eval(*sub.index);
            Value rhs = eval(*stmt.value);
            setItem(object, index, binaryOp(stmt.op, getItem(object, index), rhs));
            markMutated(*sub.object);
            return;
        }
        case ExprKind::Attribute:
        {
            const auto &attr = static_cast<const AttributeExpr &>(target);
            Value object = eval(*attr.object);
            Value rhs = eval(*stmt.value);
            Value updated = binaryOp(stmt.op, getAttribute(object, attr.attr), rhs);
            if (object.kind() != Value::Kind::Module)
                throwNative(NativeErrorKind::AttributeError,
                            "'" + std::string(object.typeName()) + "' object attribute '" + attr.attr +
                                "' is read-only");
            object.asModule().attrs[attr.attr] = std::move(updated);
            return;
        }
        default:
            throwNative(NativeErrorKind::SyntaxError, "illegal expression for augmented assignment");
    }
}

Interpreter::Flow Interpreter::execWhile(const WhileStmt &stmt)
{
    while (eval(*stmt.condition).truthy())
    {
        const Flow flow = execBlock(stmt.body);
        if (flow == Flow::Break)
            return Flow::Normal;
        if (flow == Flow::Return)
            return flow;
        tick();
    }
    return execBlock(stmt.orelse);
}

Interpreter::Flow Interpreter::execFor(const ForStmt &stmt)
{
    const ValueList items = iterate(eval(*stmt.iterable));
    for (const auto &item : items)
    {
        assign(*stmt.target, item);
        const Flow flow = execBlock(stmt.body);
        if (flow == Flow::Break)
            return Flow::Normal;
        if (flow == Flow::Return)
            return flow;
    }
    return execBlock(stmt.orelse);
}

bool Interpreter::handlerMatches(const ExceptHandler &handler, NativeErrorKind kind)
{
    if (!handler.type)
        return true;
    const Value type = eval(*handler.type);
    auto matchOne = [&](const Value &v) {
        if (v.kind() != Value::Kind::Function || !v.asFunction().exceptionType)
            throwNative(NativeErrorKind::TypeError,
                        "catching classes that do not inherit from BaseException is not allowed");
        const NativeErrorKind want = *v.asFunction().exceptionType;
        return want == NativeErrorKind::Exception || want == kind;
    };
    if (type.kind() == Value::Kind::Tuple)
    {
        for (const auto &v : type.asTuple())
        {
            if (matchOne(v))
                return true;
        }
        return false;
    }
    return matchOne(type);
}

Interpreter::Flow Interpreter::execTryBody(const TryStmt &stmt)
{
    Flow flow = Flow::Normal;
    try
    {
        flow = execBlock(stmt.body);
    }
    catch (const NativeTrap &trap)
    {
        const NativeError &err = trap.error();
        if (!isCatchable(err.kind))
            throw;
        for (const auto &handler : stmt.handlers)
        {
            if (!handlerMatches(handler, err.kind))
                continue;
            Value exc = Value::exception(err.kind, err.message);
            if (!handler.name.empty())
                storeName(handler.name, exc);
            RestoreValue active(activeException_, std::move(exc));
            return execBlock(handler.body);
        }
        throw;
    }
    if (flow == Flow::Normal)
        flow = execBlock(stmt.orelse);
    return flow;
}

Interpreter::Flow Interpreter::execTry(const TryStmt &stmt)
{
    if (stmt.finalbody.empty())
        return execTryBody(stmt);

    Flow flow = Flow::Normal;
    std::optional<NativeTrap> pending;
    try
    {
        flow = execTryBody(stmt);
    }
    catch (const NativeTrap &trap)
    {
        if (!isCatchable(trap.error().kind))
            throw;
        pending = trap;
    }

    Value savedReturn = returnValue_;
    const Flow finalFlow = execBlock(stmt.finalbody);
    if (finalFlow != Flow::Normal)
        return finalFlow; // control transfer in `finally` replaces the pending outcome
    returnValue_ = std::move(savedReturn);
    if (pending)
        throw *pending;
    return flow;
}

void Interpreter::execRaise(const RaiseStmt &stmt)
{
    if (!stmt.exception)
    {
        if (activeException_.kind() != Value::Kind::Exception)
            throwNative(NativeErrorKind::RuntimeError, "No active exception to reraise");
        const auto &e = activeException_.asException();
        throwNative(e.kind, e.message);
    }
    const Value v = eval(*stmt.exception);
    if (v.kind() == Value::Kind::Exception)
        throwNative(v.asException().kind, v.asException().message);
    if (v.kind() == Value::Kind::Function && v.asFunction().exceptionType)
        throwNative(*v.asFunction().exceptionType, "");
    throwNative(NativeErrorKind::TypeError, "exceptions must derive from BaseException");
}

Value Interpreter::loadModule(const std::string &name)
{
    if (const Value *cached = env_.loadedModule(name))
        return *cached;
    auto module = makeSandboxModule(name);
    if (!module)
        throwNative(NativeErrorKind::ImportError, "module '" + name + "' is not available in the sandbox");
    Value v = Value::module(std::move(module));
    env_.cacheModule(name, v);
    return v;
}

void Interpreter::importModule(const std::string &module, const std::string &bindAs)
{
    storeName(bindAs.empty() ? module : bindAs, loadModule(module));
}

void Interpreter::execImport(const ImportStmt &stmt)
{
    for (const auto &alias : stmt.names)
        importModule(alias.module, alias.asName);
}

void Interpreter::execImportFrom(const ImportFromStmt &stmt)
{
    const Value module = loadModule(stmt.module);
    const auto &attrs = module.asModule().attrs;
    for (const auto &alias : stmt.names)
    {
        if (alias.module == "*")
        {
            std::vector<std::string> names;
            for (const auto &[name, value] : attrs)
            {
                if (!name.empty() && name[0] != '_')
                    names.push_back(name);
            }
            std::sort(names.begin(), names.end());
            for (const auto &name : names)
                storeName(name, attrs.at(name));
            continue;
        }
        auto it = attrs.find(alias.module);
        if (it == attrs.end())
            throwNative(NativeErrorKind::ImportError,
                        "cannot import name '" + alias.module + "' from '" + stmt.module + "'");
        storeName(alias.asName.empty() ? alias.module : alias.asName, it->second);
    }
}

void Interpreter::defineFunction(const FunctionDefStmt &stmt)
{
    auto fn = std::make_shared<FunctionObject>();
    fn->name = stmt.name;
    fn->def = &stmt;
    fn->keepAlive = owner_;
    fn->closure = frame_;
    for (const auto &param : stmt.params)
    {
        if (param.defaultValue)
            fn->defaults.push_back(eval(*param.defaultValue));
    }
    storeName(stmt.name, Value::function(std::move(fn)));
}

} // namespace fusion::vm
