//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Interpreter_Expr.cpp
// Purpose: Expression evaluation and assignment targets for the native
//          interpreter.
// Key invariants: Operands evaluate left to right; `and`/`or` return the
//                 deciding operand, not a bool.
// Ownership/Lifetime: See Interpreter.hpp.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "vm/Interpreter.hpp"

#include "vm/Builtins.hpp"
#include "vm/Format.hpp"
#include "vm/Operators.hpp"

#include <limits>

namespace fusion::vm
{

using namespace frontends::py;

namespace
{

bool compareOne(CompareOp op, const Value &l, const Value &r)
{
    switch (op)
    {
        case CompareOp::Eq:
            return l == r;
        case CompareOp::Ne:
            return l != r;
        case CompareOp::Lt:
            return lessThan(l, r);
        case CompareOp::Le:
            return lessThan(l, r) || l == r;
        case CompareOp::Gt:
            return lessThan(r, l);
        case CompareOp::Ge:
            return lessThan(r, l) || l == r;
        case CompareOp::In:
            return contains(r, l);
        case CompareOp::NotIn:
            return !contains(r, l);
        case CompareOp::Is:
            return identical(l, r);
        case CompareOp::IsNot:
            return !identical(l, r);
    }
    return false;
}

Value unaryOp(UnaryOp op, const Value &v)
{
    if (op == UnaryOp::Not)
        return Value::boolean(!v.truthy());
    if (v.isIntegral())
    {
        const int64_t i = v.asInt();
        if (op == UnaryOp::Pos)
            return Value::integer(i);
        if (i == std::numeric_limits<int64_t>::min())
            throwNative(NativeErrorKind::OverflowError, "integer result out of 64-bit range");
        return Value::integer(-i);
    }
    if (v.kind() == Value::Kind::Float)
        return Value::real(op == UnaryOp::Neg ? -v.asFloat() : v.asFloat());
    throwNative(NativeErrorKind::TypeError,
                std::string("bad operand type for unary ") + (op == UnaryOp::Neg ? "-" : "+") + ": '" +
                    std::string(v.typeName()) + "'");
}

} // namespace

Value Interpreter::eval(const Expr &expr)
{
    switch (expr.kind)
    {
        case ExprKind::Name:
            return lookupName(static_cast<const NameExpr &>(expr).name);
        case ExprKind::IntLiteral:
            return Value::integer(static_cast<const IntLiteralExpr &>(expr).value);
        case ExprKind::FloatLiteral:
            return Value::real(static_cast<const FloatLiteralExpr &>(expr).value);
        case ExprKind::StringLiteral:
            return Value::string(static_cast<const StringLiteralExpr &>(expr).value);
        case ExprKind::FString:
            return evalFString(static_cast<const FStringExpr &>(expr));
        case ExprKind::BoolLiteral:
            return Value::boolean(static_cast<const BoolLiteralExpr &>(expr).value);
        case ExprKind::NoneLiteral:
            return Value::none();
        case ExprKind::List:
        case ExprKind::Tuple:
        {
            const ExprList &elems = expr.kind == ExprKind::List ? static_cast<const ListExpr &>(expr).elements
                                                                : static_cast<const TupleExpr &>(expr).elements;
            ValueList items;
            items.reserve(elems.size());
            for (const auto &e : elems)
                items.push_back(eval(*e));
            return expr.kind == ExprKind::List ? Value::list(std::move(items)) : Value::tuple(std::move(items));
        }
        case ExprKind::Dict:
        {
            Value d = Value::dict();
            for (const auto &[k, v] : static_cast<const DictExpr &>(expr).entries)
            {
                Value key = eval(*k);
                d.asDict().set(key, eval(*v));
            }
            return d;
        }
        case ExprKind::Binary:
        {
            const auto &b = static_cast<const BinaryExpr &>(expr);
            Value lhs = eval(*b.left);
            Value rhs = eval(*b.right);
            return binaryOp(b.op, lhs, rhs);
        }
        case ExprKind::Unary:
        {
            const auto &u = static_cast<const UnaryExpr &>(expr);
            return unaryOp(u.op, eval(*u.operand));
        }
        case ExprKind::BoolOp:
        {
            const auto &b = static_cast<const BoolOpExpr &>(expr);
            Value lhs = eval(*b.left);
            if (lhs.truthy() != b.isAnd)
                return lhs;
            return eval(*b.right);
        }
        case ExprKind::Compare:
            return evalCompare(static_cast<const CompareExpr &>(expr));
        case ExprKind::Call:
            return evalCall(static_cast<const CallExpr &>(expr));
        case ExprKind::Attribute:
        {
            const auto &a = static_cast<const AttributeExpr &>(expr);
            return getAttribute(eval(*a.object), a.attr);
        }
        case ExprKind::Subscript:
            return evalSubscript(static_cast<const SubscriptExpr &>(expr));
        case ExprKind::Slice:
            throwNative(NativeErrorKind::SyntaxError, "slice is only valid inside a subscript");
        case ExprKind::Conditional:
        {
            const auto &c = static_cast<const ConditionalExpr &>(expr);
            return eval(*c.condition).truthy() ? eval(*c.thenExpr) : eval(*c.elseExpr);
        }
        case ExprKind::ListComp:
            return evalListComp(static_cast<const ListCompExpr &>(expr));
        case ExprKind::Lambda:
            return makeLambda(static_cast<const LambdaExpr &>(expr));
    }
    throwNative(NativeErrorKind::RuntimeError, "unsupported expression");
}

Value Interpreter::evalCompare(const CompareExpr &cmp)
{
    Value left = eval(*cmp.first);
    for (const auto &[op, expr] : cmp.rest)
    {
        Value right = eval(*expr);
        if (!compareOne(op, left, right))
            return Value::boolean(false);
        left = std::move(right);
    }
    return Value::boolean(true);
}

Value Interpreter::evalCall(const CallExpr &call)
{
    Value callee;
    if (call.callee->kind == ExprKind::Attribute)
    {
        const auto &attr = static_cast<const AttributeExpr &>(*call.callee);
        Value object = eval(*attr.object);
        const auto k = object.kind();
        if ((k == Value::Kind::Str || k == Value::Kind::List || k == Value::Kind::Dict) && hasMethod(object, attr.attr))
        {
            ValueList args;
            for (const auto &a : call.args)
                args.push_back(eval(*a));
            KeywordArgs kwargs;
            for (const auto &kw : call.kwargs)
                kwargs.emplace_back(kw.name, eval(*kw.value));
            Value result = callMethod(*this, object, attr.attr, args, kwargs);
            if (k != Value::Kind::Str && isMutatingMethod(attr.attr))
                markMutated(*attr.object);
            return result;
        }
        callee = getAttribute(object, attr.attr);
    }
    else
    {
        callee = eval(*call.callee);
    }

    ValueList args;
    args.reserve(call.args.size());
    for (const auto &a : call.args)
        args.push_back(eval(*a));
    KeywordArgs kwargs;
    for (const auto &kw : call.kwargs)
        kwargs.emplace_back(kw.name, eval(*kw.value));
    return this->call(callee, std::move(args), std::move(kwargs));
}

SliceBounds Interpreter::evalSliceBounds(const SliceExpr &slice)
{
    auto part = [&](const ExprPtr &e) -> std::optional<int64_t> {
        if (!e)
            return std::nullopt;
        Value v = eval(*e);
        if (v.isNone())
            return std::nullopt;
        if (!v.isIntegral())
            throwNative(NativeErrorKind::TypeError, "slice indices must be integers or None");
        return v.asInt();
    };
    SliceBounds bounds;
    bounds.lower = part(slice.lower);
    bounds.upper = part(slice.upper);
    bounds.step = part(slice.step);
    return bounds;
}

Value Interpreter::evalSubscript(const SubscriptExpr &sub)
{
    Value object = eval(*sub.object);
    if (sub.index->kind == ExprKind::Slice)
        return getSlice(object, evalSliceBounds(static_cast<const SliceExpr &>(*sub.index)));
    return getItem(object, eval(*sub.index));
}

Value Interpreter::evalFString(const FStringExpr &fstr)
{
    std::string out;
    for (const auto &part : fstr.parts)
    {
        if (!part.expr)
        {
            out += part.literal;
            continue;
        }
        Value v = eval(*part.expr);
        if (part.conversion == 'r')
            v = Value::string(toRepr(v));
        else if (part.conversion == 's')
            v = Value::string(toStr(v));
        out += formatWithSpec(v, part.spec);
    }
    return Value::string(std::move(out));
}

Value Interpreter::evalListComp(const ListCompExpr &comp)
{
    const ValueList source = iterate(eval(*comp.iterable));
    auto scope = std::make_shared<Frame>();
    scope->parent = frame_;
    FrameScope guard(*this, std::move(scope));

    ValueList out;
    for (const auto &item : source)
    {
        tick();
        assign(*comp.target, item);
        bool keep = true;
        for (const auto &cond : comp.conditions)
        {
            if (!eval(*cond).truthy())
            {
                keep = false;
                break;
            }
        }
        if (keep)
            out.push_back(eval(*comp.element));
    }
    return Value::list(std::move(out));
}

Value Interpreter::makeLambda(const LambdaExpr &lambda)
{
    auto fn = std::make_shared<FunctionObject>();
    fn->name = "<lambda>";
    fn->lambda = &lambda;
    fn->keepAlive = owner_;
    fn->closure = frame_;
    return Value::function(std::move(fn));
}

Value Interpreter::getAttribute(const Value &object, const std::string &attr)
{
    switch (object.kind())
    {
        case Value::Kind::Module:
        {
            const auto &m = object.asModule();
            auto it = m.attrs.find(attr);
            if (it == m.attrs.end())
                throwNative(NativeErrorKind::AttributeError, "module '" + m.name + "' has no attribute '" + attr + "'");
            return it->second;
        }
        case Value::Kind::Str:
        case Value::Kind::List:
        case Value::Kind::Dict:
            if (hasMethod(object, attr))
            {
                auto bound = std::make_shared<FunctionObject>();
                bound->name = attr;
                bound->self = object;
                return Value::function(std::move(bound));
            }
            break;
        case Value::Kind::Function:
            if (attr == "__name__")
                return Value::string(object.asFunction().name);
            break;
        case Value::Kind::Exception:
            if (attr == "args")
                return Value::tuple({Value::string(object.asException().message)});
            break;
        default:
            break;
    }
    throwNative(NativeErrorKind::AttributeError,
                "'" + std::string(object.typeName()) + "' object has no attribute '" + attr + "'");
}

void Interpreter::assign(const Expr &target, Value value)
{
    switch (target.kind)
    {
        case ExprKind::Name:
            storeName(static_cast<const NameExpr &>(target).name, std::move(value));
            return;
        case ExprKind::Tuple:
        case ExprKind::List:
        {
            const ExprList &elems = target.kind == ExprKind::List ? static_cast<const ListExpr &>(target).elements
                                                                  : static_cast<const TupleExpr &>(target).elements;
            ValueList items = iterate(value);
            if (items.size() < elems.size())
                throwNative(NativeErrorKind::ValueError,
                            "not enough values to unpack (expected " + std::to_string(elems.size()) + ", got " +
                                std::to_string(items.size()) + ")");
            if (items.size() > elems.size())
                throwNative(NativeErrorKind::ValueError,
                            "too many values to unpack (expected " + std::to_string(elems.size()) + ")");
            for (size_t i = 0; i < elems.size(); ++i)
                assign(*elems[i], std::move(items[i]));
            return;
        }
        case ExprKind::Subscript:
        {
            const auto &sub = static_cast<const SubscriptExpr &>(target);
            Value object = eval(*sub.object);
            if (sub.index->kind == ExprKind::Slice)
                setSlice(object, evalSliceBounds(static_cast<const SliceExpr &>(*sub.index)), value);
            else
                setItem(object, eval(*sub.index), std::move(value));
            markMutated(*sub.object);
            return;
        }
        case ExprKind::Attribute:
        {
            const auto &attr = static_cast<const AttributeExpr &>(target);
            Value object = eval(*attr.object);
            if (object.kind() != Value::Kind::Module)
                throwNative(NativeErrorKind::AttributeError,
                            "'" + std::string(object.typeName()) + "' object has no writable attribute '" +
                                attr.attr + "'");
            object.asModule().attrs[attr.attr] = std::move(value);
            return;
        }
        default:
            throwNative(NativeErrorKind::SyntaxError, "cannot assign to expression");
    }
}

void Interpreter::deleteTarget(const Expr &target)
{
    switch (target.kind)
    {
        case ExprKind::Name:
            deleteName(static_cast<const NameExpr &>(target).name);
            return;
        case ExprKind::Tuple:
        case ExprKind::List:
        {
            const ExprList &elems = target.kind == ExprKind::List ? static_cast<const ListExpr &>(target).elements
                                                                  : static_cast<const TupleExpr &>(target).elements;
            for (const auto &e : elems)
                deleteTarget(*e);
            return;
        }
        case ExprKind::Subscript:
        {
            const auto &sub = static_cast<const SubscriptExpr &>(target);
            Value object = eval(*sub.object);
            if (sub.index->kind == ExprKind::Slice)
                delSlice(object, evalSliceBounds(static_cast<const SliceExpr &>(*sub.index)));
            else
                delItem(object, eval(*sub.index));
            markMutated(*sub.object);
            return;
        }
        default:
            throwNative(NativeErrorKind::SyntaxError, "cannot delete expression");
    }
}

void Interpreter::markMutated(const Expr &target)
{
    const Expr *e = &target;
    while (e->kind == ExprKind::Subscript || e->kind == ExprKind::Attribute)
    {
        e = e->kind == ExprKind::Subscript ? static_cast<const SubscriptExpr *>(e)->object.get()
                                           : static_cast<const AttributeExpr *>(e)->object.get();
    }
    if (e->kind != ExprKind::Name)
        return;
    const auto &name = static_cast<const NameExpr *>(e)->name;
    if (!isLocal(name))
        env_.touch(name);
}

} // namespace fusion::vm
