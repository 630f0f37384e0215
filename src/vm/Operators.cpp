//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Operators.cpp
// Purpose: Implements the native operator semantics.
// Key invariants: Floor division and modulo round toward negative infinity;
//                 the sign of a modulo result follows the divisor.
// Ownership/Lifetime: Stateless.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "vm/Operators.hpp"

#include "vm/Format.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace fusion::vm
{

namespace
{

constexpr int64_t kMaxSequenceRepeat = 50'000'000;

[[noreturn]] void unsupported(BinaryOp op, const Value &a, const Value &b)
{
    throwNative(NativeErrorKind::TypeError,
                "unsupported operand type(s) for " + std::string(binaryOpSpelling(op)) + ": '" +
                    std::string(a.typeName()) + "' and '" + std::string(b.typeName()) + "'");
}

[[noreturn]] void overflow()
{
    throwNative(NativeErrorKind::OverflowError, "integer result out of 64-bit range");
}

int64_t checkedAdd(int64_t a, int64_t b)
{
    int64_t r = 0;
    if (__builtin_add_overflow(a, b, &r))
        overflow();
    return r;
}

int64_t checkedSub(int64_t a, int64_t b)
{
    int64_t r = 0;
    if (__builtin_sub_overflow(a, b, &r))
        overflow();
    return r;
}

int64_t checkedMul(int64_t a, int64_t b)
{
    int64_t r = 0;
    if (__builtin_mul_overflow(a, b, &r))
        overflow();
    return r;
}

int64_t floorDiv(int64_t a, int64_t b)
{
    if (b == 0)
        throwNative(NativeErrorKind::ZeroDivisionError, "integer division or modulo by zero");
    if (a == std::numeric_limits<int64_t>::min() && b == -1)
        overflow();
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0)))
        --q;
    return q;
}

int64_t floorMod(int64_t a, int64_t b)
{
    if (b == 0)
        throwNative(NativeErrorKind::ZeroDivisionError, "integer division or modulo by zero");
    if (b == -1)
        return 0;
    int64_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0)))
        r += b;
    return r;
}

int64_t intPow(int64_t base, int64_t exp)
{
    int64_t result = 1;
    while (exp > 0)
    {
        if (exp & 1)
            result = checkedMul(result, base);
        exp >>= 1;
        if (exp > 0)
            base = checkedMul(base, base);
    }
    return result;
}

Value repeat(const Value &seq, int64_t times)
{
    if (times < 0)
        times = 0;
    const int64_t unit = lengthOf(seq);
    if (unit > 0 && times > kMaxSequenceRepeat / unit)
        throwNative(NativeErrorKind::OverflowError, "repeated sequence is too large");
    if (seq.kind() == Value::Kind::Str)
    {
        std::string out;
        out.reserve(static_cast<size_t>(unit * times));
        for (int64_t i = 0; i < times; ++i)
            out += seq.asStr();
        return Value::string(std::move(out));
    }
    ValueList out;
    const auto &items = seq.elements();
    out.reserve(static_cast<size_t>(unit * times));
    for (int64_t i = 0; i < times; ++i)
        out.insert(out.end(), items.begin(), items.end());
    return seq.kind() == Value::Kind::List ? Value::list(std::move(out)) : Value::tuple(std::move(out));
}

bool isSequence(const Value &v)
{
    return v.kind() == Value::Kind::Str || v.kind() == Value::Kind::List || v.kind() == Value::Kind::Tuple;
}

int64_t normalizeIndex(int64_t index, int64_t size, std::string_view what)
{
    if (index < 0)
        index += size;
    if (index < 0 || index >= size)
        throwNative(NativeErrorKind::IndexError, std::string(what) + " index out of range");
    return index;
}

int64_t indexValue(const Value &index, std::string_view what)
{
    if (!index.isIntegral())
        throwNative(NativeErrorKind::TypeError,
                    std::string(what) + " indices must be integers or slices, not " + std::string(index.typeName()));
    return index.asInt();
}

} // namespace

std::string_view binaryOpSpelling(BinaryOp op) noexcept
{
    switch (op)
    {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::FloorDiv:
            return "//";
        case BinaryOp::Mod:
            return "%";
        case BinaryOp::Pow:
            return "**";
    }
    return "?";
}

Value binaryOp(BinaryOp op, const Value &a, const Value &b)
{
    using Kind = Value::Kind;

    if (a.isIntegral() && b.isIntegral())
    {
        const int64_t x = a.asInt();
        const int64_t y = b.asInt();
        switch (op)
        {
            case BinaryOp::Add:
                return Value::integer(checkedAdd(x, y));
            case BinaryOp::Sub:
                return Value::integer(checkedSub(x, y));
            case BinaryOp::Mul:
                return Value::integer(checkedMul(x, y));
            case BinaryOp::Div:
                if (y == 0)
                    throwNative(NativeErrorKind::ZeroDivisionError, "division by zero");
                return Value::real(static_cast<double>(x) / static_cast<double>(y));
            case BinaryOp::FloorDiv:
                return Value::integer(floorDiv(x, y));
            case BinaryOp::Mod:
                return Value::integer(floorMod(x, y));
            case BinaryOp::Pow:
                if (y < 0)
                {
                    if (x == 0)
                        throwNative(NativeErrorKind::ZeroDivisionError,
                                    "0.0 cannot be raised to a negative power");
                    return Value::real(std::pow(static_cast<double>(x), static_cast<double>(y)));
                }
                return Value::integer(intPow(x, y));
        }
    }

    if (a.isNumber() && b.isNumber())
    {
        const double x = a.asFloat();
        const double y = b.asFloat();
        switch (op)
        {
            case BinaryOp::Add:
                return Value::real(x + y);
            case BinaryOp::Sub:
                return Value::real(x - y);
            case BinaryOp::Mul:
                return Value::real(x * y);
            case BinaryOp::Div:
                if (y == 0.0)
                    throwNative(NativeErrorKind::ZeroDivisionError, "float division by zero");
                return Value::real(x / y);
            case BinaryOp::FloorDiv:
                if (y == 0.0)
                    throwNative(NativeErrorKind::ZeroDivisionError, "float floor division by zero");
                return Value::real(std::floor(x / y));
            case BinaryOp::Mod:
            {
                if (y == 0.0)
                    throwNative(NativeErrorKind::ZeroDivisionError, "float modulo");
                double r = std::fmod(x, y);
                if (r != 0.0 && ((r < 0) != (y < 0)))
                    r += y;
                return Value::real(r);
            }
            case BinaryOp::Pow:
                if (x == 0.0 && y < 0.0)
                    throwNative(NativeErrorKind::ZeroDivisionError, "0.0 cannot be raised to a negative power");
                if (x < 0.0 && y != std::floor(y))
                    throwNative(NativeErrorKind::ValueError, "negative number cannot be raised to a fractional power");
                return Value::real(std::pow(x, y));
        }
    }

    switch (op)
    {
        case BinaryOp::Add:
            if (a.kind() == Kind::Str && b.kind() == Kind::Str)
                return Value::string(a.asStr() + b.asStr());
            if ((a.kind() == Kind::List || a.kind() == Kind::Tuple) && a.kind() == b.kind())
            {
                ValueList out = a.elements();
                const auto &tail = b.elements();
                out.insert(out.end(), tail.begin(), tail.end());
                return a.kind() == Kind::List ? Value::list(std::move(out)) : Value::tuple(std::move(out));
            }
            break;
        case BinaryOp::Mul:
            if (isSequence(a) && b.isIntegral())
                return repeat(a, b.asInt());
            if (a.isIntegral() && isSequence(b))
                return repeat(b, a.asInt());
            break;
        case BinaryOp::Mod:
            if (a.kind() == Kind::Str)
                return Value::string(percentFormat(a.asStr(), b));
            break;
        default:
            break;
    }
    unsupported(op, a, b);
}

bool lessThan(const Value &a, const Value &b)
{
    using Kind = Value::Kind;
    if (a.isNumber() && b.isNumber())
    {
        if (a.isIntegral() && b.isIntegral())
            return a.asInt() < b.asInt();
        return a.asFloat() < b.asFloat();
    }
    if (a.kind() == Kind::Str && b.kind() == Kind::Str)
        return a.asStr() < b.asStr();
    if ((a.kind() == Kind::List || a.kind() == Kind::Tuple) && a.kind() == b.kind())
    {
        const auto &x = a.elements();
        const auto &y = b.elements();
        for (size_t i = 0; i < x.size() && i < y.size(); ++i)
        {
            if (x[i] == y[i])
                continue;
            return lessThan(x[i], y[i]);
        }
        return x.size() < y.size();
    }
    throwNative(NativeErrorKind::TypeError,
                "'<' not supported between instances of '" + std::string(a.typeName()) + "' and '" +
                    std::string(b.typeName()) + "'");
}

bool contains(const Value &container, const Value &item)
{
    using Kind = Value::Kind;
    switch (container.kind())
    {
        case Kind::Str:
            if (item.kind() != Kind::Str)
                throwNative(NativeErrorKind::TypeError,
                            "'in <string>' requires string as left operand, not " + std::string(item.typeName()));
            return container.asStr().find(item.asStr()) != std::string::npos;
        case Kind::List:
        case Kind::Tuple:
            for (const auto &v : container.elements())
            {
                if (v == item)
                    return true;
            }
            return false;
        case Kind::Dict:
            return container.asDict().find(item) != nullptr;
        default:
            throwNative(NativeErrorKind::TypeError,
                        "argument of type '" + std::string(container.typeName()) + "' is not iterable");
    }
}

bool identical(const Value &a, const Value &b)
{
    const void *ia = a.identity();
    const void *ib = b.identity();
    if (ia || ib)
        return ia == ib;
    return a.kind() == b.kind() && a == b;
}

int64_t lengthOf(const Value &v)
{
    using Kind = Value::Kind;
    switch (v.kind())
    {
        case Kind::Str:
            return static_cast<int64_t>(v.asStr().size());
        case Kind::List:
        case Kind::Tuple:
            return static_cast<int64_t>(v.elements().size());
        case Kind::Dict:
            return static_cast<int64_t>(v.asDict().size());
        default:
            throwNative(NativeErrorKind::TypeError,
                        "object of type '" + std::string(v.typeName()) + "' has no len()");
    }
}

ValueList iterate(const Value &v)
{
    using Kind = Value::Kind;
    switch (v.kind())
    {
        case Kind::List:
        case Kind::Tuple:
            return v.elements();
        case Kind::Str:
        {
            ValueList out;
            out.reserve(v.asStr().size());
            for (char c : v.asStr())
                out.push_back(Value::string(std::string(1, c)));
            return out;
        }
        case Kind::Dict:
        {
            ValueList out;
            out.reserve(v.asDict().size());
            for (const auto &entry : v.asDict().entries())
                out.push_back(entry.first);
            return out;
        }
        default:
            throwNative(NativeErrorKind::TypeError, "'" + std::string(v.typeName()) + "' object is not iterable");
    }
}

Value getItem(const Value &container, const Value &index)
{
    using Kind = Value::Kind;
    switch (container.kind())
    {
        case Kind::Str:
        {
            const auto &s = container.asStr();
            const int64_t i = normalizeIndex(indexValue(index, "string"), static_cast<int64_t>(s.size()), "string");
            return Value::string(std::string(1, s[static_cast<size_t>(i)]));
        }
        case Kind::List:
        case Kind::Tuple:
        {
            const auto &items = container.elements();
            const char *what = container.kind() == Kind::List ? "list" : "tuple";
            const int64_t i = normalizeIndex(indexValue(index, what), static_cast<int64_t>(items.size()), what);
            return items[static_cast<size_t>(i)];
        }
        case Kind::Dict:
        {
            const Value *v = container.asDict().find(index);
            if (!v)
                throwNative(NativeErrorKind::KeyError, toRepr(index));
            return *v;
        }
        default:
            throwNative(NativeErrorKind::TypeError,
                        "'" + std::string(container.typeName()) + "' object is not subscriptable");
    }
}

void setItem(const Value &container, const Value &index, Value value)
{
    using Kind = Value::Kind;
    switch (container.kind())
    {
        case Kind::List:
        {
            auto &items = container.asList();
            const int64_t i = normalizeIndex(indexValue(index, "list"), static_cast<int64_t>(items.size()), "list assignment");
            items[static_cast<size_t>(i)] = std::move(value);
            return;
        }
        case Kind::Dict:
            container.asDict().set(index, std::move(value));
            return;
        default:
            throwNative(NativeErrorKind::TypeError,
                        "'" + std::string(container.typeName()) + "' object does not support item assignment");
    }
}

void delItem(const Value &container, const Value &index)
{
    using Kind = Value::Kind;
    switch (container.kind())
    {
        case Kind::List:
        {
            auto &items = container.asList();
            const int64_t i = normalizeIndex(indexValue(index, "list"), static_cast<int64_t>(items.size()), "list assignment");
            items.erase(items.begin() + i);
            return;
        }
        case Kind::Dict:
            if (!container.asDict().erase(index))
                throwNative(NativeErrorKind::KeyError, toRepr(index));
            return;
        default:
            throwNative(NativeErrorKind::TypeError,
                        "'" + std::string(container.typeName()) + "' object does not support item deletion");
    }
}

std::vector<int64_t> sliceIndices(const SliceBounds &bounds, int64_t n)
{
    const int64_t step = bounds.step.value_or(1);
    if (step == 0)
        throwNative(NativeErrorKind::ValueError, "slice step cannot be zero");

    auto clamp = [&](std::optional<int64_t> v, int64_t dflt, int64_t lo, int64_t hi) {
        if (!v)
            return dflt;
        int64_t x = *v;
        if (x < 0)
            x += n;
        if (x < lo)
            x = lo;
        if (x > hi)
            x = hi;
        return x;
    };

    int64_t start;
    int64_t stop;
    if (step > 0)
    {
        start = clamp(bounds.lower, 0, 0, n);
        stop = clamp(bounds.upper, n, 0, n);
    }
    else
    {
        start = clamp(bounds.lower, n - 1, -1, n - 1);
        stop = clamp(bounds.upper, -1, -1, n - 1);
    }

    std::vector<int64_t> out;
    if (step > 0)
    {
        for (int64_t i = start; i < stop; i += step)
            out.push_back(i);
    }
    else
    {
        for (int64_t i = start; i > stop; i += step)
            out.push_back(i);
    }
    return out;
}

Value getSlice(const Value &seq, const SliceBounds &bounds)
{
    using Kind = Value::Kind;
    if (seq.kind() == Kind::Str)
    {
        const auto &s = seq.asStr();
        std::string out;
        for (int64_t i : sliceIndices(bounds, static_cast<int64_t>(s.size())))
            out.push_back(s[static_cast<size_t>(i)]);
        return Value::string(std::move(out));
    }
    if (seq.kind() == Kind::List || seq.kind() == Kind::Tuple)
    {
        const auto &items = seq.elements();
        ValueList out;
        for (int64_t i : sliceIndices(bounds, static_cast<int64_t>(items.size())))
            out.push_back(items[static_cast<size_t>(i)]);
        return seq.kind() == Kind::List ? Value::list(std::move(out)) : Value::tuple(std::move(out));
    }
    throwNative(NativeErrorKind::TypeError, "'" + std::string(seq.typeName()) + "' object is not subscriptable");
}

void setSlice(const Value &seq, const SliceBounds &bounds, const Value &items)
{
    if (seq.kind() != Value::Kind::List)
        throwNative(NativeErrorKind::TypeError,
                    "'" + std::string(seq.typeName()) + "' object does not support slice assignment");
    auto &list = seq.asList();
    ValueList replacement = iterate(items);
    const int64_t n = static_cast<int64_t>(list.size());
    if (bounds.step.value_or(1) != 1)
    {
        const auto idx = sliceIndices(bounds, n);
        if (idx.size() != replacement.size())
            throwNative(NativeErrorKind::ValueError,
                        "attempt to assign sequence of size " + std::to_string(replacement.size()) +
                            " to extended slice of size " + std::to_string(idx.size()));
        for (size_t k = 0; k < idx.size(); ++k)
            list[static_cast<size_t>(idx[k])] = std::move(replacement[k]);
        return;
    }
    SliceBounds plain{bounds.lower, bounds.upper, std::nullopt};
    auto clampPos = [&](std::optional<int64_t> v, int64_t dflt) {
        if (!v)
            return dflt;
        int64_t x = *v < 0 ? *v + n : *v;
        return x < 0 ? int64_t{0} : (x > n ? n : x);
    };
    const int64_t lo = clampPos(plain.lower, 0);
    const int64_t hi = std::max(lo, clampPos(plain.upper, n));
    list.erase(list.begin() + lo, list.begin() + hi);
    list.insert(list.begin() + lo, replacement.begin(), replacement.end());
}

void delSlice(const Value &seq, const SliceBounds &bounds)
{
    if (seq.kind() != Value::Kind::List)
        throwNative(NativeErrorKind::TypeError,
                    "'" + std::string(seq.typeName()) + "' object does not support item deletion");
    auto &list = seq.asList();
    auto idx = sliceIndices(bounds, static_cast<int64_t>(list.size()));
    std::vector<bool> drop(list.size(), false);
    for (int64_t i : idx)
        drop[static_cast<size_t>(i)] = true;
    ValueList kept;
    kept.reserve(list.size() - idx.size());
    for (size_t i = 0; i < list.size(); ++i)
    {
        if (!drop[i])
            kept.push_back(std::move(list[i]));
    }
    list = std::move(kept);
}

} // namespace fusion::vm
