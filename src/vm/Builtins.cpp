//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Builtins.cpp
// Purpose: Builtin functions and exception constructors of the native
//          language.
// Key invariants: Builtins never touch global state other than the
//                 interpreter passed to them.
// Ownership/Lifetime: The table is a function-local static.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "vm/Builtins.hpp"

#include "vm/Format.hpp"
#include "vm/Interpreter.hpp"
#include "vm/Operators.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace fusion::vm
{

namespace detail
{

std::vector<std::optional<Value>> bindArgs(std::string_view function,
                                           ValueList &args,
                                           KeywordArgs &kwargs,
                                           std::initializer_list<std::string_view> names,
                                           size_t required)
{
    const std::vector<std::string_view> params(names);
    if (args.size() > params.size())
        throwNative(NativeErrorKind::TypeError,
                    std::string(function) + "() takes at most " + std::to_string(params.size()) + " argument" +
                        (params.size() == 1 ? "" : "s") + " (" + std::to_string(args.size()) + " given)");
    std::vector<std::optional<Value>> slots(params.size());
    for (size_t i = 0; i < args.size(); ++i)
        slots[i] = std::move(args[i]);
    for (auto &[name, value] : kwargs)
    {
        auto it = std::find(params.begin(), params.end(), name);
        if (it == params.end())
            throwNative(NativeErrorKind::TypeError,
                        std::string(function) + "() got an unexpected keyword argument '" + name + "'");
        auto &slot = slots[static_cast<size_t>(it - params.begin())];
        if (slot)
            throwNative(NativeErrorKind::TypeError,
                        std::string(function) + "() got multiple values for argument '" + name + "'");
        slot = std::move(value);
    }
    for (size_t i = 0; i < required; ++i)
    {
        if (!slots[i])
            throwNative(NativeErrorKind::TypeError, std::string(function) + "() missing required argument '" +
                                                        std::string(params[i]) + "' (pos " + std::to_string(i + 1) +
                                                        ")");
    }
    return slots;
}

int64_t intArg(std::string_view function, const Value &v)
{
    if (!v.isIntegral())
        throwNative(NativeErrorKind::TypeError, std::string(function) + "(): expected int, got '" +
                                                    std::string(v.typeName()) + "'");
    return v.asInt();
}

double floatArg(std::string_view function, const Value &v)
{
    if (!v.isNumber())
        throwNative(NativeErrorKind::TypeError, std::string(function) + "(): must be real number, not " +
                                                    std::string(v.typeName()));
    return v.asFloat();
}

const std::string &strArg(std::string_view function, const Value &v)
{
    if (v.kind() != Value::Kind::Str)
        throwNative(NativeErrorKind::TypeError, std::string(function) + "(): argument must be str, not " +
                                                    std::string(v.typeName()));
    return v.asStr();
}

Value makeBuiltin(std::string name, BuiltinFn fn)
{
    auto obj = std::make_shared<FunctionObject>();
    obj->name = std::move(name);
    obj->builtin = std::move(fn);
    return Value::function(std::move(obj));
}

void sortValues(Interpreter &interp, ValueList &items, const Value &key, bool reverse)
{
    std::vector<std::pair<Value, size_t>> keyed;
    keyed.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i)
        keyed.emplace_back(key.isNone() ? items[i] : interp.call(key, {items[i]}), i);
    std::stable_sort(keyed.begin(), keyed.end(), [reverse](const auto &a, const auto &b) {
        return reverse ? lessThan(b.first, a.first) : lessThan(a.first, b.first);
    });
    ValueList sorted;
    sorted.reserve(items.size());
    for (const auto &[k, index] : keyed)
        sorted.push_back(items[index]);
    items = std::move(sorted);
}

} // namespace detail

namespace
{

using detail::bindArgs;
using detail::floatArg;
using detail::intArg;
using detail::makeBuiltin;
using detail::strArg;

constexpr int64_t kMaxRangeLength = 50'000'000;

std::string trimSpace(const std::string &s)
{
    const size_t b = s.find_first_not_of(" \t\n\r\f\v");
    if (b == std::string::npos)
        return {};
    const size_t e = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(b, e - b + 1);
}

Value parseIntText(const std::string &text, int64_t base)
{
    const std::string original = text;
    auto invalid = [&]() -> Value {
        throwNative(NativeErrorKind::ValueError,
                    "invalid literal for int() with base " + std::to_string(base) + ": " + toRepr(Value::string(original)));
    };
    std::string s = trimSpace(text);
    bool negative = false;
    if (!s.empty() && (s[0] == '+' || s[0] == '-'))
    {
        negative = s[0] == '-';
        s.erase(0, 1);
    }
    if (s.size() >= 2 && s[0] == '0')
    {
        const char p = static_cast<char>(s[1] | 0x20);
        const int64_t prefixed = p == 'x' ? 16 : p == 'o' ? 8 : p == 'b' ? 2 : 0;
        if (prefixed && (base == 0 || base == prefixed))
        {
            base = prefixed;
            s.erase(0, 2);
        }
    }
    if (base == 0)
        base = 10;
    if (base < 2 || base > 36)
        throwNative(NativeErrorKind::ValueError, "int() base must be >= 2 and <= 36, or 0");
    if (s.empty() || s.front() == '_' || s.back() == '_')
        return invalid();

    uint64_t mag = 0;
    for (size_t i = 0; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c == '_')
        {
            if (s[i - 1] == '_')
                return invalid();
            continue;
        }
        int digit = -1;
        if (c >= '0' && c <= '9')
            digit = c - '0';
        else if (c >= 'a' && c <= 'z')
            digit = c - 'a' + 10;
        else if (c >= 'A' && c <= 'Z')
            digit = c - 'A' + 10;
        if (digit < 0 || digit >= base)
            return invalid();
        const uint64_t limit = negative ? uint64_t{1} << 63 : (uint64_t{1} << 63) - 1;
        if (mag > (limit - static_cast<uint64_t>(digit)) / static_cast<uint64_t>(base))
            throwNative(NativeErrorKind::OverflowError, "int() literal out of 64-bit range");
        mag = mag * static_cast<uint64_t>(base) + static_cast<uint64_t>(digit);
    }
    if (negative)
        return Value::integer(mag == (uint64_t{1} << 63) ? std::numeric_limits<int64_t>::min()
                                                         : -static_cast<int64_t>(mag));
    return Value::integer(static_cast<int64_t>(mag));
}

Value floatToInt(double d)
{
    if (std::isnan(d))
        throwNative(NativeErrorKind::ValueError, "cannot convert float NaN to integer");
    if (std::isinf(d))
        throwNative(NativeErrorKind::OverflowError, "cannot convert float infinity to integer");
    const double t = std::trunc(d);
    if (t >= 9223372036854775808.0 || t < -9223372036854775808.0)
        throwNative(NativeErrorKind::OverflowError, "int too large to convert");
    return Value::integer(static_cast<int64_t>(t));
}

Value builtinPrint(Interpreter &interp, ValueList &args, KeywordArgs &kwargs)
{
    std::string sep = " ";
    std::string end = "\n";
    for (const auto &[name, value] : kwargs)
    {
        if (name != "sep" && name != "end")
            throwNative(NativeErrorKind::TypeError, "print() got an unexpected keyword argument '" + name + "'");
        if (value.isNone())
            continue;
        if (value.kind() != Value::Kind::Str)
            throwNative(NativeErrorKind::TypeError,
                        name + " must be None or a string, not " + std::string(value.typeName()));
        (name == "sep" ? sep : end) = value.asStr();
    }
    std::string line;
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (i)
            line += sep;
        line += toStr(args[i]);
    }
    line += end;
    interp.write(line);
    return Value::none();
}

Value builtinInt(Interpreter &, ValueList &args, KeywordArgs &kwargs)
{
    auto a = bindArgs("int", args, kwargs, {"x", "base"}, 0);
    if (!a[0])
        return Value::integer(0);
    const Value &x = *a[0];
    if (a[1])
    {
        if (x.kind() != Value::Kind::Str)
            throwNative(NativeErrorKind::TypeError, "int() can't convert non-string with explicit base");
        return parseIntText(x.asStr(), intArg("int", *a[1]));
    }
    switch (x.kind())
    {
        case Value::Kind::Int:
        case Value::Kind::Bool:
            return Value::integer(x.asInt());
        case Value::Kind::Float:
            return floatToInt(x.asFloat());
        case Value::Kind::Str:
            return parseIntText(x.asStr(), 10);
        default:
            throwNative(NativeErrorKind::TypeError,
                        "int() argument must be a string or a number, not '" + std::string(x.typeName()) + "'");
    }
}

Value builtinFloat(Interpreter &, ValueList &args, KeywordArgs &kwargs)
{
    auto a = bindArgs("float", args, kwargs, {"x"}, 0);
    if (!a[0])
        return Value::real(0.0);
    const Value &x = *a[0];
    if (x.isNumber())
        return Value::real(x.asFloat());
    if (x.kind() != Value::Kind::Str)
        throwNative(NativeErrorKind::TypeError,
                    "float() argument must be a string or a number, not '" + std::string(x.typeName()) + "'");
    std::string s = trimSpace(x.asStr());
    s.erase(std::remove(s.begin(), s.end(), '_'), s.end());
    if (!s.empty())
    {
        errno = 0;
        char *endp = nullptr;
        const double d = std::strtod(s.c_str(), &endp);
        if (endp && *endp == '\0' && !(errno == ERANGE && std::isinf(d)))
            return Value::real(d);
    }
    throwNative(NativeErrorKind::ValueError, "could not convert string to float: " + toRepr(x));
}

Value builtinRange(Interpreter &, ValueList &args, KeywordArgs &kwargs)
{
    if (!kwargs.empty())
        throwNative(NativeErrorKind::TypeError, "range() takes no keyword arguments");
    if (args.empty() || args.size() > 3)
        throwNative(NativeErrorKind::TypeError,
                    "range expected 1 to 3 arguments, got " + std::to_string(args.size()));
    int64_t start = 0;
    int64_t stop = 0;
    int64_t step = 1;
    if (args.size() == 1)
    {
        stop = intArg("range", args[0]);
    }
    else
    {
        start = intArg("range", args[0]);
        stop = intArg("range", args[1]);
        if (args.size() == 3)
            step = intArg("range", args[2]);
    }
    if (step == 0)
        throwNative(NativeErrorKind::ValueError, "range() arg 3 must not be zero");
    ValueList out;
    const long double span = step > 0 ? static_cast<long double>(stop) - start : static_cast<long double>(start) - stop;
    if (span > 0 && span / (step > 0 ? step : -static_cast<long double>(step)) > kMaxRangeLength)
        throwNative(NativeErrorKind::OverflowError, "range() result is too large");
    if (step > 0)
    {
        for (int64_t i = start; i < stop; i += step)
        {
            out.push_back(Value::integer(i));
            if (stop - i <= step)
                break;
        }
    }
    else
    {
        for (int64_t i = start; i > stop; i += step)
        {
            out.push_back(Value::integer(i));
            if (i - stop <= -step)
                break;
        }
    }
    return Value::list(std::move(out));
}

Value minMax(Interpreter &interp, std::string_view fname, bool isMax, ValueList &args, KeywordArgs &kwargs)
{
    Value key;
    std::optional<Value> dflt;
    for (auto &[name, value] : kwargs)
    {
        if (name == "key")
            key = value;
        else if (name == "default")
            dflt = value;
        else
            throwNative(NativeErrorKind::TypeError,
                        std::string(fname) + "() got an unexpected keyword argument '" + name + "'");
    }
    if (args.empty())
        throwNative(NativeErrorKind::TypeError, std::string(fname) + " expected at least 1 argument, got 0");
    const ValueList items = args.size() == 1 ? iterate(args[0]) : args;
    if (items.empty())
    {
        if (dflt)
            return *dflt;
        throwNative(NativeErrorKind::ValueError, std::string(fname) + "() arg is an empty sequence");
    }
    size_t best = 0;
    Value bestKey = key.isNone() ? items[0] : interp.call(key, {items[0]});
    for (size_t i = 1; i < items.size(); ++i)
    {
        Value k = key.isNone() ? items[i] : interp.call(key, {items[i]});
        if (isMax ? lessThan(bestKey, k) : lessThan(k, bestKey))
        {
            best = i;
            bestKey = std::move(k);
        }
    }
    return items[best];
}

Value builtinRound(Interpreter &, ValueList &args, KeywordArgs &kwargs)
{
    auto a = bindArgs("round", args, kwargs, {"number", "ndigits"}, 1);
    const Value &x = *a[0];
    const bool hasDigits = a[1] && !a[1]->isNone();
    if (x.isIntegral())
    {
        if (!hasDigits || intArg("round", *a[1]) >= 0)
            return Value::integer(x.asInt());
        const int64_t digits = -intArg("round", *a[1]);
        if (digits > 18)
            return Value::integer(0);
        const double scale = std::pow(10.0, static_cast<double>(digits));
        return floatToInt(std::nearbyint(static_cast<double>(x.asInt()) / scale) * scale);
    }
    const double d = floatArg("round", x);
    if (!hasDigits)
        return floatToInt(std::nearbyint(d));
    const int64_t digits = intArg("round", *a[1]);
    if (!std::isfinite(d) || digits > 300)
        return Value::real(d);
    const double scale = std::pow(10.0, static_cast<double>(digits));
    const double r = std::nearbyint(d * scale) / scale;
    return Value::real(std::isfinite(r) ? r : d);
}

Value builtinDict(Interpreter &, ValueList &args, KeywordArgs &kwargs)
{
    if (args.size() > 1)
        throwNative(NativeErrorKind::TypeError,
                    "dict expected at most 1 argument, got " + std::to_string(args.size()));
    Value out = Value::dict();
    auto &d = out.asDict();
    if (!args.empty())
    {
        if (args[0].kind() == Value::Kind::Dict)
        {
            for (const auto &[k, v] : args[0].asDict().entries())
                d.set(k, v);
        }
        else
        {
            for (const auto &pair : iterate(args[0]))
            {
                ValueList kv = iterate(pair);
                if (kv.size() != 2)
                    throwNative(NativeErrorKind::ValueError,
                                "dictionary update sequence element has length " + std::to_string(kv.size()) +
                                    "; 2 is required");
                d.set(kv[0], kv[1]);
            }
        }
    }
    for (auto &[name, value] : kwargs)
        d.set(Value::string(name), value);
    return out;
}

Value exceptionConstructor(NativeErrorKind kind)
{
    auto obj = std::make_shared<FunctionObject>();
    obj->name = std::string(toString(kind));
    obj->exceptionType = kind;
    obj->builtin = [kind](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        if (!kwargs.empty())
            throwNative(NativeErrorKind::TypeError,
                        std::string(toString(kind)) + "() takes no keyword arguments");
        std::string message;
        if (args.size() == 1)
            message = toStr(args[0]);
        else if (args.size() > 1)
            message = toRepr(Value::tuple(args));
        return Value::exception(kind, std::move(message));
    };
    return Value::function(std::move(obj));
}

std::unordered_map<std::string, Value> buildTable()
{
    std::unordered_map<std::string, Value> t;
    auto add = [&t](const char *name, BuiltinFn fn) { t.emplace(name, makeBuiltin(name, std::move(fn))); };

    add("print", builtinPrint);
    add("len", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("len", args, kwargs, {"obj"}, 1);
        return Value::integer(lengthOf(*a[0]));
    });
    add("str", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("str", args, kwargs, {"object"}, 0);
        return Value::string(a[0] ? toStr(*a[0]) : std::string());
    });
    add("repr", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("repr", args, kwargs, {"obj"}, 1);
        return Value::string(toRepr(*a[0]));
    });
    add("format", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("format", args, kwargs, {"value", "format_spec"}, 1);
        return Value::string(formatWithSpec(*a[0], a[1] ? strArg("format", *a[1]) : std::string()));
    });
    add("int", builtinInt);
    add("float", builtinFloat);
    add("bool", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("bool", args, kwargs, {"x"}, 0);
        return Value::boolean(a[0] && a[0]->truthy());
    });
    add("list", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("list", args, kwargs, {"iterable"}, 0);
        return Value::list(a[0] ? iterate(*a[0]) : ValueList{});
    });
    add("tuple", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("tuple", args, kwargs, {"iterable"}, 0);
        return Value::tuple(a[0] ? iterate(*a[0]) : ValueList{});
    });
    add("dict", builtinDict);
    add("range", builtinRange);
    add("abs", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("abs", args, kwargs, {"x"}, 1);
        const Value &x = *a[0];
        if (x.isIntegral())
        {
            if (x.asInt() == std::numeric_limits<int64_t>::min())
                throwNative(NativeErrorKind::OverflowError, "integer result out of 64-bit range");
            return Value::integer(x.asInt() < 0 ? -x.asInt() : x.asInt());
        }
        if (x.kind() == Value::Kind::Float)
            return Value::real(std::fabs(x.asFloat()));
        throwNative(NativeErrorKind::TypeError,
                    "bad operand type for abs(): '" + std::string(x.typeName()) + "'");
    });
    add("min", [](Interpreter &in, ValueList &args, KeywordArgs &kwargs) {
        return minMax(in, "min", false, args, kwargs);
    });
    add("max", [](Interpreter &in, ValueList &args, KeywordArgs &kwargs) {
        return minMax(in, "max", true, args, kwargs);
    });
    add("sum", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("sum", args, kwargs, {"iterable", "start"}, 1);
        Value total = a[1] ? *a[1] : Value::integer(0);
        if (total.kind() == Value::Kind::Str)
            throwNative(NativeErrorKind::TypeError, "sum() can't sum strings [use ''.join(seq) instead]");
        for (const auto &v : iterate(*a[0]))
            total = binaryOp(BinaryOp::Add, total, v);
        return total;
    });
    add("round", builtinRound);
    add("sorted", [](Interpreter &in, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("sorted", args, kwargs, {"iterable", "key", "reverse"}, 1);
        ValueList items = iterate(*a[0]);
        detail::sortValues(in, items, a[1] ? *a[1] : Value::none(), a[2] && a[2]->truthy());
        return Value::list(std::move(items));
    });
    add("enumerate", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("enumerate", args, kwargs, {"iterable", "start"}, 1);
        int64_t index = a[1] ? intArg("enumerate", *a[1]) : 0;
        ValueList out;
        for (auto &v : iterate(*a[0]))
            out.push_back(Value::tuple({Value::integer(index++), std::move(v)}));
        return Value::list(std::move(out));
    });
    add("zip", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        if (!kwargs.empty())
            throwNative(NativeErrorKind::TypeError, "zip() takes no keyword arguments");
        std::vector<ValueList> columns;
        size_t n = args.empty() ? 0 : std::numeric_limits<size_t>::max();
        for (const auto &arg : args)
        {
            columns.push_back(iterate(arg));
            n = std::min(n, columns.back().size());
        }
        ValueList out;
        for (size_t i = 0; i < n; ++i)
        {
            ValueList row;
            for (auto &col : columns)
                row.push_back(col[i]);
            out.push_back(Value::tuple(std::move(row)));
        }
        return Value::list(std::move(out));
    });
    add("chr", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("chr", args, kwargs, {"i"}, 1);
        return Value::string(formatWithSpec(Value::integer(intArg("chr", *a[0])), "c"));
    });
    add("ord", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("ord", args, kwargs, {"c"}, 1);
        const std::string &s = strArg("ord", *a[0]);
        if (s.empty())
            throwNative(NativeErrorKind::TypeError, "ord() expected a character, but string of length 0 found");
        const auto *p = reinterpret_cast<const unsigned char *>(s.data());
        uint32_t cp = p[0];
        size_t len = 1;
        if (cp >= 0xF0)
        {
            cp &= 0x07;
            len = 4;
        }
        else if (cp >= 0xE0)
        {
            cp &= 0x0F;
            len = 3;
        }
        else if (cp >= 0xC0)
        {
            cp &= 0x1F;
            len = 2;
        }
        if (len != s.size())
            throwNative(NativeErrorKind::TypeError, "ord() expected a character, but string of length " +
                                                        std::to_string(s.size()) + " found");
        for (size_t i = 1; i < len; ++i)
            cp = (cp << 6) | (p[i] & 0x3F);
        return Value::integer(static_cast<int64_t>(cp));
    });

    for (NativeErrorKind kind : kCatchableErrorKinds)
        t.emplace(std::string(toString(kind)), exceptionConstructor(kind));
    return t;
}

} // namespace

const std::unordered_map<std::string, Value> &builtinTable()
{
    static const std::unordered_map<std::string, Value> table = buildTable();
    return table;
}

} // namespace fusion::vm
