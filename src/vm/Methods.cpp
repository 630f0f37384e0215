//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Methods.cpp
// Purpose: Methods of the str, list and dict types.
// Key invariants: str methods never mutate their receiver; list and dict
//                 methods mutate shared storage in place.
// Ownership/Lifetime: Stateless.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "vm/Builtins.hpp"

#include "vm/Format.hpp"
#include "vm/Interpreter.hpp"
#include "vm/Operators.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace fusion::vm
{

namespace
{

using detail::bindArgs;
using detail::intArg;
using detail::strArg;

constexpr std::array<std::string_view, 30> kStrMethods = {
    "upper",   "lower",    "strip",      "lstrip",    "rstrip",  "split",   "join",    "replace",
    "startswith", "endswith", "find",    "rfind",     "index",   "count",   "format",  "capitalize",
    "title",   "isdigit",  "isalpha",    "isalnum",   "isspace", "isupper", "islower", "splitlines",
    "zfill",   "center",   "ljust",      "rjust",     "swapcase", "partition",
};

constexpr std::array<std::string_view, 11> kListMethods = {
    "append", "extend", "pop", "insert", "remove", "index", "count", "sort", "reverse", "copy", "clear",
};

constexpr std::array<std::string_view, 9> kDictMethods = {
    "keys", "values", "items", "get", "update", "pop", "setdefault", "copy", "clear",
};

constexpr std::array<std::string_view, 11> kMutatingMethods = {
    "append", "extend", "pop", "insert", "remove", "sort", "reverse", "clear", "update", "setdefault", "popitem",
};

template <size_t N> bool listed(const std::array<std::string_view, N> &names, std::string_view name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

[[noreturn]] void noMethod(const Value &self, const std::string &name)
{
    throwNative(NativeErrorKind::AttributeError,
                "'" + std::string(self.typeName()) + "' object has no attribute '" + name + "'");
}

std::string stripChars(const std::string &s, const std::optional<Value> &chars, bool left, bool right)
{
    std::string set = " \t\n\r\f\v";
    if (chars && !chars->isNone())
        set = strArg("strip", *chars);
    size_t b = 0;
    size_t e = s.size();
    if (left)
    {
        while (b < e && set.find(s[b]) != std::string::npos)
            ++b;
    }
    if (right)
    {
        while (e > b && set.find(s[e - 1]) != std::string::npos)
            --e;
    }
    return s.substr(b, e - b);
}

Value splitString(const std::string &s, const std::optional<Value> &sepArg, int64_t maxsplit)
{
    ValueList out;
    if (!sepArg || sepArg->isNone())
    {
        size_t i = 0;
        while (i < s.size())
        {
            while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
                ++i;
            if (i >= s.size())
                break;
            if (maxsplit >= 0 && static_cast<int64_t>(out.size()) == maxsplit)
            {
                size_t e = s.size();
                while (e > i && std::isspace(static_cast<unsigned char>(s[e - 1])))
                    --e;
                out.push_back(Value::string(s.substr(i, e - i)));
                break;
            }
            size_t j = i;
            while (j < s.size() && !std::isspace(static_cast<unsigned char>(s[j])))
                ++j;
            out.push_back(Value::string(s.substr(i, j - i)));
            i = j;
        }
        return Value::list(std::move(out));
    }
    const std::string &sep = strArg("split", *sepArg);
    if (sep.empty())
        throwNative(NativeErrorKind::ValueError, "empty separator");
    size_t pos = 0;
    while (true)
    {
        if (maxsplit >= 0 && static_cast<int64_t>(out.size()) == maxsplit)
            break;
        const size_t hit = s.find(sep, pos);
        if (hit == std::string::npos)
            break;
        out.push_back(Value::string(s.substr(pos, hit - pos)));
        pos = hit + sep.size();
    }
    out.push_back(Value::string(s.substr(pos)));
    return Value::list(std::move(out));
}

bool affixMatches(const std::string &s, const Value &affix, bool prefix, std::string_view fname)
{
    auto one = [&](const Value &v) {
        const std::string &a = strArg(fname, v);
        if (a.size() > s.size())
            return false;
        return prefix ? s.compare(0, a.size(), a) == 0 : s.compare(s.size() - a.size(), a.size(), a) == 0;
    };
    if (affix.kind() == Value::Kind::Tuple)
    {
        for (const auto &v : affix.asTuple())
        {
            if (one(v))
                return true;
        }
        return false;
    }
    return one(affix);
}

std::pair<size_t, size_t> searchRange(const std::string &s, const std::optional<Value> &start, const std::optional<Value> &end)
{
    const int64_t n = static_cast<int64_t>(s.size());
    auto norm = [n](const std::optional<Value> &v, int64_t dflt) {
        if (!v || v->isNone())
            return dflt;
        int64_t x = intArg("find", *v);
        if (x < 0)
            x += n;
        return std::clamp<int64_t>(x, 0, n);
    };
    const int64_t b = norm(start, 0);
    const int64_t e = norm(end, n);
    return {static_cast<size_t>(b), static_cast<size_t>(std::max(b, e))};
}

std::string padTo(const std::string &s, int64_t width, char fill, char align)
{
    if (width <= static_cast<int64_t>(s.size()))
        return s;
    const size_t n = static_cast<size_t>(width) - s.size();
    if (align == '<')
        return s + std::string(n, fill);
    if (align == '>')
        return std::string(n, fill) + s;
    const size_t left = n / 2 + (n & s.size() & 1);
    return std::string(left, fill) + s + std::string(n - left, fill);
}

Value strMethod(const std::string &s, const std::string &name, ValueList &args, KeywordArgs &kwargs)
{
    auto transform = [&](auto fn) {
        bindArgs(name, args, kwargs, {}, 0);
        std::string out = s;
        for (auto &c : out)
            c = static_cast<char>(fn(static_cast<unsigned char>(c)));
        return Value::string(std::move(out));
    };
    auto predicate = [&](auto fn) {
        bindArgs(name, args, kwargs, {}, 0);
        if (s.empty())
            return Value::boolean(false);
        return Value::boolean(std::all_of(s.begin(), s.end(), [&](char c) { return fn(static_cast<unsigned char>(c)) != 0; }));
    };

    if (name == "upper")
        return transform(::toupper);
    if (name == "lower")
        return transform(::tolower);
    if (name == "swapcase")
        return transform([](int c) { return std::isupper(c) ? std::tolower(c) : std::toupper(c); });
    if (name == "isdigit")
        return predicate(::isdigit);
    if (name == "isalpha")
        return predicate(::isalpha);
    if (name == "isalnum")
        return predicate(::isalnum);
    if (name == "isspace")
        return predicate(::isspace);
    if (name == "isupper" || name == "islower")
    {
        bindArgs(name, args, kwargs, {}, 0);
        const bool upper = name == "isupper";
        bool cased = false;
        for (unsigned char c : s)
        {
            if (std::isalpha(c))
            {
                cased = true;
                if ((std::isupper(c) != 0) != upper)
                    return Value::boolean(false);
            }
        }
        return Value::boolean(cased);
    }
    if (name == "strip" || name == "lstrip" || name == "rstrip")
    {
        auto a = bindArgs(name, args, kwargs, {"chars"}, 0);
        return Value::string(stripChars(s, a[0], name != "rstrip", name != "lstrip"));
    }
    if (name == "split")
    {
        auto a = bindArgs(name, args, kwargs, {"sep", "maxsplit"}, 0);
        return splitString(s, a[0], a[1] ? intArg(name, *a[1]) : -1);
    }
    if (name == "splitlines")
    {
        bindArgs(name, args, kwargs, {}, 0);
        ValueList out;
        size_t pos = 0;
        while (pos < s.size())
        {
            size_t nl = s.find_first_of("\r\n", pos);
            if (nl == std::string::npos)
            {
                out.push_back(Value::string(s.substr(pos)));
                break;
            }
            out.push_back(Value::string(s.substr(pos, nl - pos)));
            pos = nl + ((s[nl] == '\r' && nl + 1 < s.size() && s[nl + 1] == '\n') ? 2 : 1);
        }
        return Value::list(std::move(out));
    }
    if (name == "join")
    {
        auto a = bindArgs(name, args, kwargs, {"iterable"}, 1);
        std::string out;
        bool first = true;
        for (const auto &v : iterate(*a[0]))
        {
            if (v.kind() != Value::Kind::Str)
                throwNative(NativeErrorKind::TypeError, "sequence item: expected str instance, " +
                                                            std::string(v.typeName()) + " found");
            if (!first)
                out += s;
            first = false;
            out += v.asStr();
        }
        return Value::string(std::move(out));
    }
    if (name == "replace")
    {
        auto a = bindArgs(name, args, kwargs, {"old", "new", "count"}, 2);
        const std::string &from = strArg(name, *a[0]);
        const std::string &to = strArg(name, *a[1]);
        int64_t limit = a[2] ? intArg(name, *a[2]) : -1;
        std::string out;
        size_t pos = 0;
        if (from.empty())
        {
            for (size_t i = 0; i <= s.size(); ++i)
            {
                if (limit != 0)
                {
                    out += to;
                    if (limit > 0)
                        --limit;
                }
                if (i < s.size())
                    out.push_back(s[i]);
            }
            return Value::string(std::move(out));
        }
        while (limit != 0)
        {
            const size_t hit = s.find(from, pos);
            if (hit == std::string::npos)
                break;
            out.append(s, pos, hit - pos);
            out += to;
            pos = hit + from.size();
            if (limit > 0)
                --limit;
        }
        out.append(s, pos, std::string::npos);
        return Value::string(std::move(out));
    }
    if (name == "startswith" || name == "endswith")
    {
        auto a = bindArgs(name, args, kwargs, {"affix", "start", "end"}, 1);
        const auto [b, e] = searchRange(s, a[1], a[2]);
        return Value::boolean(affixMatches(s.substr(b, e - b), *a[0], name == "startswith", name));
    }
    if (name == "find" || name == "rfind" || name == "index")
    {
        auto a = bindArgs(name, args, kwargs, {"sub", "start", "end"}, 1);
        const std::string &sub = strArg(name, *a[0]);
        const auto [b, e] = searchRange(s, a[1], a[2]);
        const std::string window = s.substr(b, e - b);
        const size_t hit = name == "rfind" ? window.rfind(sub) : window.find(sub);
        if (hit == std::string::npos)
        {
            if (name == "index")
                throwNative(NativeErrorKind::ValueError, "substring not found");
            return Value::integer(-1);
        }
        return Value::integer(static_cast<int64_t>(b + hit));
    }
    if (name == "count")
    {
        auto a = bindArgs(name, args, kwargs, {"sub"}, 1);
        const std::string &sub = strArg(name, *a[0]);
        if (sub.empty())
            return Value::integer(static_cast<int64_t>(s.size()) + 1);
        int64_t n = 0;
        for (size_t pos = s.find(sub); pos != std::string::npos; pos = s.find(sub, pos + sub.size()))
            ++n;
        return Value::integer(n);
    }
    if (name == "format")
        return Value::string(strFormat(s, args, kwargs));
    if (name == "capitalize" || name == "title")
    {
        bindArgs(name, args, kwargs, {}, 0);
        std::string out = s;
        bool startOfWord = true;
        for (size_t i = 0; i < out.size(); ++i)
        {
            const auto c = static_cast<unsigned char>(out[i]);
            const bool upper = name == "title" ? startOfWord : i == 0;
            out[i] = static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
            startOfWord = !std::isalpha(c);
        }
        return Value::string(std::move(out));
    }
    if (name == "zfill")
    {
        auto a = bindArgs(name, args, kwargs, {"width"}, 1);
        const int64_t width = intArg(name, *a[0]);
        if (width <= static_cast<int64_t>(s.size()))
            return Value::string(s);
        const size_t n = static_cast<size_t>(width) - s.size();
        if (!s.empty() && (s[0] == '-' || s[0] == '+'))
            return Value::string(s.substr(0, 1) + std::string(n, '0') + s.substr(1));
        return Value::string(std::string(n, '0') + s);
    }
    if (name == "center" || name == "ljust" || name == "rjust")
    {
        auto a = bindArgs(name, args, kwargs, {"width", "fillchar"}, 1);
        char fill = ' ';
        if (a[1])
        {
            const std::string &f = strArg(name, *a[1]);
            if (f.size() != 1)
                throwNative(NativeErrorKind::TypeError, "The fill character must be exactly one character long");
            fill = f[0];
        }
        const char align = name == "ljust" ? '<' : name == "rjust" ? '>' : '^';
        return Value::string(padTo(s, intArg(name, *a[0]), fill, align));
    }
    if (name == "partition")
    {
        auto a = bindArgs(name, args, kwargs, {"sep"}, 1);
        const std::string &sep = strArg(name, *a[0]);
        if (sep.empty())
            throwNative(NativeErrorKind::ValueError, "empty separator");
        const size_t hit = s.find(sep);
        if (hit == std::string::npos)
            return Value::tuple({Value::string(s), Value::string(""), Value::string("")});
        return Value::tuple({Value::string(s.substr(0, hit)), Value::string(sep),
                             Value::string(s.substr(hit + sep.size()))});
    }
    noMethod(Value::string(s), name);
}

Value listMethod(Interpreter &interp, const Value &self, const std::string &name, ValueList &args, KeywordArgs &kwargs)
{
    ValueList &items = self.asList();
    if (name == "append")
    {
        auto a = bindArgs(name, args, kwargs, {"object"}, 1);
        items.push_back(std::move(*a[0]));
        return Value::none();
    }
    if (name == "extend")
    {
        auto a = bindArgs(name, args, kwargs, {"iterable"}, 1);
        ValueList extra = iterate(*a[0]);
        items.insert(items.end(), extra.begin(), extra.end());
        return Value::none();
    }
    if (name == "pop")
    {
        auto a = bindArgs(name, args, kwargs, {"index"}, 0);
        if (items.empty())
            throwNative(NativeErrorKind::IndexError, "pop from empty list");
        int64_t i = a[0] ? intArg(name, *a[0]) : -1;
        const int64_t n = static_cast<int64_t>(items.size());
        if (i < 0)
            i += n;
        if (i < 0 || i >= n)
            throwNative(NativeErrorKind::IndexError, "pop index out of range");
        Value out = std::move(items[static_cast<size_t>(i)]);
        items.erase(items.begin() + i);
        return out;
    }
    if (name == "insert")
    {
        auto a = bindArgs(name, args, kwargs, {"index", "object"}, 2);
        const int64_t n = static_cast<int64_t>(items.size());
        int64_t i = intArg(name, *a[0]);
        if (i < 0)
            i += n;
        i = std::clamp<int64_t>(i, 0, n);
        items.insert(items.begin() + i, std::move(*a[1]));
        return Value::none();
    }
    if (name == "remove" || name == "index")
    {
        auto a = bindArgs(name, args, kwargs, {"value"}, 1);
        auto it = std::find(items.begin(), items.end(), *a[0]);
        if (it == items.end())
        {
            if (name == "remove")
                throwNative(NativeErrorKind::ValueError, "list.remove(x): x not in list");
            throwNative(NativeErrorKind::ValueError, toRepr(*a[0]) + " is not in list");
        }
        if (name == "index")
            return Value::integer(it - items.begin());
        items.erase(it);
        return Value::none();
    }
    if (name == "count")
    {
        auto a = bindArgs(name, args, kwargs, {"value"}, 1);
        return Value::integer(std::count(items.begin(), items.end(), *a[0]));
    }
    if (name == "sort")
    {
        if (!args.empty())
            throwNative(NativeErrorKind::TypeError, "sort() takes no positional arguments");
        auto a = bindArgs(name, args, kwargs, {"key", "reverse"}, 0);
        ValueList copy = items;
        detail::sortValues(interp, copy, a[0] ? *a[0] : Value::none(), a[1] && a[1]->truthy());
        items = std::move(copy);
        return Value::none();
    }
    if (name == "reverse")
    {
        bindArgs(name, args, kwargs, {}, 0);
        std::reverse(items.begin(), items.end());
        return Value::none();
    }
    if (name == "copy")
    {
        bindArgs(name, args, kwargs, {}, 0);
        return Value::list(items);
    }
    if (name == "clear")
    {
        bindArgs(name, args, kwargs, {}, 0);
        items.clear();
        return Value::none();
    }
    noMethod(self, name);
}

Value dictMethod(const Value &self, const std::string &name, ValueList &args, KeywordArgs &kwargs)
{
    DictObject &d = self.asDict();
    if (name == "keys" || name == "values" || name == "items")
    {
        bindArgs(name, args, kwargs, {}, 0);
        ValueList out;
        out.reserve(d.size());
        for (const auto &[k, v] : d.entries())
        {
            if (name == "keys")
                out.push_back(k);
            else if (name == "values")
                out.push_back(v);
            else
                out.push_back(Value::tuple({k, v}));
        }
        return Value::list(std::move(out));
    }
    if (name == "get")
    {
        auto a = bindArgs(name, args, kwargs, {"key", "default"}, 1);
        const Value *v = d.find(*a[0]);
        return v ? *v : (a[1] ? *a[1] : Value::none());
    }
    if (name == "update")
    {
        if (args.size() > 1)
            throwNative(NativeErrorKind::TypeError, "update expected at most 1 argument");
        if (!args.empty())
        {
            if (args[0].kind() == Value::Kind::Dict)
            {
                const auto entries = args[0].asDict().entries();
                for (const auto &[k, v] : entries)
                    d.set(k, v);
            }
            else
            {
                for (const auto &pair : iterate(args[0]))
                {
                    ValueList kv = iterate(pair);
                    if (kv.size() != 2)
                        throwNative(NativeErrorKind::ValueError, "dictionary update sequence element has length " +
                                                                     std::to_string(kv.size()) + "; 2 is required");
                    d.set(kv[0], kv[1]);
                }
            }
        }
        for (auto &[k, v] : kwargs)
            d.set(Value::string(k), v);
        return Value::none();
    }
    if (name == "pop")
    {
        auto a = bindArgs(name, args, kwargs, {"key", "default"}, 1);
        const Value *v = d.find(*a[0]);
        if (!v)
        {
            if (a[1])
                return *a[1];
            throwNative(NativeErrorKind::KeyError, toRepr(*a[0]));
        }
        Value out = *v;
        d.erase(*a[0]);
        return out;
    }
    if (name == "setdefault")
    {
        auto a = bindArgs(name, args, kwargs, {"key", "default"}, 1);
        if (const Value *v = d.find(*a[0]))
            return *v;
        Value dflt = a[1] ? *a[1] : Value::none();
        d.set(*a[0], dflt);
        return dflt;
    }
    if (name == "copy")
    {
        bindArgs(name, args, kwargs, {}, 0);
        Value out = Value::dict();
        for (const auto &[k, v] : d.entries())
            out.asDict().set(k, v);
        return out;
    }
    if (name == "clear")
    {
        bindArgs(name, args, kwargs, {}, 0);
        d.clear();
        return Value::none();
    }
    noMethod(self, name);
}

} // namespace

bool hasMethod(const Value &self, std::string_view name)
{
    switch (self.kind())
    {
        case Value::Kind::Str:
            return listed(kStrMethods, name);
        case Value::Kind::List:
            return listed(kListMethods, name);
        case Value::Kind::Dict:
            return listed(kDictMethods, name);
        default:
            return false;
    }
}

bool isMutatingMethod(std::string_view name)
{
    return listed(kMutatingMethods, name);
}

Value callMethod(Interpreter &interp, const Value &self, const std::string &name, ValueList &args, KeywordArgs &kwargs)
{
    switch (self.kind())
    {
        case Value::Kind::Str:
            return strMethod(self.asStr(), name, args, kwargs);
        case Value::Kind::List:
            return listMethod(interp, self, name, args, kwargs);
        case Value::Kind::Dict:
            return dictMethod(self, name, args, kwargs);
        default:
            noMethod(self, name);
    }
}

} // namespace fusion::vm
