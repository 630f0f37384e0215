//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Format.cpp
// Purpose: Implements value-to-text conversions for the native language.
// Key invariants: Nested containers print at most kMaxReprDepth levels deep.
// Ownership/Lifetime: Stateless.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "vm/Format.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace fusion::vm
{

namespace
{

constexpr int kMaxReprDepth = 64;

void appendUtf8(std::string &out, uint32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string quoteString(const std::string &s)
{
    const bool hasSingle = s.find('\'') != std::string::npos;
    const bool hasDouble = s.find('"') != std::string::npos;
    const char quote = hasSingle && !hasDouble ? '"' : '\'';
    std::string out(1, quote);
    for (unsigned char c : s)
    {
        switch (c)
        {
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                if (c == static_cast<unsigned char>(quote))
                {
                    out.push_back('\\');
                    out.push_back(static_cast<char>(c));
                }
                else if (c < 0x20 || c == 0x7F)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof buf, "\\x%02x", c);
                    out += buf;
                }
                else
                {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back(quote);
    return out;
}

std::string render(const Value &v, bool repr, int depth)
{
    using Kind = Value::Kind;
    switch (v.kind())
    {
        case Kind::None:
            return "None";
        case Kind::Bool:
            return v.asBool() ? "True" : "False";
        case Kind::Int:
            return std::to_string(v.asInt());
        case Kind::Float:
            return formatFloatRepr(v.asFloat());
        case Kind::Str:
            return repr ? quoteString(v.asStr()) : v.asStr();
        case Kind::List:
        case Kind::Tuple:
        {
            const bool isList = v.kind() == Kind::List;
            if (depth > kMaxReprDepth)
                return isList ? "[...]" : "(...)";
            std::string out = isList ? "[" : "(";
            const auto &items = v.elements();
            for (size_t i = 0; i < items.size(); ++i)
            {
                if (i)
                    out += ", ";
                out += render(items[i], true, depth + 1);
            }
            if (!isList && items.size() == 1)
                out += ",";
            out += isList ? "]" : ")";
            return out;
        }
        case Kind::Dict:
        {
            if (depth > kMaxReprDepth)
                return "{...}";
            std::string out = "{";
            bool first = true;
            for (const auto &[k, val] : v.asDict().entries())
            {
                if (!first)
                    out += ", ";
                first = false;
                out += render(k, true, depth + 1);
                out += ": ";
                out += render(val, true, depth + 1);
            }
            out += "}";
            return out;
        }
        case Kind::Function:
        {
            const auto &fn = v.asFunction();
            if (fn.exceptionType)
                return "<class '" + fn.name + "'>";
            if (!fn.self.isNone())
                return "<built-in method " + fn.name + " of " + std::string(fn.self.typeName()) + " object>";
            return (fn.isBuiltin() ? "<built-in function " : "<function ") + fn.name + ">";
        }
        case Kind::Module:
            return "<module '" + v.asModule().name + "'>";
        case Kind::Exception:
        {
            const auto &e = v.asException();
            if (!repr)
                return e.message;
            return std::string(toString(e.kind)) + "(" + (e.message.empty() ? "" : quoteString(e.message)) + ")";
        }
    }
    return "<object>";
}

std::string pad(const std::string &sign,
                const std::string &prefix,
                const std::string &body,
                size_t width,
                char align,
                char fill)
{
    const size_t len = sign.size() + prefix.size() + body.size();
    if (width <= len)
        return sign + prefix + body;
    const size_t n = width - len;
    switch (align)
    {
        case '<':
            return sign + prefix + body + std::string(n, fill);
        case '^':
            return std::string(n / 2, fill) + sign + prefix + body + std::string(n - n / 2, fill);
        case '=':
            return sign + prefix + std::string(n, fill) + body;
        default:
            return std::string(n, fill) + sign + prefix + body;
    }
}

std::string unsignedDigits(uint64_t mag, int base, bool upper)
{
    if (mag == 0)
        return "0";
    const char *digits = upper ? "0123456789ABCDEF" : "0123456789abcdef";
    std::string out;
    while (mag)
    {
        out.insert(out.begin(), digits[mag % static_cast<uint64_t>(base)]);
        mag /= static_cast<uint64_t>(base);
    }
    return out;
}

uint64_t magnitude(int64_t v)
{
    return v < 0 ? static_cast<uint64_t>(-(v + 1)) + 1 : static_cast<uint64_t>(v);
}

std::string cFloat(double mag, int precision, char conv, bool alt)
{
    char fmt[16];
    std::snprintf(fmt, sizeof fmt, "%%%s.*%c", alt ? "#" : "", conv);
    char buf[512];
    const int n = std::snprintf(buf, sizeof buf, fmt, precision, mag);
    if (n < 0)
        throwNative(NativeErrorKind::ValueError, "float formatting failed");
    if (static_cast<size_t>(n) < sizeof buf)
        return std::string(buf, static_cast<size_t>(n));
    std::string big(static_cast<size_t>(n) + 1, '\0');
    std::snprintf(big.data(), big.size(), fmt, precision, mag);
    big.resize(static_cast<size_t>(n));
    return big;
}

std::string group(const std::string &body, char sep, size_t every)
{
    size_t end = body.find_first_of(".eE");
    if (end == std::string::npos)
        end = body.size();
    std::string intPart = body.substr(0, end);
    std::string out;
    int count = 0;
    for (size_t i = intPart.size(); i-- > 0;)
    {
        out.insert(out.begin(), intPart[i]);
        if (++count % static_cast<int>(every) == 0 && i > 0)
            out.insert(out.begin(), sep);
    }
    return out + body.substr(end);
}

std::string signOf(bool negative, char signFlag)
{
    if (negative)
        return "-";
    if (signFlag == '+')
        return "+";
    if (signFlag == ' ')
        return " ";
    return "";
}

struct PercentSpec
{
    bool left = false;
    char sign = 0;
    bool alt = false;
    bool zero = false;
    size_t width = 0;
    int precision = -1;
    char conv = 0;
};

std::string convertPercent(const PercentSpec &ps, const Value &arg)
{
    const char align = ps.left ? '<' : '>';
    switch (ps.conv)
    {
        case 's':
        case 'r':
        case 'a':
        {
            std::string s = ps.conv == 's' ? toStr(arg) : toRepr(arg);
            if (ps.precision >= 0 && static_cast<size_t>(ps.precision) < s.size())
                s.resize(static_cast<size_t>(ps.precision));
            return pad("", "", s, ps.width, align, ' ');
        }
        case 'd':
        case 'i':
        case 'u':
        case 'x':
        case 'X':
        case 'o':
        {
            int64_t iv = 0;
            if (arg.isIntegral())
            {
                iv = arg.asInt();
            }
            else if (arg.kind() == Value::Kind::Float && (ps.conv == 'd' || ps.conv == 'i' || ps.conv == 'u'))
            {
                const double d = arg.asFloat();
                if (!std::isfinite(d) || std::fabs(d) >= 9.2e18)
                    throwNative(NativeErrorKind::OverflowError, "cannot convert float to integer");
                iv = static_cast<int64_t>(d);
            }
            else
            {
                const bool real = ps.conv == 'd' || ps.conv == 'i' || ps.conv == 'u';
                throwNative(NativeErrorKind::TypeError,
                            std::string("%") + ps.conv + " format: " + (real ? "a real number" : "an integer") +
                                " is required, not " + std::string(arg.typeName()));
            }
            const int base = ps.conv == 'x' || ps.conv == 'X' ? 16 : ps.conv == 'o' ? 8 : 10;
            std::string body = unsignedDigits(magnitude(iv), base, ps.conv == 'X');
            if (ps.precision > 0 && body.size() < static_cast<size_t>(ps.precision))
                body.insert(0, static_cast<size_t>(ps.precision) - body.size(), '0');
            std::string prefix;
            if (ps.alt && base == 16)
                prefix = ps.conv == 'X' ? "0X" : "0x";
            else if (ps.alt && base == 8)
                prefix = "0o";
            const std::string sign = signOf(iv < 0, ps.sign);
            if (ps.zero && !ps.left)
                return pad(sign, prefix, body, ps.width, '=', '0');
            return pad(sign, prefix, body, ps.width, align, ' ');
        }
        case 'f':
        case 'F':
        case 'e':
        case 'E':
        case 'g':
        case 'G':
        {
            if (!arg.isNumber())
                throwNative(NativeErrorKind::TypeError,
                            "must be real number, not " + std::string(arg.typeName()));
            const double d = arg.asFloat();
            const std::string body =
                cFloat(std::fabs(d), ps.precision >= 0 ? ps.precision : 6, ps.conv, ps.alt);
            const std::string sign = signOf(std::signbit(d) && !std::isnan(d), ps.sign);
            if (ps.zero && !ps.left && std::isfinite(d))
                return pad(sign, "", body, ps.width, '=', '0');
            return pad(sign, "", body, ps.width, align, ' ');
        }
        case 'c':
        {
            std::string body;
            if (arg.isIntegral())
            {
                const int64_t cp = arg.asInt();
                if (cp < 0 || cp > 0x10FFFF)
                    throwNative(NativeErrorKind::OverflowError, "%c arg not in range(0x110000)");
                appendUtf8(body, static_cast<uint32_t>(cp));
            }
            else if (arg.kind() == Value::Kind::Str && arg.asStr().size() == 1)
            {
                body = arg.asStr();
            }
            else
            {
                throwNative(NativeErrorKind::TypeError, "%c requires int or char");
            }
            return pad("", "", body, ps.width, align, ' ');
        }
        default:
        {
            char buf[64];
            std::snprintf(buf,
                          sizeof buf,
                          "unsupported format character '%c' (0x%x)",
                          ps.conv,
                          static_cast<unsigned>(static_cast<unsigned char>(ps.conv)));
            throwNative(NativeErrorKind::ValueError, buf);
        }
    }
}

/// Shared driver for both `%` entry points. @p mapping is non-null when the
/// right-hand side is a dict.
std::string percentDriver(std::string_view fmt, const ValueList *args, const DictObject *mapping)
{
    std::string out;
    size_t argIndex = 0;
    bool usedMapping = false;

    auto nextArg = [&]() -> const Value & {
        if (!args || argIndex >= args->size())
            throwNative(NativeErrorKind::TypeError, "not enough arguments for format string");
        return (*args)[argIndex++];
    };

    size_t i = 0;
    while (i < fmt.size())
    {
        const char c = fmt[i];
        if (c != '%')
        {
            out.push_back(c);
            ++i;
            continue;
        }
        ++i;
        if (i >= fmt.size())
            throwNative(NativeErrorKind::ValueError, "incomplete format");

        const Value *keyed = nullptr;
        if (fmt[i] == '(')
        {
            const size_t close = fmt.find(')', i);
            if (close == std::string_view::npos)
                throwNative(NativeErrorKind::ValueError, "incomplete format key");
            if (!mapping)
                throwNative(NativeErrorKind::TypeError, "format requires a mapping");
            const std::string key(fmt.substr(i + 1, close - i - 1));
            keyed = mapping->find(Value::string(key));
            if (!keyed)
                throwNative(NativeErrorKind::KeyError, "'" + key + "'");
            usedMapping = true;
            i = close + 1;
        }

        PercentSpec ps;
        for (; i < fmt.size(); ++i)
        {
            const char f = fmt[i];
            if (f == '-')
                ps.left = true;
            else if (f == '+')
                ps.sign = '+';
            else if (f == ' ')
                ps.sign = ps.sign ? ps.sign : ' ';
            else if (f == '#')
                ps.alt = true;
            else if (f == '0')
                ps.zero = true;
            else
                break;
        }
        if (i < fmt.size() && fmt[i] == '*')
        {
            const Value &w = nextArg();
            if (!w.isIntegral())
                throwNative(NativeErrorKind::TypeError, "* wants int");
            int64_t wv = w.asInt();
            if (wv < 0)
            {
                ps.left = true;
                wv = -wv;
            }
            ps.width = static_cast<size_t>(wv);
            ++i;
        }
        else
        {
            while (i < fmt.size() && fmt[i] >= '0' && fmt[i] <= '9')
                ps.width = ps.width * 10 + static_cast<size_t>(fmt[i++] - '0');
        }
        if (i < fmt.size() && fmt[i] == '.')
        {
            ++i;
            ps.precision = 0;
            if (i < fmt.size() && fmt[i] == '*')
            {
                const Value &p = nextArg();
                if (!p.isIntegral())
                    throwNative(NativeErrorKind::TypeError, "* wants int");
                ps.precision = static_cast<int>(std::max<int64_t>(0, p.asInt()));
                ++i;
            }
            else
            {
                while (i < fmt.size() && fmt[i] >= '0' && fmt[i] <= '9')
                    ps.precision = ps.precision * 10 + (fmt[i++] - '0');
            }
        }
        while (i < fmt.size() && (fmt[i] == 'l' || fmt[i] == 'h' || fmt[i] == 'L'))
            ++i;
        if (i >= fmt.size())
            throwNative(NativeErrorKind::ValueError, "incomplete format");
        ps.conv = fmt[i++];
        if (ps.conv == '%')
        {
            out.push_back('%');
            continue;
        }
        out += convertPercent(ps, keyed ? *keyed : nextArg());
    }

    if (args && argIndex < args->size() && !usedMapping)
        throwNative(NativeErrorKind::TypeError, "not all arguments converted during string formatting");
    return out;
}

struct FormatSpec
{
    char fill = ' ';
    char align = 0;
    char sign = 0;
    bool alt = false;
    size_t width = 0;
    char grouping = 0;
    int precision = -1;
    char type = 0;
};

FormatSpec parseFormatSpec(std::string_view spec)
{
    auto isAlign = [](char c) { return c == '<' || c == '>' || c == '^' || c == '='; };
    FormatSpec fs;
    size_t i = 0;
    if (spec.size() >= 2 && isAlign(spec[1]))
    {
        fs.fill = spec[0];
        fs.align = spec[1];
        i = 2;
    }
    else if (!spec.empty() && isAlign(spec[0]))
    {
        fs.align = spec[0];
        i = 1;
    }
    if (i < spec.size() && (spec[i] == '+' || spec[i] == '-' || spec[i] == ' '))
        fs.sign = spec[i++];
    if (i < spec.size() && spec[i] == '#')
    {
        fs.alt = true;
        ++i;
    }
    if (i < spec.size() && spec[i] == '0')
    {
        if (!fs.align)
        {
            fs.fill = '0';
            fs.align = '=';
        }
        ++i;
    }
    while (i < spec.size() && spec[i] >= '0' && spec[i] <= '9')
        fs.width = fs.width * 10 + static_cast<size_t>(spec[i++] - '0');
    if (i < spec.size() && (spec[i] == ',' || spec[i] == '_'))
        fs.grouping = spec[i++];
    if (i < spec.size() && spec[i] == '.')
    {
        ++i;
        if (i >= spec.size() || spec[i] < '0' || spec[i] > '9')
            throwNative(NativeErrorKind::ValueError, "Format specifier missing precision");
        fs.precision = 0;
        while (i < spec.size() && spec[i] >= '0' && spec[i] <= '9')
            fs.precision = fs.precision * 10 + (spec[i++] - '0');
    }
    if (i < spec.size())
        fs.type = spec[i++];
    if (i != spec.size())
        throwNative(NativeErrorKind::ValueError, "Invalid format specifier '" + std::string(spec) + "'");
    return fs;
}

[[noreturn]] void unknownCode(char type, const Value &v)
{
    throwNative(NativeErrorKind::ValueError,
                std::string("Unknown format code '") + type + "' for object of type '" +
                    std::string(v.typeName()) + "'");
}

std::string formatFloatSpec(double d, const FormatSpec &fs)
{
    const double mag = std::fabs(d);
    std::string body;
    std::string suffix;
    switch (fs.type)
    {
        case 0:
            if (fs.precision < 0)
            {
                body = formatFloatRepr(mag);
            }
            else
            {
                body = cFloat(mag, std::max(fs.precision, 1), 'g', fs.alt);
                if (std::isfinite(mag) && body.find_first_of(".e") == std::string::npos)
                    body += ".0";
            }
            break;
        case 'n':
            body = cFloat(mag, fs.precision >= 0 ? fs.precision : 6, 'g', fs.alt);
            break;
        case '%':
            body = cFloat(mag * 100.0, fs.precision >= 0 ? fs.precision : 6, 'f', fs.alt);
            suffix = "%";
            break;
        case 'f':
        case 'F':
        case 'e':
        case 'E':
        case 'g':
        case 'G':
            body = cFloat(mag, fs.precision >= 0 ? fs.precision : 6, fs.type, fs.alt);
            break;
        default:
            unknownCode(fs.type, Value::real(d));
    }
    if (fs.grouping)
        body = group(body, fs.grouping, 3);
    return pad(signOf(std::signbit(d) && !std::isnan(d), fs.sign), "", body + suffix, fs.width,
               fs.align ? fs.align : '>', fs.fill);
}

} // namespace

std::string formatFloatRepr(double d)
{
    if (std::isnan(d))
        return "nan";
    if (std::isinf(d))
        return d > 0 ? "inf" : "-inf";
    if (d == 0.0)
        return std::signbit(d) ? "-0.0" : "0.0";

    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof buf, d, std::chars_format::scientific);
    std::string sci(buf, res.ptr);
    std::string sign;
    if (sci[0] == '-')
    {
        sign = "-";
        sci.erase(0, 1);
    }
    const size_t epos = sci.find('e');
    const int exp = std::atoi(sci.c_str() + epos + 1);
    std::string digits;
    for (size_t i = 0; i < epos; ++i)
    {
        if (sci[i] != '.')
            digits.push_back(sci[i]);
    }

    if (exp < -4 || exp >= 16)
    {
        std::string out = sign + digits.substr(0, 1);
        if (digits.size() > 1)
            out += "." + digits.substr(1);
        char ebuf[16];
        std::snprintf(ebuf, sizeof ebuf, "e%c%02d", exp < 0 ? '-' : '+', std::abs(exp));
        return out + ebuf;
    }
    if (exp < 0)
        return sign + "0." + std::string(static_cast<size_t>(-exp - 1), '0') + digits;

    const size_t intLen = static_cast<size_t>(exp) + 1;
    if (digits.size() <= intLen)
        return sign + digits + std::string(intLen - digits.size(), '0') + ".0";
    return sign + digits.substr(0, intLen) + "." + digits.substr(intLen);
}

std::string toStr(const Value &v)
{
    return render(v, false, 0);
}

std::string toRepr(const Value &v)
{
    return render(v, true, 0);
}

std::string formatWithSpec(const Value &v, std::string_view spec)
{
    using Kind = Value::Kind;
    if (spec.empty())
        return toStr(v);
    const FormatSpec fs = parseFormatSpec(spec);

    if (v.kind() == Kind::Str || (v.kind() == Kind::Bool && fs.type == 0))
    {
        if (fs.type != 0 && fs.type != 's')
            unknownCode(fs.type, v);
        if (fs.sign)
            throwNative(NativeErrorKind::ValueError, "Sign not allowed in string format specifier");
        if (fs.align == '=')
            throwNative(NativeErrorKind::ValueError, "'=' alignment not allowed in string format specifier");
        std::string body = toStr(v);
        if (fs.precision >= 0 && static_cast<size_t>(fs.precision) < body.size())
            body.resize(static_cast<size_t>(fs.precision));
        return pad("", "", body, fs.width, fs.align ? fs.align : '<', fs.fill);
    }

    if (v.isIntegral())
    {
        const int64_t iv = v.asInt();
        switch (fs.type)
        {
            case 'e':
            case 'E':
            case 'f':
            case 'F':
            case 'g':
            case 'G':
            case '%':
                return formatFloatSpec(static_cast<double>(iv), fs);
            default:
                break;
        }
        if (fs.precision >= 0)
            throwNative(NativeErrorKind::ValueError, "Precision not allowed in integer format specifier");
        std::string prefix;
        std::string body;
        switch (fs.type)
        {
            case 0:
            case 'd':
            case 'n':
                body = unsignedDigits(magnitude(iv), 10, false);
                if (fs.grouping)
                    body = group(body, fs.grouping, 3);
                break;
            case 'b':
            case 'o':
            case 'x':
            case 'X':
            {
                const int base = fs.type == 'b' ? 2 : fs.type == 'o' ? 8 : 16;
                body = unsignedDigits(magnitude(iv), base, fs.type == 'X');
                if (fs.grouping == '_')
                    body = group(body, '_', 4);
                else if (fs.grouping)
                    throwNative(NativeErrorKind::ValueError, "Cannot specify ',' with '" + std::string(1, fs.type) + "'.");
                if (fs.alt)
                    prefix = std::string("0") + (fs.type == 'X' ? 'X' : fs.type);
                break;
            }
            case 'c':
            {
                if (iv < 0 || iv > 0x10FFFF)
                    throwNative(NativeErrorKind::OverflowError, "%c arg not in range(0x110000)");
                appendUtf8(body, static_cast<uint32_t>(iv));
                return pad("", "", body, fs.width, fs.align ? fs.align : '<', fs.fill);
            }
            default:
                unknownCode(fs.type, v);
        }
        return pad(signOf(iv < 0, fs.sign), prefix, body, fs.width, fs.align ? fs.align : '>', fs.fill);
    }

    if (v.kind() == Kind::Float)
        return formatFloatSpec(v.asFloat(), fs);

    throwNative(NativeErrorKind::TypeError,
                "unsupported format string passed to " + std::string(v.typeName()) + ".__format__");
}

std::string percentFormat(std::string_view fmt, const ValueList &args)
{
    return percentDriver(fmt, &args, nullptr);
}

std::string percentFormat(std::string_view fmt, const Value &rhs)
{
    if (rhs.kind() == Value::Kind::Tuple)
        return percentDriver(fmt, &rhs.asTuple(), nullptr);
    if (rhs.kind() == Value::Kind::Dict)
    {
        ValueList single{rhs};
        return percentDriver(fmt, &single, &rhs.asDict());
    }
    ValueList single{rhs};
    return percentDriver(fmt, &single, nullptr);
}

std::string strFormat(std::string_view fmt, const ValueList &args, const KeywordArgs &kwargs)
{
    std::string out;
    size_t autoIndex = 0;
    bool usedAuto = false;
    bool usedManual = false;

    size_t i = 0;
    while (i < fmt.size())
    {
        const char c = fmt[i];
        if (c == '{' && i + 1 < fmt.size() && fmt[i + 1] == '{')
        {
            out.push_back('{');
            i += 2;
            continue;
        }
        if (c == '}' && i + 1 < fmt.size() && fmt[i + 1] == '}')
        {
            out.push_back('}');
            i += 2;
            continue;
        }
        if (c == '}')
            throwNative(NativeErrorKind::ValueError, "Single '}' encountered in format string");
        if (c != '{')
        {
            out.push_back(c);
            ++i;
            continue;
        }

        const size_t close = fmt.find('}', i);
        if (close == std::string_view::npos)
            throwNative(NativeErrorKind::ValueError, "Single '{' encountered in format string");
        std::string_view field = fmt.substr(i + 1, close - i - 1);
        i = close + 1;

        std::string_view spec;
        const size_t colon = field.find(':');
        if (colon != std::string_view::npos)
        {
            spec = field.substr(colon + 1);
            field = field.substr(0, colon);
        }
        char conversion = 0;
        const size_t bang = field.find('!');
        if (bang != std::string_view::npos)
        {
            if (bang + 2 != field.size() || (field[bang + 1] != 'r' && field[bang + 1] != 's'))
                throwNative(NativeErrorKind::ValueError, "invalid conversion in format string");
            conversion = field[bang + 1];
            field = field.substr(0, bang);
        }

        const Value *arg = nullptr;
        if (field.empty())
        {
            if (usedManual)
                throwNative(NativeErrorKind::ValueError,
                            "cannot switch from manual field specification to automatic field numbering");
            usedAuto = true;
            if (autoIndex >= args.size())
                throwNative(NativeErrorKind::IndexError, "Replacement index " + std::to_string(autoIndex) +
                                                             " out of range for positional args tuple");
            arg = &args[autoIndex++];
        }
        else if (field.find_first_not_of("0123456789") == std::string_view::npos)
        {
            if (usedAuto)
                throwNative(NativeErrorKind::ValueError,
                            "cannot switch from automatic field numbering to manual field specification");
            usedManual = true;
            const size_t idx = static_cast<size_t>(std::stoul(std::string(field)));
            if (idx >= args.size())
                throwNative(NativeErrorKind::IndexError, "Replacement index " + std::string(field) +
                                                             " out of range for positional args tuple");
            arg = &args[idx];
        }
        else
        {
            for (const auto &[name, value] : kwargs)
            {
                if (name == field)
                    arg = &value;
            }
            if (!arg)
                throwNative(NativeErrorKind::KeyError, "'" + std::string(field) + "'");
        }

        if (conversion == 'r')
            out += formatWithSpec(Value::string(toRepr(*arg)), spec);
        else if (conversion == 's')
            out += formatWithSpec(Value::string(toStr(*arg)), spec);
        else
            out += formatWithSpec(*arg, spec);
    }
    return out;
}

} // namespace fusion::vm
