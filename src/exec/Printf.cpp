//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Printf.cpp
// Purpose: Locate, evaluate and rewrite printf calls in guest code.
// Key invariants: Text outside rewritten calls is preserved byte for byte.
// Ownership/Lifetime: Stateless.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#include "exec/Printf.hpp"

#include "vm/Format.hpp"
#include "vm/NativeError.hpp"

#include <cctype>
#include <cstdio>

namespace fusion::exec
{

namespace
{

bool isIdentChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool endsWith(std::string_view s, std::string_view suffix)
{
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

/// @brief Lexical walker shared by the call finder and argument splitter.
class Cursor
{
  public:
    Cursor(std::string_view code, LanguageTag language) : code_(code), lang_(language) {}

    /// @brief Skip a comment or literal at @p i; returns the new index or
    ///        @p i unchanged when nothing was skipped.
    size_t skipTrivia(size_t i) const
    {
        const size_t n = code_.size();
        const char c = code_[i];
        if (c == '/' && i + 1 < n && code_[i + 1] == '/')
            return lineEnd(i);
        if (c == '#' && lang_ == LanguageTag::Php)
            return lineEnd(i);
        if (c == '/' && i + 1 < n && code_[i + 1] == '*')
        {
            const auto close = code_.find("*/", i + 2);
            return close == std::string_view::npos ? n : close + 2;
        }
        if (c == '"' || (c == '`' && lang_ == LanguageTag::Js))
            return quoted(i, c);
        if (c == '\'')
        {
            if (lang_ != LanguageTag::Rust)
                return quoted(i, c);
            // Rust char literal; a lone quote starts a lifetime.
            if (i + 2 < n && code_[i + 1] == '\\')
                return quoted(i, c);
            if (i + 2 < n && code_[i + 2] == '\'')
                return i + 3;
        }
        return i;
    }

    /// @brief Index one past the closing quote of the literal at @p i.
    size_t quoted(size_t i, char q) const
    {
        size_t j = i + 1;
        while (j < code_.size() && code_[j] != q)
            j += code_[j] == '\\' ? 2 : 1;
        return std::min(j + 1, code_.size());
    }

  private:
    size_t lineEnd(size_t i) const
    {
        const auto nl = code_.find('\n', i);
        return nl == std::string_view::npos ? code_.size() : nl;
    }

    std::string_view code_;
    LanguageTag lang_;
};

/// @brief Callee text ending at @p nameBegin, or empty when the name is a
///        member access of something other than a known printf owner.
std::string calleeAt(std::string_view code, size_t nameBegin)
{
    const std::string_view before = code.substr(0, nameBegin);
    for (std::string_view owner : {"System.out.", "std::"})
    {
        if (endsWith(before, owner))
        {
            const size_t start = nameBegin - owner.size();
            if (start == 0 || !isIdentChar(code[start - 1]))
                return std::string(owner) + "printf";
        }
    }
    if (!before.empty())
    {
        const char prev = before.back();
        if (isIdentChar(prev) || prev == '.' || prev == '$' || endsWith(before, "->") || endsWith(before, "::"))
            return {};
    }
    return "printf";
}

/// @brief Parse the argument list starting at the '(' at @p open.
/// @return Offset one past ')' and the raw argument texts, or nullopt.
std::optional<std::pair<size_t, std::vector<std::string>>> splitArgs(std::string_view code,
                                                                     size_t open,
                                                                     const Cursor &cursor)
{
    std::vector<std::string> args;
    int depth = 0;
    size_t argStart = open + 1;
    size_t i = open;
    while (i < code.size())
    {
        const size_t skipped = cursor.skipTrivia(i);
        if (skipped != i)
        {
            i = skipped;
            continue;
        }
        const char c = code[i];
        if (c == '(' || c == '[' || c == '{')
        {
            ++depth;
        }
        else if (c == ')' || c == ']' || c == '}')
        {
            if (--depth == 0)
            {
                if (c != ')')
                    return std::nullopt;
                args.emplace_back(trim(code.substr(argStart, i - argStart)));
                return std::make_pair(i + 1, std::move(args));
            }
        }
        else if (c == ',' && depth == 1)
        {
            args.emplace_back(trim(code.substr(argStart, i - argStart)));
            argStart = i + 1;
        }
        ++i;
    }
    return std::nullopt;
}

/// @brief Body of @p arg when it is exactly one double-quoted literal.
std::optional<std::string> literalBody(std::string_view arg, LanguageTag language)
{
    if (arg.size() < 2 || arg.front() != '"')
        return std::nullopt;
    if (Cursor(arg, language).quoted(0, '"') != arg.size() || arg.back() != '"')
        return std::nullopt;
    return std::string(arg.substr(1, arg.size() - 2));
}

/// @brief PHP variables are written `$name`; native expressions use `name`.
std::string stripPhpSigils(std::string_view expr)
{
    std::string out;
    for (size_t i = 0; i < expr.size(); ++i)
    {
        if (expr[i] == '$' && i + 1 < expr.size() &&
            (std::isalpha(static_cast<unsigned char>(expr[i + 1])) || expr[i + 1] == '_'))
            continue;
        out.push_back(expr[i]);
    }
    return out;
}

bool isConversion(char c)
{
    switch (c)
    {
        case 's':
        case 'd':
        case 'i':
        case 'u':
        case 'f':
        case 'F':
        case 'e':
        case 'E':
        case 'g':
        case 'G':
        case 'x':
        case 'X':
        case 'o':
        case 'c':
            return true;
        default:
            return false;
    }
}

} // namespace

std::vector<PrintfCall> findPrintfCalls(std::string_view code, LanguageTag language)
{
    const Cursor cursor(code, language);
    std::vector<PrintfCall> calls;
    int braces = 0;
    size_t i = 0;
    while (i < code.size())
    {
        const size_t skipped = cursor.skipTrivia(i);
        if (skipped != i)
        {
            i = skipped;
            continue;
        }
        const char c = code[i];
        if (c == '{')
        {
            ++braces;
            ++i;
            continue;
        }
        if (c == '}')
        {
            --braces;
            ++i;
            continue;
        }
        if (!isIdentChar(c) || (i > 0 && isIdentChar(code[i - 1])))
        {
            ++i;
            continue;
        }
        size_t j = i;
        while (j < code.size() && isIdentChar(code[j]))
            ++j;
        if (braces != 0 || code.substr(i, j - i) != "printf")
        {
            i = j;
            continue;
        }

        const std::string callee = calleeAt(code, i);
        size_t open = j;
        while (open < code.size() && (code[open] == ' ' || code[open] == '\t'))
            ++open;
        if (callee.empty() || open >= code.size() || code[open] != '(')
        {
            i = j;
            continue;
        }

        auto parsed = splitArgs(code, open, cursor);
        if (!parsed)
        {
            i = j;
            continue;
        }
        auto &[end, args] = *parsed;
        auto body = args.empty() ? std::nullopt : literalBody(args.front(), language);
        if (body && args.size() >= 2)
        {
            PrintfCall call;
            call.callee = callee;
            call.begin = i - (callee.size() - 6);
            call.end = end;
            call.format = *body;
            call.args.assign(args.begin() + 1, args.end());
            calls.push_back(std::move(call));
        }
        i = end;
    }
    return calls;
}

std::string unescapeLiteral(std::string_view body)
{
    std::string out;
    for (size_t i = 0; i < body.size(); ++i)
    {
        if (body[i] != '\\' || i + 1 >= body.size())
        {
            out.push_back(body[i]);
            continue;
        }
        const char e = body[++i];
        switch (e)
        {
            case 'n':
                out.push_back('\n');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 'a':
                out.push_back('\a');
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'v':
                out.push_back('\v');
                break;
            case 'x':
            {
                unsigned v = 0;
                size_t k = i + 1;
                while (k < body.size() && k < i + 3 && std::isxdigit(static_cast<unsigned char>(body[k])))
                {
                    const char h = body[k++];
                    v = v * 16 + static_cast<unsigned>(std::isdigit(static_cast<unsigned char>(h))
                                                           ? h - '0'
                                                           : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
                }
                out.push_back(static_cast<char>(v));
                i = k - 1;
                break;
            }
            default:
                if (e >= '0' && e <= '7')
                {
                    unsigned v = 0;
                    size_t k = i;
                    while (k < body.size() && k < i + 3 && body[k] >= '0' && body[k] <= '7')
                        v = v * 8 + static_cast<unsigned>(body[k++] - '0');
                    out.push_back(static_cast<char>(v));
                    i = k - 1;
                }
                else
                {
                    // \" \\ \' \? \$ and unknown escapes keep the character.
                    out.push_back(e);
                }
        }
    }
    return out;
}

std::string formatPrintf(std::string_view format, const vm::ValueList &args, LanguageTag language)
{
    // Normalise to the native %-format: length modifiers dropped, Java %n
    // expanded.
    std::string fmt;
    for (size_t i = 0; i < format.size(); ++i)
    {
        if (format[i] != '%')
        {
            fmt.push_back(format[i]);
            continue;
        }
        const size_t start = i++;
        if (i < format.size() && format[i] == '%')
        {
            fmt += "%%";
            continue;
        }
        std::string spec = "%";
        while (i < format.size() && std::string_view("-+ #0").find(format[i]) != std::string_view::npos)
            spec.push_back(format[i++]);
        while (i < format.size() && std::isdigit(static_cast<unsigned char>(format[i])))
            spec.push_back(format[i++]);
        if (i < format.size() && format[i] == '.')
        {
            spec.push_back(format[i++]);
            while (i < format.size() && std::isdigit(static_cast<unsigned char>(format[i])))
                spec.push_back(format[i++]);
        }
        while (i < format.size() && std::string_view("hlLqjzt").find(format[i]) != std::string_view::npos)
            ++i;
        if (i >= format.size())
            throw PrintfError("incomplete conversion at end of format string");
        const char conv = format[i];
        if (conv == 'n' && language == LanguageTag::Java && spec == "%")
        {
            fmt.push_back('\n');
            continue;
        }
        if (!isConversion(conv))
            throw PrintfError("unsupported conversion '" + std::string(format.substr(start, i - start + 1)) + "'");
        spec.push_back(conv);
        fmt += spec;
    }

    try
    {
        return vm::percentFormat(fmt, args);
    }
    catch (const vm::NativeTrap &trap)
    {
        throw PrintfError(vm::formatNativeError(trap.error()));
    }
}

std::string quotePrintfLiteral(std::string_view text, LanguageTag language)
{
    const bool octal = language == LanguageTag::Cpp || language == LanguageTag::Java;
    std::string out = "\"";
    for (char ch : text)
    {
        const auto c = static_cast<unsigned char>(ch);
        switch (ch)
        {
            case '"':
                out += "\\\"";
                break;
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
            case '%':
                out += "%%";
                break;
            case '$':
                out += language == LanguageTag::Php ? "\\$" : "$";
                break;
            default:
                if (c < 0x20 || c == 0x7f)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), octal ? "\\%03o" : "\\x%02x", c);
                    out += buf;
                }
                else
                {
                    out.push_back(ch);
                }
        }
    }
    out += '"';
    return out;
}

PrintfRewrite rewritePrintf(std::string_view code, LanguageTag language, const PrintfEvaluator &evaluate)
{
    PrintfRewrite result;
    const auto calls = findPrintfCalls(code, language);
    std::optional<std::string> lastText;
    size_t copied = 0;
    for (const auto &call : calls)
    {
        vm::ValueList values;
        for (const auto &arg : call.args)
        {
            const std::string expr = language == LanguageTag::Php ? stripPhpSigils(arg) : arg;
            auto v = evaluate(expr);
            if (!v)
                break;
            values.push_back(std::move(*v));
        }
        if (values.size() != call.args.size())
            continue;

        const std::string text = formatPrintf(unescapeLiteral(call.format), values, language);
        result.code.append(code.substr(copied, call.begin - copied));
        result.code += call.callee + "(" + quotePrintfLiteral(text, language) + ")";
        copied = call.end;
        ++result.rewritten;
        lastText = text;
    }
    result.code.append(code.substr(copied));

    if (calls.size() == 1 && result.rewritten == 1)
    {
        const auto &call = calls.front();
        const auto outside = std::string(code.substr(0, call.begin)) + std::string(code.substr(call.end));
        if (outside.find_first_not_of(" \t\r\n;") == std::string::npos)
            result.inlineText = lastText;
    }
    return result;
}

} // namespace fusion::exec
