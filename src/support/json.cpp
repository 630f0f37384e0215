//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/json.cpp
// Purpose: Recursive-descent JSON parser and pretty printer.
// Key invariants: Parser depth is bounded by kMaxDepth; strings are emitted
//                 as UTF-8 with control characters escaped.
// Ownership/Lifetime: See json.hpp.
// Links: RFC 8259
//
//===----------------------------------------------------------------------===//

#include "support/json.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace fusion::support::json
{

const Value *Value::find(std::string_view key) const
{
    if (kind_ != Kind::Object)
        return nullptr;
    for (const auto &m : object_)
    {
        if (m.first == key)
            return &m.second;
    }
    return nullptr;
}

Value &Value::set(std::string key, Value v)
{
    if (kind_ == Kind::Null)
        kind_ = Kind::Object;
    for (auto &m : object_)
    {
        if (m.first == key)
        {
            m.second = std::move(v);
            return m.second;
        }
    }
    object_.emplace_back(std::move(key), std::move(v));
    return object_.back().second;
}

void Value::push(Value v)
{
    if (kind_ == Kind::Null)
        kind_ = Kind::Array;
    array_.push_back(std::move(v));
}

bool Value::operator==(const Value &other) const
{
    if (kind_ != other.kind_)
        return false;
    switch (kind_)
    {
        case Kind::Null:
            return true;
        case Kind::Bool:
            return bool_ == other.bool_;
        case Kind::Int:
            return int_ == other.int_;
        case Kind::Float:
            return float_ == other.float_;
        case Kind::String:
            return string_ == other.string_;
        case Kind::Array:
            return array_ == other.array_;
        case Kind::Object:
            return object_ == other.object_;
    }
    return false;
}

namespace
{
constexpr int kMaxDepth = 256;

void writeString(std::string &out, const std::string &s)
{
    static constexpr char kHex[] = "0123456789abcdef";
    out.push_back('"');
    for (unsigned char c : s)
    {
        switch (c)
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
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (c < 0x20)
                {
                    out += "\\u00";
                    out.push_back(kHex[c >> 4]);
                    out.push_back(kHex[c & 0x0f]);
                }
                else
                {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back('"');
}

void writeFloat(std::string &out, double d)
{
    if (!std::isfinite(d))
    {
        out += "null";
        return;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", d);
    std::string text(buf);
    if (text.find_first_of(".eE") == std::string::npos)
        text += ".0";
    out += text;
}

void newline(std::string &out, int indent, int depth)
{
    if (indent <= 0)
        return;
    out.push_back('\n');
    out.append(static_cast<size_t>(indent * depth), ' ');
}

void writeValue(std::string &out, const Value &v, int indent, int depth)
{
    switch (v.kind())
    {
        case Value::Kind::Null:
            out += "null";
            return;
        case Value::Kind::Bool:
            out += v.asBool() ? "true" : "false";
            return;
        case Value::Kind::Int:
            out += std::to_string(v.asInt());
            return;
        case Value::Kind::Float:
            writeFloat(out, v.asFloat());
            return;
        case Value::Kind::String:
            writeString(out, v.asString());
            return;
        case Value::Kind::Array:
        {
            const auto &items = v.asArray();
            if (items.empty())
            {
                out += "[]";
                return;
            }
            out.push_back('[');
            for (size_t i = 0; i < items.size(); ++i)
            {
                if (i != 0)
                    out.push_back(',');
                newline(out, indent, depth + 1);
                writeValue(out, items[i], indent, depth + 1);
            }
            newline(out, indent, depth);
            out.push_back(']');
            return;
        }
        case Value::Kind::Object:
        {
            const auto &members = v.asObject();
            if (members.empty())
            {
                out += "{}";
                return;
            }
            out.push_back('{');
            for (size_t i = 0; i < members.size(); ++i)
            {
                if (i != 0)
                    out.push_back(',');
                newline(out, indent, depth + 1);
                writeString(out, members[i].first);
                out += indent > 0 ? ": " : ":";
                writeValue(out, members[i].second, indent, depth + 1);
            }
            newline(out, indent, depth);
            out.push_back('}');
            return;
        }
    }
}

/// @brief Cursor-based parser over a JSON text buffer.
class Parser
{
  public:
    explicit Parser(std::string_view text) : text_(text) {}

    Expected<Value> parseDocument()
    {
        Value v;
        if (!parseValue(v, 0))
            return fail();
        skipWs();
        if (pos_ != text_.size())
        {
            error_ = "trailing characters after JSON document";
            return fail();
        }
        return v;
    }

  private:
    Diag fail() const
    {
        return makeError("IntegrityError", SourceLoc::atLine(0, line_), "malformed JSON: " + error_);
    }

    void skipWs()
    {
        while (pos_ < text_.size())
        {
            const char c = text_[pos_];
            if (c == '\n')
                ++line_;
            else if (c != ' ' && c != '\t' && c != '\r')
                return;
            ++pos_;
        }
    }

    bool expect(char c)
    {
        skipWs();
        if (pos_ < text_.size() && text_[pos_] == c)
        {
            ++pos_;
            return true;
        }
        error_ = std::string("expected '") + c + "'";
        return false;
    }

    bool literal(std::string_view word)
    {
        if (text_.substr(pos_, word.size()) != word)
        {
            error_ = "unexpected token";
            return false;
        }
        pos_ += word.size();
        return true;
    }

    bool parseValue(Value &out, int depth)
    {
        if (depth > kMaxDepth)
        {
            error_ = "nesting too deep";
            return false;
        }
        skipWs();
        if (pos_ >= text_.size())
        {
            error_ = "unexpected end of input";
            return false;
        }
        switch (text_[pos_])
        {
            case '{':
                return parseObject(out, depth);
            case '[':
                return parseArray(out, depth);
            case '"':
            {
                std::string s;
                if (!parseString(s))
                    return false;
                out = Value(std::move(s));
                return true;
            }
            case 't':
                out = Value(true);
                return literal("true");
            case 'f':
                out = Value(false);
                return literal("false");
            case 'n':
                out = Value();
                return literal("null");
            default:
                return parseNumber(out);
        }
    }

    bool parseObject(Value &out, int depth)
    {
        ++pos_;
        out = Value::object();
        skipWs();
        if (pos_ < text_.size() && text_[pos_] == '}')
        {
            ++pos_;
            return true;
        }
        while (true)
        {
            skipWs();
            std::string key;
            if (pos_ >= text_.size() || text_[pos_] != '"')
            {
                error_ = "expected object key";
                return false;
            }
            if (!parseString(key))
                return false;
            if (!expect(':'))
                return false;
            Value member;
            if (!parseValue(member, depth + 1))
                return false;
            out.set(std::move(key), std::move(member));
            skipWs();
            if (pos_ < text_.size() && text_[pos_] == ',')
            {
                ++pos_;
                continue;
            }
            return expect('}');
        }
    }

    bool parseArray(Value &out, int depth)
    {
        ++pos_;
        out = Value::array();
        skipWs();
        if (pos_ < text_.size() && text_[pos_] == ']')
        {
            ++pos_;
            return true;
        }
        while (true)
        {
            Value item;
            if (!parseValue(item, depth + 1))
                return false;
            out.push(std::move(item));
            skipWs();
            if (pos_ < text_.size() && text_[pos_] == ',')
            {
                ++pos_;
                continue;
            }
            return expect(']');
        }
    }

    static void appendUtf8(std::string &s, uint32_t cp)
    {
        if (cp < 0x80)
        {
            s.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800)
        {
            s.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else if (cp < 0x10000)
        {
            s.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else
        {
            s.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            s.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    bool parseHex4(uint32_t &cp)
    {
        if (pos_ + 4 > text_.size())
        {
            error_ = "truncated unicode escape";
            return false;
        }
        cp = 0;
        for (int i = 0; i < 4; ++i)
        {
            const char c = text_[pos_++];
            cp <<= 4;
            if (c >= '0' && c <= '9')
                cp |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f')
                cp |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F')
                cp |= static_cast<uint32_t>(c - 'A' + 10);
            else
            {
                error_ = "invalid unicode escape";
                return false;
            }
        }
        return true;
    }

    bool parseString(std::string &out)
    {
        ++pos_;
        while (pos_ < text_.size())
        {
            const char c = text_[pos_++];
            if (c == '"')
                return true;
            if (c == '\n')
            {
                error_ = "newline in string";
                return false;
            }
            if (c != '\\')
            {
                out.push_back(c);
                continue;
            }
            if (pos_ >= text_.size())
                break;
            const char esc = text_[pos_++];
            switch (esc)
            {
                case '"':
                case '\\':
                case '/':
                    out.push_back(esc);
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case 'u':
                {
                    uint32_t cp = 0;
                    if (!parseHex4(cp))
                        return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF && text_.substr(pos_, 2) == "\\u")
                    {
                        pos_ += 2;
                        uint32_t low = 0;
                        if (!parseHex4(low))
                            return false;
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(out, cp);
                    break;
                }
                default:
                    error_ = "invalid escape sequence";
                    return false;
            }
        }
        error_ = "unterminated string";
        return false;
    }

    bool parseNumber(Value &out)
    {
        const size_t start = pos_;
        bool isFloat = false;
        if (pos_ < text_.size() && text_[pos_] == '-')
            ++pos_;
        while (pos_ < text_.size())
        {
            const char c = text_[pos_];
            if (c >= '0' && c <= '9')
            {
                ++pos_;
            }
            else if (c == '.' || c == 'e' || c == 'E' || c == '+' || (c == '-' && pos_ > start))
            {
                isFloat = true;
                ++pos_;
            }
            else
            {
                break;
            }
        }
        const std::string token(text_.substr(start, pos_ - start));
        if (token.empty() || token == "-")
        {
            error_ = "unexpected character";
            return false;
        }
        char *end = nullptr;
        if (isFloat)
        {
            const double d = std::strtod(token.c_str(), &end);
            out = Value(d);
        }
        else
        {
            const long long i = std::strtoll(token.c_str(), &end, 10);
            out = Value(static_cast<int64_t>(i));
        }
        if (end == nullptr || *end != '\0')
        {
            error_ = "invalid number '" + token + "'";
            return false;
        }
        return true;
    }

    std::string_view text_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    std::string error_;
};
} // namespace

std::string write(const Value &v, int indent)
{
    std::string out;
    writeValue(out, v, indent, 0);
    out.push_back('\n');
    return out;
}

Expected<Value> parse(std::string_view text)
{
    Parser p(text);
    return p.parseDocument();
}

} // namespace fusion::support::json
