//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Marshal.cpp
// Purpose: Literal rendering and type inference for the marshalling
//          adapters, plus identifier extraction from guest code.
// Key invariants: Statically typed targets (C++, Java, Rust) require every
//                 container to be homogeneous after int-to-float promotion;
//                 mapping keys must be strings in every target. Empty
//                 containers default to integer elements.
// Ownership/Lifetime: Stateless.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#include "exec/Marshal.hpp"

#include "vm/Format.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>
#include <set>

namespace fusion::exec
{

MarshalError::MarshalError(std::string name, const std::string &message)
    : std::runtime_error("cannot marshal '" + name + "': " + message), name_(std::move(name))
{
}

std::string MarshalAdapter::declare(const std::string &name, const vm::Value &value) const
{
    if (isReserved(name))
        throw MarshalError(name, "name is reserved in " + std::string(frontends::lf::toString(language())));
    return declaration(name, value);
}

namespace
{

using vm::Value;
using Kind = vm::Value::Kind;

constexpr int kMaxNesting = 32;

//===----------------------------------------------------------------------===//
// Escaping
//===----------------------------------------------------------------------===//

std::string hex2(unsigned char c)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02x", c);
    return buf;
}

/// @brief Escape into a double-quoted literal; @p control renders other
///        control bytes.
template <typename F> std::string quote(const std::string &s, F control, bool escapeDollar = false)
{
    std::string out = "\"";
    for (char ch : s)
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
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '$':
                out += escapeDollar ? "\\$" : "$";
                break;
            default:
                if (c < 0x20 || c == 0x7f)
                    out += control(c);
                else
                    out.push_back(ch);
        }
    }
    out += '"';
    return out;
}

std::string quoteCpp(const std::string &s)
{
    return quote(s, [](unsigned char c) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\%03o", c);
        return std::string(buf);
    });
}

std::string quoteJava(const std::string &s)
{
    return quote(s, [](unsigned char c) { return "\\u00" + hex2(c); });
}

std::string quoteJs(const std::string &s)
{
    return quote(s, [](unsigned char c) { return "\\u00" + hex2(c); });
}

std::string quotePhp(const std::string &s)
{
    return quote(s, [](unsigned char c) { return "\\x" + hex2(c); }, true);
}

std::string quoteRust(const std::string &s)
{
    return quote(s, [](unsigned char c) { return "\\u{" + hex2(c) + "}"; });
}

//===----------------------------------------------------------------------===//
// Static shapes
//===----------------------------------------------------------------------===//

/// @brief Inferred static type of a value.
struct Shape
{
    enum Base
    {
        Int,
        Float,
        Str,
        Bool,
        Null,
        Seq,
        Map,
    } base = Int;
    std::shared_ptr<const Shape> elem; ///< Element or mapped type of Seq/Map.
};

bool sameShape(const Shape &a, const Shape &b)
{
    if (a.base != b.base)
        return false;
    if (!a.elem || !b.elem)
        return !a.elem && !b.elem;
    return sameShape(*a.elem, *b.elem);
}

Shape unify(const Shape &a, const Shape &b, const std::string &name)
{
    if (sameShape(a, b))
        return a;
    const bool aNum = a.base == Shape::Int || a.base == Shape::Float;
    const bool bNum = b.base == Shape::Int || b.base == Shape::Float;
    if (aNum && bNum)
        return Shape{Shape::Float, nullptr};
    if (a.base == b.base && a.elem && b.elem)
        return Shape{a.base, std::make_shared<const Shape>(unify(*a.elem, *b.elem, name))};
    throw MarshalError(name, "heterogeneous container has no static element type");
}

void requireStringKeys(const vm::DictObject &d, const std::string &name)
{
    for (const auto &[k, v] : d.entries())
    {
        if (k.kind() != Kind::Str)
            throw MarshalError(name, "mapping keys must be strings, found " + std::string(k.typeName()));
    }
}

Shape shapeOf(const Value &v, const std::string &name, int depth, bool nested)
{
    if (depth > kMaxNesting)
        throw MarshalError(name, "value is nested too deeply");
    switch (v.kind())
    {
        case Kind::Bool:
            return Shape{Shape::Bool, nullptr};
        case Kind::Int:
            return Shape{Shape::Int, nullptr};
        case Kind::Float:
            return Shape{Shape::Float, nullptr};
        case Kind::Str:
            return Shape{Shape::Str, nullptr};
        case Kind::None:
            if (nested)
                throw MarshalError(name, "None inside a container has no static type");
            return Shape{Shape::Null, nullptr};
        case Kind::List:
        case Kind::Tuple:
        {
            Shape elem{Shape::Int, nullptr};
            bool first = true;
            for (const auto &e : v.elements())
            {
                Shape s = shapeOf(e, name, depth + 1, true);
                elem = first ? s : unify(elem, s, name);
                first = false;
            }
            return Shape{Shape::Seq, std::make_shared<const Shape>(elem)};
        }
        case Kind::Dict:
        {
            const auto &d = v.asDict();
            requireStringKeys(d, name);
            Shape elem{Shape::Int, nullptr};
            bool first = true;
            for (const auto &[k, e] : d.entries())
            {
                Shape s = shapeOf(e, name, depth + 1, true);
                elem = first ? s : unify(elem, s, name);
                first = false;
            }
            return Shape{Shape::Map, std::make_shared<const Shape>(elem)};
        }
        default:
            throw MarshalError(name, std::string(v.typeName()) + " values cannot leave the native language");
    }
}

/// @brief Float literal text; @p inf and @p nan spell the specials.
std::string floatText(double d, std::string_view inf, std::string_view nan)
{
    if (std::isnan(d))
        return std::string(nan);
    if (std::isinf(d))
        return (d < 0 ? "-" : "") + std::string(inf);
    return vm::formatFloatRepr(d);
}

/// @brief Common driver for C++, Java and Rust.
class StaticAdapter : public MarshalAdapter
{
  protected:
    virtual std::string typeName(const Shape &s) const = 0;
    virtual std::string intLiteral(int64_t i) const = 0;
    virtual std::string floatLiteral(double d) const = 0;
    virtual std::string strLiteral(const std::string &s) const = 0;
    virtual std::string seqLiteral(const std::vector<std::string> &items, const Shape &s) const = 0;
    virtual std::string mapLiteral(const std::vector<std::pair<std::string, std::string>> &items,
                                   const Shape &s) const = 0;
    virtual std::string nullDeclaration(const std::string &name) const = 0;
    virtual std::string bind(const std::string &name, const std::string &type, const std::string &literal) const = 0;

    std::string literal(const Value &v, const Shape &s, const std::string &name) const
    {
        switch (s.base)
        {
            case Shape::Bool:
                return v.asBool() ? "true" : "false";
            case Shape::Int:
                return intLiteral(v.asInt());
            case Shape::Float:
                if (v.isIntegral())
                    return floatLiteral(static_cast<double>(v.asInt()));
                return floatLiteral(v.asFloat());
            case Shape::Str:
                return strLiteral(v.asStr());
            case Shape::Seq:
            {
                std::vector<std::string> items;
                for (const auto &e : v.elements())
                    items.push_back(literal(e, *s.elem, name));
                return seqLiteral(items, s);
            }
            case Shape::Map:
            {
                std::vector<std::pair<std::string, std::string>> items;
                for (const auto &[k, e] : v.asDict().entries())
                    items.emplace_back(strLiteral(k.asStr()), literal(e, *s.elem, name));
                return mapLiteral(items, s);
            }
            case Shape::Null:
                break;
        }
        throw MarshalError(name, "None has no literal");
    }

    std::string declaration(const std::string &name, const Value &value) const override
    {
        const Shape s = shapeOf(value, name, 0, false);
        if (s.base == Shape::Null)
            return nullDeclaration(name);
        return bind(name, typeName(s), literal(value, s, name));
    }
};

std::string joinItems(const std::vector<std::string> &items)
{
    std::string out;
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i)
            out += ", ";
        out += items[i];
    }
    return out;
}

template <size_t N> bool listed(const std::array<std::string_view, N> &words, std::string_view name)
{
    return std::find(words.begin(), words.end(), name) != words.end();
}

//===----------------------------------------------------------------------===//
// C++
//===----------------------------------------------------------------------===//

class CppAdapter final : public StaticAdapter
{
  public:
    LanguageTag language() const override
    {
        return LanguageTag::Cpp;
    }

    bool isReserved(std::string_view name) const override
    {
        static constexpr std::array<std::string_view, 99> kWords = {
            "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor", "bool", "break", "case",
            "catch", "char", "char8_t", "char16_t", "char32_t", "class", "compl", "concept", "const",
            "consteval", "constexpr", "constinit", "const_cast", "continue", "co_await", "co_return",
            "co_yield", "decltype", "default", "delete", "do", "double", "dynamic_cast", "else", "enum",
            "explicit", "export", "extern", "false", "float", "for", "friend", "goto", "if", "inline", "int",
            "long", "mutable", "namespace", "new", "noexcept", "not", "not_eq", "nullptr", "operator", "or",
            "or_eq", "private", "protected", "public", "register", "reinterpret_cast", "requires", "return",
            "short", "signed", "sizeof", "static", "static_assert", "static_cast", "struct", "switch",
            "template", "this", "thread_local", "throw", "true", "try", "typedef", "typeid", "typename",
            "union", "unsigned", "using", "virtual", "void", "volatile", "wchar_t", "while", "xor", "xor_eq",
            "main", "std", "printf", "string", "vector", "map", "cout",
        };
        return listed(kWords, name);
    }

  protected:
    std::string typeName(const Shape &s) const override
    {
        switch (s.base)
        {
            case Shape::Int:
                return "long long";
            case Shape::Float:
                return "double";
            case Shape::Str:
                return "std::string";
            case Shape::Bool:
                return "bool";
            case Shape::Null:
                return "std::nullptr_t";
            case Shape::Seq:
                return "std::vector<" + typeName(*s.elem) + ">";
            case Shape::Map:
                return "std::map<std::string, " + typeName(*s.elem) + ">";
        }
        return "void";
    }

    std::string intLiteral(int64_t i) const override
    {
        if (i == std::numeric_limits<int64_t>::min())
            return "(-9223372036854775807LL - 1)";
        return std::to_string(i) + "LL";
    }

    std::string floatLiteral(double d) const override
    {
        return floatText(d, "std::numeric_limits<double>::infinity()", "std::numeric_limits<double>::quiet_NaN()");
    }

    std::string strLiteral(const std::string &s) const override
    {
        return "std::string(" + quoteCpp(s) + ", " + std::to_string(s.size()) + ")";
    }

    std::string seqLiteral(const std::vector<std::string> &items, const Shape &) const override
    {
        return "{" + joinItems(items) + "}";
    }

    std::string mapLiteral(const std::vector<std::pair<std::string, std::string>> &items, const Shape &) const override
    {
        std::vector<std::string> pairs;
        for (const auto &[k, v] : items)
            pairs.push_back("{" + k + ", " + v + "}");
        return "{" + joinItems(pairs) + "}";
    }

    std::string nullDeclaration(const std::string &name) const override
    {
        return "std::nullptr_t " + name + " = nullptr;";
    }

    std::string bind(const std::string &name, const std::string &type, const std::string &literal) const override
    {
        return type + " " + name + " = " + literal + ";";
    }
};

//===----------------------------------------------------------------------===//
// Java
//===----------------------------------------------------------------------===//

class JavaAdapter final : public StaticAdapter
{
  public:
    LanguageTag language() const override
    {
        return LanguageTag::Java;
    }

    bool isReserved(std::string_view name) const override
    {
        static constexpr std::array<std::string_view, 60> kWords = {
            "abstract", "assert", "boolean", "break", "byte", "case", "catch", "char", "class", "const",
            "continue", "default", "do", "double", "else", "enum", "extends", "final", "finally", "float",
            "for", "goto", "if", "implements", "import", "instanceof", "int", "interface", "long", "native",
            "new", "package", "private", "protected", "public", "return", "short", "static", "strictfp",
            "super", "switch", "synchronized", "this", "throw", "throws", "transient", "try", "void",
            "volatile", "while", "true", "false", "null", "var", "yield", "record", "args", "Main", "System",
            "String",
        };
        return listed(kWords, name);
    }

  protected:
    std::string boxed(const Shape &s) const
    {
        switch (s.base)
        {
            case Shape::Int:
                return "Long";
            case Shape::Float:
                return "Double";
            case Shape::Bool:
                return "Boolean";
            default:
                return typeName(s);
        }
    }

    std::string typeName(const Shape &s) const override
    {
        switch (s.base)
        {
            case Shape::Int:
                return "long";
            case Shape::Float:
                return "double";
            case Shape::Str:
                return "String";
            case Shape::Bool:
                return "boolean";
            case Shape::Null:
                return "Object";
            case Shape::Seq:
                if (s.elem->base == Shape::Map)
                    throw MarshalError("", "sequences of mappings have no Java array type");
                return typeName(*s.elem) + "[]";
            case Shape::Map:
                return "java.util.Map<String, " + boxed(*s.elem) + ">";
        }
        return "Object";
    }

    std::string intLiteral(int64_t i) const override
    {
        if (i == std::numeric_limits<int64_t>::min())
            return "Long.MIN_VALUE";
        return std::to_string(i) + "L";
    }

    std::string floatLiteral(double d) const override
    {
        if (std::isinf(d))
            return d < 0 ? "Double.NEGATIVE_INFINITY" : "Double.POSITIVE_INFINITY";
        return floatText(d, "Double.POSITIVE_INFINITY", "Double.NaN");
    }

    std::string strLiteral(const std::string &s) const override
    {
        return quoteJava(s);
    }

    std::string seqLiteral(const std::vector<std::string> &items, const Shape &s) const override
    {
        return "new " + typeName(s) + "{" + joinItems(items) + "}";
    }

    std::string mapLiteral(const std::vector<std::pair<std::string, std::string>> &items, const Shape &s) const override
    {
        std::string out = "new java.util.LinkedHashMap<String, " + boxed(*s.elem) + ">()";
        if (items.empty())
            return out;
        out += " {{ ";
        for (const auto &[k, v] : items)
            out += "put(" + k + ", " + v + "); ";
        return out + "}}";
    }

    std::string nullDeclaration(const std::string &name) const override
    {
        return "Object " + name + " = null;";
    }

    std::string bind(const std::string &name, const std::string &type, const std::string &literal) const override
    {
        return type + " " + name + " = " + literal + ";";
    }

    std::string declaration(const std::string &name, const Value &value) const override
    {
        try
        {
            return StaticAdapter::declaration(name, value);
        }
        catch (const MarshalError &e)
        {
            if (!e.name().empty())
                throw;
            throw MarshalError(name, "sequences of mappings have no Java array type");
        }
    }
};

//===----------------------------------------------------------------------===//
// Rust
//===----------------------------------------------------------------------===//

class RustAdapter final : public StaticAdapter
{
  public:
    LanguageTag language() const override
    {
        return LanguageTag::Rust;
    }

    bool isReserved(std::string_view name) const override
    {
        static constexpr std::array<std::string_view, 52> kWords = {
            "as", "break", "const", "continue", "crate", "else", "enum", "extern", "false", "fn", "for", "if",
            "impl", "in", "let", "loop", "match", "mod", "move", "mut", "pub", "ref", "return", "self", "Self",
            "static", "struct", "super", "trait", "true", "type", "unsafe", "use", "where", "while", "async",
            "await", "dyn", "abstract", "become", "box", "do", "final", "macro", "override", "priv", "typeof",
            "unsized", "virtual", "yield", "try", "main",
        };
        return listed(kWords, name);
    }

  protected:
    std::string typeName(const Shape &s) const override
    {
        switch (s.base)
        {
            case Shape::Int:
                return "i64";
            case Shape::Float:
                return "f64";
            case Shape::Str:
                return "String";
            case Shape::Bool:
                return "bool";
            case Shape::Null:
                return "Option<()>";
            case Shape::Seq:
                return "Vec<" + typeName(*s.elem) + ">";
            case Shape::Map:
                return "std::collections::BTreeMap<String, " + typeName(*s.elem) + ">";
        }
        return "()";
    }

    std::string intLiteral(int64_t i) const override
    {
        if (i == std::numeric_limits<int64_t>::min())
            return "i64::MIN";
        return std::to_string(i) + "i64";
    }

    std::string floatLiteral(double d) const override
    {
        if (std::isnan(d))
            return "f64::NAN";
        if (std::isinf(d))
            return d < 0 ? "f64::NEG_INFINITY" : "f64::INFINITY";
        return vm::formatFloatRepr(d) + "_f64";
    }

    std::string strLiteral(const std::string &s) const override
    {
        return "String::from(" + quoteRust(s) + ")";
    }

    std::string seqLiteral(const std::vector<std::string> &items, const Shape &) const override
    {
        return "vec![" + joinItems(items) + "]";
    }

    std::string mapLiteral(const std::vector<std::pair<std::string, std::string>> &items, const Shape &s) const override
    {
        std::vector<std::string> pairs;
        for (const auto &[k, v] : items)
            pairs.push_back("(" + k + ", " + v + ")");
        return "vec![" + joinItems(pairs) + "].into_iter().collect::<" + typeName(s) + ">()";
    }

    std::string nullDeclaration(const std::string &name) const override
    {
        return "let mut " + name + ": Option<()> = None;";
    }

    std::string bind(const std::string &name, const std::string &type, const std::string &literal) const override
    {
        return "let mut " + name + ": " + type + " = " + literal + ";";
    }
};

//===----------------------------------------------------------------------===//
// Dynamic targets
//===----------------------------------------------------------------------===//

/// @brief Common driver for JavaScript and PHP.
class DynamicAdapter : public MarshalAdapter
{
  protected:
    virtual std::string intLiteral(int64_t i) const = 0;
    virtual std::string floatLiteral(double d) const = 0;
    virtual std::string strLiteral(const std::string &s) const = 0;
    virtual std::string nullLiteral() const = 0;
    virtual std::string seqLiteral(const std::vector<std::string> &items) const = 0;
    virtual std::string mapLiteral(const std::vector<std::pair<std::string, std::string>> &items) const = 0;

    std::string literal(const Value &v, const std::string &name, int depth) const
    {
        if (depth > kMaxNesting)
            throw MarshalError(name, "value is nested too deeply");
        switch (v.kind())
        {
            case Kind::None:
                return nullLiteral();
            case Kind::Bool:
                return v.asBool() ? "true" : "false";
            case Kind::Int:
                return intLiteral(v.asInt());
            case Kind::Float:
                return floatLiteral(v.asFloat());
            case Kind::Str:
                return strLiteral(v.asStr());
            case Kind::List:
            case Kind::Tuple:
            {
                std::vector<std::string> items;
                for (const auto &e : v.elements())
                    items.push_back(literal(e, name, depth + 1));
                return seqLiteral(items);
            }
            case Kind::Dict:
            {
                requireStringKeys(v.asDict(), name);
                std::vector<std::pair<std::string, std::string>> items;
                for (const auto &[k, e] : v.asDict().entries())
                    items.emplace_back(strLiteral(k.asStr()), literal(e, name, depth + 1));
                return mapLiteral(items);
            }
            default:
                throw MarshalError(name, std::string(v.typeName()) + " values cannot leave the native language");
        }
    }
};

class JsAdapter final : public DynamicAdapter
{
  public:
    LanguageTag language() const override
    {
        return LanguageTag::Js;
    }

    bool isReserved(std::string_view name) const override
    {
        static constexpr std::array<std::string_view, 53> kWords = {
            "break", "case", "catch", "class", "const", "continue", "debugger", "default", "delete", "do",
            "else", "export", "extends", "false", "finally", "for", "function", "if", "import", "in",
            "instanceof", "new", "null", "return", "super", "switch", "this", "throw", "true", "try", "typeof",
            "var", "void", "while", "with", "yield", "let", "static", "enum", "await", "implements", "package",
            "protected", "interface", "private", "public", "arguments", "eval", "undefined", "NaN", "Infinity",
            "console", "require",
        };
        return listed(kWords, name);
    }

  protected:
    std::string intLiteral(int64_t i) const override
    {
        return std::to_string(i);
    }

    std::string floatLiteral(double d) const override
    {
        return floatText(d, "Infinity", "NaN");
    }

    std::string strLiteral(const std::string &s) const override
    {
        return quoteJs(s);
    }

    std::string nullLiteral() const override
    {
        return "null";
    }

    std::string seqLiteral(const std::vector<std::string> &items) const override
    {
        return "[" + joinItems(items) + "]";
    }

    std::string mapLiteral(const std::vector<std::pair<std::string, std::string>> &items) const override
    {
        std::vector<std::string> pairs;
        for (const auto &[k, v] : items)
            pairs.push_back(k + ": " + v);
        return "{" + joinItems(pairs) + "}";
    }

    std::string declaration(const std::string &name, const Value &value) const override
    {
        return "let " + name + " = " + literal(value, name, 0) + ";";
    }
};

class PhpAdapter final : public DynamicAdapter
{
  public:
    LanguageTag language() const override
    {
        return LanguageTag::Php;
    }

    bool isReserved(std::string_view name) const override
    {
        static constexpr std::array<std::string_view, 13> kWords = {
            "this", "GLOBALS", "_SERVER", "_GET", "_POST", "_FILES", "_COOKIE", "_SESSION", "_REQUEST", "_ENV",
            "argv", "argc", "http_response_header",
        };
        return listed(kWords, name);
    }

  protected:
    std::string intLiteral(int64_t i) const override
    {
        if (i == std::numeric_limits<int64_t>::min())
            return "PHP_INT_MIN";
        return std::to_string(i);
    }

    std::string floatLiteral(double d) const override
    {
        return floatText(d, "INF", "NAN");
    }

    std::string strLiteral(const std::string &s) const override
    {
        return quotePhp(s);
    }

    std::string nullLiteral() const override
    {
        return "null";
    }

    std::string seqLiteral(const std::vector<std::string> &items) const override
    {
        return "[" + joinItems(items) + "]";
    }

    std::string mapLiteral(const std::vector<std::pair<std::string, std::string>> &items) const override
    {
        std::vector<std::string> pairs;
        for (const auto &[k, v] : items)
            pairs.push_back(k + " => " + v);
        return "[" + joinItems(pairs) + "]";
    }

    std::string declaration(const std::string &name, const Value &value) const override
    {
        return "$" + name + " = " + literal(value, name, 0) + ";";
    }
};

//===----------------------------------------------------------------------===//
// Identifier extraction
//===----------------------------------------------------------------------===//

bool isIdentStart(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

class IdentifierScanner
{
  public:
    IdentifierScanner(std::string_view code, LanguageTag language) : code_(code), lang_(language) {}

    std::vector<std::string> run()
    {
        scan(0, code_.size());
        return std::move(names_);
    }

  private:
    std::string_view code_;
    LanguageTag lang_;
    std::vector<std::string> names_;
    std::set<std::string> seen_;

    void add(std::string_view name)
    {
        std::string s(name);
        if (seen_.insert(s).second)
            names_.push_back(std::move(s));
    }

    /// Collect `{name}` / `{name:spec}` captures of a Rust format string.
    void rustCaptures(size_t begin, size_t end)
    {
        for (size_t i = begin; i < end; ++i)
        {
            if (code_[i] != '{')
                continue;
            if (i + 1 < end && code_[i + 1] == '{')
            {
                ++i;
                continue;
            }
            size_t j = i + 1;
            if (j < end && isIdentStart(code_[j]))
            {
                size_t k = j;
                while (k < end && isIdentChar(code_[k]))
                    ++k;
                if (k < end && (code_[k] == '}' || code_[k] == ':'))
                    add(code_.substr(j, k - j));
            }
        }
    }

    /// Skip a quoted literal starting at @p i; returns the index past it.
    size_t skipString(size_t i, size_t end)
    {
        const char q = code_[i];
        const size_t start = i + 1;
        size_t j = start;
        while (j < end)
        {
            const char c = code_[j];
            if (c == '\\')
            {
                j += 2;
                continue;
            }
            if (q == '`' && c == '$' && j + 1 < end && code_[j + 1] == '{')
            {
                // Template substitution: scan the embedded expression.
                size_t k = j + 2;
                int depth = 1;
                while (k < end && depth > 0)
                {
                    if (code_[k] == '{')
                        ++depth;
                    else if (code_[k] == '}')
                        --depth;
                    if (depth > 0)
                        ++k;
                }
                scan(j + 2, k);
                j = k + 1;
                continue;
            }
            if (q == '"' && lang_ == LanguageTag::Php && c == '$' && j + 1 < end && isIdentStart(code_[j + 1]))
            {
                size_t k = j + 1;
                while (k < end && isIdentChar(code_[k]))
                    ++k;
                add(code_.substr(j + 1, k - j - 1));
                j = k;
                continue;
            }
            if (c == q)
                break;
            ++j;
        }
        if (q == '"' && lang_ == LanguageTag::Rust)
            rustCaptures(start, std::min(j, end));
        return j + 1;
    }

    void scan(size_t begin, size_t end)
    {
        size_t i = begin;
        while (i < end)
        {
            const char c = code_[i];
            if (c == '/' && i + 1 < end && code_[i + 1] == '/')
            {
                while (i < end && code_[i] != '\n')
                    ++i;
                continue;
            }
            if (c == '/' && i + 1 < end && code_[i + 1] == '*')
            {
                const auto close = code_.find("*/", i + 2);
                i = close == std::string_view::npos || close >= end ? end : close + 2;
                continue;
            }
            if (c == '"' || c == '`' || (c == '\'' && lang_ != LanguageTag::Rust))
            {
                i = skipString(i, end);
                continue;
            }
            if (std::isdigit(static_cast<unsigned char>(c)))
            {
                while (i < end && (isIdentChar(code_[i]) || code_[i] == '.'))
                    ++i;
                continue;
            }
            if (isIdentStart(c))
            {
                size_t j = i;
                while (j < end && isIdentChar(code_[j]))
                    ++j;
                const bool member = (i > 0 && code_[i - 1] == '.') ||
                                    (i > 1 && code_[i - 1] == '>' && code_[i - 2] == '-') ||
                                    (i > 1 && code_[i - 1] == ':' && code_[i - 2] == ':');
                if (!member)
                    add(code_.substr(i, j - i));
                i = j;
                continue;
            }
            ++i;
        }
    }
};

} // namespace

std::unique_ptr<MarshalAdapter> makeMarshalAdapter(LanguageTag language)
{
    switch (language)
    {
        case LanguageTag::Cpp:
            return std::make_unique<CppAdapter>();
        case LanguageTag::Java:
            return std::make_unique<JavaAdapter>();
        case LanguageTag::Rust:
            return std::make_unique<RustAdapter>();
        case LanguageTag::Js:
            return std::make_unique<JsAdapter>();
        case LanguageTag::Php:
            return std::make_unique<PhpAdapter>();
        case LanguageTag::Py:
            break;
    }
    return nullptr;
}

std::vector<std::string> referencedIdentifiers(std::string_view code, LanguageTag language)
{
    return IdentifierScanner(code, language).run();
}

std::vector<std::string> marshalEnvironment(const MarshalAdapter &adapter,
                                            std::string_view code,
                                            const vm::Environment &environment)
{
    const auto referenced = referencedIdentifiers(code, adapter.language());
    const std::set<std::string> wanted(referenced.begin(), referenced.end());

    for (const auto &[name, fn] : environment.functions())
    {
        if (wanted.count(name))
            throw MarshalError(name, "native functions cannot be passed to " +
                                         std::string(frontends::lf::toString(adapter.language())));
    }

    std::vector<std::string> decls;
    for (const auto &[name, value] : environment.variables())
    {
        if (wanted.count(name))
            decls.push_back(adapter.declare(name, value));
    }
    return decls;
}

} // namespace fusion::exec
