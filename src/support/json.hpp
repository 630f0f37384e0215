//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/json.hpp
// Purpose: Minimal JSON document model with a parser and pretty printer,
//          used by the compiled-artifact codec.
// Key invariants:
//   - Objects preserve member insertion order; set() replaces in place.
//   - Integers without fraction or exponent parse as Int, others as Float.
//   - Output of write() parses back to an equal document.
// Ownership/Lifetime: Values own their children.
// Links: RFC 8259
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fusion::support::json
{

/// @brief JSON document node.
class Value
{
  public:
    enum class Kind
    {
        Null,
        Bool,
        Int,
        Float,
        String,
        Array,
        Object
    };

    using Array = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using Object = std::vector<Member>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : kind_(Kind::Bool), bool_(b) {}
    Value(int i) : kind_(Kind::Int), int_(i) {}
    Value(int64_t i) : kind_(Kind::Int), int_(i) {}
    Value(uint64_t i) : kind_(Kind::Int), int_(static_cast<int64_t>(i)) {}
    Value(double d) : kind_(Kind::Float), float_(d) {}
    Value(std::string s) : kind_(Kind::String), string_(std::move(s)) {}
    Value(const char *s) : kind_(Kind::String), string_(s) {}
    Value(Array a) : kind_(Kind::Array), array_(std::move(a)) {}
    Value(Object o) : kind_(Kind::Object), object_(std::move(o)) {}

    /// @brief Empty object node.
    static Value object()
    {
        return Value(Object{});
    }

    /// @brief Empty array node.
    static Value array()
    {
        return Value(Array{});
    }

    Kind kind() const
    {
        return kind_;
    }

    bool isNull() const
    {
        return kind_ == Kind::Null;
    }

    bool isBool() const
    {
        return kind_ == Kind::Bool;
    }

    bool isInt() const
    {
        return kind_ == Kind::Int;
    }

    /// @brief True for Int and Float nodes.
    bool isNumber() const
    {
        return kind_ == Kind::Int || kind_ == Kind::Float;
    }

    bool isString() const
    {
        return kind_ == Kind::String;
    }

    bool isArray() const
    {
        return kind_ == Kind::Array;
    }

    bool isObject() const
    {
        return kind_ == Kind::Object;
    }

    bool asBool() const
    {
        return bool_;
    }

    int64_t asInt() const
    {
        return kind_ == Kind::Float ? static_cast<int64_t>(float_) : int_;
    }

    double asFloat() const
    {
        return kind_ == Kind::Int ? static_cast<double>(int_) : float_;
    }

    const std::string &asString() const
    {
        return string_;
    }

    const Array &asArray() const
    {
        return array_;
    }

    Array &asArray()
    {
        return array_;
    }

    const Object &asObject() const
    {
        return object_;
    }

    /// @brief Member named @p key, or nullptr when absent or not an object.
    const Value *find(std::string_view key) const;

    /// @brief Insert or replace member @p key; converts Null nodes to objects.
    Value &set(std::string key, Value v);

    /// @brief Append @p v; converts Null nodes to arrays.
    void push(Value v);

    bool operator==(const Value &other) const;

    bool operator!=(const Value &other) const
    {
        return !(*this == other);
    }

  private:
    Kind kind_ = Kind::Null;
    bool bool_ = false;
    int64_t int_ = 0;
    double float_ = 0.0;
    std::string string_;
    Array array_;
    Object object_;
};

/// @brief Serialize @p v as indented JSON text terminated by a newline.
/// @param indent Spaces per nesting level; 0 selects compact output.
std::string write(const Value &v, int indent = 2);

/// @brief Parse @p text as a single JSON document.
/// @return Parsed document or an error diagnostic naming the line.
Expected<Value> parse(std::string_view text);

} // namespace fusion::support::json
