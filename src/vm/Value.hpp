//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Value.hpp
// Purpose: Dynamically typed values of the native language.
// Key invariants: Lists, dicts, functions and modules have reference
//                 semantics (shared storage); scalars and tuples are values.
//                 Dict iteration order is insertion order.
// Ownership/Lifetime: Reference kinds are shared through std::shared_ptr;
//                     a Value keeps its referent alive.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/NativeError.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace fusion::frontends::py
{
struct FunctionDefStmt;
struct LambdaExpr;
} // namespace fusion::frontends::py

namespace fusion::vm
{

class Value;
class DictObject;
class Interpreter;
struct FunctionObject;
struct ModuleObject;
struct Frame;

using ValueList = std::vector<Value>;
using KeywordArgs = std::vector<std::pair<std::string, Value>>;

/// @brief Error object bound by `except T as e`.
struct ExceptionObject
{
    NativeErrorKind kind = NativeErrorKind::Exception;
    std::string message;
};

class Value
{
  public:
    enum class Kind
    {
        None,
        Bool,
        Int,
        Float,
        Str,
        List,
        Tuple,
        Dict,
        Function,
        Module,
        Exception,
    };

    Value() = default;

    static Value none()
    {
        return Value();
    }

    static Value boolean(bool b);
    static Value integer(int64_t i);
    static Value real(double d);
    static Value string(std::string s);
    static Value list(ValueList items = {});
    static Value tuple(ValueList items = {});
    static Value dict();
    static Value dict(std::shared_ptr<DictObject> d);
    static Value function(std::shared_ptr<FunctionObject> f);
    static Value module(std::shared_ptr<ModuleObject> m);
    static Value exception(NativeErrorKind kind, std::string message);

    Kind kind() const noexcept
    {
        return kind_;
    }

    bool isNone() const noexcept
    {
        return kind_ == Kind::None;
    }

    /// @brief Int or Bool (bool participates in arithmetic as 0/1).
    bool isIntegral() const noexcept
    {
        return kind_ == Kind::Int || kind_ == Kind::Bool;
    }

    /// @brief Int, Bool or Float.
    bool isNumber() const noexcept
    {
        return isIntegral() || kind_ == Kind::Float;
    }

    bool asBool() const;
    int64_t asInt() const;
    double asFloat() const;
    const std::string &asStr() const;
    ValueList &asList() const;
    const ValueList &asTuple() const;
    DictObject &asDict() const;
    FunctionObject &asFunction() const;
    ModuleObject &asModule() const;
    const ExceptionObject &asException() const;

    /// @brief Elements of a List or Tuple.
    const ValueList &elements() const;

    /// @brief Shared storage of a reference kind, null for scalars.
    const void *identity() const noexcept;

    /// @brief Guest truthiness.
    bool truthy() const;

    /// @brief Guest type name as reported in error messages.
    std::string_view typeName() const noexcept;

    /// @brief Recursive copy that shares no mutable storage with *this.
    Value deepCopy() const;

    /// @brief Guest `==`; numbers compare across Int/Float/Bool.
    friend bool operator==(const Value &a, const Value &b);

    friend bool operator!=(const Value &a, const Value &b)
    {
        return !(a == b);
    }

  private:
    using Storage = std::variant<std::monostate,
                                 bool,
                                 int64_t,
                                 double,
                                 std::string,
                                 std::shared_ptr<ValueList>,
                                 std::shared_ptr<DictObject>,
                                 std::shared_ptr<FunctionObject>,
                                 std::shared_ptr<ModuleObject>,
                                 std::shared_ptr<ExceptionObject>>;

    Value(Kind kind, Storage data) : kind_(kind), data_(std::move(data)) {}

    Kind kind_ = Kind::None;
    Storage data_;
};

/// @brief Canonical key text used to index dict entries; throws TypeError
///        for unhashable values.
std::string hashKey(const Value &key);

/// @brief Insertion-ordered mapping.
class DictObject
{
  public:
    const std::vector<std::pair<Value, Value>> &entries() const noexcept
    {
        return entries_;
    }

    size_t size() const noexcept
    {
        return entries_.size();
    }

    const Value *find(const Value &key) const;
    Value *find(const Value &key);

    /// @brief Insert or replace; replacement keeps the original position.
    void set(const Value &key, Value value);

    bool erase(const Value &key);
    void clear();

  private:
    std::vector<std::pair<Value, Value>> entries_;
    std::unordered_map<std::string, size_t> index_;
};

/// @brief Native implementation of a builtin callable.
using BuiltinFn =
    std::function<Value(Interpreter &, ValueList &args, KeywordArgs &kwargs)>;

/// @brief User-defined function, lambda or builtin.
struct FunctionObject
{
    std::string name;

    const frontends::py::FunctionDefStmt *def = nullptr;
    const frontends::py::LambdaExpr *lambda = nullptr;
    std::shared_ptr<const void> keepAlive; ///< Owner of the AST behind def/lambda.
    std::vector<Value> defaults;           ///< Aligned with the trailing parameters.
    std::shared_ptr<Frame> closure;        ///< Enclosing function frame, if any.

    BuiltinFn builtin;
    Value self; ///< Receiver of a bound method, None otherwise.
    std::optional<NativeErrorKind> exceptionType;

    bool isBuiltin() const noexcept
    {
        return static_cast<bool>(builtin);
    }
};

/// @brief Imported sandbox module.
struct ModuleObject
{
    std::string name;
    std::unordered_map<std::string, Value> attrs;
};

} // namespace fusion::vm
