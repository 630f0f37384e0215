//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Builtins.hpp
// Purpose: Builtin functions, container methods and sandbox modules of the
//          native language.
// Key invariants: The builtin table is immutable after first use and may be
//                 shared by concurrent runs.
// Ownership/Lifetime: Builtin values live for the whole process; module
//                     instances are owned by the environment importing them.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Value.hpp"

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fusion::vm
{

class Interpreter;

/// @brief Builtins visible from every scope, including exception types.
const std::unordered_map<std::string, Value> &builtinTable();

/// @brief Whether @p self (a str, list or dict) has a method @p name.
bool hasMethod(const Value &self, std::string_view name);

/// @brief Whether method @p name modifies its list or dict receiver.
bool isMutatingMethod(std::string_view name);

/// @brief Invoke method @p name on a str, list or dict receiver.
Value callMethod(Interpreter &interp,
                 const Value &self,
                 const std::string &name,
                 ValueList &args,
                 KeywordArgs &kwargs);

/// @brief Names of the modules `import` may load.
const std::vector<std::string> &sandboxModuleNames();

/// @brief Create a fresh instance of a sandbox module, null when @p name is
///        outside the sandbox.
std::shared_ptr<ModuleObject> makeSandboxModule(const std::string &name);

namespace detail
{

/// @brief Bind positional and keyword arguments of a builtin to @p names.
/// @param required Count of leading parameters that must be supplied.
/// @return One slot per name; unsupplied optional parameters are nullopt.
std::vector<std::optional<Value>> bindArgs(std::string_view function,
                                           ValueList &args,
                                           KeywordArgs &kwargs,
                                           std::initializer_list<std::string_view> names,
                                           size_t required);

/// @brief Integer argument, TypeError otherwise.
int64_t intArg(std::string_view function, const Value &v);

/// @brief Numeric argument as double, TypeError otherwise.
double floatArg(std::string_view function, const Value &v);

/// @brief String argument, TypeError otherwise.
const std::string &strArg(std::string_view function, const Value &v);

/// @brief Make a builtin function value.
Value makeBuiltin(std::string name, BuiltinFn fn);

/// @brief Stable sort honouring guest `key=` and `reverse=` arguments.
void sortValues(Interpreter &interp, ValueList &items, const Value &key, bool reverse);

} // namespace detail

} // namespace fusion::vm
