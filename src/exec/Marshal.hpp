//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Marshal.hpp
// Purpose: Convert native environment values into variable declarations of
//          the subprocess languages.
// Key invariants: Only data values cross the boundary. A value with no
//                 faithful literal in the target language raises
//                 MarshalError; nothing is silently stringified.
// Ownership/Lifetime: Adapters are stateless.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lf/LanguageTag.hpp"
#include "vm/Environment.hpp"
#include "vm/Value.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fusion::exec
{

using frontends::lf::LanguageTag;

/// @brief A value or name that cannot be expressed in the target language.
class MarshalError : public std::runtime_error
{
  public:
    MarshalError(std::string name, const std::string &message);

    /// @brief Environment name whose value failed to marshal.
    const std::string &name() const noexcept
    {
        return name_;
    }

  private:
    std::string name_;
};

/// @brief Per-language rendering of native values as declarations.
class MarshalAdapter
{
  public:
    virtual ~MarshalAdapter() = default;

    virtual LanguageTag language() const = 0;

    /// @brief Statement(s) declaring @p name with @p value.
    /// @throws MarshalError for reserved names or unmappable values.
    std::string declare(const std::string &name, const vm::Value &value) const;

    /// @brief Whether @p name is a keyword or otherwise unusable in the target.
    virtual bool isReserved(std::string_view name) const = 0;

  protected:
    virtual std::string declaration(const std::string &name, const vm::Value &value) const = 0;
};

std::unique_ptr<MarshalAdapter> makeMarshalAdapter(LanguageTag language);

/// @brief Identifiers @p code refers to, in first-use order.
/// @details String literals and comments are skipped, except for the
///          interpolation forms of the language (`${x}` in JS templates,
///          `$x` in PHP strings, `{x}` in Rust format strings).
std::vector<std::string> referencedIdentifiers(std::string_view code, LanguageTag language);

/// @brief Declarations for every environment variable @p code refers to.
/// @throws MarshalError when a referenced name is a native function or a
///         value that cannot be expressed in the target language.
std::vector<std::string> marshalEnvironment(const MarshalAdapter &adapter,
                                            std::string_view code,
                                            const vm::Environment &environment);

} // namespace fusion::exec
