//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Expected-style result carrying either a value or one diagnostic,
//          plus helpers for building and printing diagnostics.
// Key invariants: Exactly one of value/error is engaged.
// Ownership/Lifetime: Owns the contained value or diagnostic.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace fusion::support
{
using Diag = Diagnostic;

/// @brief Value-or-diagnostic result used by fallible phases.
/// @tparam T Stored value type when the operation succeeds.
template <class T> class Expected
{
  public:
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding @p diag.
    Expected(Diag diag) : error_(std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the failure diagnostic; requires !hasValue().
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

/// @brief Expected specialization for operations without a payload.
template <> class Expected<void>
{
  public:
    Expected() = default;

    Expected(Diag diag) : error_(std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return !error_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<Diag> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to a lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic with location and message.
Diag makeError(SourceLoc loc, std::string msg);

/// @brief Create an error diagnostic tagged with category @p code.
Diag makeError(std::string code, SourceLoc loc, std::string msg);

/// @brief Create a warning diagnostic tagged with category @p code.
Diag makeWarning(std::string code, SourceLoc loc, std::string msg);

/// @brief Print a single diagnostic to @p os.
/// @details Format: `<path>:<line>: <severity>[<code>]: <message>`; the path
///          prefix is replaced by `line <n>:` when no file is attached.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm = nullptr);

} // namespace fusion::support
