//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Printf.hpp
// Purpose: Placeholder resolution for printf calls in subprocess blocks.
//          Argument expressions are evaluated against the native environment
//          and the call is rewritten to print a single literal.
// Key invariants: Only calls at brace depth 0 whose first argument is one
//                 double-quoted literal followed by at least one argument
//                 are candidates. A call with an argument that is not a
//                 native expression is left untouched; an argument naming
//                 an unbound variable fails the block.
// Ownership/Lifetime: Stateless functions.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lf/LanguageTag.hpp"
#include "vm/Value.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fusion::exec
{

using frontends::lf::LanguageTag;

/// @brief Malformed format string or mismatched arguments.
class PrintfError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// @brief A candidate call located in guest code.
struct PrintfCall
{
    size_t begin = 0;              ///< Offset of the callee name.
    size_t end = 0;                ///< One past the closing parenthesis.
    std::string callee;            ///< e.g. "printf" or "System.out.printf".
    std::string format;            ///< Literal body with escapes intact.
    std::vector<std::string> args; ///< Trimmed argument texts after the format.
};

std::vector<PrintfCall> findPrintfCalls(std::string_view code, LanguageTag language);

/// @brief Decode C-style escapes of a double-quoted literal body.
std::string unescapeLiteral(std::string_view body);

/// @brief Expand @p format (already unescaped) with @p args.
/// @throws PrintfError on unsupported conversions or argument mismatch.
std::string formatPrintf(std::string_view format, const vm::ValueList &args, LanguageTag language);

/// @brief Double-quoted literal that makes the guest printf print @p text.
std::string quotePrintfLiteral(std::string_view text, LanguageTag language);

/// @brief Evaluate one argument; nullopt when the argument is not a native
///        expression.
/// @throws vm::NativeTrap when evaluation fails, including a NameError for
///         an unbound name.
using PrintfEvaluator = std::function<std::optional<vm::Value>(const std::string &expression)>;

struct PrintfRewrite
{
    std::string code;
    /// @brief Formatted text when the block is exactly one rewritten call.
    std::optional<std::string> inlineText;
    size_t rewritten = 0;
};

PrintfRewrite rewritePrintf(std::string_view code, LanguageTag language, const PrintfEvaluator &evaluate);

} // namespace fusion::exec
