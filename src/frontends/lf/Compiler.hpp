//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/Compiler.hpp
// Purpose: IR builder: runs tokenizer, directive processor and block
//          assembler over a fusion source and produces a Program.
// Key invariants:
//   - source_hash depends only on the normalised source text.
//   - A failed compile leaves `program` empty and at least one error in
//     `diagnostics`.
// Ownership/Lifetime: CompilerResult owns the program and diagnostics.
// Links: docs/lf-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lf/Program.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace fusion::frontends::lf
{

struct CompilerInput
{
    /// @brief Fusion source text.
    std::string_view source;

    /// @brief Path used for diagnostics; defaults to "<input>".
    std::string_view path{"<input>"};

    /// @brief Existing file id within the supplied source manager, if any.
    std::optional<uint32_t> fileId{};
};

struct CompilerResult
{
    support::DiagnosticEngine diagnostics{};

    uint32_t fileId{0};

    std::optional<Program> program{};

    [[nodiscard]] bool succeeded() const;
};

/// @brief Canonical form hashed into source_hash.
/// @details Line endings become '\n', trailing blanks are stripped from each
///          line and trailing empty lines are dropped.
std::string normalizeSource(std::string_view source);

/// @brief Lowercase hex SHA-256 of normalizeSource(@p source).
std::string computeSourceHash(std::string_view source);

/// @brief Build the Program for @p input.
CompilerResult compile(const CompilerInput &input, support::SourceManager &sm);

/// @brief Read @p path from disk and compile it.
CompilerResult compileFile(const std::string &path, support::SourceManager &sm);

} // namespace fusion::frontends::lf
