//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/Artifact.hpp
// Purpose: Encode and decode the persisted compiled artifact (".lsf").
//
// Layout (JSON):
//   format_version  "LSF-3.0"
//   metadata        compiler_id, source_file, source_path, compile_time,
//                   security_level, optimization_level
//   program         directives[{line,name,value}],
//                   code_blocks[{line,type,content,fragments}],
//                   source_hash, block_digest, parse_time,
//                   stats{total_lines,directive_count,code_block_count}
//
// Key invariants:
//   - decodeArtifact(encodeArtifact(a)).program == a.program.
//   - A block_digest that does not match the decoded blocks, or a missing
//     or malformed source_hash, is an IntegrityError.
// Ownership/Lifetime: Value types.
// Links: docs/lf-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lf/Program.hpp"
#include "support/diag_expected.hpp"
#include "support/json.hpp"

#include <string>
#include <string_view>

namespace fusion::frontends::lf
{

inline constexpr std::string_view kArtifactFormatVersion = "LSF-3.0";
inline constexpr std::string_view kCompilerId = "fusion-lfc-1.0";

struct ArtifactMetadata
{
    std::string compilerId{kCompilerId};
    std::string sourceFile;
    std::string sourcePath;
    std::string compileTime;
    std::string securityLevel{"medium"};
    int optimizationLevel = 2;
};

struct Artifact
{
    std::string formatVersion{kArtifactFormatVersion};
    ArtifactMetadata metadata;
    Program program;
};

/// @brief Current UTC time as an ISO-8601 string.
std::string currentTimestamp();

support::json::Value artifactToJson(const Artifact &artifact);

/// @brief Serialize @p artifact to its persisted text form.
std::string encodeArtifact(const Artifact &artifact);

/// @brief Parse and validate a persisted artifact.
support::Expected<Artifact> decodeArtifact(std::string_view text);

/// @brief Check that @p source still hashes to the artifact's source_hash.
/// @details Accepts both full digests and the 16-character prefix written by
///          older compilers.
support::Expected<void> verifySourceHash(const Artifact &artifact, std::string_view source);

} // namespace fusion::frontends::lf
