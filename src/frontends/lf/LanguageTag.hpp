//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/LanguageTag.hpp
// Purpose: The fixed set of guest-language tags recognised in fusion sources.
// Key invariants: Tag spellings are lowercase and unique; exactly one tag
//                 (Py) names the native in-process language.
// Ownership/Lifetime: Value types only.
// Links: docs/lf-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace fusion::frontends::lf
{

/// @brief Guest languages a code block may be written in.
enum class LanguageTag
{
    Py,   ///< Native language, executed in-process.
    Cpp,  ///< C++ via g++.
    Js,   ///< JavaScript via node.
    Java, ///< Java via javac/java.
    Php,  ///< PHP via php.
    Rust, ///< Rust via rustc.
};

/// @brief How a guest language delimits nested blocks.
enum class BlockSyntax
{
    Indentation, ///< Trailing colon plus indentation.
    Braces,      ///< Curly braces.
};

inline constexpr std::array<LanguageTag, 6> kAllLanguageTags = {
    LanguageTag::Py, LanguageTag::Cpp, LanguageTag::Js,
    LanguageTag::Java, LanguageTag::Php, LanguageTag::Rust};

/// @brief Source spelling of @p tag (e.g. "py").
constexpr std::string_view toString(LanguageTag tag)
{
    switch (tag)
    {
        case LanguageTag::Py:
            return "py";
        case LanguageTag::Cpp:
            return "cpp";
        case LanguageTag::Js:
            return "js";
        case LanguageTag::Java:
            return "java";
        case LanguageTag::Php:
            return "php";
        case LanguageTag::Rust:
            return "rust";
    }
    return "?";
}

/// @brief Map a source spelling back to its tag.
std::optional<LanguageTag> parseLanguageTag(std::string_view text);

constexpr bool isNative(LanguageTag tag)
{
    return tag == LanguageTag::Py;
}

constexpr BlockSyntax blockSyntaxOf(LanguageTag tag)
{
    return tag == LanguageTag::Py ? BlockSyntax::Indentation : BlockSyntax::Braces;
}

} // namespace fusion::frontends::lf
