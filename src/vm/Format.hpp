//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Format.hpp
// Purpose: Text conversions of native values: str/repr, format specs,
//          printf-style `%` formatting and str.format.
// Key invariants: Float repr is the shortest text that round-trips and
//                 always carries a '.', 'e', "inf" or "nan".
// Ownership/Lifetime: Stateless free functions.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Value.hpp"

#include <string>
#include <string_view>

namespace fusion::vm
{

/// @brief Shortest round-tripping repr of @p d (`0.1`, `1e+16`, `2.0`).
std::string formatFloatRepr(double d);

/// @brief Guest `str(v)`.
std::string toStr(const Value &v);

/// @brief Guest `repr(v)`.
std::string toRepr(const Value &v);

/// @brief Apply a format-spec mini-language string to @p v.
/// @details Grammar: `[[fill]align][sign][#][0][width][,|_][.precision][type]`.
///          Throws ValueError/TypeError traps on malformed or mismatched specs.
std::string formatWithSpec(const Value &v, std::string_view spec);

/// @brief printf-style formatting of @p fmt with positional @p args.
/// @details Supports `%s %r %d %i %u %f %F %e %E %g %G %x %X %o %c %%` with
///          flags `-+ #0`, width and precision. Mismatched argument counts
///          raise TypeError.
std::string percentFormat(std::string_view fmt, const ValueList &args);

/// @brief Guest `fmt % rhs`: a tuple spreads, a dict enables `%(key)s`,
///        anything else is a single argument.
std::string percentFormat(std::string_view fmt, const Value &rhs);

/// @brief Guest `fmt.format(*args, **kwargs)`.
std::string strFormat(std::string_view fmt, const ValueList &args, const KeywordArgs &kwargs);

} // namespace fusion::vm
