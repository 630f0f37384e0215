//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Operators.hpp
// Purpose: Arithmetic, ordering, membership, indexing and iteration over
//          native values.
// Key invariants: Integer arithmetic is checked; results outside 64 bits
//                 raise OverflowError instead of wrapping.
// Ownership/Lifetime: Stateless free functions.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/py/AST_Expr.hpp"
#include "vm/Value.hpp"

#include <optional>

namespace fusion::vm
{

using frontends::py::BinaryOp;

/// @brief Apply a binary arithmetic operator with guest semantics.
Value binaryOp(BinaryOp op, const Value &lhs, const Value &rhs);

/// @brief Guest `<`; raises TypeError for unordered kinds.
bool lessThan(const Value &lhs, const Value &rhs);

/// @brief Guest `item in container`.
bool contains(const Value &container, const Value &item);

/// @brief Guest `is`.
bool identical(const Value &lhs, const Value &rhs);

/// @brief Guest `len(v)`.
int64_t lengthOf(const Value &v);

/// @brief Materialise the elements produced by iterating @p v.
ValueList iterate(const Value &v);

Value getItem(const Value &container, const Value &index);
void setItem(const Value &container, const Value &index, Value value);
void delItem(const Value &container, const Value &index);

/// @brief Bounds of a `lo:hi:step` slice; absent parts are nullopt.
struct SliceBounds
{
    std::optional<int64_t> lower;
    std::optional<int64_t> upper;
    std::optional<int64_t> step;
};

/// @brief Indices selected by @p bounds over a sequence of length @p size.
std::vector<int64_t> sliceIndices(const SliceBounds &bounds, int64_t size);

Value getSlice(const Value &seq, const SliceBounds &bounds);
void setSlice(const Value &seq, const SliceBounds &bounds, const Value &items);
void delSlice(const Value &seq, const SliceBounds &bounds);

/// @brief Name of @p op as written in source, used in error messages.
std::string_view binaryOpSpelling(BinaryOp op) noexcept;

} // namespace fusion::vm
