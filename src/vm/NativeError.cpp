//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/NativeError.cpp
// Purpose: Name lookup and formatting for native guest errors.
// Key invariants: None.
// Ownership/Lifetime: Stateless.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "vm/NativeError.hpp"

namespace fusion::vm
{

std::optional<NativeErrorKind> parseNativeErrorKind(std::string_view name)
{
    for (NativeErrorKind k : kCatchableErrorKinds)
    {
        if (toString(k) == name)
            return k;
    }
    return std::nullopt;
}

std::string formatNativeError(const NativeError &error)
{
    std::string out(toString(error.kind));
    if (!error.message.empty())
    {
        out += ": ";
        out += error.message;
    }
    return out;
}

NativeTrap::NativeTrap(NativeError error)
    : std::runtime_error(formatNativeError(error)), error_(std::move(error))
{
}

void throwNative(NativeErrorKind kind, std::string message)
{
    throw NativeTrap(NativeError{kind, std::move(message), 0});
}

} // namespace fusion::vm
