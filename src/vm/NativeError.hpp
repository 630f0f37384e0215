//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/NativeError.hpp
// Purpose: Typed guest errors raised by the native interpreter.
// Key invariants: Enum values map one-to-one onto guest exception names.
// Ownership/Lifetime: Value types; traps are thrown by value.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fusion::vm
{

/// @brief Categorises guest errors raised while running native code.
enum class NativeErrorKind : int32_t
{
    Exception = 0,         ///< Base kind; matched by `except Exception`.
    NameError = 1,         ///< Unbound name.
    TypeError = 2,         ///< Operation applied to the wrong type.
    ValueError = 3,        ///< Right type, unacceptable value.
    ZeroDivisionError = 4, ///< Division or modulo by zero.
    IndexError = 5,        ///< Sequence index out of range.
    KeyError = 6,          ///< Missing mapping key.
    AttributeError = 7,    ///< Unknown attribute or method.
    ImportError = 8,       ///< Module outside the sandbox.
    RuntimeError = 9,      ///< Catch-all guest failure.
    OverflowError = 10,    ///< Integer result outside 64 bits.
    SyntaxError = 11,      ///< Malformed native code.
    RecursionError = 12,   ///< Call depth limit exceeded.
    Timeout = 13,          ///< Deadline or step budget exhausted; not catchable.
    Cancelled = 14,        ///< Run cancelled; not catchable.
};

/// @brief Convert a kind to its guest-visible name.
constexpr std::string_view toString(NativeErrorKind kind) noexcept
{
    switch (kind)
    {
        case NativeErrorKind::Exception:
            return "Exception";
        case NativeErrorKind::NameError:
            return "NameError";
        case NativeErrorKind::TypeError:
            return "TypeError";
        case NativeErrorKind::ValueError:
            return "ValueError";
        case NativeErrorKind::ZeroDivisionError:
            return "ZeroDivisionError";
        case NativeErrorKind::IndexError:
            return "IndexError";
        case NativeErrorKind::KeyError:
            return "KeyError";
        case NativeErrorKind::AttributeError:
            return "AttributeError";
        case NativeErrorKind::ImportError:
            return "ImportError";
        case NativeErrorKind::RuntimeError:
            return "RuntimeError";
        case NativeErrorKind::OverflowError:
            return "OverflowError";
        case NativeErrorKind::SyntaxError:
            return "SyntaxError";
        case NativeErrorKind::RecursionError:
            return "RecursionError";
        case NativeErrorKind::Timeout:
            return "Timeout";
        case NativeErrorKind::Cancelled:
            return "Cancelled";
    }
    return "Exception";
}

/// @brief Kinds a guest `except` clause may name.
inline constexpr NativeErrorKind kCatchableErrorKinds[] = {
    NativeErrorKind::Exception,      NativeErrorKind::NameError,     NativeErrorKind::TypeError,
    NativeErrorKind::ValueError,     NativeErrorKind::ZeroDivisionError,
    NativeErrorKind::IndexError,     NativeErrorKind::KeyError,      NativeErrorKind::AttributeError,
    NativeErrorKind::ImportError,    NativeErrorKind::RuntimeError,  NativeErrorKind::OverflowError,
    NativeErrorKind::RecursionError,
};

/// @brief Look up a guest exception name; only catchable kinds resolve.
std::optional<NativeErrorKind> parseNativeErrorKind(std::string_view name);

/// @brief Whether guest code may intercept errors of @p kind.
constexpr bool isCatchable(NativeErrorKind kind) noexcept
{
    return kind != NativeErrorKind::Timeout && kind != NativeErrorKind::Cancelled &&
           kind != NativeErrorKind::SyntaxError;
}

/// @brief Structured record of a guest error.
struct NativeError
{
    NativeErrorKind kind = NativeErrorKind::RuntimeError;
    std::string message;
    uint32_t line = 0; ///< Physical fusion-source line, 0 when unknown.
};

/// @brief Format as `Kind: message`.
std::string formatNativeError(const NativeError &error);

/// @brief Exception carrying a NativeError out of the interpreter.
class NativeTrap : public std::runtime_error
{
  public:
    explicit NativeTrap(NativeError error);

    const NativeError &error() const noexcept
    {
        return error_;
    }

    /// @brief Attach @p line when the trap was raised without one.
    void setLineIfUnknown(uint32_t line) noexcept
    {
        if (error_.line == 0)
            error_.line = line;
    }

  private:
    NativeError error_;
};

/// @brief Throw a NativeTrap without location; the interpreter fills it in.
[[noreturn]] void throwNative(NativeErrorKind kind, std::string message);

} // namespace fusion::vm
