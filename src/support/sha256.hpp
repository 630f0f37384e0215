//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/sha256.hpp
// Purpose: SHA-256 digest used for source hashes and artifact integrity.
// Key invariants: Hex digests are 64 lowercase hexadecimal characters.
// Ownership/Lifetime: Sha256 instances own their running state.
// Links: FIPS 180-4
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace fusion::support
{

/// @brief Incremental SHA-256 hasher.
class Sha256
{
  public:
    using Digest = std::array<uint8_t, 32>;

    Sha256();

    /// @brief Absorb @p data into the running digest.
    void update(std::string_view data);

    /// @brief Finish hashing and return the raw digest.
    /// @note The hasher must not be updated afterwards.
    Digest finish();

    /// @brief Finish hashing and return the lowercase hex digest.
    std::string finishHex();

  private:
    void compress(const uint8_t *block);

    std::array<uint32_t, 8> state_;
    std::array<uint8_t, 64> buffer_{};
    size_t buffered_ = 0;
    uint64_t totalBytes_ = 0;
};

/// @brief One-shot lowercase hex SHA-256 of @p data.
std::string sha256Hex(std::string_view data);

} // namespace fusion::support
