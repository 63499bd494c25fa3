// ZKRANGE - Keccak-256 Hash Function
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Keccak-256 as used by Ethereum (original Keccak padding, not FIPS 202 SHA3).

#ifndef ZKRANGE_CRYPTO_KECCAK_H
#define ZKRANGE_CRYPTO_KECCAK_H

#include <cstdint>
#include <cstddef>
#include "zkrange/core/types.h"

namespace zkrange {
namespace crypto {

/// Keccak-256 hasher class
/// Provides incremental hashing with the same Write/Finalize shape as the other hashers
class Keccak256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Sponge rate in bytes (1600 - 2 * 256 bits)
    static constexpr size_t RATE = 136;

    /// Default constructor - initializes to empty state
    Keccak256();

    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    Keccak256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output. The hasher must be Reset before reuse.
    /// @param hash Pointer to output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    Keccak256& Reset();

private:
    /// Keccak-f[1600] state, 25 lanes
    uint64_t state_[25];

    /// Buffer for a partial block
    Byte buffer_[RATE];

    /// Bytes currently held in buffer_
    size_t buffered_;

    /// Absorb one full RATE-sized block into the state
    void AbsorbBlock(const Byte block[RATE]);
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute Keccak-256 of data in a single call
Hash256 Keccak256Hash(const Byte* data, size_t len);

/// Compute Keccak-256 of a vector
inline Hash256 Keccak256Hash(const std::vector<Byte>& data) {
    return Keccak256Hash(data.data(), data.size());
}

} // namespace crypto
} // namespace zkrange

#endif // ZKRANGE_CRYPTO_KECCAK_H
