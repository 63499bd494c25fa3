// ZKRANGE - Keccak-256 Implementation
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Keccak-f[1600] sponge with rate 136 bytes and 0x01 domain padding.
// Reference: https://keccak.team/keccak_specs_summary.html

#include "zkrange/crypto/keccak.h"
#include <cstring>

namespace zkrange {
namespace crypto {

// ============================================================================
// Keccak Constants
// ============================================================================

namespace {

constexpr int KECCAK_ROUNDS = 24;

/// Iota round constants
constexpr uint64_t RC[KECCAK_ROUNDS] = {
    0x0000000000000001ULL, 0x0000000000008082ULL,
    0x800000000000808aULL, 0x8000000080008000ULL,
    0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL,
    0x000000000000008aULL, 0x0000000000000088ULL,
    0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL,
    0x8000000000008089ULL, 0x8000000000008003ULL,
    0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL,
    0x8000000080008081ULL, 0x8000000000008080ULL,
    0x0000000080000001ULL, 0x8000000080008008ULL
};

/// Rho rotation offsets, in pi traversal order
constexpr int ROTC[24] = {
    1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
    27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44
};

/// Pi lane permutation
constexpr int PILN[24] = {
    10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1
};

inline uint64_t ROTL64(uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

/// Load a little-endian 64-bit lane
inline uint64_t ReadLE64(const Byte* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

/// Store a little-endian 64-bit lane
inline void WriteLE64(Byte* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<Byte>(v >> (8 * i));
    }
}

/// The Keccak-f[1600] permutation
void KeccakF(uint64_t st[25]) {
    uint64_t bc[5];

    for (int round = 0; round < KECCAK_ROUNDS; ++round) {
        // Theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            uint64_t t = bc[(i + 4) % 5] ^ ROTL64(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) {
                st[j + i] ^= t;
            }
        }

        // Rho and Pi
        uint64_t t = st[1];
        for (int i = 0; i < 24; ++i) {
            int j = PILN[i];
            bc[0] = st[j];
            st[j] = ROTL64(t, ROTC[i]);
            t = bc[0];
        }

        // Chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) {
                bc[i] = st[j + i];
            }
            for (int i = 0; i < 5; ++i) {
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // Iota
        st[0] ^= RC[round];
    }
}

} // anonymous namespace

// ============================================================================
// Keccak256 Implementation
// ============================================================================

Keccak256::Keccak256() {
    Reset();
}

Keccak256& Keccak256::Reset() {
    std::memset(state_, 0, sizeof(state_));
    std::memset(buffer_, 0, sizeof(buffer_));
    buffered_ = 0;
    return *this;
}

void Keccak256::AbsorbBlock(const Byte block[RATE]) {
    for (size_t i = 0; i < RATE / 8; ++i) {
        state_[i] ^= ReadLE64(block + 8 * i);
    }
    KeccakF(state_);
}

Keccak256& Keccak256::Write(const Byte* data, size_t len) {
    const Byte* end = data + len;

    // Fill a partially filled buffer first
    if (buffered_ > 0) {
        size_t take = std::min(RATE - buffered_, len);
        std::memcpy(buffer_ + buffered_, data, take);
        buffered_ += take;
        data += take;
        if (buffered_ < RATE) {
            return *this;
        }
        AbsorbBlock(buffer_);
        buffered_ = 0;
    }

    // Absorb full blocks directly from input
    while (static_cast<size_t>(end - data) >= RATE) {
        AbsorbBlock(data);
        data += RATE;
    }

    // Keep the tail
    if (end > data) {
        std::memcpy(buffer_, data, end - data);
        buffered_ = end - data;
    }

    return *this;
}

void Keccak256::Finalize(Byte hash[OUTPUT_SIZE]) {
    // Multi-rate padding: 0x01 ... 0x80 (both bits land in one byte when buffered_ == RATE - 1)
    std::memset(buffer_ + buffered_, 0, RATE - buffered_);
    buffer_[buffered_] ^= 0x01;
    buffer_[RATE - 1] ^= 0x80;
    AbsorbBlock(buffer_);
    buffered_ = 0;

    for (size_t i = 0; i < OUTPUT_SIZE / 8; ++i) {
        WriteLE64(hash + 8 * i, state_[i]);
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 Keccak256Hash(const Byte* data, size_t len) {
    Hash256 result;
    Keccak256().Write(data, len).Finalize(result.data());
    return result;
}

} // namespace crypto
} // namespace zkrange
