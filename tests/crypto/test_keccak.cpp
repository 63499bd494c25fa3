// ZKRANGE - Keccak-256 Tests
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Known-answer tests for the original (pre-NIST) Keccak-256 padding, plus
// incremental hashing across the sponge block boundary.

#include <gtest/gtest.h>
#include "zkrange/crypto/keccak.h"
#include "zkrange/core/hex.h"

#include <algorithm>
#include <array>
#include <string>
#include <vector>

namespace zkrange {
namespace test {

namespace {

std::string KeccakHex(const std::string& input) {
    return crypto::Keccak256Hash(reinterpret_cast<const Byte*>(input.data()),
                                 input.size()).ToHex();
}

std::vector<Byte> PatternBytes(size_t len) {
    std::vector<Byte> data(len);
    for (size_t i = 0; i < len; ++i) {
        data[i] = static_cast<Byte>(i * 7 + 3);
    }
    return data;
}

} // namespace

// ============================================================================
// Known Answers
// ============================================================================

TEST(Keccak256Test, OutputSizeIs32Bytes) {
    EXPECT_EQ(crypto::Keccak256::OUTPUT_SIZE, 32u);
    EXPECT_EQ(crypto::Keccak256::RATE, 136u);
}

TEST(Keccak256Test, EmptyInput) {
    EXPECT_EQ(KeccakHex(""),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(Keccak256Test, Abc) {
    EXPECT_EQ(KeccakHex("abc"),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(Keccak256Test, QuickBrownFox) {
    EXPECT_EQ(KeccakHex("The quick brown fox jumps over the lazy dog"),
              "4d741b6f1eb29cb2a9b9911c82f56fa8d73b04959d3d9d222895df6c0b28aa15");
}

TEST(Keccak256Test, ZeroWord) {
    std::vector<Byte> zero(32, 0);
    EXPECT_EQ(crypto::Keccak256Hash(zero).ToHex(),
              "290decd9548b62a8d60345a988386fc84ba6bc95484008f6362f93160ef3e563");
}

TEST(Keccak256Test, DiffersFromSha3) {
    // SHA3-256("") uses the 0x06 domain byte and hashes differently
    EXPECT_NE(KeccakHex(""),
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

// ============================================================================
// Incremental Hashing
// ============================================================================

TEST(Keccak256Test, IncrementalMatchesOneShot) {
    for (size_t len : {0u, 1u, 135u, 136u, 137u, 271u, 272u, 273u, 1000u}) {
        std::vector<Byte> data = PatternBytes(len);
        Hash256 expected = crypto::Keccak256Hash(data);

        for (size_t chunk : {1u, 7u, 32u, 136u, 200u}) {
            crypto::Keccak256 hasher;
            for (size_t pos = 0; pos < len; pos += chunk) {
                size_t n = std::min(chunk, len - pos);
                hasher.Write(data.data() + pos, n);
            }
            std::array<Byte, crypto::Keccak256::OUTPUT_SIZE> digest;
            hasher.Finalize(digest.data());

            EXPECT_EQ(Hash256(digest), expected) << "len=" << len << " chunk=" << chunk;
        }
    }
}

TEST(Keccak256Test, BlockBoundaryLengthsDiffer) {
    Hash256 a = crypto::Keccak256Hash(PatternBytes(135));
    Hash256 b = crypto::Keccak256Hash(PatternBytes(136));
    Hash256 c = crypto::Keccak256Hash(PatternBytes(137));
    EXPECT_NE(a, b);
    EXPECT_NE(b, c);
    EXPECT_NE(a, c);
}

TEST(Keccak256Test, ResetRestoresInitialState) {
    crypto::Keccak256 hasher;
    const std::string junk = "junk";
    hasher.Write(reinterpret_cast<const Byte*>(junk.data()), junk.size());

    std::array<Byte, 32> digest;
    hasher.Finalize(digest.data());

    hasher.Reset();
    const std::string abc = "abc";
    hasher.Write(reinterpret_cast<const Byte*>(abc.data()), abc.size());
    hasher.Finalize(digest.data());

    EXPECT_EQ(BytesToHex(digest),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(Keccak256Test, WriteChains) {
    crypto::Keccak256 hasher;
    const Byte a = 'a', b = 'b', c = 'c';
    std::array<Byte, 32> digest;
    hasher.Write(&a, 1).Write(&b, 1).Write(&c, 1).Finalize(digest.data());
    EXPECT_EQ(BytesToHex(digest),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

} // namespace test
} // namespace zkrange
