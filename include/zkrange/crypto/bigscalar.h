// ZKRANGE - 256-bit Scalars and Modular Arithmetic
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Fixed-width unsigned integers with exact modular arithmetic over an
// arbitrary public modulus. Arithmetic is carried out on OpenSSL BIGNUMs,
// so intermediate products never overflow.

#ifndef ZKRANGE_CRYPTO_BIGSCALAR_H
#define ZKRANGE_CRYPTO_BIGSCALAR_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zkrange {
namespace crypto {

// ============================================================================
// BigScalar
// ============================================================================

/**
 * An unsigned integer in [0, 2^256), stored as 32 big-endian bytes.
 *
 * This is the wire and transcript representation of every proof field,
 * parameter and challenge. Parsing rejects anything wider than 256 bits.
 */
class BigScalar {
public:
    static constexpr size_t SIZE = 32;

    /// Default constructor (zero)
    BigScalar();

    /// Construct from 32 big-endian bytes
    explicit BigScalar(const std::array<uint8_t, SIZE>& data);

    /// Create from integer
    static BigScalar FromInt(uint64_t value);

    /// Parse big-endian bytes of any length; nullopt if the value needs more than 256 bits
    static std::optional<BigScalar> FromBytes(const uint8_t* data, size_t len);

    /// Parse hex digits (optional 0x prefix, odd length allowed); nullopt if
    /// empty, not hex, or wider than 256 bits
    static std::optional<BigScalar> FromHex(const std::string& hex);

    /// Parse a decimal integer; nullopt if malformed or wider than 256 bits
    static std::optional<BigScalar> FromDecimal(const std::string& dec);

    /// Check if value is zero
    bool IsZero() const;

    /// Raw bytes (big-endian)
    const uint8_t* data() const { return data_.data(); }
    const std::array<uint8_t, SIZE>& ToBytes() const { return data_; }

    /// Minimal even-length lowercase hex ("00" for zero)
    std::string ToHex() const;

    /// Full 64-digit lowercase hex
    std::string ToPaddedHex() const;

    /// Decimal string
    std::string ToDecimal() const;

    /// Value as uint64_t if it fits
    std::optional<uint64_t> TryGetUint64() const;

    /// Comparison (numeric)
    bool operator==(const BigScalar& other) const { return data_ == other.data_; }
    bool operator!=(const BigScalar& other) const { return !(*this == other); }
    bool operator<(const BigScalar& other) const { return data_ < other.data_; }
    bool operator>(const BigScalar& other) const { return other < *this; }
    bool operator<=(const BigScalar& other) const { return !(other < *this); }
    bool operator>=(const BigScalar& other) const { return !(*this < other); }

private:
    std::array<uint8_t, SIZE> data_;
};

// ============================================================================
// Modular Arithmetic
// ============================================================================

/**
 * Modular exponentiation base^exponent mod modulus.
 *
 * Edge cases are evaluated in this order and are part of the protocol:
 * modulus == 0 yields 0, exponent == 0 yields 1, base == 0 yields 0.
 */
BigScalar ModPow(const BigScalar& base, const BigScalar& exponent,
                 const BigScalar& modulus);

/// (a * b) mod modulus, exact; 0 when modulus == 0
BigScalar MulMod(const BigScalar& a, const BigScalar& b, const BigScalar& modulus);

/// (a + b) mod modulus, exact; 0 when modulus == 0
BigScalar AddMod(const BigScalar& a, const BigScalar& b, const BigScalar& modulus);

/// a mod modulus; 0 when modulus == 0
BigScalar Mod(const BigScalar& a, const BigScalar& modulus);

} // namespace crypto
} // namespace zkrange

#endif // ZKRANGE_CRYPTO_BIGSCALAR_H
