// ZKRANGE - 256-bit Scalars and Modular Arithmetic Implementation
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#include "zkrange/crypto/bigscalar.h"
#include "zkrange/core/hex.h"

#include <cstring>
#include <memory>
#include <new>
#include <stdexcept>

#include <openssl/bn.h>
#include <openssl/crypto.h>

namespace zkrange {
namespace crypto {

namespace {

using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;

BnPtr NewBN() {
    BnPtr bn(BN_new(), &BN_free);
    if (!bn) throw std::bad_alloc();
    return bn;
}

BnPtr ToBN(const BigScalar& v) {
    BnPtr bn(BN_bin2bn(v.data(), BigScalar::SIZE, nullptr), &BN_free);
    if (!bn) throw std::bad_alloc();
    return bn;
}

BnCtxPtr NewCtx() {
    BnCtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
    if (!ctx) throw std::bad_alloc();
    return ctx;
}

void CheckBN(int ok, const char* op) {
    if (!ok) {
        throw std::runtime_error(std::string("BIGNUM operation failed: ") + op);
    }
}

// Results are always reduced below a 256-bit modulus, so they fit
BigScalar FromBN(const BIGNUM* bn) {
    std::array<uint8_t, BigScalar::SIZE> out{};
    CheckBN(BN_bn2binpad(bn, out.data(), static_cast<int>(BigScalar::SIZE)) ==
                static_cast<int>(BigScalar::SIZE),
            "BN_bn2binpad");
    return BigScalar(out);
}

} // anonymous namespace

// ============================================================================
// BigScalar Implementation
// ============================================================================

BigScalar::BigScalar() {
    data_.fill(0);
}

BigScalar::BigScalar(const std::array<uint8_t, SIZE>& data) : data_(data) {}

BigScalar BigScalar::FromInt(uint64_t value) {
    BigScalar result;
    for (int i = 0; i < 8; ++i) {
        result.data_[31 - i] = (value >> (i * 8)) & 0xff;
    }
    return result;
}

std::optional<BigScalar> BigScalar::FromBytes(const uint8_t* data, size_t len) {
    // Skip leading zeros so wide but small encodings are accepted
    size_t start = 0;
    while (start < len && data[start] == 0) {
        ++start;
    }
    size_t significant = len - start;
    if (significant > SIZE) {
        return std::nullopt;
    }

    BigScalar result;
    if (significant > 0) {
        std::memcpy(result.data_.data() + (SIZE - significant), data + start, significant);
    }
    return result;
}

std::optional<BigScalar> BigScalar::FromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(TrimWhitespace(hex));
    if (digits.empty()) {
        return std::nullopt;
    }
    if (digits.length() % 2 != 0) {
        digits.insert(digits.begin(), '0');
    }
    if (!IsValidHex(digits)) {
        return std::nullopt;
    }

    std::vector<HexByte> bytes = HexToBytes(digits);
    return FromBytes(bytes.data(), bytes.size());
}

std::optional<BigScalar> BigScalar::FromDecimal(const std::string& dec) {
    std::string digits = TrimWhitespace(dec);
    if (digits.empty()) {
        return std::nullopt;
    }
    for (char c : digits) {
        if (c < '0' || c > '9') return std::nullopt;
    }

    BIGNUM* raw = nullptr;
    int parsed = BN_dec2bn(&raw, digits.c_str());
    BnPtr bn(raw, &BN_free);
    if (!bn || parsed != static_cast<int>(digits.length())) {
        return std::nullopt;
    }
    if (BN_num_bytes(bn.get()) > static_cast<int>(SIZE)) {
        return std::nullopt;
    }
    return FromBN(bn.get());
}

bool BigScalar::IsZero() const {
    for (auto b : data_) {
        if (b != 0) return false;
    }
    return true;
}

std::string BigScalar::ToHex() const {
    size_t start = 0;
    while (start < SIZE - 1 && data_[start] == 0) {
        ++start;
    }
    return BytesToHex(data_.data() + start, SIZE - start);
}

std::string BigScalar::ToPaddedHex() const {
    return BytesToHex(data_);
}

std::string BigScalar::ToDecimal() const {
    BnPtr bn = ToBN(*this);
    char* dec = BN_bn2dec(bn.get());
    if (!dec) throw std::bad_alloc();
    std::string result(dec);
    OPENSSL_free(dec);
    return result;
}

std::optional<uint64_t> BigScalar::TryGetUint64() const {
    for (size_t i = 0; i < SIZE - 8; ++i) {
        if (data_[i] != 0) return std::nullopt;
    }
    uint64_t value = 0;
    for (size_t i = SIZE - 8; i < SIZE; ++i) {
        value = (value << 8) | data_[i];
    }
    return value;
}

// ============================================================================
// Modular Arithmetic
// ============================================================================

BigScalar ModPow(const BigScalar& base, const BigScalar& exponent,
                 const BigScalar& modulus) {
    if (modulus.IsZero()) return BigScalar();
    if (exponent.IsZero()) return BigScalar::FromInt(1);
    if (base.IsZero()) return BigScalar();

    BnPtr b = ToBN(base);
    BnPtr e = ToBN(exponent);
    BnPtr m = ToBN(modulus);
    BnPtr r = NewBN();
    BnCtxPtr ctx = NewCtx();

    CheckBN(BN_nnmod(b.get(), b.get(), m.get(), ctx.get()), "BN_nnmod");
    CheckBN(BN_mod_exp(r.get(), b.get(), e.get(), m.get(), ctx.get()), "BN_mod_exp");
    return FromBN(r.get());
}

BigScalar MulMod(const BigScalar& a, const BigScalar& b, const BigScalar& modulus) {
    if (modulus.IsZero()) return BigScalar();

    BnPtr x = ToBN(a);
    BnPtr y = ToBN(b);
    BnPtr m = ToBN(modulus);
    BnPtr r = NewBN();
    BnCtxPtr ctx = NewCtx();

    CheckBN(BN_mod_mul(r.get(), x.get(), y.get(), m.get(), ctx.get()), "BN_mod_mul");
    return FromBN(r.get());
}

BigScalar AddMod(const BigScalar& a, const BigScalar& b, const BigScalar& modulus) {
    if (modulus.IsZero()) return BigScalar();

    BnPtr x = ToBN(a);
    BnPtr y = ToBN(b);
    BnPtr m = ToBN(modulus);
    BnPtr r = NewBN();
    BnCtxPtr ctx = NewCtx();

    CheckBN(BN_mod_add(r.get(), x.get(), y.get(), m.get(), ctx.get()), "BN_mod_add");
    return FromBN(r.get());
}

BigScalar Mod(const BigScalar& a, const BigScalar& modulus) {
    if (modulus.IsZero()) return BigScalar();

    BnPtr x = ToBN(a);
    BnPtr m = ToBN(modulus);
    BnPtr r = NewBN();
    BnCtxPtr ctx = NewCtx();

    CheckBN(BN_nnmod(r.get(), x.get(), m.get(), ctx.get()), "BN_nnmod");
    return FromBN(r.get());
}

} // namespace crypto
} // namespace zkrange
