// ZKRANGE - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#ifndef ZKRANGE_CORE_HEX_H
#define ZKRANGE_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace zkrange {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes
/// @throws std::invalid_argument on odd length or a non-hex character
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex (non-empty, even length)
bool IsValidHex(const std::string& str);

/// Remove a leading "0x" or "0X", if any
std::string StripHexPrefix(const std::string& str);

/// Trim ASCII whitespace from both ends
std::string TrimWhitespace(const std::string& str);

} // namespace zkrange

#endif // ZKRANGE_CORE_HEX_H
