// ZKGAS - Hex Encoding/Decoding Utilities
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#ifndef ZKGAS_CORE_HEX_H
#define ZKGAS_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace zkgas {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

/// Convert hex string to bytes (accepts an optional "0x" prefix).
/// Throws std::invalid_argument on odd length or invalid characters.
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex (optional "0x" prefix)
bool IsValidHex(const std::string& str);

/// Remove a leading "0x"/"0X"
std::string StripHexPrefix(const std::string& str);

} // namespace zkgas

#endif // ZKGAS_CORE_HEX_H
