#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Base58 alphabet (no 0, O, I, l to avoid visual ambiguity).
inline constexpr char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// ---------------------------------------------------------------------------
// Pure Base58 encoding / decoding
// ---------------------------------------------------------------------------

/// Encode raw bytes as a Base58 string.
/// Leading zero bytes map to leading '1' characters.
std::string base58_encode(std::span<const uint8_t> data);

/// Decode a Base58 string back to raw bytes.
/// Returns std::nullopt if any character is outside the Base58 alphabet.
std::optional<std::vector<uint8_t>> base58_decode(std::string_view str);

// ---------------------------------------------------------------------------
// Base58Check (4-byte checksum = first bytes of SHA256(SHA256(payload)))
// ---------------------------------------------------------------------------

/// Append the 4-byte checksum, then Base58-encode.
std::string base58check_encode(std::span<const uint8_t> data);

/// Decode and verify a Base58Check string, returning the payload without
/// the checksum.  PARSE_BAD_FORMAT for invalid characters or short input,
/// PARSE_CHECKSUM on checksum mismatch.
core::Result<std::vector<uint8_t>> base58check_decode(std::string_view str);

}  // namespace core
