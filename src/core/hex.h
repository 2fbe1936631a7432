#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Encode a byte span to a lowercase hexadecimal string.
std::string to_hex(std::span<const uint8_t> data);

// Decode a hexadecimal string to bytes.  An optional "0x" prefix is
// accepted.  Returns nullopt on odd length or non-hex characters.
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// Decode a hex literal known to be valid.  Throws std::invalid_argument
// otherwise; intended for constants and tests.
std::vector<uint8_t> hex_bytes(std::string_view hex);

// Return a copy of @p data in reverse byte order.
std::vector<uint8_t> reversed(std::span<const uint8_t> data);

}  // namespace core
