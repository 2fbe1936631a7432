#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "crypto/secp256r1.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace primitives {

/// N3 mainnet and testnet address version byte (addresses start with 'N').
inline constexpr uint8_t DEFAULT_ADDRESS_VERSION = 0x35;

// ---------------------------------------------------------------------------
// Addresses
// ---------------------------------------------------------------------------
// An address is Base58Check(version || script hash), with the script hash in
// wire (little-endian) order.
// ---------------------------------------------------------------------------

std::string script_hash_to_address(
    const core::uint160& hash, uint8_t version = DEFAULT_ADDRESS_VERSION);

/// Address of the single-sig verification script for @p key.
std::string public_key_to_address(
    const crypto::PublicKey& key, uint8_t version = DEFAULT_ADDRESS_VERSION);

/// PARSE_CHECKSUM on a bad checksum, PARSE_BAD_FORMAT on bad Base58, wrong
/// length or a version byte other than @p version.
core::Result<core::uint160> address_to_script_hash(
    std::string_view address, uint8_t version = DEFAULT_ADDRESS_VERSION);

[[nodiscard]] bool is_valid_address(std::string_view address,
                                    uint8_t version = DEFAULT_ADDRESS_VERSION);

} // namespace primitives
