#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/config.h"
#include "core/error.h"
#include "crypto/scrypt.h"
#include "crypto/secp256r1.h"
#include "primitives/address.h"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace wallet {

// ---------------------------------------------------------------------------
// NEP-2 password-protected private keys
// ---------------------------------------------------------------------------
// Raw layout (39 bytes, Base58Check encoded):
//
//   0x01 0x42 0xE0 | address hash (4) | AES-256-ECB ciphertext (32)
//
// address hash = first 4 bytes of SHA256(SHA256(address)) for the key's
// single-sig address.  It salts scrypt and is the only integrity check:
// a wrong password surfaces as an address hash mismatch.
// ---------------------------------------------------------------------------

inline constexpr std::array<uint8_t, 3> NEP2_PREFIX = {0x01, 0x42, 0xE0};
inline constexpr size_t NEP2_RAW_SIZE = 39;

struct Nep2Params {
    crypto::ScryptParams scrypt;
    uint8_t              address_version = primitives::DEFAULT_ADDRESS_VERSION;

    static Nep2Params from_settings(const core::NetworkSettings& settings);
};

/// SHA256(SHA256(address))[0..4].
std::array<uint8_t, 4> nep2_address_hash(const crypto::PublicKey& key,
                                         uint8_t address_version);

core::Result<std::string> nep2_encrypt(std::string_view password,
                                       const crypto::ECKey& key,
                                       const Nep2Params& params = {});

/// PARSE_* for a malformed string, CRYPTO_PASSPHRASE for a wrong password.
core::Result<crypto::ECKey> nep2_decrypt(std::string_view password,
                                         std::string_view nep2,
                                         const Nep2Params& params = {});

} // namespace wallet
