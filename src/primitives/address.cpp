// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/address.h"

#include "core/base58.h"
#include "primitives/script/builder.h"

#include <vector>

namespace primitives {

std::string script_hash_to_address(const core::uint160& hash,
                                   uint8_t version) {
    std::vector<uint8_t> payload;
    payload.reserve(1 + core::uint160::SIZE);
    payload.push_back(version);
    payload.insert(payload.end(), hash.bytes().begin(), hash.bytes().end());
    return core::base58check_encode(payload);
}

std::string public_key_to_address(const crypto::PublicKey& key,
                                  uint8_t version) {
    auto script = script::build_verification_script(key);
    return script_hash_to_address(script::script_hash(script), version);
}

core::Result<core::uint160> address_to_script_hash(std::string_view address,
                                                   uint8_t version) {
    N3TX_TRY_ASSIGN(payload, core::base58check_decode(address));
    if (payload.size() != 1 + core::uint160::SIZE) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "address payload is " +
                           std::to_string(payload.size()) + " bytes");
    }
    if (payload[0] != version) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "address version " + std::to_string(payload[0]) +
                           ", expected " + std::to_string(version));
    }
    return core::uint160::from_bytes(
        std::span<const uint8_t, 20>(payload.data() + 1, 20));
}

bool is_valid_address(std::string_view address, uint8_t version) {
    return address_to_script_hash(address, version).ok();
}

} // namespace primitives
