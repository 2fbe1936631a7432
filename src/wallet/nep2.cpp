// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/nep2.h"

#include "core/base58.h"
#include "core/logging.h"
#include "crypto/aes.h"
#include "crypto/hash.h"

#include <openssl/crypto.h>

#include <algorithm>
#include <vector>

namespace wallet {

namespace {

constexpr size_t DERIVED_KEY_SIZE = 64;

// scrypt(password, address hash) split into the XOR mask and the AES key.
struct DerivedKeys {
    std::array<uint8_t, 32> half1{};
    std::array<uint8_t, 32> half2{};

    ~DerivedKeys() {
        OPENSSL_cleanse(half1.data(), half1.size());
        OPENSSL_cleanse(half2.data(), half2.size());
    }
};

core::Result<void> derive(std::string_view password,
                          std::span<const uint8_t> salt,
                          const crypto::ScryptParams& params,
                          DerivedKeys& out) {
    N3TX_TRY_ASSIGN(derived, crypto::scrypt_derive(password, salt, params,
                                                   DERIVED_KEY_SIZE));
    std::copy_n(derived.begin(), 32, out.half1.begin());
    std::copy_n(derived.begin() + 32, 32, out.half2.begin());
    OPENSSL_cleanse(derived.data(), derived.size());
    return core::make_ok();
}

} // namespace

Nep2Params Nep2Params::from_settings(const core::NetworkSettings& settings) {
    Nep2Params p;
    p.scrypt.n = settings.scrypt_n;
    p.scrypt.r = settings.scrypt_r;
    p.scrypt.p = settings.scrypt_p;
    p.address_version = settings.address_version;
    return p;
}

std::array<uint8_t, 4> nep2_address_hash(const crypto::PublicKey& key,
                                         uint8_t address_version) {
    auto address = primitives::public_key_to_address(key, address_version);
    auto digest = crypto::hash256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(address.data()), address.size()));
    std::array<uint8_t, 4> out{};
    std::copy_n(digest.bytes().begin(), out.size(), out.begin());
    return out;
}

core::Result<std::string> nep2_encrypt(std::string_view password,
                                       const crypto::ECKey& key,
                                       const Nep2Params& params) {
    if (!key.is_valid()) {
        return core::Error(core::ErrorCode::CRYPTO_KEY_FAIL,
                           "cannot encrypt an empty key");
    }
    auto addr_hash = nep2_address_hash(key.pubkey_compressed(),
                                       params.address_version);

    DerivedKeys keys;
    N3TX_TRY_VOID(derive(password, addr_hash, params.scrypt, keys));

    auto secret = key.secret();
    std::array<uint8_t, 32> masked{};
    for (size_t i = 0; i < masked.size(); ++i) {
        masked[i] = secret[i] ^ keys.half1[i];
    }
    OPENSSL_cleanse(secret.data(), secret.size());

    auto encrypted = crypto::aes256_ecb_encrypt(keys.half2, masked);
    OPENSSL_cleanse(masked.data(), masked.size());
    if (!encrypted.ok()) return encrypted.error();

    std::vector<uint8_t> raw;
    raw.reserve(NEP2_RAW_SIZE);
    raw.insert(raw.end(), NEP2_PREFIX.begin(), NEP2_PREFIX.end());
    raw.insert(raw.end(), addr_hash.begin(), addr_hash.end());
    raw.insert(raw.end(), encrypted.value().begin(), encrypted.value().end());
    return core::base58check_encode(raw);
}

core::Result<crypto::ECKey> nep2_decrypt(std::string_view password,
                                         std::string_view nep2,
                                         const Nep2Params& params) {
    N3TX_TRY_ASSIGN(raw, core::base58check_decode(nep2));
    if (raw.size() != NEP2_RAW_SIZE ||
        !std::equal(NEP2_PREFIX.begin(), NEP2_PREFIX.end(), raw.begin())) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "not a NEP-2 encrypted key");
    }
    auto addr_hash = std::span<const uint8_t>(raw).subspan(3, 4);
    auto ciphertext = std::span<const uint8_t>(raw).subspan(7, 32);

    DerivedKeys keys;
    N3TX_TRY_VOID(derive(password, addr_hash, params.scrypt, keys));

    N3TX_TRY_ASSIGN(masked, crypto::aes256_ecb_decrypt(keys.half2, ciphertext));
    std::array<uint8_t, 32> secret{};
    for (size_t i = 0; i < secret.size(); ++i) {
        secret[i] = masked[i] ^ keys.half1[i];
    }
    OPENSSL_cleanse(masked.data(), masked.size());

    auto key = crypto::ECKey::from_secret(secret);
    OPENSSL_cleanse(secret.data(), secret.size());

    auto wrong_password = [] {
        LOG_WARN(core::LogCategory::WALLET, "NEP-2 passphrase mismatch");
        return core::Error(core::ErrorCode::CRYPTO_PASSPHRASE,
                           "wrong passphrase for NEP-2 key");
    };
    if (!key.ok()) return wrong_password();

    auto check = nep2_address_hash(key.value().pubkey_compressed(),
                                   params.address_version);
    if (!std::equal(check.begin(), check.end(), addr_hash.begin())) {
        return wrong_password();
    }
    return key;
}

} // namespace wallet
