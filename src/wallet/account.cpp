// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/account.h"

#include "core/base58.h"
#include "core/logging.h"

#include <openssl/crypto.h>

#include <algorithm>

namespace wallet {

// ---------------------------------------------------------------------------
// WIF
// ---------------------------------------------------------------------------

std::string encode_wif(std::span<const uint8_t, 32> secret) {
    std::vector<uint8_t> payload;
    payload.reserve(34);
    payload.push_back(WIF_VERSION);
    payload.insert(payload.end(), secret.begin(), secret.end());
    payload.push_back(0x01);
    auto out = core::base58check_encode(payload);
    OPENSSL_cleanse(payload.data(), payload.size());
    return out;
}

core::Result<std::array<uint8_t, 32>> decode_wif(std::string_view wif) {
    N3TX_TRY_ASSIGN(payload, core::base58check_decode(wif));
    if (payload.size() != 34 || payload[0] != WIF_VERSION ||
        payload[33] != 0x01) {
        OPENSSL_cleanse(payload.data(), payload.size());
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "not a compressed-key WIF string");
    }
    std::array<uint8_t, 32> secret{};
    std::copy_n(payload.begin() + 1, 32, secret.begin());
    OPENSSL_cleanse(payload.data(), payload.size());
    return secret;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Account::Account(const core::uint160& hash, uint8_t version)
    : hash_(hash),
      address_(primitives::script_hash_to_address(hash, version)),
      label_(address_),
      version_(version) {}

Account Account::from_key(crypto::ECKey key, uint8_t version) {
    auto script = primitives::script::VerificationScript::from_public_key(
        key.pubkey_compressed());
    Account acct(script.script_hash(), version);
    acct.verification_ = std::move(script);
    acct.key_ = std::move(key);
    return acct;
}

core::Result<Account> Account::create(uint8_t version) {
    N3TX_TRY_ASSIGN(key, crypto::ECKey::generate());
    return from_key(std::move(key), version);
}

core::Result<Account> Account::from_wif(std::string_view wif, uint8_t version) {
    N3TX_TRY_ASSIGN(secret, decode_wif(wif));
    auto key = crypto::ECKey::from_secret(secret);
    OPENSSL_cleanse(secret.data(), secret.size());
    if (!key.ok()) return key.error();
    return from_key(std::move(key).value(), version);
}

core::Result<Account> Account::from_nep2(std::string_view nep2,
                                         std::string_view password,
                                         const Nep2Params& params) {
    N3TX_TRY_ASSIGN(key, nep2_decrypt(password, nep2, params));
    auto acct = from_key(std::move(key), params.address_version);
    acct.encrypted_key_ = std::string(nep2);
    return acct;
}

core::Result<Account> Account::create_multisig(
    std::vector<crypto::PublicKey> keys, int threshold, uint8_t version) {
    N3TX_TRY_ASSIGN(script, primitives::script::VerificationScript::from_multisig(
                                std::move(keys), threshold));
    return from_verification_script(std::move(script), version);
}

Account Account::from_verification_script(
    primitives::script::VerificationScript script, uint8_t version) {
    Account acct(script.script_hash(), version);
    acct.verification_ = std::move(script);
    return acct;
}

Account Account::from_script_hash(const core::uint160& hash, uint8_t version) {
    return Account(hash, version);
}

core::Result<Account> Account::from_address(std::string_view address,
                                            uint8_t version) {
    N3TX_TRY_ASSIGN(hash, primitives::address_to_script_hash(address, version));
    return Account(hash, version);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool Account::is_multisig() const {
    return verification_ && verification_->is_multisig();
}

core::Result<int> Account::signing_threshold() const {
    if (!verification_) {
        return core::Error(core::ErrorCode::CONFIG_NO_SCRIPT,
                           "account " + address_ +
                           " has no verification script");
    }
    return verification_->signing_threshold();
}

core::Result<int> Account::nr_of_participants() const {
    if (!verification_) {
        return core::Error(core::ErrorCode::CONFIG_NO_SCRIPT,
                           "account " + address_ +
                           " has no verification script");
    }
    return verification_->nr_of_accounts();
}

// ---------------------------------------------------------------------------
// NEP-2
// ---------------------------------------------------------------------------

core::Result<void> Account::encrypt_private_key(std::string_view password,
                                                const Nep2Params& params) {
    if (!key_) {
        return core::Error(core::ErrorCode::CONFIG_NO_PRIVATE_KEY,
                           "account " + address_ + " holds no private key");
    }
    N3TX_TRY_ASSIGN(nep2, nep2_encrypt(password, *key_, params));
    encrypted_key_ = std::move(nep2);
    key_.reset();
    LOG_DEBUG(core::LogCategory::WALLET, "encrypted key of " + address_);
    return core::make_ok();
}

core::Result<void> Account::decrypt_private_key(std::string_view password,
                                                const Nep2Params& params) {
    if (key_) return core::make_ok();
    if (!encrypted_key_) {
        return core::Error(core::ErrorCode::CONFIG_NO_PRIVATE_KEY,
                           "account " + address_ + " has no encrypted key");
    }
    N3TX_TRY_ASSIGN(key, nep2_decrypt(password, *encrypted_key_, params));

    auto derived = primitives::script::VerificationScript::from_public_key(
        key.pubkey_compressed());
    if (derived.script_hash() != hash_) {
        return core::Error(core::ErrorCode::WALLET_KEY_MISS,
                           "NEP-2 key does not belong to " + address_);
    }
    key_ = std::move(key);
    LOG_DEBUG(core::LogCategory::WALLET, "decrypted key of " + address_);
    return core::make_ok();
}

core::Result<std::string> Account::export_wif() const {
    if (!key_) {
        return core::Error(core::ErrorCode::CONFIG_NO_PRIVATE_KEY,
                           "account " + address_ + " holds no private key");
    }
    auto secret = key_->secret();
    auto wif = encode_wif(secret);
    OPENSSL_cleanse(secret.data(), secret.size());
    return wif;
}

} // namespace wallet
