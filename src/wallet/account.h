#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "crypto/secp256r1.h"
#include "primitives/address.h"
#include "primitives/script/verification.h"
#include "wallet/nep2.h"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wallet {

/// WIF version byte.
inline constexpr uint8_t WIF_VERSION = 0x80;

/// Base58Check(0x80 || secret || 0x01).
std::string encode_wif(std::span<const uint8_t, 32> secret);

/// Exactly 34 payload bytes with the 0x80 prefix and 0x01 suffix.
core::Result<std::array<uint8_t, 32>> decode_wif(std::string_view wif);

// ---------------------------------------------------------------------------
// Account -- an address and what is known about how to sign for it
// ---------------------------------------------------------------------------
// A full account holds a key pair.  A multi-sig account holds only its
// verification script; a watch-only account holds only the script hash.
// Encrypting the private key drops the key pair and keeps the NEP-2 string
// until decrypt_private_key() restores it.
// ---------------------------------------------------------------------------
class Account {
public:
    static Account from_key(crypto::ECKey key,
                            uint8_t version = primitives::DEFAULT_ADDRESS_VERSION);

    /// Fresh random key pair.
    static core::Result<Account> create(
        uint8_t version = primitives::DEFAULT_ADDRESS_VERSION);

    static core::Result<Account> from_wif(
        std::string_view wif,
        uint8_t version = primitives::DEFAULT_ADDRESS_VERSION);

    /// Decrypt @p nep2 and build a full account.
    static core::Result<Account> from_nep2(std::string_view nep2,
                                           std::string_view password,
                                           const Nep2Params& params = {});

    static core::Result<Account> create_multisig(
        std::vector<crypto::PublicKey> keys, int threshold,
        uint8_t version = primitives::DEFAULT_ADDRESS_VERSION);

    static Account from_verification_script(
        primitives::script::VerificationScript script,
        uint8_t version = primitives::DEFAULT_ADDRESS_VERSION);

    /// Watch-only.
    static Account from_script_hash(
        const core::uint160& hash,
        uint8_t version = primitives::DEFAULT_ADDRESS_VERSION);

    /// Watch-only, from an address string.
    static core::Result<Account> from_address(
        std::string_view address,
        uint8_t version = primitives::DEFAULT_ADDRESS_VERSION);

    // -- Identity -----------------------------------------------------------

    [[nodiscard]] const core::uint160& script_hash() const noexcept { return hash_; }
    [[nodiscard]] const std::string& address() const noexcept { return address_; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void set_label(std::string label) { label_ = std::move(label); }

    // -- Keys and scripts ---------------------------------------------------

    /// nullptr when no decrypted key is held.
    [[nodiscard]] const crypto::ECKey* key() const noexcept {
        return key_ ? &*key_ : nullptr;
    }
    [[nodiscard]] bool has_private_key() const noexcept { return key_.has_value(); }

    [[nodiscard]] const std::optional<primitives::script::VerificationScript>&
    verification_script() const noexcept {
        return verification_;
    }

    [[nodiscard]] bool is_multisig() const;

    /// Signatures required; CONFIG_NO_SCRIPT for watch-only accounts.
    core::Result<int> signing_threshold() const;
    core::Result<int> nr_of_participants() const;

    // -- NEP-2 --------------------------------------------------------------

    [[nodiscard]] const std::optional<std::string>& encrypted_key() const noexcept {
        return encrypted_key_;
    }

    /// Replace the key pair with its NEP-2 form.
    core::Result<void> encrypt_private_key(std::string_view password,
                                           const Nep2Params& params = {});

    /// Restore the key pair.  The key must belong to this account.
    core::Result<void> decrypt_private_key(std::string_view password,
                                           const Nep2Params& params = {});

    core::Result<std::string> export_wif() const;

private:
    Account(const core::uint160& hash, uint8_t version);

    core::uint160                                          hash_;
    std::string                                            address_;
    std::string                                            label_;
    uint8_t                                                version_;
    std::optional<crypto::ECKey>                           key_;
    std::optional<primitives::script::VerificationScript>  verification_;
    std::optional<std::string>                             encrypted_key_;
};

} // namespace wallet
