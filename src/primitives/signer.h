#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/stream.h"
#include "core/types.h"
#include "crypto/secp256r1.h"
#include "primitives/contract_parameter.h"
#include "primitives/witness_condition.h"
#include "primitives/witness_scope.h"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace wallet { class Account; }

namespace primitives {

// ---------------------------------------------------------------------------
// SignerBase -- fields and wire form shared by every signer kind
// ---------------------------------------------------------------------------
// Wire form:
//   hash (20) | scope byte
//   | [allowed contracts var-list]   if CUSTOM_CONTRACTS
//   | [allowed groups var-list]      if CUSTOM_GROUPS
//   | [rules var-list]               if WITNESS_RULES
//
// The setters widen the scope.  Each one either applies completely or
// leaves the signer unchanged.
// ---------------------------------------------------------------------------
class SignerBase {
public:
    [[nodiscard]] const core::uint160& script_hash() const noexcept {
        return hash_;
    }
    [[nodiscard]] uint8_t scopes() const noexcept { return scopes_; }
    [[nodiscard]] bool has_scope(WitnessScope flag) const noexcept {
        return primitives::has_scope(scopes_, flag);
    }

    [[nodiscard]] const std::vector<core::uint160>& allowed_contracts() const noexcept {
        return allowed_contracts_;
    }
    [[nodiscard]] const std::vector<crypto::PublicKey>& allowed_groups() const noexcept {
        return allowed_groups_;
    }
    [[nodiscard]] const std::vector<WitnessRule>& rules() const noexcept {
        return rules_;
    }

    /// Adds CUSTOM_CONTRACTS and appends.  CONFIG_SCOPE_CONFLICT on a
    /// global signer, CONFIG_TOO_MANY_ITEMS past MAX_SUBITEMS.
    core::Result<void> set_allowed_contracts(
        std::span<const core::uint160> contracts);

    /// Adds CUSTOM_GROUPS and appends.  Same failure modes.
    core::Result<void> set_allowed_groups(
        std::span<const crypto::PublicKey> groups);

    /// Adds WITNESS_RULES and appends.  Also fails with
    /// CONFIG_NESTING_DEPTH when a rule's condition nests too deep.
    core::Result<void> set_rules(std::span<const WitnessRule> rules);

    void serialize(core::BinaryWriter& w) const;
    [[nodiscard]] size_t serialized_size() const;

    [[nodiscard]] std::string to_string() const;

    /// Equal wire forms.
    bool operator==(const SignerBase& other) const;

protected:
    SignerBase(const core::uint160& hash, uint8_t scopes)
        : hash_(hash), scopes_(scopes) {}

    core::uint160                  hash_;
    uint8_t                        scopes_ = 0;
    std::vector<core::uint160>     allowed_contracts_;
    std::vector<crypto::PublicKey> allowed_groups_;
    std::vector<WitnessRule>       rules_;

    friend class Signer;
};

// ---------------------------------------------------------------------------
// AccountSigner -- signs with an account's key or multi-sig script
// ---------------------------------------------------------------------------
class AccountSigner : public SignerBase {
public:
    static AccountSigner none(const wallet::Account& account);
    static AccountSigner called_by_entry(const wallet::Account& account);
    static AccountSigner global(const wallet::Account& account);

    [[nodiscard]] const wallet::Account& account() const noexcept {
        return *account_;
    }

private:
    AccountSigner(std::shared_ptr<const wallet::Account> account,
                  uint8_t scopes);

    std::shared_ptr<const wallet::Account> account_;
};

// ---------------------------------------------------------------------------
// ContractSigner -- authorized on chain by the contract's verify method
// ---------------------------------------------------------------------------
class ContractSigner : public SignerBase {
public:
    static ContractSigner called_by_entry(
        const core::uint160& contract_hash,
        std::vector<ContractParameter> verify_params = {});
    static ContractSigner global(
        const core::uint160& contract_hash,
        std::vector<ContractParameter> verify_params = {});

    [[nodiscard]] const std::vector<ContractParameter>& verify_params() const noexcept {
        return verify_params_;
    }

private:
    ContractSigner(const core::uint160& hash, uint8_t scopes,
                   std::vector<ContractParameter> params)
        : SignerBase(hash, scopes), verify_params_(std::move(params)) {}

    std::vector<ContractParameter> verify_params_;
};

// ---------------------------------------------------------------------------
// TransactionSigner -- wire-only signer, produced by deserialization
// ---------------------------------------------------------------------------
class TransactionSigner : public SignerBase {
public:
    TransactionSigner(const core::uint160& hash, uint8_t scopes)
        : SignerBase(hash, scopes) {}
    TransactionSigner(const core::uint160& hash,
                      std::span<const WitnessScope> scopes)
        : SignerBase(hash, combine_scopes(scopes)) {}
};

// ---------------------------------------------------------------------------
// Signer -- one of the three kinds
// ---------------------------------------------------------------------------
class Signer {
public:
    using Storage = std::variant<AccountSigner, ContractSigner,
                                 TransactionSigner>;

    Signer(AccountSigner s)     : storage_(std::move(s)) {} // NOLINT
    Signer(ContractSigner s)    : storage_(std::move(s)) {} // NOLINT
    Signer(TransactionSigner s) : storage_(std::move(s)) {} // NOLINT

    [[nodiscard]] bool is_account()     const { return std::holds_alternative<AccountSigner>(storage_); }
    [[nodiscard]] bool is_contract()    const { return std::holds_alternative<ContractSigner>(storage_); }
    [[nodiscard]] bool is_transaction() const { return std::holds_alternative<TransactionSigner>(storage_); }

    [[nodiscard]] const AccountSigner*     as_account()     const { return std::get_if<AccountSigner>(&storage_); }
    [[nodiscard]] const ContractSigner*    as_contract()    const { return std::get_if<ContractSigner>(&storage_); }
    [[nodiscard]] const TransactionSigner* as_transaction() const { return std::get_if<TransactionSigner>(&storage_); }

    [[nodiscard]] const SignerBase& base() const;
    [[nodiscard]] SignerBase& base();

    [[nodiscard]] const Storage& value() const noexcept { return storage_; }

    [[nodiscard]] const core::uint160& script_hash() const { return base().script_hash(); }
    [[nodiscard]] uint8_t scopes() const { return base().scopes(); }

    void serialize(core::BinaryWriter& w) const { base().serialize(w); }

    /// Always yields a TransactionSigner.  Rejects an invalid scope byte
    /// and lists longer than MAX_SUBITEMS.
    static Signer deserialize(core::BinaryReader& r);

    /// Equal wire forms, regardless of kind.
    bool operator==(const Signer& other) const { return base() == other.base(); }

private:
    Storage storage_;
};

} // namespace primitives
