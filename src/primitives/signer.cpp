// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/signer.h"

#include "core/logging.h"
#include "core/serialize.h"
#include "wallet/account.h"

namespace primitives {

namespace {

core::Result<void> check_widening(uint8_t scopes, size_t have, size_t adding,
                                  std::string_view what) {
    if (has_scope(scopes, WitnessScope::GLOBAL)) {
        LOG_WARN(core::LogCategory::CONFIG,
                 "rejected " + std::string(what) + " on a global signer");
        return core::Error(core::ErrorCode::CONFIG_SCOPE_CONFLICT,
                           "cannot restrict " + std::string(what) +
                           " of a signer with global scope");
    }
    if (have + adding > MAX_SUBITEMS) {
        LOG_WARN(core::LogCategory::CONFIG,
                 "rejected " + std::to_string(adding) + " " +
                 std::string(what) + ", signer already has " +
                 std::to_string(have));
        return core::Error(core::ErrorCode::CONFIG_TOO_MANY_ITEMS,
                           "a signer may carry at most " +
                           std::to_string(MAX_SUBITEMS) + " " +
                           std::string(what));
    }
    return core::make_ok();
}

} // namespace

// ---------------------------------------------------------------------------
// SignerBase
// ---------------------------------------------------------------------------

core::Result<void> SignerBase::set_allowed_contracts(
    std::span<const core::uint160> contracts) {
    N3TX_TRY_VOID(check_widening(scopes_, allowed_contracts_.size(),
                                 contracts.size(), "allowed contracts"));
    scopes_ = with_scope(scopes_, WitnessScope::CUSTOM_CONTRACTS);
    allowed_contracts_.insert(allowed_contracts_.end(),
                              contracts.begin(), contracts.end());
    return core::make_ok();
}

core::Result<void> SignerBase::set_allowed_groups(
    std::span<const crypto::PublicKey> groups) {
    N3TX_TRY_VOID(check_widening(scopes_, allowed_groups_.size(),
                                 groups.size(), "allowed groups"));
    scopes_ = with_scope(scopes_, WitnessScope::CUSTOM_GROUPS);
    allowed_groups_.insert(allowed_groups_.end(), groups.begin(), groups.end());
    return core::make_ok();
}

core::Result<void> SignerBase::set_rules(std::span<const WitnessRule> rules) {
    N3TX_TRY_VOID(check_widening(scopes_, rules_.size(), rules.size(),
                                 "witness rules"));
    for (const auto& rule : rules) {
        N3TX_TRY_VOID(rule.condition.validate(MAX_CONDITION_NESTING));
    }
    scopes_ = with_scope(scopes_, WitnessScope::WITNESS_RULES);
    rules_.insert(rules_.end(), rules.begin(), rules.end());
    return core::make_ok();
}

void SignerBase::serialize(core::BinaryWriter& w) const {
    core::ser_write_uint160(w, hash_);
    core::ser_write_u8(w, scopes_);
    if (has_scope(WitnessScope::CUSTOM_CONTRACTS)) {
        core::ser_write_var_int(w, allowed_contracts_.size());
        for (const auto& h : allowed_contracts_) core::ser_write_uint160(w, h);
    }
    if (has_scope(WitnessScope::CUSTOM_GROUPS)) {
        core::ser_write_var_int(w, allowed_groups_.size());
        for (const auto& g : allowed_groups_) core::ser_write_bytes(w, g);
    }
    if (has_scope(WitnessScope::WITNESS_RULES)) {
        core::ser_write_list(w, rules_);
    }
}

size_t SignerBase::serialized_size() const {
    core::BinaryWriter w;
    serialize(w);
    return w.size();
}

std::string SignerBase::to_string() const {
    std::string out = "Signer(0x" + hash_.to_hex() + ", " +
                      scopes_to_string(scopes_);
    if (!allowed_contracts_.empty()) {
        out += ", contracts=" + std::to_string(allowed_contracts_.size());
    }
    if (!allowed_groups_.empty()) {
        out += ", groups=" + std::to_string(allowed_groups_.size());
    }
    if (!rules_.empty()) {
        out += ", rules=" + std::to_string(rules_.size());
    }
    return out + ")";
}

bool SignerBase::operator==(const SignerBase& other) const {
    return hash_ == other.hash_ && scopes_ == other.scopes_ &&
           allowed_contracts_ == other.allowed_contracts_ &&
           allowed_groups_ == other.allowed_groups_ &&
           rules_ == other.rules_;
}

// ---------------------------------------------------------------------------
// AccountSigner
// ---------------------------------------------------------------------------

AccountSigner::AccountSigner(std::shared_ptr<const wallet::Account> account,
                             uint8_t scopes)
    : SignerBase(account->script_hash(), scopes),
      account_(std::move(account)) {}

AccountSigner AccountSigner::none(const wallet::Account& account) {
    return AccountSigner(std::make_shared<const wallet::Account>(account),
                         static_cast<uint8_t>(WitnessScope::NONE));
}

AccountSigner AccountSigner::called_by_entry(const wallet::Account& account) {
    return AccountSigner(std::make_shared<const wallet::Account>(account),
                         static_cast<uint8_t>(WitnessScope::CALLED_BY_ENTRY));
}

AccountSigner AccountSigner::global(const wallet::Account& account) {
    return AccountSigner(std::make_shared<const wallet::Account>(account),
                         static_cast<uint8_t>(WitnessScope::GLOBAL));
}

// ---------------------------------------------------------------------------
// ContractSigner
// ---------------------------------------------------------------------------

ContractSigner ContractSigner::called_by_entry(
    const core::uint160& contract_hash,
    std::vector<ContractParameter> verify_params) {
    return ContractSigner(contract_hash,
                          static_cast<uint8_t>(WitnessScope::CALLED_BY_ENTRY),
                          std::move(verify_params));
}

ContractSigner ContractSigner::global(
    const core::uint160& contract_hash,
    std::vector<ContractParameter> verify_params) {
    return ContractSigner(contract_hash,
                          static_cast<uint8_t>(WitnessScope::GLOBAL),
                          std::move(verify_params));
}

// ---------------------------------------------------------------------------
// Signer
// ---------------------------------------------------------------------------

const SignerBase& Signer::base() const {
    return std::visit([](const auto& s) -> const SignerBase& { return s; },
                      storage_);
}

SignerBase& Signer::base() {
    return std::visit([](auto& s) -> SignerBase& { return s; }, storage_);
}

Signer Signer::deserialize(core::BinaryReader& r) {
    auto hash = core::ser_read_uint160(r);
    uint8_t scopes = core::ser_read_u8(r);
    if (!is_valid_scope_byte(scopes)) {
        throw core::FormatError("invalid witness scope byte " +
                                std::to_string(scopes));
    }

    TransactionSigner signer(hash, scopes);
    if (has_scope(scopes, WitnessScope::CUSTOM_CONTRACTS)) {
        uint64_t n = core::ser_read_var_int(r, MAX_SUBITEMS);
        for (uint64_t i = 0; i < n; ++i) {
            signer.allowed_contracts_.push_back(core::ser_read_uint160(r));
        }
    }
    if (has_scope(scopes, WitnessScope::CUSTOM_GROUPS)) {
        uint64_t n = core::ser_read_var_int(r, MAX_SUBITEMS);
        for (uint64_t i = 0; i < n; ++i) {
            signer.allowed_groups_.push_back(core::ser_read_encoded_ec_point(r));
        }
    }
    if (has_scope(scopes, WitnessScope::WITNESS_RULES)) {
        signer.rules_ = core::ser_read_list<WitnessRule>(r, MAX_SUBITEMS);
    }
    return Signer(std::move(signer));
}

} // namespace primitives
