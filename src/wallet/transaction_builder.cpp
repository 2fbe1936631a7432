// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/transaction_builder.h"

#include "core/hex.h"
#include "core/logging.h"
#include "core/random.h"
#include "primitives/script/builder.h"
#include "primitives/script/invocation.h"
#include "primitives/script/verification.h"
#include "wallet/account.h"

#include <algorithm>
#include <limits>
#include <set>

namespace wallet {

namespace {

// Stands in for the key of an account whose verification script is
// unknown, so the network fee is priced for a single-sig witness.
constexpr std::string_view DUMMY_PUBLIC_KEY =
    "02ec143f00b88524caf36a0121c2de09eef0519ddbe1c710a00f0e2663201ee4c0";

primitives::script::VerificationScript dummy_verification_script() {
    auto bytes = core::hex_bytes(DUMMY_PUBLIC_KEY);
    crypto::PublicKey key{};
    std::copy(bytes.begin(), bytes.end(), key.begin());
    return primitives::script::VerificationScript::from_public_key(key);
}

primitives::script::InvocationScript placeholder_invocation(int signatures) {
    std::vector<crypto::Signature> sigs(static_cast<size_t>(signatures),
                                        crypto::Signature{});
    return primitives::script::InvocationScript::from_signatures(sigs);
}

core::Error config_error(core::ErrorCode code, std::string message) {
    LOG_WARN(core::LogCategory::CONFIG, message);
    return core::Error(code, std::move(message));
}

} // namespace

TransactionBuilder::TransactionBuilder(rpc::Provider& provider,
                                       core::NetworkSettings settings)
    : provider_(provider),
      settings_(settings),
      nonce_(core::get_random_uint32()) {}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

TransactionBuilder& TransactionBuilder::version(uint8_t v) {
    version_ = v;
    return *this;
}

TransactionBuilder& TransactionBuilder::nonce(uint32_t n) {
    nonce_ = n;
    return *this;
}

TransactionBuilder& TransactionBuilder::valid_until_block(uint32_t height) {
    valid_until_block_ = height;
    return *this;
}

TransactionBuilder& TransactionBuilder::signers(
    std::vector<primitives::Signer> signers) {
    signers_ = std::move(signers);
    return *this;
}

core::Result<void> TransactionBuilder::first_signer(const core::uint160& hash) {
    auto it = std::find_if(signers_.begin(), signers_.end(),
                           [&](const primitives::Signer& s) {
                               return s.script_hash() == hash;
                           });
    if (it == signers_.end()) {
        return config_error(core::ErrorCode::CONFIG_INVALID_ARG,
                            "no signer with hash 0x" + hash.to_hex());
    }
    std::rotate(signers_.begin(), it, it + 1);
    return core::make_ok();
}

TransactionBuilder& TransactionBuilder::attributes(
    std::vector<primitives::TransactionAttribute> attrs) {
    attributes_.insert(attributes_.end(),
                       std::make_move_iterator(attrs.begin()),
                       std::make_move_iterator(attrs.end()));
    return *this;
}

TransactionBuilder& TransactionBuilder::script(std::vector<uint8_t> script) {
    script_ = std::move(script);
    return *this;
}

TransactionBuilder& TransactionBuilder::extend_script(
    std::span<const uint8_t> script) {
    script_.insert(script_.end(), script.begin(), script.end());
    return *this;
}

TransactionBuilder& TransactionBuilder::additional_system_fee(int64_t fee) {
    additional_system_fee_ = fee;
    return *this;
}

TransactionBuilder& TransactionBuilder::additional_network_fee(int64_t fee) {
    additional_network_fee_ = fee;
    return *this;
}

TransactionBuilder& TransactionBuilder::fee_consumer(FeeConsumer consumer) {
    fee_consumer_ = std::move(consumer);
    fee_error_.reset();
    return *this;
}

TransactionBuilder& TransactionBuilder::fee_error(core::Error err) {
    fee_error_ = std::move(err);
    fee_consumer_ = nullptr;
    return *this;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

core::Result<void> TransactionBuilder::validate() const {
    using primitives::Transaction;

    if (signers_.empty()) {
        return config_error(core::ErrorCode::CONFIG_NO_SIGNERS,
                            "transaction has no signers");
    }
    if (script_.empty()) {
        return config_error(core::ErrorCode::CONFIG_NO_SCRIPT,
                            "transaction has no script");
    }
    if (script_.size() > Transaction::MAX_SCRIPT_SIZE) {
        return config_error(core::ErrorCode::CONFIG_INVALID_ARG,
                            "script is " + std::to_string(script_.size()) +
                            " bytes, max " +
                            std::to_string(Transaction::MAX_SCRIPT_SIZE));
    }
    if (signers_.size() > Transaction::MAX_TRANSACTION_ATTRIBUTES) {
        return config_error(core::ErrorCode::CONFIG_TOO_MANY_SIGNERS,
                            std::to_string(signers_.size()) +
                            " signers, max " +
                            std::to_string(Transaction::MAX_TRANSACTION_ATTRIBUTES));
    }
    std::set<core::uint160> seen;
    for (const auto& s : signers_) {
        if (!seen.insert(s.script_hash()).second) {
            return config_error(core::ErrorCode::CONFIG_DUP_SIGNER,
                                "duplicate signer 0x" +
                                s.script_hash().to_hex());
        }
    }
    if (signers_.size() + attributes_.size() >
        Transaction::MAX_TRANSACTION_ATTRIBUTES) {
        return config_error(core::ErrorCode::CONFIG_TOO_MANY_ATTRS,
                            std::to_string(attributes_.size()) +
                            " attributes with " +
                            std::to_string(signers_.size()) +
                            " signers exceed " +
                            std::to_string(Transaction::MAX_TRANSACTION_ATTRIBUTES));
    }
    std::set<primitives::TransactionAttributeType> kinds;
    for (const auto& a : attributes_) {
        if (!kinds.insert(a.type()).second) {
            return config_error(core::ErrorCode::CONFIG_INVALID_ARG,
                                "duplicate attribute " + a.to_string());
        }
    }
    if (valid_until_block_ && *valid_until_block_ == 0) {
        return config_error(core::ErrorCode::CONFIG_INVALID_ARG,
                            "valid-until-block must be positive");
    }
    if (additional_system_fee_ < 0 || additional_network_fee_ < 0) {
        return config_error(core::ErrorCode::CONFIG_INVALID_ARG,
                            "additional fees must not be negative");
    }
    return core::make_ok();
}

// HighPriority is reserved for the committee: one signer must be a
// committee member, directly or as a key of a multi-sig account.
core::Result<void> TransactionBuilder::check_committee() {
    bool high_priority = std::any_of(
        attributes_.begin(), attributes_.end(),
        [](const primitives::TransactionAttribute& a) {
            return a.is_high_priority();
        });
    if (!high_priority) return core::make_ok();

    auto committee = provider_.get_committee();
    if (!committee.ok()) return rpc::delegated(committee.error(), "get_committee");

    std::set<core::uint160> members;
    for (const auto& key : committee.value()) {
        members.insert(primitives::script::script_hash(
            primitives::script::build_verification_script(key)));
    }

    for (const auto& signer : signers_) {
        if (members.count(signer.script_hash())) return core::make_ok();
        const auto* acct_signer = signer.as_account();
        if (!acct_signer || !acct_signer->account().is_multisig()) continue;
        auto keys = acct_signer->account().verification_script()->public_keys();
        if (!keys.ok()) continue;
        for (const auto& key : keys.value()) {
            if (members.count(primitives::script::script_hash(
                    primitives::script::build_verification_script(key)))) {
                return core::make_ok();
            }
        }
    }
    return config_error(core::ErrorCode::CONFIG_NOT_COMMITTEE,
                        "HighPriority requires a committee member signer");
}

core::Result<std::vector<primitives::Witness>>
TransactionBuilder::placeholder_witnesses() const {
    std::vector<primitives::Witness> out;
    out.reserve(signers_.size());
    for (const auto& signer : signers_) {
        if (const auto* cs = signer.as_contract()) {
            N3TX_TRY_ASSIGN(w, primitives::Witness::create_contract_witness(
                                   cs->verify_params()));
            out.push_back(std::move(w));
            continue;
        }
        const auto* as = signer.as_account();
        if (as && as->account().verification_script()) {
            const auto& verification = *as->account().verification_script();
            N3TX_TRY_ASSIGN(m, verification.signing_threshold());
            out.emplace_back(placeholder_invocation(m), verification);
        } else {
            out.emplace_back(placeholder_invocation(1),
                             dummy_verification_script());
        }
    }
    return out;
}

core::Result<void> TransactionBuilder::check_sender_balance(int64_t required) {
    if (!fee_consumer_ && !fee_error_) return core::make_ok();

    const auto& sender = signers_.front().script_hash();
    auto balance = provider_.get_gas_balance(sender);
    if (!balance.ok()) return rpc::delegated(balance.error(), "get_gas_balance");
    if (required <= balance.value()) return core::make_ok();

    LOG_DEBUG(core::LogCategory::TX,
              "sender 0x" + sender.to_hex() + " holds " +
              std::to_string(balance.value()) + ", needs " +
              std::to_string(required));
    if (fee_error_) return *fee_error_;
    fee_consumer_(required, balance.value());
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Assembly
// ---------------------------------------------------------------------------

core::Result<primitives::Transaction> TransactionBuilder::build_unsigned() {
    N3TX_TRY_VOID(validate());
    N3TX_TRY_VOID(check_committee());

    uint32_t valid_until = 0;
    if (valid_until_block_) {
        valid_until = *valid_until_block_;
    } else {
        auto count = provider_.get_block_count();
        if (!count.ok()) return rpc::delegated(count.error(), "get_block_count");
        uint64_t expiry = static_cast<uint64_t>(count.value()) +
                          settings_.max_valid_until_block_increment;
        if (expiry == 0 || expiry - 1 > std::numeric_limits<uint32_t>::max()) {
            return core::Error(core::ErrorCode::CONFIG_INVALID_ARG,
                               "valid-until block past uint32 range at height " +
                               std::to_string(count.value()));
        }
        valid_until = static_cast<uint32_t>(expiry - 1);
    }

    auto invocation = provider_.invoke_script(script_, signers_);
    if (!invocation.ok()) {
        return rpc::delegated(invocation.error(), "invoke_script");
    }
    if (invocation.value().has_fault()) {
        return core::Error(core::ErrorCode::TX_ERROR,
                           "script faulted during fee estimation: " +
                           invocation.value().exception);
    }
    int64_t system_fee = invocation.value().gas_consumed + additional_system_fee_;

    primitives::Transaction tx(version_, nonce_, valid_until, signers_,
                               system_fee, 0, attributes_, script_);

    N3TX_TRY_ASSIGN(placeholders, placeholder_witnesses());
    tx.set_witnesses(std::move(placeholders));
    auto network_fee = provider_.calculate_network_fee(tx.to_bytes());
    if (!network_fee.ok()) {
        return rpc::delegated(network_fee.error(), "calculate_network_fee");
    }
    tx.set_witnesses({});
    tx.set_network_fee(network_fee.value() + additional_network_fee_);

    N3TX_TRY_VOID(check_sender_balance(tx.system_fee() + tx.network_fee()));

    LOG_DEBUG(core::LogCategory::TX,
              "unsigned transaction: system fee " +
              std::to_string(tx.system_fee()) + ", network fee " +
              std::to_string(tx.network_fee()) + ", valid until " +
              std::to_string(valid_until));
    return tx;
}

core::Result<primitives::Transaction> TransactionBuilder::sign() {
    N3TX_TRY_ASSIGN(tx, build_unsigned());

    auto magic = provider_.get_network_magic();
    if (!magic.ok()) return rpc::delegated(magic.error(), "get_network_magic");
    if (magic.value() != settings_.network_magic) {
        return config_error(core::ErrorCode::CONFIG_INVALID_ARG,
                            "provider network magic " +
                            std::to_string(magic.value()) +
                            " differs from configured " +
                            std::to_string(settings_.network_magic));
    }
    auto sign_data = tx.sign_data(magic.value());

    for (const auto& signer : tx.signers()) {
        if (const auto* cs = signer.as_contract()) {
            N3TX_TRY_ASSIGN(w, primitives::Witness::create_contract_witness(
                                   cs->verify_params()));
            tx.add_witness(std::move(w));
            continue;
        }
        const auto* as = signer.as_account();
        if (!as) {
            return config_error(core::ErrorCode::CONFIG_NO_PRIVATE_KEY,
                                "cannot sign for wire-only signer 0x" +
                                signer.script_hash().to_hex());
        }
        const auto& account = as->account();
        if (account.is_multisig()) {
            return config_error(core::ErrorCode::CONFIG_MULTISIG,
                                "multi-sig account " + account.address() +
                                " cannot be signed automatically");
        }
        if (!account.key()) {
            return config_error(core::ErrorCode::CONFIG_NO_PRIVATE_KEY,
                                "account " + account.address() +
                                " holds no private key");
        }
        N3TX_TRY_ASSIGN(w, primitives::Witness::create(sign_data,
                                                       *account.key()));
        tx.add_witness(std::move(w));
    }

    size_t tx_size = tx.size();
    if (tx_size > primitives::Transaction::MAX_TRANSACTION_SIZE) {
        return core::Error(core::ErrorCode::TX_TOO_LARGE,
                           "signed transaction is " +
                           std::to_string(tx_size) + " bytes");
    }
    LOG_DEBUG(core::LogCategory::TX,
              "signed transaction 0x" + tx.hash().to_hex() + " (" +
              std::to_string(tx_size) + " bytes)");
    return tx;
}

} // namespace wallet
