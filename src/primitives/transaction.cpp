// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/transaction.h"

#include "core/logging.h"
#include "core/serialize.h"
#include "crypto/hash.h"
#include "rpc/provider.h"

#include <set>
#include <stdexcept>

namespace primitives {

Transaction::Transaction(uint8_t version, uint32_t nonce,
                         uint32_t valid_until_block,
                         std::vector<Signer> signers, int64_t system_fee,
                         int64_t network_fee,
                         std::vector<TransactionAttribute> attributes,
                         std::vector<uint8_t> script,
                         std::vector<Witness> witnesses)
    : version_(version),
      nonce_(nonce),
      valid_until_block_(valid_until_block),
      signers_(std::move(signers)),
      system_fee_(system_fee),
      network_fee_(network_fee),
      attributes_(std::move(attributes)),
      script_(std::move(script)),
      witnesses_(std::move(witnesses)) {}

const core::uint160& Transaction::sender() const {
    if (signers_.empty()) {
        throw std::logic_error("Transaction::sender(): no signers");
    }
    return signers_.front().script_hash();
}

// ---------------------------------------------------------------------------
// Hashing
// ---------------------------------------------------------------------------

core::uint256 Transaction::hash() const {
    return crypto::sha256(unsigned_bytes());
}

std::vector<uint8_t> Transaction::sign_data(uint32_t magic) const {
    core::BinaryWriter w;
    core::ser_write_u32(w, magic);
    core::ser_write_uint256(w, hash());
    return w.release();
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

void Transaction::serialize_unsigned(core::BinaryWriter& w) const {
    core::ser_write_u8(w, version_);
    core::ser_write_u32(w, nonce_);
    core::ser_write_i64(w, system_fee_);
    core::ser_write_i64(w, network_fee_);
    core::ser_write_u32(w, valid_until_block_);
    core::ser_write_list(w, signers_);
    core::ser_write_list(w, attributes_);
    core::ser_write_var_bytes(w, script_);
}

void Transaction::serialize(core::BinaryWriter& w) const {
    serialize_unsigned(w);
    core::ser_write_list(w, witnesses_);
}

std::vector<uint8_t> Transaction::unsigned_bytes() const {
    core::BinaryWriter w;
    serialize_unsigned(w);
    return w.release();
}

std::vector<uint8_t> Transaction::to_bytes() const {
    core::BinaryWriter w;
    serialize(w);
    return w.release();
}

size_t Transaction::size() const {
    size_t total = HEADER_SIZE;
    total += core::list_size(signers_);
    total += core::list_size(attributes_);
    total += core::var_bytes_size(script_.size());
    total += core::var_size(witnesses_.size());
    for (const auto& wit : witnesses_) total += wit.serialized_size();
    return total;
}

Transaction Transaction::deserialize(core::BinaryReader& r) {
    Transaction tx;
    tx.version_ = core::ser_read_u8(r);
    if (tx.version_ > CURRENT_VERSION) {
        throw core::FormatError("unsupported transaction version " +
                                std::to_string(tx.version_));
    }
    tx.nonce_ = core::ser_read_u32(r);
    tx.system_fee_ = core::ser_read_i64(r);
    tx.network_fee_ = core::ser_read_i64(r);
    if (tx.system_fee_ < 0 || tx.network_fee_ < 0) {
        throw core::FormatError("negative transaction fee");
    }
    tx.valid_until_block_ = core::ser_read_u32(r);

    tx.signers_ = core::ser_read_list<Signer>(r, MAX_TRANSACTION_ATTRIBUTES);
    if (tx.signers_.empty()) {
        throw core::FormatError("transaction has no signers");
    }
    std::set<core::uint160> seen;
    for (const auto& s : tx.signers_) {
        if (!seen.insert(s.script_hash()).second) {
            throw core::FormatError("duplicate signer 0x" +
                                    s.script_hash().to_hex());
        }
    }

    tx.attributes_ = core::ser_read_list<TransactionAttribute>(
        r, MAX_TRANSACTION_ATTRIBUTES - tx.signers_.size());
    std::set<TransactionAttributeType> kinds;
    for (const auto& a : tx.attributes_) {
        if (!kinds.insert(a.type()).second) {
            throw core::FormatError("duplicate transaction attribute " +
                                    a.to_string());
        }
    }

    tx.script_ = core::ser_read_var_bytes(r, MAX_SCRIPT_SIZE);
    if (tx.script_.empty()) {
        throw core::FormatError("transaction script is empty");
    }

    if (!r.eof()) {
        tx.witnesses_ = core::ser_read_list<Witness>(r, tx.signers_.size());
        if (tx.witnesses_.size() != tx.signers_.size()) {
            throw core::FormatError(
                std::to_string(tx.witnesses_.size()) + " witnesses for " +
                std::to_string(tx.signers_.size()) + " signers");
        }
    }
    return tx;
}

core::Result<Transaction> Transaction::from_bytes(
    std::span<const uint8_t> data) {
    auto result = core::decode_bytes(data, [](core::BinaryReader& r) {
        return Transaction::deserialize(r);
    });
    if (!result.ok()) {
        LOG_DEBUG(core::LogCategory::CODEC,
                  "transaction decode failed: " + result.error().message());
    }
    return result;
}

// ---------------------------------------------------------------------------
// Broadcast
// ---------------------------------------------------------------------------

core::Result<core::uint256> Transaction::send(rpc::Provider& provider) {
    if (!is_signed()) {
        return core::Error(core::ErrorCode::TX_NOT_SIGNED,
                           std::to_string(witnesses_.size()) +
                           " witnesses for " +
                           std::to_string(signers_.size()) + " signers");
    }
    size_t tx_size = size();
    if (tx_size > MAX_TRANSACTION_SIZE) {
        return core::Error(core::ErrorCode::TX_TOO_LARGE,
                           "transaction is " + std::to_string(tx_size) +
                           " bytes, max " +
                           std::to_string(MAX_TRANSACTION_SIZE));
    }

    auto height = provider.get_block_count();
    if (!height.ok()) return rpc::delegated(height.error(), "get_block_count");

    auto sent = provider.send_raw_transaction(to_bytes());
    if (!sent.ok()) return rpc::delegated(sent.error(), "send_raw_transaction");

    block_count_when_sent_ = height.value();
    LOG_INFO(core::LogCategory::TX,
             "sent transaction 0x" + hash().to_hex() + " at block " +
             std::to_string(height.value()));
    return sent.value();
}

bool Transaction::operator==(const Transaction& other) const {
    return version_ == other.version_ && nonce_ == other.nonce_ &&
           valid_until_block_ == other.valid_until_block_ &&
           signers_ == other.signers_ && system_fee_ == other.system_fee_ &&
           network_fee_ == other.network_fee_ &&
           attributes_ == other.attributes_ && script_ == other.script_ &&
           witnesses_ == other.witnesses_;
}

} // namespace primitives
