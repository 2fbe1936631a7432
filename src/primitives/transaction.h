#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/stream.h"
#include "core/types.h"
#include "primitives/signer.h"
#include "primitives/transaction_attribute.h"
#include "primitives/witness.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace rpc { class Provider; }

namespace primitives {

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------
// Wire layout:
//
//   version u8 | nonce u32 | system_fee i64 | network_fee i64
//   | valid_until_block u32 | signers var-list | attributes var-list
//   | script var-bytes                               <- unsigned form ends
//   | witnesses var-list                              (signed form only)
//
// hash() is SHA256 of the unsigned form.  A signature covers
// sign_data(magic) = magic u32 LE ++ hash bytes.
// ---------------------------------------------------------------------------
class Transaction {
public:
    static constexpr uint8_t CURRENT_VERSION = 0;
    static constexpr size_t  MAX_TRANSACTION_SIZE = 102400;
    /// Signers plus attributes.
    static constexpr size_t  MAX_TRANSACTION_ATTRIBUTES = 16;
    static constexpr size_t  HEADER_SIZE = 1 + 4 + 8 + 8 + 4;
    static constexpr uint64_t MAX_SCRIPT_SIZE = 0xFFFF;

    // -- Construction -------------------------------------------------------

    Transaction() = default;

    Transaction(uint8_t version, uint32_t nonce, uint32_t valid_until_block,
                std::vector<Signer> signers, int64_t system_fee,
                int64_t network_fee,
                std::vector<TransactionAttribute> attributes,
                std::vector<uint8_t> script,
                std::vector<Witness> witnesses = {});

    // -- Accessors ----------------------------------------------------------

    [[nodiscard]] uint8_t  version() const noexcept { return version_; }
    [[nodiscard]] uint32_t nonce() const noexcept { return nonce_; }
    [[nodiscard]] uint32_t valid_until_block() const noexcept { return valid_until_block_; }
    [[nodiscard]] int64_t  system_fee() const noexcept { return system_fee_; }
    [[nodiscard]] int64_t  network_fee() const noexcept { return network_fee_; }
    [[nodiscard]] const std::vector<Signer>& signers() const noexcept { return signers_; }
    [[nodiscard]] const std::vector<TransactionAttribute>& attributes() const noexcept {
        return attributes_;
    }
    [[nodiscard]] const std::vector<uint8_t>& script() const noexcept { return script_; }
    [[nodiscard]] const std::vector<Witness>& witnesses() const noexcept { return witnesses_; }

    /// Hash of the first signer, which pays the fees.
    [[nodiscard]] const core::uint160& sender() const;

    /// True once there is one witness per signer.
    [[nodiscard]] bool is_signed() const noexcept {
        return !signers_.empty() && witnesses_.size() == signers_.size();
    }

    void set_system_fee(int64_t fee) { system_fee_ = fee; }
    void set_network_fee(int64_t fee) { network_fee_ = fee; }
    void add_witness(Witness witness) { witnesses_.push_back(std::move(witness)); }
    void set_witnesses(std::vector<Witness> witnesses) {
        witnesses_ = std::move(witnesses);
    }

    // -- Hashing ------------------------------------------------------------

    [[nodiscard]] core::uint256 hash() const;

    /// Bytes a witness signature covers on network @p magic.
    [[nodiscard]] std::vector<uint8_t> sign_data(uint32_t magic) const;

    // -- Serialization ------------------------------------------------------

    void serialize_unsigned(core::BinaryWriter& w) const;
    void serialize(core::BinaryWriter& w) const;

    [[nodiscard]] std::vector<uint8_t> unsigned_bytes() const;
    [[nodiscard]] std::vector<uint8_t> to_bytes() const;

    /// Encoded size of the signed form.
    [[nodiscard]] size_t size() const;

    /// Parses either form; an input ending after the script yields a
    /// transaction without witnesses.
    static Transaction deserialize(core::BinaryReader& r);
    static core::Result<Transaction> from_bytes(std::span<const uint8_t> data);

    // -- Broadcast ----------------------------------------------------------

    /// Broadcast through @p provider and remember the block count at that
    /// moment.  TX_NOT_SIGNED if witnesses are missing, TX_TOO_LARGE above
    /// MAX_TRANSACTION_SIZE.
    core::Result<core::uint256> send(rpc::Provider& provider);

    [[nodiscard]] std::optional<uint32_t> block_count_when_sent() const noexcept {
        return block_count_when_sent_;
    }

    /// Field-wise equality; the broadcast height is not compared.
    bool operator==(const Transaction& other) const;

private:
    uint8_t                            version_ = CURRENT_VERSION;
    uint32_t                           nonce_ = 0;
    uint32_t                           valid_until_block_ = 0;
    std::vector<Signer>                signers_;
    int64_t                            system_fee_ = 0;
    int64_t                            network_fee_ = 0;
    std::vector<TransactionAttribute>  attributes_;
    std::vector<uint8_t>               script_;
    std::vector<Witness>               witnesses_;
    std::optional<uint32_t>            block_count_when_sent_;
};

} // namespace primitives
