#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/config.h"
#include "core/error.h"
#include "core/types.h"
#include "primitives/signer.h"
#include "primitives/transaction.h"
#include "primitives/transaction_attribute.h"
#include "rpc/provider.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace wallet {

// ---------------------------------------------------------------------------
// TransactionBuilder -- configure, validate, price and sign a transaction
// ---------------------------------------------------------------------------
// The provider is consulted only inside build_unsigned() and sign():
//   - block count, for the default valid-until-block
//   - committee, when a HighPriority attribute is present
//   - invoke_script, for the system fee
//   - calculate_network_fee, over the transaction with placeholder
//     witnesses of the final shape
//   - GAS balance of the sender, when a fee consumer or fee error is set
//   - network magic, when signing
// Provider failures come back as PROVIDER_ERROR.
// ---------------------------------------------------------------------------
class TransactionBuilder {
public:
    /// Receives (required fee, sender balance) when the balance is short.
    using FeeConsumer = std::function<void(int64_t, int64_t)>;

    explicit TransactionBuilder(rpc::Provider& provider,
                                core::NetworkSettings settings = {});

    // -- Configuration ------------------------------------------------------

    TransactionBuilder& version(uint8_t v);
    TransactionBuilder& nonce(uint32_t n);
    TransactionBuilder& valid_until_block(uint32_t height);

    /// Replace the signer list.  The first signer pays the fees.
    TransactionBuilder& signers(std::vector<primitives::Signer> signers);

    /// Move the signer with @p hash to the front.  CONFIG_INVALID_ARG if no
    /// signer has that hash.
    core::Result<void> first_signer(const core::uint160& hash);

    TransactionBuilder& attributes(
        std::vector<primitives::TransactionAttribute> attrs);
    TransactionBuilder& script(std::vector<uint8_t> script);
    /// Append to the current script.
    TransactionBuilder& extend_script(std::span<const uint8_t> script);

    TransactionBuilder& additional_system_fee(int64_t fee);
    TransactionBuilder& additional_network_fee(int64_t fee);

    /// Advisory callback for an insufficient sender balance.  Clears any
    /// fee error.
    TransactionBuilder& fee_consumer(FeeConsumer consumer);
    /// Fail build_unsigned() with @p err on an insufficient sender balance.
    /// Clears any fee consumer.
    TransactionBuilder& fee_error(core::Error err);

    [[nodiscard]] const std::vector<primitives::Signer>& signers() const noexcept {
        return signers_;
    }
    [[nodiscard]] const std::vector<uint8_t>& script() const noexcept {
        return script_;
    }
    [[nodiscard]] uint32_t nonce() const noexcept { return nonce_; }

    // -- Assembly -----------------------------------------------------------

    core::Result<primitives::Transaction> build_unsigned();

    /// build_unsigned() plus one witness per signer, in signer order.
    core::Result<primitives::Transaction> sign();

private:
    core::Result<void> validate() const;
    core::Result<void> check_committee();
    core::Result<std::vector<primitives::Witness>> placeholder_witnesses() const;
    core::Result<void> check_sender_balance(int64_t required);

    rpc::Provider&                               provider_;
    core::NetworkSettings                        settings_;

    uint8_t                                      version_ = primitives::Transaction::CURRENT_VERSION;
    uint32_t                                     nonce_;
    std::optional<uint32_t>                      valid_until_block_;
    std::vector<primitives::Signer>              signers_;
    std::vector<primitives::TransactionAttribute> attributes_;
    std::vector<uint8_t>                         script_;
    int64_t                                      additional_system_fee_ = 0;
    int64_t                                      additional_network_fee_ = 0;
    FeeConsumer                                  fee_consumer_;
    std::optional<core::Error>                   fee_error_;
};

} // namespace wallet
