#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef N3TX_RPC_PROVIDER_H
#define N3TX_RPC_PROVIDER_H

#include "core/error.h"
#include "core/types.h"
#include "crypto/secp256r1.h"
#include "primitives/signer.h"
#include "primitives/stack_item.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rpc {

// ---------------------------------------------------------------------------
// InvocationResult -- outcome of a test invocation
// ---------------------------------------------------------------------------
struct InvocationResult {
    std::string                         state;          // "HALT" or "FAULT"
    int64_t                             gas_consumed = 0;
    std::string                         exception;
    std::vector<primitives::StackItem>  stack;

    [[nodiscard]] bool has_fault() const {
        return state.find("FAULT") != std::string::npos;
    }
};

// ---------------------------------------------------------------------------
// Provider -- node access used by transaction assembly
// ---------------------------------------------------------------------------
// The transport (JSON-RPC over HTTP, an in-process node, a test double) is
// the implementation's concern.  Calls are synchronous.  Implementations
// report failures as errors; callers wrap them with delegated() so they
// surface as PROVIDER_ERROR.
// ---------------------------------------------------------------------------
class Provider {
public:
    virtual ~Provider() = default;

    /// Height of the next block to be persisted.
    virtual core::Result<uint32_t> get_block_count() = 0;

    virtual core::Result<uint32_t> get_network_magic() = 0;

    /// Public keys of the current committee.
    virtual core::Result<std::vector<crypto::PublicKey>> get_committee() = 0;

    /// Test-run @p script with @p signers attached; gas_consumed is the
    /// system fee the script needs.
    virtual core::Result<InvocationResult> invoke_script(
        std::span<const uint8_t> script,
        std::span<const primitives::Signer> signers) = 0;

    /// Network fee for the serialized transaction, whose witnesses may be
    /// placeholders of the right shape.
    virtual core::Result<int64_t> calculate_network_fee(
        std::span<const uint8_t> tx_bytes) = 0;

    /// GAS balance of @p account in fractions (10^-8 GAS).
    virtual core::Result<int64_t> get_gas_balance(
        const core::uint160& account) = 0;

    /// Broadcast; returns the transaction hash the node computed.
    virtual core::Result<core::uint256> send_raw_transaction(
        std::span<const uint8_t> tx_bytes) = 0;
};

/// Rewrap a provider failure as PROVIDER_ERROR, naming the call.  Errors
/// already carrying PROVIDER_ERROR keep their message.
core::Error delegated(const core::Error& err, std::string_view call);

} // namespace rpc

#endif // N3TX_RPC_PROVIDER_H
