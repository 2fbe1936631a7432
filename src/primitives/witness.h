#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/stream.h"
#include "crypto/secp256r1.h"
#include "primitives/contract_parameter.h"
#include "primitives/script/invocation.h"
#include "primitives/script/verification.h"

#include <span>
#include <vector>

namespace primitives {

/// Proof that one signer authorized a transaction.
///
/// The invocation script pushes the proof (signatures, or contract verify
/// arguments) and the verification script checks it.  Serialized as two
/// var-bytes fields, invocation first.
class Witness {
public:
    Witness() = default;
    Witness(script::InvocationScript invocation,
            script::VerificationScript verification)
        : invocation_(std::move(invocation)),
          verification_(std::move(verification)) {}

    /// Sign @p message with @p key; single-sig verification script.
    static core::Result<Witness> create(std::span<const uint8_t> message,
                                        const crypto::ECKey& key);

    /// Multi-sig witness.  Takes the first signing_threshold() entries of
    /// @p signatures, which must already be in the script's key order.
    /// CONFIG_MULTISIG if @p verification is not multi-sig or too few
    /// signatures are supplied.
    static core::Result<Witness> create_multisig(
        const script::VerificationScript& verification,
        std::span<const crypto::Signature> signatures);

    /// As above, building the verification script from @p keys.
    static core::Result<Witness> create_multisig(
        int threshold, std::span<const crypto::Signature> signatures,
        std::vector<crypto::PublicKey> keys);

    /// Pushes @p verify_params; the verification script stays empty so the
    /// node runs the contract's verify method.
    static core::Result<Witness> create_contract_witness(
        std::span<const ContractParameter> verify_params);

    [[nodiscard]] const script::InvocationScript& invocation() const noexcept {
        return invocation_;
    }
    [[nodiscard]] const script::VerificationScript& verification() const noexcept {
        return verification_;
    }

    [[nodiscard]] size_t serialized_size() const;

    void serialize(core::BinaryWriter& w) const;
    static Witness deserialize(core::BinaryReader& r);

    bool operator==(const Witness&) const = default;

private:
    script::InvocationScript   invocation_;
    script::VerificationScript verification_;
};

} // namespace primitives
