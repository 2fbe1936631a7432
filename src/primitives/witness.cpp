// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/witness.h"

#include "core/logging.h"
#include "core/serialize.h"
#include "primitives/script/builder.h"

namespace primitives {

core::Result<Witness> Witness::create(std::span<const uint8_t> message,
                                      const crypto::ECKey& key) {
    N3TX_TRY_ASSIGN(invocation,
                    script::InvocationScript::from_message_and_key(message, key));
    return Witness(std::move(invocation),
                   script::VerificationScript::from_public_key(
                       key.pubkey_compressed()));
}

core::Result<Witness> Witness::create_multisig(
    const script::VerificationScript& verification,
    std::span<const crypto::Signature> signatures) {
    auto threshold = verification.signing_threshold();
    if (!threshold.ok() || !verification.is_multisig()) {
        return core::Error(core::ErrorCode::CONFIG_MULTISIG,
                           "verification script is not multi-sig");
    }
    size_t m = static_cast<size_t>(threshold.value());
    if (signatures.size() < m) {
        LOG_WARN(core::LogCategory::CONFIG,
                 "multi-sig witness needs " + std::to_string(m) +
                 " signatures, got " + std::to_string(signatures.size()));
        return core::Error(core::ErrorCode::CONFIG_MULTISIG,
                           "not enough signatures: need " + std::to_string(m) +
                           ", got " + std::to_string(signatures.size()));
    }
    return Witness(script::InvocationScript::from_signatures(
                       signatures.first(m)),
                   verification);
}

core::Result<Witness> Witness::create_multisig(
    int threshold, std::span<const crypto::Signature> signatures,
    std::vector<crypto::PublicKey> keys) {
    N3TX_TRY_ASSIGN(verification,
                    script::VerificationScript::from_multisig(std::move(keys),
                                                              threshold));
    return create_multisig(verification, signatures);
}

core::Result<Witness> Witness::create_contract_witness(
    std::span<const ContractParameter> verify_params) {
    script::ScriptBuilder sb;
    for (const auto& p : verify_params) {
        N3TX_TRY_VOID(sb.push_param(p));
    }
    return Witness(script::InvocationScript(sb.to_bytes()),
                   script::VerificationScript());
}

size_t Witness::serialized_size() const {
    return core::var_bytes_size(invocation_.script().size()) +
           core::var_bytes_size(verification_.script().size());
}

void Witness::serialize(core::BinaryWriter& w) const {
    invocation_.serialize(w);
    verification_.serialize(w);
}

Witness Witness::deserialize(core::BinaryReader& r) {
    auto invocation = script::InvocationScript::deserialize(r);
    auto verification = script::VerificationScript::deserialize(r);
    return Witness(std::move(invocation), std::move(verification));
}

} // namespace primitives
