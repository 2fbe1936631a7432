#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/stream.h"
#include "crypto/secp256r1.h"

#include <cstdint>
#include <span>
#include <vector>

namespace primitives::script {

/// Upper bound on the encoded length of an invocation script.
inline constexpr uint64_t MAX_INVOCATION_SCRIPT = 0x10000;

// ---------------------------------------------------------------------------
// InvocationScript -- the unlocking half of a witness
// ---------------------------------------------------------------------------
// For signature witnesses this is a sequence of PUSHDATA1 64 <sig>; for
// contract witnesses it pushes the verify() arguments.
// ---------------------------------------------------------------------------
class InvocationScript {
public:
    InvocationScript() = default;
    explicit InvocationScript(std::vector<uint8_t> script)
        : script_(std::move(script)) {}

    static InvocationScript from_signature(const crypto::Signature& sig);
    static InvocationScript from_signatures(
        std::span<const crypto::Signature> sigs);

    /// Sign @p message with @p key and wrap the signature.
    static core::Result<InvocationScript> from_message_and_key(
        std::span<const uint8_t> message, const crypto::ECKey& key);

    [[nodiscard]] const std::vector<uint8_t>& script() const noexcept {
        return script_;
    }
    [[nodiscard]] bool empty() const noexcept { return script_.empty(); }

    /// Every 64-byte PUSHDATA1 in order.  Any other instruction is a
    /// PARSE_BAD_FORMAT error.
    core::Result<std::vector<crypto::Signature>> signatures() const;

    void serialize(core::BinaryWriter& w) const;
    static InvocationScript deserialize(core::BinaryReader& r);

    bool operator==(const InvocationScript& other) const = default;

private:
    std::vector<uint8_t> script_;
};

} // namespace primitives::script
