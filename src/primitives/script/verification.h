#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/stream.h"
#include "core/types.h"
#include "crypto/secp256r1.h"

#include <cstdint>
#include <span>
#include <vector>

namespace primitives::script {

/// Upper bound on the encoded length of a verification script.
inline constexpr uint64_t MAX_VERIFICATION_SCRIPT = 0x10000;

// ---------------------------------------------------------------------------
// VerificationScript -- the locking half of a witness
// ---------------------------------------------------------------------------
// Two standard shapes are recognised:
//
//   single-sig  PUSHDATA1 33 <key> SYSCALL System.Crypto.CheckSig
//   multi-sig   <m> (PUSHDATA1 33 <key>){n} <n> SYSCALL
//               System.Crypto.CheckMultisig,  1 <= m <= n <= 1024
//
// Anything else (including an empty script, used by contract witnesses) is
// carried opaquely; the introspection queries then report an error.
// ---------------------------------------------------------------------------
class VerificationScript {
public:
    VerificationScript() = default;
    explicit VerificationScript(std::vector<uint8_t> script)
        : script_(std::move(script)) {}

    static VerificationScript from_public_key(const crypto::PublicKey& key);
    static core::Result<VerificationScript> from_multisig(
        std::vector<crypto::PublicKey> keys, int threshold);

    [[nodiscard]] const std::vector<uint8_t>& script() const noexcept {
        return script_;
    }
    [[nodiscard]] bool empty() const noexcept { return script_.empty(); }

    [[nodiscard]] bool is_single_sig() const;
    [[nodiscard]] bool is_multisig() const;

    /// Keys in script order.
    core::Result<std::vector<crypto::PublicKey>> public_keys() const;
    /// 1 for single-sig, m for multi-sig.
    core::Result<int> signing_threshold() const;
    core::Result<int> nr_of_accounts() const;

    /// RIPEMD160(SHA256(script)).
    [[nodiscard]] core::uint160 script_hash() const;

    void serialize(core::BinaryWriter& w) const;
    static VerificationScript deserialize(core::BinaryReader& r);

    bool operator==(const VerificationScript& other) const = default;

private:
    std::vector<uint8_t> script_;
};

} // namespace primitives::script
