// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/script/verification.h"

#include "core/serialize.h"
#include "primitives/script/builder.h"
#include "primitives/script/interop.h"
#include "primitives/script/opcodes.h"
#include "primitives/script/reader.h"

#include <algorithm>
#include <optional>

namespace primitives::script {

namespace {

constexpr size_t SINGLE_SIG_SIZE = 40;

struct MultisigLayout {
    int threshold = 0;
    std::vector<crypto::PublicKey> keys;
};

bool tag_matches(std::span<const uint8_t> bytes, InteropService svc) {
    auto tag = interop_tag(svc);
    return std::equal(bytes.begin(), bytes.end(), tag.begin(), tag.end());
}

// Full structural parse; any deviation yields nullopt.
std::optional<MultisigLayout> parse_multisig(std::span<const uint8_t> script) {
    core::BinaryReader r(script);
    MultisigLayout out;
    try {
        auto m = read_push_int(r).to_int64();
        if (!m || *m < 1 || *m > MAX_MULTISIG_KEYS) return std::nullopt;
        out.threshold = static_cast<int>(*m);

        // Key pushes run until the first non-PUSHDATA1 opcode, which is
        // rewound so the key count can be read from it.
        for (;;) {
            r.mark();
            if (r.eof() ||
                core::ser_read_u8(r) != static_cast<uint8_t>(Opcode::PUSHDATA1)) {
                r.reset();
                break;
            }
            if (core::ser_read_u8(r) != 33) return std::nullopt;
            out.keys.push_back(core::ser_read_encoded_ec_point(r));
        }

        auto n = read_push_int(r).to_int64();
        if (!n || *n != static_cast<int64_t>(out.keys.size())) {
            return std::nullopt;
        }
        if (out.threshold > *n) return std::nullopt;

        if (core::ser_read_u8(r) != static_cast<uint8_t>(Opcode::SYSCALL)) {
            return std::nullopt;
        }
        if (!tag_matches(r.take(4), InteropService::CRYPTO_CHECK_MULTISIG)) {
            return std::nullopt;
        }
        if (!r.eof()) return std::nullopt;
    } catch (const core::OutOfBoundsError&) {
        return std::nullopt;
    } catch (const core::FormatError&) {
        return std::nullopt;
    }
    return out;
}

core::Error not_standard() {
    return core::Error(core::ErrorCode::SCRIPT_INVALID,
                       "not a single-sig or multi-sig verification script");
}

} // namespace

VerificationScript VerificationScript::from_public_key(
    const crypto::PublicKey& key) {
    return VerificationScript(build_verification_script(key));
}

core::Result<VerificationScript> VerificationScript::from_multisig(
    std::vector<crypto::PublicKey> keys, int threshold) {
    N3TX_TRY_ASSIGN(script, build_multisig_script(std::move(keys), threshold));
    return VerificationScript(std::move(script));
}

bool VerificationScript::is_single_sig() const {
    if (script_.size() != SINGLE_SIG_SIZE) return false;
    if (script_[0] != static_cast<uint8_t>(Opcode::PUSHDATA1) ||
        script_[1] != 33 ||
        (script_[2] != 0x02 && script_[2] != 0x03) ||
        script_[35] != static_cast<uint8_t>(Opcode::SYSCALL)) {
        return false;
    }
    return tag_matches(std::span(script_).subspan(36, 4),
                       InteropService::CRYPTO_CHECK_SIG);
}

bool VerificationScript::is_multisig() const {
    return parse_multisig(script_).has_value();
}

core::Result<std::vector<crypto::PublicKey>>
VerificationScript::public_keys() const {
    if (is_single_sig()) {
        crypto::PublicKey key{};
        std::copy_n(script_.begin() + 2, key.size(), key.begin());
        return std::vector<crypto::PublicKey>{key};
    }
    if (auto layout = parse_multisig(script_)) {
        return std::move(layout->keys);
    }
    return not_standard();
}

core::Result<int> VerificationScript::signing_threshold() const {
    if (is_single_sig()) return 1;
    if (auto layout = parse_multisig(script_)) return layout->threshold;
    return not_standard();
}

core::Result<int> VerificationScript::nr_of_accounts() const {
    N3TX_TRY_ASSIGN(keys, public_keys());
    return static_cast<int>(keys.size());
}

core::uint160 VerificationScript::script_hash() const {
    return primitives::script::script_hash(script_);
}

void VerificationScript::serialize(core::BinaryWriter& w) const {
    core::ser_write_var_bytes(w, script_);
}

VerificationScript VerificationScript::deserialize(core::BinaryReader& r) {
    return VerificationScript(
        core::ser_read_var_bytes(r, MAX_VERIFICATION_SCRIPT));
}

} // namespace primitives::script
