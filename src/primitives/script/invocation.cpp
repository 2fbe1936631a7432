// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/script/invocation.h"

#include "core/serialize.h"
#include "primitives/script/builder.h"
#include "primitives/script/reader.h"

#include <algorithm>

namespace primitives::script {

InvocationScript InvocationScript::from_signature(const crypto::Signature& sig) {
    ScriptBuilder sb;
    sb.push_data(sig);
    return InvocationScript(sb.to_bytes());
}

InvocationScript InvocationScript::from_signatures(
    std::span<const crypto::Signature> sigs) {
    ScriptBuilder sb;
    for (const auto& sig : sigs) sb.push_data(sig);
    return InvocationScript(sb.to_bytes());
}

core::Result<InvocationScript> InvocationScript::from_message_and_key(
    std::span<const uint8_t> message, const crypto::ECKey& key) {
    N3TX_TRY_ASSIGN(sig, key.sign(message));
    return from_signature(sig);
}

core::Result<std::vector<crypto::Signature>>
InvocationScript::signatures() const {
    return core::decode_bytes(script_, [](core::BinaryReader& r) {
        std::vector<crypto::Signature> out;
        while (!r.eof()) {
            auto data = read_push_data(r);
            if (data.size() != crypto::Signature{}.size()) {
                throw core::FormatError("pushed " +
                                        std::to_string(data.size()) +
                                        " bytes where a signature was expected");
            }
            crypto::Signature sig{};
            std::copy(data.begin(), data.end(), sig.begin());
            out.push_back(sig);
        }
        return out;
    });
}

void InvocationScript::serialize(core::BinaryWriter& w) const {
    core::ser_write_var_bytes(w, script_);
}

InvocationScript InvocationScript::deserialize(core::BinaryReader& r) {
    return InvocationScript(core::ser_read_var_bytes(r, MAX_INVOCATION_SCRIPT));
}

} // namespace primitives::script
