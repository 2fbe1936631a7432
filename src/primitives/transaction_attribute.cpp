// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/transaction_attribute.h"

#include "core/serialize.h"

namespace primitives {

namespace {

bool is_known_response_code(uint8_t code) {
    switch (static_cast<OracleResponseCode>(code)) {
    case OracleResponseCode::SUCCESS:
    case OracleResponseCode::PROTOCOL_NOT_SUPPORTED:
    case OracleResponseCode::CONSENSUS_UNREACHABLE:
    case OracleResponseCode::NOT_FOUND:
    case OracleResponseCode::TIMEOUT:
    case OracleResponseCode::FORBIDDEN:
    case OracleResponseCode::RESPONSE_TOO_LARGE:
    case OracleResponseCode::INSUFFICIENT_FUNDS:
    case OracleResponseCode::CONTENT_TYPE_NOT_SUPPORTED:
    case OracleResponseCode::ERR:
        return true;
    }
    return false;
}

} // namespace

TransactionAttribute TransactionAttribute::oracle_response(
    uint64_t id, OracleResponseCode code, std::vector<uint8_t> result) {
    return TransactionAttribute(
        OracleResponseAttribute{id, code, std::move(result)});
}

TransactionAttributeType TransactionAttribute::type() const noexcept {
    return is_high_priority() ? TransactionAttributeType::HIGH_PRIORITY
                              : TransactionAttributeType::ORACLE_RESPONSE;
}

std::string TransactionAttribute::to_string() const {
    if (is_high_priority()) return "HighPriority";
    const auto& o = std::get<OracleResponseAttribute>(storage_);
    return "OracleResponse(id=" + std::to_string(o.id) + ", code=" +
           std::to_string(static_cast<int>(o.code)) + ", " +
           std::to_string(o.result.size()) + " bytes)";
}

void TransactionAttribute::serialize(core::BinaryWriter& w) const {
    core::ser_write_u8(w, static_cast<uint8_t>(type()));
    if (const auto* o = as_oracle_response()) {
        core::ser_write_u64(w, o->id);
        core::ser_write_u8(w, static_cast<uint8_t>(o->code));
        core::ser_write_var_bytes(w, o->result);
    }
}

TransactionAttribute TransactionAttribute::deserialize(core::BinaryReader& r) {
    uint8_t tag = core::ser_read_u8(r);
    switch (static_cast<TransactionAttributeType>(tag)) {
    case TransactionAttributeType::HIGH_PRIORITY:
        return high_priority();
    case TransactionAttributeType::ORACLE_RESPONSE: {
        uint64_t id = core::ser_read_u64(r);
        uint8_t code = core::ser_read_u8(r);
        if (!is_known_response_code(code)) {
            throw core::FormatError("unknown oracle response code " +
                                    std::to_string(code));
        }
        auto result = core::ser_read_var_bytes(r, MAX_ORACLE_RESULT_SIZE);
        if (code != static_cast<uint8_t>(OracleResponseCode::SUCCESS) &&
            !result.empty()) {
            throw core::FormatError("failed oracle response carries a result");
        }
        return oracle_response(id, static_cast<OracleResponseCode>(code),
                               std::move(result));
    }
    }
    throw core::FormatError("unknown transaction attribute type " +
                            std::to_string(tag));
}

} // namespace primitives
