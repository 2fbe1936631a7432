#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/stream.h"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace primitives {

enum class TransactionAttributeType : uint8_t {
    HIGH_PRIORITY   = 0x01,
    ORACLE_RESPONSE = 0x11,
};

enum class OracleResponseCode : uint8_t {
    SUCCESS                    = 0x00,
    PROTOCOL_NOT_SUPPORTED     = 0x10,
    CONSENSUS_UNREACHABLE      = 0x12,
    NOT_FOUND                  = 0x14,
    TIMEOUT                    = 0x16,
    FORBIDDEN                  = 0x18,
    RESPONSE_TOO_LARGE         = 0x1A,
    INSUFFICIENT_FUNDS         = 0x1C,
    CONTENT_TYPE_NOT_SUPPORTED = 0x1F,
    ERR                        = 0xFF,  // "ERROR" clashes with <windows.h>
};

/// Largest oracle result payload.
inline constexpr uint64_t MAX_ORACLE_RESULT_SIZE = 0xFFFF;

struct HighPriorityAttribute {
    bool operator==(const HighPriorityAttribute&) const = default;
};

struct OracleResponseAttribute {
    uint64_t             id   = 0;
    OracleResponseCode   code = OracleResponseCode::SUCCESS;
    std::vector<uint8_t> result;

    bool operator==(const OracleResponseAttribute&) const = default;
};

// ---------------------------------------------------------------------------
// TransactionAttribute
// ---------------------------------------------------------------------------
// Wire form: type byte, then
//   HighPriority     nothing (only committee members may attach it)
//   OracleResponse   id u64 | response code u8 | result var-bytes
// ---------------------------------------------------------------------------
class TransactionAttribute {
public:
    using Storage = std::variant<HighPriorityAttribute, OracleResponseAttribute>;

    TransactionAttribute(HighPriorityAttribute a)   : storage_(a) {}            // NOLINT
    TransactionAttribute(OracleResponseAttribute a) : storage_(std::move(a)) {} // NOLINT

    static TransactionAttribute high_priority() {
        return TransactionAttribute(HighPriorityAttribute{});
    }
    static TransactionAttribute oracle_response(uint64_t id,
                                                OracleResponseCode code,
                                                std::vector<uint8_t> result);

    [[nodiscard]] TransactionAttributeType type() const noexcept;
    [[nodiscard]] bool is_high_priority() const noexcept {
        return std::holds_alternative<HighPriorityAttribute>(storage_);
    }
    [[nodiscard]] const OracleResponseAttribute* as_oracle_response() const {
        return std::get_if<OracleResponseAttribute>(&storage_);
    }

    [[nodiscard]] std::string to_string() const;

    void serialize(core::BinaryWriter& w) const;
    static TransactionAttribute deserialize(core::BinaryReader& r);

    bool operator==(const TransactionAttribute&) const = default;

private:
    Storage storage_;
};

} // namespace primitives
