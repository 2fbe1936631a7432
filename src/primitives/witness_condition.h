#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/stream.h"
#include "core/types.h"
#include "crypto/secp256r1.h"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace primitives {

/// Composite conditions (And/Or) may nest at most this deep.
inline constexpr int MAX_CONDITION_NESTING = 2;

/// Cap on the children of a composite condition, and on each of a signer's
/// allowed-contract, allowed-group and rule lists.
inline constexpr size_t MAX_SUBITEMS = 16;

enum class WitnessConditionType : uint8_t {
    BOOLEAN            = 0x00,
    NOT                = 0x01,
    AND                = 0x02,
    OR                 = 0x03,
    SCRIPT_HASH        = 0x18,
    GROUP              = 0x19,
    CALLED_BY_ENTRY    = 0x20,
    CALLED_BY_CONTRACT = 0x28,
    CALLED_BY_GROUP    = 0x29,
};

class WitnessCondition;

// ---------------------------------------------------------------------------
// Condition payloads
// ---------------------------------------------------------------------------

struct BooleanCondition          { bool value = false; };
struct NotCondition              { std::shared_ptr<const WitnessCondition> operand; };
struct AndCondition              { std::vector<WitnessCondition> expressions; };
struct OrCondition               { std::vector<WitnessCondition> expressions; };
struct ScriptHashCondition       { core::uint160 hash; };
struct GroupCondition            { crypto::PublicKey group{}; };
struct CalledByEntryCondition    {};
struct CalledByContractCondition { core::uint160 hash; };
struct CalledByGroupCondition    { crypto::PublicKey group{}; };

// ---------------------------------------------------------------------------
// WitnessCondition -- boolean expression evaluated by a WitnessRule
// ---------------------------------------------------------------------------
// Wire form: type byte, then
//   Boolean            bool byte
//   Not                one condition
//   And / Or           var-list of conditions (1..16)
//   ScriptHash         20 bytes
//   Group              33-byte compressed point
//   CalledByEntry      nothing
//   CalledByContract   20 bytes
//   CalledByGroup      33-byte compressed point
//
// Only And/Or add a nesting level; Not wraps its operand at the same level.
// Values are immutable once built, so Not shares its operand.
// ---------------------------------------------------------------------------
class WitnessCondition {
public:
    using List    = std::vector<WitnessCondition>;
    using Storage = std::variant<BooleanCondition, NotCondition, AndCondition,
                                 OrCondition, ScriptHashCondition,
                                 GroupCondition, CalledByEntryCondition,
                                 CalledByContractCondition,
                                 CalledByGroupCondition>;

    WitnessCondition() : storage_(BooleanCondition{}) {}

    static WitnessCondition boolean(bool value);
    static WitnessCondition negate(WitnessCondition operand);
    static WitnessCondition all_of(List expressions);
    static WitnessCondition any_of(List expressions);
    static WitnessCondition script_hash(const core::uint160& hash);
    static WitnessCondition group(const crypto::PublicKey& key);
    static WitnessCondition called_by_entry();
    static WitnessCondition called_by_contract(const core::uint160& hash);
    static WitnessCondition called_by_group(const crypto::PublicKey& key);

    [[nodiscard]] WitnessConditionType type() const noexcept;
    [[nodiscard]] const Storage& value() const noexcept { return storage_; }

    /// Number of nested Not/And/Or levels (0 for a leaf).
    [[nodiscard]] int nesting_depth() const;

    /// Depth and sub-item checks.  CONFIG_NESTING_DEPTH when Not/And/Or
    /// nest deeper than @p max_depth, CONFIG_TOO_MANY_ITEMS when a
    /// composite has more than MAX_SUBITEMS children, CONFIG_INVALID_ARG
    /// when it has none.
    core::Result<void> validate(int max_depth = MAX_CONDITION_NESTING) const;

    [[nodiscard]] std::string to_string() const;

    void serialize(core::BinaryWriter& w) const;
    static WitnessCondition deserialize(core::BinaryReader& r);

    /// Structural equality (identical wire form).
    bool operator==(const WitnessCondition& other) const;

private:
    explicit WitnessCondition(Storage s) : storage_(std::move(s)) {}

    static WitnessCondition deserialize_at(core::BinaryReader& r,
                                           int remaining_depth);

    Storage storage_;
};

// ---------------------------------------------------------------------------
// WitnessRule -- allow or deny when the condition holds
// ---------------------------------------------------------------------------
enum class WitnessAction : uint8_t {
    DENY  = 0,
    ALLOW = 1,
};

struct WitnessRule {
    WitnessAction    action = WitnessAction::DENY;
    WitnessCondition condition;

    void serialize(core::BinaryWriter& w) const;
    static WitnessRule deserialize(core::BinaryReader& r);

    bool operator==(const WitnessRule& other) const {
        return action == other.action && condition == other.condition;
    }
};

} // namespace primitives
