#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/bigint.h"
#include "core/error.h"
#include "core/stream.h"
#include "core/types.h"
#include "crypto/secp256r1.h"
#include "primitives/contract_parameter.h"
#include "primitives/script/interop.h"
#include "primitives/script/opcodes.h"

#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>
#include <vector>

namespace primitives::script {

/// Upper bound on keys in a multi-signature verification script.
inline constexpr int MAX_MULTISIG_KEYS = 1024;

/// Default number of items the iterator-unwrap script collects.
inline constexpr uint32_t DEFAULT_ITERATOR_COUNT = 100;

// ---------------------------------------------------------------------------
// CallFlags -- permissions granted to a contract call
// ---------------------------------------------------------------------------
enum class CallFlags : uint8_t {
    NONE         = 0x00,
    READ_STATES  = 0x01,
    WRITE_STATES = 0x02,
    ALLOW_CALL   = 0x04,
    ALLOW_NOTIFY = 0x08,
    STATES       = READ_STATES | WRITE_STATES,
    READ_ONLY    = READ_STATES | ALLOW_CALL,
    ALL          = STATES | ALLOW_CALL | ALLOW_NOTIFY,
};

// ---------------------------------------------------------------------------
// ScriptBuilder -- emits N3 VM bytecode
// ---------------------------------------------------------------------------
// Infallible emitters return the builder for chaining.  Emitters that can
// reject their input (integers wider than 256 bits, unsupported parameter
// shapes) return core::Result<void> and leave the buffer untouched on
// failure.
// ---------------------------------------------------------------------------
class ScriptBuilder {
public:
    ScriptBuilder() = default;

    /// Append raw opcode bytes.
    ScriptBuilder& op_code(Opcode op);
    ScriptBuilder& op_code(std::initializer_list<Opcode> ops);

    /// Append an opcode followed by its raw operand bytes.
    ScriptBuilder& op_code(Opcode op, std::span<const uint8_t> operand);

    /// SYSCALL with the service's 4-byte tag.
    ScriptBuilder& sys_call(InteropService svc);

    /// PUSHDATA1/2/4 with the shortest length prefix.
    ScriptBuilder& push_data(std::span<const uint8_t> data);
    ScriptBuilder& push_data(std::string_view utf8);

    ScriptBuilder& push_bool(bool value);

    /// PUSHM1..PUSH16 for -1..16, otherwise PUSHINT8..PUSHINT256 with the
    /// value sign-padded to the smallest width that holds it.
    core::Result<void> push_integer(const core::BigInt& value);

    /// Push one parameter according to its kind.
    core::Result<void> push_param(const ContractParameter& param);

    /// Push each parameter in order, then the count and PACK.
    core::Result<void> push_params(std::span<const ContractParameter> params);

    /// NEWARRAY0 for an empty array, push_params() otherwise.
    core::Result<void> push_array(std::span<const ContractParameter> items);

    /// Value then key for each entry, then the count and PACKMAP.
    core::Result<void> push_map(const ContractParameter::MapEntries& entries);

    ScriptBuilder& pack();

    /// Parameters (or NEWARRAY0), call flags, method, contract hash and
    /// SYSCALL System.Contract.Call.
    core::Result<void> contract_call(const core::uint160& contract_hash,
                                     std::string_view method,
                                     std::span<const ContractParameter> params,
                                     CallFlags flags = CallFlags::ALL);

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }
    [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept {
        return buf_.bytes();
    }
    [[nodiscard]] std::vector<uint8_t> to_bytes() const { return buf_.bytes(); }

private:
    core::BinaryWriter buf_;
};

// ---------------------------------------------------------------------------
// Script templates
// ---------------------------------------------------------------------------

/// PUSHDATA1 33 <key> SYSCALL System.Crypto.CheckSig.
std::vector<uint8_t> build_verification_script(const crypto::PublicKey& key);

/// <threshold> <keys sorted by encoded bytes> <n> SYSCALL
/// System.Crypto.CheckMultisig.  Requires 1 <= threshold <= n <= 1024.
core::Result<std::vector<uint8_t>> build_multisig_script(
    std::vector<crypto::PublicKey> keys, int threshold);

/// A single contract call.
core::Result<std::vector<uint8_t>> build_contract_script(
    const core::uint160& contract_hash, std::string_view method,
    std::span<const ContractParameter> params,
    CallFlags flags = CallFlags::ALL);

/// Calls an iterator-returning method and collects at most @p max_items
/// of its values into an array left on the stack.
core::Result<std::vector<uint8_t>> build_contract_call_and_unwrap_iterator(
    const core::uint160& contract_hash, std::string_view method,
    std::span<const ContractParameter> params,
    uint32_t max_items = DEFAULT_ITERATOR_COUNT,
    CallFlags flags = CallFlags::READ_ONLY);

/// ABORT <sender> <nef checksum> <name>.  Its script hash is the hash of a
/// contract deployed by @p sender.
core::Result<std::vector<uint8_t>> build_contract_hash_script(
    const core::uint160& sender, uint32_t nef_checksum, std::string_view name);

/// RIPEMD160(SHA256(script)).
core::uint160 script_hash(std::span<const uint8_t> script);

} // namespace primitives::script
