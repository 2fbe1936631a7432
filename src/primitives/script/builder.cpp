// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/script/builder.h"

#include "core/logging.h"
#include "core/serialize.h"
#include "crypto/hash.h"

#include <algorithm>

namespace primitives::script {

// ---------------------------------------------------------------------------
// Raw emitters
// ---------------------------------------------------------------------------

ScriptBuilder& ScriptBuilder::op_code(Opcode op) {
    core::ser_write_u8(buf_, static_cast<uint8_t>(op));
    return *this;
}

ScriptBuilder& ScriptBuilder::op_code(std::initializer_list<Opcode> ops) {
    for (auto op : ops) op_code(op);
    return *this;
}

ScriptBuilder& ScriptBuilder::op_code(Opcode op,
                                      std::span<const uint8_t> operand) {
    op_code(op);
    core::ser_write_bytes(buf_, operand);
    return *this;
}

ScriptBuilder& ScriptBuilder::sys_call(InteropService svc) {
    auto tag = interop_tag(svc);
    return op_code(Opcode::SYSCALL, tag);
}

ScriptBuilder& ScriptBuilder::push_data(std::span<const uint8_t> data) {
    if (data.size() <= 0xFF) {
        op_code(Opcode::PUSHDATA1);
        core::ser_write_u8(buf_, static_cast<uint8_t>(data.size()));
    } else if (data.size() <= 0xFFFF) {
        op_code(Opcode::PUSHDATA2);
        core::ser_write_u16(buf_, static_cast<uint16_t>(data.size()));
    } else {
        op_code(Opcode::PUSHDATA4);
        core::ser_write_u32(buf_, static_cast<uint32_t>(data.size()));
    }
    core::ser_write_bytes(buf_, data);
    return *this;
}

ScriptBuilder& ScriptBuilder::push_data(std::string_view utf8) {
    return push_data(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(utf8.data()), utf8.size()));
}

ScriptBuilder& ScriptBuilder::push_bool(bool value) {
    return op_code(value ? Opcode::PUSHT : Opcode::PUSHF);
}

ScriptBuilder& ScriptBuilder::pack() {
    return op_code(Opcode::PACK);
}

// ---------------------------------------------------------------------------
// Integers
// ---------------------------------------------------------------------------

core::Result<void> ScriptBuilder::push_integer(const core::BigInt& value) {
    if (auto small = value.to_int64(); small && *small >= -1 && *small <= 16) {
        op_code(encode_small_int(static_cast<int>(*small)));
        return core::make_ok();
    }

    auto bytes = value.to_le_bytes();
    static constexpr size_t WIDTHS[] = {1, 2, 4, 8, 16, 32};
    static constexpr Opcode OPS[] = {
        Opcode::PUSHINT8,  Opcode::PUSHINT16,  Opcode::PUSHINT32,
        Opcode::PUSHINT64, Opcode::PUSHINT128, Opcode::PUSHINT256,
    };

    for (size_t i = 0; i < std::size(WIDTHS); ++i) {
        if (bytes.size() > WIDTHS[i]) continue;
        bytes.resize(WIDTHS[i], value.is_negative() ? 0xFF : 0x00);
        op_code(OPS[i], bytes);
        return core::make_ok();
    }

    return core::Error(core::ErrorCode::SCRIPT_INT_TOO_LARGE,
                       "integer " + value.to_string() +
                       " does not fit in 256 bits");
}

// ---------------------------------------------------------------------------
// Parameters
// ---------------------------------------------------------------------------
// Compound pushes are staged in a scratch builder so a failure deep inside
// an array or map leaves this builder unchanged.

core::Result<void> ScriptBuilder::push_param(const ContractParameter& param) {
    switch (param.type()) {
    case ContractParameterType::ANY:
        op_code(Opcode::PUSHNULL);
        return core::make_ok();
    case ContractParameterType::BOOLEAN:
        push_bool(*param.as_bool());
        return core::make_ok();
    case ContractParameterType::INTEGER:
        return push_integer(*param.as_integer());
    case ContractParameterType::BYTE_ARRAY:
    case ContractParameterType::STRING:
    case ContractParameterType::HASH160:
    case ContractParameterType::HASH256:
    case ContractParameterType::PUBLIC_KEY:
    case ContractParameterType::SIGNATURE:
        push_data(param.push_bytes());
        return core::make_ok();
    case ContractParameterType::ARRAY:
        return push_array(*param.as_array());
    case ContractParameterType::MAP:
        return push_map(*param.as_map());
    }
    return core::Error(core::ErrorCode::SCRIPT_INVALID,
                       "unsupported parameter type");
}

core::Result<void> ScriptBuilder::push_params(
    std::span<const ContractParameter> params) {
    ScriptBuilder scratch;
    for (const auto& p : params) {
        N3TX_TRY_VOID(scratch.push_param(p));
    }
    N3TX_TRY_VOID(scratch.push_integer(
        core::BigInt(static_cast<int64_t>(params.size()))));
    scratch.pack();
    core::ser_write_bytes(buf_, scratch.bytes());
    return core::make_ok();
}

core::Result<void> ScriptBuilder::push_array(
    std::span<const ContractParameter> items) {
    if (items.empty()) {
        op_code(Opcode::NEWARRAY0);
        return core::make_ok();
    }
    return push_params(items);
}

core::Result<void> ScriptBuilder::push_map(
    const ContractParameter::MapEntries& entries) {
    ScriptBuilder scratch;
    for (const auto& [key, value] : entries) {
        N3TX_TRY_VOID(scratch.push_param(value));
        N3TX_TRY_VOID(scratch.push_param(key));
    }
    N3TX_TRY_VOID(scratch.push_integer(
        core::BigInt(static_cast<int64_t>(entries.size()))));
    scratch.op_code(Opcode::PACKMAP);
    core::ser_write_bytes(buf_, scratch.bytes());
    return core::make_ok();
}

core::Result<void> ScriptBuilder::contract_call(
    const core::uint160& contract_hash,
    std::string_view method,
    std::span<const ContractParameter> params,
    CallFlags flags) {
    ScriptBuilder scratch;
    if (params.empty()) {
        scratch.op_code(Opcode::NEWARRAY0);
    } else {
        N3TX_TRY_VOID(scratch.push_params(params));
    }
    N3TX_TRY_VOID(scratch.push_integer(
        core::BigInt(static_cast<int64_t>(flags))));
    scratch.push_data(method);
    scratch.push_data(contract_hash.span());
    scratch.sys_call(InteropService::CONTRACT_CALL);

    core::ser_write_bytes(buf_, scratch.bytes());
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Script templates
// ---------------------------------------------------------------------------

std::vector<uint8_t> build_verification_script(const crypto::PublicKey& key) {
    ScriptBuilder sb;
    sb.push_data(key).sys_call(InteropService::CRYPTO_CHECK_SIG);
    return sb.to_bytes();
}

core::Result<std::vector<uint8_t>> build_multisig_script(
    std::vector<crypto::PublicKey> keys, int threshold) {
    int n = static_cast<int>(keys.size());
    if (n < 1 || n > MAX_MULTISIG_KEYS) {
        return core::Error(core::ErrorCode::CONFIG_MULTISIG,
                           "multi-sig needs 1.." +
                           std::to_string(MAX_MULTISIG_KEYS) +
                           " keys, got " + std::to_string(n));
    }
    if (threshold < 1 || threshold > n) {
        return core::Error(core::ErrorCode::CONFIG_MULTISIG,
                           "signing threshold " + std::to_string(threshold) +
                           " out of range 1.." + std::to_string(n));
    }

    // Lexicographic order of the encoded keys makes the script, and hence
    // the account hash, independent of input order.
    std::sort(keys.begin(), keys.end());

    ScriptBuilder sb;
    N3TX_TRY_VOID(sb.push_integer(core::BigInt(threshold)));
    for (const auto& key : keys) sb.push_data(key);
    N3TX_TRY_VOID(sb.push_integer(core::BigInt(n)));
    sb.sys_call(InteropService::CRYPTO_CHECK_MULTISIG);
    return sb.to_bytes();
}

core::Result<std::vector<uint8_t>> build_contract_script(
    const core::uint160& contract_hash, std::string_view method,
    std::span<const ContractParameter> params, CallFlags flags) {
    ScriptBuilder sb;
    N3TX_TRY_VOID(sb.contract_call(contract_hash, method, params, flags));
    return sb.to_bytes();
}

core::Result<std::vector<uint8_t>> build_contract_call_and_unwrap_iterator(
    const core::uint160& contract_hash, std::string_view method,
    std::span<const ContractParameter> params,
    uint32_t max_items, CallFlags flags) {
    ScriptBuilder sb;
    N3TX_TRY_VOID(sb.push_integer(core::BigInt(static_cast<int64_t>(max_items))));
    N3TX_TRY_VOID(sb.contract_call(contract_hash, method, params, flags));

    // Stack: [max, iterator, results]
    sb.op_code(Opcode::NEWARRAY0);

    size_t cycle_start = sb.size();
    sb.op_code(Opcode::OVER).sys_call(InteropService::ITERATOR_NEXT);

    size_t jmp_if_not = sb.size();
    const uint8_t placeholder[1] = {0x00};
    sb.op_code(Opcode::JMPIFNOT, placeholder);

    sb.op_code({Opcode::DUP, Opcode::PUSH2, Opcode::PICK})
      .sys_call(InteropService::ITERATOR_VALUE)
      .op_code({Opcode::APPEND, Opcode::DUP, Opcode::SIZE,
                Opcode::PUSH3, Opcode::PICK, Opcode::GE});

    size_t jmp_if_max = sb.size();
    sb.op_code(Opcode::JMPIF, placeholder);

    size_t jmp_back = sb.size();
    const uint8_t back[1] = {static_cast<uint8_t>(
        static_cast<int8_t>(static_cast<long>(cycle_start) -
                            static_cast<long>(jmp_back)))};
    sb.op_code(Opcode::JMP, back);

    size_t load_result = sb.size();
    sb.op_code({Opcode::NIP, Opcode::NIP});

    // Jump operands are relative to the jump instruction itself.
    auto script = sb.to_bytes();
    script[jmp_if_not + 1] = static_cast<uint8_t>(
        static_cast<int8_t>(load_result - jmp_if_not));
    script[jmp_if_max + 1] = static_cast<uint8_t>(
        static_cast<int8_t>(load_result - jmp_if_max));

    LOG_TRACE(core::LogCategory::SCRIPT,
              "iterator unwrap script for " + std::string(method) + ": " +
              std::to_string(script.size()) + " bytes");
    return script;
}

core::Result<std::vector<uint8_t>> build_contract_hash_script(
    const core::uint160& sender, uint32_t nef_checksum, std::string_view name) {
    ScriptBuilder sb;
    sb.op_code(Opcode::ABORT).push_data(sender.span());
    N3TX_TRY_VOID(sb.push_integer(core::BigInt(static_cast<int64_t>(nef_checksum))));
    sb.push_data(name);
    return sb.to_bytes();
}

core::uint160 script_hash(std::span<const uint8_t> script) {
    return crypto::hash160(script);
}

} // namespace primitives::script
