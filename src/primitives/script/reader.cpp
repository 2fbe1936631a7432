// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/script/reader.h"

#include "core/hex.h"
#include "core/serialize.h"
#include "primitives/script/interop.h"
#include "primitives/script/opcodes.h"

namespace primitives::script {

namespace {

size_t read_prefix(core::BinaryReader& r, uint8_t prefix) {
    switch (prefix) {
    case 1: return core::ser_read_u8(r);
    case 2: return core::ser_read_u16(r);
    case 4: return core::ser_read_u32(r);
    default:
        throw core::FormatError("unsupported operand prefix size " +
                                std::to_string(prefix));
    }
}

} // namespace

std::vector<uint8_t> read_push_data(core::BinaryReader& r) {
    auto op = static_cast<Opcode>(core::ser_read_u8(r));
    if (op != Opcode::PUSHDATA1 && op != Opcode::PUSHDATA2 &&
        op != Opcode::PUSHDATA4) {
        throw core::FormatError("expected PUSHDATA, found " +
                                std::string(opcode_name(op)));
    }
    size_t len = read_prefix(r, operand_size(op).prefix);
    return core::ser_read_bytes(r, len);
}

core::BigInt read_push_int(core::BinaryReader& r) {
    auto op = static_cast<Opcode>(core::ser_read_u8(r));
    if (auto small = decode_small_int(op)) {
        return core::BigInt(static_cast<int64_t>(*small));
    }
    if (op >= Opcode::PUSHINT8 && op <= Opcode::PUSHINT256) {
        auto bytes = r.take(operand_size(op).size);
        return core::BigInt::from_le_bytes(bytes);
    }
    throw core::FormatError("expected integer push, found " +
                            std::string(opcode_name(op)));
}

core::Result<std::string> ScriptReader::to_opcode_string(
    std::span<const uint8_t> script) {
    return core::decode_bytes(script, [](core::BinaryReader& r) {
        std::string out;
        while (!r.eof()) {
            uint8_t raw = core::ser_read_u8(r);
            if (!is_valid_opcode(raw)) {
                throw core::FormatError("undefined opcode 0x" +
                                        core::to_hex(std::span(&raw, 1)) +
                                        " at offset " +
                                        std::to_string(r.position() - 1));
            }
            auto op = static_cast<Opcode>(raw);
            out += opcode_name(op);

            auto operand = operand_size(op);
            if (op == Opcode::SYSCALL) {
                auto tag = r.take(4);
                auto svc = interop_from_tag(tag);
                out += ' ';
                out += svc ? std::string(interop_name(*svc))
                           : core::to_hex(tag);
            } else if (operand.size > 0) {
                out += ' ';
                out += core::to_hex(r.take(operand.size));
            } else if (operand.prefix > 0) {
                size_t len = read_prefix(r, operand.prefix);
                out += ' ' + std::to_string(len) + ' ' +
                       core::to_hex(r.take(len));
            }
            out += '\n';
        }
        return out;
    });
}

} // namespace primitives::script
