#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/bigint.h"
#include "core/error.h"
#include "core/stream.h"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace primitives::script {

// ---------------------------------------------------------------------------
// Push decoding
// ---------------------------------------------------------------------------
// Both readers consume exactly one instruction.  They throw
// core::FormatError when the instruction is not a push of the expected kind
// and core::OutOfBoundsError when the operand is truncated.

/// PUSHDATA1/2/4 and its payload.
std::vector<uint8_t> read_push_data(core::BinaryReader& r);

/// PUSHM1..PUSH16 or PUSHINT8..PUSHINT256.
core::BigInt read_push_int(core::BinaryReader& r);

// ---------------------------------------------------------------------------
// ScriptReader -- disassembly
// ---------------------------------------------------------------------------
class ScriptReader {
public:
    /// One instruction per line: the opcode name, then for fixed operands
    /// the operand hex, for prefixed operands the length and the data hex.
    /// SYSCALL operands are shown as the interop service name when known.
    /// Undefined opcodes or truncated operands are a PARSE_* error.
    static core::Result<std::string> to_opcode_string(
        std::span<const uint8_t> script);
};

} // namespace primitives::script
