// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/script/opcodes.h"

#include <unordered_map>

namespace primitives::script {

// ---------------------------------------------------------------------------
// opcode_name  --  canonical display string for every Opcode value
// ---------------------------------------------------------------------------

std::string_view opcode_name(Opcode op) {
    switch (op) {
    // Constants
    case Opcode::PUSHINT8:      return "PUSHINT8";
    case Opcode::PUSHINT16:     return "PUSHINT16";
    case Opcode::PUSHINT32:     return "PUSHINT32";
    case Opcode::PUSHINT64:     return "PUSHINT64";
    case Opcode::PUSHINT128:    return "PUSHINT128";
    case Opcode::PUSHINT256:    return "PUSHINT256";
    case Opcode::PUSHT:         return "PUSHT";
    case Opcode::PUSHF:         return "PUSHF";
    case Opcode::PUSHA:         return "PUSHA";
    case Opcode::PUSHNULL:      return "PUSHNULL";
    case Opcode::PUSHDATA1:     return "PUSHDATA1";
    case Opcode::PUSHDATA2:     return "PUSHDATA2";
    case Opcode::PUSHDATA4:     return "PUSHDATA4";
    case Opcode::PUSHM1:        return "PUSHM1";
    case Opcode::PUSH0:         return "PUSH0";
    case Opcode::PUSH1:         return "PUSH1";
    case Opcode::PUSH2:         return "PUSH2";
    case Opcode::PUSH3:         return "PUSH3";
    case Opcode::PUSH4:         return "PUSH4";
    case Opcode::PUSH5:         return "PUSH5";
    case Opcode::PUSH6:         return "PUSH6";
    case Opcode::PUSH7:         return "PUSH7";
    case Opcode::PUSH8:         return "PUSH8";
    case Opcode::PUSH9:         return "PUSH9";
    case Opcode::PUSH10:        return "PUSH10";
    case Opcode::PUSH11:        return "PUSH11";
    case Opcode::PUSH12:        return "PUSH12";
    case Opcode::PUSH13:        return "PUSH13";
    case Opcode::PUSH14:        return "PUSH14";
    case Opcode::PUSH15:        return "PUSH15";
    case Opcode::PUSH16:        return "PUSH16";

    // Flow control
    case Opcode::NOP:           return "NOP";
    case Opcode::JMP:           return "JMP";
    case Opcode::JMP_L:         return "JMP_L";
    case Opcode::JMPIF:         return "JMPIF";
    case Opcode::JMPIF_L:       return "JMPIF_L";
    case Opcode::JMPIFNOT:      return "JMPIFNOT";
    case Opcode::JMPIFNOT_L:    return "JMPIFNOT_L";
    case Opcode::JMPEQ:         return "JMPEQ";
    case Opcode::JMPEQ_L:       return "JMPEQ_L";
    case Opcode::JMPNE:         return "JMPNE";
    case Opcode::JMPNE_L:       return "JMPNE_L";
    case Opcode::JMPGT:         return "JMPGT";
    case Opcode::JMPGT_L:       return "JMPGT_L";
    case Opcode::JMPGE:         return "JMPGE";
    case Opcode::JMPGE_L:       return "JMPGE_L";
    case Opcode::JMPLT:         return "JMPLT";
    case Opcode::JMPLT_L:       return "JMPLT_L";
    case Opcode::JMPLE:         return "JMPLE";
    case Opcode::JMPLE_L:       return "JMPLE_L";
    case Opcode::CALL:          return "CALL";
    case Opcode::CALL_L:        return "CALL_L";
    case Opcode::CALLA:         return "CALLA";
    case Opcode::CALLT:         return "CALLT";
    case Opcode::ABORT:         return "ABORT";
    case Opcode::ASSERT:        return "ASSERT";
    case Opcode::THROW:         return "THROW";
    case Opcode::TRY:           return "TRY";
    case Opcode::TRY_L:         return "TRY_L";
    case Opcode::ENDTRY:        return "ENDTRY";
    case Opcode::ENDTRY_L:      return "ENDTRY_L";
    case Opcode::ENDFINALLY:    return "ENDFINALLY";
    case Opcode::RET:           return "RET";
    case Opcode::SYSCALL:       return "SYSCALL";

    // Stack
    case Opcode::DEPTH:         return "DEPTH";
    case Opcode::DROP:          return "DROP";
    case Opcode::NIP:           return "NIP";
    case Opcode::XDROP:         return "XDROP";
    case Opcode::CLEAR:         return "CLEAR";
    case Opcode::DUP:           return "DUP";
    case Opcode::OVER:          return "OVER";
    case Opcode::PICK:          return "PICK";
    case Opcode::TUCK:          return "TUCK";
    case Opcode::SWAP:          return "SWAP";
    case Opcode::ROT:           return "ROT";
    case Opcode::ROLL:          return "ROLL";
    case Opcode::REVERSE3:      return "REVERSE3";
    case Opcode::REVERSE4:      return "REVERSE4";
    case Opcode::REVERSEN:      return "REVERSEN";

    // Slot
    case Opcode::INITSSLOT:     return "INITSSLOT";
    case Opcode::INITSLOT:      return "INITSLOT";
    case Opcode::LDSFLD0:       return "LDSFLD0";
    case Opcode::LDSFLD1:       return "LDSFLD1";
    case Opcode::LDSFLD2:       return "LDSFLD2";
    case Opcode::LDSFLD3:       return "LDSFLD3";
    case Opcode::LDSFLD4:       return "LDSFLD4";
    case Opcode::LDSFLD5:       return "LDSFLD5";
    case Opcode::LDSFLD6:       return "LDSFLD6";
    case Opcode::LDSFLD:        return "LDSFLD";
    case Opcode::STSFLD0:       return "STSFLD0";
    case Opcode::STSFLD1:       return "STSFLD1";
    case Opcode::STSFLD2:       return "STSFLD2";
    case Opcode::STSFLD3:       return "STSFLD3";
    case Opcode::STSFLD4:       return "STSFLD4";
    case Opcode::STSFLD5:       return "STSFLD5";
    case Opcode::STSFLD6:       return "STSFLD6";
    case Opcode::STSFLD:        return "STSFLD";
    case Opcode::LDLOC0:        return "LDLOC0";
    case Opcode::LDLOC1:        return "LDLOC1";
    case Opcode::LDLOC2:        return "LDLOC2";
    case Opcode::LDLOC3:        return "LDLOC3";
    case Opcode::LDLOC4:        return "LDLOC4";
    case Opcode::LDLOC5:        return "LDLOC5";
    case Opcode::LDLOC6:        return "LDLOC6";
    case Opcode::LDLOC:         return "LDLOC";
    case Opcode::STLOC0:        return "STLOC0";
    case Opcode::STLOC1:        return "STLOC1";
    case Opcode::STLOC2:        return "STLOC2";
    case Opcode::STLOC3:        return "STLOC3";
    case Opcode::STLOC4:        return "STLOC4";
    case Opcode::STLOC5:        return "STLOC5";
    case Opcode::STLOC6:        return "STLOC6";
    case Opcode::STLOC:         return "STLOC";
    case Opcode::LDARG0:        return "LDARG0";
    case Opcode::LDARG1:        return "LDARG1";
    case Opcode::LDARG2:        return "LDARG2";
    case Opcode::LDARG3:        return "LDARG3";
    case Opcode::LDARG4:        return "LDARG4";
    case Opcode::LDARG5:        return "LDARG5";
    case Opcode::LDARG6:        return "LDARG6";
    case Opcode::LDARG:         return "LDARG";
    case Opcode::STARG0:        return "STARG0";
    case Opcode::STARG1:        return "STARG1";
    case Opcode::STARG2:        return "STARG2";
    case Opcode::STARG3:        return "STARG3";
    case Opcode::STARG4:        return "STARG4";
    case Opcode::STARG5:        return "STARG5";
    case Opcode::STARG6:        return "STARG6";
    case Opcode::STARG:         return "STARG";

    // Splice
    case Opcode::NEWBUFFER:     return "NEWBUFFER";
    case Opcode::MEMCPY:        return "MEMCPY";
    case Opcode::CAT:           return "CAT";
    case Opcode::SUBSTR:        return "SUBSTR";
    case Opcode::LEFT:          return "LEFT";
    case Opcode::RIGHT:         return "RIGHT";

    // Bitwise logic
    case Opcode::INVERT:        return "INVERT";
    case Opcode::AND:           return "AND";
    case Opcode::OR:            return "OR";
    case Opcode::XOR:           return "XOR";
    case Opcode::EQUAL:         return "EQUAL";
    case Opcode::NOTEQUAL:      return "NOTEQUAL";

    // Arithmetic
    case Opcode::SIGN:          return "SIGN";
    case Opcode::ABS:           return "ABS";
    case Opcode::NEGATE:        return "NEGATE";
    case Opcode::INC:           return "INC";
    case Opcode::DEC:           return "DEC";
    case Opcode::ADD:           return "ADD";
    case Opcode::SUB:           return "SUB";
    case Opcode::MUL:           return "MUL";
    case Opcode::DIV:           return "DIV";
    case Opcode::MOD:           return "MOD";
    case Opcode::POW:           return "POW";
    case Opcode::SQRT:          return "SQRT";
    case Opcode::MODMUL:        return "MODMUL";
    case Opcode::MODPOW:        return "MODPOW";
    case Opcode::SHL:           return "SHL";
    case Opcode::SHR:           return "SHR";
    case Opcode::NOT:           return "NOT";
    case Opcode::BOOLAND:       return "BOOLAND";
    case Opcode::BOOLOR:        return "BOOLOR";
    case Opcode::NZ:            return "NZ";
    case Opcode::NUMEQUAL:      return "NUMEQUAL";
    case Opcode::NUMNOTEQUAL:   return "NUMNOTEQUAL";
    case Opcode::LT:            return "LT";
    case Opcode::LE:            return "LE";
    case Opcode::GT:            return "GT";
    case Opcode::GE:            return "GE";
    case Opcode::MIN:           return "MIN";
    case Opcode::MAX:           return "MAX";
    case Opcode::WITHIN:        return "WITHIN";

    // Compound types
    case Opcode::PACKMAP:       return "PACKMAP";
    case Opcode::PACKSTRUCT:    return "PACKSTRUCT";
    case Opcode::PACK:          return "PACK";
    case Opcode::UNPACK:        return "UNPACK";
    case Opcode::NEWARRAY0:     return "NEWARRAY0";
    case Opcode::NEWARRAY:      return "NEWARRAY";
    case Opcode::NEWARRAY_T:    return "NEWARRAY_T";
    case Opcode::NEWSTRUCT0:    return "NEWSTRUCT0";
    case Opcode::NEWSTRUCT:     return "NEWSTRUCT";
    case Opcode::NEWMAP:        return "NEWMAP";
    case Opcode::SIZE:          return "SIZE";
    case Opcode::HASKEY:        return "HASKEY";
    case Opcode::KEYS:          return "KEYS";
    case Opcode::VALUES:        return "VALUES";
    case Opcode::PICKITEM:      return "PICKITEM";
    case Opcode::APPEND:        return "APPEND";
    case Opcode::SETITEM:       return "SETITEM";
    case Opcode::REVERSEITEMS:  return "REVERSEITEMS";
    case Opcode::REMOVE:        return "REMOVE";
    case Opcode::CLEARITEMS:    return "CLEARITEMS";
    case Opcode::POPITEM:       return "POPITEM";

    // Types
    case Opcode::ISNULL:        return "ISNULL";
    case Opcode::ISTYPE:        return "ISTYPE";
    case Opcode::CONVERT:       return "CONVERT";

    // Extensions
    case Opcode::ABORTMSG:      return "ABORTMSG";
    case Opcode::ASSERTMSG:     return "ASSERTMSG";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Operand sizes
// ---------------------------------------------------------------------------

OperandSize operand_size(Opcode op) noexcept {
    switch (op) {
    case Opcode::PUSHINT8:      return {1, 0};
    case Opcode::PUSHINT16:     return {2, 0};
    case Opcode::PUSHINT32:     return {4, 0};
    case Opcode::PUSHINT64:     return {8, 0};
    case Opcode::PUSHINT128:    return {16, 0};
    case Opcode::PUSHINT256:    return {32, 0};
    case Opcode::PUSHA:         return {4, 0};
    case Opcode::PUSHDATA1:     return {0, 1};
    case Opcode::PUSHDATA2:     return {0, 2};
    case Opcode::PUSHDATA4:     return {0, 4};
    case Opcode::JMP:           return {1, 0};
    case Opcode::JMP_L:         return {4, 0};
    case Opcode::JMPIF:         return {1, 0};
    case Opcode::JMPIF_L:       return {4, 0};
    case Opcode::JMPIFNOT:      return {1, 0};
    case Opcode::JMPIFNOT_L:    return {4, 0};
    case Opcode::JMPEQ:         return {1, 0};
    case Opcode::JMPEQ_L:       return {4, 0};
    case Opcode::JMPNE:         return {1, 0};
    case Opcode::JMPNE_L:       return {4, 0};
    case Opcode::JMPGT:         return {1, 0};
    case Opcode::JMPGT_L:       return {4, 0};
    case Opcode::JMPGE:         return {1, 0};
    case Opcode::JMPGE_L:       return {4, 0};
    case Opcode::JMPLT:         return {1, 0};
    case Opcode::JMPLT_L:       return {4, 0};
    case Opcode::JMPLE:         return {1, 0};
    case Opcode::JMPLE_L:       return {4, 0};
    case Opcode::CALL:          return {1, 0};
    case Opcode::CALL_L:        return {4, 0};
    case Opcode::CALLT:         return {2, 0};
    case Opcode::TRY:           return {2, 0};
    case Opcode::TRY_L:         return {8, 0};
    case Opcode::ENDTRY:        return {1, 0};
    case Opcode::ENDTRY_L:      return {4, 0};
    case Opcode::SYSCALL:       return {4, 0};
    case Opcode::INITSSLOT:     return {1, 0};
    case Opcode::INITSLOT:      return {2, 0};
    case Opcode::LDSFLD:        return {1, 0};
    case Opcode::STSFLD:        return {1, 0};
    case Opcode::LDLOC:         return {1, 0};
    case Opcode::STLOC:         return {1, 0};
    case Opcode::LDARG:         return {1, 0};
    case Opcode::STARG:         return {1, 0};
    case Opcode::NEWARRAY_T:    return {1, 0};
    case Opcode::ISTYPE:        return {1, 0};
    case Opcode::CONVERT:       return {1, 0};
    default:                    return {};
    }
}

bool is_valid_opcode(uint8_t byte) noexcept {
    return opcode_name(static_cast<Opcode>(byte)) != "UNKNOWN";
}

// ---------------------------------------------------------------------------
// opcode_from_name  --  reverse lookup by canonical name
// ---------------------------------------------------------------------------

namespace detail {

struct NameMap {
    std::unordered_map<std::string_view, Opcode> map;

    NameMap() {
        for (int i = 0; i < 256; ++i) {
            auto byte = static_cast<uint8_t>(i);
            if (!is_valid_opcode(byte)) continue;
            auto op = static_cast<Opcode>(byte);
            map.emplace(opcode_name(op), op);
        }
    }
};

static const NameMap& name_map() {
    static const NameMap instance;
    return instance;
}

} // namespace detail

std::optional<Opcode> opcode_from_name(std::string_view name) {
    const auto& m = detail::name_map().map;
    auto it = m.find(name);
    if (it != m.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace primitives::script
