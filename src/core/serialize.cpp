// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/serialize.h"

// ---------------------------------------------------------------------------
// Explicit template instantiations for the two concrete stream types
// (BinaryWriter, BinaryReader).  Keeps the common instantiations in one
// object file and verifies that the templates compile for both streams.
// ---------------------------------------------------------------------------

namespace core {

// -------------------------------------------------------------------
// Var-int
// -------------------------------------------------------------------
template void     ser_write_var_int<BinaryWriter>(BinaryWriter&, uint64_t);
template uint64_t ser_read_var_int<BinaryReader>(BinaryReader&, uint64_t);

// -------------------------------------------------------------------
// Primitive writers
// -------------------------------------------------------------------
template void ser_write_u8<BinaryWriter>(BinaryWriter&, uint8_t);
template void ser_write_u16<BinaryWriter>(BinaryWriter&, uint16_t);
template void ser_write_u32<BinaryWriter>(BinaryWriter&, uint32_t);
template void ser_write_u64<BinaryWriter>(BinaryWriter&, uint64_t);
template void ser_write_i16<BinaryWriter>(BinaryWriter&, int16_t);
template void ser_write_i32<BinaryWriter>(BinaryWriter&, int32_t);
template void ser_write_i64<BinaryWriter>(BinaryWriter&, int64_t);
template void ser_write_bool<BinaryWriter>(BinaryWriter&, bool);
template void ser_write_bytes<BinaryWriter>(
    BinaryWriter&, std::span<const uint8_t>);

// -------------------------------------------------------------------
// Primitive readers
// -------------------------------------------------------------------
template uint8_t  ser_read_u8<BinaryReader>(BinaryReader&);
template uint16_t ser_read_u16<BinaryReader>(BinaryReader&);
template uint32_t ser_read_u32<BinaryReader>(BinaryReader&);
template uint64_t ser_read_u64<BinaryReader>(BinaryReader&);
template int16_t  ser_read_i16<BinaryReader>(BinaryReader&);
template int32_t  ser_read_i32<BinaryReader>(BinaryReader&);
template int64_t  ser_read_i64<BinaryReader>(BinaryReader&);
template bool     ser_read_bool<BinaryReader>(BinaryReader&);

// -------------------------------------------------------------------
// Var-bytes / var-string
// -------------------------------------------------------------------
template void ser_write_var_bytes<BinaryWriter>(
    BinaryWriter&, std::span<const uint8_t>);
template std::vector<uint8_t> ser_read_var_bytes<BinaryReader>(
    BinaryReader&, uint64_t);

template void        ser_write_var_string<BinaryWriter>(
    BinaryWriter&, std::string_view);
template std::string ser_read_var_string<BinaryReader>(
    BinaryReader&, uint64_t);

// -------------------------------------------------------------------
// Hashes
// -------------------------------------------------------------------
template void          ser_write_uint160<BinaryWriter>(
    BinaryWriter&, const core::uint160&);
template core::uint160 ser_read_uint160<BinaryReader>(BinaryReader&);

template void          ser_write_uint256<BinaryWriter>(
    BinaryWriter&, const core::uint256&);
template core::uint256 ser_read_uint256<BinaryReader>(BinaryReader&);

}  // namespace core
