// Copyright © 2025 Robert Smallshire <robert@smallshire.org.uk>
//
// This file is part of SvdMmap.
//
// SvdMmap is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. SvdMmap is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with SvdMmap.
// If not, see <https://www.gnu.org/licenses/>.

#ifndef SVDMMAP_REGISTER_PROTOCOL_HPP
#define SVDMMAP_REGISTER_PROTOCOL_HPP

#include "svdmmap/DeviceModel.hpp"
#include "svdmmap/FieldCodec.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace svdmmap {

// Everything the header writer needs to emit the access classes of one
// register:
//
//   class Cr       : storage, derives svdmmap::Register<std::uint32_t>
//   class CrGet    : snapshot reader, unless the register is write-only
//   class CrUpdate : staged writer, unless the register is read-only
//
struct RegisterProtocol {
    std::string source_name;
    std::optional<std::string> description;
    uint32_t address_offset = 0;

    std::string type_name;    // Cr
    std::string member_name;  // cr, the slot name in the peripheral block
    std::string reader_name;  // CrGet
    std::string writer_name;  // CrUpdate

    bool has_reader = false;
    bool has_writer = false;

    // update() writes untouched bits as zero instead of reading them back.
    // Set for write-only registers, whose read value is undefined.
    bool zero_fill_by_default = false;

    // Bits covered by no field; always written as zero. Zero when the
    // register has no fields.
    uint32_t reserved_mask = 0;

    std::vector<FieldCodec> fields;
    std::vector<EnumTypeDef> enum_types;  // One per enumerated field, field order

    std::vector<const FieldCodec*> readable_fields() const;
    std::vector<const FieldCodec*> writable_fields() const;
};

// Throws UnsupportedBitWidth when any field has no storage type
RegisterProtocol make_register_protocol(const Register& reg);

} // namespace svdmmap

#endif // SVDMMAP_REGISTER_PROTOCOL_HPP
