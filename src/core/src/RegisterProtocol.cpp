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

#include "svdmmap/RegisterProtocol.hpp"
#include "svdmmap/Inflect.hpp"

namespace svdmmap {

std::vector<const FieldCodec*> RegisterProtocol::readable_fields() const {
    std::vector<const FieldCodec*> result;
    if (!has_reader) {
        return result;
    }
    for (const auto& field : fields) {
        if (field.readable()) {
            result.push_back(&field);
        }
    }
    return result;
}

std::vector<const FieldCodec*> RegisterProtocol::writable_fields() const {
    std::vector<const FieldCodec*> result;
    if (!has_writer) {
        return result;
    }
    for (const auto& field : fields) {
        if (field.writable()) {
            result.push_back(&field);
        }
    }
    return result;
}

RegisterProtocol make_register_protocol(const Register& reg) {
    RegisterProtocol protocol;
    protocol.source_name = reg.name;
    protocol.description = reg.description;
    protocol.address_offset = reg.address_offset;

    protocol.type_name = type_identifier(reg.name);
    protocol.member_name = member_identifier(reg.name);
    protocol.reader_name = protocol.type_name + "Get";
    protocol.writer_name = protocol.type_name + "Update";

    protocol.has_reader = is_readable(reg.access);
    protocol.has_writer = is_writable(reg.access);
    protocol.zero_fill_by_default = reg.access == Access::WriteOnly;

    uint32_t covered = 0;
    for (const auto& field : reg.fields) {
        protocol.fields.emplace_back(field, reg.access);
        covered |= protocol.fields.back().word_mask();

        if (auto def = make_enum_type(field)) {
            protocol.enum_types.push_back(std::move(*def));
        }
    }
    protocol.reserved_mask = reg.fields.empty() ? 0 : ~covered;

    return protocol;
}

} // namespace svdmmap
