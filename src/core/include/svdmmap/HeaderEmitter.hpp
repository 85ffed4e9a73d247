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

#ifndef SVDMMAP_HEADER_EMITTER_HPP
#define SVDMMAP_HEADER_EMITTER_HPP

#include "svdmmap/DeviceAssembler.hpp"
#include "svdmmap/GeneratorOptions.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace svdmmap {

// Writes a GeneratedDevice as a self-contained C++20 header.
//
// Per peripheral module the output contains, in order: enum classes, the
// register classes (storage, then snapshot reader, then staged writer), the
// inline bodies tying them together, the register block structure with its
// layout assertions, and the extern link declarations.
class HeaderEmitter {
public:
    HeaderEmitter(std::ostream& out, const GeneratorOptions& options);

    void emit(const GeneratedDevice& device);

private:
    void emit_module(const PeripheralModule& module);
    void emit_enum(const EnumTypeDef& def);
    void emit_register_class(const RegisterProtocol& reg);
    void emit_reader_class(const RegisterProtocol& reg);
    void emit_writer_class(const RegisterProtocol& reg);
    void emit_register_bodies(const RegisterProtocol& reg);
    void emit_enum_getter(const FieldCodec& field);
    void emit_layout(const PeripheralModule& module);
    void emit_links(const PeripheralModule& module);

    void emit_comment(const std::optional<std::string>& text, std::string_view indent);

    std::ostream& out_;
    const GeneratorOptions& options_;
    const PeripheralModule* enum_scope_ = nullptr;
};

// Convenience: render to a string
std::string emit_header(const GeneratedDevice& device, const GeneratorOptions& options = {});

} // namespace svdmmap

#endif // SVDMMAP_HEADER_EMITTER_HPP
