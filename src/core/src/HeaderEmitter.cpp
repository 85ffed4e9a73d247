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

#include "svdmmap/HeaderEmitter.hpp"
#include "svdmmap/Errors.hpp"
#include "svdmmap/Inflect.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace svdmmap {

namespace {

constexpr std::string_view kWordType = "std::uint32_t";
constexpr std::string_view kIndent = "    ";

std::string offset_literal(uint64_t value) {
    std::ostringstream out;
    out << "0x" << std::hex << value;
    return out.str();
}

} // anonymous namespace

HeaderEmitter::HeaderEmitter(std::ostream& out, const GeneratorOptions& options)
    : out_(out)
    , options_(options) {}

void HeaderEmitter::emit(const GeneratedDevice& device) {
    out_ << "// Generated by svd-mmap from the " << device.device_name
         << " device description. Do not edit.\n";
    emit_comment(device.description, "");
    out_ << "\n#pragma once\n\n";
    out_ << "#include <" << options_.runtime_include << ">\n\n";
    out_ << "#include <cstddef>\n";
    out_ << "#include <cstdint>\n\n";

    out_ << "namespace " << device.namespace_name << " {\n";
    for (const auto& module : device.modules) {
        out_ << "\n";
        emit_module(module);
    }
    out_ << "\n} // namespace " << device.namespace_name << "\n";
}

void HeaderEmitter::emit_module(const PeripheralModule& module) {
    enum_scope_ = &module;

    emit_comment(module.description, "");
    out_ << "namespace " << module.namespace_name << " {\n";

    for (const auto& def : module.enum_types) {
        out_ << "\n";
        emit_enum(def);
    }

    if (!module.registers.empty()) {
        out_ << "\n";
    }
    for (const auto& reg : module.registers) {
        if (reg.has_reader) {
            out_ << "class " << reg.reader_name << ";\n";
        }
        if (reg.has_writer) {
            out_ << "class " << reg.writer_name << ";\n";
        }
    }

    for (const auto& reg : module.registers) {
        out_ << "\n";
        emit_register_class(reg);
        if (reg.has_reader) {
            out_ << "\n";
            emit_reader_class(reg);
        }
        if (reg.has_writer) {
            out_ << "\n";
            emit_writer_class(reg);
        }
        emit_register_bodies(reg);
    }

    out_ << "\n";
    emit_layout(module);
    out_ << "\n";
    emit_links(module);

    out_ << "\n} // namespace " << module.namespace_name << "\n";
    enum_scope_ = nullptr;
}

void HeaderEmitter::emit_enum(const EnumTypeDef& def) {
    out_ << "enum class " << def.type_name << " : " << def.underlying_type << " {\n";
    for (const auto& variant : def.variants) {
        emit_comment(variant.description, kIndent);
        out_ << kIndent << variant.name << " = " << hex_literal(variant.value) << ",\n";
    }
    out_ << "};\n";
}

void HeaderEmitter::emit_register_class(const RegisterProtocol& reg) {
    emit_comment(reg.description, "");
    out_ << "class " << reg.type_name << " : public svdmmap::Register<" << kWordType << "> {\n";
    out_ << "public:\n";

    if (reg.has_reader) {
        out_ << kIndent << reg.reader_name << " get() const noexcept;\n";
        for (const FieldCodec* field : reg.readable_fields()) {
            out_ << kIndent << field->value_type() << " " << field->accessor_name() << "() const";
            out_ << (field->enum_type_name() ? ";\n" : " noexcept;\n");
        }
    }

    if (reg.has_writer) {
        out_ << kIndent << reg.writer_name << " update() noexcept;\n";
        out_ << kIndent << reg.writer_name << " ignoring_state() noexcept;\n";
        for (const FieldCodec* field : reg.writable_fields()) {
            out_ << kIndent << reg.writer_name << " " << field->setter_name() << "("
                 << field->value_type() << " new_value) noexcept;\n";
        }
    }

    out_ << "};\n";
    out_ << "static_assert(sizeof(" << reg.type_name << ") == sizeof(" << kWordType << "));\n";
}

void HeaderEmitter::emit_reader_class(const RegisterProtocol& reg) {
    out_ << "class " << reg.reader_name << " : public svdmmap::RegisterSnapshot<"
         << reg.type_name << "> {\n";
    out_ << "public:\n";
    out_ << kIndent << "using RegisterSnapshot::RegisterSnapshot;\n";

    for (const FieldCodec* field : reg.readable_fields()) {
        out_ << "\n";
        emit_comment(field->description(), kIndent);
        if (field->enum_type_name()) {
            emit_enum_getter(*field);
            continue;
        }
        out_ << kIndent << field->value_type() << " " << field->accessor_name()
             << "() const noexcept {\n";
        out_ << kIndent << kIndent << "return " << field->decode_expression("bits()") << ";\n";
        out_ << kIndent << "}\n";
    }

    out_ << "};\n";
}

void HeaderEmitter::emit_enum_getter(const FieldCodec& field) {
    const std::string& type_name = *field.enum_type_name();

    const EnumTypeDef* def = nullptr;
    if (enum_scope_ != nullptr) {
        auto it = std::find_if(enum_scope_->enum_types.begin(), enum_scope_->enum_types.end(),
            [&](const EnumTypeDef& e) { return e.type_name == type_name; });
        if (it != enum_scope_->enum_types.end()) {
            def = &*it;
        }
    }
    if (def == nullptr) {
        throw GenerationError("No enumerated type " + type_name + " for field " + field.name());
    }

    out_ << kIndent << type_name << " " << field.accessor_name() << "() const {\n";
    out_ << kIndent << kIndent << "const auto raw = " << field.raw_expression("bits()") << ";\n";
    out_ << kIndent << kIndent << "switch (raw) {\n";

    // Variants sharing a value: the first one decodes
    std::set<uint64_t> seen;
    for (const auto& variant : def->variants) {
        if (!seen.insert(variant.value).second) {
            continue;
        }
        out_ << kIndent << kIndent << "case " << hex_literal(variant.value) << ": return "
             << type_name << "::" << variant.name << ";\n";
    }
    out_ << kIndent << kIndent << "}\n";
    out_ << kIndent << kIndent << "svdmmap::unmapped_enum_value(\"" << type_name << "\", raw);\n";
    out_ << kIndent << "}\n";
}

void HeaderEmitter::emit_writer_class(const RegisterProtocol& reg) {
    out_ << "class " << reg.writer_name << " : public svdmmap::RegisterUpdate<"
         << reg.type_name << ", " << hex_literal(reg.reserved_mask) << "> {\n";
    out_ << "public:\n";
    out_ << kIndent << "using RegisterUpdate::RegisterUpdate;\n\n";

    out_ << kIndent << reg.writer_name << "& set_bits(" << kWordType
         << " new_value) noexcept {\n";
    out_ << kIndent << kIndent << "stage(" << hex_literal(kRegisterWordMask)
         << ", new_value);\n";
    out_ << kIndent << kIndent << "return *this;\n";
    out_ << kIndent << "}\n";

    for (const FieldCodec* field : reg.writable_fields()) {
        out_ << "\n";
        emit_comment(field->description(), kIndent);
        out_ << kIndent << reg.writer_name << "& " << field->setter_name() << "("
             << field->value_type() << " new_value) noexcept {\n";
        out_ << kIndent << kIndent << "stage(" << hex_literal(field->word_mask()) << ", "
             << field->encode_expression("new_value") << ");\n";
        out_ << kIndent << kIndent << "return *this;\n";
        out_ << kIndent << "}\n";
    }

    out_ << "};\n";
}

void HeaderEmitter::emit_register_bodies(const RegisterProtocol& reg) {
    const std::string& type = reg.type_name;

    if (reg.has_reader) {
        out_ << "\n";
        out_ << "inline " << reg.reader_name << " " << type << "::get() const noexcept {\n";
        out_ << kIndent << "return " << reg.reader_name << "(*this);\n";
        out_ << "}\n";
        for (const FieldCodec* field : reg.readable_fields()) {
            out_ << "inline " << field->value_type() << " " << type << "::"
                 << field->accessor_name() << "() const"
                 << (field->enum_type_name() ? "" : " noexcept") << " {\n";
            out_ << kIndent << "return get()." << field->accessor_name() << "();\n";
            out_ << "}\n";
        }
    }

    if (reg.has_writer) {
        const std::string_view update_policy = reg.zero_fill_by_default
            ? "svdmmap::WritePolicy::IgnoreState"
            : "svdmmap::WritePolicy::PreserveState";

        out_ << "\n";
        out_ << "inline " << reg.writer_name << " " << type << "::update() noexcept {\n";
        out_ << kIndent << "return " << reg.writer_name << "(*this, " << update_policy << ");\n";
        out_ << "}\n";
        out_ << "inline " << reg.writer_name << " " << type << "::ignoring_state() noexcept {\n";
        out_ << kIndent << "return " << reg.writer_name
             << "(*this, svdmmap::WritePolicy::IgnoreState);\n";
        out_ << "}\n";
        for (const FieldCodec* field : reg.writable_fields()) {
            out_ << "inline " << reg.writer_name << " " << type << "::" << field->setter_name()
                 << "(" << field->value_type() << " new_value) noexcept {\n";
            out_ << kIndent << reg.writer_name << " staged = update();\n";
            out_ << kIndent << "staged." << field->setter_name() << "(new_value);\n";
            out_ << kIndent << "return staged;\n";
            out_ << "}\n";
        }
    }
}

void HeaderEmitter::emit_layout(const PeripheralModule& module) {
    const std::string& type = module.layout_type_name;

    out_ << "struct " << type << " {\n";
    for (const auto& slot : module.layout.slots) {
        if (slot.is_padding()) {
            out_ << kIndent << "std::uint8_t " << slot.name << "[" << slot.size << "];\n";
        } else {
            out_ << kIndent << slot.type_name << " " << slot.name << ";\n";
        }
    }
    out_ << "};\n";

    // An empty structure still has size 1
    if (module.layout.size != 0) {
        out_ << "static_assert(sizeof(" << type << ") == " << offset_literal(module.layout.size)
             << ");\n";
    }
    for (const auto& slot : module.layout.slots) {
        if (slot.is_padding()) {
            continue;
        }
        out_ << "static_assert(offsetof(" << type << ", " << slot.name << ") == "
             << offset_literal(slot.offset) << ");\n";
    }
}

void HeaderEmitter::emit_links(const PeripheralModule& module) {
    for (const auto& link : module.links) {
        out_ << "extern " << link.type_name << " " << link.instance_name << " __asm__(\""
             << link.symbol_name << "\");";
        out_ << "  // " << offset_literal(link.base_address);
        if (link.alias) {
            out_ << ", derived from " << module.peripheral_name;
        }
        out_ << "\n";
    }
}

void HeaderEmitter::emit_comment(const std::optional<std::string>& text, std::string_view indent) {
    if (!text) {
        return;
    }
    const auto normalized = normalize_description(*text);
    if (normalized.empty()) {
        return;
    }
    out_ << indent << "// " << normalized << "\n";
}

std::string emit_header(const GeneratedDevice& device, const GeneratorOptions& options) {
    std::ostringstream out;
    HeaderEmitter emitter(out, options);
    emitter.emit(device);
    return out.str();
}

} // namespace svdmmap
