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

#include "svdmmap/FieldCodec.hpp"
#include "svdmmap/Errors.hpp"
#include "svdmmap/Inflect.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace svdmmap {

namespace {

// Names the generated register, snapshot and writer classes already use
constexpr std::string_view kReservedAccessorNames[] = {
    "bits", "get", "ignores_state", "ignoring_state", "load", "reserved_mask",
    "stage", "staged_mask", "staged_value", "store", "update",
};

std::string field_accessor_name(std::string_view field_name) {
    auto name = member_identifier(field_name);
    if (std::find(std::begin(kReservedAccessorNames), std::end(kReservedAccessorNames), name) !=
        std::end(kReservedAccessorNames)) {
        name += '_';
    }
    return name;
}

std::string enum_type_name_for(const Field& field) {
    const auto& values = *field.enumerated_values;
    return type_identifier(values.name.value_or(field.name));
}

} // anonymous namespace

StorageType select_storage_type(std::string_view field_name, uint32_t bit_width) {
    if (bit_width == 1) {
        return StorageType::Bool;
    } else if (bit_width >= 2 && bit_width <= 8) {
        return StorageType::U8;
    } else if (bit_width >= 9 && bit_width <= 16) {
        return StorageType::U16;
    } else if (bit_width >= 17 && bit_width <= 32) {
        return StorageType::U32;
    } else if (bit_width >= 33 && bit_width <= 64) {
        return StorageType::U64;
    }
    throw UnsupportedBitWidth(std::string(field_name), bit_width);
}

std::string_view storage_type_name(StorageType type) noexcept {
    switch (type) {
    case StorageType::Bool: return "bool";
    case StorageType::U8:   return "std::uint8_t";
    case StorageType::U16:  return "std::uint16_t";
    case StorageType::U32:  return "std::uint32_t";
    case StorageType::U64:  return "std::uint64_t";
    }
    return "std::uint32_t";
}

std::string hex_literal(uint64_t value) {
    std::ostringstream out;
    out << "0x" << std::hex << value << (value > kRegisterWordMask ? "ull" : "u");
    return out.str();
}

//////////////////////////////////////////////////////////////////////////////
// Enumerated types
//////////////////////////////////////////////////////////////////////////////

const EnumVariant* EnumTypeDef::find_variant(uint64_t raw) const noexcept {
    for (const auto& variant : variants) {
        if (variant.value == raw) {
            return &variant;
        }
    }
    return nullptr;
}

bool EnumTypeDef::same_variants(const EnumTypeDef& other) const noexcept {
    if (underlying_type != other.underlying_type || variants.size() != other.variants.size()) {
        return false;
    }
    for (size_t i = 0; i < variants.size(); ++i) {
        if (variants[i].name != other.variants[i].name ||
            variants[i].value != other.variants[i].value) {
            return false;
        }
    }
    return true;
}

std::optional<EnumTypeDef> make_enum_type(const Field& field) {
    if (!field.enumerated_values) {
        return std::nullopt;
    }

    EnumTypeDef def;
    def.type_name = enum_type_name_for(field);

    bool wide = field.bit_width > kRegisterBits;
    for (const auto& value : field.enumerated_values->values) {
        auto name = type_identifier(value.name);

        // The first of two identically named variants wins
        auto duplicate = std::find_if(def.variants.begin(), def.variants.end(),
                                      [&](const EnumVariant& v) { return v.name == name; });
        if (duplicate != def.variants.end()) {
            continue;
        }

        wide = wide || value.value > kRegisterWordMask;
        def.variants.push_back(EnumVariant{std::move(name), value.value, value.description});
    }
    def.underlying_type = wide ? "std::uint64_t" : "std::uint32_t";

    return def;
}

//////////////////////////////////////////////////////////////////////////////
// FieldCodec
//////////////////////////////////////////////////////////////////////////////

FieldCodec::FieldCodec(const Field& field, std::optional<Access> register_access)
    : name_(field.name)
    , description_(field.description)
    , accessor_name_(field_accessor_name(field.name))
    , bit_offset_(field.bit_offset)
    , bit_width_(field.bit_width)
    , storage_(select_storage_type(field.name, field.bit_width))
    , readable_(is_readable(register_access) && is_readable(field.access))
    , writable_(is_writable(register_access) && is_writable(field.access)) {
    if (field.enumerated_values) {
        enum_type_name_ = enum_type_name_for(field);
    }
}

uint64_t FieldCodec::shifted_mask() const noexcept {
    return bit_offset_ >= 64 ? 0 : mask() << bit_offset_;
}

std::string FieldCodec::value_type() const {
    if (enum_type_name_) {
        return *enum_type_name_;
    }
    return std::string(storage_type_name(storage_));
}

uint64_t FieldCodec::decode(uint64_t raw) const noexcept {
    if (bit_offset_ >= 64) {
        return 0;
    }
    return (raw >> bit_offset_) & mask();
}

FieldCodec::Encoded FieldCodec::encode(uint64_t value) const noexcept {
    if (bit_offset_ >= 64) {
        return Encoded{0, 0};
    }
    return Encoded{(value & mask()) << bit_offset_, shifted_mask()};
}

std::string FieldCodec::raw_expression(std::string_view word_expression) const {
    const auto mask_literal = hex_literal(mask());
    std::ostringstream out;
    if (needs_wide_arithmetic()) {
        out << "(static_cast<std::uint64_t>(" << word_expression << ") >> " << bit_offset_
            << ") & " << mask_literal;
    } else if (bit_offset_ == 0) {
        out << word_expression << " & " << mask_literal;
    } else {
        out << "(" << word_expression << " >> " << bit_offset_ << ") & " << mask_literal;
    }
    return out.str();
}

// For enumerated fields this is the switch operand: the variant match is
// emitted by the header writer.
std::string FieldCodec::decode_expression(std::string_view word_expression) const {
    const auto raw = raw_expression(word_expression);
    if (enum_type_name_) {
        return raw;
    }
    if (storage_ == StorageType::Bool) {
        return "(" + raw + ") != 0";
    }
    return "static_cast<" + std::string(storage_type_name(storage_)) + ">(" + raw + ")";
}

std::string FieldCodec::encode_expression(std::string_view value_expression) const {
    const std::string_view arithmetic_type =
        needs_wide_arithmetic() ? "std::uint64_t" : "std::uint32_t";

    std::ostringstream masked;
    masked << "static_cast<" << arithmetic_type << ">(" << value_expression << ") & "
           << hex_literal(mask());

    std::ostringstream out;
    out << "static_cast<std::uint32_t>(";
    if (bit_offset_ == 0) {
        out << masked.str();
    } else {
        out << "(" << masked.str() << ") << " << bit_offset_;
    }
    out << ")";
    return out.str();
}

} // namespace svdmmap
