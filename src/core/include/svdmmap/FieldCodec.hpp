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

#ifndef SVDMMAP_FIELD_CODEC_HPP
#define SVDMMAP_FIELD_CODEC_HPP

#include "svdmmap/DeviceModel.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace svdmmap {

// Every register is stored as one 32-bit word
constexpr uint32_t kRegisterBits = 32;
constexpr uint32_t kRegisterBytes = kRegisterBits / 8;
constexpr uint64_t kRegisterWordMask = 0xFFFFFFFFull;

// Value type of a field's getter and setter, chosen from its width
enum class StorageType : uint8_t {
    Bool,   // 1 bit
    U8,     // 2-8 bits
    U16,    // 9-16 bits
    U32,    // 17-32 bits
    U64     // 33-64 bits
};

// Throws UnsupportedBitWidth for widths 0 and > 64
StorageType select_storage_type(std::string_view field_name, uint32_t bit_width);

// C++ spelling: "bool", "std::uint8_t", ...
std::string_view storage_type_name(StorageType type) noexcept;

// (1 << width) - 1, all ones for 64
constexpr uint64_t field_mask(uint32_t bit_width) noexcept {
    return bit_width >= 64 ? ~uint64_t{0} : (uint64_t{1} << bit_width) - 1;
}

// Hexadecimal C++ literal with the narrowest unsigned suffix: 0xfu, 0x1ffffffffull
std::string hex_literal(uint64_t value);

struct EnumVariant {
    std::string name;        // PascalCase identifier
    uint64_t value = 0;
    std::optional<std::string> description;
};

// An enum class generated for a field with enumerated values
struct EnumTypeDef {
    std::string type_name;   // PascalCase of the enum's name, else of the field's
    std::string underlying_type;
    std::vector<EnumVariant> variants;

    // Variant for a raw field value, nullptr when the value is unmapped
    const EnumVariant* find_variant(uint64_t raw) const noexcept;

    bool same_variants(const EnumTypeDef& other) const noexcept;
};

std::optional<EnumTypeDef> make_enum_type(const Field& field);

// Encode/decode plan for one field of one register
class FieldCodec {
public:
    struct Encoded {
        uint64_t bits;  // (value & mask) << offset
        uint64_t mask;  // mask << offset
    };

    FieldCodec(const Field& field, std::optional<Access> register_access);

    const std::string& name() const noexcept { return name_; }
    const std::optional<std::string>& description() const noexcept { return description_; }

    // Identifier of the getter; the setter is "set_" + accessor_name()
    const std::string& accessor_name() const noexcept { return accessor_name_; }
    std::string setter_name() const { return "set_" + accessor_name_; }

    uint32_t bit_offset() const noexcept { return bit_offset_; }
    uint32_t bit_width() const noexcept { return bit_width_; }
    StorageType storage() const noexcept { return storage_; }
    const std::optional<std::string>& enum_type_name() const noexcept { return enum_type_name_; }

    // Rebinds an enumerated field to the type it is generated against
    void set_enum_type_name(std::string type_name) { enum_type_name_ = std::move(type_name); }

    // Register access narrowed by field access
    bool readable() const noexcept { return readable_; }
    bool writable() const noexcept { return writable_; }

    uint64_t mask() const noexcept { return field_mask(bit_width_); }
    uint64_t shifted_mask() const noexcept;

    // Bits of the 32-bit register word this field occupies
    uint32_t word_mask() const noexcept {
        return static_cast<uint32_t>(shifted_mask() & kRegisterWordMask);
    }

    // C++ type of the getter result and setter argument
    std::string value_type() const;

    // Generation-time arithmetic mirroring the emitted expressions
    uint64_t decode(uint64_t raw) const noexcept;
    Encoded encode(uint64_t value) const noexcept;

    // Masked, unshifted field value read from word_expression
    std::string raw_expression(std::string_view word_expression) const;

    // Getter body expression for a non-enumerated field
    std::string decode_expression(std::string_view word_expression) const;

    // Register word bits for value_expression, to be staged under word_mask()
    std::string encode_expression(std::string_view value_expression) const;

private:
    // Whether the field reaches beyond the 32-bit word and needs 64-bit arithmetic
    bool needs_wide_arithmetic() const noexcept {
        return bit_offset_ + bit_width_ > kRegisterBits;
    }

    std::string name_;
    std::optional<std::string> description_;
    std::string accessor_name_;
    uint32_t bit_offset_;
    uint32_t bit_width_;
    StorageType storage_;
    std::optional<std::string> enum_type_name_;
    bool readable_;
    bool writable_;
};

} // namespace svdmmap

#endif // SVDMMAP_FIELD_CODEC_HPP
