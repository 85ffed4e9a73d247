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

#ifndef SVDMMAP_DEVICE_MODEL_HPP
#define SVDMMAP_DEVICE_MODEL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace svdmmap {

// Device description as read from an SVD document.
// The generator treats all of these as read-only input.

enum class Access : uint8_t {
    ReadOnly,
    WriteOnly,
    ReadWrite
};

// An absent access mode places no restriction
constexpr bool is_readable(std::optional<Access> access) noexcept {
    return access != Access::WriteOnly;
}

constexpr bool is_writable(std::optional<Access> access) noexcept {
    return access != Access::ReadOnly;
}

struct EnumeratedValue {
    std::string name;
    uint64_t value = 0;
    std::optional<std::string> description;
};

struct EnumeratedValues {
    std::optional<std::string> name;
    std::vector<EnumeratedValue> values;
};

struct Field {
    std::string name;
    std::optional<std::string> description;
    uint32_t bit_offset = 0;
    uint32_t bit_width = 0;
    std::optional<Access> access;  // Overrides the register's when present
    std::optional<EnumeratedValues> enumerated_values;
};

struct Register {
    std::string name;
    std::optional<std::string> description;
    uint32_t address_offset = 0;
    uint32_t size = 32;            // Bits
    std::optional<Access> access;
    std::vector<Field> fields;
};

struct Peripheral {
    std::string name;
    std::optional<std::string> group_name;
    std::optional<std::string> description;
    uint64_t base_address = 0;
    std::optional<std::string> derived_from;  // Reuses that peripheral's register layout
    std::vector<Register> registers;
};

struct Device {
    std::string name;
    std::optional<std::string> description;
    std::vector<Peripheral> peripherals;
};

} // namespace svdmmap

#endif // SVDMMAP_DEVICE_MODEL_HPP
