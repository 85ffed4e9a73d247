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

#include "svdmmap/SvdLoader.hpp"

#include <pugixml.hpp>

#include <cctype>
#include <fstream>
#include <utility>

namespace svdmmap {

namespace {

// Properties inherited by registers from their peripheral and device
struct RegisterDefaults {
    uint32_t size = 32;
    std::optional<Access> access;
};

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

// "USART[%s]" and "CH%s" name dim arrays; we keep one instance
std::string strip_dim_placeholder(std::string name) {
    for (std::string_view placeholder : {"[%s]", "_%s", "%s"}) {
        if (auto pos = name.find(placeholder); pos != std::string::npos) {
            name.erase(pos, placeholder.size());
            break;
        }
    }
    return name;
}

std::string context_of(std::string_view element, std::string_view name) {
    std::string result(element);
    if (!name.empty()) {
        result += " ";
        result += name;
    }
    return result;
}

std::optional<std::string> optional_text(const pugi::xml_node& node, const char* name) {
    auto child = node.child(name);
    if (child.empty()) {
        return std::nullopt;
    }
    return std::string(trim(child.text().as_string()));
}

std::string required_text(const pugi::xml_node& node, const char* name,
                          std::string_view context) {
    auto text = optional_text(node, name);
    if (!text || text->empty()) {
        throw SvdError("Missing <" + std::string(name) + "> in " + std::string(context));
    }
    return std::move(*text);
}

uint64_t number_in(std::string_view text, std::string_view element, std::string_view context) {
    try {
        return parse_svd_number(text);
    } catch (const SvdError& e) {
        throw SvdError(std::string(e.what()) + " in <" + std::string(element) + "> of "
                       + std::string(context));
    }
}

std::optional<uint64_t> optional_number(const pugi::xml_node& node, const char* name,
                                        std::string_view context) {
    auto text = optional_text(node, name);
    if (!text) {
        return std::nullopt;
    }
    return number_in(*text, name, context);
}

uint64_t required_number(const pugi::xml_node& node, const char* name,
                         std::string_view context) {
    return number_in(required_text(node, name, context), name, context);
}

uint32_t narrow_u32(uint64_t value, std::string_view element, std::string_view context) {
    if (value > 0xFFFFFFFFull) {
        throw SvdError("Value of <" + std::string(element) + "> out of range in "
                       + std::string(context));
    }
    return static_cast<uint32_t>(value);
}

std::optional<Access> optional_access(const pugi::xml_node& node, std::string_view context) {
    auto text = optional_text(node, "access");
    if (!text) {
        return std::nullopt;
    }
    auto access = parse_svd_access(*text);
    if (!access) {
        throw SvdError("Unknown access \"" + *text + "\" in " + std::string(context));
    }
    return access;
}

RegisterDefaults read_defaults(const pugi::xml_node& node, const RegisterDefaults& inherited,
                               std::string_view context) {
    RegisterDefaults defaults = inherited;
    if (auto size = optional_number(node, "size", context)) {
        defaults.size = narrow_u32(*size, "size", context);
    }
    if (auto access = optional_access(node, context)) {
        defaults.access = access;
    }
    return defaults;
}

EnumeratedValues read_enumerated_values(const pugi::xml_node& node, std::string_view context) {
    EnumeratedValues values;
    values.name = optional_text(node, "name");

    for (pugi::xml_node value_node : node.children("enumeratedValue")) {
        // isDefault entries carry no value
        auto value_text = optional_text(value_node, "value");
        if (!value_text) {
            continue;
        }
        EnumeratedValue value;
        value.name = required_text(value_node, "name", context);
        value.value = number_in(*value_text, "value", context);
        value.description = optional_text(value_node, "description");
        values.values.push_back(std::move(value));
    }
    return values;
}

// [msb:lsb]
std::pair<uint32_t, uint32_t> parse_bit_range(std::string_view text, std::string_view context) {
    text = trim(text);
    auto colon = text.find(':');
    if (text.size() < 5 || text.front() != '[' || text.back() != ']' ||
        colon == std::string_view::npos || colon != text.rfind(':')) {
        throw SvdError("Malformed <bitRange> \"" + std::string(text) + "\" in "
                       + std::string(context));
    }
    auto msb = number_in(text.substr(1, colon - 1), "bitRange", context);
    auto lsb = number_in(text.substr(colon + 1, text.size() - colon - 2), "bitRange", context);
    if (lsb > msb) {
        throw SvdError("Reversed <bitRange> \"" + std::string(text) + "\" in "
                       + std::string(context));
    }
    return {narrow_u32(msb, "bitRange", context), narrow_u32(lsb, "bitRange", context)};
}

Field read_field(const pugi::xml_node& node, std::string_view register_context) {
    Field field;
    field.name = strip_dim_placeholder(required_text(node, "name", register_context));
    const auto context = context_of("field", field.name) + " of " + std::string(register_context);

    field.description = optional_text(node, "description");

    if (auto range = optional_text(node, "bitRange")) {
        auto [msb, lsb] = parse_bit_range(*range, context);
        field.bit_offset = lsb;
        field.bit_width = msb - lsb + 1;
    } else if (!node.child("lsb").empty() || !node.child("msb").empty()) {
        auto lsb = narrow_u32(required_number(node, "lsb", context), "lsb", context);
        auto msb = narrow_u32(required_number(node, "msb", context), "msb", context);
        if (lsb > msb) {
            throw SvdError("<lsb> above <msb> in " + context);
        }
        field.bit_offset = lsb;
        field.bit_width = msb - lsb + 1;
    } else {
        field.bit_offset = narrow_u32(required_number(node, "bitOffset", context),
                                      "bitOffset", context);
        field.bit_width = narrow_u32(required_number(node, "bitWidth", context),
                                     "bitWidth", context);
    }

    field.access = optional_access(node, context);

    // Only the first block; a second one normally describes the write side
    auto enum_node = node.child("enumeratedValues");
    if (!enum_node.empty()) {
        field.enumerated_values = read_enumerated_values(enum_node, context);
    }

    return field;
}

Register read_register(const pugi::xml_node& node, const RegisterDefaults& defaults,
                       std::string_view peripheral_context) {
    Register reg;
    reg.name = strip_dim_placeholder(required_text(node, "name", peripheral_context));
    const auto context = context_of("register", reg.name) + " of "
                         + std::string(peripheral_context);

    reg.description = optional_text(node, "description");
    reg.address_offset = narrow_u32(required_number(node, "addressOffset", context),
                                    "addressOffset", context);

    auto own = read_defaults(node, defaults, context);
    reg.size = own.size;
    reg.access = own.access;

    for (pugi::xml_node field_node : node.child("fields").children("field")) {
        reg.fields.push_back(read_field(field_node, context));
    }
    return reg;
}

Peripheral read_peripheral(const pugi::xml_node& node, const RegisterDefaults& device_defaults) {
    Peripheral peripheral;
    peripheral.name = strip_dim_placeholder(required_text(node, "name", "peripheral"));
    const auto context = context_of("peripheral", peripheral.name);

    peripheral.group_name = optional_text(node, "groupName");
    peripheral.description = optional_text(node, "description");
    peripheral.base_address = required_number(node, "baseAddress", context);

    if (auto derived = node.attribute("derivedFrom"); !derived.empty()) {
        peripheral.derived_from = std::string(trim(derived.value()));
    }

    auto defaults = read_defaults(node, device_defaults, context);
    for (pugi::xml_node reg_node : node.child("registers").children("register")) {
        peripheral.registers.push_back(read_register(reg_node, defaults, context));
    }
    return peripheral;
}

} // anonymous namespace

uint64_t parse_svd_number(std::string_view text) {
    text = trim(text);

    int base = 10;
    if (text.starts_with("0x") || text.starts_with("0X")) {
        base = 16;
        text.remove_prefix(2);
    } else if (text.starts_with("#")) {
        base = 2;
        text.remove_prefix(1);
    } else if (text.starts_with("0b") || text.starts_with("0B")) {
        base = 2;
        text.remove_prefix(2);
    }

    if (text.empty()) {
        throw SvdError("Empty number");
    }

    uint64_t value = 0;
    for (char c : text) {
        int digit;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (c >= 'a' && c <= 'f') {
            digit = c - 'a' + 10;
        } else if (c >= 'A' && c <= 'F') {
            digit = c - 'A' + 10;
        } else {
            digit = base;
        }
        if (digit >= base) {
            throw SvdError("Invalid number \"" + std::string(text) + "\"");
        }
        const uint64_t next = value * static_cast<uint64_t>(base) + static_cast<uint64_t>(digit);
        if (next / static_cast<uint64_t>(base) != value) {
            throw SvdError("Number out of range \"" + std::string(text) + "\"");
        }
        value = next;
    }
    return value;
}

std::optional<Access> parse_svd_access(std::string_view text) {
    text = trim(text);
    if (text == "read-only") {
        return Access::ReadOnly;
    } else if (text == "write-only" || text == "writeOnce") {
        return Access::WriteOnly;
    } else if (text == "read-write" || text == "read-writeOnce") {
        return Access::ReadWrite;
    }
    return std::nullopt;
}

Device parse_device(std::string_view xml_text) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml_text.data(), xml_text.size());
    if (!result) {
        throw SvdError(std::string("XML parse error: ") + result.description()
                       + " at offset " + std::to_string(result.offset));
    }

    auto device_node = doc.child("device");
    if (device_node.empty()) {
        throw SvdError("Missing <device> root element");
    }

    Device device;
    device.name = required_text(device_node, "name", "device");
    device.description = optional_text(device_node, "description");

    const auto context = context_of("device", device.name);
    auto defaults = read_defaults(device_node, RegisterDefaults{}, context);

    for (pugi::xml_node node : device_node.child("peripherals").children("peripheral")) {
        device.peripherals.push_back(read_peripheral(node, defaults));
    }
    return device;
}

Device load_device_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary | std::ios::ate);
    if (!file) {
        throw SvdError("Cannot open file: " + filepath);
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::string data(static_cast<size_t>(size), '\0');
    if (!file.read(data.data(), size)) {
        throw SvdError("Cannot read file: " + filepath);
    }

    return parse_device(data);
}

} // namespace svdmmap
