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

#ifndef SVDMMAP_DEVICE_ASSEMBLER_HPP
#define SVDMMAP_DEVICE_ASSEMBLER_HPP

#include "svdmmap/DeviceModel.hpp"
#include "svdmmap/FieldCodec.hpp"
#include "svdmmap/GeneratorOptions.hpp"
#include "svdmmap/LayoutPlan.hpp"
#include "svdmmap/RegisterProtocol.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace svdmmap {

// Name referenced by some derived_from -> names of the peripherals deriving from it
using DerivationGroups = std::map<std::string, std::set<std::string>>;

DerivationGroups build_derivation_groups(const Device& device);

// snake_case(prefix + device + "_" + peripheral): mmap_stm32f4_usart1
std::string link_symbol_name(std::string_view prefix,
                             std::string_view device_name,
                             std::string_view peripheral_name);

// Binds one peripheral instance to the symbol the linker script places at its
// base address:
//
//   extern Usart USART1 __asm__("mmap_stm32f4_usart1");
//
struct LinkDeclaration {
    std::string peripheral_name;  // As in the device description
    std::string instance_name;    // USART1
    std::string type_name;        // Layout type of the base peripheral
    std::string symbol_name;
    uint64_t base_address = 0;
    bool alias = false;           // Derived from the base peripheral
};

// Generated code of one non-derived peripheral and its aliases
struct PeripheralModule {
    std::string peripheral_name;
    std::optional<std::string> description;
    std::string namespace_name;
    std::string layout_type_name;

    LayoutPlan layout;
    std::vector<EnumTypeDef> enum_types;        // Unique by type name
    std::vector<RegisterProtocol> registers;    // Laid-out registers, address order
    std::vector<LinkDeclaration> links;         // Base first, then aliases by name
};

struct GeneratedDevice {
    std::string device_name;
    std::optional<std::string> description;
    std::string namespace_name;
    std::vector<PeripheralModule> modules;      // Input order of base peripherals
    std::vector<std::string> warnings;          // Tolerated anomalies
};

// Layout and accessor code for one peripheral, without namespace or link
// declarations. Anomalies are appended to warnings.
PeripheralModule generate_peripheral(const Peripheral& peripheral,
                                     std::vector<std::string>& warnings);

// The whole device. Throws GenerationError (UnsupportedBitWidth) on input that
// cannot be generated. Layout slots refer to the registers of device, which
// must outlive the result if they are dereferenced.
GeneratedDevice assemble_device(const Device& device, const GeneratorOptions& options = {});

struct LinkMemEntry {
    std::string symbol_name;
    uint64_t base_address = 0;
};

// One entry per peripheral instance, aliases included, in input order
std::vector<LinkMemEntry> gen_link_mem(const Device& device, const GeneratorOptions& options = {});

// "<symbol_name> = 0x<8 hex digits>" per line
void write_link_mem(std::ostream& out, const std::vector<LinkMemEntry>& entries);

} // namespace svdmmap

#endif // SVDMMAP_DEVICE_ASSEMBLER_HPP
