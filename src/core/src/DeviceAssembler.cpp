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

#include "svdmmap/DeviceAssembler.hpp"
#include "svdmmap/Inflect.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace svdmmap {

namespace {

const Peripheral* find_peripheral(const Device& device, std::string_view name) {
    for (const auto& peripheral : device.peripherals) {
        if (peripheral.name == name) {
            return &peripheral;
        }
    }
    return nullptr;
}

// Follow derived_from links to the peripheral that carries the registers.
// Returns nullptr if the chain names an unknown peripheral or loops.
const Peripheral* resolve_base(const Device& device, const Peripheral& peripheral) {
    const Peripheral* current = &peripheral;
    for (size_t hops = 0; hops <= device.peripherals.size(); ++hops) {
        if (!current->derived_from) {
            return current;
        }
        current = find_peripheral(device, *current->derived_from);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return nullptr;
}

// Type names declared in one peripheral namespace
class TypeNames {
public:
    bool taken(const std::string& name) const { return names_.contains(name); }
    void claim(const std::string& name) { names_.insert(name); }

private:
    std::set<std::string> names_;
};

bool register_names_taken(const TypeNames& names, const std::string& type_name) {
    return names.taken(type_name) || names.taken(type_name + "Get")
        || names.taken(type_name + "Update");
}

void rename_register(RegisterProtocol& protocol, std::string type_name) {
    protocol.type_name = std::move(type_name);
    protocol.reader_name = protocol.type_name + "Get";
    protocol.writer_name = protocol.type_name + "Update";
}

const EnumTypeDef* find_enum_type(const PeripheralModule& module, const std::string& type_name) {
    for (const auto& def : module.enum_types) {
        if (def.type_name == type_name) {
            return &def;
        }
    }
    return nullptr;
}

// Name under which def is declared in module. An identical definition already
// declared under the name is shared. A conflicting one is declared under a
// name scoped by its register: Cr2Mode.
std::string place_enum_type(PeripheralModule& module, TypeNames& names,
                            const RegisterProtocol& protocol, const EnumTypeDef& def,
                            std::vector<std::string>& warnings) {
    std::string candidate = def.type_name;
    const std::string scoped = protocol.type_name + def.type_name;
    for (int n = 1;; ++n) {
        if (const EnumTypeDef* existing = find_enum_type(module, candidate)) {
            if (existing->same_variants(def)) {
                return candidate;
            }
        } else if (!names.taken(candidate)) {
            break;
        }
        candidate = n == 1 ? scoped : scoped + std::to_string(n);
    }

    if (candidate != def.type_name) {
        warnings.push_back("Peripheral " + module.peripheral_name + ": enumerated type "
                           + def.type_name + " of register " + protocol.source_name
                           + " clashes with an earlier type of that name; generated as "
                           + candidate);
    }

    EnumTypeDef placed = def;
    placed.type_name = candidate;
    names.claim(candidate);
    module.enum_types.push_back(std::move(placed));
    return candidate;
}

} // anonymous namespace

DerivationGroups build_derivation_groups(const Device& device) {
    DerivationGroups groups;
    for (const auto& peripheral : device.peripherals) {
        if (peripheral.derived_from) {
            groups[*peripheral.derived_from].insert(peripheral.name);
        }
    }
    return groups;
}

std::string link_symbol_name(std::string_view prefix,
                             std::string_view device_name,
                             std::string_view peripheral_name) {
    std::string joined;
    joined.reserve(prefix.size() + device_name.size() + peripheral_name.size() + 1);
    joined.append(prefix);
    joined.append(device_name);
    joined.push_back('_');
    joined.append(peripheral_name);
    return to_snake_case(joined);
}

PeripheralModule generate_peripheral(const Peripheral& peripheral,
                                     std::vector<std::string>& warnings) {
    PeripheralModule module;
    module.peripheral_name = peripheral.name;
    module.description = peripheral.description;
    module.layout_type_name = type_identifier(peripheral.group_name.value_or(peripheral.name));
    module.namespace_name = member_identifier(peripheral.name);

    module.layout = plan_layout(peripheral.registers);

    for (const auto& dropped : module.layout.dropped) {
        std::ostringstream oss;
        oss << "Peripheral " << peripheral.name << ": register " << dropped.name
            << " at offset 0x" << std::hex << dropped.address_offset
            << " overlaps the register ending at 0x" << dropped.cursor << " and was dropped";
        warnings.push_back(oss.str());
    }

    TypeNames names;
    names.claim(module.layout_type_name);

    // Register classes first, so that enumerated types yield to them
    for (auto& slot : module.layout.slots) {
        if (slot.is_padding()) {
            continue;
        }
        const Register& reg = *slot.source;
        if (reg.size != kRegisterBits) {
            warnings.push_back("Peripheral " + peripheral.name + ": register " + reg.name
                               + " has size " + std::to_string(reg.size)
                               + " bits; generated as a 32-bit register");
        }

        RegisterProtocol protocol = make_register_protocol(reg);
        if (register_names_taken(names, protocol.type_name)) {
            std::string base = protocol.type_name + "Reg";
            for (int n = 2; register_names_taken(names, base); ++n) {
                base = protocol.type_name + "Reg" + std::to_string(n);
            }
            warnings.push_back("Peripheral " + peripheral.name + ": class name "
                               + protocol.type_name + " of register " + reg.name
                               + " is already in use; generated as " + base);
            rename_register(protocol, std::move(base));
        }
        names.claim(protocol.type_name);
        names.claim(protocol.reader_name);
        names.claim(protocol.writer_name);
        slot.type_name = protocol.type_name;

        module.registers.push_back(std::move(protocol));
    }

    for (auto& protocol : module.registers) {
        auto def = protocol.enum_types.begin();
        for (auto& field : protocol.fields) {
            if (!field.enum_type_name()) {
                continue;
            }
            std::string type_name = place_enum_type(module, names, protocol, *def, warnings);
            def->type_name = type_name;
            field.set_enum_type_name(std::move(type_name));
            ++def;
        }
    }

    return module;
}

GeneratedDevice assemble_device(const Device& device, const GeneratorOptions& options) {
    GeneratedDevice result;
    result.device_name = device.name;
    result.description = device.description;
    result.namespace_name = member_identifier(device.name);

    const DerivationGroups groups = build_derivation_groups(device);

    // Aliases of each base peripheral, resolved through derivation chains
    std::map<const Peripheral*, std::vector<const Peripheral*>> aliases;
    for (const auto& peripheral : device.peripherals) {
        if (!peripheral.derived_from) {
            continue;
        }
        const Peripheral* base = resolve_base(device, peripheral);
        if (base == nullptr) {
            result.warnings.push_back("Peripheral " + peripheral.name + " derives from "
                                      + *peripheral.derived_from
                                      + ", which is not a peripheral of this device;"
                                      + " no declaration generated");
            continue;
        }
        if (base->name != *peripheral.derived_from) {
            result.warnings.push_back("Peripheral " + peripheral.name + " derives from "
                                      + *peripheral.derived_from + ", itself derived; linked as "
                                      + base->name);
        }
        aliases[base].push_back(&peripheral);
    }

    std::set<std::string> used_namespaces;

    for (const auto& peripheral : device.peripherals) {
        if (peripheral.derived_from) {
            continue;
        }

        PeripheralModule module = generate_peripheral(peripheral, result.warnings);

        const bool has_dependents = groups.contains(peripheral.name);
        if (has_dependents && peripheral.group_name) {
            std::string group_namespace = member_identifier(*peripheral.group_name);
            if (!used_namespaces.contains(group_namespace)) {
                module.namespace_name = std::move(group_namespace);
            }
        }
        if (used_namespaces.contains(module.namespace_name)) {
            std::string unique = module.namespace_name + "_2";
            for (int n = 3; used_namespaces.contains(unique); ++n) {
                unique = module.namespace_name + "_" + std::to_string(n);
            }
            result.warnings.push_back("Peripheral " + peripheral.name + ": namespace "
                                      + module.namespace_name + " is already in use;"
                                      + " generated as " + unique);
            module.namespace_name = std::move(unique);
        }
        used_namespaces.insert(module.namespace_name);

        auto link = [&](const Peripheral& instance, bool alias) {
            LinkDeclaration decl;
            decl.peripheral_name = instance.name;
            decl.instance_name = constant_identifier(instance.name);
            decl.type_name = module.layout_type_name;
            decl.symbol_name = link_symbol_name(options.link_prefix, device.name, instance.name);
            decl.base_address = instance.base_address;
            decl.alias = alias;
            module.links.push_back(std::move(decl));
        };

        link(peripheral, false);
        if (auto it = aliases.find(&peripheral); it != aliases.end()) {
            std::vector<const Peripheral*> members = it->second;
            std::sort(members.begin(), members.end(),
                [](const Peripheral* a, const Peripheral* b) { return a->name < b->name; });
            for (const Peripheral* member : members) {
                link(*member, true);
            }
        }

        result.modules.push_back(std::move(module));
    }

    return result;
}

std::vector<LinkMemEntry> gen_link_mem(const Device& device, const GeneratorOptions& options) {
    std::vector<LinkMemEntry> entries;
    entries.reserve(device.peripherals.size());
    for (const auto& peripheral : device.peripherals) {
        entries.push_back(LinkMemEntry{
            link_symbol_name(options.link_prefix, device.name, peripheral.name),
            peripheral.base_address});
    }
    return entries;
}

void write_link_mem(std::ostream& out, const std::vector<LinkMemEntry>& entries) {
    const auto flags = out.flags();
    const auto fill = out.fill();
    for (const auto& entry : entries) {
        out << entry.symbol_name << " = 0x"
            << std::hex << std::nouppercase << std::setw(8) << std::setfill('0')
            << entry.base_address << '\n';
    }
    out.flags(flags);
    out.fill(fill);
}

} // namespace svdmmap
