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

#ifndef SVDMMAP_LAYOUT_PLAN_HPP
#define SVDMMAP_LAYOUT_PLAN_HPP

#include "svdmmap/DeviceModel.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace svdmmap {

// One member of a peripheral's register block structure
struct LayoutSlot {
    enum class Kind : uint8_t {
        Register,
        Padding
    };

    Kind kind = Kind::Register;
    uint32_t offset = 0;      // Bytes from the peripheral base
    uint32_t size = 0;        // Bytes
    std::string name;         // Member name: cr, _pad0
    std::string type_name;    // Register class; empty for padding
    const Register* source = nullptr;  // Register slots only

    bool is_padding() const noexcept { return kind == Kind::Padding; }
};

// A register that overlapped an earlier one and was left out of the block
struct DroppedRegister {
    std::string name;
    uint32_t address_offset = 0;
    uint32_t cursor = 0;      // End of the previous register
};

struct LayoutPlan {
    std::vector<LayoutSlot> slots;   // Ascending offset, no gaps, no overlaps
    std::vector<DroppedRegister> dropped;
    uint32_t size = 0;               // Bytes covered by the slots

    size_t register_count() const;
};

// Lay out registers in ascending address order, 4 bytes each.
//
// A register starting beyond the cursor is preceded by a padding slot
// _pad<N> of the missing bytes. A register starting before the cursor
// overlaps the previous one and is dropped; registers sharing an offset keep
// their input order, so the first declared wins.
//
// The plan refers to the input registers, which must outlive it.
LayoutPlan plan_layout(const std::vector<Register>& registers);

} // namespace svdmmap

#endif // SVDMMAP_LAYOUT_PLAN_HPP
