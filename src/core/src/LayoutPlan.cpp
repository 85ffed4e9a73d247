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

#include "svdmmap/LayoutPlan.hpp"
#include "svdmmap/FieldCodec.hpp"
#include "svdmmap/Inflect.hpp"

#include <algorithm>
#include <utility>

namespace svdmmap {

size_t LayoutPlan::register_count() const {
    return static_cast<size_t>(std::count_if(slots.begin(), slots.end(),
        [](const LayoutSlot& slot) { return !slot.is_padding(); }));
}

LayoutPlan plan_layout(const std::vector<Register>& registers) {
    std::vector<const Register*> sorted;
    sorted.reserve(registers.size());
    for (const auto& reg : registers) {
        sorted.push_back(&reg);
    }
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const Register* a, const Register* b) { return a->address_offset < b->address_offset; });

    LayoutPlan plan;
    uint32_t cursor = 0;
    uint32_t pad_count = 0;

    for (const Register* reg : sorted) {
        if (reg->address_offset < cursor) {
            plan.dropped.push_back(DroppedRegister{reg->name, reg->address_offset, cursor});
            continue;
        }

        if (reg->address_offset > cursor) {
            LayoutSlot pad;
            pad.kind = LayoutSlot::Kind::Padding;
            pad.offset = cursor;
            pad.size = reg->address_offset - cursor;
            pad.name = "_pad" + std::to_string(pad_count++);
            plan.slots.push_back(std::move(pad));
        }

        LayoutSlot slot;
        slot.kind = LayoutSlot::Kind::Register;
        slot.offset = reg->address_offset;
        slot.size = kRegisterBytes;
        slot.name = member_identifier(reg->name);
        slot.type_name = type_identifier(reg->name);
        slot.source = reg;
        plan.slots.push_back(std::move(slot));

        cursor = reg->address_offset + kRegisterBytes;
    }

    plan.size = cursor;
    return plan;
}

} // namespace svdmmap
