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

#ifndef SVDMMAP_RUNTIME_VOLATILE_CELL_HPP
#define SVDMMAP_RUNTIME_VOLATILE_CELL_HPP

#include <concepts>

namespace svdmmap {

// One hardware word. Every get() and set() is exactly one volatile access,
// so the compiler can neither elide nor reorder it against other accesses
// to the same cell.
template<std::unsigned_integral Word>
class VolatileCell {
public:
    VolatileCell() = default;

    // Non-copyable
    VolatileCell(const VolatileCell&) = delete;
    VolatileCell& operator=(const VolatileCell&) = delete;

    Word get() const noexcept { return value_; }
    void set(Word value) noexcept { value_ = value; }

private:
    volatile Word value_{};
};

} // namespace svdmmap

#endif // SVDMMAP_RUNTIME_VOLATILE_CELL_HPP
