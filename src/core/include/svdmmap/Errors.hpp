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

#ifndef SVDMMAP_ERRORS_HPP
#define SVDMMAP_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace svdmmap {

// Base of all failures that abort code generation
class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A field whose width has no storage type (0 or more than 64 bits)
class UnsupportedBitWidth : public GenerationError {
public:
    UnsupportedBitWidth(std::string field_name, uint32_t bit_width)
        : GenerationError("Unsupported bit width " + std::to_string(bit_width) +
                          " for field " + field_name)
        , field_name_(std::move(field_name))
        , bit_width_(bit_width) {}

    const std::string& field_name() const noexcept { return field_name_; }
    uint32_t bit_width() const noexcept { return bit_width_; }

private:
    std::string field_name_;
    uint32_t bit_width_;
};

} // namespace svdmmap

#endif // SVDMMAP_ERRORS_HPP
