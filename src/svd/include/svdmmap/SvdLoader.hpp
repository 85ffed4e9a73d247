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

#ifndef SVDMMAP_SVD_LOADER_HPP
#define SVDMMAP_SVD_LOADER_HPP

#include "svdmmap/DeviceModel.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace svdmmap {

// The document cannot be read or does not describe a device we understand
class SvdError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Read a CMSIS-SVD device description.
//
// Only what the generator needs is kept: peripherals with their registers,
// fields and the first enumeratedValues block of each field. Register size and
// access default to the peripheral's, then the device's. Clusters are skipped;
// dim arrays are read as a single register.
Device parse_device(std::string_view xml_text);

Device load_device_file(const std::string& filepath);

// SVD scaled non-negative integer: decimal, 0x/0X hexadecimal, #/0b binary
uint64_t parse_svd_number(std::string_view text);

// "read-only", "write-only", "read-write", "writeOnce", "read-writeOnce";
// nullopt for anything else
std::optional<Access> parse_svd_access(std::string_view text);

} // namespace svdmmap

#endif // SVDMMAP_SVD_LOADER_HPP
