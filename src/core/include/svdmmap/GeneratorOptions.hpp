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

#ifndef SVDMMAP_GENERATOR_OPTIONS_HPP
#define SVDMMAP_GENERATOR_OPTIONS_HPP

#include <string>
#include <string_view>

namespace svdmmap {

constexpr std::string_view kDefaultLinkPrefix = "mmap_";
constexpr std::string_view kRuntimeInclude = "svdmmap/runtime/Register.hpp";

struct GeneratorOptions {
    // Prepended to "<device>_<peripheral>" to form link symbol names
    std::string link_prefix{kDefaultLinkPrefix};

    // Header the generated code includes for the register runtime
    std::string runtime_include{kRuntimeInclude};
};

} // namespace svdmmap

#endif // SVDMMAP_GENERATOR_OPTIONS_HPP
