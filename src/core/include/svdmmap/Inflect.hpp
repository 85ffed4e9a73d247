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

#ifndef SVDMMAP_INFLECT_HPP
#define SVDMMAP_INFLECT_HPP

#include <string>
#include <string_view>
#include <vector>

namespace svdmmap {

// Name casing for generated identifiers.
//
// A name is split into words at any character that is not a letter or digit,
// at a lower-to-upper case transition ("clockEnable" -> clock, Enable) and
// before a capital that starts a lowercase word after an acronym or a digit
// ("HTTPServer" -> HTTP, Server; "Ch2Mode" -> Ch2, Mode). Digits otherwise
// stay with the word before them, so "STM32L4x6" is a single word.

std::vector<std::string> split_words(std::string_view name);

std::string to_snake_case(std::string_view name);     // usart_cr1
std::string to_pascal_case(std::string_view name);    // UsartCr1
std::string to_constant_case(std::string_view name);  // USART_CR1

// Make name usable as a C++ identifier: prefix '_' when it starts with a digit
// (or is empty), append '_' when it is a keyword.
std::string sanitize_identifier(std::string name);

// Collapse whitespace runs (including newlines) to single spaces and trim
std::string normalize_description(std::string_view text);

// Casing plus sanitizing, as used for each kind of generated name
inline std::string type_identifier(std::string_view name) {
    return sanitize_identifier(to_pascal_case(name));
}

inline std::string member_identifier(std::string_view name) {
    return sanitize_identifier(to_snake_case(name));
}

inline std::string constant_identifier(std::string_view name) {
    return sanitize_identifier(to_constant_case(name));
}

} // namespace svdmmap

#endif // SVDMMAP_INFLECT_HPP
