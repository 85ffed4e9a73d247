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

#include "svdmmap/Inflect.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace svdmmap {

namespace {

constexpr std::string_view kCppKeywords[] = {
    "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor",
    "bool", "break", "case", "catch", "char", "char8_t", "char16_t", "char32_t",
    "class", "compl", "concept", "const", "consteval", "constexpr", "constinit",
    "const_cast", "continue", "co_await", "co_return", "co_yield", "decltype",
    "default", "delete", "do", "double", "dynamic_cast", "else", "enum",
    "explicit", "export", "extern", "false", "float", "for", "friend", "goto",
    "if", "inline", "int", "long", "mutable", "namespace", "new", "noexcept",
    "not", "not_eq", "nullptr", "operator", "or", "or_eq", "private",
    "protected", "public", "register", "reinterpret_cast", "requires", "return",
    "short", "signed", "sizeof", "static", "static_assert", "static_cast",
    "struct", "switch", "template", "this", "thread_local", "throw", "true",
    "try", "typedef", "typeid", "typename", "union", "unsigned", "using",
    "virtual", "void", "volatile", "wchar_t", "while", "xor", "xor_eq",
};

bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool is_alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

char lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
char upper(char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }

std::string join(const std::vector<std::string>& words, std::string_view separator) {
    std::string result;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i != 0) {
            result += separator;
        }
        result += words[i];
    }
    return result;
}

} // anonymous namespace

std::vector<std::string> split_words(std::string_view name) {
    std::vector<std::string> words;
    std::string current;

    auto flush = [&] {
        if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    };

    for (size_t i = 0; i < name.size(); ++i) {
        const char c = name[i];
        if (!is_alnum(c)) {
            flush();
            continue;
        }

        // A non-empty current word means name[i - 1] was a letter or digit
        if (is_upper(c) && !current.empty()) {
            const char prev = name[i - 1];
            const bool next_is_lower = i + 1 < name.size() && is_lower(name[i + 1]);
            if (is_lower(prev) || next_is_lower) {
                flush();
            }
        }
        current.push_back(c);
    }
    flush();

    return words;
}

std::string to_snake_case(std::string_view name) {
    auto words = split_words(name);
    for (auto& word : words) {
        std::transform(word.begin(), word.end(), word.begin(), lower);
    }
    return join(words, "_");
}

std::string to_pascal_case(std::string_view name) {
    auto words = split_words(name);
    for (auto& word : words) {
        std::transform(word.begin(), word.end(), word.begin(), lower);
        word.front() = upper(word.front());
    }
    return join(words, "");
}

std::string to_constant_case(std::string_view name) {
    auto words = split_words(name);
    for (auto& word : words) {
        std::transform(word.begin(), word.end(), word.begin(), upper);
    }
    return join(words, "_");
}

std::string sanitize_identifier(std::string name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
        name.insert(0, "_");
    }
    if (std::find(std::begin(kCppKeywords), std::end(kCppKeywords), name) != std::end(kCppKeywords)) {
        name += '_';
    }
    return name;
}

std::string normalize_description(std::string_view text) {
    std::string result;
    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += c;
    }
    return result;
}

} // namespace svdmmap
