// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace beacon {

// `ascii_caseless_comp` compares two ascii strings for equality, ignoring case.
//
// Example usage:
//
// ascii_caseless_comp(std::string_view("Request-Id"), std::string_view("request-id"));
//
struct ascii_caseless_comp_t {
    constexpr bool operator()(std::string_view a, std::string_view b) const noexcept {
        if (a.size() != b.size()) {
            return false;
        }
        constexpr auto tolower = [](const char c) { return (c >= 'A' && c <= 'Z') ? c + ('a' - 'A') : c; };
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (tolower(a[i]) != tolower(b[i])) {
                return false;
            }
        }
        return true;
    }
};

inline constexpr ascii_caseless_comp_t ascii_caseless_comp{};

// Strip leading and trailing whitespace (space, tab, CR, LF, VT, FF).
std::string trim(std::string_view input);

// True when the string is empty or contains only whitespace.
bool is_blank(std::string_view input);

// Uppercase hex encoding of a byte buffer, two characters per byte.
std::string to_upper_hex(const std::uint8_t* data, std::size_t size);

}  // namespace beacon
