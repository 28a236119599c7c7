// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <beacon/common/string_utils.hpp>

namespace beacon {

namespace {
constexpr std::string_view kWhitespace = " \t\r\n\v\f";
}  // namespace

std::string trim(std::string_view input) {
    size_t start = input.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) {
        return "";
    }
    size_t end = input.find_last_not_of(kWhitespace);
    return std::string(input.substr(start, end - start + 1));
}

bool is_blank(std::string_view input) { return input.find_first_not_of(kWhitespace) == std::string_view::npos; }

std::string to_upper_hex(const std::uint8_t* data, std::size_t size) {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string hex;
    hex.reserve(size * 2);
    for (std::size_t i = 0; i < size; i++) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0F]);
    }
    return hex;
}

}  // namespace beacon
