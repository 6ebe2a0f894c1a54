/*
   Copyright 2022 The Arbor Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include "util.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <regex>
#include <utility>

namespace arbor {

namespace {

    constexpr uint8_t kInvalidNibble{0xff};

    constexpr uint8_t nibble_of(char c) {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        return kInvalidNibble;
    }

    uint64_t multiplier_of(std::string_view suffix) {
        static constexpr std::array<std::pair<std::string_view, uint64_t>, 4> kMultipliers{{
            {"KB", kKibi},
            {"MB", kMebi},
            {"GB", kGibi},
            {"TB", kTebi},
        }};
        for (const auto& [name, multiplier] : kMultipliers) {
            if (iequals(suffix, name)) return multiplier;
        }
        return 1;
    }

}  // namespace

evmc::bytes32 to_bytes32(ByteView bytes) {
    evmc::bytes32 word;
    if (bytes.length() > sizeof(word.bytes)) {
        bytes.remove_prefix(bytes.length() - sizeof(word.bytes));
    }
    if (!bytes.empty()) {
        std::memcpy(word.bytes + sizeof(word.bytes) - bytes.length(), bytes.data(), bytes.length());
    }
    return word;
}

std::string to_hex(ByteView bytes, bool with_prefix) {
    static constexpr std::string_view kDigits{"0123456789abcdef"};
    std::string out;
    out.reserve(bytes.length() * 2 + 2);
    if (with_prefix) {
        out += "0x";
    }
    for (const uint8_t b : bytes) {
        out += kDigits[b >> 4];
        out += kDigits[b & 0x0f];
    }
    return out;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (hex.length() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }

    Bytes out((hex.length() + 1) / 2, 0);
    // The first output byte takes a single digit when the count is odd
    size_t digit{hex.length() % 2 == 0 ? 0u : 1u};
    for (const char c : hex) {
        const uint8_t nibble{nibble_of(c)};
        if (nibble == kInvalidNibble) {
            return std::nullopt;
        }
        uint8_t& target{out[digit / 2]};
        target = static_cast<uint8_t>(digit % 2 == 0 ? nibble << 4 : target | nibble);
        ++digit;
    }
    return out;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i{0}; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<uint64_t> parse_size(const std::string& sizestr) {
    if (sizestr.empty()) {
        return 0ull;
    }

    static const std::regex kSizeFormat{R"(^(\d*)(?:\.(\d{1,3}))?\ *?(B|KB|MB|GB|TB)?$)",
                                        std::regex_constants::icase};
    std::smatch parts;
    if (!std::regex_match(sizestr, parts, kSizeFormat)) {
        return std::nullopt;
    }

    const uint64_t multiplier{multiplier_of(parts[3].str())};
    uint64_t size{0};
    for (const char c : parts[1].str()) {
        size = size * 10 + static_cast<uint64_t>(c - '0');
    }
    size *= multiplier;

    // Fraction digits are scaled without floating point: ".5" adds 5/10 of the multiplier
    const std::string fraction{parts[2].str()};
    if (!fraction.empty()) {
        uint64_t numerator{0};
        uint64_t denominator{1};
        for (const char c : fraction) {
            numerator = numerator * 10 + static_cast<uint64_t>(c - '0');
            denominator *= 10;
        }
        size += multiplier * numerator / denominator;
    }
    return size;
}

std::string human_size(uint64_t bytes) {
    static constexpr std::array<const char*, 5> kUnits{"B", "KB", "MB", "GB", "TB"};
    size_t unit{0};
    auto scaled{static_cast<double>(bytes)};
    while (scaled >= static_cast<double>(kKibi) && unit + 1 < kUnits.size()) {
        scaled /= static_cast<double>(kKibi);
        ++unit;
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f %s", scaled, kUnits[unit]);
    return buffer;
}

}  // namespace arbor
