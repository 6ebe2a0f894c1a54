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

#ifndef ARBOR_COMMON_BASE_HPP_
#define ARBOR_COMMON_BASE_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#include <evmc/evmc.hpp>
#pragma GCC diagnostic pop

namespace arbor {

using namespace evmc::literals;

using Bytes = std::basic_string<uint8_t>;

//! \brief Non-owning view over bytes, constructible from Bytes, byte arrays and 32-byte hashes
class ByteView : public std::basic_string_view<uint8_t> {
  public:
    constexpr ByteView() noexcept = default;

    constexpr ByteView(const std::basic_string_view<uint8_t>& other) noexcept
        : std::basic_string_view<uint8_t>{other.data(), other.length()} {}

    ByteView(const Bytes& str) noexcept : std::basic_string_view<uint8_t>{str.data(), str.length()} {}

    constexpr ByteView(const uint8_t* data, size_type length) noexcept
        : std::basic_string_view<uint8_t>{data, length} {}

    template <std::size_t N>
    constexpr ByteView(const uint8_t (&array)[N]) noexcept : std::basic_string_view<uint8_t>{array, N} {}

    template <std::size_t N>
    constexpr ByteView(const std::array<uint8_t, N>& array) noexcept
        : std::basic_string_view<uint8_t>{array.data(), N} {}

    constexpr ByteView(const evmc::bytes32& hash) noexcept : ByteView{hash.bytes} {}
};

//! \brief Height of a block in the chain
using BlockNum = uint64_t;

// Binary size multiples, used for map geometry and size options
inline constexpr uint64_t kKibi{uint64_t{1} << 10};
inline constexpr uint64_t kMebi{kKibi << 10};
inline constexpr uint64_t kGibi{kMebi << 10};
inline constexpr uint64_t kTebi{kGibi << 10};

constexpr uint64_t operator"" _Kibi(unsigned long long x) { return x * kKibi; }
constexpr uint64_t operator"" _Mebi(unsigned long long x) { return x * kMebi; }
constexpr uint64_t operator"" _Gibi(unsigned long long x) { return x * kGibi; }

}  // namespace arbor

#endif  // ARBOR_COMMON_BASE_HPP_
