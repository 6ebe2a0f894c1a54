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

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>

#include <arbor/common/base.hpp>

namespace arbor {

//! \brief Right-aligns bytes into a 32-byte word, keeping only the trailing 32 bytes of longer inputs
evmc::bytes32 to_bytes32(ByteView bytes);

//! \brief Lower case hex rendering of bytes, optionally prefixed by "0x"
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Parses hex digits, with or without a "0x" prefix. An odd digit count reads as if left-padded by a 0
//! \return std::nullopt on any non hex digit
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

//! \brief Parses sizes like "256MB" or "1.5 GB" (binary multiples, case insensitive suffix)
std::optional<uint64_t> parse_size(const std::string& sizestr);

//! \brief Renders a byte count with two decimals and the largest fitting binary suffix
std::string human_size(uint64_t bytes);

bool iequals(std::string_view a, std::string_view b);

inline ethash::hash256 keccak256(ByteView view) { return ethash::keccak256(view.data(), view.size()); }

}  // namespace arbor
