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

#include <cstdint>

#include <intx/intx.hpp>

namespace arbor::endian {

//! \brief Writes value at dst as 4 big-endian bytes
inline void store_big_u32(uint8_t* dst, uint32_t value) noexcept { intx::be::unsafe::store(dst, value); }

//! \brief Writes value at dst as 8 big-endian bytes
inline void store_big_u64(uint8_t* dst, uint64_t value) noexcept { intx::be::unsafe::store(dst, value); }

}  // namespace arbor::endian
