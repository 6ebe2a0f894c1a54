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

#include <ostream>
#include <utility>

#include <arbor/common/base.hpp>
#include <arbor/common/util.hpp>

namespace arbor {

//! \brief An owned, immutable sequence of bytes used as key of hash maps and sets.
//! \remarks Equality, ordering and hashing are by content. Hashing plugs into Abseil through AbslHashValue so
//! ByteKey can be used directly with absl::flat_hash_map and absl::flat_hash_set.
class ByteKey {
  public:
    ByteKey() = default;
    explicit ByteKey(ByteView data) : data_{data} {}
    explicit ByteKey(Bytes&& data) noexcept : data_{std::move(data)} {}

    [[nodiscard]] ByteView view() const noexcept { return data_; }
    [[nodiscard]] const Bytes& bytes() const noexcept { return data_; }
    [[nodiscard]] size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    friend bool operator==(const ByteKey& lhs, const ByteKey& rhs) noexcept { return lhs.data_ == rhs.data_; }
    friend bool operator!=(const ByteKey& lhs, const ByteKey& rhs) noexcept { return !(lhs == rhs); }
    friend bool operator<(const ByteKey& lhs, const ByteKey& rhs) noexcept {
        return lhs.view().compare(rhs.view()) < 0;
    }

    template <typename H>
    friend H AbslHashValue(H h, const ByteKey& key) {
        return H::combine(H::combine_contiguous(std::move(h), key.data_.data(), key.data_.size()), key.data_.size());
    }

    friend std::ostream& operator<<(std::ostream& out, const ByteKey& key) { return out << to_hex(key.view()); }

  private:
    Bytes data_;
};

}  // namespace arbor
