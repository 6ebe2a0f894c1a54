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
#include <optional>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/functional/function_ref.h>

#include <arbor/common/byte_key.hpp>

namespace arbor::trie {

//! \brief Reference count of a key claimed by sealed blocks still in the journal
struct RefCount {
    bool durable{false};        // Whether the key is held by the backing store regardless of journal claims
    uint32_t journal_refs{0};  // Number of journaled blocks having inserted the key

    [[nodiscard]] uint32_t total_refs() const noexcept { return journal_refs + (durable ? 1u : 0u); }

    friend bool operator==(const RefCount&, const RefCount&) = default;
};

//! \brief Tracks per key reference counts. An entry exists if and only if its journal_refs is greater than zero
//! \remarks Not thread safe: callers serialize access
class RefCounter {
  public:
    RefCounter() = default;

    // Not copyable nor movable
    RefCounter(const RefCounter&) = delete;
    RefCounter& operator=(const RefCounter&) = delete;

    //! \brief Adds one journal reference to key
    //! \param [in] durable_probe : invoked only when key is not tracked yet, tells whether the backing store
    //! already holds key before the insert being recorded
    void inc_ref(const ByteKey& key, absl::FunctionRef<bool()> durable_probe);

    //! \brief Removes one journal reference from key, erasing the entry when no journal reference is left
    //! \param [in] mark_durable : when set, overwrites the durable flag before the decrement
    //! \return A copy of the entry as it is after the (optional) durable mutation and the decrement
    //! \throws std::logic_error when key is not tracked
    RefCount dec_ref(const ByteKey& key, std::optional<bool> mark_durable = std::nullopt);

    //! \brief Returns the entry for key, if any. The pointer is invalidated by any mutation
    [[nodiscard]] const RefCount* find(const ByteKey& key) const;

    //! \brief Clears the durable flag of a tracked key
    //! \return Whether key is tracked
    bool demote(const ByteKey& key);

    [[nodiscard]] size_t size() const noexcept { return counts_.size(); }
    [[nodiscard]] bool empty() const noexcept { return counts_.empty(); }

    //! \brief Returns a copy of all entries sorted by key
    [[nodiscard]] std::vector<std::pair<ByteKey, RefCount>> snapshot() const;

  private:
    absl::flat_hash_map<ByteKey, RefCount> counts_;
};

}  // namespace arbor::trie
