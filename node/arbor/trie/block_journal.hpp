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

#include <list>
#include <optional>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <absl/functional/function_ref.h>
#include <evmc/evmc.hpp>

#include <arbor/common/base.hpp>
#include <arbor/common/byte_key.hpp>

namespace arbor::trie {

//! \brief Keys inserted and deleted while building one block
struct BlockUpdates {
    evmc::bytes32 block_hash{};
    BlockNum block_number{0};
    absl::flat_hash_set<ByteKey> inserted_keys;
    absl::flat_hash_set<ByteKey> deleted_keys;

    //! \return Whether key was not already recorded as inserted
    bool record_insert(const ByteKey& key) { return inserted_keys.insert(key).second; }

    void record_delete(const ByteKey& key) { deleted_keys.insert(key); }

    [[nodiscard]] bool empty() const noexcept { return inserted_keys.empty() && deleted_keys.empty(); }
};

//! \brief Sealed BlockUpdates indexed by block hash and kept in seal order
//! \remarks Not thread safe: callers serialize access
class BlockJournal {
  public:
    BlockJournal() = default;

    // Not copyable nor movable
    BlockJournal(const BlockJournal&) = delete;
    BlockJournal& operator=(const BlockJournal&) = delete;

    //! \brief Appends updates at the tail
    //! \throws std::logic_error when a record with same block hash is already present
    void append(BlockUpdates&& updates);

    //! \brief Removes and returns the record for block_hash, if any
    std::optional<BlockUpdates> extract(const evmc::bytes32& block_hash);

    [[nodiscard]] bool contains(const evmc::bytes32& block_hash) const { return index_.contains(block_hash); }

    //! \brief Returns the record for block_hash, if any. The pointer is invalidated by extract
    [[nodiscard]] const BlockUpdates* find(const evmc::bytes32& block_hash) const;

    //! \brief Hashes of all records at block_number in seal order
    [[nodiscard]] std::vector<evmc::bytes32> hashes_at(BlockNum block_number) const;

    //! \brief Visits all records in seal order
    void for_each(absl::FunctionRef<void(const BlockUpdates&)> func) const;

    [[nodiscard]] size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }

  private:
    std::list<BlockUpdates> records_;
    absl::flat_hash_map<evmc::bytes32, std::list<BlockUpdates>::iterator> index_;
};

}  // namespace arbor::trie
