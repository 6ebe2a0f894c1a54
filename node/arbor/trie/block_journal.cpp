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

#include "block_journal.hpp"

#include <iterator>
#include <utility>

#include <arbor/common/ensure.hpp>
#include <arbor/common/util.hpp>

namespace arbor::trie {

void BlockJournal::append(BlockUpdates&& updates) {
    ensure_invariant(!contains(updates.block_hash), [&updates]() {
        return "block " + to_hex(updates.block_hash, true) + " already journaled";
    });
    records_.push_back(std::move(updates));
    auto last{std::prev(records_.end())};
    index_.emplace(last->block_hash, last);
}

std::optional<BlockUpdates> BlockJournal::extract(const evmc::bytes32& block_hash) {
    const auto it{index_.find(block_hash)};
    if (it == index_.end()) {
        return std::nullopt;
    }
    auto record{it->second};
    index_.erase(it);
    std::optional<BlockUpdates> ret{std::move(*record)};
    records_.erase(record);
    return ret;
}

const BlockUpdates* BlockJournal::find(const evmc::bytes32& block_hash) const {
    const auto it{index_.find(block_hash)};
    return it == index_.end() ? nullptr : &*it->second;
}

std::vector<evmc::bytes32> BlockJournal::hashes_at(BlockNum block_number) const {
    std::vector<evmc::bytes32> ret;
    for (const auto& record : records_) {
        if (record.block_number == block_number) {
            ret.push_back(record.block_hash);
        }
    }
    return ret;
}

void BlockJournal::for_each(absl::FunctionRef<void(const BlockUpdates&)> func) const {
    for (const auto& record : records_) {
        func(record);
    }
}

}  // namespace arbor::trie
