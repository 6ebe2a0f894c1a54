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

#include "ref_counter.hpp"

#include <algorithm>

#include <arbor/common/ensure.hpp>

namespace arbor::trie {

void RefCounter::inc_ref(const ByteKey& key, absl::FunctionRef<bool()> durable_probe) {
    auto it{counts_.find(key)};
    if (it == counts_.end()) {
        it = counts_.emplace(key, RefCount{durable_probe(), 0}).first;
    }
    ++it->second.journal_refs;
}

RefCount RefCounter::dec_ref(const ByteKey& key, std::optional<bool> mark_durable) {
    auto it{counts_.find(key)};
    ensure_invariant(it != counts_.end(), [&key]() { return "dec_ref on untracked key " + to_hex(key.view()); });
    ensure_invariant(it->second.journal_refs > 0, [&key]() { return "dec_ref on drained key " + to_hex(key.view()); });

    // Durable mutation must land before the entry may be erased
    if (mark_durable) {
        it->second.durable = *mark_durable;
    }
    --it->second.journal_refs;
    const RefCount ret{it->second};
    if (ret.journal_refs == 0) {
        counts_.erase(it);
    }
    return ret;
}

const RefCount* RefCounter::find(const ByteKey& key) const {
    const auto it{counts_.find(key)};
    return it == counts_.end() ? nullptr : &it->second;
}

bool RefCounter::demote(const ByteKey& key) {
    auto it{counts_.find(key)};
    if (it == counts_.end()) {
        return false;
    }
    it->second.durable = false;
    return true;
}

std::vector<std::pair<ByteKey, RefCount>> RefCounter::snapshot() const {
    std::vector<std::pair<ByteKey, RefCount>> ret(counts_.begin(), counts_.end());
    std::sort(ret.begin(), ret.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    return ret;
}

}  // namespace arbor::trie
