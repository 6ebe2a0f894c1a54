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

#include "journal_prune_store.hpp"

#include <string>

#include <arbor/common/log.hpp>
#include <arbor/common/util.hpp>

namespace arbor::trie {

JournalPruneStore::JournalPruneStore(db::KeyValueStore& source, bool prune_enabled)
    : source_{source}, prune_enabled_{prune_enabled} {}

std::optional<Bytes> JournalPruneStore::get(ByteView key) const { return source_.get(key); }

std::vector<Bytes> JournalPruneStore::keys() const { return source_.keys(); }

void JournalPruneStore::close() { source_.close(); }

void JournalPruneStore::record_insert(ByteView key) {
    ByteKey byte_key{key};
    if (pending_.record_insert(byte_key)) {
        // Durability is probed before the value is written through
        ref_counter_.inc_ref(byte_key, [&]() { return source_.get(key).has_value(); });
    }
}

void JournalPruneStore::put(ByteView key, std::optional<ByteView> value) {
    if (!value) {
        erase(key);
        return;
    }
    std::scoped_lock lock{mutex_};
    if (prune_enabled_) {
        record_insert(key);
    }
    source_.put(key, value);
}

void JournalPruneStore::erase(ByteView key) {
    if (!prune_enabled_) {
        return;
    }
    std::scoped_lock lock{mutex_};
    pending_.record_delete(ByteKey{key});
}

void JournalPruneStore::put_batch(const db::Rows& rows) {
    std::scoped_lock lock{mutex_};
    const bool enabled{prune_enabled_};
    db::Rows inserts;
    for (const auto& [key, value] : rows) {
        if (value) {
            if (enabled) {
                record_insert(key);
            }
            inserts.emplace(key, value);
        } else if (enabled) {
            pending_.record_delete(ByteKey{key});
        }
    }
    if (!inserts.empty()) {
        source_.put_batch(inserts);
    }
}

void JournalPruneStore::erase_batch(const std::vector<Bytes>& keys) {
    if (!prune_enabled_) {
        return;
    }
    std::scoped_lock lock{mutex_};
    for (const auto& key : keys) {
        pending_.record_delete(ByteKey{key});
    }
}

void JournalPruneStore::put_to_batch(ByteView, std::optional<ByteView>) {
    throw db::UnsupportedOperationError("JournalPruneStore does not support put_to_batch, use put_batch");
}

void JournalPruneStore::commit_batch() {
    throw db::UnsupportedOperationError("JournalPruneStore does not support commit_batch, use put_batch");
}

bool JournalPruneStore::empty() const {
    {
        std::scoped_lock lock{mutex_};
        if (!pending_.inserted_keys.empty()) {
            return false;
        }
    }
    return source_.empty();
}

void JournalPruneStore::store_block_changes(const evmc::bytes32& block_hash, BlockNum block_number) {
    if (!prune_enabled_) {
        return;
    }
    std::scoped_lock lock{mutex_};
    if (journal_.contains(block_hash)) {
        log::Warning("Block sealed twice, discarding its previous changes",
                     {"number", std::to_string(block_number), "hash", to_hex(block_hash, true)});
        rollback_unlocked(block_hash);
    }
    pending_.block_hash = block_hash;
    pending_.block_number = block_number;
    ARBOR_TRACE << "Sealed block " << block_number << " inserted=" << pending_.inserted_keys.size()
                << " deleted=" << pending_.deleted_keys.size();
    journal_.append(std::exchange(pending_, BlockUpdates{}));
}

bool JournalPruneStore::prune(const evmc::bytes32& block_hash, BlockNum block_number) {
    if (!prune_enabled_) {
        return false;
    }
    std::scoped_lock lock{mutex_};
    auto updates{journal_.extract(block_hash)};
    if (!updates) {
        return false;
    }

    // Inserts of a canonical block become durable
    for (const auto& key : updates->inserted_keys) {
        ref_counter_.dec_ref(key, /*mark_durable=*/true);
    }

    std::vector<Bytes> purged;
    for (const auto& key : updates->deleted_keys) {
        const RefCount* ref{ref_counter_.find(key)};
        if (!ref || ref->journal_refs == 0) {
            purged.push_back(key.bytes());
        } else {
            ref_counter_.demote(key);
        }
    }
    if (!purged.empty()) {
        source_.erase_batch(purged);
    }

    const auto siblings{journal_.hashes_at(block_number)};
    for (const auto& sibling : siblings) {
        rollback_unlocked(sibling);
    }

    log::Debug("Pruned block", {"number", std::to_string(block_number), "hash", to_hex(block_hash, true),
                                "inserted", std::to_string(updates->inserted_keys.size()),
                                "deleted", std::to_string(updates->deleted_keys.size()),
                                "purged", std::to_string(purged.size()),
                                "siblings", std::to_string(siblings.size())});
    return true;
}

bool JournalPruneStore::rollback(const evmc::bytes32& block_hash) {
    std::scoped_lock lock{mutex_};
    return rollback_unlocked(block_hash);
}

bool JournalPruneStore::rollback_unlocked(const evmc::bytes32& block_hash) {
    auto updates{journal_.extract(block_hash)};
    if (!updates) {
        return false;
    }

    db::Rows tombstones;
    for (const auto& key : updates->inserted_keys) {
        if (ref_counter_.dec_ref(key).total_refs() == 0) {
            tombstones.emplace(key.bytes(), std::nullopt);
        }
    }
    if (!tombstones.empty()) {
        source_.put_batch(tombstones);
    }

    log::Debug("Rolled back block", {"number", std::to_string(updates->block_number), "hash",
                                     to_hex(block_hash, true), "inserted",
                                     std::to_string(updates->inserted_keys.size()), "purged",
                                     std::to_string(tombstones.size())});
    return true;
}

std::vector<std::pair<ByteKey, RefCount>> JournalPruneStore::ref_counts() const {
    std::scoped_lock lock{mutex_};
    return ref_counter_.snapshot();
}

std::vector<BlockUpdates> JournalPruneStore::journal() const {
    std::scoped_lock lock{mutex_};
    std::vector<BlockUpdates> ret;
    ret.reserve(journal_.size());
    journal_.for_each([&ret](const BlockUpdates& updates) { ret.push_back(updates); });
    return ret;
}

size_t JournalPruneStore::journal_size() const {
    std::scoped_lock lock{mutex_};
    return journal_.size();
}

size_t JournalPruneStore::pending_inserted_count() const {
    std::scoped_lock lock{mutex_};
    return pending_.inserted_keys.size();
}

size_t JournalPruneStore::pending_deleted_count() const {
    std::scoped_lock lock{mutex_};
    return pending_.deleted_keys.size();
}

}  // namespace arbor::trie
