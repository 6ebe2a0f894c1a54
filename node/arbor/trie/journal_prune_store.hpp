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

#include <atomic>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <evmc/evmc.hpp>

#include <arbor/common/base.hpp>
#include <arbor/common/byte_key.hpp>
#include <arbor/db/kv_store.hpp>
#include <arbor/trie/block_journal.hpp>
#include <arbor/trie/ref_counter.hpp>

namespace arbor::trie {

//! \brief KeyValueStore adapter which defers every deletion of trie nodes until the block that requested it is
//! pruned, keeping nodes needed by forked blocks alive
//! \details Inserts are written through to the source store immediately and reference counted per sealed block.
//! Deletes are only journaled. prune() resolves a block as canonical: its deletes are applied to the store unless
//! the key is still claimed by another journaled block, and competing blocks at the same height are rolled back,
//! purging the keys only they inserted.
//! \remarks The journal and the reference counts live in memory only and are lost on restart. After a restart the
//! deferred deletes of blocks which were not pruned yet are never applied, while the nodes written through stay in
//! the store. A crash can then leave unreachable nodes behind but never loses reachable ones.
//! \remarks Mutating operations are serialized by one mutex guarding pending updates, journal and reference counts
//! altogether. get(), keys() and close() go straight to the source store
class JournalPruneStore : public db::KeyValueStore {
  public:
    explicit JournalPruneStore(db::KeyValueStore& source, bool prune_enabled = true);

    // Not copyable nor movable
    JournalPruneStore(const JournalPruneStore&) = delete;
    JournalPruneStore& operator=(const JournalPruneStore&) = delete;

    //! \brief Toggles journaling. When disabled inserts are written through without bookkeeping, deletes are
    //! dropped and sealing or pruning blocks does nothing
    void set_prune_enabled(bool enabled) noexcept { prune_enabled_ = enabled; }
    [[nodiscard]] bool prune_enabled() const noexcept { return prune_enabled_; }

    [[nodiscard]] std::optional<Bytes> get(ByteView key) const override;

    //! \brief Writes through a value. A missing value records a deferred delete which is never forwarded
    void put(ByteView key, std::optional<ByteView> value) override;

    //! \brief Records a deferred delete
    void erase(ByteView key) override;

    //! \brief Writes through all valued rows in one batch and records the others as deferred deletes
    void put_batch(const db::Rows& rows) override;

    void erase_batch(const std::vector<Bytes>& keys) override;

    //! \throws db::UnsupportedOperationError
    void put_to_batch(ByteView key, std::optional<ByteView> value) override;

    //! \throws db::UnsupportedOperationError
    void commit_batch() override;

    [[nodiscard]] std::vector<Bytes> keys() const override;

    //! \brief False as long as the pending updates hold inserts, otherwise tells whether the source store is empty
    [[nodiscard]] bool empty() const override;

    void close() override;

    //! \brief Seals the pending updates as the changes of block_hash and starts a new pending set
    //! \remarks Sealing a block already in the journal first rolls back its previous record: keys that only the old
    //! record inserted are purged from the source store, then the new record is appended at the journal tail
    void store_block_changes(const evmc::bytes32& block_hash, BlockNum block_number);

    //! \brief Resolves block_hash as canonical at block_number. Competing blocks at block_number are rolled back
    //! \return Whether block_hash was found in the journal
    bool prune(const evmc::bytes32& block_hash, BlockNum block_number);

    //! \brief Discards the changes of block_hash purging the keys it alone inserted
    //! \return Whether block_hash was found in the journal
    bool rollback(const evmc::bytes32& block_hash);

    /** @name Diagnostics */
    ///@{

    [[nodiscard]] std::vector<std::pair<ByteKey, RefCount>> ref_counts() const;

    //! \brief Copy of journaled records in seal order
    [[nodiscard]] std::vector<BlockUpdates> journal() const;

    [[nodiscard]] size_t journal_size() const;
    [[nodiscard]] size_t pending_inserted_count() const;
    [[nodiscard]] size_t pending_deleted_count() const;

    ///@}

    [[nodiscard]] db::KeyValueStore& source() const noexcept { return source_; }

  private:
    //! \brief Records key as inserted by pending block, ref counting it once per block. Lock must be held
    void record_insert(ByteView key);

    //! \brief Lock must be held
    bool rollback_unlocked(const evmc::bytes32& block_hash);

    db::KeyValueStore& source_;
    std::atomic<bool> prune_enabled_;

    mutable std::mutex mutex_;
    BlockUpdates pending_;
    BlockJournal journal_;
    RefCounter ref_counter_;
};

}  // namespace arbor::trie
