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

#include <stdexcept>
#include <thread>

#include <catch2/catch.hpp>

#include <arbor/common/endian.hpp>
#include <arbor/common/util.hpp>
#include <arbor/db/memory_store.hpp>
#include <arbor/test/log.hpp>

namespace arbor::trie {

// MemoryStore recording the calls it receives
class CountingStore : public db::MemoryStore {
  public:
    [[nodiscard]] std::optional<Bytes> get(ByteView key) const override {
        ++reads;
        return MemoryStore::get(key);
    }
    void put(ByteView key, std::optional<ByteView> value) override {
        ++writes;
        MemoryStore::put(key, value);
    }
    void erase(ByteView key) override {
        ++writes;
        MemoryStore::erase(key);
    }
    void put_batch(const db::Rows& rows) override {
        ++writes;
        ++put_batches;
        MemoryStore::put_batch(rows);
    }
    void erase_batch(const std::vector<Bytes>& keys) override {
        ++writes;
        ++erase_batches;
        MemoryStore::erase_batch(keys);
    }

    [[nodiscard]] size_t calls() const { return reads + writes; }

    mutable size_t reads{0};
    size_t writes{0};
    size_t put_batches{0};
    size_t erase_batches{0};
};

// MemoryStore swallowing single writes, as an asynchronous store would before flushing
class LaggingStore : public db::MemoryStore {
  public:
    void put(ByteView, std::optional<ByteView>) override {}
};

// MemoryStore failing physical deletes
class FailingStore : public db::MemoryStore {
  public:
    void erase_batch(const std::vector<Bytes>&) override { throw std::runtime_error("disk full"); }
};

static evmc::bytes32 block_hash(uint64_t n, uint8_t fork = 0) {
    evmc::bytes32 hash;
    hash.bytes[0] = fork;
    endian::store_big_u64(&hash.bytes[24], n);
    return hash;
}

static Bytes node(std::string_view hex) { return *from_hex(hex); }

static const Bytes kValue{*from_hex("0xc0ffee")};

static void check_ref_invariant(const JournalPruneStore& store) {
    for (const auto& [key, ref] : store.ref_counts()) {
        CHECK(ref.journal_refs > 0);
        CHECK(ref.total_refs() >= 1);
    }
}

TEST_CASE("JournalPruneStore insert seal prune") {
    db::MemoryStore source;
    JournalPruneStore store{source};
    const Bytes k{node("0x0a01")};

    store.put(k, kValue);
    CHECK(source.get(k) == kValue);  // Written through before sealing
    CHECK(store.pending_inserted_count() == 1);

    store.store_block_changes(block_hash(1), 1);
    CHECK(store.pending_inserted_count() == 0);
    REQUIRE(store.journal_size() == 1);
    const auto refs{store.ref_counts()};
    REQUIRE(refs.size() == 1);
    CHECK(refs[0].second == RefCount{false, 1});

    CHECK(store.prune(block_hash(1), 1));
    CHECK(store.get(k) == kValue);
    CHECK(store.ref_counts().empty());
    CHECK(store.journal_size() == 0);

    // Already pruned
    CHECK_FALSE(store.prune(block_hash(1), 1));
    CHECK(store.get(k) == kValue);
}

TEST_CASE("JournalPruneStore fork resolution") {
    test::SetLogVerbosityGuard log_guard{log::Level::kNone};
    db::MemoryStore source;
    JournalPruneStore store{source};
    const Bytes k1{node("0x0a01")};
    const Bytes k2{node("0x0b02")};
    const Bytes k3{node("0x0c03")};

    store.put(k1, kValue);
    store.store_block_changes(block_hash(10, 0), 10);
    store.put(k2, kValue);
    store.store_block_changes(block_hash(10, 1), 10);
    store.put(k3, kValue);
    store.store_block_changes(block_hash(11, 1), 11);
    REQUIRE(source.size() == 3);

    CHECK(store.prune(block_hash(10, 0), 10));
    CHECK(source.get(k1) == kValue);
    CHECK_FALSE(source.get(k2).has_value());
    CHECK(source.get(k3) == kValue);  // Not at the pruned height

    const auto journal{store.journal()};
    REQUIRE(journal.size() == 1);
    CHECK(journal[0].block_hash == block_hash(11, 1));
    CHECK_FALSE(store.rollback(block_hash(10, 1)));
    check_ref_invariant(store);
}

TEST_CASE("JournalPruneStore shared key across forks") {
    test::SetLogVerbosityGuard log_guard{log::Level::kNone};
    db::MemoryStore source;
    JournalPruneStore store{source};
    const Bytes shared{node("0x0a01")};
    const Bytes only_b{node("0x0b02")};

    store.put(shared, kValue);
    store.store_block_changes(block_hash(5, 0), 5);
    store.put(shared, kValue);
    store.put(only_b, kValue);
    store.store_block_changes(block_hash(5, 1), 5);

    SECTION("Canonical block keeps the shared key") {
        CHECK(store.prune(block_hash(5, 1), 5));
        CHECK(source.get(shared) == kValue);
        CHECK(source.get(only_b) == kValue);
        CHECK(store.ref_counts().empty());
    }

    SECTION("Rolled back sibling keeps the shared key") {
        CHECK(store.rollback(block_hash(5, 1)));
        CHECK(source.get(shared) == kValue);
        CHECK_FALSE(source.get(only_b).has_value());
        const auto refs{store.ref_counts()};
        REQUIRE(refs.size() == 1);
        CHECK(refs[0].second == RefCount{false, 1});
    }
}

TEST_CASE("JournalPruneStore delete then reinsert") {
    test::SetLogVerbosityGuard log_guard{log::Level::kNone};
    db::MemoryStore source;
    const Bytes k{node("0x0a01")};
    source.put(k, kValue);
    JournalPruneStore store{source};

    store.erase(k);
    CHECK(store.pending_deleted_count() == 1);
    CHECK(source.get(k) == kValue);  // Deferred
    store.store_block_changes(block_hash(100), 100);

    const Bytes v2{*from_hex("0xbeef")};
    store.put(k, v2);
    store.store_block_changes(block_hash(110), 110);

    CHECK(store.prune(block_hash(100), 100));
    CHECK(source.get(k) == v2);
    auto refs{store.ref_counts()};
    REQUIRE(refs.size() == 1);
    CHECK(refs[0].second == RefCount{false, 1});  // Demoted by the prior delete

    SECTION("Reinserting block becomes canonical") {
        CHECK(store.prune(block_hash(110), 110));
        CHECK(source.get(k) == v2);
        CHECK(store.ref_counts().empty());
    }

    SECTION("Reinserting block is discarded") {
        CHECK(store.rollback(block_hash(110)));
        CHECK_FALSE(source.get(k).has_value());
        CHECK(store.ref_counts().empty());
    }
}

TEST_CASE("JournalPruneStore delete applied on prune") {
    db::MemoryStore source;
    const Bytes stale{node("0x0a01")};
    const Bytes fresh{node("0x0b02")};
    source.put(stale, kValue);
    JournalPruneStore store{source};

    store.put(fresh, kValue);
    store.put(stale, std::nullopt);
    store.store_block_changes(block_hash(7), 7);
    CHECK(source.get(stale) == kValue);

    CHECK(store.prune(block_hash(7), 7));
    CHECK_FALSE(source.get(stale).has_value());
    CHECK(source.get(fresh) == kValue);
}

TEST_CASE("JournalPruneStore delete claimed by pending insert") {
    test::SetLogVerbosityGuard log_guard{log::Level::kNone};
    db::MemoryStore source;
    const Bytes k{node("0x0a01")};
    source.put(k, kValue);
    JournalPruneStore store{source};

    store.erase(k);
    store.store_block_changes(block_hash(1), 1);

    // Reinserted by the block under construction
    const Bytes v2{*from_hex("0xbeef")};
    store.put(k, v2);
    auto refs{store.ref_counts()};
    REQUIRE(refs.size() == 1);
    CHECK(refs[0].second == RefCount{true, 1});

    CHECK(store.prune(block_hash(1), 1));
    CHECK(source.get(k) == v2);
    refs = store.ref_counts();
    REQUIRE(refs.size() == 1);
    CHECK(refs[0].second == RefCount{false, 1});
    CHECK(store.pending_inserted_count() == 1);

    store.store_block_changes(block_hash(2), 2);

    SECTION("Reinserting block becomes canonical") {
        CHECK(store.prune(block_hash(2), 2));
        CHECK(source.get(k) == v2);
        CHECK(store.ref_counts().empty());
    }

    SECTION("Reinserting block is discarded") {
        CHECK(store.rollback(block_hash(2)));
        CHECK_FALSE(source.get(k).has_value());
        CHECK(store.ref_counts().empty());
    }
}

TEST_CASE("JournalPruneStore insert and delete in one block") {
    db::MemoryStore source;
    const Bytes fresh{node("0x0a01")};
    const Bytes preexisting{node("0x0b02")};
    source.put(preexisting, kValue);
    JournalPruneStore store{source};

    store.put(fresh, kValue);
    store.erase(fresh);
    store.put(preexisting, kValue);
    store.erase(preexisting);
    CHECK(store.pending_inserted_count() == 2);
    CHECK(store.pending_deleted_count() == 2);
    store.store_block_changes(block_hash(4), 4);

    const auto refs{store.ref_counts()};
    REQUIRE(refs.size() == 2);
    CHECK(source.get(fresh) == kValue);
    CHECK(source.get(preexisting) == kValue);

    // The block's own inserts are released before its deletes are weighed
    CHECK(store.prune(block_hash(4), 4));
    CHECK_FALSE(source.get(fresh).has_value());
    CHECK_FALSE(source.get(preexisting).has_value());
    CHECK(store.ref_counts().empty());
    CHECK(source.empty());
}

TEST_CASE("JournalPruneStore rollback") {
    db::MemoryStore source;
    const Bytes preexisting{node("0x0a01")};
    const Bytes fresh{node("0x0b02")};
    source.put(preexisting, kValue);
    JournalPruneStore store{source};

    store.put(preexisting, kValue);
    store.put(fresh, kValue);
    store.store_block_changes(block_hash(3), 3);

    CHECK(store.rollback(block_hash(3)));
    CHECK(source.get(preexisting) == kValue);  // Durable before the block
    CHECK_FALSE(source.get(fresh).has_value());
    CHECK(store.ref_counts().empty());
    CHECK_FALSE(store.rollback(block_hash(3)));
}

TEST_CASE("JournalPruneStore absent block") {
    CountingStore source;
    JournalPruneStore store{source};
    const Bytes k{node("0x0a01")};
    store.put(k, kValue);
    store.store_block_changes(block_hash(1), 1);
    const auto calls{source.calls()};
    const auto refs{store.ref_counts()};

    CHECK_FALSE(store.prune(block_hash(2), 2));
    CHECK_FALSE(store.prune(block_hash(1, 1), 1));
    CHECK_FALSE(store.rollback(block_hash(2)));
    CHECK(source.calls() == calls);
    CHECK(store.journal_size() == 1);
    CHECK(store.ref_counts() == refs);
}

TEST_CASE("JournalPruneStore batches") {
    CountingStore source;
    JournalPruneStore store{source};
    const Bytes k1{node("0x0a01")};
    const Bytes k2{node("0x0b02")};
    const Bytes k3{node("0x0c03")};
    source.MemoryStore::put(k3, kValue);

    db::Rows rows;
    rows.emplace(k1, kValue);
    rows.emplace(k2, kValue);
    rows.emplace(k3, std::nullopt);
    store.put_batch(rows);
    CHECK(source.put_batches == 1);
    CHECK(source.get(k1) == kValue);
    CHECK(source.get(k3) == kValue);
    CHECK(store.pending_inserted_count() == 2);
    CHECK(store.pending_deleted_count() == 1);

    store.erase_batch({k1, k2});
    CHECK(store.pending_deleted_count() == 3);
    CHECK(source.get(k1) == kValue);

    store.store_block_changes(block_hash(1), 1);
    CHECK(store.prune(block_hash(1), 1));
    CHECK(source.erase_batches == 1);
    CHECK(source.empty());

    SECTION("Only deletes issue no batch write") {
        const auto put_batches{source.put_batches};
        db::Rows deletes;
        deletes.emplace(k1, std::nullopt);
        store.put_batch(deletes);
        CHECK(source.put_batches == put_batches);
    }
}

TEST_CASE("JournalPruneStore repeated insert in one block") {
    db::MemoryStore source;
    JournalPruneStore store{source};
    const Bytes k{node("0x0a01")};

    store.put(k, kValue);
    store.put(k, *from_hex("0xbeef"));
    store.store_block_changes(block_hash(1), 1);
    const auto refs{store.ref_counts()};
    REQUIRE(refs.size() == 1);
    CHECK(refs[0].second.journal_refs == 1);

    CHECK(store.prune(block_hash(1), 1));
    CHECK(store.ref_counts().empty());
}

TEST_CASE("JournalPruneStore disabled") {
    CountingStore source;
    const Bytes k{node("0x0a01")};
    const Bytes other{node("0x0b02")};
    source.MemoryStore::put(other, kValue);
    JournalPruneStore store{source, /*prune_enabled=*/false};
    CHECK_FALSE(store.prune_enabled());

    store.put(k, kValue);
    CHECK(source.get(k) == kValue);
    CHECK(store.pending_inserted_count() == 0);
    CHECK(store.ref_counts().empty());

    const auto writes{source.writes};
    store.erase(other);
    store.put(other, std::nullopt);
    store.erase_batch({other});
    db::Rows rows;
    rows.emplace(other, std::nullopt);
    store.put_batch(rows);
    CHECK(source.writes == writes);
    CHECK(source.get(other) == kValue);
    CHECK(store.pending_deleted_count() == 0);

    store.store_block_changes(block_hash(1), 1);
    CHECK(store.journal_size() == 0);
    CHECK_FALSE(store.prune(block_hash(1), 1));

    SECTION("Enabling starts bookkeeping") {
        store.set_prune_enabled(true);
        store.erase(other);
        CHECK(store.pending_deleted_count() == 1);
        store.store_block_changes(block_hash(2), 2);
        CHECK(store.prune(block_hash(2), 2));
        CHECK_FALSE(source.get(other).has_value());
    }
}

TEST_CASE("JournalPruneStore emptiness") {
    LaggingStore source;
    JournalPruneStore store{source};
    const Bytes k{node("0x0a01")};
    CHECK(store.empty());

    store.erase(k);
    CHECK(store.empty());  // Pending deletes do not count

    store.put(k, kValue);
    CHECK(source.empty());
    CHECK_FALSE(store.empty());

    store.store_block_changes(block_hash(1), 1);
    CHECK(store.empty());
}

TEST_CASE("JournalPruneStore unsupported operations") {
    db::MemoryStore source;
    JournalPruneStore store{source};
    const Bytes k{node("0x0a01")};
    CHECK_THROWS_AS(store.put_to_batch(k, ByteView{kValue}), db::UnsupportedOperationError);
    CHECK_THROWS_AS(store.commit_batch(), db::UnsupportedOperationError);
    CHECK(source.empty());
    CHECK(store.pending_inserted_count() == 0);
}

TEST_CASE("JournalPruneStore sealing a block twice") {
    test::SetLogVerbosityGuard log_guard{log::Level::kNone};
    db::MemoryStore source;
    JournalPruneStore store{source};
    const Bytes k1{node("0x0a01")};
    const Bytes k2{node("0x0b02")};
    const Bytes k3{node("0x0c03")};

    store.put(k1, kValue);
    store.store_block_changes(block_hash(4), 4);
    store.put(k3, kValue);
    store.store_block_changes(block_hash(5), 5);
    store.put(k2, kValue);
    store.store_block_changes(block_hash(4), 4);

    // The old record's exclusive key is purged and the new record moves to the tail
    CHECK_FALSE(source.get(k1).has_value());
    CHECK(source.get(k2) == kValue);
    const auto journal{store.journal()};
    REQUIRE(journal.size() == 2);
    CHECK(journal[0].block_hash == block_hash(5));
    CHECK(journal[1].block_hash == block_hash(4));

    CHECK(store.prune(block_hash(4), 4));
    CHECK(source.get(k2) == kValue);
    CHECK(source.get(k3) == kValue);
    const auto refs{store.ref_counts()};
    REQUIRE(refs.size() == 1);
    CHECK(refs[0].first == ByteKey{k3});
}

TEST_CASE("JournalPruneStore store failures propagate") {
    FailingStore source;
    JournalPruneStore store{source};
    const Bytes k{node("0x0a01")};
    source.MemoryStore::put(k, kValue);

    store.erase(k);
    store.store_block_changes(block_hash(1), 1);
    CHECK_THROWS_AS(store.prune(block_hash(1), 1), std::runtime_error);
    CHECK(source.get(k) == kValue);
    CHECK(store.journal_size() == 0);  // In memory state already moved on
}

TEST_CASE("JournalPruneStore closes its source") {
    db::MemoryStore source;
    JournalPruneStore store{source};
    CHECK(&store.source() == &source);
    store.close();
    CHECK_THROWS_AS(source.keys(), std::runtime_error);
}

TEST_CASE("JournalPruneStore chain with forks") {
    test::SetLogVerbosityGuard log_guard{log::Level::kNone};
    db::MemoryStore source;
    JournalPruneStore store{source};
    constexpr BlockNum kBlocks{20};
    constexpr uint8_t kForks{3};
    constexpr BlockNum kDepth{4};

    auto key_of = [](BlockNum n, uint8_t fork) {
        Bytes key(9, '\0');
        endian::store_big_u64(&key[0], n);
        key[8] = fork;
        return key;
    };

    for (BlockNum n{1}; n <= kBlocks; ++n) {
        for (uint8_t fork{0}; fork < kForks; ++fork) {
            store.put(key_of(n, fork), kValue);
            if (fork == 0 && n > 1) {
                store.erase(key_of(n - 1, 0));  // Canonical chain replaces its previous node
            }
            store.store_block_changes(block_hash(n, fork), n);
        }
        if (n > kDepth) {
            CHECK(store.prune(block_hash(n - kDepth, 0), n - kDepth));
        }
        check_ref_invariant(store);
    }
    for (BlockNum n{kBlocks - kDepth + 1}; n <= kBlocks; ++n) {
        CHECK(store.prune(block_hash(n, 0), n));
    }

    CHECK(store.journal_size() == 0);
    CHECK(store.ref_counts().empty());
    CHECK(source.keys() == std::vector<Bytes>{key_of(kBlocks, 0)});
}

TEST_CASE("JournalPruneStore concurrent writers") {
    db::MemoryStore source;
    JournalPruneStore store{source};
    constexpr size_t kThreads{4};
    constexpr uint64_t kBlocksPerThread{50};

    std::vector<std::thread> writers;
    for (size_t t{0}; t < kThreads; ++t) {
        writers.emplace_back([&store, t]() {
            for (uint64_t i{0}; i < kBlocksPerThread; ++i) {
                Bytes key(9, '\0');
                key[0] = static_cast<uint8_t>(t);
                endian::store_big_u64(&key[1], i);
                store.put(key, kValue);
                (void)store.get(key);
                store.store_block_changes(block_hash(i, static_cast<uint8_t>(t)), t * kBlocksPerThread + i);
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    const auto journal{store.journal()};
    CHECK(journal.size() == kThreads * kBlocksPerThread);
    for (const auto& updates : journal) {
        CHECK(store.prune(updates.block_hash, updates.block_number));
    }
    CHECK(store.ref_counts().empty());
    CHECK(source.size() == kThreads * kBlocksPerThread);
}

}  // namespace arbor::trie
