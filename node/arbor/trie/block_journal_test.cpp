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

#include <catch2/catch.hpp>

namespace arbor::trie {

static BlockUpdates make_updates(const evmc::bytes32& hash, BlockNum number, uint8_t inserted) {
    BlockUpdates updates;
    updates.block_hash = hash;
    updates.block_number = number;
    updates.record_insert(ByteKey{Bytes{inserted}});
    return updates;
}

TEST_CASE("BlockUpdates") {
    BlockUpdates updates;
    CHECK(updates.empty());
    const ByteKey key{Bytes{0x0a}};
    CHECK(updates.record_insert(key));
    CHECK_FALSE(updates.record_insert(key));
    updates.record_delete(key);
    updates.record_delete(key);
    CHECK(updates.inserted_keys.size() == 1);
    CHECK(updates.deleted_keys.size() == 1);
    CHECK_FALSE(updates.empty());
}

TEST_CASE("BlockJournal") {
    const auto hash_a{0x000000000000000000000000000000000000000000000000000000000000000a_bytes32};
    const auto hash_b{0x000000000000000000000000000000000000000000000000000000000000000b_bytes32};
    const auto hash_c{0x000000000000000000000000000000000000000000000000000000000000000c_bytes32};

    BlockJournal journal;
    CHECK(journal.empty());
    CHECK_FALSE(journal.extract(hash_a).has_value());

    journal.append(make_updates(hash_b, 10, 0x01));
    journal.append(make_updates(hash_c, 11, 0x02));
    journal.append(make_updates(hash_a, 10, 0x03));
    REQUIRE(journal.size() == 3);

    SECTION("Records are kept in seal order") {
        std::vector<evmc::bytes32> order;
        journal.for_each([&order](const BlockUpdates& updates) { order.push_back(updates.block_hash); });
        CHECK(order == std::vector<evmc::bytes32>{hash_b, hash_c, hash_a});
        CHECK(journal.hashes_at(10) == std::vector<evmc::bytes32>{hash_b, hash_a});
        CHECK(journal.hashes_at(11) == std::vector<evmc::bytes32>{hash_c});
        CHECK(journal.hashes_at(12).empty());
    }

    SECTION("Extract removes the record") {
        CHECK(journal.contains(hash_c));
        REQUIRE(journal.find(hash_c));
        CHECK(journal.find(hash_c)->block_number == 11);

        const auto updates{journal.extract(hash_c)};
        REQUIRE(updates.has_value());
        CHECK(updates->block_number == 11);
        CHECK(updates->inserted_keys.contains(ByteKey{Bytes{0x02}}));
        CHECK_FALSE(journal.contains(hash_c));
        CHECK_FALSE(journal.find(hash_c));
        CHECK(journal.size() == 2);
        CHECK_FALSE(journal.extract(hash_c).has_value());
    }

    SECTION("Appending an existing hash fails") {
        CHECK_THROWS_AS(journal.append(make_updates(hash_a, 12, 0x04)), std::logic_error);
        CHECK(journal.size() == 3);
    }

    SECTION("Reappended hash goes to the tail") {
        (void)journal.extract(hash_b);
        journal.append(make_updates(hash_b, 10, 0x01));
        CHECK(journal.hashes_at(10) == std::vector<evmc::bytes32>{hash_a, hash_b});
    }
}

}  // namespace arbor::trie
