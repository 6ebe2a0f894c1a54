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

#include "memory_store.hpp"

#include <catch2/catch.hpp>

#include <arbor/common/util.hpp>

namespace arbor::db {

TEST_CASE("MemoryStore") {
    MemoryStore store;
    const Bytes key1{*from_hex("0x01")};
    const Bytes key2{*from_hex("0x02")};
    const Bytes key3{*from_hex("0x0301")};
    const Bytes value{*from_hex("0xc0ffee")};

    CHECK(store.empty());
    CHECK_FALSE(store.get(key1).has_value());

    SECTION("Single writes") {
        store.put(key2, value);
        store.put(key1, value);
        CHECK_FALSE(store.empty());
        CHECK(store.get(key1) == value);
        CHECK(store.keys() == std::vector<Bytes>{key1, key2});

        store.put(key1, std::nullopt);
        CHECK_FALSE(store.get(key1).has_value());
        store.erase(key2);
        CHECK(store.empty());
    }

    SECTION("Batch writes") {
        store.put(key3, value);
        Rows rows;
        rows.emplace(key1, value);
        rows.emplace(key2, value);
        rows.emplace(key3, std::nullopt);
        store.put_batch(rows);
        CHECK(store.keys() == std::vector<Bytes>{key1, key2});

        store.erase_batch({key1, key3});
        CHECK(store.keys() == std::vector<Bytes>{key2});
        CHECK(store.size() == 1);
    }

    SECTION("Staged batch") {
        store.put(key1, value);
        store.put_to_batch(key2, value);
        store.put_to_batch(key1, std::nullopt);
        CHECK(store.get(key1).has_value());
        CHECK_FALSE(store.get(key2).has_value());

        store.commit_batch();
        CHECK_FALSE(store.get(key1).has_value());
        CHECK(store.get(key2) == value);

        // Nothing staged anymore
        store.commit_batch();
        CHECK(store.size() == 1);
    }

    SECTION("Closed") {
        store.put(key1, value);
        store.close();
        CHECK_THROWS_AS(store.get(key1), std::runtime_error);
        CHECK_THROWS_AS(store.put(key1, value), std::runtime_error);
        CHECK_THROWS_AS(store.keys(), std::runtime_error);
        CHECK_THROWS_AS(store.size(), std::runtime_error);
    }
}

}  // namespace arbor::db
