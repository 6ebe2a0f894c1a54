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

#include "mdbx_store.hpp"

#include <atomic>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include <arbor/common/directories.hpp>
#include <arbor/common/util.hpp>

namespace arbor::db {

TEST_CASE("MdbxStore") {
    TemporaryDirectory tmp_dir;
    EnvConfig config{tmp_dir.path().string(), /*create=*/true};
    config.inmemory = true;

    const Bytes key1{*from_hex("0x01")};
    const Bytes key2{*from_hex("0x02")};
    const Bytes key3{*from_hex("0x0301")};
    const Bytes value{*from_hex("0xc0ffee")};

    SECTION("Single writes") {
        MdbxStore store{config};
        CHECK(store.empty());
        CHECK_FALSE(store.get(key1).has_value());

        store.put(key2, value);
        store.put(key1, value);
        CHECK(store.size() == 2);
        CHECK(store.get(key1) == value);
        CHECK(store.keys() == std::vector<Bytes>{key1, key2});

        store.put(key1, std::nullopt);
        store.erase(key2);
        store.erase(key3);  // Absent key is no error
        CHECK(store.empty());
    }

    SECTION("Batch writes") {
        MdbxStore store{config};
        store.put(key3, value);
        Rows rows;
        rows.emplace(key1, value);
        rows.emplace(key2, value);
        rows.emplace(key3, std::nullopt);
        store.put_batch(rows);
        CHECK(store.keys() == std::vector<Bytes>{key1, key2});

        store.erase_batch({key1, key3});
        CHECK(store.keys() == std::vector<Bytes>{key2});
    }

    SECTION("Staged batch") {
        MdbxStore store{config};
        store.put_to_batch(key1, value);
        store.put_to_batch(key2, value);
        CHECK(store.empty());
        store.commit_batch();
        CHECK(store.size() == 2);
    }

    SECTION("Data survives reopening") {
        {
            MdbxStore store{config};
            store.put(key1, value);
        }
        config.create = false;
        MdbxStore store{config};
        CHECK(store.get(key1) == value);

        store.close();
        CHECK_THROWS_AS(store.get(key1), std::runtime_error);
    }

    SECTION("Tables are isolated") {
        MdbxStore store{config, MapConfig{"Custom"}};
        store.put(key1, value);
        CHECK(store.keys() == std::vector<Bytes>{key1});
        store.close();

        config.create = false;
        MdbxStore trie_nodes{config};
        CHECK(trie_nodes.empty());
    }

    SECTION("Close while reading") {
        MdbxStore store{config};
        store.put(key1, value);

        constexpr size_t kReaders{4};
        std::atomic<size_t> running{0};
        std::atomic<size_t> rejected{0};
        std::atomic<size_t> wrong_reads{0};
        std::vector<std::thread> readers;
        for (size_t i{0}; i < kReaders; ++i) {
            readers.emplace_back([&]() {
                ++running;
                while (true) {
                    try {
                        if (store.get(key1) != value || store.keys().size() != 1) {
                            ++wrong_reads;
                        }
                    } catch (const std::runtime_error&) {
                        ++rejected;
                        return;
                    }
                }
            });
        }
        while (running < kReaders) {
            std::this_thread::yield();
        }
        store.close();
        for (auto& reader : readers) {
            reader.join();
        }

        CHECK(rejected == kReaders);
        CHECK(wrong_reads == 0);
        CHECK_THROWS_AS(store.size(), std::runtime_error);
        CHECK_THROWS_AS(store.put(key2, value), std::runtime_error);
        CHECK_THROWS_AS(store.put_to_batch(key2, value), std::runtime_error);
        CHECK_NOTHROW(store.close());
    }
}

}  // namespace arbor::db
