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

#include <mutex>

#include <absl/container/btree_map.h>

#include <arbor/db/kv_store.hpp>

namespace arbor::db {

//! \brief Thread safe KeyValueStore kept entirely in memory
class MemoryStore : public KeyValueStore {
  public:
    MemoryStore() = default;

    // Not copyable nor movable
    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    [[nodiscard]] std::optional<Bytes> get(ByteView key) const override;
    void put(ByteView key, std::optional<ByteView> value) override;
    void erase(ByteView key) override;
    void put_batch(const Rows& rows) override;
    void erase_batch(const std::vector<Bytes>& keys) override;
    void put_to_batch(ByteView key, std::optional<ByteView> value) override;
    void commit_batch() override;
    [[nodiscard]] std::vector<Bytes> keys() const override;
    [[nodiscard]] bool empty() const override;
    void close() override;

    //! \brief Number of stored entries
    [[nodiscard]] size_t size() const;

  private:
    void throw_if_closed() const;

    mutable std::mutex mutex_;
    absl::btree_map<Bytes, Bytes> data_;
    Rows staged_;
    bool closed_{false};
};

}  // namespace arbor::db
