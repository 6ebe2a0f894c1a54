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
#include <shared_mutex>

#include <arbor/db/kv_store.hpp>
#include <arbor/db/mdbx.hpp>

namespace arbor::db {

//! \brief KeyValueStore persisted in one MDBX table
//! \remarks Every operation runs in its own transaction. Batches are applied atomically in a single write transaction.
//! close() waits for operations in flight to release the environment. Operations issued after close() throw
//! std::runtime_error
class MdbxStore : public KeyValueStore {
  public:
    //! \brief Opens (or creates) the environment described by config and the table described by map_config
    explicit MdbxStore(const EnvConfig& config, const MapConfig& map_config = table::kTrieNodes);
    ~MdbxStore() override;

    // Not copyable nor movable
    MdbxStore(const MdbxStore&) = delete;
    MdbxStore& operator=(const MdbxStore&) = delete;

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

    //! \brief Number of records in the table
    [[nodiscard]] size_t size() const;

  private:
    //! \brief Shared hold on the open environment for the duration of one operation
    //! \throws std::runtime_error if the store has been closed
    [[nodiscard]] std::shared_lock<std::shared_mutex> hold_open_env() const;

    mutable ::mdbx::env_managed env_;
    MapConfig map_config_;
    mutable std::shared_mutex env_mutex_;  // Shared by operations, exclusive on close
    bool closed_{false};
    std::mutex staged_mutex_;
    Rows staged_;
};

}  // namespace arbor::db
