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

#include <stdexcept>

#include <arbor/common/log.hpp>

namespace arbor::db {

MdbxStore::MdbxStore(const EnvConfig& config, const MapConfig& map_config)
    : env_{open_env(config)}, map_config_{map_config} {
    auto txn{env_.start_write()};
    if (!has_map(txn, map_config_.name)) {
        log::Info("Creating table", {"name", map_config_.name, "path", config.path});
    }
    (void)open_map(txn, map_config_);
    txn.commit();
}

MdbxStore::~MdbxStore() { close(); }

std::shared_lock<std::shared_mutex> MdbxStore::hold_open_env() const {
    std::shared_lock lock{env_mutex_};
    if (closed_) {
        throw std::runtime_error("MdbxStore is closed");
    }
    return lock;
}

std::optional<Bytes> MdbxStore::get(ByteView key) const {
    const auto env_lock{hold_open_env()};
    auto txn{env_.start_read()};
    auto cursor{open_cursor(txn, map_config_)};
    const auto data{cursor.find(to_slice(key), /*throw_notfound=*/false)};
    if (!data) {
        return std::nullopt;
    }
    return Bytes{from_slice(data.value)};
}

void MdbxStore::put(ByteView key, std::optional<ByteView> value) {
    const auto env_lock{hold_open_env()};
    auto txn{env_.start_write()};
    const auto map{open_map(txn, map_config_)};
    if (value) {
        txn.upsert(map, to_slice(key), to_slice(*value));
    } else {
        (void)txn.erase(map, to_slice(key));
    }
    txn.commit();
}

void MdbxStore::erase(ByteView key) { put(key, std::nullopt); }

void MdbxStore::put_batch(const Rows& rows) {
    const auto env_lock{hold_open_env()};
    if (rows.empty()) {
        return;
    }
    auto txn{env_.start_write()};
    const auto map{open_map(txn, map_config_)};
    for (const auto& [key, value] : rows) {
        if (value) {
            txn.upsert(map, to_slice(key), to_slice(*value));
        } else {
            (void)txn.erase(map, to_slice(key));
        }
    }
    txn.commit();
}

void MdbxStore::erase_batch(const std::vector<Bytes>& keys) {
    const auto env_lock{hold_open_env()};
    if (keys.empty()) {
        return;
    }
    auto txn{env_.start_write()};
    const auto map{open_map(txn, map_config_)};
    for (const auto& key : keys) {
        (void)txn.erase(map, to_slice(key));
    }
    txn.commit();
}

void MdbxStore::put_to_batch(ByteView key, std::optional<ByteView> value) {
    const auto env_lock{hold_open_env()};
    std::scoped_lock lock{staged_mutex_};
    staged_.insert_or_assign(Bytes{key}, value ? std::optional<Bytes>{Bytes{*value}} : std::nullopt);
}

void MdbxStore::commit_batch() {
    Rows staged;
    {
        std::scoped_lock lock{staged_mutex_};
        staged.swap(staged_);
    }
    put_batch(staged);
}

std::vector<Bytes> MdbxStore::keys() const {
    const auto env_lock{hold_open_env()};
    std::vector<Bytes> ret;
    auto txn{env_.start_read()};
    auto cursor{open_cursor(txn, map_config_)};
    (void)cursor_for_each(cursor, [&ret](ByteView key, ByteView) {
        ret.emplace_back(key);
        return true;
    });
    return ret;
}

bool MdbxStore::empty() const { return size() == 0; }

size_t MdbxStore::size() const {
    const auto env_lock{hold_open_env()};
    auto txn{env_.start_read()};
    const auto map{open_map(txn, map_config_)};
    return txn.get_map_stat(map).ms_entries;
}

void MdbxStore::close() {
    std::unique_lock lock{env_mutex_};
    if (closed_) {
        return;
    }
    closed_ = true;
    env_.close();
}

}  // namespace arbor::db
