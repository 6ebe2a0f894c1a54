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

#include <utility>

namespace arbor::db {

void MemoryStore::throw_if_closed() const {
    if (closed_) {
        throw std::runtime_error("MemoryStore is closed");
    }
}

std::optional<Bytes> MemoryStore::get(ByteView key) const {
    std::scoped_lock lock{mutex_};
    throw_if_closed();
    const auto it{data_.find(Bytes{key})};
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStore::put(ByteView key, std::optional<ByteView> value) {
    std::scoped_lock lock{mutex_};
    throw_if_closed();
    if (value) {
        data_.insert_or_assign(Bytes{key}, Bytes{*value});
    } else {
        data_.erase(Bytes{key});
    }
}

void MemoryStore::erase(ByteView key) {
    std::scoped_lock lock{mutex_};
    throw_if_closed();
    data_.erase(Bytes{key});
}

void MemoryStore::put_batch(const Rows& rows) {
    std::scoped_lock lock{mutex_};
    throw_if_closed();
    for (const auto& [key, value] : rows) {
        if (value) {
            data_.insert_or_assign(key, *value);
        } else {
            data_.erase(key);
        }
    }
}

void MemoryStore::erase_batch(const std::vector<Bytes>& keys) {
    std::scoped_lock lock{mutex_};
    throw_if_closed();
    for (const auto& key : keys) {
        data_.erase(key);
    }
}

void MemoryStore::put_to_batch(ByteView key, std::optional<ByteView> value) {
    std::scoped_lock lock{mutex_};
    throw_if_closed();
    staged_.insert_or_assign(Bytes{key}, value ? std::optional<Bytes>{Bytes{*value}} : std::nullopt);
}

void MemoryStore::commit_batch() {
    Rows staged;
    {
        std::scoped_lock lock{mutex_};
        throw_if_closed();
        staged.swap(staged_);
    }
    put_batch(staged);
}

std::vector<Bytes> MemoryStore::keys() const {
    std::scoped_lock lock{mutex_};
    throw_if_closed();
    std::vector<Bytes> ret;
    ret.reserve(data_.size());
    for (const auto& [key, _] : data_) {
        ret.push_back(key);
    }
    return ret;
}

bool MemoryStore::empty() const {
    std::scoped_lock lock{mutex_};
    throw_if_closed();
    return data_.empty();
}

void MemoryStore::close() {
    std::scoped_lock lock{mutex_};
    closed_ = true;
    data_.clear();
    staged_.clear();
}

size_t MemoryStore::size() const {
    std::scoped_lock lock{mutex_};
    throw_if_closed();
    return data_.size();
}

}  // namespace arbor::db
