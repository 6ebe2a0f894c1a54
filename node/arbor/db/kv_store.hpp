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

#include <optional>
#include <stdexcept>
#include <vector>

#include <absl/container/btree_map.h>

#include <arbor/common/base.hpp>

namespace arbor::db {

//! \brief Rows of a batch write. A row without value requests the deletion of its key
using Rows = absl::btree_map<Bytes, std::optional<Bytes>>;

//! \brief Raised by stores which do not implement an operation of the KeyValueStore contract
class UnsupportedOperationError : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

//! \brief Byte oriented key-value store holding trie nodes
//! \remarks A missing value in put and put_batch is an unconditional delete of the key
class KeyValueStore {
  public:
    virtual ~KeyValueStore() = default;

    //! \brief Returns the value stored for key, if any
    [[nodiscard]] virtual std::optional<Bytes> get(ByteView key) const = 0;

    virtual void put(ByteView key, std::optional<ByteView> value) = 0;

    virtual void erase(ByteView key) = 0;

    //! \brief Applies all rows at once
    virtual void put_batch(const Rows& rows) = 0;

    virtual void erase_batch(const std::vector<Bytes>& keys) = 0;

    //! \brief Stages a row to be applied by the next commit_batch
    virtual void put_to_batch(ByteView key, std::optional<ByteView> value) = 0;

    //! \brief Applies all rows staged by put_to_batch
    virtual void commit_batch() = 0;

    //! \brief Returns all stored keys in ascending order
    [[nodiscard]] virtual std::vector<Bytes> keys() const = 0;

    [[nodiscard]] virtual bool empty() const = 0;

    //! \brief Releases underlying resources. Any further operation throws
    virtual void close() = 0;
};

}  // namespace arbor::db
