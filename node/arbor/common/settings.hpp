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
#ifndef ARBOR_COMMON_SETTINGS_HPP_
#define ARBOR_COMMON_SETTINGS_HPP_

#include <memory>

#include <arbor/common/base.hpp>
#include <arbor/common/directories.hpp>
#include <arbor/db/mdbx.hpp>

namespace arbor {

//! \brief Backing stores available for trie nodes
enum class StoreKind {
    kMemory,  // Volatile, lost on exit
    kMdbx     // Persisted in the triedb directory
};

struct NodeSettings {
    std::unique_ptr<DataDirectory> data_directory;  // Pointer to data folder
    db::EnvConfig triedb_env_config{};              // Trie nodes db config
    StoreKind store_kind{StoreKind::kMemory};       // Backing store of trie nodes
    bool prune_enabled{true};                       // Whether deletes of trie nodes are journaled and pruned
    BlockNum prune_depth{128};                      // Distance from tip at which a block is pruned
};

}  // namespace arbor

#endif  // ARBOR_COMMON_SETTINGS_HPP_
