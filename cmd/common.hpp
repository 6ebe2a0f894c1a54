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

#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include <CLI/CLI.hpp>

#include <arbor/common/log.hpp>
#include <arbor/common/settings.hpp>
#include <arbor/common/util.hpp>
#include <arbor/db/kv_store.hpp>

namespace arbor::cmd {

struct HumanSizeParserValidator : public CLI::Validator {
    template <typename T>
    explicit HumanSizeParserValidator(T min, std::optional<T> max = std::nullopt) {
        std::stringstream out;
        out << " in [" << min << " - " << (max.has_value() ? max.value() : "inf") << "]";
        description(out.str());

        func_ = [min, max](const std::string& value) -> std::string {
            const auto parsed_size{parse_size(value)};
            if (!parsed_size.has_value()) {
                return "Value " + value + " is not a parseable size";
            }
            const auto min_size{parse_size(min).value()};
            const auto max_size{max.has_value() ? parse_size(max.value()).value() : UINT64_MAX};
            if (parsed_size.value() < min_size || parsed_size.value() > max_size) {
                return "Value " + value + " not in range " + min + " to " + (max.has_value() ? max.value() : "inf");
            }
            return {};
        };
    }
};

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for the data directory path
void add_option_data_dir(CLI::App& cli, std::filesystem::path& data_dir);

//! \brief Set up option for the kind of backing store of trie nodes
void add_option_store_kind(CLI::App& cli, StoreKind& store_kind);

//! \brief Set up options for the trie nodes database. Sizes are collected as human readable strings
void add_triedb_options(CLI::App& cli, db::EnvConfig& env_config, std::string& max_size, std::string& growth_size);

//! \brief Set up options for the journaled pruning of trie nodes
void add_prune_options(CLI::App& cli, NodeSettings& node_settings);

//! \brief Applies human readable database sizes collected by add_triedb_options
void apply_triedb_sizes(db::EnvConfig& env_config, const std::string& max_size, const std::string& growth_size);

//! \brief Opens the backing store of trie nodes selected by node_settings
//! \remarks A mdbx store is created in the triedb folder of the data directory, which must be set
std::unique_ptr<db::KeyValueStore> open_backing_store(NodeSettings& node_settings);

}  // namespace arbor::cmd
