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

#include "common.hpp"

#include <map>
#include <stdexcept>

#include <arbor/db/mdbx_store.hpp>
#include <arbor/db/memory_store.hpp>

namespace arbor::cmd {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->capture_default_str()
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log_settings.log_verbosity);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_option_data_dir(CLI::App& cli, std::filesystem::path& data_dir) {
    cli.add_option("--datadir", data_dir, "The path to the data directory")
        ->default_val(DataDirectory::get_default_storage_path().string());
}

void add_option_store_kind(CLI::App& cli, StoreKind& store_kind) {
    std::map<std::string, StoreKind> store_mapping{
        {"memory", StoreKind::kMemory},
        {"mdbx", StoreKind::kMdbx},
    };
    cli.add_option("--store", store_kind, "Backing store of trie nodes")
        ->capture_default_str()
        ->transform(CLI::Transformer(store_mapping, CLI::ignore_case))
        ->default_val(StoreKind::kMemory);
}

void add_triedb_options(CLI::App& cli, db::EnvConfig& env_config, std::string& max_size, std::string& growth_size) {
    max_size = human_size(env_config.max_size);
    growth_size = human_size(env_config.growth_size);

    auto& db_opts = *cli.add_option_group("TrieDb", "Trie nodes database options");
    db_opts.add_flag("--triedb.exclusive", env_config.exclusive, "Trie nodes database opened in exclusive mode");
    db_opts.add_flag("--triedb.writemap", env_config.write_map, "Trie nodes database enable writemap");
    db_opts.add_option("--triedb.maxsize", max_size, "Trie nodes database max size")
        ->capture_default_str()
        ->check(HumanSizeParserValidator("32MB", {"128TB"}));
    db_opts.add_option("--triedb.growthsize", growth_size, "Trie nodes database growth size")
        ->capture_default_str()
        ->check(HumanSizeParserValidator("2MB"));
    db_opts.add_option("--mdbx.max.readers", env_config.max_readers, "The maximum number of MDBX readers")
        ->default_val(db::EnvConfig{}.max_readers)
        ->check(CLI::Range(1, 32767));
}

void add_prune_options(CLI::App& cli, NodeSettings& node_settings) {
    auto& prune_opts = *cli.add_option_group("Prune", "Trie nodes pruning options");
    prune_opts.add_option("--prune.depth", node_settings.prune_depth, "Number of blocks behind the tip to prune at")
        ->capture_default_str()
        ->check(CLI::Range(BlockNum{1}, BlockNum{1'000'000}));
    prune_opts.add_flag("!--prune.disabled", node_settings.prune_enabled,
                        "Writes trie nodes through and drops their deletes");
}

void apply_triedb_sizes(db::EnvConfig& env_config, const std::string& max_size, const std::string& growth_size) {
    env_config.max_size = parse_size(max_size).value();
    env_config.growth_size = parse_size(growth_size).value();
    if (env_config.growth_size > env_config.max_size) {
        throw std::invalid_argument("--triedb.growthsize can't be greater than --triedb.maxsize");
    }
}

std::unique_ptr<db::KeyValueStore> open_backing_store(NodeSettings& node_settings) {
    if (node_settings.store_kind == StoreKind::kMemory) {
        return std::make_unique<db::MemoryStore>();
    }
    if (!node_settings.data_directory) {
        throw std::invalid_argument("Data directory is required by mdbx store");
    }
    node_settings.data_directory->deploy();
    auto& env_config{node_settings.triedb_env_config};
    env_config.path = node_settings.data_directory->triedb().path().string();
    env_config.create = !std::filesystem::exists(db::get_datafile_path(env_config.path));
    log::Info("Opening trie nodes database", {"path", env_config.path, "create", env_config.create ? "yes" : "no"});
    return std::make_unique<db::MdbxStore>(env_config);
}

}  // namespace arbor::cmd
