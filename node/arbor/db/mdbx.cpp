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

#include "mdbx.hpp"

#include <stdexcept>

#include <arbor/common/util.hpp>

namespace arbor::db {

::mdbx::env_managed open_env(const EnvConfig& config) {
    namespace fs = std::filesystem;

    if (config.path.empty()) {
        throw std::invalid_argument("Invalid argument : config.path");
    }

    // Check datafile exists if create is not set
    fs::path db_path{config.path};
    if (db_path.has_filename()) {
        db_path += std::filesystem::path::preferred_separator;  // Remove ambiguity. It has to be a directory
    }
    if (!fs::exists(db_path)) {
        fs::create_directories(db_path);
    } else if (!fs::is_directory(db_path)) {
        throw std::runtime_error("Path " + db_path.string() + " is not valid");
    }

    fs::path db_file{get_datafile_path(db_path)};
    size_t db_ondisk_file_size{fs::exists(db_file) ? fs::file_size(db_file) : 0};

    if (!config.create && !db_ondisk_file_size) {
        throw std::runtime_error("Unable to locate " + db_file.string() + ", which is required to exist");
    } else if (config.create && db_ondisk_file_size) {
        throw std::runtime_error("File " + db_file.string() + " already exists but create was set");
    }
    if (config.create && config.readonly) {
        throw std::runtime_error("Create conflicts with Readonly");
    }

    // Mapping a file with a map size smaller than its size on disk would only map a part of data
    if (db_ondisk_file_size > config.max_size) {
        throw std::runtime_error("Database map size is too small. Min required " + human_size(db_ondisk_file_size));
    }

    uint32_t flags{MDBX_NOTLS | MDBX_NORDAHEAD | MDBX_COALESCE | MDBX_SYNC_DURABLE};
    if (config.readonly) {
        flags |= MDBX_RDONLY;
    }
    if (config.inmemory) {
        flags |= MDBX_NOMETASYNC;
    }
    if (config.exclusive) {
        flags |= MDBX_EXCLUSIVE;
    }
    if (config.write_map) {
        flags |= MDBX_WRITEMAP;
    }

    ::mdbx::env_managed::create_parameters cp{};
    const auto max_map_size{static_cast<intptr_t>(config.inmemory ? 64_Mebi : config.max_size)};
    const auto growth_size{static_cast<intptr_t>(config.inmemory ? 2_Mebi : config.growth_size)};
    cp.geometry.make_dynamic(::mdbx::env::geometry::default_value, max_map_size);
    cp.geometry.growth_step = growth_size;
    cp.geometry.pagesize = 4_Kibi;

    ::mdbx::env::operate_parameters op{};
    op.mode = op.mode_from_flags(static_cast<MDBX_env_flags_t>(flags));
    op.options = op.options_from_flags(static_cast<MDBX_env_flags_t>(flags));
    op.durability = op.durability_from_flags(static_cast<MDBX_env_flags_t>(flags));
    op.max_maps = config.max_tables;
    op.max_readers = config.max_readers;

    ::mdbx::env_managed ret{db_path.native(), cp, op};
    if (!config.readonly) {
        // C++ bindings don't have setoptions
        ::mdbx::error::success_or_throw(::mdbx_env_set_option(ret, MDBX_opt_txn_dp_initial, 16_Kibi));
        ::mdbx::error::success_or_throw(::mdbx_env_set_option(ret, MDBX_opt_dp_reserve_limit, 16_Kibi));
    }
    if (!config.inmemory) {
        ret.check_readers();
    }
    return ret;
}

::mdbx::map_handle open_map(::mdbx::txn& tx, const MapConfig& config) {
    if (tx.is_readonly()) {
        return tx.open_map(config.name, config.key_mode, config.value_mode);
    }
    return tx.create_map(config.name, config.key_mode, config.value_mode);
}

::mdbx::cursor_managed open_cursor(::mdbx::txn& tx, const MapConfig& config) {
    return tx.open_cursor(open_map(tx, config));
}

bool has_map(::mdbx::txn& tx, const char* map_name) {
    try {
        ::mdbx::map_handle main_map{1};
        auto main_crs{tx.open_cursor(main_map)};
        return main_crs.seek(::mdbx::slice(map_name));
    } catch (const ::mdbx::exception&) {
        return false;
    }
}

size_t cursor_for_each(::mdbx::cursor& cursor, WalkFuncRef func) {
    size_t ret{0};
    auto data{cursor.eof() ? cursor.to_first(/*throw_notfound=*/false) : cursor.current(/*throw_notfound=*/false)};
    while (data.done) {
        ++ret;
        if (!func(from_slice(data.key), from_slice(data.value))) {
            break;
        }
        data = cursor.to_next(/*throw_notfound=*/false);
    }
    return ret;
}

}  // namespace arbor::db
