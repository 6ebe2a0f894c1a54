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

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wimplicit-fallthrough"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#pragma GCC diagnostic ignored "-Wshadow"
#include <mdbx.h++>
#pragma GCC diagnostic pop

#include <absl/functional/function_ref.h>

#include <arbor/common/base.hpp>

namespace arbor::db {

inline constexpr std::string_view kDbDataFileName{"mdbx.dat"};

//! \brief Essential environment settings
struct EnvConfig {
    std::string path{};
    bool create{false};          // Whether db file must be created
    bool readonly{false};        // Whether db should be opened in RO mode
    bool exclusive{false};       // Whether this process has exclusive access
    bool inmemory{false};        // Whether this db is in memory
    bool write_map{false};       // Whether to enable mdbx write map
    size_t max_size{64_Gibi};    // Mdbx max map size
    size_t growth_size{1_Gibi};  // Increment size for each extension
    uint32_t max_tables{16};     // Default max number of named tables
    uint32_t max_readers{100};   // Default max number of readers
};

//! \brief Configuration settings for a "map" (aka a table)
struct MapConfig {
    const char* name{nullptr};                                        // Name of the table (is key in MAIN_DBI)
    const ::mdbx::key_mode key_mode{::mdbx::key_mode::usual};         // Key collation order
    const ::mdbx::value_mode value_mode{::mdbx::value_mode::single};  // Data Storage Mode
};

namespace table {
    //! \brief Trie nodes addressed by their hash
    inline constexpr MapConfig kTrieNodes{"TrieNodes"};
}  // namespace table

//! \brief Reference to a processing function invoked by cursor_for_each on each record.
//! Returning false stops the loop
using WalkFuncRef = absl::FunctionRef<bool(ByteView key, ByteView value)>;

//! \brief Opens an mdbx environment using the provided environment config
//! \param [in] config : A structure containing essential environment settings
//! \return A handler to mdbx::env_managed class
//! \remarks May throw exceptions
::mdbx::env_managed open_env(const EnvConfig& config);

//! \brief Opens an mdbx "map" (aka table)
//! \param [in] tx : a reference to a valid mdbx transaction
//! \param [in] config : the configuration settings for the map
//! \return A handle to the opened map
::mdbx::map_handle open_map(::mdbx::txn& tx, const MapConfig& config);

//! \brief Opens a cursor to an mdbx "map" (aka table)
//! \param [in] tx : a reference to a valid mdbx transaction
//! \param [in] config : the configuration settings for the underlying map
//! \return A handle to the opened cursor
::mdbx::cursor_managed open_cursor(::mdbx::txn& tx, const MapConfig& config);

//! \brief Checks whether a provided map name exists in database
//! \param [in] tx : a reference to a valid mdbx transaction
//! \param [in] map_name : the name of the map to check for
//! \return True / False
bool has_map(::mdbx::txn& tx, const char* map_name);

//! \brief Executes a function on each record of the map, in key order, starting from the first one
//! \param [in] cursor : A reference to a cursor opened on a map
//! \param [in] func : A reference to a function with the code to execute on records
//! \return The overall number of processed records
size_t cursor_for_each(::mdbx::cursor& cursor, WalkFuncRef func);

//! \brief Builds the full path to mdbx datafile provided a directory
inline std::filesystem::path get_datafile_path(const std::filesystem::path& base_path) noexcept {
    return base_path / std::filesystem::path(kDbDataFileName);
}

inline ::mdbx::slice to_slice(ByteView value) { return {value.data(), value.length()}; }

inline ByteView from_slice(const ::mdbx::slice slice) {
    return {static_cast<const uint8_t*>(slice.data()), slice.length()};
}

}  // namespace arbor::db
