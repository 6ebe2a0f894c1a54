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

#include "directories.hpp"

#include <cstdlib>
#include <random>
#include <string>
#include <system_error>

namespace arbor {

static std::string random_string(size_t len) {
    static constexpr char kAlphaNum[]{
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz"};

    // don't count the null terminator
    static constexpr size_t kNumberOfCharacters{sizeof(kAlphaNum) - 1};

    std::random_device rd;
    std::default_random_engine engine{rd()};
    std::uniform_int_distribution<size_t> uniform_dist{0, kNumberOfCharacters - 1};

    std::string s;
    s.reserve(len);
    for (size_t i{0}; i < len; ++i) {
        s += kAlphaNum[uniform_dist(engine)];
    }
    return s;
}

Directory::Directory(const std::filesystem::path& directory_path, bool must_create) {
    if (directory_path.empty()) {
        path_ = std::filesystem::current_path();
    } else {
        path_ = directory_path;
    }
    if (must_create) {
        create();
    }
}

bool Directory::exists() const { return std::filesystem::exists(path_) && std::filesystem::is_directory(path_); }

const std::filesystem::path& Directory::path() const { return path_; }

void Directory::clear() const {
    if (!exists()) {
        return;
    }
    for (const auto& item : std::filesystem::directory_iterator(path_)) {
        std::filesystem::remove_all(item.path());
    }
}

void Directory::create() {
    if (exists()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    if (ec) {
        throw std::invalid_argument("Directory " + path_.string() + " does not exist and could not be created");
    }
}

std::filesystem::path DataDirectory::get_default_storage_path() {
    std::filesystem::path base_dir_path;
    if (const char* xdg_data{std::getenv("XDG_DATA_HOME")}; xdg_data) {
        base_dir_path = xdg_data;
    } else if (const char* home{std::getenv("HOME")}; home) {
        base_dir_path = home;
        base_dir_path /= ".local";
        base_dir_path /= "share";
    } else {
        // We don't actually know where to store data, fallback to current directory
        base_dir_path = std::filesystem::current_path();
    }
    base_dir_path /= "arbor";
    return base_dir_path;
}

void DataDirectory::deploy() {
    Directory::create();
    triedb_.create();
}

std::filesystem::path TemporaryDirectory::get_unique_temporary_path(const std::filesystem::path& base_path) {
    if (base_path.empty()) {
        throw std::invalid_argument("Temporary base path is empty");
    }

    const auto absolute_base_path{std::filesystem::absolute(base_path)};
    if (!std::filesystem::exists(absolute_base_path) || !std::filesystem::is_directory(absolute_base_path)) {
        throw std::invalid_argument("Path " + absolute_base_path.string() + " does not exist or is not a directory");
    }

    // Build random paths appending random strings of fixed length to base path
    for (int i = 0; i < 1000; ++i) {
        auto new_absolute_base_path{absolute_base_path / random_string(10)};
        if (!std::filesystem::exists(new_absolute_base_path)) {
            return new_absolute_base_path;
        }
    }

    // We were unable to find a valid unique non-existent path
    throw std::runtime_error("Unable to find a valid unique non-existent path");
}

std::filesystem::path TemporaryDirectory::get_unique_temporary_path() {
    return TemporaryDirectory::get_unique_temporary_path(std::filesystem::temp_directory_path());
}

}  // namespace arbor
