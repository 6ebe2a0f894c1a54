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
#ifndef ARBOR_COMMON_DIRECTORIES_HPP_
#define ARBOR_COMMON_DIRECTORIES_HPP_

#include <filesystem>
#include <stdexcept>

namespace arbor {

//! \brief Directory class acts as a wrapper around common functions and properties of a filesystem directory object
class Directory {
  public:
    //! Creates an instance of a Directory object provided the path
    //! \param [in] directory_path : the path of the directory
    //! \param [in] must_create : whether the directory must be created on filesystem should not exist
    explicit Directory(const std::filesystem::path& directory_path, bool must_create = false);
    virtual ~Directory() = default;

    // Not copyable nor movable
    Directory(const Directory&) = delete;
    Directory& operator=(const Directory&) = delete;

    //! \brief Returns whether this Directory exists on filesystem
    [[nodiscard]] bool exists() const;

    //! \brief Returns the std::filesystem::path of this Directory instance
    [[nodiscard]] const std::filesystem::path& path() const;

    //! \brief Removes all contained files and subdirectories
    virtual void clear() const;

    //! \brief Creates the directory on filesystem should not exist
    void create();

  protected:
    std::filesystem::path path_;
};

//! \brief TemporaryDirectory is a Directory which is automatically deleted on destructor of the instance.
//! The full path of the directory starts from a given path plus the discovery of a unique non-existent sub-path
//! through a linear search. Should no initial path be given, TemporaryDirectory is built from the path indicated
//! for temporary files storage by host OS environment variables
class TemporaryDirectory final : public Directory {
  public:
    //! \brief Creates an instance of a TemporaryDirectory from a user provided path
    //! \param [in] base_path :  A path where to append this instance to
    explicit TemporaryDirectory(const std::filesystem::path& base_path)
        : Directory(TemporaryDirectory::get_unique_temporary_path(base_path), true) {}

    //! \brief Creates an instance of a TemporaryDirectory from OS temporary path
    explicit TemporaryDirectory() : Directory(TemporaryDirectory::get_unique_temporary_path(), true) {}

    ~TemporaryDirectory() final {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    //! \brief Builds a temporary path from OS provided temporary storage location
    static std::filesystem::path get_unique_temporary_path();
    //! \brief Builds a temporary path from user provided temporary storage location
    static std::filesystem::path get_unique_temporary_path(const std::filesystem::path& base_path);
};

//! \brief DataDirectory wraps the directory tree used by Arbor as base storage path.
//! <base_path>
//! └───triedb   <-- Where the trie node database is stored
class DataDirectory final : public Directory {
  public:
    //! \brief Creates an instance of Arbor's data directory given an initial base path
    //! \param [in] base_path : the actual path of base directory
    //! \param [in] create : whether the directory itself and the underlying tree should be created
    explicit DataDirectory(const std::filesystem::path& base_path, bool create = false)
        : Directory(base_path, create), triedb_(base_path / "triedb", create) {}

    //! \brief Creates an instance of Arbor's data directory starting from default storage path
    explicit DataDirectory(bool create = false)
        : DataDirectory::DataDirectory(DataDirectory::get_default_storage_path(), create) {}

    ~DataDirectory() final = default;

    // Not copyable nor movable
    DataDirectory(const DataDirectory&) = delete;
    DataDirectory& operator=(const DataDirectory&) = delete;

    //! \brief Returns the path for default storage as defined by host OS environment variable(s)
    static std::filesystem::path get_default_storage_path();

    //! \brief Deploys the full tree on filesystem (i.e. missing directories are created)
    void deploy();

    //! \brief DataDirectory can't be cleared
    void clear() const final { throw std::runtime_error("Can't clear a DataDirectory"); }

    //! \brief Returns the "triedb" directory (where the trie node database is stored)
    [[nodiscard]] const Directory& triedb() const { return triedb_; }

  private:
    Directory triedb_;
};

}  // namespace arbor

#endif  // !ARBOR_COMMON_DIRECTORIES_HPP_
