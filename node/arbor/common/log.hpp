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

#ifndef ARBOR_COMMON_LOG_HPP_
#define ARBOR_COMMON_LOG_HPP_

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <arbor/common/terminal.hpp>

namespace arbor::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. build info)
    kCritical,  // An error there's no way we can recover from
    kError,     // We encountered an error which we might be able to recover from
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Debug information
    kTrace      // Trace calls to functions
};

//! \brief Holds logging configuration
struct Settings {
    bool log_std_out{false};            // Whether console logging goes to std::cout or std::cerr (default)
    bool log_utc{false};                // Whether timestamps should be in UTC or imbue local timezone
    bool log_nocolor{false};            // Whether to disable colorized output
    bool log_threads{false};            // Whether to print thread ids in log lines
    Level log_verbosity{Level::kInfo};  // Log verbosity level
    std::string log_file;               // Log to file
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings);

//! \brief Get the current logging verbosity
//! \note This function is not thread safe as it's meant to be used in tests
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void set_verbosity(Level level);

//! \brief Names the calling thread in log lines when Settings::log_threads is on
void set_thread_name(const char* name);

//! \brief Returns the name given to the calling thread, or its id if none was set
std::string get_thread_name();

//! \brief Whether a line of the given level passes the configured verbosity
bool test_verbosity(Level level);

//! \brief Copies every printed line, without colors, to the given file
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    explicit BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    // Accumulators
    template <class T>
    inline void append(T const& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(T const& t) {
        append(t);
        return *this;
    }

  protected:
    void flush();
    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;

}  // namespace arbor::log

#define ARBOR_LOGBUFFER(level_)                \
    if (!arbor::log::test_verbosity(level_)) { \
    } else                                     \
        arbor::log::LogBuffer<level_>()

//! \brief Streams a trace line only when trace verbosity is enabled, so its operands are not evaluated otherwise
#define ARBOR_TRACE ARBOR_LOGBUFFER(arbor::log::Level::kTrace)

#endif  // !ARBOR_COMMON_LOG_HPP_
