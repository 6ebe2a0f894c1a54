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

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <thread>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace arbor::log {

namespace {

    Settings current_settings{};
    std::mutex sink_mutex{};
    std::unique_ptr<std::ofstream> tee_stream{nullptr};
    thread_local std::string local_thread_name{};

    struct LevelStyle {
        const char* tag;
        const char* color;
    };

    LevelStyle style_of(Level level) {
        switch (level) {
            case Level::kCritical:
                return {" CRIT", kBackgroundRed};
            case Level::kError:
                return {"ERROR", kColorRed};
            case Level::kWarning:
                return {" WARN", kColorOrangeHigh};
            case Level::kInfo:
                return {" INFO", kColorGreen};
            case Level::kDebug:
                return {"DEBUG", kBackgroundPurple};
            case Level::kTrace:
                return {"TRACE", kColorCoal};
            default:
                break;
        }
        return {"     ", kColorReset};
    }

    std::string strip_colors(const std::string& line) {
        static const std::regex kEscapeSequence{"\\x1b\\[[0-9;]+m"};
        return std::regex_replace(line, kEscapeSequence, "");
    }

}  // namespace

void init(const Settings& settings) {
    current_settings = settings;
    if (settings.log_file.empty()) {
        tee_stream.reset();
        return;
    }
    tee_file(settings.log_file);
}

void tee_file(const std::filesystem::path& path) {
    auto stream{std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app)};
    if (!stream->is_open()) {
        throw std::runtime_error("Unable to open log file " + path.string());
    }
    tee_stream = std::move(stream);
}

Level get_verbosity() { return current_settings.log_verbosity; }

void set_verbosity(Level level) { current_settings.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= current_settings.log_verbosity; }

void set_thread_name(const char* name) { local_thread_name = name; }

std::string get_thread_name() {
    if (local_thread_name.empty()) {
        std::ostringstream id;
        id << std::this_thread::get_id();
        local_thread_name = id.str();
    }
    return local_thread_name;
}

BufferBase::BufferBase(Level level) : should_print_(test_verbosity(level)) {
    if (!should_print_) return;

    const auto style{style_of(level)};
    ss_ << kColorReset << " " << style.color << style.tag << kColorReset << " ";

    static const absl::TimeZone zone{current_settings.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << kColorCyan << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), zone) << "] " << kColorReset;

    if (current_settings.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    if (!should_print_) return;
    ss_ << std::left << std::setw(30) << std::setfill(' ') << msg;
    for (size_t i{0}; i < args.size(); ++i) {
        if (i % 2 == 0) {
            ss_ << kColorGreen << args[i] << kColorReset << "=";
        } else {
            ss_ << kColorWhiteHigh << args[i] << kColorReset << " ";
        }
    }
}

void BufferBase::flush() {
    if (!should_print_) return;

    const std::string line{ss_.str()};
    const std::string plain{strip_colors(line)};

    std::scoped_lock lock{sink_mutex};
    std::ostream& console{current_settings.log_std_out ? std::cout : std::cerr};
    console << (current_settings.log_nocolor ? plain : line) << std::endl;
    if (tee_stream) {
        *tee_stream << plain << std::endl;
    }
}

}  // namespace arbor::log
