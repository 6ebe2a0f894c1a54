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

#include "stopwatch.hpp"

#include <iomanip>
#include <sstream>

namespace arbor {

StopWatch::TimePoint StopWatch::start() noexcept {
    if (started_) {
        return start_time_;
    }
    started_ = true;
    start_time_ = std::chrono::steady_clock::now();
    last_lap_ = start_time_;
    laps_.clear();
    return start_time_;
}

StopWatch::Duration StopWatch::lap_duration() noexcept {
    if (!started_) {
        return {};
    }
    const auto now{std::chrono::steady_clock::now()};
    const auto duration{std::chrono::duration_cast<Duration>(now - last_lap_)};
    last_lap_ = now;
    laps_.push_back(duration);
    return duration;
}

StopWatch::Duration StopWatch::stop() noexcept {
    if (!started_) {
        return {};
    }
    started_ = false;
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start_time_);
}

std::string StopWatch::format(Duration duration) noexcept {
    using namespace std::chrono_literals;

    std::ostringstream os;
    char fill = os.fill('0');

    if (duration >= 60s) {
        bool need_space{false};
        if (auto h = std::chrono::duration_cast<std::chrono::hours>(duration); h.count()) {
            os << h.count() << "h";
            duration -= h;
            need_space = true;
        }
        if (auto m = std::chrono::duration_cast<std::chrono::minutes>(duration); m.count()) {
            os << (need_space ? " " : "") << m.count() << "m";
            duration -= m;
            need_space = true;
        }
        if (auto s = std::chrono::duration_cast<std::chrono::seconds>(duration); s.count()) {
            os << (need_space ? " " : "") << s.count() << "s";
        }
    } else if (duration >= 1s) {
        auto s = std::chrono::duration_cast<std::chrono::seconds>(duration);
        duration -= s;
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(duration);
        os << s.count();
        if (ms.count()) {
            os << "." << std::setw(3) << ms.count();
        }
        os << "s";
    } else if (duration >= 1ms) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(duration);
        duration -= ms;
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(duration);
        os << ms.count();
        if (us.count()) {
            os << "." << std::setw(3) << us.count();
        }
        os << "ms";
    } else {
        os << std::chrono::duration_cast<std::chrono::microseconds>(duration).count() << "us";
    }

    os.fill(fill);
    return os.str();
}

}  // namespace arbor
