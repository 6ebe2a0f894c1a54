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

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace arbor {

//! \brief This class mimics the behavior of a stopwatch to measure timings of operations
class StopWatch {
  public:
    using TimePoint = std::chrono::time_point<std::chrono::steady_clock>;
    using Duration = std::chrono::nanoseconds;

    explicit StopWatch(bool auto_start = false) {
        if (auto_start) start();
    }

    //! \brief Starts the clock
    //! \return The TimePoint it was started on
    TimePoint start() noexcept;

    //! \brief Records a lap time
    //! \return The lap Duration (i.e. since previous lap or since start)
    Duration lap_duration() noexcept;

    //! \brief Stops the watch
    //! \return The overall duration since start
    Duration stop() noexcept;

    //! \brief Returns the vector of lap durations
    [[nodiscard]] const std::vector<Duration>& laps() const { return laps_; }

    //! \brief Returns a human readable duration
    static std::string format(Duration duration) noexcept;

    explicit operator bool() const noexcept { return started_; }

  private:
    bool started_{false};
    TimePoint start_time_{};
    TimePoint last_lap_{};
    std::vector<Duration> laps_{};
};

}  // namespace arbor
