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

#include <thread>

#include <catch2/catch.hpp>

namespace arbor {

TEST_CASE("Stop Watch") {
    using namespace std::chrono_literals;

    StopWatch sw{};
    CHECK_FALSE(sw);
    CHECK(sw.lap_duration().count() == 0);

    sw.start();
    CHECK(sw);
    std::this_thread::sleep_for(5ms);
    CHECK(sw.lap_duration() >= 5ms);
    std::this_thread::sleep_for(1ms);
    CHECK(sw.lap_duration() >= 1ms);
    CHECK(sw.laps().size() == 2);

    const auto total{sw.stop()};
    CHECK(total >= 6ms);
    CHECK_FALSE(sw);
    CHECK(sw.stop().count() == 0);

    CHECK(StopWatch::format(255h + 12min + 14s) == "255h 12m 14s");
    CHECK(StopWatch::format(7min + 12s + 120ms) == "7m 12s");
    CHECK(StopWatch::format(1ms) == "1ms");
    CHECK(StopWatch::format(1200ms) == "1.200s");
    CHECK(StopWatch::format(1010us) == "1.010ms");
    CHECK(StopWatch::format(20us) == "20us");
}

}  // namespace arbor
