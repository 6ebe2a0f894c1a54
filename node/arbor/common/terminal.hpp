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
#ifndef ARBOR_COMMON_TERMINAL_HPP_
#define ARBOR_COMMON_TERMINAL_HPP_

namespace arbor {

// ANSI escape sequences used to colorize log lines

// Reset sequence
inline constexpr const char* kColorReset = "\x1b[0m";  // Resets fore color to terminal default

// Normal colors
inline constexpr const char* kColorCoal = "\x1b[90m";   // Black
inline constexpr const char* kColorRed = "\x1b[91m";    // Red
inline constexpr const char* kColorGreen = "\x1b[32m";  // Green
inline constexpr const char* kColorCyan = "\x1b[96m";   // Cyan

// Highlight colors
inline constexpr const char* kColorWhiteHigh = "\x1b[1;97m";   // White
inline constexpr const char* kColorOrangeHigh = "\x1b[1;33m";  // Yellow

// Background
inline constexpr const char* kBackgroundRed = "\x1b[101m";     // Red
inline constexpr const char* kBackgroundPurple = "\x1b[105m";  // Purple

}  // namespace arbor

#endif  // ARBOR_COMMON_TERMINAL_HPP_
