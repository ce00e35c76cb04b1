//  Copyright 2025 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <atomic>
#include <chrono>

#include "type/type.hpp"

namespace photoshelf {
/**
 * @brief Process-wide cached wall clock. Refresh() must run once before Now() is trusted.
 *
 */
class TimeProvider {
 private:
  static std::atomic<std::chrono::system_clock::time_point> _cached_sys_time;
  static std::atomic<std::chrono::steady_clock::time_point> _cached_steady_time;

 public:
  static void Refresh();
  static auto Now() -> std::chrono::system_clock::time_point;
  static auto CurrentYear() -> ref_year_t;
};
};  // namespace photoshelf
