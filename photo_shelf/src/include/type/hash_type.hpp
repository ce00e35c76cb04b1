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

#include <xxhash.h>

#include <cstddef>
#include <cstdint>
#include <format>
#include <string>

namespace photoshelf {
// 128-bit XXH3 digest. Album ids are rendered from it.
class Hash128 {
 public:
  explicit Hash128(const XXH128_hash_t& h) : _h(h) {}

  std::string ToString() const { return std::format("{:016x}{:016x}", _h.high64, _h.low64); }

  /**
   * @brief Render the 32 hex digits in 8-4-4-4-12 groups, the layout album ids use
   *
   * @return std::string
   */
  std::string ToUUIDString() const {
    const std::string hex = ToString();
    return std::format("{}-{}-{}-{}-{}", hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4),
                       hex.substr(16, 4), hex.substr(20, 12));
  }

  static Hash128 Compute(const void* data, size_t length, uint64_t seed = 0) {
    return Hash128(XXH3_128bits_withSeed(data, length, seed));
  }

 private:
  XXH128_hash_t _h;
};
};  // namespace photoshelf
