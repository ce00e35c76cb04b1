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

#include <concepts>
#include <cstdint>
#include <random>
#include <string>

#include "type/hash_type.hpp"
#include "type/type.hpp"

namespace photoshelf {
namespace RandomID {
template <typename Pred>
concept IdTakenPredicate = std::predicate<Pred, const album_id_t&>;

/**
 * @brief Hands out UUID-shaped album ids. Each id is a seeded 128-bit hash of the album
 *        url and a running counter, so ids never depend on the url alone.
 *
 */
class AlbumIdGenerator {
 private:
  static constexpr uint64_t kStableSeed = 0x70686f746f736866ULL;

  std::mt19937_64           engine_;
  uint64_t                  counter_    = 0;

 public:
  AlbumIdGenerator() : engine_(std::random_device{}()) {}
  explicit AlbumIdGenerator(uint64_t seed) : engine_(seed) {}

  auto NextID(const album_url_t& url) -> album_id_t {
    const std::string material = url + "#" + std::to_string(++counter_);
    return Hash128::Compute(material.data(), material.size(), engine_()).ToUUIDString();
  }

  /**
   * @brief Generate ids until one is not already taken
   *
   * @param url
   * @param is_taken returns true when an id is already in use
   */
  template <IdTakenPredicate Pred>
  auto GenerateID(const album_url_t& url, Pred&& is_taken) -> album_id_t {
    album_id_t id = NextID(url);
    while (is_taken(id)) {
      id = NextID(url);
    }
    return id;
  }

  /**
   * @brief Id derived from the url alone, for records that were stored without one. The
   *        same url yields the same id on every load until the record is rewritten.
   *
   * @param url
   * @param is_taken returns true when an id is already in use
   */
  template <IdTakenPredicate Pred>
  static auto StableID(const album_url_t& url, Pred&& is_taken) -> album_id_t {
    album_id_t id = Hash128::Compute(url.data(), url.size(), kStableSeed).ToUUIDString();
    for (uint64_t attempt = 1; is_taken(id); ++attempt) {
      const std::string material = url + "#" + std::to_string(attempt);
      id = Hash128::Compute(material.data(), material.size(), kStableSeed).ToUUIDString();
    }
    return id;
  }
};
};  // namespace RandomID
};  // namespace photoshelf
