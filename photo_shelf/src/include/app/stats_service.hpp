//  Copyright 2026 Yurun Zi
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

#include <memory>
#include <nlohmann/json.hpp>
#include <vector>

#include "album/album_collection.hpp"
#include "app/shelf_service.hpp"
#include "type/type.hpp"

namespace photoshelf {

/// Album ids per completeness bucket, each list in file order.
struct AlbumStats {
  std::vector<album_id_t> all_ids_{};
  std::vector<album_id_t> complete_ids_{};
  std::vector<album_id_t> incomplete_ids_{};
  std::vector<album_id_t> missing_count_ids_{};
  std::vector<album_id_t> missing_date_ids_{};
  std::vector<album_id_t> missing_both_ids_{};
  std::vector<album_id_t> with_tags_ids_{};
  std::vector<album_id_t> without_tags_ids_{};

  [[nodiscard]] auto      ToJSON() const -> nlohmann::json;
};

class StatsService {
 public:
  explicit StatsService(std::shared_ptr<ShelfService> shelf);

  /// Load the album file and bucket every album.
  [[nodiscard]] auto Compute() -> AlbumStats;

  /// An album is complete when it has a non-zero item count and some date.
  [[nodiscard]] static auto Compute(const AlbumCollection& albums) -> AlbumStats;

 private:
  std::shared_ptr<ShelfService> shelf_;
};

}  // namespace photoshelf
