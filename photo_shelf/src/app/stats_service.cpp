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

#include "app/stats_service.hpp"

#include <stdexcept>
#include <utility>

namespace photoshelf {

auto AlbumStats::ToJSON() const -> nlohmann::json {
  const auto bucket = [](const std::vector<album_id_t>& ids) {
    return nlohmann::json{{"count", ids.size()}, {"ids", ids}};
  };
  return {{"all", bucket(all_ids_)},
          {"complete", bucket(complete_ids_)},
          {"incomplete", bucket(incomplete_ids_)},
          {"missing_item_count", bucket(missing_count_ids_)},
          {"missing_date", bucket(missing_date_ids_)},
          {"missing_both", bucket(missing_both_ids_)},
          {"with_tags", bucket(with_tags_ids_)},
          {"without_tags", bucket(without_tags_ids_)}};
}

StatsService::StatsService(std::shared_ptr<ShelfService> shelf) : shelf_(std::move(shelf)) {
  if (!shelf_) {
    throw std::invalid_argument("StatsService: shelf service is null");
  }
}

auto StatsService::Compute() -> AlbumStats {
  return shelf_->Read<AlbumStats>(
      [](const AlbumCollection& albums) { return StatsService::Compute(albums); });
}

auto StatsService::Compute(const AlbumCollection& albums) -> AlbumStats {
  AlbumStats stats;
  for (const auto& record : albums) {
    const auto& id = record.id_;
    stats.all_ids_.push_back(id);

    const bool missing_count = !record.HasItemCount();
    const bool missing_date  = !record.HasDate();
    if (missing_count) {
      stats.missing_count_ids_.push_back(id);
    }
    if (missing_date) {
      stats.missing_date_ids_.push_back(id);
    }
    if (missing_count && missing_date) {
      stats.missing_both_ids_.push_back(id);
    }
    if (missing_count || missing_date) {
      stats.incomplete_ids_.push_back(id);
    } else {
      stats.complete_ids_.push_back(id);
    }

    if (record.tags_.empty()) {
      stats.without_tags_ids_.push_back(id);
    } else {
      stats.with_tags_ids_.push_back(id);
    }
  }
  return stats;
}

}  // namespace photoshelf
