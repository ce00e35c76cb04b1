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

#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "album/album_query.hpp"
#include "app/shelf_service.hpp"
#include "type/type.hpp"

namespace photoshelf {
struct MatchedAlbum {
  size_t                      position_ = 0;  // 1-based
  size_t                      total_    = 0;

  std::string                 display_title_;
  std::string                 clean_title_;
  std::string                 date_display_;
  std::vector<album_tag_t>    tags_;
  std::string                 subtitle_;

  album_url_t                 url_;
  album_id_t                  id_;
  std::optional<item_count_t> item_count_ = std::nullopt;
  std::string                 date_edit_;  // "A" or "A--B", empty without a date

  auto                        ToJSON() const -> nlohmann::json;
};

class QueryService {
 private:
  std::shared_ptr<ShelfService> shelf_;
  ref_year_t                    reference_year_;

 public:
  QueryService() = delete;
  QueryService(std::shared_ptr<ShelfService> shelf, ref_year_t reference_year);

  /**
   * @brief Filter the collection and order the hits newest first, undated last. Ties keep
   *        file order.
   *
   * @param raw_query free text plus an optional y:YYYY / y:YYYY-YYYY token
   * @param filters id set and tag restrictions
   */
  auto Search(const std::string& raw_query, const QueryFilters& filters = {})
      -> std::vector<MatchedAlbum>;

  /**
   * @brief Same as Search() but on an already loaded snapshot
   *
   */
  auto Search(const AlbumCollection& albums, const std::string& raw_query,
              const QueryFilters& filters) const -> std::vector<MatchedAlbum>;
};
};  // namespace photoshelf
