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
#include <optional>
#include <string>

#include "album/album_record.hpp"
#include "album/date_normalizer.hpp"
#include "app/shelf_service.hpp"
#include "type/type.hpp"

namespace photoshelf {
struct TitleEdit {
  album_url_t url_;
  std::string old_title_;
  std::string new_title_;

  auto        ToJSON() const -> nlohmann::json;
};

struct ItemCountEdit {
  album_url_t                 url_;
  std::optional<item_count_t> old_count_ = std::nullopt;
  item_count_t                new_count_ = 0;

  auto                        ToJSON() const -> nlohmann::json;
};

struct DateEdit {
  album_url_t url_;
  DateSpan    span_;
  std::string canonical_range_;  // "A" or "A--B"
  std::string display_;          // "Mar 01, 2023" or "Mar 01 – Mar 03, 2023"

  auto        ToJSON() const -> nlohmann::json;
};

/**
 * @brief Parse a typed item count. Surrounding whitespace and a leading '+' are accepted.
 *
 * @throws ShelfError VALIDATION for non-integers and negatives
 */
auto ParseItemCount(const std::string& text) -> item_count_t;

// Direct, unconditional edits of a single album. Every call is one load/modify/save cycle.
class EditService {
 private:
  std::shared_ptr<ShelfService> shelf_;
  ref_year_t                    reference_year_;

 public:
  EditService() = delete;
  EditService(std::shared_ptr<ShelfService> shelf, ref_year_t reference_year);

  auto EditTitle(const album_url_t& url, const std::string& new_title) -> TitleEdit;
  auto EditItemCount(const album_url_t& url, item_count_t new_count) -> ItemCountEdit;
  auto EditItemCount(const album_url_t& url, const std::string& new_count_text)
      -> ItemCountEdit;

  /**
   * @brief Replace the album's date with "A" or "A--B". A single date drops any endDate.
   *
   */
  auto EditDate(const album_url_t& url, const std::string& date_input) -> DateEdit;

  /**
   * @brief Remove the album and hand back what was stored
   *
   */
  auto DeleteAlbum(const album_url_t& url) -> AlbumRecord;
};
};  // namespace photoshelf
