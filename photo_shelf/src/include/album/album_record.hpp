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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "album/date_normalizer.hpp"
#include "type/type.hpp"

namespace photoshelf {
/**
 * @brief One persisted album, keyed by url. Maps 1:1 onto a line of the album file.
 *
 */
class AlbumRecord {
 public:
  static constexpr const char* kDefaultTitle = "Untitled Album";

  album_id_t                   id_;
  album_url_t                  url_;
  std::string                  title_;
  std::optional<item_count_t>  item_count_ = std::nullopt;
  std::vector<album_tag_t>     tags_;

  std::optional<std::string>   date_range_ = std::nullopt;
  std::optional<std::string>   start_date_ = std::nullopt;
  std::optional<std::string>   end_date_   = std::nullopt;

  // Keys this version does not know about, written back untouched
  nlohmann::json               extra_      = nlohmann::json::object();

  auto                         HasTag(const album_tag_t& tag) const -> bool;
  auto                         AddTag(const album_tag_t& tag) -> bool;
  auto                         RemoveTag(const album_tag_t& tag) -> bool;

  auto                         HasItemCount() const -> bool;
  auto                         HasDate() const -> bool;

  /**
   * @brief The stored start/end pair, with dateRange as a fallback for lines that only
   *        carry the combined form
   *
   */
  auto                         RawStart() const -> std::optional<std::string>;
  auto                         RawEnd() const -> std::optional<std::string>;

  /**
   * @brief Current date span re-normalized, or nullopt when the record has no usable date
   *
   */
  auto CurrentSpan(ref_year_t reference_year) const -> std::optional<DateSpan>;

  /**
   * @brief Overwrite dateRange, startDate and endDate together. A span without an end
   *        removes any previous endDate.
   *
   */
  void SetDateSpan(const DateSpan& span);

  auto ToJSON() const -> nlohmann::json;

  /**
   * @brief Build a record from one parsed line
   *
   * @throws std::invalid_argument naming the offending field
   */
  static auto FromJSON(const nlohmann::json& j) -> AlbumRecord;

 private:
  // dateRange split into start and optional end, or nullopt when there is no dateRange
  auto RangeParts() const
      -> std::optional<std::pair<std::string, std::optional<std::string>>>;
};
};  // namespace photoshelf
