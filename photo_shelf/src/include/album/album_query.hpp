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

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "album/album_record.hpp"
#include "type/type.hpp"

namespace photoshelf {
/**
 * @brief Inclusive year interval from a "y:YYYY" or "y:YYYY-YYYY" token
 *
 */
struct YearFilter {
  int32_t start_year_ = 0;
  int32_t end_year_   = 0;

  bool    operator==(const YearFilter&) const = default;
};

struct ParsedQuery {
  std::optional<YearFilter> year_ = std::nullopt;
  std::vector<std::string>  terms_;  // normalized, all must occur in the title
};

/**
 * @brief Restrictions supplied next to the query text. Unset members do not filter.
 *
 */
struct QueryFilters {
  std::optional<std::unordered_set<album_id_t>> ids_ = std::nullopt;
  std::optional<album_tag_t>                    tag_ = std::nullopt;
};

class AlbumQuery {
 public:
  static constexpr const char* kGooglePhotosSuffix = " - Google Photos";

  static auto ParseQuery(const std::string& raw_query) -> ParsedQuery;

  /**
   * @brief Lower-case, treat - _ / \ | as spaces, collapse whitespace
   *
   */
  static auto NormalizeText(const std::string& text) -> std::string;

  static auto MatchesTerms(const std::string& title, const std::vector<std::string>& terms)
      -> bool;

  /**
   * @brief The album's year span overlaps the filter. Records without a parsable start
   *        date never match; an unparsable end falls back to the start.
   *
   */
  static auto MatchesYear(const AlbumRecord& record, const YearFilter& filter,
                          ref_year_t reference_year) -> bool;

  static auto MatchesFilters(const AlbumRecord& record, const QueryFilters& filters) -> bool;

  static auto CleanTitle(const std::string& title) -> std::string;

  /**
   * @brief 1234567 -> "1,234,567"
   *
   */
  static auto FormatCount(int64_t n) -> std::string;
};
};  // namespace photoshelf
