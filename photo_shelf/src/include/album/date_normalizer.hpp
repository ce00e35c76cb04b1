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

#include <compare>
#include <cstdint>
#include <optional>
#include <string>

#include "type/type.hpp"

namespace photoshelf {
/**
 * @brief (year, month, day) ordering key. The all-zero value stands for "no date" and
 *        compares below every real date.
 *
 */
struct DateTriple {
  int32_t year_  = 0;
  int32_t month_ = 0;
  int32_t day_   = 0;

  auto    IsSentinel() const -> bool { return year_ == 0 && month_ == 0 && day_ == 0; }
  auto    operator<=>(const DateTriple&) const = default;
};

/**
 * @brief A single canonical date or a closed interval of two canonical dates
 *
 */
struct DateSpan {
  canon_date_t                start_;
  std::optional<canon_date_t> end_ = std::nullopt;

  auto                        ToRange() const -> std::string;
  bool                        operator==(const DateSpan&) const = default;
};

/**
 * @brief Stateless conversions between the date spellings found in album data
 *        ("2024-11-27", "Nov 27, 2024", "Nov 27") and the canonical yyyy-mm-dd form.
 *
 */
class DateNormalizer {
 public:
  static constexpr const char* kRangeSeparator = "--";

  /**
   * @brief Convert any supported spelling to yyyy-mm-dd. Spellings without a year are
   *        placed in reference_year.
   *
   * @return std::nullopt when the text is not a date
   */
  static auto Normalize(const std::string& raw, ref_year_t reference_year)
      -> std::optional<canon_date_t>;

  static auto Validate(const std::string& s) -> bool;

  static auto BuildRange(const canon_date_t& start, const std::optional<canon_date_t>& end)
      -> std::string;
  static auto SplitRange(const std::string& range) -> std::optional<DateSpan>;

  static auto DisplayDate(const canon_date_t& canonical) -> std::string;
  static auto DisplayRange(const canon_date_t& start, const canon_date_t& end) -> std::string;
  static auto DisplaySpan(const DateSpan& span) -> std::string;

  static auto ParseTriple(const std::string& raw, ref_year_t reference_year) -> DateTriple;

  /**
   * @brief Normalize a start / optional end pair coming from scraped data. The pair is
   *        rejected as a whole when either side fails or the end precedes the start.
   *
   */
  static auto NormalizeSpan(const std::optional<std::string>& raw_start,
                            const std::optional<std::string>& raw_end, ref_year_t reference_year)
      -> std::optional<DateSpan>;

  /**
   * @brief Parser for user typed date edits: "A" or "A--B", each side in any spelling
   *        Normalize() accepts.
   *
   */
  static auto ParseDateInput(const std::string& text, ref_year_t reference_year)
      -> std::optional<DateSpan>;

 private:
  static auto DaysInMonth(int32_t year, int32_t month) -> int32_t;
  static auto MonthFromName(const std::string& name) -> std::optional<int32_t>;
  static auto Format(int32_t year, int32_t month, int32_t day) -> canon_date_t;
};
};  // namespace photoshelf
