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

#include "album/date_normalizer.hpp"

#include <array>
#include <cctype>
#include <format>
#include <regex>
#include <string>

#include "utils/string/convert.hpp"

namespace photoshelf {
namespace {
constexpr std::array<const char*, 12> kMonthAbbr = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
constexpr std::array<const char*, 12> kMonthFull = {
    "january", "february", "march",     "april",   "may",      "june",
    "july",    "august",   "september", "october", "november", "december"};

const std::regex kCanonicalPattern(R"(^(\d{4})-(\d{2})-(\d{2})$)");
const std::regex kDisplayPattern(R"(^([A-Za-z]+)\.?\s+(\d{1,2})(?:\s*,\s*(\d{4}))?$)");

auto             ToLowerAscii(std::string s) -> std::string {
  for (auto& ch : s) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return s;
}
}  // namespace

auto DateSpan::ToRange() const -> std::string { return DateNormalizer::BuildRange(start_, end_); }

auto DateNormalizer::DaysInMonth(int32_t year, int32_t month) -> int32_t {
  static constexpr std::array<int32_t, 12> kDays = {31, 28, 31, 30, 31, 30,
                                                    31, 31, 30, 31, 30, 31};
  if (month == 2) {
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return leap ? 29 : 28;
  }
  return kDays[month - 1];
}

auto DateNormalizer::MonthFromName(const std::string& name) -> std::optional<int32_t> {
  const std::string lower = ToLowerAscii(name);
  for (size_t i = 0; i < kMonthAbbr.size(); ++i) {
    if (lower == ToLowerAscii(kMonthAbbr[i]) || lower == kMonthFull[i]) {
      return static_cast<int32_t>(i + 1);
    }
  }
  return std::nullopt;
}

auto DateNormalizer::Format(int32_t year, int32_t month, int32_t day) -> canon_date_t {
  return std::format("{:04}-{:02}-{:02}", year, month, day);
}

auto DateNormalizer::Validate(const std::string& s) -> bool {
  std::smatch m;
  if (!std::regex_match(s, m, kCanonicalPattern)) {
    return false;
  }
  const int32_t year  = std::stoi(m[1].str());
  const int32_t month = std::stoi(m[2].str());
  const int32_t day   = std::stoi(m[3].str());
  if (year < 1 || month < 1 || month > 12 || day < 1) {
    return false;
  }
  return day <= DaysInMonth(year, month);
}

auto DateNormalizer::Normalize(const std::string& raw, ref_year_t reference_year)
    -> std::optional<canon_date_t> {
  const std::string text = conv::Trim(raw);
  if (text.empty()) {
    return std::nullopt;
  }

  if (Validate(text)) {
    return text;
  }

  std::smatch m;
  if (!std::regex_match(text, m, kDisplayPattern)) {
    return std::nullopt;
  }
  const auto month = MonthFromName(m[1].str());
  if (!month.has_value()) {
    return std::nullopt;
  }
  const int32_t day  = std::stoi(m[2].str());
  const int32_t year = m[3].matched ? std::stoi(m[3].str()) : reference_year;
  if (year < 1 || day < 1 || day > DaysInMonth(year, month.value())) {
    return std::nullopt;
  }
  return Format(year, month.value(), day);
}

auto DateNormalizer::BuildRange(const canon_date_t& start, const std::optional<canon_date_t>& end)
    -> std::string {
  if (end.has_value()) {
    return start + kRangeSeparator + end.value();
  }
  return start;
}

auto DateNormalizer::SplitRange(const std::string& range) -> std::optional<DateSpan> {
  const std::string text = conv::Trim(range);
  const auto        pos  = text.find(kRangeSeparator);
  if (pos == std::string::npos) {
    if (!Validate(text)) {
      return std::nullopt;
    }
    return DateSpan{text, std::nullopt};
  }
  const std::string start = conv::Trim(text.substr(0, pos));
  const std::string end   = conv::Trim(text.substr(pos + 2));
  if (!Validate(start) || !Validate(end)) {
    return std::nullopt;
  }
  return DateSpan{start, end};
}

auto DateNormalizer::DisplayDate(const canon_date_t& canonical) -> std::string {
  if (!Validate(canonical)) {
    return canonical;
  }
  const int32_t month = std::stoi(canonical.substr(5, 2));
  return std::format("{} {}, {}", kMonthAbbr[month - 1], canonical.substr(8, 2),
                     canonical.substr(0, 4));
}

auto DateNormalizer::DisplayRange(const canon_date_t& start, const canon_date_t& end)
    -> std::string {
  if (!Validate(start) || !Validate(end)) {
    return std::format("{} – {}", start, end);
  }
  if (start.substr(0, 4) == end.substr(0, 4)) {
    const int32_t month = std::stoi(start.substr(5, 2));
    return std::format("{} {} – {}", kMonthAbbr[month - 1], start.substr(8, 2),
                       DisplayDate(end));
  }
  return std::format("{} – {}", DisplayDate(start), DisplayDate(end));
}

auto DateNormalizer::DisplaySpan(const DateSpan& span) -> std::string {
  if (span.end_.has_value()) {
    return DisplayRange(span.start_, span.end_.value());
  }
  return DisplayDate(span.start_);
}

auto DateNormalizer::ParseTriple(const std::string& raw, ref_year_t reference_year) -> DateTriple {
  const auto canonical = Normalize(raw, reference_year);
  if (!canonical.has_value()) {
    return DateTriple{};
  }
  const auto& c = canonical.value();
  return DateTriple{std::stoi(c.substr(0, 4)), std::stoi(c.substr(5, 2)),
                    std::stoi(c.substr(8, 2))};
}

auto DateNormalizer::NormalizeSpan(const std::optional<std::string>& raw_start,
                                   const std::optional<std::string>& raw_end,
                                   ref_year_t reference_year) -> std::optional<DateSpan> {
  if (!raw_start.has_value() || conv::Trim(raw_start.value()).empty()) {
    return std::nullopt;
  }
  auto start = Normalize(raw_start.value(), reference_year);
  if (!start.has_value()) {
    return std::nullopt;
  }
  if (!raw_end.has_value() || conv::Trim(raw_end.value()).empty()) {
    return DateSpan{start.value(), std::nullopt};
  }
  auto end = Normalize(raw_end.value(), reference_year);
  // Canonical strings order chronologically
  if (!end.has_value() || end.value() < start.value()) {
    return std::nullopt;
  }
  return DateSpan{start.value(), end.value()};
}

auto DateNormalizer::ParseDateInput(const std::string& text, ref_year_t reference_year)
    -> std::optional<DateSpan> {
  const std::string input = conv::Trim(text);
  if (input.empty()) {
    return std::nullopt;
  }
  const auto pos = input.find(kRangeSeparator);
  if (pos == std::string::npos) {
    auto single = Normalize(input, reference_year);
    if (!single.has_value()) {
      return std::nullopt;
    }
    return DateSpan{single.value(), std::nullopt};
  }
  // Exactly one separator
  if (input.find(kRangeSeparator, pos + 2) != std::string::npos) {
    return std::nullopt;
  }
  const std::string start = input.substr(0, pos);
  const std::string end   = input.substr(pos + 2);
  if (conv::Trim(end).empty()) {
    return std::nullopt;
  }
  return NormalizeSpan(start, end, reference_year);
}
};  // namespace photoshelf
