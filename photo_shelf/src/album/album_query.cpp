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

#include "album/album_query.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <utility>

#include "album/date_normalizer.hpp"
#include "utils/string/convert.hpp"

namespace photoshelf {
namespace {
const std::regex kYearToken(R"(^[yY]:(\d{4})(?:-(\d{4}))?$)");

auto             IsSeparator(char ch) -> bool {
  return ch == '-' || ch == '_' || ch == '/' || ch == '\\' || ch == '|';
}

auto IsAsciiSpace(char ch) -> bool {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}
}  // namespace

auto AlbumQuery::ParseQuery(const std::string& raw_query) -> ParsedQuery {
  ParsedQuery        parsed;
  std::istringstream stream(raw_query);
  std::string        token;
  std::string        remaining;
  while (stream >> token) {
    std::smatch m;
    if (std::regex_match(token, m, kYearToken)) {
      int32_t start = std::stoi(m[1].str());
      int32_t end   = m[2].matched ? std::stoi(m[2].str()) : start;
      if (end < start) {
        std::swap(start, end);
      }
      // Later tokens override earlier ones
      parsed.year_ = YearFilter{start, end};
      continue;
    }
    if (!remaining.empty()) {
      remaining.push_back(' ');
    }
    remaining += token;
  }

  std::istringstream term_stream(NormalizeText(remaining));
  std::string        term;
  while (term_stream >> term) {
    parsed.terms_.push_back(term);
  }
  return parsed;
}

auto AlbumQuery::NormalizeText(const std::string& text) -> std::string {
  const std::string lowered = conv::ToLowerUtf8(text);
  std::string       result;
  result.reserve(lowered.size());
  bool pending_space = false;
  for (char ch : lowered) {
    if (IsSeparator(ch) || IsAsciiSpace(ch)) {
      pending_space = true;
      continue;
    }
    if (pending_space && !result.empty()) {
      result.push_back(' ');
    }
    pending_space = false;
    result.push_back(ch);
  }
  return result;
}

auto AlbumQuery::MatchesTerms(const std::string& title, const std::vector<std::string>& terms)
    -> bool {
  if (terms.empty()) {
    return true;
  }
  const std::string normalized = NormalizeText(title);
  return std::all_of(terms.begin(), terms.end(), [&normalized](const std::string& term) {
    return normalized.find(term) != std::string::npos;
  });
}

auto AlbumQuery::MatchesYear(const AlbumRecord& record, const YearFilter& filter,
                             ref_year_t reference_year) -> bool {
  const auto raw_start = record.RawStart();
  if (!raw_start.has_value()) {
    return false;
  }
  const DateTriple start = DateNormalizer::ParseTriple(raw_start.value(), reference_year);
  if (start.IsSentinel()) {
    return false;
  }
  int32_t    end_year = start.year_;
  const auto raw_end  = record.RawEnd();
  if (raw_end.has_value()) {
    const DateTriple end = DateNormalizer::ParseTriple(raw_end.value(), reference_year);
    if (!end.IsSentinel()) {
      end_year = end.year_;
    }
  }
  return start.year_ <= filter.end_year_ && end_year >= filter.start_year_;
}

auto AlbumQuery::MatchesFilters(const AlbumRecord& record, const QueryFilters& filters) -> bool {
  if (filters.ids_.has_value() && !filters.ids_->contains(record.id_)) {
    return false;
  }
  if (filters.tag_.has_value() && !record.HasTag(filters.tag_.value())) {
    return false;
  }
  return true;
}

auto AlbumQuery::CleanTitle(const std::string& title) -> std::string {
  const std::string suffix = kGooglePhotosSuffix;
  if (title.size() >= suffix.size() &&
      title.compare(title.size() - suffix.size(), suffix.size(), suffix) == 0) {
    return title.substr(0, title.size() - suffix.size());
  }
  return title;
}

auto AlbumQuery::FormatCount(int64_t n) -> std::string {
  std::string digits = std::to_string(n < 0 ? -n : n);
  std::string result;
  result.reserve(digits.size() + digits.size() / 3 + 1);
  for (size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (digits.size() - i) % 3 == 0) {
      result.push_back(',');
    }
    result.push_back(digits[i]);
  }
  return n < 0 ? "-" + result : result;
}
};  // namespace photoshelf
