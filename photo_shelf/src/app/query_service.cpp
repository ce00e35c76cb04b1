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

#include "app/query_service.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

#include "album/date_normalizer.hpp"

namespace photoshelf {
namespace {
struct RankedAlbum {
  const AlbumRecord* record_;
  DateTriple         sort_key_;
};

auto JoinTags(const std::vector<album_tag_t>& tags) -> std::string {
  std::string joined;
  for (const auto& tag : tags) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += tag;
  }
  return joined;
}
}  // namespace

auto MatchedAlbum::ToJSON() const -> nlohmann::json {
  nlohmann::json j;
  j["position"]     = position_;
  j["total"]        = total_;
  j["title"]        = display_title_;
  j["clean_title"]  = clean_title_;
  j["date_display"] = date_display_;
  j["tags"]         = tags_;
  j["subtitle"]     = subtitle_;
  j["url"]          = url_;
  j["id"]           = id_;
  j["date_edit"]    = date_edit_;
  if (item_count_.has_value()) {
    j["itemCount"] = item_count_.value();
  } else {
    j["itemCount"] = nullptr;
  }
  return j;
}

QueryService::QueryService(std::shared_ptr<ShelfService> shelf, ref_year_t reference_year)
    : shelf_(std::move(shelf)), reference_year_(reference_year) {
  if (!shelf_) {
    throw std::invalid_argument("QueryService: shelf service is null");
  }
}

auto QueryService::Search(const std::string& raw_query, const QueryFilters& filters)
    -> std::vector<MatchedAlbum> {
  return shelf_->Read<std::vector<MatchedAlbum>>(
      [&](const AlbumCollection& albums) { return Search(albums, raw_query, filters); });
}

auto QueryService::Search(const AlbumCollection& albums, const std::string& raw_query,
                          const QueryFilters& filters) const -> std::vector<MatchedAlbum> {
  const ParsedQuery        query = AlbumQuery::ParseQuery(raw_query);

  std::vector<RankedAlbum> ranked;
  for (const auto& record : albums) {
    if (!AlbumQuery::MatchesFilters(record, filters)) {
      continue;
    }
    if (query.year_.has_value() &&
        !AlbumQuery::MatchesYear(record, query.year_.value(), reference_year_)) {
      continue;
    }
    if (!AlbumQuery::MatchesTerms(record.title_, query.terms_)) {
      continue;
    }
    const auto raw_start = record.RawStart();
    ranked.push_back(
        {&record, raw_start.has_value()
                      ? DateNormalizer::ParseTriple(raw_start.value(), reference_year_)
                      : DateTriple{}});
  }

  // Newest first, undated last
  std::stable_sort(ranked.begin(), ranked.end(), [](const RankedAlbum& a, const RankedAlbum& b) {
    const bool a_undated = a.sort_key_.IsSentinel();
    const bool b_undated = b.sort_key_.IsSentinel();
    if (a_undated != b_undated) {
      return b_undated;
    }
    return a.sort_key_ > b.sort_key_;
  });

  std::vector<MatchedAlbum> results;
  results.reserve(ranked.size());
  const size_t total = ranked.size();
  for (size_t i = 0; i < total; ++i) {
    const AlbumRecord& record = *ranked[i].record_;
    MatchedAlbum       match;
    match.position_    = i + 1;
    match.total_       = total;
    match.clean_title_ =
        AlbumQuery::CleanTitle(record.title_.empty() ? std::string("Untitled") : record.title_);
    match.display_title_ =
        record.HasItemCount()
            ? std::format("{} ({})", match.clean_title_,
                          AlbumQuery::FormatCount(record.item_count_.value()))
            : match.clean_title_;
    match.tags_       = record.tags_;
    match.url_        = record.url_;
    match.id_         = record.id_;
    match.item_count_ = record.item_count_;

    const auto span   = record.CurrentSpan(reference_year_);
    if (span.has_value()) {
      match.date_display_ = DateNormalizer::DisplaySpan(span.value());
      match.date_edit_    = span->ToRange();
    } else {
      match.date_display_ = record.date_range_.value_or("");
    }

    std::string details;
    if (!match.date_display_.empty()) {
      details = std::format("📅 {}", match.date_display_);
    }
    if (!record.tags_.empty()) {
      if (!details.empty()) {
        details += " • ";
      }
      details += std::format("🏷️ {}", JoinTags(record.tags_));
    }
    match.subtitle_ =
        std::format("{}/{} • {}", AlbumQuery::FormatCount(static_cast<int64_t>(match.position_)),
                    AlbumQuery::FormatCount(static_cast<int64_t>(match.total_)),
                    details.empty() ? record.url_ : details);
    results.push_back(std::move(match));
  }
  return results;
}
};  // namespace photoshelf
