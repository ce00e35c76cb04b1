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

#include "app/shelf_library.hpp"

#include <utility>

namespace photoshelf {
ShelfLibrary::ShelfLibrary(ShelfConfig config) : config_(std::move(config)) {
  config_.EnsureDataDir();
  store_          = std::make_shared<RecordStore>(config_.DbPath());
  shelf_          = std::make_shared<ShelfService>(store_);

  ingest_service_ = std::make_unique<IngestServiceImpl>(shelf_, config_.reference_year_);
  query_service_  = std::make_unique<QueryService>(shelf_, config_.reference_year_);
  tag_service_    = std::make_unique<TagService>(shelf_);
  edit_service_   = std::make_unique<EditService>(shelf_, config_.reference_year_);
  stats_service_  = std::make_unique<StatsService>(shelf_);
}

auto ShelfLibrary::IngestSingle(const SingleCandidate& candidate) -> IngestResult {
  return ingest_service_->IngestSingle(candidate);
}

auto ShelfLibrary::IngestBatch(const BatchCandidates& candidates) -> IngestReport {
  return ingest_service_->IngestBatch(candidates);
}

auto ShelfLibrary::Ingest(const IngestRequest& request) -> IngestReport {
  return ingest_service_->Ingest(request);
}

auto ShelfLibrary::IngestJSON(const std::string& payload) -> IngestReport {
  return ingest_service_->IngestJSON(payload);
}

auto ShelfLibrary::Search(const std::string& query, const QueryFilters& filters)
    -> std::vector<MatchedAlbum> {
  return query_service_->Search(query, filters);
}

auto ShelfLibrary::ListTags(const std::optional<std::string>& filter) -> std::vector<TagCount> {
  return tag_service_->ListTags(filter);
}

auto ShelfLibrary::ToggleTag(const album_url_t& url, const album_tag_t& tag, TagAction action)
    -> TagToggleOutcome {
  return tag_service_->Toggle(url, tag, action);
}

auto ShelfLibrary::BuildTagMenu(const album_url_t& url, const std::optional<std::string>& filter)
    -> TagMenu {
  return tag_service_->BuildMenu(url, filter);
}

auto ShelfLibrary::EditTitle(const album_url_t& url, const std::string& new_title) -> TitleEdit {
  return edit_service_->EditTitle(url, new_title);
}

auto ShelfLibrary::EditItemCount(const album_url_t& url, item_count_t new_count)
    -> ItemCountEdit {
  return edit_service_->EditItemCount(url, new_count);
}

auto ShelfLibrary::EditItemCount(const album_url_t& url, const std::string& new_count_text)
    -> ItemCountEdit {
  return edit_service_->EditItemCount(url, new_count_text);
}

auto ShelfLibrary::EditDate(const album_url_t& url, const std::string& date_input) -> DateEdit {
  return edit_service_->EditDate(url, date_input);
}

auto ShelfLibrary::DeleteAlbum(const album_url_t& url) -> AlbumRecord {
  return edit_service_->DeleteAlbum(url);
}

auto ShelfLibrary::Stats() -> AlbumStats { return stats_service_->Compute(); }
};  // namespace photoshelf
