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
#include <optional>
#include <string>
#include <vector>

#include "album/album_query.hpp"
#include "album/album_record.hpp"
#include "album/ingest_request.hpp"
#include "app/edit_service.hpp"
#include "app/ingest_service.hpp"
#include "app/query_service.hpp"
#include "app/shelf_service.hpp"
#include "app/stats_service.hpp"
#include "app/tag_service.hpp"
#include "config/shelf_config.hpp"
#include "storage/record_store.hpp"

namespace photoshelf {
// Entry point for front ends: wires one record store into every service
class ShelfLibrary {
 private:
  ShelfConfig                        config_;
  std::shared_ptr<RecordStore>       store_;
  std::shared_ptr<ShelfService>      shelf_;

  std::unique_ptr<IngestService>     ingest_service_;
  std::unique_ptr<QueryService>      query_service_;
  std::unique_ptr<TagService>        tag_service_;
  std::unique_ptr<EditService>       edit_service_;
  std::unique_ptr<StatsService>      stats_service_;

 public:
  ShelfLibrary() = delete;
  explicit ShelfLibrary(ShelfConfig config);

  auto IngestSingle(const SingleCandidate& candidate) -> IngestResult;
  auto IngestBatch(const BatchCandidates& candidates) -> IngestReport;
  auto Ingest(const IngestRequest& request) -> IngestReport;
  auto IngestJSON(const std::string& payload) -> IngestReport;

  auto Search(const std::string& query, const QueryFilters& filters = {})
      -> std::vector<MatchedAlbum>;

  auto ListTags(const std::optional<std::string>& filter = std::nullopt)
      -> std::vector<TagCount>;
  auto ToggleTag(const album_url_t& url, const album_tag_t& tag, TagAction action)
      -> TagToggleOutcome;
  auto BuildTagMenu(const album_url_t& url,
                    const std::optional<std::string>& filter = std::nullopt) -> TagMenu;

  auto EditTitle(const album_url_t& url, const std::string& new_title) -> TitleEdit;
  auto EditItemCount(const album_url_t& url, item_count_t new_count) -> ItemCountEdit;
  auto EditItemCount(const album_url_t& url, const std::string& new_count_text)
      -> ItemCountEdit;
  auto EditDate(const album_url_t& url, const std::string& date_input) -> DateEdit;
  auto DeleteAlbum(const album_url_t& url) -> AlbumRecord;

  auto Stats() -> AlbumStats;

  auto GetConfig() const -> const ShelfConfig& { return config_; }
};
};  // namespace photoshelf
