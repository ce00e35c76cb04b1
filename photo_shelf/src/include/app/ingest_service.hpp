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
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "album/album_collection.hpp"
#include "album/date_normalizer.hpp"
#include "album/ingest_request.hpp"
#include "app/shelf_service.hpp"
#include "type/type.hpp"

namespace photoshelf {
enum class IngestOutcome : uint8_t {
  CREATED = 0,
  UPDATED,
  UNCHANGED,
  SKIPPED  // no url, nothing recorded
};

struct IngestResult {
  album_id_t    id_{};
  IngestOutcome outcome_ = IngestOutcome::SKIPPED;
};

struct IngestReport {
  std::vector<album_id_t> created_ids_{};
  std::vector<album_id_t> updated_ids_{};
  std::vector<album_id_t> unchanged_ids_{};

  void                    Add(const IngestResult& result);
  auto                    Total() const -> size_t {
    return created_ids_.size() + updated_ids_.size() + unchanged_ids_.size();
  }
  auto ToJSON() const -> nlohmann::json;
};

class IngestService {
 public:
  virtual ~IngestService()                                               = default;

  virtual auto IngestSingle(const SingleCandidate& candidate) -> IngestResult = 0;
  virtual auto IngestBatch(const BatchCandidates& candidates) -> IngestReport = 0;
  virtual auto Ingest(const IngestRequest& request) -> IngestReport           = 0;
  virtual auto IngestJSON(const std::string& payload) -> IngestReport         = 0;
};

class IngestServiceImpl final : public IngestService {
 private:
  std::shared_ptr<ShelfService> shelf_;
  ref_year_t                    reference_year_;

  /**
   * @brief Merge one candidate into the snapshot. Titles of existing records are never
   *        touched; counts only fill an absent or zero value; dates replace the stored
   *        span as a unit when they differ after normalization.
   *
   */
  auto Merge(AlbumCollection& albums, const album_url_t& url,
             const std::optional<std::string>& title, std::optional<item_count_t> item_count,
             const std::optional<DateSpan>& span) -> IngestResult;

 public:
  IngestServiceImpl() = delete;
  IngestServiceImpl(std::shared_ptr<ShelfService> shelf, ref_year_t reference_year);

  auto IngestSingle(const SingleCandidate& candidate) -> IngestResult override;
  auto IngestBatch(const BatchCandidates& candidates) -> IngestReport override;
  auto Ingest(const IngestRequest& request) -> IngestReport override;
  auto IngestJSON(const std::string& payload) -> IngestReport override;
};
};  // namespace photoshelf
