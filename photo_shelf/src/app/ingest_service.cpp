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

#include "app/ingest_service.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include "album/album_record.hpp"
#include "utils/string/convert.hpp"

namespace photoshelf {
void IngestReport::Add(const IngestResult& result) {
  switch (result.outcome_) {
    case IngestOutcome::CREATED:
      created_ids_.push_back(result.id_);
      break;
    case IngestOutcome::UPDATED:
      updated_ids_.push_back(result.id_);
      break;
    case IngestOutcome::UNCHANGED:
      unchanged_ids_.push_back(result.id_);
      break;
    case IngestOutcome::SKIPPED:
      break;
  }
}

auto IngestReport::ToJSON() const -> nlohmann::json {
  return nlohmann::json{{"created", created_ids_},
                        {"updated", updated_ids_},
                        {"unchanged", unchanged_ids_}};
}

IngestServiceImpl::IngestServiceImpl(std::shared_ptr<ShelfService> shelf,
                                     ref_year_t                    reference_year)
    : shelf_(std::move(shelf)), reference_year_(reference_year) {
  if (!shelf_) {
    throw std::invalid_argument("IngestService: shelf service is null");
  }
}

auto IngestServiceImpl::Merge(AlbumCollection& albums, const album_url_t& raw_url,
                              const std::optional<std::string>& title,
                              std::optional<item_count_t>       item_count,
                              const std::optional<DateSpan>&    span) -> IngestResult {
  const album_url_t url = conv::SanitizeUtf8(conv::Trim(raw_url));
  if (url.empty()) {
    return {};
  }

  AlbumRecord* existing = albums.Find(url);
  if (existing == nullptr) {
    AlbumRecord record;
    record.url_ = url;
    record.title_ =
        (title.has_value() && !title->empty()) ? conv::SanitizeUtf8(title.value())
                                               : std::string(AlbumRecord::kDefaultTitle);
    record.item_count_ = item_count;
    if (span.has_value()) {
      record.SetDateSpan(span.value());
    }
    record.id_ = shelf_->GetStore()->GetIdGenerator().GenerateID(
        url, [&albums](const album_id_t& id) { return albums.HasId(id); });

    auto& inserted = albums.Insert(std::move(record));
    albums.MarkDirty();
    return {inserted.id_, IngestOutcome::CREATED};
  }

  bool updated = false;
  // Absent and zero are the same "unknown" state; a known count is a user correction
  if (item_count.has_value() && !existing->HasItemCount() &&
      existing->item_count_.value_or(0) != item_count.value()) {
    existing->item_count_ = item_count;
    updated               = true;
  }

  if (span.has_value() && existing->CurrentSpan(reference_year_) != span) {
    existing->SetDateSpan(span.value());
    updated = true;
  }

  if (updated) {
    albums.MarkDirty();
    return {existing->id_, IngestOutcome::UPDATED};
  }
  return {existing->id_, IngestOutcome::UNCHANGED};
}

auto IngestServiceImpl::IngestSingle(const SingleCandidate& candidate) -> IngestResult {
  const auto span =
      DateNormalizer::NormalizeSpan(candidate.start_date_, candidate.end_date_, reference_year_);
  return shelf_
      ->Write<IngestResult>([&](AlbumCollection& albums) {
        return Merge(albums, candidate.url_, candidate.title_, candidate.item_count_, span);
      })
      .first;
}

auto IngestServiceImpl::IngestBatch(const BatchCandidates& candidates) -> IngestReport {
  return shelf_
      ->Write<IngestReport>([&](AlbumCollection& albums) {
        IngestReport report;
        for (const auto& entry : candidates.albums_) {
          report.Add(Merge(albums, entry.url_, entry.title_, entry.item_count_, std::nullopt));
        }
        return report;
      })
      .first;
}

auto IngestServiceImpl::Ingest(const IngestRequest& request) -> IngestReport {
  return std::visit(
      [this](const auto& candidate) -> IngestReport {
        using T = std::decay_t<decltype(candidate)>;
        if constexpr (std::is_same_v<T, SingleCandidate>) {
          IngestReport report;
          report.Add(IngestSingle(candidate));
          return report;
        } else {
          return IngestBatch(candidate);
        }
      },
      request);
}

auto IngestServiceImpl::IngestJSON(const std::string& payload) -> IngestReport {
  return Ingest(ParseIngestRequest(payload));
}
};  // namespace photoshelf
