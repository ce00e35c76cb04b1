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

#include "album/ingest_request.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>

#include "album/shelf_error.hpp"
#include "utils/string/convert.hpp"

namespace photoshelf {
namespace {
// 2^63, the first double past the item count range
constexpr double kCountLimit = 9223372036854775808.0;

auto ReadString(const nlohmann::json& j, const char* key) -> std::optional<std::string> {
  if (!j.contains(key) || !j.at(key).is_string()) {
    return std::nullopt;
  }
  return j.at(key).get<std::string>();
}

auto ReadUrl(const nlohmann::json& j) -> album_url_t {
  return conv::Trim(ReadString(j, "url").value_or(""));
}

auto ParseSingle(const nlohmann::json& j) -> SingleCandidate {
  SingleCandidate candidate;
  candidate.url_        = ReadUrl(j);
  candidate.title_      = ReadString(j, "title");
  candidate.item_count_ = j.contains("itemCount") ? ReadCandidateCount(j.at("itemCount"))
                                                  : std::nullopt;
  candidate.start_date_ = ReadString(j, "startDate");
  candidate.end_date_   = ReadString(j, "endDate");
  return candidate;
}

auto ParseBatch(const nlohmann::json& j) -> BatchCandidates {
  BatchCandidates batch;
  if (!j.contains("albums") || j.at("albums").is_null()) {
    return batch;
  }
  const auto& albums = j.at("albums");
  if (!albums.is_array()) {
    throw ShelfError(ShelfErrorCode::FORMAT, "'albums' must be an array");
  }
  batch.albums_.reserve(albums.size());
  size_t index = 0;
  for (const auto& element : albums) {
    if (!element.is_object()) {
      throw ShelfError(ShelfErrorCode::FORMAT,
                       std::format("Batch element {} is not an object", index));
    }
    BatchEntry entry;
    entry.url_        = ReadUrl(element);
    entry.title_      = ReadString(element, "title");
    entry.item_count_ = element.contains("itemCount")
                            ? ReadCandidateCount(element.at("itemCount"))
                            : std::nullopt;
    batch.albums_.push_back(std::move(entry));
    ++index;
  }
  return batch;
}
}  // namespace

auto ReadCandidateCount(const nlohmann::json& value) -> std::optional<item_count_t> {
  if (value.is_number_unsigned()) {
    const auto n = value.get<uint64_t>();
    if (n > static_cast<uint64_t>(std::numeric_limits<item_count_t>::max())) {
      return std::nullopt;
    }
    return static_cast<item_count_t>(n);
  }
  if (value.is_number_integer()) {
    const auto n = value.get<int64_t>();
    return n >= 0 ? std::optional<item_count_t>(n) : std::nullopt;
  }
  if (value.is_number_float()) {
    const double d = value.get<double>();
    if (d >= 0 && d < kCountLimit && std::floor(d) == d) {
      return static_cast<item_count_t>(d);
    }
    return std::nullopt;
  }
  if (value.is_string()) {
    const std::string text = conv::Trim(value.get<std::string>());
    item_count_t      n    = 0;
    auto [ptr, ec]         = std::from_chars(text.data(), text.data() + text.size(), n);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() || n < 0) {
      return std::nullopt;
    }
    return n;
  }
  return std::nullopt;
}

auto ParseIngestRequest(const nlohmann::json& payload) -> IngestRequest {
  if (!payload.is_object()) {
    throw ShelfError(ShelfErrorCode::FORMAT, "Ingest payload must be a JSON object");
  }
  if (payload.contains("error")) {
    const auto& err = payload.at("error");
    throw ShelfError(ShelfErrorCode::FORMAT,
                     std::format("Scraper reported an error: {}",
                                 err.is_string() ? err.get<std::string>() : err.dump()));
  }

  const auto type = ReadString(payload, "type");
  if (type == "single") {
    return ParseSingle(payload);
  }
  if (type == "bulk") {
    return ParseBatch(payload);
  }
  throw ShelfError(ShelfErrorCode::FORMAT, "Unexpected data structure from scraper");
}

auto ParseIngestRequest(const std::string& payload) -> IngestRequest {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(payload);
  } catch (const nlohmann::json::parse_error& e) {
    throw ShelfError(ShelfErrorCode::FORMAT, std::format("Invalid JSON data: {}", e.what()));
  }
  return ParseIngestRequest(j);
}
};  // namespace photoshelf
