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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "type/type.hpp"

namespace photoshelf {
// An album page scraped on its own, dates included
struct SingleCandidate {
  album_url_t                 url_;
  std::optional<std::string>  title_      = std::nullopt;
  std::optional<item_count_t> item_count_ = std::nullopt;
  std::optional<std::string>  start_date_ = std::nullopt;
  std::optional<std::string>  end_date_   = std::nullopt;
};

// One row of an album overview page
struct BatchEntry {
  album_url_t                 url_;
  std::optional<std::string>  title_      = std::nullopt;
  std::optional<item_count_t> item_count_ = std::nullopt;
};

struct BatchCandidates {
  std::vector<BatchEntry> albums_;
};

using IngestRequest = std::variant<SingleCandidate, BatchCandidates>;

/**
 * @brief Classify a scraper payload: {"type":"single",...}, {"type":"bulk","albums":[...]}.
 *        A scraper error object {"error": "..."} and every other shape raise FORMAT.
 *
 */
auto ParseIngestRequest(const nlohmann::json& payload) -> IngestRequest;
auto ParseIngestRequest(const std::string& payload) -> IngestRequest;

/**
 * @brief Lenient count reading for scraped values: integers, integral floats and numeric
 *        strings. Anything else, negatives included, is "not supplied".
 *
 */
auto ReadCandidateCount(const nlohmann::json& value) -> std::optional<item_count_t>;
};  // namespace photoshelf
