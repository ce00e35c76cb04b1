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

#include "album/album_record.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>
#include <utility>

namespace photoshelf {
namespace {
auto ReadOptionalString(const nlohmann::json& j, const char* key) -> std::optional<std::string> {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  if (!j.at(key).is_string()) {
    throw std::invalid_argument(std::format("field '{}' must be a string", key));
  }
  return j.at(key).get<std::string>();
}

auto ReadItemCount(const nlohmann::json& j) -> std::optional<item_count_t> {
  if (!j.contains("itemCount") || j.at("itemCount").is_null()) {
    return std::nullopt;
  }
  const auto& v = j.at("itemCount");
  if (v.is_number_unsigned()) {
    const auto n = v.get<uint64_t>();
    if (n > static_cast<uint64_t>(std::numeric_limits<item_count_t>::max())) {
      throw std::invalid_argument("field 'itemCount' is out of range");
    }
    return static_cast<item_count_t>(n);
  }
  if (v.is_number_integer()) {
    const auto n = v.get<int64_t>();
    if (n >= 0) {
      return n;
    }
  } else if (v.is_number_float()) {
    const double d = v.get<double>();
    // Below 2^63 so the conversion stays in range
    if (d >= 0 && d < 9223372036854775808.0 && std::floor(d) == d) {
      return static_cast<item_count_t>(d);
    }
  }
  throw std::invalid_argument("field 'itemCount' must be a non-negative integer");
}
}  // namespace

auto AlbumRecord::HasTag(const album_tag_t& tag) const -> bool {
  return std::find(tags_.begin(), tags_.end(), tag) != tags_.end();
}

auto AlbumRecord::AddTag(const album_tag_t& tag) -> bool {
  if (HasTag(tag)) {
    return false;
  }
  tags_.push_back(tag);
  return true;
}

auto AlbumRecord::RemoveTag(const album_tag_t& tag) -> bool {
  auto it = std::find(tags_.begin(), tags_.end(), tag);
  if (it == tags_.end()) {
    return false;
  }
  tags_.erase(it);
  return true;
}

auto AlbumRecord::HasItemCount() const -> bool {
  return item_count_.has_value() && item_count_.value() > 0;
}

auto AlbumRecord::HasDate() const -> bool {
  return (start_date_.has_value() && !start_date_->empty()) ||
         (date_range_.has_value() && !date_range_->empty());
}

auto AlbumRecord::RangeParts() const
    -> std::optional<std::pair<std::string, std::optional<std::string>>> {
  if (!date_range_.has_value() || date_range_->empty()) {
    return std::nullopt;
  }
  if (auto span = DateNormalizer::SplitRange(date_range_.value())) {
    return std::make_pair(span->start_, span->end_);
  }
  // Legacy display-form values such as "Mar 1, 2023--Mar 3, 2023"
  const auto pos = date_range_->find(DateNormalizer::kRangeSeparator);
  if (pos == std::string::npos) {
    return std::make_pair(date_range_.value(), std::optional<std::string>());
  }
  return std::make_pair(date_range_->substr(0, pos),
                        std::optional<std::string>(date_range_->substr(pos + 2)));
}

auto AlbumRecord::RawStart() const -> std::optional<std::string> {
  if (start_date_.has_value() && !start_date_->empty()) {
    return start_date_;
  }
  if (auto parts = RangeParts()) {
    return parts->first;
  }
  return std::nullopt;
}

auto AlbumRecord::RawEnd() const -> std::optional<std::string> {
  if (start_date_.has_value() && !start_date_->empty()) {
    return end_date_;
  }
  if (auto parts = RangeParts()) {
    return parts->second;
  }
  return std::nullopt;
}

auto AlbumRecord::CurrentSpan(ref_year_t reference_year) const -> std::optional<DateSpan> {
  return DateNormalizer::NormalizeSpan(RawStart(), RawEnd(), reference_year);
}

void AlbumRecord::SetDateSpan(const DateSpan& span) {
  start_date_ = span.start_;
  end_date_   = span.end_;
  date_range_ = span.ToRange();
}

auto AlbumRecord::ToJSON() const -> nlohmann::json {
  nlohmann::json j = extra_.is_object() ? extra_ : nlohmann::json::object();
  j["id"]          = id_;
  j["url"]         = url_;
  j["title"]       = title_;
  j["tags"]        = tags_;
  if (item_count_.has_value()) {
    j["itemCount"] = item_count_.value();
  }
  if (date_range_.has_value()) {
    j["dateRange"] = date_range_.value();
  }
  if (start_date_.has_value()) {
    j["startDate"] = start_date_.value();
  }
  if (end_date_.has_value()) {
    j["endDate"] = end_date_.value();
  }
  return j;
}

auto AlbumRecord::FromJSON(const nlohmann::json& j) -> AlbumRecord {
  if (!j.is_object()) {
    throw std::invalid_argument("line is not a JSON object");
  }
  AlbumRecord record;

  auto        url = ReadOptionalString(j, "url");
  if (!url.has_value() || url->empty()) {
    throw std::invalid_argument("missing 'url'");
  }
  record.url_   = url.value();
  record.id_    = ReadOptionalString(j, "id").value_or("");
  record.title_ = ReadOptionalString(j, "title").value_or("");
  record.item_count_ = ReadItemCount(j);

  if (j.contains("tags") && !j.at("tags").is_null()) {
    if (!j.at("tags").is_array()) {
      throw std::invalid_argument("field 'tags' must be an array");
    }
    for (const auto& tag : j.at("tags")) {
      if (!tag.is_string()) {
        throw std::invalid_argument("field 'tags' must only hold strings");
      }
      record.AddTag(tag.get<std::string>());
    }
  }

  record.date_range_ = ReadOptionalString(j, "dateRange");
  record.start_date_ = ReadOptionalString(j, "startDate");
  record.end_date_   = ReadOptionalString(j, "endDate");

  for (const auto& [key, value] : j.items()) {
    if (key == "id" || key == "url" || key == "title" || key == "itemCount" || key == "tags" ||
        key == "dateRange" || key == "startDate" || key == "endDate") {
      continue;
    }
    record.extra_[key] = value;
  }
  return record;
}
};  // namespace photoshelf
