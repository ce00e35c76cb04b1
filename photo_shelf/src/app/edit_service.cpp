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

#include "app/edit_service.hpp"

#include <charconv>
#include <format>
#include <stdexcept>
#include <utility>

#include "album/shelf_error.hpp"
#include "utils/string/convert.hpp"

namespace photoshelf {
namespace {
auto RequireUrl(const album_url_t& url) -> album_url_t {
  album_url_t key = conv::Trim(url);
  if (key.empty()) {
    throw ShelfError(ShelfErrorCode::VALIDATION, "Album URL is required");
  }
  return key;
}

auto FindOrThrow(AlbumCollection& albums, const album_url_t& url) -> AlbumRecord& {
  AlbumRecord* record = albums.Find(url);
  if (record == nullptr) {
    throw ShelfError(ShelfErrorCode::NOT_FOUND, std::format("Album not found: {}", url));
  }
  return *record;
}
}  // namespace

auto TitleEdit::ToJSON() const -> nlohmann::json {
  return {{"url", url_}, {"old_title", old_title_}, {"new_title", new_title_}};
}

auto ItemCountEdit::ToJSON() const -> nlohmann::json {
  nlohmann::json j = {{"url", url_}, {"new_count", new_count_}};
  if (old_count_.has_value()) {
    j["old_count"] = old_count_.value();
  } else {
    j["old_count"] = nullptr;
  }
  return j;
}

auto DateEdit::ToJSON() const -> nlohmann::json {
  return {{"url", url_}, {"dateRange", canonical_range_}, {"display", display_}};
}

auto ParseItemCount(const std::string& text) -> item_count_t {
  std::string digits = conv::Trim(text);
  if (!digits.empty() && digits.front() == '+') {
    digits.erase(0, 1);
  }
  item_count_t value = 0;
  auto [ptr, ec]     = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
    throw ShelfError(ShelfErrorCode::VALIDATION,
                     std::format("Invalid item count '{}', enter a whole number", text));
  }
  if (value < 0) {
    throw ShelfError(ShelfErrorCode::VALIDATION, "Item count must be 0 or greater");
  }
  return value;
}

EditService::EditService(std::shared_ptr<ShelfService> shelf, ref_year_t reference_year)
    : shelf_(std::move(shelf)), reference_year_(reference_year) {
  if (!shelf_) {
    throw std::invalid_argument("EditService: shelf service is null");
  }
}

auto EditService::EditTitle(const album_url_t& url, const std::string& new_title) -> TitleEdit {
  const album_url_t key   = RequireUrl(url);
  const std::string title = conv::SanitizeUtf8(conv::Trim(new_title));
  if (title.empty()) {
    throw ShelfError(ShelfErrorCode::VALIDATION, "Title cannot be empty");
  }

  return shelf_
      ->Write<TitleEdit>([&](AlbumCollection& albums) {
        AlbumRecord& record = FindOrThrow(albums, key);
        TitleEdit    edit{record.url_, record.title_, title};
        record.title_ = title;
        albums.MarkDirty();
        return edit;
      })
      .first;
}

auto EditService::EditItemCount(const album_url_t& url, item_count_t new_count)
    -> ItemCountEdit {
  const album_url_t key = RequireUrl(url);
  if (new_count < 0) {
    throw ShelfError(ShelfErrorCode::VALIDATION, "Item count must be 0 or greater");
  }

  return shelf_
      ->Write<ItemCountEdit>([&](AlbumCollection& albums) {
        AlbumRecord&  record = FindOrThrow(albums, key);
        ItemCountEdit edit{record.url_, record.item_count_, new_count};
        record.item_count_ = new_count;
        albums.MarkDirty();
        return edit;
      })
      .first;
}

auto EditService::EditItemCount(const album_url_t& url, const std::string& new_count_text)
    -> ItemCountEdit {
  return EditItemCount(url, ParseItemCount(new_count_text));
}

auto EditService::EditDate(const album_url_t& url, const std::string& date_input) -> DateEdit {
  const album_url_t key  = RequireUrl(url);
  const auto        span = DateNormalizer::ParseDateInput(date_input, reference_year_);
  if (!span.has_value()) {
    throw ShelfError(ShelfErrorCode::VALIDATION,
                     std::format("Invalid date '{}', use yyyy-mm-dd or yyyy-mm-dd--yyyy-mm-dd",
                                 date_input));
  }

  return shelf_
      ->Write<DateEdit>([&](AlbumCollection& albums) {
        AlbumRecord& record = FindOrThrow(albums, key);
        record.SetDateSpan(span.value());
        albums.MarkDirty();
        return DateEdit{record.url_, span.value(), span->ToRange(),
                        DateNormalizer::DisplaySpan(span.value())};
      })
      .first;
}

auto EditService::DeleteAlbum(const album_url_t& url) -> AlbumRecord {
  const album_url_t key = RequireUrl(url);

  return shelf_
      ->Write<AlbumRecord>([&](AlbumCollection& albums) {
        auto removed = albums.Erase(key);
        if (!removed.has_value()) {
          throw ShelfError(ShelfErrorCode::NOT_FOUND, std::format("Album not found: {}", key));
        }
        albums.MarkDirty();
        return std::move(removed.value());
      })
      .first;
}
};  // namespace photoshelf
