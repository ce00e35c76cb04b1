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

#include "app/tag_service.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "album/shelf_error.hpp"
#include "utils/string/convert.hpp"

namespace photoshelf {
auto ParseTagAction(const std::string& text) -> TagAction {
  const std::string lowered = conv::ToLowerUtf8(conv::Trim(text));
  if (lowered == "add") {
    return TagAction::ADD;
  }
  if (lowered == "remove") {
    return TagAction::REMOVE;
  }
  throw ShelfError(ShelfErrorCode::VALIDATION,
                   std::format("Unknown tag action '{}', expected add or remove", text));
}

auto TagToggleOutcomeName(TagToggleOutcome outcome) -> const char* {
  switch (outcome) {
    case TagToggleOutcome::APPLIED:
      return "applied";
    case TagToggleOutcome::ALREADY_IN_STATE:
      return "already_in_state";
    case TagToggleOutcome::ALBUM_NOT_FOUND:
      return "album_not_found";
  }
  return "unknown";
}

auto TagMenu::ToJSON() const -> nlohmann::json {
  nlohmann::json entries = nlohmann::json::array();
  for (const auto& entry : entries_) {
    nlohmann::json item = {{"tag", entry.tag_},
                           {"count", entry.count_},
                           {"action", TagActionName(entry.action_)},
                           {"create", entry.create_}};
    entries.push_back(std::move(item));
  }
  return {{"url", url_}, {"title", title_}, {"tags", current_tags_}, {"entries", entries}};
}

TagService::TagService(std::shared_ptr<ShelfService> shelf) : shelf_(std::move(shelf)) {
  if (!shelf_) {
    throw std::invalid_argument("TagService: shelf service is null");
  }
}

auto TagService::Aggregate(const AlbumCollection& albums, TagOrder order)
    -> std::vector<TagCount> {
  std::vector<TagCount>                   counts;
  std::unordered_map<album_tag_t, size_t> index;
  for (const auto& record : albums) {
    for (const auto& tag : record.tags_) {
      auto it = index.find(tag);
      if (it == index.end()) {
        index.emplace(tag, counts.size());
        counts.push_back({tag, 1});
      } else {
        ++counts[it->second].count_;
      }
    }
  }

  if (order == TagOrder::COUNT_ONLY) {
    std::stable_sort(counts.begin(), counts.end(), [](const TagCount& a, const TagCount& b) {
      return a.count_ > b.count_;
    });
    return counts;
  }

  std::vector<std::pair<std::string, TagCount>> keyed;
  keyed.reserve(counts.size());
  for (auto& count : counts) {
    keyed.emplace_back(conv::ToLowerUtf8(count.tag_), std::move(count));
  }
  std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
    if (a.second.count_ != b.second.count_) {
      return a.second.count_ > b.second.count_;
    }
    return a.first < b.first;
  });
  std::vector<TagCount> sorted;
  sorted.reserve(keyed.size());
  for (auto& [key, count] : keyed) {
    sorted.push_back(std::move(count));
  }
  return sorted;
}

auto TagService::AllTags(TagOrder order) -> std::vector<TagCount> {
  return shelf_->Read<std::vector<TagCount>>(
      [order](const AlbumCollection& albums) { return Aggregate(albums, order); });
}

auto TagService::ListTags(const std::optional<std::string>& filter) -> std::vector<TagCount> {
  auto              tags   = AllTags(TagOrder::COUNT_THEN_NAME);
  const std::string needle = conv::ToLowerUtf8(conv::Trim(filter.value_or("")));
  if (needle.empty()) {
    return tags;
  }
  std::erase_if(tags, [&needle](const TagCount& count) {
    return conv::ToLowerUtf8(count.tag_).find(needle) == std::string::npos;
  });
  return tags;
}

auto TagService::Toggle(const album_url_t& url, const album_tag_t& tag, TagAction action)
    -> TagToggleOutcome {
  const album_url_t key   = conv::Trim(url);
  const album_tag_t label = conv::SanitizeUtf8(conv::Trim(tag));
  if (key.empty() || label.empty()) {
    throw ShelfError(ShelfErrorCode::VALIDATION, "URL and tag are required");
  }

  return shelf_
      ->Write<TagToggleOutcome>([&](AlbumCollection& albums) {
        AlbumRecord* record = albums.Find(key);
        if (record == nullptr) {
          return TagToggleOutcome::ALBUM_NOT_FOUND;
        }
        const bool changed =
            action == TagAction::ADD ? record->AddTag(label) : record->RemoveTag(label);
        if (!changed) {
          return TagToggleOutcome::ALREADY_IN_STATE;
        }
        albums.MarkDirty();
        return TagToggleOutcome::APPLIED;
      })
      .first;
}

auto TagService::BuildMenu(const album_url_t& url, const std::optional<std::string>& filter)
    -> TagMenu {
  const album_url_t key    = conv::Trim(url);
  const std::string needle = conv::ToLowerUtf8(conv::Trim(filter.value_or("")));

  return shelf_->Read<TagMenu>([&](const AlbumCollection& albums) {
    const AlbumRecord* record = albums.Find(key);
    if (record == nullptr) {
      throw ShelfError(ShelfErrorCode::NOT_FOUND, std::format("Album not found: {}", key));
    }

    TagMenu menu;
    menu.url_          = record->url_;
    menu.title_        = record->title_;
    menu.current_tags_ = record->tags_;

    bool exact_match   = false;
    for (const auto& count : Aggregate(albums, TagOrder::COUNT_ONLY)) {
      const std::string lowered = conv::ToLowerUtf8(count.tag_);
      if (lowered == needle) {
        exact_match = true;
      }
      if (!needle.empty() && lowered.find(needle) == std::string::npos) {
        continue;
      }
      menu.entries_.push_back(
          {count.tag_, count.count_,
           record->HasTag(count.tag_) ? TagAction::REMOVE : TagAction::ADD, false});
    }

    if (!needle.empty() && !exact_match) {
      menu.entries_.push_back({needle, 0, TagAction::ADD, true});
    }
    return menu;
  });
}
};  // namespace photoshelf
