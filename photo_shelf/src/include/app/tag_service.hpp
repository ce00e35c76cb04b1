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
#include "app/shelf_service.hpp"
#include "type/type.hpp"

namespace photoshelf {
enum class TagOrder : uint8_t {
  COUNT_THEN_NAME = 0,  // tag listing: count desc, then name case-insensitively
  COUNT_ONLY            // tag menu: count desc, ties in first-seen order
};

enum class TagAction : uint8_t { ADD = 0, REMOVE };

enum class TagToggleOutcome : uint8_t { APPLIED = 0, ALREADY_IN_STATE, ALBUM_NOT_FOUND };

inline auto TagActionName(TagAction action) -> const char* {
  return action == TagAction::ADD ? "add" : "remove";
}

auto ParseTagAction(const std::string& text) -> TagAction;

auto TagToggleOutcomeName(TagToggleOutcome outcome) -> const char*;

struct TagCount {
  album_tag_t tag_;
  uint32_t    count_ = 0;

  bool        operator==(const TagCount&) const = default;
};

struct TagMenuEntry {
  album_tag_t tag_;
  uint32_t    count_  = 0;
  TagAction   action_ = TagAction::ADD;
  bool        create_ = false;  // proposes a tag no album carries yet
};

struct TagMenu {
  album_url_t               url_;
  std::string               title_;
  std::vector<album_tag_t>  current_tags_;
  std::vector<TagMenuEntry> entries_;

  auto                      ToJSON() const -> nlohmann::json;
};

class TagService {
 private:
  std::shared_ptr<ShelfService> shelf_;

 public:
  TagService() = delete;
  explicit TagService(std::shared_ptr<ShelfService> shelf);

  /**
   * @brief Tag -> album count over a snapshot, in the requested order
   *
   */
  static auto Aggregate(const AlbumCollection& albums, TagOrder order) -> std::vector<TagCount>;

  auto        AllTags(TagOrder order = TagOrder::COUNT_THEN_NAME) -> std::vector<TagCount>;

  /**
   * @brief Listing order, keeping tags that contain filter case-insensitively
   *
   */
  auto        ListTags(const std::optional<std::string>& filter = std::nullopt)
      -> std::vector<TagCount>;

  /**
   * @brief Add or remove one tag on one album. Only APPLIED rewrites the file.
   *
   * @throws ShelfError VALIDATION for an empty url or tag
   */
  auto Toggle(const album_url_t& url, const album_tag_t& tag, TagAction action)
      -> TagToggleOutcome;

  /**
   * @brief Every known tag with the action a toggle would perform on this album, plus a
   *        "create" entry when the filter names a tag nobody has yet
   *
   * @throws ShelfError NOT_FOUND for an unknown url
   */
  auto BuildMenu(const album_url_t& url, const std::optional<std::string>& filter = std::nullopt)
      -> TagMenu;
};
};  // namespace photoshelf
