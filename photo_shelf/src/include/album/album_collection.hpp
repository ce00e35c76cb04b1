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

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "album/album_record.hpp"
#include "type/type.hpp"

namespace photoshelf {
/**
 * @brief In-memory snapshot of the album file. Keeps file order and a url index, and
 *        remembers whether anything was modified since it was loaded.
 *
 */
class AlbumCollection {
 private:
  std::vector<AlbumRecord>                     records_;
  std::unordered_map<album_url_t, size_t>      url_index_;
  std::unordered_set<album_id_t>               ids_;
  bool                                         dirty_ = false;

  void                                         Reindex();

 public:
  AlbumCollection() = default;

  auto Find(const album_url_t& url) -> AlbumRecord*;
  auto Find(const album_url_t& url) const -> const AlbumRecord*;
  auto Contains(const album_url_t& url) const -> bool;
  auto HasId(const album_id_t& id) const -> bool;

  /**
   * @brief Append a record. The url must not be present yet.
   *
   * @throws std::invalid_argument on a duplicate url
   */
  auto Insert(AlbumRecord record) -> AlbumRecord&;

  /**
   * @brief Remove the record with the given url, returning it
   *
   */
  auto Erase(const album_url_t& url) -> std::optional<AlbumRecord>;

  /**
   * @brief Register an id assigned to an existing record after insertion
   *
   */
  void RegisterId(const album_id_t& id) { ids_.insert(id); }

  auto Size() const -> size_t { return records_.size(); }
  auto Empty() const -> bool { return records_.empty(); }

  void MarkDirty() { dirty_ = true; }
  auto IsDirty() const -> bool { return dirty_; }
  void ClearDirty() { dirty_ = false; }

  auto begin() const { return records_.cbegin(); }
  auto end() const { return records_.cend(); }
};
};  // namespace photoshelf
