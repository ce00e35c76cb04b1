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

#include "album/album_collection.hpp"

#include <format>
#include <stdexcept>

namespace photoshelf {
void AlbumCollection::Reindex() {
  url_index_.clear();
  for (size_t i = 0; i < records_.size(); ++i) {
    url_index_[records_[i].url_] = i;
  }
}

auto AlbumCollection::Find(const album_url_t& url) -> AlbumRecord* {
  auto it = url_index_.find(url);
  if (it == url_index_.end()) {
    return nullptr;
  }
  return &records_[it->second];
}

auto AlbumCollection::Find(const album_url_t& url) const -> const AlbumRecord* {
  auto it = url_index_.find(url);
  if (it == url_index_.end()) {
    return nullptr;
  }
  return &records_[it->second];
}

auto AlbumCollection::Contains(const album_url_t& url) const -> bool {
  return url_index_.contains(url);
}

auto AlbumCollection::HasId(const album_id_t& id) const -> bool { return ids_.contains(id); }

auto AlbumCollection::Insert(AlbumRecord record) -> AlbumRecord& {
  if (url_index_.contains(record.url_)) {
    throw std::invalid_argument(std::format("duplicate url '{}'", record.url_));
  }
  if (!record.id_.empty()) {
    ids_.insert(record.id_);
  }
  url_index_[record.url_] = records_.size();
  records_.push_back(std::move(record));
  return records_.back();
}

auto AlbumCollection::Erase(const album_url_t& url) -> std::optional<AlbumRecord> {
  auto it = url_index_.find(url);
  if (it == url_index_.end()) {
    return std::nullopt;
  }
  const size_t index   = it->second;
  AlbumRecord  removed = std::move(records_[index]);
  records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(index));
  ids_.erase(removed.id_);
  Reindex();
  return removed;
}
};  // namespace photoshelf
