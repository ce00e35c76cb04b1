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

#include "app/shelf_service.hpp"

#include <stdexcept>
#include <utility>

namespace photoshelf {
ShelfService::ShelfService(std::shared_ptr<RecordStore> store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("ShelfService: record store is null");
  }
}

auto ShelfService::Sync(AlbumCollection& albums) -> SyncResult {
  if (!albums.IsDirty()) {
    return SyncResult{true, 0, "unchanged"};
  }
  SyncResult result = store_->Save(albums);
  albums.ClearDirty();
  return result;
}
};  // namespace photoshelf
