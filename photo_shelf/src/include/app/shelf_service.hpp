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

#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

#include "album/album_collection.hpp"
#include "storage/record_store.hpp"

namespace photoshelf {
// Every operation sees a fresh snapshot of the album file; mutating operations write the
// snapshot back only when they marked it dirty.
class ShelfService {
 private:
  std::shared_ptr<RecordStore> store_;

  mutable std::mutex           store_lock_;

 public:
  ShelfService() = delete;
  explicit ShelfService(std::shared_ptr<RecordStore> store);

  template <typename TResult>
  auto Read(std::function<TResult(const AlbumCollection&)> operation) -> TResult {
    std::lock_guard<std::mutex> lock(store_lock_);
    AlbumCollection             albums = store_->Load();
    if constexpr (std::is_void_v<TResult>) {
      operation(albums);
      return;
    } else {
      return operation(albums);
    }
  }

  template <typename TResult>
  auto Write(std::function<TResult(AlbumCollection&)> operation)
      -> std::conditional_t<std::is_void_v<TResult>, SyncResult,
                            std::pair<TResult, SyncResult>> {
    std::lock_guard<std::mutex> lock(store_lock_);
    AlbumCollection             albums = store_->Load();

    if constexpr (std::is_void_v<TResult>) {
      operation(albums);
      return Sync(albums);
    } else {
      TResult    result      = operation(albums);
      SyncResult sync_result = Sync(albums);
      return {std::move(result), sync_result};
    }
  }

  auto GetStore() -> std::shared_ptr<RecordStore> { return store_; }

 private:
  auto Sync(AlbumCollection& albums) -> SyncResult;
};
};  // namespace photoshelf
