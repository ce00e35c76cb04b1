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
#include <string>

#include "album/album_collection.hpp"
#include "type/type.hpp"
#include "utils/id/id_generator.hpp"

namespace photoshelf {
struct SyncResult {
  bool        success_         = true;
  uint32_t    records_written_ = 0;
  std::string message_         = "";
};

/**
 * @brief Owns the line-oriented album file: one JSON object per line, no enclosing
 *        array. Every Save() replaces the whole file.
 *
 */
class RecordStore {
 private:
  store_path_t               path_;
  RandomID::AlbumIdGenerator id_gen_;

 public:
  RecordStore() = delete;
  explicit RecordStore(store_path_t path);

  /**
   * @brief Read the whole file. A missing file is an empty collection. Lines without an
   *        id get one derived from their url, so it stays the same across loads until the
   *        caller saves.
   *
   * @throws ShelfError PERSISTENCE on the first malformed line, with its line number, or
   *         when the file cannot be checked or opened
   */
  auto Load() -> AlbumCollection;

  /**
   * @brief Write all records to a sibling temp file and rename it over the album file
   *
   * @throws ShelfError PERSISTENCE when the file cannot be written. The previous file is
   *         left as it was.
   */
  auto Save(const AlbumCollection& albums) -> SyncResult;

  auto GetIdGenerator() -> RandomID::AlbumIdGenerator& { return id_gen_; }
};
};  // namespace photoshelf
