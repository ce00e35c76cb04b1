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

#include "storage/record_store.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

#include "album/shelf_error.hpp"
#include "utils/string/convert.hpp"

namespace photoshelf {
RecordStore::RecordStore(store_path_t path) : path_(std::move(path)) {}

auto RecordStore::Load() -> AlbumCollection {
  AlbumCollection albums;
  std::error_code ec;
  const bool      present = std::filesystem::exists(path_, ec);
  if (ec) {
    throw ShelfError(ShelfErrorCode::PERSISTENCE,
                     std::format("Cannot access album file {}: {}",
                                 conv::ToBytes(path_.wstring()), ec.message()));
  }
  if (!present) {
    return albums;
  }

  std::ifstream file(path_, std::ios::binary);
  if (!file.is_open()) {
    throw ShelfError(ShelfErrorCode::PERSISTENCE,
                     std::format("Cannot open album file {}", conv::ToBytes(path_.wstring())));
  }

  std::string line;
  uint64_t    line_no    = 0;
  uint32_t    backfilled = 0;
  while (std::getline(file, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (conv::Trim(line).empty()) {
      continue;
    }

    AlbumRecord record;
    try {
      record = AlbumRecord::FromJSON(nlohmann::json::parse(line));
    } catch (const nlohmann::json::exception& e) {
      throw ShelfError(ShelfErrorCode::PERSISTENCE,
                       std::format("Malformed album line {}: {}", line_no, e.what()));
    } catch (const std::invalid_argument& e) {
      throw ShelfError(ShelfErrorCode::PERSISTENCE,
                       std::format("Malformed album line {}: {}", line_no, e.what()));
    }

    if (albums.Contains(record.url_)) {
      throw ShelfError(ShelfErrorCode::PERSISTENCE,
                       std::format("Malformed album line {}: duplicate url '{}'", line_no,
                                   record.url_));
    }
    const bool needs_id = record.id_.empty();
    auto&      inserted = albums.Insert(std::move(record));
    if (needs_id) {
      inserted.id_ = RandomID::AlbumIdGenerator::StableID(
          inserted.url_, [&albums](const album_id_t& id) { return albums.HasId(id); });
      albums.RegisterId(inserted.id_);
      ++backfilled;
    }
  }
  if (file.bad()) {
    throw ShelfError(ShelfErrorCode::PERSISTENCE,
                     std::format("Failed reading album file {}", conv::ToBytes(path_.wstring())));
  }

  if (backfilled > 0) {
    std::cerr << std::format("[RecordStore] Assigned ids to {} album(s) without one\n",
                             backfilled);
  }
  return albums;
}

auto RecordStore::Save(const AlbumCollection& albums) -> SyncResult {
  SyncResult      result{true, 0, ""};
  std::error_code ec;

  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw ShelfError(ShelfErrorCode::PERSISTENCE,
                       std::format("Cannot create data directory {}: {}",
                                   conv::ToBytes(path_.parent_path().wstring()), ec.message()));
    }
  }

  store_path_t temp_path = path_;
  temp_path += ".tmp";
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw ShelfError(ShelfErrorCode::PERSISTENCE,
                       std::format("Cannot open {} for writing",
                                   conv::ToBytes(temp_path.wstring())));
    }
    try {
      for (const auto& record : albums) {
        out << record.ToJSON().dump() << '\n';
        ++result.records_written_;
      }
    } catch (const nlohmann::json::exception& e) {
      out.close();
      std::filesystem::remove(temp_path, ec);
      throw ShelfError(ShelfErrorCode::PERSISTENCE,
                       std::format("Failed to encode album record: {}", e.what()));
    }
    out.flush();
    if (!out.good()) {
      out.close();
      std::filesystem::remove(temp_path, ec);
      std::cerr << std::format("[RecordStore] Write to {} failed\n",
                               conv::ToBytes(temp_path.wstring()));
      throw ShelfError(ShelfErrorCode::PERSISTENCE, "Failed to write album file payload");
    }
  }

  // rename() replaces the destination in one step on POSIX
  std::filesystem::rename(temp_path, path_, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(temp_path, ec);
    std::cerr << std::format("[RecordStore] Could not finalize {}: {}\n",
                             conv::ToBytes(path_.wstring()), reason);
    throw ShelfError(ShelfErrorCode::PERSISTENCE,
                     std::format("Failed to finalize album file {}: {}",
                                 conv::ToBytes(path_.wstring()), reason));
  }

  std::cerr << std::format("[RecordStore] Rewrote {} with {} album(s)\n",
                           conv::ToBytes(path_.filename().wstring()), result.records_written_);
  return result;
}
};  // namespace photoshelf
