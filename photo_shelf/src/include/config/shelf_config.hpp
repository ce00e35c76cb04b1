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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "type/type.hpp"

namespace photoshelf {
/**
 * @brief Where the album file lives and which year completes dates written without one.
 *        Sources apply in order: defaults, environment, config file, command line.
 *
 */
struct ShelfConfig {
  static constexpr const char* kDefaultDbFileName = "photoAlbums.json";
  static constexpr const char* kEnvDataDir        = "PHOTO_SHELF_DATA_DIR";
  static constexpr const char* kEnvLegacyDataDir  = "alfred_workflow_data";
  static constexpr const char* kEnvReferenceYear  = "PHOTO_SHELF_REFERENCE_YEAR";

  store_path_t                 data_dir_;
  std::string                  db_file_name_      = kDefaultDbFileName;
  ref_year_t                   reference_year_    = 0;

  /**
   * @brief Current directory and the current calendar year
   *
   */
  static auto                  Defaults() -> ShelfConfig;

  /**
   * @brief Defaults, then the environment, then config_file when given
   *
   */
  static auto Load(const std::optional<store_path_t>& config_file = std::nullopt) -> ShelfConfig;

  void        ApplyEnvironment();

  /**
   * @brief Overlay {"data_dir", "db_file_name", "reference_year"}; absent keys keep their
   *        value
   *
   * @throws ShelfError VALIDATION on wrong types or an out-of-range year
   */
  void        ApplyJSON(const nlohmann::json& j);

  /**
   * @throws ShelfError VALIDATION when the file is unreadable or not valid JSON
   */
  void        ApplyFile(const store_path_t& config_file);

  void        SetReferenceYear(const std::string& text);

  auto        DbPath() const -> store_path_t;

  /**
   * @throws ShelfError PERSISTENCE when the directory cannot be created
   */
  void        EnsureDataDir() const;

  auto        ToJSON() const -> nlohmann::json;
};
};  // namespace photoshelf
