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

#include "config/shelf_config.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>

#include "album/shelf_error.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/string/convert.hpp"

namespace photoshelf {
namespace {
constexpr ref_year_t kMinYear = 1;
constexpr ref_year_t kMaxYear = 9999;

auto                 ReadEnv(const char* name) -> std::optional<std::string> {
  const char* value = std::getenv(name);
  if (value == nullptr || conv::Trim(value).empty()) {
    return std::nullopt;
  }
  return conv::Trim(value);
}

void CheckYear(int64_t year) {
  if (year < kMinYear || year > kMaxYear) {
    throw ShelfError(ShelfErrorCode::VALIDATION,
                     std::format("Reference year {} is out of range", year));
  }
}
}  // namespace

auto ShelfConfig::Defaults() -> ShelfConfig {
  TimeProvider::Refresh();
  ShelfConfig config;
  std::error_code ec;
  config.data_dir_ = std::filesystem::current_path(ec);
  if (ec) {
    config.data_dir_ = ".";
  }
  config.reference_year_ = TimeProvider::CurrentYear();
  return config;
}

auto ShelfConfig::Load(const std::optional<store_path_t>& config_file) -> ShelfConfig {
  ShelfConfig config = Defaults();
  config.ApplyEnvironment();
  if (config_file.has_value()) {
    config.ApplyFile(config_file.value());
  }
  return config;
}

void ShelfConfig::ApplyEnvironment() {
  if (auto dir = ReadEnv(kEnvDataDir)) {
    data_dir_ = store_path_t(conv::FromBytes(dir.value()));
  } else if (auto legacy = ReadEnv(kEnvLegacyDataDir)) {
    data_dir_ = store_path_t(conv::FromBytes(legacy.value()));
  }
  if (auto year = ReadEnv(kEnvReferenceYear)) {
    SetReferenceYear(year.value());
  }
}

void ShelfConfig::SetReferenceYear(const std::string& text) {
  const std::string trimmed = conv::Trim(text);
  int64_t           year    = 0;
  auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), year);
  if (trimmed.empty() || ec != std::errc() || ptr != trimmed.data() + trimmed.size()) {
    throw ShelfError(ShelfErrorCode::VALIDATION,
                     std::format("Reference year '{}' is not a number", text));
  }
  CheckYear(year);
  reference_year_ = static_cast<ref_year_t>(year);
}

void ShelfConfig::ApplyJSON(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ShelfError(ShelfErrorCode::VALIDATION, "Config must be a JSON object");
  }
  if (j.contains("data_dir")) {
    if (!j.at("data_dir").is_string()) {
      throw ShelfError(ShelfErrorCode::VALIDATION, "Config 'data_dir' must be a string");
    }
    data_dir_ = store_path_t(conv::FromBytes(j.at("data_dir").get<std::string>()));
  }
  if (j.contains("db_file_name")) {
    if (!j.at("db_file_name").is_string() || j.at("db_file_name").get<std::string>().empty()) {
      throw ShelfError(ShelfErrorCode::VALIDATION,
                       "Config 'db_file_name' must be a non-empty string");
    }
    db_file_name_ = j.at("db_file_name").get<std::string>();
  }
  if (j.contains("reference_year")) {
    if (!j.at("reference_year").is_number_integer()) {
      throw ShelfError(ShelfErrorCode::VALIDATION, "Config 'reference_year' must be an integer");
    }
    const auto year = j.at("reference_year").get<int64_t>();
    CheckYear(year);
    reference_year_ = static_cast<ref_year_t>(year);
  }
}

void ShelfConfig::ApplyFile(const store_path_t& config_file) {
  std::ifstream file(config_file);
  if (!file.is_open()) {
    throw ShelfError(ShelfErrorCode::VALIDATION,
                     std::format("Cannot open config file {}",
                                 conv::ToBytes(config_file.wstring())));
  }
  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ShelfError(ShelfErrorCode::VALIDATION,
                     std::format("Malformed config file {}: {}",
                                 conv::ToBytes(config_file.wstring()), e.what()));
  }
  ApplyJSON(j);
}

auto ShelfConfig::DbPath() const -> store_path_t {
  return data_dir_ / conv::FromBytes(db_file_name_);
}

void ShelfConfig::EnsureDataDir() const {
  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if (ec) {
    throw ShelfError(ShelfErrorCode::PERSISTENCE,
                     std::format("Cannot create data directory {}: {}",
                                 conv::ToBytes(data_dir_.wstring()), ec.message()));
  }
}

auto ShelfConfig::ToJSON() const -> nlohmann::json {
  return {{"data_dir", conv::ToBytes(data_dir_.wstring())},
          {"db_file_name", db_file_name_},
          {"reference_year", reference_year_}};
}
};  // namespace photoshelf
