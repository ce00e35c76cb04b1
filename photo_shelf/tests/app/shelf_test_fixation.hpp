#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "app/shelf_service.hpp"
#include "storage/record_store.hpp"
#include "type/type.hpp"
#include "utils/clock/time_provider.hpp"

namespace photoshelf {
class ShelfServiceTests : public ::testing::Test {
 protected:
  static constexpr ref_year_t kReferenceYear = 2024;

  std::filesystem::path       data_dir_;
  std::filesystem::path       db_path_;

  // Run before any unit test runs
  void                        SetUp() override {
    TimeProvider::Refresh();
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    data_dir_        = std::filesystem::temp_directory_path() / "photo_shelf_test" /
                (std::string(info->test_suite_name()) + "_" + info->name());
    if (std::filesystem::exists(data_dir_)) {
      std::filesystem::remove_all(data_dir_);
    }
    std::filesystem::create_directories(data_dir_);
    db_path_ = data_dir_ / "photoAlbums.json";
  }

  // Run after each unit test
  void TearDown() override {
    if (std::filesystem::exists(data_dir_)) {
      std::filesystem::remove_all(data_dir_);
    }
  }

  auto MakeShelf() -> std::shared_ptr<ShelfService> {
    return std::make_shared<ShelfService>(std::make_shared<RecordStore>(db_path_));
  }

  void WriteLines(const std::vector<std::string>& lines) {
    std::ofstream out(db_path_, std::ios::binary | std::ios::trunc);
    for (const auto& line : lines) {
      out << line << '\n';
    }
  }

  auto ReadLines() -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::ifstream            in(db_path_, std::ios::binary);
    std::string              line;
    while (std::getline(in, line)) {
      lines.push_back(line);
    }
    return lines;
  }

  auto ReadRaw() -> std::string {
    std::ifstream in(db_path_, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  }
};
}  // namespace photoshelf
