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

#include <CLI/CLI.hpp>
#include <clocale>
#include <exception>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>

#include "album/shelf_error.hpp"
#include "app/shelf_library.hpp"
#include "config/shelf_config.hpp"
#include "utils/string/convert.hpp"

using namespace photoshelf;

namespace {
constexpr int kExitUsage = 1;

auto          ExitCodeFor(ShelfErrorCode code) -> int {
  switch (code) {
    case ShelfErrorCode::VALIDATION:
      return 2;
    case ShelfErrorCode::NOT_FOUND:
      return 3;
    case ShelfErrorCode::PERSISTENCE:
      return 4;
    case ShelfErrorCode::FORMAT:
      return 5;
  }
  return kExitUsage;
}

void Emit(const nlohmann::json& document) {
  std::cout << document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
            << std::endl;
}

auto ParseIdList(const std::string& text) -> std::optional<std::unordered_set<album_id_t>> {
  std::unordered_set<album_id_t> ids;
  std::istringstream             stream(text);
  std::string                    id;
  while (std::getline(stream, id, ',')) {
    id = conv::Trim(id);
    if (!id.empty()) {
      ids.insert(id);
    }
  }
  if (ids.empty()) {
    return std::nullopt;
  }
  return ids;
}

auto OptionalText(const std::string& text) -> std::optional<std::string> {
  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}
}  // namespace

int main(int argc, char* argv[]) {
  std::setlocale(LC_CTYPE, "");

  CLI::App    app{"photo_shelf: local photo album library"};
  app.require_subcommand(1);

  std::string config_path;
  std::string data_dir;
  std::string reference_year;
  app.add_option("--config", config_path, "JSON config file");
  app.add_option("--data-dir", data_dir, "Directory holding the album file");
  app.add_option("--reference-year", reference_year, "Year for dates written without one");

  std::string url;
  std::string text;
  std::string extra;
  std::string tag_filter;
  std::string id_filter;

  auto*       ingest_cmd = app.add_subcommand("ingest", "Merge scraped album data");
  ingest_cmd->add_option("payload", text, "Scraper JSON payload")->required();

  auto* search_cmd = app.add_subcommand("search", "Search albums");
  search_cmd->add_option("query", text, "Free text plus optional y:YYYY or y:YYYY-YYYY");
  search_cmd->add_option("--tag", tag_filter, "Only albums carrying this tag");
  search_cmd->add_option("--ids", id_filter, "Only albums with these comma separated ids");

  auto* tags_cmd = app.add_subcommand("tags", "List tags with album counts");
  tags_cmd->add_option("filter", text, "Case-insensitive substring");

  auto* menu_cmd = app.add_subcommand("tag-menu", "Tag actions for one album");
  menu_cmd->add_option("url", url, "Album url")->required();
  menu_cmd->add_option("filter", text, "Filter or new tag name");

  auto* toggle_cmd = app.add_subcommand("toggle-tag", "Add or remove a tag");
  toggle_cmd->add_option("url", url, "Album url")->required();
  toggle_cmd->add_option("tag", text, "Tag")->required();
  toggle_cmd->add_option("action", extra, "add or remove")
      ->required()
      ->check(CLI::IsMember({"add", "remove"}));

  auto* title_cmd = app.add_subcommand("edit-title", "Rename an album");
  title_cmd->add_option("url", url, "Album url")->required();
  title_cmd->add_option("title", text, "New title")->required();

  auto* count_cmd = app.add_subcommand("edit-count", "Set the item count of an album");
  count_cmd->add_option("url", url, "Album url")->required();
  count_cmd->add_option("count", text, "Whole number, 0 or greater")->required();

  auto* date_cmd = app.add_subcommand("edit-date", "Set the date of an album");
  date_cmd->add_option("url", url, "Album url")->required();
  date_cmd->add_option("date", text, "yyyy-mm-dd or yyyy-mm-dd--yyyy-mm-dd")->required();

  auto* delete_cmd = app.add_subcommand("delete", "Delete an album");
  delete_cmd->add_option("url", url, "Album url")->required();

  auto* stats_cmd = app.add_subcommand("stats", "Completeness statistics");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e) == 0 ? 0 : kExitUsage;
  }

  try {
    ShelfConfig config =
        ShelfConfig::Load(config_path.empty() ? std::nullopt
                                              : std::optional<store_path_t>(
                                                    store_path_t(conv::FromBytes(config_path))));
    if (!data_dir.empty()) {
      config.data_dir_ = store_path_t(conv::FromBytes(data_dir));
    }
    if (!reference_year.empty()) {
      config.SetReferenceYear(reference_year);
    }

    ShelfLibrary library(config);

    if (ingest_cmd->parsed()) {
      Emit(library.IngestJSON(text).ToJSON());
    } else if (search_cmd->parsed()) {
      QueryFilters filters;
      filters.ids_           = ParseIdList(id_filter);
      filters.tag_           = OptionalText(conv::Trim(tag_filter));
      nlohmann::json results = nlohmann::json::array();
      for (const auto& match : library.Search(text, filters)) {
        results.push_back(match.ToJSON());
      }
      Emit({{"query", text}, {"results", results}});
    } else if (tags_cmd->parsed()) {
      nlohmann::json tags = nlohmann::json::array();
      for (const auto& count : library.ListTags(OptionalText(text))) {
        tags.push_back({{"tag", count.tag_}, {"count", count.count_}});
      }
      Emit({{"tags", tags}});
    } else if (menu_cmd->parsed()) {
      Emit(library.BuildTagMenu(url, OptionalText(text)).ToJSON());
    } else if (toggle_cmd->parsed()) {
      const auto outcome = library.ToggleTag(url, text, ParseTagAction(extra));
      Emit({{"url", url},
            {"tag", text},
            {"action", extra},
            {"outcome", TagToggleOutcomeName(outcome)}});
      if (outcome == TagToggleOutcome::ALBUM_NOT_FOUND) {
        return ExitCodeFor(ShelfErrorCode::NOT_FOUND);
      }
    } else if (title_cmd->parsed()) {
      Emit(library.EditTitle(url, text).ToJSON());
    } else if (count_cmd->parsed()) {
      Emit(library.EditItemCount(url, text).ToJSON());
    } else if (date_cmd->parsed()) {
      Emit(library.EditDate(url, text).ToJSON());
    } else if (delete_cmd->parsed()) {
      Emit({{"deleted", library.DeleteAlbum(url).ToJSON()}});
    } else if (stats_cmd->parsed()) {
      Emit(library.Stats().ToJSON());
    }
  } catch (const ShelfError& e) {
    Emit({{"error", ErrorCodeName(e.Code())}, {"message", e.what()}});
    return ExitCodeFor(e.Code());
  } catch (const std::exception& e) {
    std::cerr << "[photo_shelf_cli] Unexpected failure: " << e.what() << std::endl;
    Emit({{"error", "internal"}, {"message", e.what()}});
    return kExitUsage;
  }
  return 0;
}
