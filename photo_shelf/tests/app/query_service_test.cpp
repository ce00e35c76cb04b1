#include "app/query_service.hpp"

#include <gtest/gtest.h>

#include <string>
#include <unordered_set>
#include <vector>

#include "shelf_test_fixation.hpp"

namespace photoshelf {
class QueryServiceTests : public ShelfServiceTests {
 protected:
  void SetUp() override {
    ShelfServiceTests::SetUp();
    WriteLines({
        R"({"id":"u1","url":"https://p/undated","title":"Undated Pile"})",
        R"({"id":"o1","url":"https://p/old","title":"Old Trip - Google Photos","itemCount":1500,)"
        R"("dateRange":"2023-01-01","startDate":"2023-01-01","tags":["travel"]})",
        R"({"id":"n1","url":"https://p/new","title":"New Year Party","itemCount":0,)"
        R"("dateRange":"2024-03-01--2024-03-02","startDate":"2024-03-01","endDate":"2024-03-02"})",
        R"({"id":"l1","url":"https://p/long","title":"Long-Project","dateRange":"2020-01-01--2025-01-01",)"
        R"("tags":["work","travel"]})",
    });
  }

  auto MakeService() -> QueryService { return QueryService(MakeShelf(), kReferenceYear); }

  static auto Ids(const std::vector<MatchedAlbum>& results) -> std::vector<album_id_t> {
    std::vector<album_id_t> ids;
    for (const auto& match : results) {
      ids.push_back(match.id_);
    }
    return ids;
  }
};

TEST_F(QueryServiceTests, EmptyQueryOrdersNewestFirstUndatedLast) {
  auto service = MakeService();
  auto results = service.Search("");
  EXPECT_EQ(Ids(results), (std::vector<album_id_t>{"n1", "o1", "l1", "u1"}));
  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(results[0].position_, 1u);
  EXPECT_EQ(results[3].total_, 4u);
}

TEST_F(QueryServiceTests, TextTermsMatchNormalizedTitle) {
  auto service = MakeService();
  EXPECT_EQ(Ids(service.Search("long project")), (std::vector<album_id_t>{"l1"}));
  EXPECT_EQ(Ids(service.Search("TRIP")), (std::vector<album_id_t>{"o1"}));
  EXPECT_TRUE(service.Search("trip party").empty());
}

TEST_F(QueryServiceTests, YearFilterUsesOverlap) {
  auto service = MakeService();
  EXPECT_EQ(Ids(service.Search("y:2023")), (std::vector<album_id_t>{"o1", "l1"}));
  EXPECT_TRUE(service.Search("y:2026").empty());
  EXPECT_EQ(Ids(service.Search("y:2024-2030 party")), (std::vector<album_id_t>{"n1"}));
}

TEST_F(QueryServiceTests, FiltersOnTagAndIds) {
  auto         service = MakeService();
  QueryFilters tag_filter;
  tag_filter.tag_ = "travel";
  EXPECT_EQ(Ids(service.Search("", tag_filter)), (std::vector<album_id_t>{"o1", "l1"}));

  QueryFilters id_filter;
  id_filter.ids_ = std::unordered_set<album_id_t>{"u1", "n1"};
  EXPECT_EQ(Ids(service.Search("", id_filter)), (std::vector<album_id_t>{"n1", "u1"}));
}

TEST_F(QueryServiceTests, ResultPresentation) {
  auto service = MakeService();
  auto results = service.Search("");

  const auto& newest = results[0];
  EXPECT_EQ(newest.display_title_, "New Year Party");
  EXPECT_EQ(newest.date_display_, "Mar 01 – Mar 02, 2024");
  EXPECT_EQ(newest.date_edit_, "2024-03-01--2024-03-02");
  EXPECT_EQ(newest.subtitle_, "1/4 • 📅 Mar 01 – Mar 02, 2024");

  const auto& old = results[1];
  EXPECT_EQ(old.clean_title_, "Old Trip");
  EXPECT_EQ(old.display_title_, "Old Trip (1,500)");
  EXPECT_EQ(old.subtitle_, "2/4 • 📅 Jan 01, 2023 • 🏷️ travel");

  const auto& undated = results[3];
  EXPECT_TRUE(undated.date_display_.empty());
  EXPECT_TRUE(undated.date_edit_.empty());
  EXPECT_EQ(undated.subtitle_, "4/4 • https://p/undated");

  auto j = undated.ToJSON();
  EXPECT_TRUE(j.at("itemCount").is_null());
  EXPECT_EQ(j.at("url"), "https://p/undated");
}

TEST_F(QueryServiceTests, SearchDoesNotWrite) {
  const std::string before  = ReadRaw();
  auto              service = MakeService();
  service.Search("y:2023 trip");
  EXPECT_EQ(ReadRaw(), before);
}
}  // namespace photoshelf
