#include "app/stats_service.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "shelf_test_fixation.hpp"

namespace photoshelf {
class StatsServiceTests : public ShelfServiceTests {};

TEST_F(StatsServiceTests, BucketsByCompleteness) {
  WriteLines({
      R"({"id":"full","url":"a","itemCount":4,"dateRange":"2023-01-01","tags":["x"]})",
      R"({"id":"nocount","url":"b","itemCount":0,"startDate":"2023-01-01"})",
      R"({"id":"nodate","url":"c","itemCount":2,"tags":["y"]})",
      R"({"id":"bare","url":"d"})",
  });
  StatsService service(MakeShelf());
  auto         stats = service.Compute();

  using Ids          = std::vector<album_id_t>;
  EXPECT_EQ(stats.all_ids_, (Ids{"full", "nocount", "nodate", "bare"}));
  EXPECT_EQ(stats.complete_ids_, (Ids{"full"}));
  EXPECT_EQ(stats.incomplete_ids_, (Ids{"nocount", "nodate", "bare"}));
  EXPECT_EQ(stats.missing_count_ids_, (Ids{"nocount", "bare"}));
  EXPECT_EQ(stats.missing_date_ids_, (Ids{"nodate", "bare"}));
  EXPECT_EQ(stats.missing_both_ids_, (Ids{"bare"}));
  EXPECT_EQ(stats.with_tags_ids_, (Ids{"full", "nodate"}));
  EXPECT_EQ(stats.without_tags_ids_, (Ids{"nocount", "bare"}));

  auto j = stats.ToJSON();
  EXPECT_EQ(j.at("missing_item_count").at("count"), 2);
  EXPECT_EQ(j.at("complete").at("ids")[0], "full");
}

TEST_F(StatsServiceTests, IdsOfLinesWithoutIdAreStable) {
  WriteLines({R"({"url":"legacy","itemCount":1})"});
  const std::string before = ReadRaw();

  auto              first  = StatsService(MakeShelf()).Compute();
  auto              second = StatsService(MakeShelf()).Compute();
  ASSERT_EQ(first.all_ids_.size(), 1u);
  EXPECT_EQ(first.all_ids_, second.all_ids_);
  EXPECT_EQ(ReadRaw(), before);
}

TEST_F(StatsServiceTests, EmptyStore) {
  StatsService service(MakeShelf());
  auto         stats = service.Compute();
  EXPECT_TRUE(stats.all_ids_.empty());
  EXPECT_EQ(stats.ToJSON().at("all").at("count"), 0);
}
}  // namespace photoshelf
