#include "album/album_record.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <stdexcept>

#include "album/album_collection.hpp"

namespace photoshelf {
TEST(AlbumRecordTest, FromJSONKeepsUnknownKeys) {
  auto record = AlbumRecord::FromJSON(nlohmann::json::parse(
      R"({"id":"x","url":"u","title":"T","itemCount":4,"tags":["a","a","b"],)"
      R"("dateRange":"2023-01-01--2023-01-02","coverUrl":"c"})"));
  EXPECT_EQ(record.id_, "x");
  EXPECT_EQ(record.item_count_, 4);
  EXPECT_EQ(record.tags_, (std::vector<album_tag_t>{"a", "b"}));
  EXPECT_EQ(record.RawStart(), "2023-01-01");
  EXPECT_EQ(record.RawEnd(), "2023-01-02");

  auto out = record.ToJSON();
  EXPECT_EQ(out.at("coverUrl"), "c");
  EXPECT_EQ(out.at("dateRange"), "2023-01-01--2023-01-02");
  EXPECT_FALSE(out.contains("startDate"));
}

TEST(AlbumRecordTest, FromJSONRejectsBadFields) {
  using nlohmann::json;
  EXPECT_THROW(AlbumRecord::FromJSON(json::array()), std::invalid_argument);
  EXPECT_THROW(AlbumRecord::FromJSON(json{{"title", "no url"}}), std::invalid_argument);
  EXPECT_THROW(AlbumRecord::FromJSON(json{{"url", ""}}), std::invalid_argument);
  EXPECT_THROW(AlbumRecord::FromJSON(json{{"url", "u"}, {"itemCount", -3}}),
               std::invalid_argument);
  EXPECT_THROW(AlbumRecord::FromJSON(json{{"url", "u"}, {"itemCount", "7"}}),
               std::invalid_argument);
  EXPECT_THROW(AlbumRecord::FromJSON(json{{"url", "u"}, {"tags", {1, 2}}}),
               std::invalid_argument);
  EXPECT_THROW(
      AlbumRecord::FromJSON(json::parse(R"({"url":"u","itemCount":18446744073709551615})")),
      std::invalid_argument);
  EXPECT_THROW(AlbumRecord::FromJSON(json::parse(R"({"url":"u","itemCount":1e300})")),
               std::invalid_argument);
}

TEST(AlbumRecordTest, SetDateSpanReplacesAllDateFields) {
  AlbumRecord record;
  record.url_ = "u";
  record.SetDateSpan(DateSpan{"2023-03-01", "2023-03-03"});
  EXPECT_EQ(record.date_range_, "2023-03-01--2023-03-03");

  record.SetDateSpan(DateSpan{"2023-04-01", std::nullopt});
  EXPECT_EQ(record.date_range_, "2023-04-01");
  EXPECT_EQ(record.start_date_, "2023-04-01");
  EXPECT_FALSE(record.end_date_.has_value());
  EXPECT_FALSE(record.ToJSON().contains("endDate"));
}

TEST(AlbumRecordTest, RawDatesComeFromDateRange) {
  AlbumRecord canonical;
  canonical.url_        = "u";
  canonical.date_range_ = " 2023-01-01 -- 2023-01-02 ";
  EXPECT_EQ(canonical.RawStart(), "2023-01-01");
  EXPECT_EQ(canonical.RawEnd(), "2023-01-02");

  AlbumRecord single;
  single.url_        = "u";
  single.date_range_ = "2023-01-01";
  EXPECT_EQ(single.RawStart(), "2023-01-01");
  EXPECT_FALSE(single.RawEnd().has_value());

  AlbumRecord legacy;
  legacy.url_        = "u";
  legacy.date_range_ = "Mar 1, 2023--Mar 3, 2023";
  EXPECT_EQ(legacy.RawStart(), "Mar 1, 2023");
  EXPECT_EQ(legacy.RawEnd(), "Mar 3, 2023");
  auto span = legacy.CurrentSpan(2024);
  ASSERT_TRUE(span.has_value());
  EXPECT_EQ(span->ToRange(), "2023-03-01--2023-03-03");

  AlbumRecord none;
  none.url_ = "u";
  EXPECT_FALSE(none.RawStart().has_value());
  EXPECT_FALSE(none.RawEnd().has_value());
}

TEST(AlbumRecordTest, CurrentSpanReadsLegacyDisplayDates) {
  AlbumRecord record;
  record.url_        = "u";
  record.start_date_ = "Mar 1, 2023";
  record.end_date_   = "Mar 3, 2023";
  auto span          = record.CurrentSpan(2024);
  ASSERT_TRUE(span.has_value());
  EXPECT_EQ(span->ToRange(), "2023-03-01--2023-03-03");
}

TEST(AlbumCollectionTest, InsertFindErase) {
  AlbumCollection albums;
  AlbumRecord     a;
  a.id_  = "1";
  a.url_ = "a";
  AlbumRecord b;
  b.id_  = "2";
  b.url_ = "b";
  albums.Insert(a);
  albums.Insert(b);
  EXPECT_THROW(albums.Insert(a), std::invalid_argument);
  EXPECT_EQ(albums.Size(), 2u);
  EXPECT_TRUE(albums.HasId("2"));

  auto removed = albums.Erase("a");
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(removed->id_, "1");
  EXPECT_FALSE(albums.HasId("1"));
  EXPECT_FALSE(albums.Erase("a").has_value());

  // Index stays valid after the shift
  ASSERT_NE(albums.Find("b"), nullptr);
  EXPECT_EQ(albums.Find("b")->id_, "2");
  EXPECT_FALSE(albums.IsDirty());
}
}  // namespace photoshelf
