#include "album/ingest_request.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>
#include <variant>

#include "album/shelf_error.hpp"

namespace photoshelf {
namespace {
void ExpectFormatError(const std::string& payload) {
  try {
    ParseIngestRequest(payload);
    FAIL() << "expected a format error for " << payload;
  } catch (const ShelfError& e) {
    EXPECT_EQ(e.Code(), ShelfErrorCode::FORMAT) << payload;
  }
}
}  // namespace

TEST(IngestRequestTest, ParsesSingle) {
  auto request = ParseIngestRequest(std::string(
      R"({"type":"single","url":" https://a ","title":"Trip","itemCount":"12",)"
      R"("startDate":"Mar 1, 2023","endDate":"Mar 3, 2023"})"));
  ASSERT_TRUE(std::holds_alternative<SingleCandidate>(request));
  const auto& single = std::get<SingleCandidate>(request);
  EXPECT_EQ(single.url_, "https://a");
  EXPECT_EQ(single.title_, "Trip");
  EXPECT_EQ(single.item_count_, 12);
  EXPECT_EQ(single.start_date_, "Mar 1, 2023");
  EXPECT_EQ(single.end_date_, "Mar 3, 2023");
}

TEST(IngestRequestTest, ParsesBulk) {
  auto request = ParseIngestRequest(std::string(
      R"({"type":"bulk","albums":[{"url":"a","title":"A","itemCount":3},{"url":"b"}]})"));
  ASSERT_TRUE(std::holds_alternative<BatchCandidates>(request));
  const auto& batch = std::get<BatchCandidates>(request);
  ASSERT_EQ(batch.albums_.size(), 2u);
  EXPECT_EQ(batch.albums_[0].url_, "a");
  EXPECT_EQ(batch.albums_[0].item_count_, 3);
  EXPECT_FALSE(batch.albums_[1].title_.has_value());
  EXPECT_FALSE(batch.albums_[1].item_count_.has_value());

  auto empty = ParseIngestRequest(std::string(R"({"type":"bulk"})"));
  EXPECT_TRUE(std::get<BatchCandidates>(empty).albums_.empty());
}

TEST(IngestRequestTest, RejectsUnknownShapes) {
  ExpectFormatError("not json");
  ExpectFormatError("[1,2,3]");
  ExpectFormatError(R"({"albums":[]})");
  ExpectFormatError(R"({"type":"other"})");
  ExpectFormatError(R"({"error":"login required"})");
  ExpectFormatError(R"({"type":"bulk","albums":{"url":"a"}})");
  ExpectFormatError(R"({"type":"bulk","albums":["a"]})");
}

TEST(IngestRequestTest, ReadCandidateCountIsLenient) {
  using nlohmann::json;
  EXPECT_EQ(ReadCandidateCount(json(5)), 5);
  EXPECT_EQ(ReadCandidateCount(json(0)), 0);
  EXPECT_EQ(ReadCandidateCount(json(7.0)), 7);
  EXPECT_EQ(ReadCandidateCount(json(" 42 ")), 42);
  EXPECT_FALSE(ReadCandidateCount(json(-1)).has_value());
  EXPECT_FALSE(ReadCandidateCount(json(2.5)).has_value());
  EXPECT_FALSE(ReadCandidateCount(json("12 photos")).has_value());
  EXPECT_FALSE(ReadCandidateCount(json(nullptr)).has_value());
  EXPECT_FALSE(ReadCandidateCount(json::array()).has_value());
  EXPECT_EQ(ReadCandidateCount(json(9223372036854775807ULL)), 9223372036854775807LL);
  EXPECT_FALSE(ReadCandidateCount(json(18446744073709551615ULL)).has_value());
  EXPECT_FALSE(ReadCandidateCount(json(9223372036854775808.0)).has_value());
  EXPECT_FALSE(ReadCandidateCount(json(1e300)).has_value());
}
}  // namespace photoshelf
