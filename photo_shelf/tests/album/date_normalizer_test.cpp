#include "album/date_normalizer.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace photoshelf {
namespace {
constexpr ref_year_t kYear = 2024;
}

TEST(DateNormalizerTest, NormalizeCanonicalPassesThrough) {
  EXPECT_EQ(DateNormalizer::Normalize("2023-03-01", kYear), "2023-03-01");
  EXPECT_EQ(DateNormalizer::Normalize("  2020-02-29 ", kYear), "2020-02-29");
}

TEST(DateNormalizerTest, NormalizeDisplayForms) {
  EXPECT_EQ(DateNormalizer::Normalize("Mar 1, 2023", kYear), "2023-03-01");
  EXPECT_EQ(DateNormalizer::Normalize("Nov 27, 2024", kYear), "2024-11-27");
  EXPECT_EQ(DateNormalizer::Normalize("Sep. 9, 2019", kYear), "2019-09-09");
  EXPECT_EQ(DateNormalizer::Normalize("december 31, 1999", kYear), "1999-12-31");
}

TEST(DateNormalizerTest, NormalizeYearlessUsesReferenceYear) {
  EXPECT_EQ(DateNormalizer::Normalize("Nov 27", kYear), "2024-11-27");
  EXPECT_EQ(DateNormalizer::Normalize("Nov 27", 2019), "2019-11-27");
  // Feb 29 only exists in leap reference years
  EXPECT_EQ(DateNormalizer::Normalize("Feb 29", 2024), "2024-02-29");
  EXPECT_EQ(DateNormalizer::Normalize("Feb 29", 2023), std::nullopt);
}

TEST(DateNormalizerTest, NormalizeRejectsGarbage) {
  EXPECT_EQ(DateNormalizer::Normalize("", kYear), std::nullopt);
  EXPECT_EQ(DateNormalizer::Normalize("yesterday", kYear), std::nullopt);
  EXPECT_EQ(DateNormalizer::Normalize("Foo 12, 2020", kYear), std::nullopt);
  EXPECT_EQ(DateNormalizer::Normalize("2023-02-30", kYear), std::nullopt);
  EXPECT_EQ(DateNormalizer::Normalize("2023-13-01", kYear), std::nullopt);
  EXPECT_EQ(DateNormalizer::Normalize("2023-3-1", kYear), std::nullopt);
  EXPECT_EQ(DateNormalizer::Normalize("Apr 31, 2023", kYear), std::nullopt);
}

TEST(DateNormalizerTest, ValidateChecksCalendar) {
  EXPECT_TRUE(DateNormalizer::Validate("2000-02-29"));
  EXPECT_FALSE(DateNormalizer::Validate("1900-02-29"));
  EXPECT_FALSE(DateNormalizer::Validate("0000-01-01"));
  EXPECT_FALSE(DateNormalizer::Validate("2023-00-10"));
  EXPECT_FALSE(DateNormalizer::Validate("Mar 1, 2023"));
}

TEST(DateNormalizerTest, BuildAndSplitRange) {
  EXPECT_EQ(DateNormalizer::BuildRange("2023-03-01", std::nullopt), "2023-03-01");
  EXPECT_EQ(DateNormalizer::BuildRange("2023-03-01", "2023-03-03"), "2023-03-01--2023-03-03");

  auto span = DateNormalizer::SplitRange("2023-03-01--2023-03-03");
  ASSERT_TRUE(span.has_value());
  EXPECT_EQ(span->start_, "2023-03-01");
  EXPECT_EQ(span->end_, "2023-03-03");

  auto single = DateNormalizer::SplitRange("2023-03-01");
  ASSERT_TRUE(single.has_value());
  EXPECT_FALSE(single->end_.has_value());

  EXPECT_FALSE(DateNormalizer::SplitRange("Mar 1, 2023--Mar 3, 2023").has_value());
}

TEST(DateNormalizerTest, DisplayForms) {
  EXPECT_EQ(DateNormalizer::DisplayDate("2023-03-01"), "Mar 01, 2023");
  EXPECT_EQ(DateNormalizer::DisplayRange("2023-03-01", "2023-03-03"), "Mar 01 – Mar 03, 2023");
  EXPECT_EQ(DateNormalizer::DisplayRange("2022-12-30", "2023-01-02"),
            "Dec 30, 2022 – Jan 02, 2023");
  EXPECT_EQ(DateNormalizer::DisplaySpan(DateSpan{"2021-07-04", std::nullopt}), "Jul 04, 2021");
}

TEST(DateNormalizerTest, DisplayDateRoundTrip) {
  for (const auto* canonical : {"2023-03-01", "1999-12-31", "2024-02-29", "2010-10-10"}) {
    auto parsed = DateNormalizer::ParseDateInput(DateNormalizer::DisplayDate(canonical), kYear);
    ASSERT_TRUE(parsed.has_value()) << canonical;
    EXPECT_EQ(parsed->start_, canonical);
    EXPECT_FALSE(parsed->end_.has_value());
  }
}

TEST(DateNormalizerTest, ParseTripleOrdersAndSentinel) {
  const auto a = DateNormalizer::ParseTriple("2024-03-01", kYear);
  const auto b = DateNormalizer::ParseTriple("Jan 1, 2023", kYear);
  EXPECT_GT(a, b);
  EXPECT_EQ(b, (DateTriple{2023, 1, 1}));

  const auto none = DateNormalizer::ParseTriple("not a date", kYear);
  EXPECT_TRUE(none.IsSentinel());
  EXPECT_LT(none, b);
}

TEST(DateNormalizerTest, NormalizeSpanRejectsBadPairs) {
  auto ok = DateNormalizer::NormalizeSpan("Mar 1, 2023", "Mar 3, 2023", kYear);
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->ToRange(), "2023-03-01--2023-03-03");

  auto no_end = DateNormalizer::NormalizeSpan("Mar 1, 2023", std::string(""), kYear);
  ASSERT_TRUE(no_end.has_value());
  EXPECT_EQ(no_end->ToRange(), "2023-03-01");

  EXPECT_FALSE(DateNormalizer::NormalizeSpan(std::nullopt, "2023-03-03", kYear).has_value());
  EXPECT_FALSE(DateNormalizer::NormalizeSpan("garbage", std::nullopt, kYear).has_value());
  EXPECT_FALSE(DateNormalizer::NormalizeSpan("2023-03-01", "garbage", kYear).has_value());
  EXPECT_FALSE(DateNormalizer::NormalizeSpan("2023-03-03", "2023-03-01", kYear).has_value());
}

TEST(DateNormalizerTest, ParseDateInputForms) {
  auto single = DateNormalizer::ParseDateInput(" 2023-05-06 ", kYear);
  ASSERT_TRUE(single.has_value());
  EXPECT_EQ(single->ToRange(), "2023-05-06");

  auto range = DateNormalizer::ParseDateInput("2023-05-06 -- May 9, 2023", kYear);
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(range->ToRange(), "2023-05-06--2023-05-09");

  auto yearless = DateNormalizer::ParseDateInput("May 6--May 9", kYear);
  ASSERT_TRUE(yearless.has_value());
  EXPECT_EQ(yearless->ToRange(), "2024-05-06--2024-05-09");

  EXPECT_FALSE(DateNormalizer::ParseDateInput("", kYear).has_value());
  EXPECT_FALSE(DateNormalizer::ParseDateInput("2023-05-06--", kYear).has_value());
  EXPECT_FALSE(DateNormalizer::ParseDateInput("--2023-05-06", kYear).has_value());
  EXPECT_FALSE(
      DateNormalizer::ParseDateInput("2023-05-06--2023-05-07--2023-05-08", kYear).has_value());
  EXPECT_FALSE(DateNormalizer::ParseDateInput("2023-05-09--2023-05-06", kYear).has_value());
}
}  // namespace photoshelf
