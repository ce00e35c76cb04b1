#include "app/edit_service.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <string>

#include "album/shelf_error.hpp"
#include "shelf_test_fixation.hpp"

namespace photoshelf {
class EditServiceTests : public ShelfServiceTests {
 protected:
  void SetUp() override {
    ShelfServiceTests::SetUp();
    WriteLines({
        R"({"id":"1","url":"a","title":"Alpha","itemCount":3,"dateRange":"2020-01-01--2020-01-03",)"
        R"("startDate":"2020-01-01","endDate":"2020-01-03"})",
        R"({"id":"2","url":"b","title":"Beta"})",
    });
  }

  auto MakeService() -> EditService { return EditService(MakeShelf(), kReferenceYear); }

  static auto CodeOf(const std::function<void()>& call) -> ShelfErrorCode {
    try {
      call();
    } catch (const ShelfError& e) {
      return e.Code();
    }
    ADD_FAILURE() << "expected a ShelfError";
    return ShelfErrorCode::FORMAT;
  }
};

TEST_F(EditServiceTests, EditTitleTrimsAndReportsOld) {
  auto service = MakeService();
  auto edit    = service.EditTitle("a", "  Alpha Reloaded ");
  EXPECT_EQ(edit.old_title_, "Alpha");
  EXPECT_EQ(edit.new_title_, "Alpha Reloaded");
  EXPECT_EQ(RecordStore(db_path_).Load().Find("a")->title_, "Alpha Reloaded");

  EXPECT_EQ(CodeOf([&] { service.EditTitle("a", "   "); }), ShelfErrorCode::VALIDATION);
  EXPECT_EQ(CodeOf([&] { service.EditTitle("", "x"); }), ShelfErrorCode::VALIDATION);
  EXPECT_EQ(CodeOf([&] { service.EditTitle("zzz", "x"); }), ShelfErrorCode::NOT_FOUND);
}

TEST_F(EditServiceTests, EditItemCountOverwritesUnconditionally) {
  auto service = MakeService();
  auto edit    = service.EditItemCount("a", "+12");
  EXPECT_EQ(edit.old_count_, 3);
  EXPECT_EQ(edit.new_count_, 12);

  auto zero = service.EditItemCount("b", item_count_t{0});
  EXPECT_FALSE(zero.old_count_.has_value());
  EXPECT_EQ(RecordStore(db_path_).Load().Find("b")->item_count_, 0);

  EXPECT_EQ(CodeOf([&] { service.EditItemCount("a", "-1"); }), ShelfErrorCode::VALIDATION);
  EXPECT_EQ(CodeOf([&] { service.EditItemCount("a", "3.5"); }), ShelfErrorCode::VALIDATION);
  EXPECT_EQ(CodeOf([&] { service.EditItemCount("a", "lots"); }), ShelfErrorCode::VALIDATION);
  EXPECT_EQ(CodeOf([&] { service.EditItemCount("zzz", "1"); }), ShelfErrorCode::NOT_FOUND);
}

TEST_F(EditServiceTests, ParseItemCountAcceptsWhitespace) {
  EXPECT_EQ(ParseItemCount(" 42 "), 42);
  EXPECT_EQ(ParseItemCount("0"), 0);
  EXPECT_THROW(ParseItemCount(""), ShelfError);
  EXPECT_THROW(ParseItemCount("+"), ShelfError);
}

TEST_F(EditServiceTests, EditDateRangeAndSingle) {
  auto service = MakeService();
  auto range   = service.EditDate("b", "2023-03-01--Mar 3, 2023");
  EXPECT_EQ(range.canonical_range_, "2023-03-01--2023-03-03");
  EXPECT_EQ(range.display_, "Mar 01 – Mar 03, 2023");

  auto single = service.EditDate("a", "2021-07-04");
  EXPECT_EQ(single.canonical_range_, "2021-07-04");
  EXPECT_EQ(single.display_, "Jul 04, 2021");

  auto        albums = RecordStore(db_path_).Load();
  const auto* a      = albums.Find("a");
  EXPECT_EQ(a->date_range_, "2021-07-04");
  EXPECT_EQ(a->start_date_, "2021-07-04");
  EXPECT_FALSE(a->end_date_.has_value());
  EXPECT_EQ(albums.Find("b")->end_date_, "2023-03-03");

  auto j = range.ToJSON();
  EXPECT_EQ(j.at("dateRange"), "2023-03-01--2023-03-03");
}

TEST_F(EditServiceTests, EditDateRejectsBadInputWithoutWriting) {
  const std::string before  = ReadRaw();
  auto              service = MakeService();
  EXPECT_EQ(CodeOf([&] { service.EditDate("a", "soon"); }), ShelfErrorCode::VALIDATION);
  EXPECT_EQ(CodeOf([&] { service.EditDate("a", "2023-03-05--2023-03-01"); }),
            ShelfErrorCode::VALIDATION);
  EXPECT_EQ(CodeOf([&] { service.EditDate("zzz", "2023-03-05"); }), ShelfErrorCode::NOT_FOUND);
  EXPECT_EQ(ReadRaw(), before);
}

TEST_F(EditServiceTests, DeleteRemovesExactlyOne) {
  auto service = MakeService();
  auto removed = service.DeleteAlbum("a");
  EXPECT_EQ(removed.id_, "1");
  EXPECT_EQ(removed.title_, "Alpha");

  auto albums = RecordStore(db_path_).Load();
  EXPECT_EQ(albums.Size(), 1u);
  EXPECT_NE(albums.Find("b"), nullptr);

  EXPECT_EQ(CodeOf([&] { service.DeleteAlbum("a"); }), ShelfErrorCode::NOT_FOUND);
  EXPECT_EQ(RecordStore(db_path_).Load().Size(), 1u);
}
}  // namespace photoshelf
