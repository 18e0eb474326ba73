#include "docsort/dedup/file_mover.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace docsort::dedup;
using docsort::testing::create_temp_dir;
using docsort::testing::read_file;
using docsort::testing::write_file;

TEST(FileMoverTest, UniqueDestinationAddsCounter) {
    auto dir = create_temp_dir("docsort_mover_test");
    EXPECT_EQ(unique_destination(dir, "a.pdf"), dir / "a.pdf");

    write_file(dir / "a.pdf", "1");
    EXPECT_EQ(unique_destination(dir, "a.pdf"), dir / "a_1.pdf");

    write_file(dir / "a_1.pdf", "2");
    EXPECT_EQ(unique_destination(dir, "a.pdf"), dir / "a_2.pdf");

    fs::remove_all(dir);
}

TEST(FileMoverTest, MoveCreatesParentAndNeverOverwrites) {
    auto dir = create_temp_dir("docsort_mover_test");
    write_file(dir / "src.txt", "payload");
    write_file(dir / "other.txt", "other");

    auto moved = move_file(dir / "src.txt", dir / "nested" / "deeper" / "dst.txt");
    ASSERT_TRUE(moved.is_ok());
    EXPECT_FALSE(fs::exists(dir / "src.txt"));
    EXPECT_EQ(read_file(dir / "nested" / "deeper" / "dst.txt"), "payload");

    auto clash = move_file(dir / "other.txt", dir / "nested" / "deeper" / "dst.txt");
    ASSERT_TRUE(clash.is_error());
    EXPECT_EQ(clash.error().code, docsort::ErrorCode::Conflict);
    EXPECT_EQ(read_file(dir / "other.txt"), "other");

    auto missing = move_file(dir / "gone.txt", dir / "x.txt");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, docsort::ErrorCode::NotFound);

    fs::remove_all(dir);
}

TEST(FileMoverTest, MoveIntoReturnsFinalPath) {
    auto dir = create_temp_dir("docsort_mover_test");
    write_file(dir / "in" / "a.pdf", "new");
    write_file(dir / "out" / "a.pdf", "old");

    auto moved = move_into(dir / "in" / "a.pdf", dir / "out");
    ASSERT_TRUE(moved.is_ok());
    EXPECT_EQ(moved.value(), dir / "out" / "a_1.pdf");
    EXPECT_EQ(read_file(dir / "out" / "a.pdf"), "old");

    fs::remove_all(dir);
}

TEST(FileMoverTest, QuarantineLayout) {
    EXPECT_EQ(quarantine_dir("/sorted", "12345_Acme"), fs::path("/sorted/12345_Acme/_duplicates"));
    EXPECT_TRUE(is_inside_quarantine("/sorted/12345_Acme/_duplicates/a.pdf"));
    EXPECT_FALSE(is_inside_quarantine("/sorted/12345_Acme/Allgemein/a.pdf"));
    EXPECT_FALSE(is_inside_quarantine("/sorted/12345_Acme/_duplicates"));
}
