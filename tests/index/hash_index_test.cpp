#include "docsort/index/hash_index.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using docsort::index::ContentRecord;
using docsort::index::HashIndex;

TEST(HashIndexTest, PutIsVisibleImmediately) {
    auto dir = docsort::testing::create_temp_dir("docsort_index_test");
    auto opened = HashIndex::open(dir);
    ASSERT_TRUE(opened.is_ok());
    auto index = opened.value();

    EXPECT_FALSE(index->get("abc").has_value());
    ASSERT_TRUE(index->put(ContentRecord{"abc", "/sorted/12345_Acme/Allgemein/a.pdf", 10, 100.5, "12345_Acme"}).is_ok());

    auto record = index->get("abc");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->path, fs::path("/sorted/12345_Acme/Allgemein/a.pdf"));
    EXPECT_EQ(record->size, 10u);
    EXPECT_EQ(index->size(), 1u);

    fs::remove_all(dir);
}

TEST(HashIndexTest, RecordsSurviveReopen) {
    auto dir = docsort::testing::create_temp_dir("docsort_index_test");
    {
        auto index = HashIndex::open(dir).value();
        ASSERT_TRUE(index->put(ContentRecord{"d1", "/sorted/a.pdf", 1, 1.0, "ALLGEMEIN"}).is_ok());
        ASSERT_TRUE(index->put(ContentRecord{"d2", "/sorted/b.pdf", 2, 2.0, "12345_Acme"}).is_ok());
        ASSERT_TRUE(index->put(ContentRecord{"d1", "/sorted/c.pdf", 3, 3.0, "ALLGEMEIN"}).is_ok());
    }
    EXPECT_TRUE(fs::exists(dir / docsort::index::kIndexFileName));

    auto reopened = HashIndex::open(dir).value();
    EXPECT_EQ(reopened->size(), 0u);
    auto loaded = reopened->load();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value(), 2u);

    auto d1 = reopened->get("d1");
    ASSERT_TRUE(d1.has_value());
    EXPECT_EQ(d1->path, fs::path("/sorted/c.pdf"));
    EXPECT_DOUBLE_EQ(d1->mtime, 3.0);
    EXPECT_EQ(reopened->get("d2")->customer_root, "12345_Acme");

    fs::remove_all(dir);
}

TEST(HashIndexTest, LoadPicksUpWritesFromAnotherConnection) {
    auto dir = docsort::testing::create_temp_dir("docsort_index_test");
    auto reader = HashIndex::open(dir).value();
    auto writer = HashIndex::open(dir).value();

    ASSERT_TRUE(writer->put(ContentRecord{"d1", "/sorted/a.pdf", 1, 1.0, "ALLGEMEIN"}).is_ok());
    EXPECT_FALSE(reader->get("d1").has_value());
    ASSERT_TRUE(reader->load().is_ok());
    EXPECT_TRUE(reader->get("d1").has_value());

    fs::remove_all(dir);
}

TEST(HashIndexTest, RecordJsonShape) {
    auto value = docsort::index::to_json(ContentRecord{"d", "/x/y.pdf", 5, 7.5, "HR"});
    EXPECT_EQ(value["path"], "/x/y.pdf");
    EXPECT_EQ(value["size"], 5);
    EXPECT_EQ(value["customer"], "HR");
    auto back = docsort::index::record_from_json("d", value);
    EXPECT_EQ(back.digest, "d");
    EXPECT_DOUBLE_EQ(back.mtime, 7.5);
}
