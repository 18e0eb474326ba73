#include "docsort/review/review_store.hpp"
#include "docsort/events/components.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace fs = std::filesystem;
using docsort::ErrorCode;
using docsort::review::ReviewFilter;
using docsort::review::ReviewItem;
using docsort::review::ReviewStore;
using docsort::testing::create_temp_dir;
using docsort::testing::read_file;
using docsort::testing::set_mtime;
using docsort::testing::write_file;

namespace {

class ReviewStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir("docsort_review_test");
        config_.central_base = root_ / "sorted";
        config_.data_dir = root_ / "state";
        auto opened = ReviewStore::open(config_, &bus_);
        ASSERT_TRUE(opened.is_ok());
        store_ = std::move(opened.value());
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    ReviewItem make_item(const fs::path& path, double confidence, double mtime,
                         std::optional<std::string> customer = std::nullopt) {
        ReviewItem item;
        item.original_path = path;
        item.size = 3;
        item.mtime = mtime;
        item.suggested_category = "unsorted";
        item.confidence = confidence;
        item.customer = std::move(customer);
        return item;
    }

    fs::path root_;
    docsort::config::Config config_;
    docsort::events::EventBus bus_;
    std::unique_ptr<ReviewStore> store_;
};

} // namespace

TEST_F(ReviewStoreTest, AddAssignsIdAndFilename) {
    docsort::events::MetricsComponent metrics(bus_);
    auto added = store_->add(make_item(root_ / "inbox" / "scan.pdf", 0.3, 10.0));
    ASSERT_TRUE(added.is_ok());
    EXPECT_EQ(added.value().size(), 36u);

    auto item = store_->get(added.value());
    ASSERT_TRUE(item.is_ok());
    EXPECT_EQ(item.value().filename, "scan.pdf");
    EXPECT_DOUBLE_EQ(item.value().confidence, 0.3);
    EXPECT_EQ(metrics.get_stats().reviews_queued.load(), 1u);
}

TEST_F(ReviewStoreTest, RejectsConfidenceOutsideUnitInterval) {
    auto added = store_->add(make_item(root_ / "scan.pdf", 1.2, 0.0));
    ASSERT_TRUE(added.is_error());
    EXPECT_EQ(added.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ReviewStoreTest, ListFiltersAndSortsNewestFirst) {
    ASSERT_TRUE(store_->add(make_item(root_ / "a.pdf", 0.2, 100.0, std::string("12345_Acme"))).is_ok());
    ASSERT_TRUE(store_->add(make_item(root_ / "b.pdf", 0.4, 300.0, std::string("12345_Acme"))).is_ok());
    ASSERT_TRUE(store_->add(make_item(root_ / "c.pdf", 0.1, 200.0)).is_ok());

    auto all = store_->list_pending();
    ASSERT_TRUE(all.is_ok());
    ASSERT_EQ(all.value().size(), 3u);
    EXPECT_EQ(all.value()[0].filename, "b.pdf");
    EXPECT_EQ(all.value()[1].filename, "c.pdf");
    EXPECT_EQ(all.value()[2].filename, "a.pdf");

    ReviewFilter acme;
    acme.customer = "12345_Acme";
    EXPECT_EQ(store_->list_pending(acme).value().size(), 2u);

    ReviewFilter band;
    band.min_confidence = 0.15;
    band.max_confidence = 0.3;
    auto banded = store_->list_pending(band).value();
    ASSERT_EQ(banded.size(), 1u);
    EXPECT_EQ(banded[0].filename, "a.pdf");
}

TEST_F(ReviewStoreTest, ConfirmMovesFileLogsFeedbackAndDropsItem) {
    const auto source = root_ / "inbox" / "12345_Acme" / "scan.pdf";
    write_file(source, "pdf");
    set_mtime(source, 1688212800);

    auto id = store_->add(make_item(source, 0.3, 1688212800.0, std::string("12345_Acme")));
    ASSERT_TRUE(id.is_ok());

    auto confirmed = store_->confirm(id.value(), "finanzen");
    ASSERT_TRUE(confirmed.is_ok());
    EXPECT_EQ(confirmed.value(), config_.central_base / "12345_Acme" / "Archiv" / "2023" / "scan.pdf");
    EXPECT_FALSE(fs::exists(source));
    EXPECT_EQ(read_file(confirmed.value()), "pdf");

    auto gone = store_->get(id.value());
    ASSERT_TRUE(gone.is_error());
    EXPECT_EQ(gone.error().code, ErrorCode::NotFound);

    std::istringstream lines(read_file(store_->feedback_log()));
    std::string line;
    ASSERT_TRUE(static_cast<bool>(std::getline(lines, line)));
    auto record = nlohmann::json::parse(line);
    EXPECT_EQ(record["id"], id.value());
    EXPECT_EQ(record["chosen_category"], "finanzen");
    EXPECT_EQ(record["suggested_category"], "unsorted");
    EXPECT_EQ(record["customer"], "12345_Acme");
    EXPECT_TRUE(record["project"].is_null());
    EXPECT_EQ(record["moved_to"], confirmed.value().string());
    EXPECT_FALSE(static_cast<bool>(std::getline(lines, line)));
}

TEST_F(ReviewStoreTest, FailedFeedbackWriteLeavesFileAndItemInPlace) {
    const auto source = root_ / "inbox" / "x.pdf";
    write_file(source, "pdf");
    auto id = store_->add(make_item(source, 0.3, 1688212800.0));
    ASSERT_TRUE(id.is_ok());

    // a directory where the log file should be makes the append fail
    fs::create_directories(store_->feedback_log());
    auto confirmed = store_->confirm(id.value(), "unsorted");
    ASSERT_TRUE(confirmed.is_error());
    EXPECT_EQ(confirmed.error().code, ErrorCode::IoError);
    EXPECT_TRUE(fs::exists(source));
    EXPECT_FALSE(fs::exists(config_.central_base / "ALLGEMEIN" / "Allgemein" / "x.pdf"));
    EXPECT_TRUE(store_->get(id.value()).is_ok());

    fs::remove_all(store_->feedback_log());
    auto retried = store_->confirm(id.value(), "unsorted");
    ASSERT_TRUE(retried.is_ok()) << retried.error().message;
    EXPECT_EQ(retried.value(), config_.central_base / "ALLGEMEIN" / "Allgemein" / "x.pdf");
    EXPECT_FALSE(fs::exists(source));
}

TEST_F(ReviewStoreTest, ConfirmAvoidsNameCollisions) {
    const auto target_dir = config_.central_base / "ALLGEMEIN" / "Allgemein";
    write_file(target_dir / "note.txt", "existing");
    const auto source = root_ / "inbox" / "note.txt";
    write_file(source, "new");

    auto id = store_->add(make_item(source, 0.2, 0.0));
    ASSERT_TRUE(id.is_ok());
    auto confirmed = store_->confirm(id.value(), "unsorted");
    ASSERT_TRUE(confirmed.is_ok());
    EXPECT_EQ(confirmed.value(), target_dir / "note_1.txt");
    EXPECT_EQ(read_file(target_dir / "note.txt"), "existing");
}

TEST_F(ReviewStoreTest, ConfirmUnknownIdIsNotFound) {
    auto confirmed = store_->confirm("no-such-id", "finanzen");
    ASSERT_TRUE(confirmed.is_error());
    EXPECT_EQ(confirmed.error().code, ErrorCode::NotFound);
    EXPECT_FALSE(fs::exists(store_->feedback_log()));
}

TEST_F(ReviewStoreTest, ConfirmWithMissingFileKeepsItem) {
    auto id = store_->add(make_item(root_ / "inbox" / "vanished.pdf", 0.2, 0.0));
    ASSERT_TRUE(id.is_ok());

    auto confirmed = store_->confirm(id.value(), "finanzen");
    ASSERT_TRUE(confirmed.is_error());
    EXPECT_EQ(confirmed.error().code, ErrorCode::NotFound);
    EXPECT_TRUE(store_->get(id.value()).is_ok());
}
