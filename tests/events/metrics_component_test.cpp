#include "docsort/events/event_bus.hpp"
#include "docsort/events/components.hpp"
#include "docsort/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace docsort::events;

TEST(MetricsComponentTest, TracksCrawlCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);
    LoggerComponent logger(bus);

    bus.emit(CrawlStartedEvent{"2024-01-01T00:00:00.000Z", 1});
    bus.emit(FileRelocatedEvent{"d1", "/in/a", "/out/a", "12345_Acme", "Allgemein"});
    bus.emit(DuplicateQuarantinedEvent{"d1", "/in/b", "/out/_duplicates/b", "/out/a"});
    bus.emit(PrimaryDisplacedEvent{"d2", "/out/c", "/out/_duplicates/c"});
    bus.emit(CrawlErrorEvent{"/in/d", "unreadable"});
    bus.emit(CrawlFinishedEvent{4, 1, 2, 1, false, std::chrono::milliseconds{12}});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.crawls_started.load(), 1u);
    EXPECT_EQ(stats.crawls_finished.load(), 1u);
    EXPECT_EQ(stats.files_relocated.load(), 1u);
    EXPECT_EQ(stats.duplicates_quarantined.load(), 1u);
    EXPECT_EQ(stats.primaries_displaced.load(), 1u);
    EXPECT_EQ(stats.crawl_errors.load(), 1u);
}

TEST(MetricsComponentTest, TracksReviewSnapshotAndPipelineCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(ReviewQueuedEvent{"r1", "scan.pdf", "unsorted", 0.3});
    bus.emit(ReviewConfirmedEvent{"r1", "finanzen", "/out/scan.pdf"});
    bus.emit(SnapshotCreatedEvent{"s1", "batch_processing", 3});
    bus.emit(RollbackCompletedEvent{"s1", true, 3, 0, std::chrono::milliseconds{5}});
    bus.emit(RollbackCompletedEvent{"s2", false, 0, 1, std::chrono::milliseconds{1}});
    bus.emit(DocumentProcessedEvent{"d1", "scan.pdf", "processed", "finanzen", "/out/scan.pdf"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.reviews_queued.load(), 1u);
    EXPECT_EQ(stats.reviews_confirmed.load(), 1u);
    EXPECT_EQ(stats.snapshots_created.load(), 1u);
    EXPECT_EQ(stats.rollbacks_succeeded.load(), 1u);
    EXPECT_EQ(stats.rollbacks_failed.load(), 1u);
    EXPECT_EQ(stats.documents_processed.load(), 1u);
    EXPECT_NO_THROW(metrics.print_stats());
}
