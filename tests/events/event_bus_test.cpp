#include <gtest/gtest.h>
#include "docsort/events/event_bus.hpp"
#include "docsort/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace docsort::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    std::string received_path;

    bus.subscribe<CrawlErrorEvent>([&](const CrawlErrorEvent& e) {
        handler_called = true;
        received_path = e.path;
    });

    bus.emit(CrawlErrorEvent{"/mnt/share/broken.pdf", "permission denied"});

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_path, "/mnt/share/broken.pdf");
}

TEST(EventBus, MultipleSubscribers) {
    EventBus bus;

    int count = 0;

    bus.subscribe<CrawlStartedEvent>([&](const CrawlStartedEvent&) { count++; });
    bus.subscribe<CrawlStartedEvent>([&](const CrawlStartedEvent&) { count++; });
    bus.subscribe<CrawlStartedEvent>([&](const CrawlStartedEvent&) { count++; });

    bus.emit(CrawlStartedEvent{"2024-01-01T00:00:00.000Z", 2});

    EXPECT_EQ(count, 3);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int relocated = 0;
    int quarantined = 0;

    bus.subscribe<FileRelocatedEvent>([&](const FileRelocatedEvent&) { relocated++; });
    bus.subscribe<DuplicateQuarantinedEvent>([&](const DuplicateQuarantinedEvent&) { quarantined++; });

    bus.emit(FileRelocatedEvent{"d1", "/in/a", "/out/a", "ALLGEMEIN", "Allgemein"});
    bus.emit(DuplicateQuarantinedEvent{"d1", "/in/b", "/out/_duplicates/b", "/out/a"});
    bus.emit(FileRelocatedEvent{"d2", "/in/c", "/out/c", "ALLGEMEIN", "Allgemein"});

    EXPECT_EQ(relocated, 2);
    EXPECT_EQ(quarantined, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<CrawlErrorEvent>([&](const CrawlErrorEvent&) { count++; });

    bus.emit(CrawlErrorEvent{"a", "x"});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<CrawlErrorEvent>(id);

    bus.emit(CrawlErrorEvent{"b", "y"});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(CrawlErrorEvent{"a", "x"}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int count = 0;
    bus.subscribe<CrawlErrorEvent>([](const CrawlErrorEvent&) { throw std::runtime_error("boom"); });
    bus.subscribe<CrawlErrorEvent>([&](const CrawlErrorEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(CrawlErrorEvent{"a", "x"}));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, ThreadSafety) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count]() {
            bus.subscribe<CrawlErrorEvent>([&count](const CrawlErrorEvent&) {
                count++;
            });
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    bus.emit(CrawlErrorEvent{"a", "x"});

    EXPECT_EQ(count, 10);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::size_t> total{0};

    bus.subscribe<SnapshotCreatedEvent>([&total](const SnapshotCreatedEvent& e) {
        total += e.file_count;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(SnapshotCreatedEvent{"id", "file_processing", 1});
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(total, 100u);
}

TEST(EventBus, SubscriberCountAndClear) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<CrawlErrorEvent>(), 0u);

    auto id1 = bus.subscribe<CrawlErrorEvent>([](const CrawlErrorEvent&) {});
    bus.subscribe<CrawlErrorEvent>([](const CrawlErrorEvent&) {});
    bus.subscribe<ReviewQueuedEvent>([](const ReviewQueuedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<CrawlErrorEvent>(), 2u);

    bus.unsubscribe<CrawlErrorEvent>(id1);
    EXPECT_EQ(bus.subscriber_count<CrawlErrorEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<CrawlErrorEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<ReviewQueuedEvent>(), 0u);
}
