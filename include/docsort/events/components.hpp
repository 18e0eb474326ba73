/**
 * @file components.hpp
 * @brief Event-driven logging and metrics
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // every crawl, review, snapshot and pipeline event is now logged and counted
 */

#pragma once

#include "docsort/events/event_bus.hpp"
#include "docsort/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace docsort::events {

/**
 * @brief Logger component - one spdlog line per event
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<CrawlStartedEvent>([](const CrawlStartedEvent& e) {
            spdlog::info("[CrawlStarted] at={} shares={}", e.started_at, e.share_count);
        });

        bus_.subscribe<CrawlFinishedEvent>([](const CrawlFinishedEvent& e) {
            spdlog::info("[CrawlFinished] processed={} moved={} duplicates={} errors={} stopped={} duration={}ms",
                         e.processed, e.moved, e.duplicates, e.errors, e.stopped, e.duration.count());
        });

        bus_.subscribe<FileRelocatedEvent>([](const FileRelocatedEvent& e) {
            spdlog::info("[FileRelocated] from={} to={} customer={} subfolder={}",
                         e.from, e.to, e.customer_root, e.subfolder);
        });

        bus_.subscribe<DuplicateQuarantinedEvent>([](const DuplicateQuarantinedEvent& e) {
            spdlog::info("[DuplicateQuarantined] from={} to={} primary={}", e.from, e.quarantined_to, e.primary);
        });

        bus_.subscribe<PrimaryDisplacedEvent>([](const PrimaryDisplacedEvent& e) {
            spdlog::info("[PrimaryDisplaced] primary={} previous_to={}", e.new_primary, e.previous_primary_to);
        });

        bus_.subscribe<CrawlErrorEvent>([](const CrawlErrorEvent& e) {
            spdlog::warn("[CrawlError] path={} error={}", e.path, e.message);
        });

        bus_.subscribe<ReviewQueuedEvent>([](const ReviewQueuedEvent& e) {
            spdlog::info("[ReviewQueued] id={} file={} suggested={} confidence={:.2f}",
                         e.item_id, e.filename, e.suggested_category, e.confidence);
        });

        bus_.subscribe<ReviewConfirmedEvent>([](const ReviewConfirmedEvent& e) {
            spdlog::info("[ReviewConfirmed] id={} category={} moved_to={}", e.item_id, e.chosen_category, e.moved_to);
        });

        bus_.subscribe<SnapshotCreatedEvent>([](const SnapshotCreatedEvent& e) {
            spdlog::info("[SnapshotCreated] id={} type={} files={}", e.snapshot_id, e.operation_type, e.file_count);
        });

        bus_.subscribe<RollbackCompletedEvent>([](const RollbackCompletedEvent& e) {
            if (e.success) {
                spdlog::info("[RollbackCompleted] id={} restored={} duration={}ms",
                             e.snapshot_id, e.files_restored, e.duration.count());
            } else {
                spdlog::warn("[RollbackCompleted] id={} restored={} failed={} duration={}ms",
                             e.snapshot_id, e.files_restored, e.files_failed, e.duration.count());
            }
        });

        bus_.subscribe<DocumentProcessedEvent>([](const DocumentProcessedEvent& e) {
            spdlog::info("[DocumentProcessed] id={} file={} status={} category={} target={}",
                         e.document_id, e.filename, e.status, e.category, e.target_path);
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Metrics component - running counters
 *
 * Counters only grow; they cover the lifetime of the component, not one
 * crawl (CrawlStats does that).
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> crawls_started{0};
        std::atomic<std::uint64_t> crawls_finished{0};
        std::atomic<std::uint64_t> files_relocated{0};
        std::atomic<std::uint64_t> duplicates_quarantined{0};
        std::atomic<std::uint64_t> primaries_displaced{0};
        std::atomic<std::uint64_t> crawl_errors{0};
        std::atomic<std::uint64_t> reviews_queued{0};
        std::atomic<std::uint64_t> reviews_confirmed{0};
        std::atomic<std::uint64_t> snapshots_created{0};
        std::atomic<std::uint64_t> rollbacks_succeeded{0};
        std::atomic<std::uint64_t> rollbacks_failed{0};
        std::atomic<std::uint64_t> documents_processed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<CrawlStartedEvent>([this](const CrawlStartedEvent&) { stats_.crawls_started++; });
        bus_.subscribe<CrawlFinishedEvent>([this](const CrawlFinishedEvent&) { stats_.crawls_finished++; });
        bus_.subscribe<FileRelocatedEvent>([this](const FileRelocatedEvent&) { stats_.files_relocated++; });
        bus_.subscribe<DuplicateQuarantinedEvent>([this](const DuplicateQuarantinedEvent&) {
            stats_.duplicates_quarantined++;
        });
        bus_.subscribe<PrimaryDisplacedEvent>([this](const PrimaryDisplacedEvent&) { stats_.primaries_displaced++; });
        bus_.subscribe<CrawlErrorEvent>([this](const CrawlErrorEvent&) { stats_.crawl_errors++; });
        bus_.subscribe<ReviewQueuedEvent>([this](const ReviewQueuedEvent&) { stats_.reviews_queued++; });
        bus_.subscribe<ReviewConfirmedEvent>([this](const ReviewConfirmedEvent&) { stats_.reviews_confirmed++; });
        bus_.subscribe<SnapshotCreatedEvent>([this](const SnapshotCreatedEvent&) { stats_.snapshots_created++; });
        bus_.subscribe<RollbackCompletedEvent>([this](const RollbackCompletedEvent& e) {
            if (e.success) {
                stats_.rollbacks_succeeded++;
            } else {
                stats_.rollbacks_failed++;
            }
        });
        bus_.subscribe<DocumentProcessedEvent>([this](const DocumentProcessedEvent&) {
            stats_.documents_processed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sorting Statistics:");
        spdlog::info("  Crawls started:     {}", stats_.crawls_started.load());
        spdlog::info("  Files relocated:    {}", stats_.files_relocated.load());
        spdlog::info("  Dups quarantined:   {}", stats_.duplicates_quarantined.load());
        spdlog::info("  Primaries replaced: {}", stats_.primaries_displaced.load());
        spdlog::info("  Crawl errors:       {}", stats_.crawl_errors.load());
        spdlog::info("  Reviews queued:     {}", stats_.reviews_queued.load());
        spdlog::info("  Reviews confirmed:  {}", stats_.reviews_confirmed.load());
        spdlog::info("  Snapshots:          {}", stats_.snapshots_created.load());
        spdlog::info("  Rollbacks ok/fail:  {}/{}", stats_.rollbacks_succeeded.load(), stats_.rollbacks_failed.load());
        spdlog::info("  Documents:          {}", stats_.documents_processed.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace docsort::events
