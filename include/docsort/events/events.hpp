/**
 * @file events.hpp
 * @brief Event types emitted by the sorting subsystem
 *
 * NAMING CONVENTION:
 * - Events are past-tense: FileRelocatedEvent, SnapshotCreatedEvent
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace docsort::events {

using TimePoint = std::chrono::system_clock::time_point;

// ════════════════════════════════════════════════════════
// Crawl Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when a crawl run begins
 *
 * WHO EMITS:
 * - Crawler::start()
 *
 * WHO SUBSCRIBES:
 * - Logger
 * - Metrics (runs started)
 */
struct CrawlStartedEvent {
    std::string started_at;
    std::size_t share_count = 0;
    TimePoint timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Emitted when the crawl thread leaves its walk
 *
 * `stopped` is true when the run ended because stop() was requested.
 */
struct CrawlFinishedEvent {
    std::uint64_t processed = 0;
    std::uint64_t moved = 0;
    std::uint64_t duplicates = 0;
    std::uint64_t errors = 0;
    bool stopped = false;
    std::chrono::milliseconds duration{0};
    TimePoint timestamp = std::chrono::system_clock::now();
};

// First copy of a digest placed at its classified destination.
struct FileRelocatedEvent {
    std::string digest;
    std::string from;
    std::string to;
    std::string customer_root;
    std::string subfolder;
    TimePoint timestamp = std::chrono::system_clock::now();
};

// A losing copy went to quarantine; the primary was left alone.
struct DuplicateQuarantinedEvent {
    std::string digest;
    std::string from;
    std::string quarantined_to;
    std::string primary;
    TimePoint timestamp = std::chrono::system_clock::now();
};

// A newer copy took over the primary path; the old primary was quarantined.
struct PrimaryDisplacedEvent {
    std::string digest;
    std::string new_primary;
    std::string previous_primary_to;
    TimePoint timestamp = std::chrono::system_clock::now();
};

struct CrawlErrorEvent {
    std::string path;
    std::string message;
    TimePoint timestamp = std::chrono::system_clock::now();
};

// ════════════════════════════════════════════════════════
// Review Events
// ════════════════════════════════════════════════════════

struct ReviewQueuedEvent {
    std::string item_id;
    std::string filename;
    std::string suggested_category;
    double confidence = 0.0;
    TimePoint timestamp = std::chrono::system_clock::now();
};

struct ReviewConfirmedEvent {
    std::string item_id;
    std::string chosen_category;
    std::string moved_to;
    TimePoint timestamp = std::chrono::system_clock::now();
};

// ════════════════════════════════════════════════════════
// Snapshot / Pipeline Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once a snapshot is durable
 *
 * WHO EMITS:
 * - SnapshotManager::create_snapshot()
 *
 * WHO SUBSCRIBES:
 * - Logger
 * - Metrics
 */
struct SnapshotCreatedEvent {
    std::string snapshot_id;
    std::string operation_type;
    std::size_t file_count = 0;
    TimePoint timestamp = std::chrono::system_clock::now();
};

struct RollbackCompletedEvent {
    std::string snapshot_id;
    bool success = false;
    std::size_t files_restored = 0;
    std::size_t files_failed = 0;
    std::chrono::milliseconds duration{0};
    TimePoint timestamp = std::chrono::system_clock::now();
};

struct DocumentProcessedEvent {
    std::string document_id;
    std::string filename;
    std::string status;       // "processed", "duplicate", "review", "failed"
    std::string category;
    std::string target_path;
    TimePoint timestamp = std::chrono::system_clock::now();
};

} // namespace docsort::events
