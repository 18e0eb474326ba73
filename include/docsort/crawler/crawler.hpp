#pragma once

#include "docsort/classify/path_classifier.hpp"
#include "docsort/config/config.hpp"
#include "docsort/core/result.hpp"
#include "docsort/crawler/crawl_stats.hpp"
#include "docsort/dedup/duplicate_resolver.hpp"
#include "docsort/events/event_bus.hpp"
#include "docsort/hashing/content_hasher.hpp"
#include "docsort/index/hash_index.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace docsort::crawler {

enum class CrawlState {
    Idle,
    Running,
    Stopping
};

const char* to_string(CrawlState state);

struct CrawlStatus {
    bool running = false;
    bool stop_requested = false;
    std::optional<std::string> started_at;
    std::optional<std::string> finished_at;
    CrawlStats stats;
};

nlohmann::json to_json(const CrawlStatus& status);

/**
 * @brief Background walker over the configured shares
 *
 * One run at a time. start() re-reads the configuration, reloads the hash
 * index and launches a worker thread; stop() is cooperative and is honoured
 * before the next directory or file. status() may be called from any
 * thread while a run is active.
 */
class Crawler {
public:
    using ConfigLoader = std::function<Result<config::Config>()>;

    Crawler(ConfigLoader loader, events::EventBus& bus);
    Crawler(std::filesystem::path config_path, events::EventBus& bus);
    ~Crawler();

    Crawler(const Crawler&) = delete;
    Crawler& operator=(const Crawler&) = delete;

    // ErrorCode::Conflict if a run is active, ErrorCode::Config on a bad
    // configuration. State is unchanged on error.
    Result<void> start();

    // "stopping" when a run was active, "idle" otherwise.
    std::string stop();

    [[nodiscard]] CrawlStatus status() const;
    [[nodiscard]] CrawlStats stats() const;
    [[nodiscard]] CrawlState state() const noexcept { return state_.load(); }
    [[nodiscard]] bool is_running() const noexcept { return state_.load() != CrawlState::Idle; }

    // Blocks until the current run has finished.
    void wait();

private:
    struct RunContext {
        config::Config config;
        std::filesystem::path central_base;  // canonical form
        classify::PathClassifier classifier;
        dedup::DuplicateResolver resolver;
    };

    Result<std::shared_ptr<index::HashIndex>> prepare_index(const config::Config& config);

    void run(std::shared_ptr<RunContext> context);
    void walk_directory(const std::filesystem::path& dir, RunContext& context);
    void process_file(const std::filesystem::path& file, RunContext& context);
    bool should_skip_directory(const std::filesystem::path& dir, const RunContext& context) const;
    void record_error(const std::filesystem::path& path, const std::string& message);

    [[nodiscard]] bool stop_requested() const noexcept { return state_.load() == CrawlState::Stopping; }

    ConfigLoader loader_;
    events::EventBus& bus_;
    hashing::ContentHasher hasher_;

    std::atomic<CrawlState> state_{CrawlState::Idle};

    mutable std::mutex stats_mutex_;
    CrawlStats stats_;
    std::optional<std::string> started_at_;
    std::optional<std::string> finished_at_;

    std::shared_ptr<index::HashIndex> index_;
    std::filesystem::path index_path_;

    std::mutex worker_mutex_;
    std::thread worker_;
};

} // namespace docsort::crawler
