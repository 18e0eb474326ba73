#include "docsort/crawler/crawler.hpp"

#include "docsort/core/file_stat.hpp"
#include "docsort/core/ids.hpp"
#include "docsort/dedup/file_mover.hpp"
#include "docsort/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <system_error>
#include <vector>

namespace docsort::crawler {
namespace fs = std::filesystem;
namespace {

fs::path normalized(const fs::path& path) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(path, ec);
    return ec ? path.lexically_normal() : canonical;
}

std::vector<fs::directory_entry> sorted_entries(const fs::path& dir, std::error_code& ec) {
    std::vector<fs::directory_entry> entries;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return entries;
    }
    const fs::directory_iterator end{};
    while (it != end) {
        entries.push_back(*it);
        it.increment(ec);
        if (ec) {
            break;
        }
    }
    std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
        return a.path().filename() < b.path().filename();
    });
    return entries;
}

} // namespace

const char* to_string(CrawlState state) {
    switch (state) {
        case CrawlState::Idle: return "idle";
        case CrawlState::Running: return "running";
        case CrawlState::Stopping: return "stopping";
    }
    return "idle";
}

nlohmann::json to_json(const CrawlStatus& status) {
    nlohmann::json out{
        {"running", status.running},
        {"stop_requested", status.stop_requested},
        {"started_at", nullptr},
        {"finished_at", nullptr},
        {"stats", to_json(status.stats)},
    };
    if (status.started_at) {
        out["started_at"] = *status.started_at;
    }
    if (status.finished_at) {
        out["finished_at"] = *status.finished_at;
    }
    return out;
}

Crawler::Crawler(ConfigLoader loader, events::EventBus& bus)
    : loader_(std::move(loader)), bus_(bus) {}

Crawler::Crawler(fs::path config_path, events::EventBus& bus)
    : Crawler([path = std::move(config_path)]() { return config::load_config(path); }, bus) {}

Crawler::~Crawler() {
    stop();
    wait();
}

Result<void> Crawler::start() {
    CrawlState expected = CrawlState::Idle;
    if (!state_.compare_exchange_strong(expected, CrawlState::Running)) {
        return Err<void>(ErrorCode::Conflict, "crawler already running");
    }

    std::lock_guard worker_lock(worker_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }

    auto fail = [this](Error error) {
        state_.store(CrawlState::Idle);
        spdlog::error("[Crawler] start rejected: {}", error.message);
        return Err<void>(std::move(error));
    };

    auto loaded = loader_ ? loader_() : Err<config::Config>(ErrorCode::Config, "no configuration source");
    if (loaded.is_error()) {
        return fail(loaded.error());
    }
    config::Config cfg = loaded.value();
    if (auto valid = config::validate_for_crawl(cfg); valid.is_error()) {
        return fail(valid.error());
    }

    std::error_code ec;
    fs::create_directories(cfg.central_base, ec);
    if (ec) {
        return fail(Error{ErrorCode::Config, "cannot create central_base " + cfg.central_base.string() + ": " + ec.message()});
    }

    auto index = prepare_index(cfg);
    if (index.is_error()) {
        return fail(index.error());
    }

    auto context = std::make_shared<RunContext>(RunContext{
        cfg,
        normalized(cfg.central_base),
        classify::PathClassifier(cfg),
        dedup::DuplicateResolver(cfg.central_base, index.value()),
    });

    const std::string started = to_iso8601(Clock::now());
    {
        std::lock_guard lock(stats_mutex_);
        stats_ = CrawlStats{};
        started_at_ = started;
        finished_at_.reset();
    }

    bus_.emit(events::CrawlStartedEvent{started, cfg.shares.size()});
    worker_ = std::thread(&Crawler::run, this, std::move(context));
    return Ok();
}

std::string Crawler::stop() {
    CrawlState expected = CrawlState::Running;
    if (state_.compare_exchange_strong(expected, CrawlState::Stopping)) {
        spdlog::info("[Crawler] stop requested");
        return "stopping";
    }
    return expected == CrawlState::Stopping ? "stopping" : "idle";
}

CrawlStatus Crawler::status() const {
    const auto current = state_.load();
    CrawlStatus status;
    status.running = current != CrawlState::Idle;
    status.stop_requested = current == CrawlState::Stopping;

    std::lock_guard lock(stats_mutex_);
    status.started_at = started_at_;
    status.finished_at = finished_at_;
    status.stats = stats_;
    return status;
}

CrawlStats Crawler::stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

void Crawler::wait() {
    std::lock_guard worker_lock(worker_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

Result<std::shared_ptr<index::HashIndex>> Crawler::prepare_index(const config::Config& config) {
    if (!index_ || index_path_ != config.index_store_path) {
        auto opened = index::HashIndex::open(config.index_store_path);
        if (opened.is_error()) {
            return opened;
        }
        index_ = opened.value();
        index_path_ = config.index_store_path;
    }
    auto loaded = index_->load();
    if (loaded.is_error()) {
        return Err<std::shared_ptr<index::HashIndex>>(loaded.error());
    }
    spdlog::info("[Crawler] hash index loaded entries={}", loaded.value());
    return Ok(index_);
}

void Crawler::run(std::shared_ptr<RunContext> context) {
    const auto begin = std::chrono::steady_clock::now();

    for (const auto& share : context->config.shares) {
        if (stop_requested()) {
            break;
        }
        std::error_code ec;
        if (!fs::is_directory(share, ec)) {
            record_error(share, "share is not a directory");
            continue;
        }
        walk_directory(share, *context);
    }

    const bool stopped = stop_requested();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);

    events::CrawlFinishedEvent finished;
    {
        std::lock_guard lock(stats_mutex_);
        finished_at_ = to_iso8601(Clock::now());
        finished.processed = stats_.processed;
        finished.moved = stats_.moved;
        finished.duplicates = stats_.duplicates;
        finished.errors = stats_.errors;
    }
    finished.stopped = stopped;
    finished.duration = elapsed;

    state_.store(CrawlState::Idle);
    bus_.emit(finished);
}

void Crawler::walk_directory(const fs::path& dir, RunContext& context) {
    std::error_code ec;
    auto entries = sorted_entries(dir, ec);
    if (ec) {
        record_error(dir, ec.message());
        return;
    }

    for (const auto& entry : entries) {
        if (stop_requested()) {
            return;
        }
        std::error_code entry_ec;
        const auto link_status = entry.symlink_status(entry_ec);
        if (entry_ec) {
            record_error(entry.path(), entry_ec.message());
            continue;
        }
        if (fs::is_symlink(link_status)) {
            continue;
        }
        if (fs::is_directory(link_status)) {
            if (!should_skip_directory(entry.path(), context)) {
                walk_directory(entry.path(), context);
            }
            continue;
        }
        if (fs::is_regular_file(link_status)) {
            process_file(entry.path(), context);
        }
    }
}

bool Crawler::should_skip_directory(const fs::path& dir, const RunContext& context) const {
    if (dir.filename() == dedup::kQuarantineDirName) {
        return true;
    }
    return normalized(dir) == context.central_base;
}

void Crawler::process_file(const fs::path& file, RunContext& context) {
    auto st = stat_file(file);
    if (st.is_error()) {
        record_error(file, st.error().message);
        return;
    }

    auto digest = hasher_.hash(file);
    if (digest.is_error()) {
        record_error(file, digest.error().message);
        return;
    }

    const auto placement = context.classifier.place(file, st.value().mtime);
    {
        std::lock_guard lock(stats_mutex_);
        stats_.record_processed(placement.customer_root, placement.subfolder);
    }

    dedup::Observation observation{file, digest.value(), st.value().size, st.value().mtime, placement};
    auto resolved = context.resolver.resolve(observation);
    if (resolved.is_error()) {
        record_error(file, resolved.error().message);
        return;
    }

    const auto& resolution = resolved.value();
    switch (resolution.outcome) {
        case dedup::Outcome::Placed: {
            {
                std::lock_guard lock(stats_mutex_);
                ++stats_.moved;
            }
            bus_.emit(events::FileRelocatedEvent{digest.value(), file.string(), resolution.final_path.string(),
                                                 placement.customer_root, placement.subfolder});
            break;
        }
        case dedup::Outcome::Displaced: {
            {
                std::lock_guard lock(stats_mutex_);
                stats_.record_duplicate(placement.customer_root, placement.subfolder);
            }
            bus_.emit(events::PrimaryDisplacedEvent{digest.value(), resolution.final_path.string(),
                                                    resolution.displaced_to ? resolution.displaced_to->string() : ""});
            break;
        }
        case dedup::Outcome::Quarantined: {
            {
                std::lock_guard lock(stats_mutex_);
                stats_.record_duplicate(placement.customer_root, placement.subfolder);
            }
            bus_.emit(events::DuplicateQuarantinedEvent{digest.value(), file.string(),
                                                        resolution.final_path.string(),
                                                        resolution.primary_path.string()});
            break;
        }
        case dedup::Outcome::AlreadyPrimary:
            spdlog::debug("[Crawler] {} is already the primary", file.string());
            break;
    }
}

void Crawler::record_error(const fs::path& path, const std::string& message) {
    {
        std::lock_guard lock(stats_mutex_);
        ++stats_.errors;
    }
    bus_.emit(events::CrawlErrorEvent{path.string(), message});
}

} // namespace docsort::crawler
