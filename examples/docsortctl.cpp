#include "docsort/api/control_surface.hpp"
#include "docsort/config/config.hpp"
#include "docsort/crawler/crawler.hpp"
#include "docsort/dedup/quarantine.hpp"
#include "docsort/documents/document_store.hpp"
#include "docsort/documents/object_storage.hpp"
#include "docsort/events/components.hpp"
#include "docsort/events/event_bus.hpp"
#include "docsort/index/hash_index.hpp"
#include "docsort/pipeline/orchestrator.hpp"
#include "docsort/review/review_store.hpp"
#include "docsort/snapshot/rollback_service.hpp"
#include "docsort/snapshot/snapshot_manager.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using docsort::api::Reply;
using docsort::api::ReplyStatus;

namespace {

std::atomic<bool> g_interrupted{false};

void signal_handler(int) {
    g_interrupted = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [--config FILE] COMMAND [ARGS]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  crawl                         Run one crawl over the configured shares\n";
    std::cout << "  status                        Show crawler status\n";
    std::cout << "  duplicates [--customer C] [--limit N] [--offset N]\n";
    std::cout << "  promote PATH                  Swap a quarantined file into primary position\n";
    std::cout << "  move PATH TARGET_DIR          Move a quarantined file elsewhere\n";
    std::cout << "  delete PATH...                Delete quarantined files\n";
    std::cout << "  pending [--customer C] [--project P] [--min X] [--max X]\n";
    std::cout << "  confirm ID CATEGORY           Confirm a review item\n";
    std::cout << "  process [--batch] PATH...     Classify and file documents\n";
    std::cout << "  snapshots [--limit N] [--type T]\n";
    std::cout << "  rollback SNAPSHOT_ID\n";
    std::cout << "  cleanup-snapshots             Drop snapshots past the retention window\n";
}

int emit(const Reply& reply) {
    std::cout << reply.body.dump(2) << std::endl;
    return reply.status == ReplyStatus::Ok ? 0 : 1;
}

std::optional<std::string> option_value(std::vector<std::string>& args, const std::string& name) {
    for (auto it = args.begin(); it != args.end(); ++it) {
        if (*it == name && std::next(it) != args.end()) {
            std::string value = *std::next(it);
            args.erase(it, std::next(it, 2));
            return value;
        }
    }
    return std::nullopt;
}

bool take_flag(std::vector<std::string>& args, const std::string& name) {
    for (auto it = args.begin(); it != args.end(); ++it) {
        if (*it == name) {
            args.erase(it);
            return true;
        }
    }
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    fs::path config_path = "docsort.json";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            args.push_back(arg);
        }
    }
    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    const std::string command = args.front();
    args.erase(args.begin());

    auto loaded = docsort::config::load_config(config_path);
    if (loaded.is_error()) {
        spdlog::error("{}", loaded.error().message);
        return 1;
    }
    const auto config = loaded.value();
    docsort::config::apply_logging(config.logging);

    docsort::events::EventBus bus;
    docsort::events::LoggerComponent logger(bus);
    docsort::events::MetricsComponent metrics(bus);

    auto index = docsort::index::HashIndex::open(config.index_store_path);
    if (index.is_error()) {
        spdlog::error("Hash index unavailable: {}", index.error().message);
        return 1;
    }
    auto documents = docsort::documents::DocumentStore::open(config.data_dir);
    if (documents.is_error()) {
        spdlog::error("Document store unavailable: {}", documents.error().message);
        return 1;
    }
    auto reviews = docsort::review::ReviewStore::open(config, &bus, documents.value().get());
    if (reviews.is_error()) {
        spdlog::error("Review store unavailable: {}", reviews.error().message);
        return 1;
    }

    docsort::documents::LocalObjectStorage storage;
    auto snapshots = docsort::snapshot::SnapshotManager::open(config.data_dir, *documents.value(), storage, &bus);
    if (snapshots.is_error()) {
        spdlog::error("Snapshot store unavailable: {}", snapshots.error().message);
        return 1;
    }
    docsort::snapshot::RollbackService rollback(*snapshots.value(), *documents.value(), storage, &bus);

    docsort::crawler::Crawler crawler(config_path, bus);
    docsort::dedup::QuarantineService quarantine(config.central_base, index.value(),
                                                 [&crawler]() { return crawler.is_running(); });
    docsort::pipeline::DocumentProcessingOrchestrator pipeline(config, *documents.value(), storage,
                                                               *reviews.value(), snapshots.value().get(),
                                                               nullptr, &bus);

    docsort::api::ControlSurface surface(crawler, quarantine, *reviews.value(), *snapshots.value(),
                                         rollback, pipeline, config.snapshots.retention_days);

    try {
        if (command == "crawl") {
            std::signal(SIGINT, signal_handler);
            auto started = surface.crawler_start();
            if (started.status != ReplyStatus::Ok) {
                return emit(started);
            }
            while (crawler.is_running()) {
                if (g_interrupted.exchange(false)) {
                    surface.crawler_stop();
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            crawler.wait();
            metrics.print_stats();
            return emit(surface.crawler_status());
        }
        if (command == "status") {
            return emit(surface.crawler_status());
        }
        if (command == "duplicates") {
            auto customer = option_value(args, "--customer");
            const auto limit = std::stoul(option_value(args, "--limit").value_or("50"));
            const auto offset = std::stoul(option_value(args, "--offset").value_or("0"));
            return emit(surface.list_duplicates(customer, limit, offset));
        }
        if (command == "promote" && args.size() == 1) {
            return emit(surface.promote_duplicate(args[0]));
        }
        if (command == "move" && args.size() == 2) {
            return emit(surface.move_duplicate(args[0], args[1]));
        }
        if (command == "delete" && !args.empty()) {
            return emit(surface.delete_duplicates(args));
        }
        if (command == "pending") {
            docsort::review::ReviewFilter filter;
            filter.customer = option_value(args, "--customer");
            filter.project = option_value(args, "--project");
            if (auto min = option_value(args, "--min")) {
                filter.min_confidence = std::stod(*min);
            }
            if (auto max = option_value(args, "--max")) {
                filter.max_confidence = std::stod(*max);
            }
            return emit(surface.list_pending(filter));
        }
        if (command == "confirm" && args.size() == 2) {
            return emit(surface.confirm_review(args[0], args[1]));
        }
        if (command == "process") {
            const bool batch = take_flag(args, "--batch");
            return emit(surface.process_files(args, batch));
        }
        if (command == "snapshots") {
            const auto limit = std::stoul(option_value(args, "--limit").value_or("50"));
            return emit(surface.list_snapshots(limit, option_value(args, "--type")));
        }
        if (command == "rollback" && args.size() == 1) {
            return emit(surface.rollback_snapshot(args[0]));
        }
        if (command == "cleanup-snapshots") {
            return emit(surface.cleanup_snapshots());
        }
    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid numeric argument: {}", e.what());
        return 1;
    } catch (const std::out_of_range& e) {
        spdlog::error("Numeric argument out of range: {}", e.what());
        return 1;
    }

    spdlog::error("Unknown command or wrong arguments: {}", command);
    print_usage(argv[0]);
    return 1;
}
