#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>

namespace docsort::crawler {

struct SubfolderStats {
    std::uint64_t processed = 0;
    std::uint64_t duplicates = 0;
};

struct CustomerStats {
    std::uint64_t processed = 0;
    std::uint64_t duplicates = 0;
    std::map<std::string, SubfolderStats> by_subfolder;
};

// Counters of one crawl run. Reset at every start, never persisted.
struct CrawlStats {
    std::uint64_t processed = 0;
    std::uint64_t moved = 0;
    std::uint64_t duplicates = 0;
    std::uint64_t errors = 0;
    std::map<std::string, CustomerStats> by_customer;

    void record_processed(const std::string& customer_root, const std::string& subfolder);
    void record_duplicate(const std::string& customer_root, const std::string& subfolder);
};

nlohmann::json to_json(const CrawlStats& stats);

} // namespace docsort::crawler
