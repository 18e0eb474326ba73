#include "docsort/crawler/crawl_stats.hpp"

namespace docsort::crawler {

void CrawlStats::record_processed(const std::string& customer_root, const std::string& subfolder) {
    ++processed;
    auto& customer = by_customer[customer_root];
    ++customer.processed;
    ++customer.by_subfolder[subfolder].processed;
}

void CrawlStats::record_duplicate(const std::string& customer_root, const std::string& subfolder) {
    ++duplicates;
    auto& customer = by_customer[customer_root];
    ++customer.duplicates;
    ++customer.by_subfolder[subfolder].duplicates;
}

nlohmann::json to_json(const CrawlStats& stats) {
    nlohmann::json by_customer = nlohmann::json::object();
    for (const auto& [customer_root, customer] : stats.by_customer) {
        nlohmann::json by_subfolder = nlohmann::json::object();
        for (const auto& [name, sub] : customer.by_subfolder) {
            by_subfolder[name] = {{"processed", sub.processed}, {"duplicates", sub.duplicates}};
        }
        by_customer[customer_root] = {
            {"processed", customer.processed},
            {"duplicates", customer.duplicates},
            {"by_subfolder", by_subfolder},
        };
    }
    return nlohmann::json{
        {"processed", stats.processed},
        {"moved", stats.moved},
        {"duplicates", stats.duplicates},
        {"errors", stats.errors},
        {"by_customer", by_customer},
    };
}

} // namespace docsort::crawler
