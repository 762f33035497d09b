#pragma once
#include "db.hpp"
#include "records.hpp"
#include <chrono>
#include <string>
#include <vector>

// Merger/acquisition query history. Every search is kept, including repeats
// of the same subject and timeframe.
class SearchLog {
public:
    explicit SearchLog(const Database& db);

    int64_t append(const std::string& subject,
                   const std::string& timeframe,
                   const std::string& payload,
                   int64_t deals_found);

    std::vector<SearchRecord> recent(int limit) const;
    std::vector<SearchRecord> by_subject(const std::string& subject, int limit) const;

    bool remove(int64_t id);
    int64_t purge_older_than(std::chrono::seconds age);

private:
    const Database& db_;
};
