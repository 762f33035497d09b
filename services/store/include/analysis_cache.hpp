#pragma once
#include "db.hpp"
#include "hashing.hpp"
#include "records.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

// TTL-keyed store of computed text artifacts. Expiry is lazy: get() filters
// expired rows but only sweep_expired() (or an explicit delete) removes them.
class AnalysisCache {
public:
    explicit AnalysisCache(const Database& db);

    std::optional<CachedResult> get(const std::string& subject,
                                    const std::string& query_kind,
                                    const Params& params = Params::object()) const;

    // Upsert by fingerprint. ttl == nullopt stores a never-expiring entry;
    // a zero or negative ttl stores an entry that is already stale.
    void put(const std::string& subject,
             const std::string& query_kind,
             const Params& params,
             const std::string& payload,
             const std::string& source,
             std::optional<std::chrono::seconds> ttl);

    int64_t sweep_expired();

    // Live entries created within `window`, grouped by subject.
    std::vector<SubjectPopularity> popular(std::chrono::seconds window, int limit) const;

    // Live entries newest first, with the number of live rows per subject/kind.
    std::vector<CacheHistoryRow> history(int limit) const;

    int64_t remove_subject(const std::string& subject);
    int64_t remove_entry(const std::string& subject, const std::string& query_kind);

    // Entries created before now - age, live or not.
    int64_t stale_count(std::chrono::seconds age) const;

private:
    const Database& db_;
};
