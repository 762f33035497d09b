#pragma once
#include "db.hpp"
#include "records.hpp"
#include <chrono>
#include <filesystem>
#include <string>

enum class BulkScope {
    Cache,
    Documents, // cascades to interactions
    Searches,
    Telemetry,
    Everything
};

const char* to_string(BulkScope scope);
// Throws MalformedInputError for an unknown name.
BulkScope parse_scope(const std::string& name);

struct CleanupReport {
    int64_t expired_cache_removed{0};
    int64_t telemetry_removed{0};
};

constexpr std::chrono::hours kTelemetryRetention{24 * 90};

class Maintenance {
public:
    explicit Maintenance(const Database& db);

    StoreStats stats() const;

    // Irreversible. Confirmation belongs to the caller (see ConfirmGate).
    int64_t bulk_delete(BulkScope scope);

    // VACUUM; reclaims space after large deletions.
    void compact();

    // Expired cache sweep, telemetry retention purge, then compaction.
    CleanupReport full_cleanup(std::chrono::seconds telemetry_retention = kTelemetryRetention);

    // Checkpoints the WAL and copies the database file byte for byte.
    void backup(const std::filesystem::path& dest) const;

private:
    const Database& db_;
};
