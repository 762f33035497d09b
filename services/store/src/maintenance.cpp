#include "../include/maintenance.hpp"
#include "../include/analysis_cache.hpp"
#include "../include/errors.hpp"
#include "../include/telemetry_log.hpp"

namespace fs = std::filesystem;

namespace {
int64_t count_rows(Connection& conn, const char* table) {
    auto st = conn.prepare(std::string("SELECT COUNT(*) FROM ") + table);
    st.step();
    return st.column_int64(0);
}

int64_t delete_all_from(Connection& conn, const char* table) {
    conn.exec(std::string("DELETE FROM ") + table + ";");
    return conn.changes();
}

int64_t file_size_or_zero(const fs::path& p) {
    std::error_code ec;
    auto n = fs::file_size(p, ec);
    return ec ? 0 : static_cast<int64_t>(n);
}
}

const char* to_string(BulkScope scope) {
    switch (scope) {
        case BulkScope::Cache: return "cache";
        case BulkScope::Documents: return "documents";
        case BulkScope::Searches: return "searches";
        case BulkScope::Telemetry: return "telemetry";
        case BulkScope::Everything: return "everything";
    }
    return "unknown";
}

BulkScope parse_scope(const std::string& name) {
    if (name == "cache") return BulkScope::Cache;
    if (name == "documents") return BulkScope::Documents;
    if (name == "searches") return BulkScope::Searches;
    if (name == "telemetry") return BulkScope::Telemetry;
    if (name == "everything") return BulkScope::Everything;
    throw MalformedInputError("unknown scope: " + name);
}

Maintenance::Maintenance(const Database& db) : db_(db) {}

StoreStats Maintenance::stats() const {
    Connection conn = db_.connect();
    StoreStats s;
    s.cache_entries = count_rows(conn, "cache_entries");
    s.documents = count_rows(conn, "documents");
    s.interactions = count_rows(conn, "interactions");
    s.searches = count_rows(conn, "searches");
    s.telemetry_events = count_rows(conn, "telemetry_events");
    s.store_bytes = file_size_or_zero(db_.path()) + file_size_or_zero(db_.path() + "-wal");
    return s;
}

int64_t Maintenance::bulk_delete(BulkScope scope) {
    Connection conn = db_.connect();
    Transaction tx(conn);
    int64_t removed = 0;
    switch (scope) {
        case BulkScope::Cache:
            removed += delete_all_from(conn, "cache_entries");
            break;
        case BulkScope::Documents:
            removed += delete_all_from(conn, "interactions");
            removed += delete_all_from(conn, "documents");
            break;
        case BulkScope::Searches:
            removed += delete_all_from(conn, "searches");
            break;
        case BulkScope::Telemetry:
            removed += delete_all_from(conn, "telemetry_events");
            break;
        case BulkScope::Everything:
            removed += delete_all_from(conn, "cache_entries");
            removed += delete_all_from(conn, "interactions");
            removed += delete_all_from(conn, "documents");
            removed += delete_all_from(conn, "searches");
            removed += delete_all_from(conn, "telemetry_events");
            break;
    }
    tx.commit();
    return removed;
}

void Maintenance::compact() {
    Connection conn = db_.connect();
    conn.exec("VACUUM;");
}

CleanupReport Maintenance::full_cleanup(std::chrono::seconds telemetry_retention) {
    CleanupReport r;
    r.expired_cache_removed = AnalysisCache(db_).sweep_expired();
    r.telemetry_removed = TelemetryLog(db_).purge_older_than(telemetry_retention);
    compact();
    return r;
}

void Maintenance::backup(const fs::path& dest) const {
    {
        Connection conn = db_.connect();
        conn.exec("PRAGMA wal_checkpoint(TRUNCATE);");
    }
    std::error_code ec;
    if (dest.has_parent_path()) fs::create_directories(dest.parent_path(), ec);
    if (!ec) fs::copy_file(db_.path(), dest, fs::copy_options::overwrite_existing, ec);
    if (ec) throw StorageUnavailableError("backup to " + dest.string() + " failed: " + ec.message());
}
