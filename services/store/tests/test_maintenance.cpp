// =============================================================================
// Maintenance & Bulk-Delete Tests
// =============================================================================

#include "test_support.hpp"
#include "../include/analysis_cache.hpp"
#include "../include/document_store.hpp"
#include "../include/errors.hpp"
#include "../include/interaction_log.hpp"
#include "../include/maintenance.hpp"
#include "../include/search_log.hpp"
#include "../include/telemetry_log.hpp"

using json = nlohmann::json;
using namespace std::chrono_literals;

class MaintenanceTest : public StoreTest {
protected:
    void populate() {
        AnalysisCache(*db_).put("EV Batteries", "global", json::object(), "overview", "openai", 24h);
        AnalysisCache(*db_).put("EV Batteries", "metrics", json::object(), "metrics", "openai", 0s);
        int64_t doc = DocumentStore(*db_).record("deck.pdf", "bytes", 12, {"h1", "h2"});
        InteractionLog(*db_).append(doc, "What is CAGR?", "12%", 5, 3);
        SearchLog(*db_).append("Fintech", "2024", "table", 3);
        TelemetryLog(*db_).log_event("market_analysis");
    }
};

TEST_F(MaintenanceTest, StatsCountsEveryTable) {
    populate();
    auto s = Maintenance(*db_).stats();
    EXPECT_EQ(s.cache_entries, 2);
    EXPECT_EQ(s.documents, 1);
    EXPECT_EQ(s.interactions, 1);
    EXPECT_EQ(s.searches, 1);
    EXPECT_EQ(s.telemetry_events, 1);
    EXPECT_GT(s.store_bytes, 0);
}

TEST_F(MaintenanceTest, BulkDeleteEverythingZeroesAllTables) {
    populate();
    Maintenance m(*db_);
    EXPECT_EQ(m.bulk_delete(BulkScope::Everything), 6);

    auto s = m.stats();
    EXPECT_EQ(s.cache_entries, 0);
    EXPECT_EQ(s.documents, 0);
    EXPECT_EQ(s.interactions, 0);
    EXPECT_EQ(s.searches, 0);
    EXPECT_EQ(s.telemetry_events, 0);
}

TEST_F(MaintenanceTest, BulkDeleteDocumentsCascades) {
    populate();
    Maintenance m(*db_);
    EXPECT_EQ(m.bulk_delete(BulkScope::Documents), 2);

    auto s = m.stats();
    EXPECT_EQ(s.documents, 0);
    EXPECT_EQ(s.interactions, 0);
    EXPECT_EQ(s.cache_entries, 2);
    EXPECT_EQ(s.searches, 1);
    EXPECT_EQ(s.telemetry_events, 1);
}

TEST_F(MaintenanceTest, BulkDeleteSingleScopes) {
    populate();
    Maintenance m(*db_);
    EXPECT_EQ(m.bulk_delete(BulkScope::Cache), 2);
    EXPECT_EQ(m.bulk_delete(BulkScope::Searches), 1);
    EXPECT_EQ(m.bulk_delete(BulkScope::Telemetry), 1);
    auto s = m.stats();
    EXPECT_EQ(s.documents, 1);
    EXPECT_EQ(s.interactions, 1);
    EXPECT_EQ(m.bulk_delete(BulkScope::Cache), 0);
}

TEST_F(MaintenanceTest, ScopeNamesRoundTrip) {
    for (auto scope : {BulkScope::Cache, BulkScope::Documents, BulkScope::Searches,
                       BulkScope::Telemetry, BulkScope::Everything}) {
        EXPECT_EQ(parse_scope(to_string(scope)), scope);
    }
    EXPECT_THROW(parse_scope("all"), MalformedInputError);
}

TEST_F(MaintenanceTest, FullCleanupSweepsAndPurges) {
    populate();
    clock_.advance(std::chrono::hours(24 * 91));
    TelemetryLog(*db_).log_event("recent");

    auto report = Maintenance(*db_).full_cleanup();
    // both cache rows are past their expiry by now
    EXPECT_EQ(report.expired_cache_removed, 2);
    EXPECT_EQ(report.telemetry_removed, 1);

    auto s = Maintenance(*db_).stats();
    EXPECT_EQ(s.cache_entries, 0);
    EXPECT_EQ(s.telemetry_events, 1);
    EXPECT_EQ(s.documents, 1);
}

TEST_F(MaintenanceTest, CompactKeepsData) {
    populate();
    Maintenance m(*db_);
    m.bulk_delete(BulkScope::Telemetry);
    m.compact();
    EXPECT_EQ(m.stats().documents, 1);
}

TEST_F(MaintenanceTest, BackupIsAUsableCopy) {
    populate();
    auto dest = unique_temp_path("market_store_backup");
    Maintenance(*db_).backup(dest);
    ASSERT_TRUE(std::filesystem::exists(dest));

    {
        StoreConfig cfg;
        cfg.db_path = dest.string();
        cfg.clock = clock_.fn();
        Database copy(cfg);
        auto s = Maintenance(copy).stats();
        EXPECT_EQ(s.documents, 1);
        EXPECT_EQ(s.interactions, 1);
        EXPECT_TRUE(AnalysisCache(copy).get("EV Batteries", "global").has_value());
    }
    remove_store_files(dest);
}
