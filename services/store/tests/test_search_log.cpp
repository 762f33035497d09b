// =============================================================================
// Search History Log Tests
// =============================================================================

#include "test_support.hpp"
#include "../include/search_log.hpp"

using namespace std::chrono_literals;

class SearchLogTest : public StoreTest {};

TEST_F(SearchLogTest, RepeatedSearchesAreAllKept) {
    SearchLog log(*db_);
    int64_t a = log.append("Fintech", "last 12 months", "| deal | value |", 4);
    int64_t b = log.append("Fintech", "last 12 months", "| deal | value |", 4);
    EXPECT_NE(a, b);
    EXPECT_EQ(log.recent(10).size(), 2u);
}

TEST_F(SearchLogTest, RecentIsNewestFirstAndLimited) {
    SearchLog log(*db_);
    log.append("A", "2023", "", 1);
    clock_.advance(1min);
    log.append("B", "2024", "", 2);
    clock_.advance(1min);
    log.append("C", "2025", "table", 3);

    auto rows = log.recent(2);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].subject, "C");
    EXPECT_EQ(rows[0].payload, "table");
    EXPECT_EQ(rows[0].deals_found, 3);
    EXPECT_EQ(rows[0].created_at, clock_.now());
    EXPECT_EQ(rows[1].subject, "B");
}

TEST_F(SearchLogTest, BySubjectSupportsTrendQueries) {
    SearchLog log(*db_);
    log.append("Fintech", "2023", "", 2);
    clock_.advance(1h);
    log.append("Biotech", "2023", "", 9);
    clock_.advance(1h);
    log.append("Fintech", "2024", "", 5);

    auto rows = log.by_subject("Fintech", 10);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].deals_found, 5);
    EXPECT_EQ(rows[1].deals_found, 2);
}

TEST_F(SearchLogTest, PurgeOlderThanCountsDeletedRows) {
    SearchLog log(*db_);
    log.append("Old", "2020", "", 0);
    log.append("Old", "2021", "", 0);
    clock_.advance(std::chrono::hours(24 * 31));
    log.append("New", "2024", "", 0);

    EXPECT_EQ(log.purge_older_than(std::chrono::hours(24 * 30)), 2);
    auto rows = log.recent(10);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].subject, "New");
    EXPECT_EQ(log.purge_older_than(std::chrono::hours(24 * 30)), 0);
}

TEST_F(SearchLogTest, RemoveSingleSearch) {
    SearchLog log(*db_);
    int64_t id = log.append("Fintech", "2024", "", 1);
    EXPECT_TRUE(log.remove(id));
    EXPECT_FALSE(log.remove(id));
    EXPECT_TRUE(log.recent(10).empty());
}
