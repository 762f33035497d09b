#include "../include/search_log.hpp"

namespace {
std::vector<SearchRecord> read_searches(Statement& st) {
    std::vector<SearchRecord> out;
    while (st.step()) {
        SearchRecord r;
        r.id = st.column_int64(0);
        r.subject = st.column_text(1);
        r.timeframe = st.column_text(2);
        r.payload = st.column_text(3);
        r.deals_found = st.column_int64(4);
        r.created_at = st.column_int64(5);
        out.push_back(std::move(r));
    }
    return out;
}
}

SearchLog::SearchLog(const Database& db) : db_(db) {}

int64_t SearchLog::append(const std::string& subject,
                          const std::string& timeframe,
                          const std::string& payload,
                          int64_t deals_found) {
    Connection conn = db_.connect();
    auto st = conn.prepare(R"SQL(
      INSERT INTO searches (subject, timeframe, payload, deals_found, created_at)
      VALUES (?,?,?,?,?)
    )SQL");
    st.bind(1, subject).bind(2, timeframe).bind(3, payload).bind(4, deals_found).bind(5, db_.now());
    st.run();
    return conn.last_insert_id();
}

std::vector<SearchRecord> SearchLog::recent(int limit) const {
    Connection conn = db_.connect();
    auto st = conn.prepare(R"SQL(
      SELECT id, subject, timeframe, payload, deals_found, created_at
      FROM searches
      ORDER BY created_at DESC, id DESC
      LIMIT ?
    )SQL");
    st.bind(1, limit);
    return read_searches(st);
}

std::vector<SearchRecord> SearchLog::by_subject(const std::string& subject, int limit) const {
    Connection conn = db_.connect();
    auto st = conn.prepare(R"SQL(
      SELECT id, subject, timeframe, payload, deals_found, created_at
      FROM searches
      WHERE subject = ?
      ORDER BY created_at DESC, id DESC
      LIMIT ?
    )SQL");
    st.bind(1, subject).bind(2, limit);
    return read_searches(st);
}

bool SearchLog::remove(int64_t id) {
    Connection conn = db_.connect();
    auto st = conn.prepare("DELETE FROM searches WHERE id = ?");
    st.bind(1, id);
    st.run();
    return conn.changes() > 0;
}

int64_t SearchLog::purge_older_than(std::chrono::seconds age) {
    Connection conn = db_.connect();
    auto st = conn.prepare("DELETE FROM searches WHERE created_at < ?");
    st.bind(1, db_.now() - age.count());
    st.run();
    return conn.changes();
}
