#include "../include/analysis_cache.hpp"

AnalysisCache::AnalysisCache(const Database& db) : db_(db) {}

std::optional<CachedResult> AnalysisCache::get(const std::string& subject,
                                               const std::string& query_kind,
                                               const Params& params) const {
    const std::string fp = fingerprint(subject, query_kind, params);
    Connection conn = db_.connect();
    auto st = conn.prepare(R"SQL(
      SELECT payload, created_at, expires_at, source
      FROM cache_entries
      WHERE fingerprint = ? AND (expires_at IS NULL OR expires_at > ?)
    )SQL");
    st.bind(1, fp).bind(2, db_.now());
    if (!st.step()) return std::nullopt;
    CachedResult r;
    r.payload = st.column_text(0);
    r.created_at = st.column_int64(1);
    r.expires_at = st.column_optional_int64(2);
    r.source = st.column_text(3);
    return r;
}

void AnalysisCache::put(const std::string& subject,
                        const std::string& query_kind,
                        const Params& params,
                        const std::string& payload,
                        const std::string& source,
                        std::optional<std::chrono::seconds> ttl) {
    const std::string fp = fingerprint(subject, query_kind, params);
    const int64_t now = db_.now();
    std::optional<int64_t> expires_at;
    if (ttl) expires_at = now + ttl->count();

    Connection conn = db_.connect();
    auto st = conn.prepare(R"SQL(
      INSERT INTO cache_entries
        (subject, query_kind, fingerprint, payload, created_at, expires_at, source)
      VALUES (?,?,?,?,?,?,?)
      ON CONFLICT(fingerprint) DO UPDATE SET
        subject = excluded.subject,
        query_kind = excluded.query_kind,
        payload = excluded.payload,
        created_at = excluded.created_at,
        expires_at = excluded.expires_at,
        source = excluded.source
    )SQL");
    int i = 1;
    st.bind(i++, subject);
    st.bind(i++, query_kind);
    st.bind(i++, fp);
    st.bind(i++, payload);
    st.bind(i++, now);
    st.bind(i++, expires_at);
    st.bind(i++, source);
    st.run();
}

int64_t AnalysisCache::sweep_expired() {
    Connection conn = db_.connect();
    auto st = conn.prepare("DELETE FROM cache_entries WHERE expires_at IS NOT NULL AND expires_at <= ?");
    st.bind(1, db_.now());
    st.run();
    return conn.changes();
}

std::vector<SubjectPopularity> AnalysisCache::popular(std::chrono::seconds window, int limit) const {
    const int64_t now = db_.now();
    Connection conn = db_.connect();
    auto st = conn.prepare(R"SQL(
      SELECT subject, COUNT(*) AS query_count, MAX(created_at) AS last_access
      FROM cache_entries
      WHERE created_at > ? AND (expires_at IS NULL OR expires_at > ?)
      GROUP BY subject
      ORDER BY query_count DESC, last_access DESC, subject ASC
      LIMIT ?
    )SQL");
    st.bind(1, now - window.count()).bind(2, now).bind(3, limit);
    std::vector<SubjectPopularity> out;
    while (st.step()) {
        out.push_back({st.column_text(0), st.column_int64(1), st.column_int64(2)});
    }
    return out;
}

std::vector<CacheHistoryRow> AnalysisCache::history(int limit) const {
    Connection conn = db_.connect();
    auto st = conn.prepare(R"SQL(
      SELECT subject, query_kind, created_at,
             COUNT(*) OVER (PARTITION BY subject, query_kind) AS access_count
      FROM cache_entries
      WHERE expires_at IS NULL OR expires_at > ?
      ORDER BY created_at DESC, id DESC
      LIMIT ?
    )SQL");
    st.bind(1, db_.now()).bind(2, limit);
    std::vector<CacheHistoryRow> out;
    while (st.step()) {
        out.push_back({st.column_text(0), st.column_text(1), st.column_int64(2), st.column_int64(3)});
    }
    return out;
}

int64_t AnalysisCache::remove_subject(const std::string& subject) {
    Connection conn = db_.connect();
    auto st = conn.prepare("DELETE FROM cache_entries WHERE subject = ?");
    st.bind(1, subject);
    st.run();
    return conn.changes();
}

int64_t AnalysisCache::remove_entry(const std::string& subject, const std::string& query_kind) {
    Connection conn = db_.connect();
    auto st = conn.prepare("DELETE FROM cache_entries WHERE subject = ? AND query_kind = ?");
    st.bind(1, subject).bind(2, query_kind);
    st.run();
    return conn.changes();
}

int64_t AnalysisCache::stale_count(std::chrono::seconds age) const {
    Connection conn = db_.connect();
    auto st = conn.prepare("SELECT COUNT(*) FROM cache_entries WHERE created_at < ?");
    st.bind(1, db_.now() - age.count());
    st.step();
    return st.column_int64(0);
}
