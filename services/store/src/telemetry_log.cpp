#include "../include/telemetry_log.hpp"

TelemetryLog::TelemetryLog(const Database& db) : db_(db) {}

int64_t TelemetryLog::log_event(const std::string& event_kind,
                                const std::optional<nlohmann::json>& payload,
                                const std::string& session_token) {
    std::optional<std::string> body;
    if (payload && !payload->is_null()) body = payload->dump();
    std::optional<std::string> session;
    if (!session_token.empty()) session = session_token;

    Connection conn = db_.connect();
    auto st = conn.prepare(R"SQL(
      INSERT INTO telemetry_events (event_kind, event_payload, session_token, created_at)
      VALUES (?,?,?,?)
    )SQL");
    st.bind(1, event_kind).bind(2, body).bind(3, session).bind(4, db_.now());
    st.run();
    return conn.last_insert_id();
}

std::vector<TelemetryEvent> TelemetryLog::recent(int limit) const {
    Connection conn = db_.connect();
    auto st = conn.prepare(R"SQL(
      SELECT id, event_kind, event_payload, session_token, created_at
      FROM telemetry_events
      ORDER BY created_at DESC, id DESC
      LIMIT ?
    )SQL");
    st.bind(1, limit);
    std::vector<TelemetryEvent> out;
    while (st.step()) {
        TelemetryEvent e;
        e.id = st.column_int64(0);
        e.event_kind = st.column_text(1);
        e.event_payload = st.column_optional_text(2);
        e.session_token = st.column_text(3);
        e.created_at = st.column_int64(4);
        out.push_back(std::move(e));
    }
    return out;
}

std::vector<DailyCount> TelemetryLog::daily_counts(std::chrono::seconds window, int limit) const {
    Connection conn = db_.connect();
    auto st = conn.prepare(R"SQL(
      SELECT date(created_at, 'unixepoch') AS day, COUNT(*)
      FROM telemetry_events
      WHERE created_at > ?
      GROUP BY day
      ORDER BY day DESC
      LIMIT ?
    )SQL");
    st.bind(1, db_.now() - window.count()).bind(2, limit);
    std::vector<DailyCount> out;
    while (st.step()) out.push_back({st.column_text(0), st.column_int64(1)});
    return out;
}

std::vector<KindCount> TelemetryLog::kind_counts(std::chrono::seconds window) const {
    Connection conn = db_.connect();
    auto st = conn.prepare(R"SQL(
      SELECT event_kind, COUNT(*) AS n
      FROM telemetry_events
      WHERE created_at > ?
      GROUP BY event_kind
      ORDER BY n DESC, event_kind ASC
    )SQL");
    st.bind(1, db_.now() - window.count());
    std::vector<KindCount> out;
    while (st.step()) out.push_back({st.column_text(0), st.column_int64(1)});
    return out;
}

int64_t TelemetryLog::count_since(std::chrono::seconds window) const {
    Connection conn = db_.connect();
    auto st = conn.prepare("SELECT COUNT(*) FROM telemetry_events WHERE created_at > ?");
    st.bind(1, db_.now() - window.count());
    st.step();
    return st.column_int64(0);
}

int64_t TelemetryLog::purge_older_than(std::chrono::seconds age) {
    Connection conn = db_.connect();
    auto st = conn.prepare("DELETE FROM telemetry_events WHERE created_at < ?");
    st.bind(1, db_.now() - age.count());
    st.run();
    return conn.changes();
}
