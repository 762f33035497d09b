#include "../include/interaction_log.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"

InteractionLog::InteractionLog(const Database& db) : db_(db) {}

double estimate_cost(int64_t query_tokens, int64_t response_tokens, double rate_in, double rate_out) {
    return (static_cast<double>(query_tokens) * rate_in + static_cast<double>(response_tokens) * rate_out) / 1000.0;
}

int64_t estimate_tokens(const std::string& text) {
    return static_cast<int64_t>(static_cast<double>(count_words(text)) * 1.3);
}

int64_t InteractionLog::append(int64_t document_id,
                               const std::string& question,
                               const std::string& answer,
                               int64_t query_tokens,
                               int64_t response_tokens) {
    const auto& cfg = db_.config();
    const double cost = estimate_cost(query_tokens, response_tokens, cfg.rate_in, cfg.rate_out);

    Connection conn = db_.connect();
    Transaction tx(conn);
    {
        auto check = conn.prepare("SELECT 1 FROM documents WHERE id = ?");
        check.bind(1, document_id);
        if (!check.step()) {
            throw NotFoundError("document " + std::to_string(document_id) + " does not exist");
        }
    }
    auto st = conn.prepare(R"SQL(
      INSERT INTO interactions
        (document_id, question, answer, query_tokens, response_tokens, cost_estimate, created_at)
      VALUES (?,?,?,?,?,?,?)
    )SQL");
    int i = 1;
    st.bind(i++, document_id);
    st.bind(i++, question);
    st.bind(i++, answer);
    st.bind(i++, query_tokens);
    st.bind(i++, response_tokens);
    st.bind(i++, cost);
    st.bind(i++, db_.now());
    st.run();
    int64_t id = conn.last_insert_id();
    tx.commit();
    return id;
}

std::vector<InteractionRecord> load_interactions(Connection& conn, int64_t document_id, HistoryOrder order) {
    std::string sql = R"SQL(
      SELECT id, document_id, question, answer, query_tokens, response_tokens, cost_estimate, created_at
      FROM interactions
      WHERE document_id = ?
    )SQL";
    sql += order == HistoryOrder::NewestFirst ? " ORDER BY created_at DESC, id DESC"
                                              : " ORDER BY created_at ASC, id ASC";
    auto st = conn.prepare(sql);
    st.bind(1, document_id);
    std::vector<InteractionRecord> out;
    while (st.step()) {
        InteractionRecord r;
        r.id = st.column_int64(0);
        r.document_id = st.column_int64(1);
        r.question = st.column_text(2);
        r.answer = st.column_text(3);
        r.query_tokens = st.column_int64(4);
        r.response_tokens = st.column_int64(5);
        r.cost_estimate = st.column_double(6);
        r.created_at = st.column_int64(7);
        out.push_back(std::move(r));
    }
    return out;
}

int64_t delete_interactions(Connection& conn, int64_t document_id) {
    auto st = conn.prepare("DELETE FROM interactions WHERE document_id = ?");
    st.bind(1, document_id);
    st.run();
    return conn.changes();
}

std::vector<InteractionRecord> InteractionLog::history(int64_t document_id, HistoryOrder order) const {
    Connection conn = db_.connect();
    return load_interactions(conn, document_id, order);
}

int64_t InteractionLog::delete_one(int64_t document_id, const std::string& question_text) {
    Connection conn = db_.connect();
    Transaction tx(conn);
    auto st = conn.prepare("DELETE FROM interactions WHERE document_id = ? AND question = ?");
    st.bind(1, document_id).bind(2, question_text);
    st.run();
    int64_t n = conn.changes();
    tx.commit();
    return n;
}

int64_t InteractionLog::delete_all(int64_t document_id) {
    Connection conn = db_.connect();
    Transaction tx(conn);
    int64_t n = delete_interactions(conn, document_id);
    tx.commit();
    return n;
}
