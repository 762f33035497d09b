#include "../include/document_store.hpp"
#include "../include/errors.hpp"
#include "../include/hashing.hpp"
#include "../include/interaction_log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

namespace {
// Used when a record carries no chunks.
constexpr int kFallbackPagesPerChunk = 50;

const char* kDocumentColumns =
    "id, display_name, content_hash, byte_size, page_count, chunk_count, chunk_handles, processed_at, status";

std::vector<std::string> parse_handles(const std::string& text, int64_t id) {
    std::vector<std::string> out;
    try {
        auto arr = json::parse(text);
        for (auto& v : arr) out.push_back(v.get<std::string>());
    } catch (const json::exception& e) {
        throw MalformedInputError("document " + std::to_string(id) + " has unreadable chunk handles: " + e.what());
    }
    return out;
}

DocumentRecord read_document(const Statement& st) {
    DocumentRecord r;
    r.id = st.column_int64(0);
    r.display_name = st.column_text(1);
    r.content_hash = st.column_text(2);
    r.byte_size = st.column_int64(3);
    r.page_count = static_cast<int>(st.column_int64(4));
    r.chunk_count = static_cast<int>(st.column_int64(5));
    r.chunk_handles = parse_handles(st.column_text(6), r.id);
    r.processed_at = st.column_int64(7);
    r.status = st.column_text(8);
    return r;
}

std::optional<DocumentRecord> load_document(Connection& conn, int64_t id, bool processed_only) {
    std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE id = ?";
    if (processed_only) sql += " AND status = 'processed'";
    auto st = conn.prepare(sql);
    st.bind(1, id);
    if (!st.step()) return std::nullopt;
    return read_document(st);
}
}

DocumentStore::DocumentStore(const Database& db) : db_(db) {}

std::optional<DocumentRecord> DocumentStore::find_by_content(const std::string& hash) const {
    Connection conn = db_.connect();
    auto st = conn.prepare(std::string("SELECT ") + kDocumentColumns + R"SQL(
      FROM documents
      WHERE content_hash = ? AND status = 'processed'
      ORDER BY processed_at DESC, id DESC
      LIMIT 1
    )SQL");
    st.bind(1, hash);
    if (!st.step()) return std::nullopt;
    return read_document(st);
}

int64_t DocumentStore::record(const std::string& display_name,
                              const std::string& content_bytes,
                              int page_count,
                              const std::vector<std::string>& chunk_handles) {
    if (page_count < 0) throw MalformedInputError("page_count must not be negative");
    const std::string hash = content_hash(content_bytes);
    const std::string handles = json(chunk_handles).dump();

    Connection conn = db_.connect();
    auto st = conn.prepare(R"SQL(
      INSERT INTO documents
        (display_name, content_hash, byte_size, page_count, chunk_count, chunk_handles, processed_at, status)
      VALUES (?,?,?,?,?,?,?,'processed')
    )SQL");
    int i = 1;
    st.bind(i++, display_name);
    st.bind(i++, hash);
    st.bind(i++, static_cast<int64_t>(content_bytes.size()));
    st.bind(i++, page_count);
    st.bind(i++, static_cast<int64_t>(chunk_handles.size()));
    st.bind(i++, handles);
    st.bind(i++, db_.now());
    st.run();
    return conn.last_insert_id();
}

std::optional<DocumentRecord> DocumentStore::get(int64_t id) const {
    Connection conn = db_.connect();
    return load_document(conn, id, false);
}

void DocumentStore::set_status(int64_t id, const std::string& status) {
    Connection conn = db_.connect();
    auto st = conn.prepare("UPDATE documents SET status = ? WHERE id = ?");
    st.bind(1, status).bind(2, id);
    st.run();
    if (conn.changes() == 0) throw NotFoundError("document " + std::to_string(id) + " does not exist");
}

std::vector<DocumentSummary> DocumentStore::sessions(int limit) const {
    Connection conn = db_.connect();
    auto st = conn.prepare(R"SQL(
      SELECT d.id, d.display_name, d.content_hash, d.byte_size, d.page_count, d.chunk_count,
             d.chunk_handles, d.processed_at, d.status,
             COUNT(i.id) AS interaction_count,
             MAX(i.created_at) AS last_question
      FROM documents d
      LEFT JOIN interactions i ON d.id = i.document_id
      WHERE d.status = 'processed'
      GROUP BY d.id
      ORDER BY d.processed_at DESC, d.id DESC
      LIMIT ?
    )SQL");
    st.bind(1, limit);
    std::vector<DocumentSummary> out;
    while (st.step()) {
        DocumentSummary s;
        s.record = read_document(st);
        s.interaction_count = st.column_int64(9);
        s.last_question_at = st.column_optional_int64(10);
        out.push_back(std::move(s));
    }
    return out;
}

std::optional<DocumentSession> DocumentStore::restore(int64_t id) const {
    Connection conn = db_.connect();
    // A read transaction keeps the record and its interactions consistent.
    conn.exec("BEGIN;");
    auto doc = load_document(conn, id, true);
    std::optional<DocumentSession> out;
    if (doc) {
        DocumentSession s;
        s.interactions = load_interactions(conn, id, HistoryOrder::OldestFirst);
        s.chunks = reconstruct_chunk_ranges(*doc);
        s.record = std::move(*doc);
        out = std::move(s);
    }
    conn.exec("COMMIT;");
    return out;
}

int64_t DocumentStore::remove(int64_t id) {
    Connection conn = db_.connect();
    Transaction tx(conn);
    int64_t removed = delete_interactions(conn, id);
    auto st = conn.prepare("DELETE FROM documents WHERE id = ?");
    st.bind(1, id);
    st.run();
    if (conn.changes() == 0) throw NotFoundError("document " + std::to_string(id) + " does not exist");
    tx.commit();
    return removed;
}

std::vector<ChunkRange> reconstruct_chunk_ranges(const DocumentRecord& record) {
    std::vector<ChunkRange> out;
    const int chunks = record.chunk_count;
    const int pages = record.page_count;
    int ppc = chunks > 0 ? pages / chunks : kFallbackPagesPerChunk;
    // Fewer pages than chunks: give each chunk one page rather than empty ranges.
    ppc = std::max(ppc, 1);
    out.reserve(record.chunk_handles.size());
    for (std::size_t i = 0; i < record.chunk_handles.size(); ++i) {
        int idx = static_cast<int>(i);
        ChunkRange r;
        r.handle = record.chunk_handles[i];
        r.start_page = std::min(idx * ppc + 1, std::max(pages, 1));
        r.end_page = std::max(std::min((idx + 1) * ppc, pages), r.start_page);
        out.push_back(std::move(r));
    }
    return out;
}
