#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct CachedResult {
    std::string payload;
    int64_t created_at{0};
    std::optional<int64_t> expires_at;
    std::string source;
};

struct SubjectPopularity {
    std::string subject;
    int64_t count{0};
    int64_t last_access{0};
};

struct CacheHistoryRow {
    std::string subject;
    std::string query_kind;
    int64_t created_at{0};
    int64_t access_count{0};
};

struct DocumentRecord {
    int64_t id{0};
    std::string display_name;
    std::string content_hash;
    int64_t byte_size{0};
    int page_count{0};
    int chunk_count{0};
    std::vector<std::string> chunk_handles; // ordered, opaque
    int64_t processed_at{0};
    std::string status{"processed"};
};

struct ChunkRange {
    std::string handle;
    int start_page{0};
    int end_page{0};
};

struct InteractionRecord {
    int64_t id{0};
    int64_t document_id{0};
    std::string question;
    std::string answer;
    int64_t query_tokens{0};
    int64_t response_tokens{0};
    double cost_estimate{0.0};
    int64_t created_at{0};
};

struct DocumentSummary {
    DocumentRecord record;
    int64_t interaction_count{0};
    std::optional<int64_t> last_question_at;
};

struct DocumentSession {
    DocumentRecord record;
    std::vector<ChunkRange> chunks;
    std::vector<InteractionRecord> interactions; // oldest first, for replay
};

struct SearchRecord {
    int64_t id{0};
    std::string subject;
    std::string timeframe;
    std::string payload;
    int64_t deals_found{0};
    int64_t created_at{0};
};

struct TelemetryEvent {
    int64_t id{0};
    std::string event_kind;
    std::optional<std::string> event_payload; // JSON text, shape not enforced
    std::string session_token;
    int64_t created_at{0};
};

struct DailyCount {
    std::string date; // YYYY-MM-DD, UTC
    int64_t count{0};
};

struct KindCount {
    std::string kind;
    int64_t count{0};
};

struct StoreStats {
    int64_t cache_entries{0};
    int64_t documents{0};
    int64_t interactions{0};
    int64_t searches{0};
    int64_t telemetry_events{0};
    int64_t store_bytes{0};
};
