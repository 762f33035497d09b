#include "../include/ingestion.hpp"
#include "../include/errors.hpp"
#include "../include/hashing.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

IngestResult ingest_document(DocumentStore& documents,
                             TelemetryLog& telemetry,
                             const std::string& display_name,
                             const std::string& content_bytes,
                             const ChunkUploader& upload,
                             const std::string& session_token) {
    IngestResult res;
    if (auto existing = documents.find_by_content(content_hash(content_bytes))) {
        res.document_id = existing->id;
        res.chunks = reconstruct_chunk_ranges(*existing);
        res.reused = true;
        return res;
    }

    res.chunks = upload(content_bytes);
    if (res.chunks.empty()) throw MalformedInputError("upload of " + display_name + " produced no chunks");

    int total_pages = 0;
    std::vector<std::string> handles;
    handles.reserve(res.chunks.size());
    for (const auto& c : res.chunks) {
        total_pages = std::max(total_pages, c.end_page);
        handles.push_back(c.handle);
    }
    res.document_id = documents.record(display_name, content_bytes, total_pages, handles);

    json event = {
        {"file_name", display_name},
        {"file_size", content_bytes.size()},
        {"total_pages", total_pages},
        {"chunks_count", res.chunks.size()}
    };
    telemetry.log_event("pdf_upload", event, session_token);
    return res;
}
