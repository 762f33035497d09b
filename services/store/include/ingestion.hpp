#pragma once
#include "document_store.hpp"
#include "telemetry_log.hpp"
#include <functional>
#include <string>
#include <vector>

// Output of the external chunk/upload pipeline for one document.
using ChunkUploader = std::function<std::vector<ChunkRange>(const std::string& content_bytes)>;

struct IngestResult {
    int64_t document_id{0};
    std::vector<ChunkRange> chunks;
    bool reused{false};
};

// Checks the dedup store first; on a hit the chunk ranges are reconstructed
// and the uploader is never called. On a miss the document is uploaded,
// recorded, and a "pdf_upload" telemetry event is written.
IngestResult ingest_document(DocumentStore& documents,
                             TelemetryLog& telemetry,
                             const std::string& display_name,
                             const std::string& content_bytes,
                             const ChunkUploader& upload,
                             const std::string& session_token = {});
