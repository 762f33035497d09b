#pragma once
#include "db.hpp"
#include "records.hpp"
#include <optional>
#include <string>
#include <vector>

// Content-addressed record of ingested documents and their externally stored
// chunk handles. Deduplication is the caller's decision: record() never looks
// for an existing hash, so two concurrent ingestions of the same bytes may
// both insert a row.
class DocumentStore {
public:
    explicit DocumentStore(const Database& db);

    // Most recently processed record with this hash and status "processed".
    std::optional<DocumentRecord> find_by_content(const std::string& content_hash) const;

    int64_t record(const std::string& display_name,
                   const std::string& content_bytes,
                   int page_count,
                   const std::vector<std::string>& chunk_handles);

    std::optional<DocumentRecord> get(int64_t id) const;
    void set_status(int64_t id, const std::string& status);

    // Processed documents newest first, with interaction counts.
    std::vector<DocumentSummary> sessions(int limit) const;

    // Record, chunk ranges and interactions (oldest first) read in one snapshot.
    std::optional<DocumentSession> restore(int64_t id) const;

    // Deletes the document and its interactions in one transaction.
    // Returns the number of interactions removed.
    int64_t remove(int64_t id);

private:
    const Database& db_;
};

// Pages per chunk = page_count / chunk_count, chunk i covering
// [i*ppc + 1, min((i+1)*ppc, page_count)]. Assumes the original split was
// even, which is not guaranteed. Degenerate records are clamped: ppc is at
// least 1, starts never pass page_count, and every range has end >= start,
// so fewer pages than chunks yields one-page ranges instead of [n, n-1].
std::vector<ChunkRange> reconstruct_chunk_ranges(const DocumentRecord& record);
