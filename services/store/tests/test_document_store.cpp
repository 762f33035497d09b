// =============================================================================
// Document Dedup Store Tests
// =============================================================================

#include "test_support.hpp"
#include "../include/document_store.hpp"
#include "../include/errors.hpp"
#include "../include/hashing.hpp"
#include "../include/ingestion.hpp"
#include "../include/interaction_log.hpp"
#include "../include/telemetry_log.hpp"

using namespace std::chrono_literals;

namespace {
const std::string kPdfBytes = std::string("%PDF-1.7\n") + std::string(4096, 'x') + "%%EOF";

DocumentRecord make_record(int pages, const std::vector<std::string>& handles) {
    DocumentRecord r;
    r.page_count = pages;
    r.chunk_count = static_cast<int>(handles.size());
    r.chunk_handles = handles;
    return r;
}
}

class DocumentStoreTest : public StoreTest {};

TEST_F(DocumentStoreTest, RecordStoresDerivedFields) {
    DocumentStore docs(*db_);
    int64_t id = docs.record("report.pdf", kPdfBytes, 120, {"file-a", "file-b", "file-c"});

    auto rec = docs.get(id);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->display_name, "report.pdf");
    EXPECT_EQ(rec->content_hash, content_hash(kPdfBytes));
    EXPECT_EQ(rec->byte_size, static_cast<int64_t>(kPdfBytes.size()));
    EXPECT_EQ(rec->page_count, 120);
    EXPECT_EQ(rec->chunk_count, 3);
    EXPECT_EQ(rec->chunk_handles, (std::vector<std::string>{"file-a", "file-b", "file-c"}));
    EXPECT_EQ(rec->processed_at, clock_.now());
    EXPECT_EQ(rec->status, "processed");
}

// Same bytes under another name resolve to the original record
TEST_F(DocumentStoreTest, FindByContentIgnoresDisplayName) {
    DocumentStore docs(*db_);
    int64_t id = docs.record("report.pdf", kPdfBytes, 120, {"file-a", "file-b"});

    auto found = docs.find_by_content(content_hash(kPdfBytes));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, id);
    EXPECT_EQ(found->page_count, 120);
    EXPECT_EQ(found->chunk_count, 2);

    EXPECT_FALSE(docs.find_by_content(content_hash("other bytes")).has_value());
}

TEST_F(DocumentStoreTest, RecordDoesNotDeduplicate) {
    DocumentStore docs(*db_);
    int64_t first = docs.record("a.pdf", kPdfBytes, 10, {"h1"});
    clock_.advance(1min);
    int64_t second = docs.record("b.pdf", kPdfBytes, 10, {"h2"});
    EXPECT_NE(first, second);

    // newest processed record is authoritative
    auto found = docs.find_by_content(content_hash(kPdfBytes));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, second);
    EXPECT_EQ(found->chunk_handles, std::vector<std::string>{"h2"});
}

TEST_F(DocumentStoreTest, FindByContentSkipsUnprocessed) {
    DocumentStore docs(*db_);
    int64_t first = docs.record("a.pdf", kPdfBytes, 10, {"h1"});
    clock_.advance(1min);
    int64_t second = docs.record("a.pdf", kPdfBytes, 10, {"h2"});
    docs.set_status(second, "failed");

    auto found = docs.find_by_content(content_hash(kPdfBytes));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, first);

    docs.set_status(first, "archived");
    EXPECT_FALSE(docs.find_by_content(content_hash(kPdfBytes)).has_value());
}

TEST_F(DocumentStoreTest, SetStatusOnMissingDocumentThrows) {
    DocumentStore docs(*db_);
    EXPECT_THROW(docs.set_status(42, "failed"), NotFoundError);
}

TEST_F(DocumentStoreTest, EvenChunkRangesCoverAllPages) {
    auto ranges = reconstruct_chunk_ranges(make_record(120, {"a", "b", "c", "d"}));
    ASSERT_EQ(ranges.size(), 4u);
    int expected_start = 1;
    for (const auto& r : ranges) {
        EXPECT_EQ(r.start_page, expected_start);
        EXPECT_EQ(r.end_page - r.start_page + 1, 30);
        expected_start = r.end_page + 1;
    }
    EXPECT_EQ(ranges.back().end_page, 120);
    EXPECT_EQ(ranges[2].handle, "c");
}

// Uneven splits lose the tail pages; the reconstruction is only approximate
TEST_F(DocumentStoreTest, UnevenChunkRangesAreApproximate) {
    auto ranges = reconstruct_chunk_ranges(make_record(10, {"a", "b", "c"}));
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0].start_page, 1);
    EXPECT_EQ(ranges[0].end_page, 3);
    EXPECT_EQ(ranges[1].start_page, 4);
    EXPECT_EQ(ranges[1].end_page, 6);
    EXPECT_EQ(ranges[2].start_page, 7);
    EXPECT_EQ(ranges[2].end_page, 9);
}

TEST_F(DocumentStoreTest, FewerPagesThanChunks) {
    auto ranges = reconstruct_chunk_ranges(make_record(2, {"a", "b", "c"}));
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0].start_page, 1);
    EXPECT_EQ(ranges[0].end_page, 1);
    EXPECT_EQ(ranges[1].start_page, 2);
    EXPECT_EQ(ranges[1].end_page, 2);
    EXPECT_EQ(ranges[2].start_page, 2);
    EXPECT_EQ(ranges[2].end_page, 2);
}

TEST_F(DocumentStoreTest, SessionsSummarizeInteractions) {
    DocumentStore docs(*db_);
    InteractionLog log(*db_);
    int64_t a = docs.record("a.pdf", "aaa", 10, {"h1"});
    clock_.advance(1min);
    int64_t b = docs.record("b.pdf", "bbb", 20, {"h2", "h3"});
    log.append(a, "q1", "a1", 5, 3);
    clock_.advance(1min);
    log.append(a, "q2", "a2", 5, 3);

    auto sessions = docs.sessions(10);
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0].record.id, b);
    EXPECT_EQ(sessions[0].interaction_count, 0);
    EXPECT_FALSE(sessions[0].last_question_at.has_value());
    EXPECT_EQ(sessions[1].record.id, a);
    EXPECT_EQ(sessions[1].interaction_count, 2);
    ASSERT_TRUE(sessions[1].last_question_at.has_value());
    EXPECT_EQ(*sessions[1].last_question_at, clock_.now());
}

TEST_F(DocumentStoreTest, RestoreReplaysInOriginalOrder) {
    DocumentStore docs(*db_);
    InteractionLog log(*db_);
    int64_t id = docs.record("a.pdf", kPdfBytes, 100, {"h1", "h2"});
    log.append(id, "first", "1", 1, 1);
    clock_.advance(1s);
    log.append(id, "second", "2", 1, 1);

    auto s = docs.restore(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->record.id, id);
    ASSERT_EQ(s->chunks.size(), 2u);
    EXPECT_EQ(s->chunks[1].start_page, 51);
    EXPECT_EQ(s->chunks[1].end_page, 100);
    ASSERT_EQ(s->interactions.size(), 2u);
    EXPECT_EQ(s->interactions[0].question, "first");
    EXPECT_EQ(s->interactions[1].question, "second");

    EXPECT_FALSE(docs.restore(id + 100).has_value());
}

TEST_F(DocumentStoreTest, RemoveCascadesToInteractions) {
    DocumentStore docs(*db_);
    InteractionLog log(*db_);
    int64_t keep = docs.record("keep.pdf", "keep", 10, {"h"});
    int64_t gone = docs.record("gone.pdf", "gone", 10, {"h"});
    log.append(keep, "q", "a", 1, 1);
    log.append(gone, "q1", "a", 1, 1);
    log.append(gone, "q2", "a", 1, 1);

    EXPECT_EQ(docs.remove(gone), 2);
    EXPECT_FALSE(docs.get(gone).has_value());
    EXPECT_TRUE(log.history(gone, HistoryOrder::NewestFirst).empty());
    EXPECT_EQ(log.history(keep, HistoryOrder::NewestFirst).size(), 1u);

    EXPECT_THROW(docs.remove(gone), NotFoundError);
}

// =============================================================================
// Ingestion (dedup decision on the caller side)
// =============================================================================

TEST_F(DocumentStoreTest, IngestTwiceReusesFirstRecord) {
    DocumentStore docs(*db_);
    TelemetryLog telemetry(*db_);
    int uploads = 0;
    ChunkUploader upload = [&](const std::string&) {
        ++uploads;
        return std::vector<ChunkRange>{{"file-1", 1, 25}, {"file-2", 26, 50}};
    };

    auto first = ingest_document(docs, telemetry, "deck.pdf", kPdfBytes, upload, "session-1");
    EXPECT_FALSE(first.reused);
    EXPECT_EQ(uploads, 1);

    auto second = ingest_document(docs, telemetry, "deck-copy.pdf", kPdfBytes, upload, "session-1");
    EXPECT_TRUE(second.reused);
    EXPECT_EQ(uploads, 1);
    EXPECT_EQ(second.document_id, first.document_id);
    ASSERT_EQ(second.chunks.size(), 2u);
    EXPECT_EQ(second.chunks[0].handle, "file-1");
    EXPECT_EQ(second.chunks[1].start_page, 26);
    EXPECT_EQ(second.chunks[1].end_page, 50);

    auto rec = docs.get(first.document_id);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->page_count, 50);

    auto events = telemetry.recent(10);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_kind, "pdf_upload");
    EXPECT_EQ(events[0].session_token, "session-1");
}

TEST_F(DocumentStoreTest, IngestRejectsEmptyUpload) {
    DocumentStore docs(*db_);
    TelemetryLog telemetry(*db_);
    ChunkUploader upload = [](const std::string&) { return std::vector<ChunkRange>{}; };
    EXPECT_THROW(ingest_document(docs, telemetry, "empty.pdf", "bytes", upload), MalformedInputError);
    EXPECT_TRUE(docs.sessions(10).empty());
}
