#pragma once
#include "db.hpp"
#include "records.hpp"
#include <string>
#include <vector>

enum class HistoryOrder {
    NewestFirst, // display
    OldestFirst  // replaying a session in its original order
};

// Question/answer pairs asked against a document.
class InteractionLog {
public:
    explicit InteractionLog(const Database& db);

    // Throws NotFoundError when document_id does not reference a document.
    int64_t append(int64_t document_id,
                   const std::string& question,
                   const std::string& answer,
                   int64_t query_tokens,
                   int64_t response_tokens);

    std::vector<InteractionRecord> history(int64_t document_id, HistoryOrder order) const;

    int64_t delete_one(int64_t document_id, const std::string& question_text);
    int64_t delete_all(int64_t document_id);

private:
    const Database& db_;
};

double estimate_cost(int64_t query_tokens, int64_t response_tokens, double rate_in, double rate_out);

// Rough estimate (words * 1.3) for callers without a tokenizer.
int64_t estimate_tokens(const std::string& text);

// Connection-level helpers so cascades can share the caller's transaction.
std::vector<InteractionRecord> load_interactions(Connection& conn, int64_t document_id, HistoryOrder order);
int64_t delete_interactions(Connection& conn, int64_t document_id);
