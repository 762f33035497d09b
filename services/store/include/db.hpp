#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

// Unix seconds. Injectable so tests can move time without sleeping.
using Clock = std::function<int64_t()>;
int64_t system_now();

struct StoreConfig {
    std::string db_path{"./data/market_intel.db"};
    int busy_timeout_ms{5000};
    // Cost per 1000 tokens, applied once when an interaction is written.
    double rate_in{0.01};
    double rate_out{0.03};
    Clock clock{system_now};
};

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();
    Statement(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement& operator=(Statement&&) = delete;

    Statement& bind(int idx, const std::string& v);
    Statement& bind(int idx, const char* v);
    Statement& bind(int idx, int v);
    Statement& bind(int idx, int64_t v);
    Statement& bind(int idx, double v);
    Statement& bind(int idx, const std::optional<int64_t>& v);
    Statement& bind(int idx, const std::optional<std::string>& v);
    Statement& bind_null(int idx);

    // true while a row is available, false once done.
    bool step();
    // Executes a statement that returns no rows.
    void run();

    std::string column_text(int col) const;
    int64_t column_int64(int col) const;
    double column_double(int col) const;
    bool column_is_null(int col) const;
    std::optional<int64_t> column_optional_int64(int col) const;
    std::optional<std::string> column_optional_text(int col) const;

private:
    sqlite3* db_{nullptr};
    sqlite3_stmt* st_{nullptr};
};

class Connection {
public:
    explicit Connection(const StoreConfig& cfg);
    ~Connection();
    Connection(Connection&& other) noexcept;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection& operator=(Connection&&) = delete;

    void exec(const std::string& sql);
    Statement prepare(const std::string& sql);
    int64_t last_insert_id() const;
    int64_t changes() const;

private:
    sqlite3* db_{nullptr};
};

// BEGIN IMMEDIATE on construction; rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(Connection& conn);
    ~Transaction();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Connection& conn_;
    bool done_{false};
};

// Owns the location of the on-disk store. Every operation opens its own
// short-lived Connection; there is no shared in-process state.
class Database {
public:
    explicit Database(StoreConfig cfg);

    Connection connect() const;
    int64_t now() const { return cfg_.clock(); }
    const StoreConfig& config() const { return cfg_; }
    const std::string& path() const { return cfg_.db_path; }

private:
    StoreConfig cfg_;
};

// Creates tables and indexes if missing. Safe to call repeatedly.
void ensure_schema(Connection& conn);
