#include "../include/db.hpp"
#include "../include/errors.hpp"
#include <sqlite3.h>
#include <chrono>
#include <filesystem>

namespace {
[[noreturn]] void throw_sqlite(sqlite3* db, int rc, const std::string& what) {
    std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    if ((rc & 0xff) == SQLITE_CONSTRAINT) throw ConstraintViolationError(msg);
    throw StorageUnavailableError(msg);
}
}

int64_t system_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

// ---------- Statement ----------

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &st_, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(st_);
        st_ = nullptr;
        throw_sqlite(db_, rc, "prepare failed");
    }
}

Statement::~Statement() {
    if (st_) sqlite3_finalize(st_);
}

Statement::Statement(Statement&& other) noexcept : db_(other.db_), st_(other.st_) {
    other.st_ = nullptr;
}

Statement& Statement::bind(int idx, const std::string& v) {
    sqlite3_bind_text(st_, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int idx, const char* v) {
    sqlite3_bind_text(st_, idx, v, -1, SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int idx, int v) {
    sqlite3_bind_int(st_, idx, v);
    return *this;
}

Statement& Statement::bind(int idx, int64_t v) {
    sqlite3_bind_int64(st_, idx, v);
    return *this;
}

Statement& Statement::bind(int idx, double v) {
    sqlite3_bind_double(st_, idx, v);
    return *this;
}

Statement& Statement::bind(int idx, const std::optional<int64_t>& v) {
    return v ? bind(idx, *v) : bind_null(idx);
}

Statement& Statement::bind(int idx, const std::optional<std::string>& v) {
    return v ? bind(idx, *v) : bind_null(idx);
}

Statement& Statement::bind_null(int idx) {
    sqlite3_bind_null(st_, idx);
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite(db_, rc, "step failed");
}

void Statement::run() {
    while (step()) {
    }
}

std::string Statement::column_text(int col) const {
    const unsigned char* p = sqlite3_column_text(st_, col);
    if (!p) return {};
    return std::string(reinterpret_cast<const char*>(p), sqlite3_column_bytes(st_, col));
}

int64_t Statement::column_int64(int col) const {
    return sqlite3_column_int64(st_, col);
}

double Statement::column_double(int col) const {
    return sqlite3_column_double(st_, col);
}

bool Statement::column_is_null(int col) const {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
}

std::optional<int64_t> Statement::column_optional_int64(int col) const {
    if (column_is_null(col)) return std::nullopt;
    return column_int64(col);
}

std::optional<std::string> Statement::column_optional_text(int col) const {
    if (column_is_null(col)) return std::nullopt;
    return column_text(col);
}

// ---------- Connection ----------

Connection::Connection(const StoreConfig& cfg) {
    int rc = sqlite3_open_v2(cfg.db_path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = "failed to open store " + cfg.db_path + ": " +
                          (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageUnavailableError(msg);
    }
    try {
        sqlite3_busy_timeout(db_, cfg.busy_timeout_ms);
        exec("PRAGMA foreign_keys=ON;");
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

Connection::~Connection() {
    if (db_) sqlite3_close(db_);
}

Connection::Connection(Connection&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

void Connection::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        if ((rc & 0xff) == SQLITE_CONSTRAINT) throw ConstraintViolationError("SQLite exec failed: " + msg);
        throw StorageUnavailableError("SQLite exec failed: " + msg);
    }
}

Statement Connection::prepare(const std::string& sql) {
    return Statement(db_, sql);
}

int64_t Connection::last_insert_id() const {
    return sqlite3_last_insert_rowid(db_);
}

int64_t Connection::changes() const {
    return sqlite3_changes(db_);
}

// ---------- Transaction ----------

Transaction::Transaction(Connection& conn) : conn_(conn) {
    conn_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (done_) return;
    try {
        conn_.exec("ROLLBACK;");
    } catch (const StoreError&) {
        // the connection is closed right after; sqlite rolls back on close
    }
}

void Transaction::commit() {
    conn_.exec("COMMIT;");
    done_ = true;
}

// ---------- Database ----------

Database::Database(StoreConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.clock) cfg_.clock = system_now;
    std::filesystem::path parent = std::filesystem::path(cfg_.db_path).parent_path();
    std::error_code ec;
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    if (ec) throw StorageUnavailableError("cannot create directory " + parent.string() + ": " + ec.message());

    Connection conn = connect();
    conn.exec("PRAGMA journal_mode=WAL;");
    conn.exec("PRAGMA synchronous=NORMAL;");
    ensure_schema(conn);
}

Connection Database::connect() const {
    return Connection(cfg_);
}
