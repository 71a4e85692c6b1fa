#include <bridge/sqlite.hpp>
#include <bridge/log.hpp>
#include <sqlite3.h>

namespace bridge {
namespace sqlite {

static Error storage_error(const std::string& what, sqlite3* db) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    return Error(ErrorKind::Storage, what + ": " + msg);
}

// ═══════════════════════════════════════════════════════════════════
// Database
// ═══════════════════════════════════════════════════════════════════

Database::Database(const std::string& path, int busy_timeout_ms) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        Error err = storage_error("Failed to open SQLite DB " + path, db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw err;
    }
    sqlite3_busy_timeout(db_, busy_timeout_ms);
    sqlite3_extended_result_codes(db_, 1);
}

Database::~Database() {
    if (db_) sqlite3_close(db_);
}

void Database::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw Error(ErrorKind::Storage, "SQLite error: " + msg);
    }
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::errmsg() const {
    return sqlite3_errmsg(db_);
}

int Database::user_version() {
    Statement st(*this, "PRAGMA user_version;");
    return st.step() ? static_cast<int>(st.column_int64(0)) : 0;
}

void Database::set_user_version(int version) {
    exec("PRAGMA user_version = " + std::to_string(version) + ";");
}

// ═══════════════════════════════════════════════════════════════════
// Statement
// ═══════════════════════════════════════════════════════════════════

Statement::Statement(Database& db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_.handle(), sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        throw storage_error("prepare failed", db_.handle());
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::bind_text(int idx, const std::string& value) {
    if (sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw storage_error("bind failed", db_.handle());
    }
}

void Statement::bind_int64(int idx, int64_t value) {
    if (sqlite3_bind_int64(stmt_, idx, value) != SQLITE_OK) {
        throw storage_error("bind failed", db_.handle());
    }
}

void Statement::bind_null(int idx) {
    if (sqlite3_bind_null(stmt_, idx) != SQLITE_OK) {
        throw storage_error("bind failed", db_.handle());
    }
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw storage_error("step failed", db_.handle());
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string Statement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

int64_t Statement::column_int64(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

std::optional<int64_t> Statement::column_optional_int64(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(stmt_, col);
}

// ═══════════════════════════════════════════════════════════════════
// Transaction
// ═══════════════════════════════════════════════════════════════════

Transaction::Transaction(Database& db, bool immediate) : db_(db) {
    // IMMEDIATE takes the write lock up front so read-check-write
    // sequences can't interleave with another process
    db_.exec(immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
}

Transaction::~Transaction() {
    if (done_) return;
    char* err = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        log_error("sqlite", "rollback failed: %s", err ? err : "unknown");
        sqlite3_free(err);
    }
}

void Transaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

} // namespace sqlite
} // namespace bridge
