#pragma once
// SQLite: owning handles for connection, statement and transaction
//
// Every failure throws bridge::Error(ErrorKind::Storage) carrying
// sqlite3_errmsg. Transaction rolls back in its destructor unless
// commit() ran, so an exception anywhere inside an operation leaves the
// file untouched.

#include "error.hpp"
#include <cstdint>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace bridge {
namespace sqlite {

class Database {
public:
    Database(const std::string& path, int busy_timeout_ms);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void exec(const std::string& sql);

    int64_t last_insert_rowid() const;
    int changes() const;
    std::string errmsg() const;

    int user_version();
    void set_user_version(int version);

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

class Statement {
public:
    Statement(Database& db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(int idx, const std::string& value);
    void bind_int64(int idx, int64_t value);
    void bind_null(int idx);

    // true while rows remain, false once done
    bool step();
    void reset();

    std::string column_text(int col) const;
    int64_t column_int64(int col) const;
    std::optional<int64_t> column_optional_int64(int col) const;

private:
    Database& db_;
    sqlite3_stmt* stmt_ = nullptr;
};

class Transaction {
public:
    explicit Transaction(Database& db, bool immediate = true);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool done_ = false;
};

} // namespace sqlite
} // namespace bridge
