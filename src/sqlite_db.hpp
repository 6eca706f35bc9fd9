#pragma once
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <string>

namespace engram {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// Open (creating parent directories) and configure a database connection.
// Throws StorageError on failure.
sqlite3* open_database(const std::string& path, uint32_t busy_timeout_ms);

// Execute one or more statements, throwing StorageError on failure.
void exec_sql(sqlite3* db, const char* sql);

// Prepare `sql` into `g`, throwing StorageError on failure.
void prepare(sqlite3* db, const char* sql, StmtGuard& g);

// Throw StorageError carrying sqlite3_errmsg, or ConcurrencyConflict when
// the code indicates a busy/locked database.
void throw_sqlite(sqlite3* db, int rc, const std::string& what);

// SQLITE_BUSY / SQLITE_LOCKED: another connection holds the write lock.
bool is_contention(int rc);

// Column / bind helpers for nullable text and integer columns
std::string column_text(sqlite3_stmt* stmt, int col);
std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col);
std::optional<uint64_t> column_optional_u64(sqlite3_stmt* stmt, int col);
// Metadata bags: JSON text in, object out. Unparseable or non-object text
// reads back as an empty object.
nlohmann::json column_json(sqlite3_stmt* stmt, int col);
std::string metadata_text(const nlohmann::json& metadata);

void bind_text(sqlite3_stmt* stmt, int col, const std::string& value);
void bind_optional_text(sqlite3_stmt* stmt, int col, const std::optional<std::string>& value);
void bind_optional_u64(sqlite3_stmt* stmt, int col, std::optional<uint64_t> value);

// Write transaction taken with BEGIN IMMEDIATE so the write lock is held
// from the first read. Rolls back on destruction unless committed.
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    sqlite3* db_;
    bool done_ = false;
};

} // namespace engram
