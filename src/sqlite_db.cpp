#include "sqlite_db.hpp"
#include "errors.hpp"
#include <filesystem>

namespace engram {

sqlite3* open_database(const std::string& path, uint32_t busy_timeout_ms) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StorageError("cannot create directory " + parent.string() +
                               ": " + ec.message());
        }
    }

    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string err = db ? sqlite3_errmsg(db) : "unknown error";
        if (db) sqlite3_close(db);
        throw StorageError("failed to open database " + path + ": " + err);
    }

    sqlite3_busy_timeout(db, static_cast<int>(busy_timeout_ms));

    // Performance pragmas; WAL lets readers proceed while a writer appends
    sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);
    return db;
}

void exec_sql(sqlite3* db, const char* sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string err = errmsg ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        if (is_contention(rc)) throw ConcurrencyConflict("database busy: " + err);
        throw StorageError("sql failed: " + err);
    }
}

void prepare(sqlite3* db, const char* sql, StmtGuard& g) {
    int rc = sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr);
    if (rc != SQLITE_OK) throw_sqlite(db, rc, "prepare");
}

void throw_sqlite(sqlite3* db, int rc, const std::string& what) {
    std::string msg = what + ": " + sqlite3_errmsg(db);
    if (is_contention(rc)) throw ConcurrencyConflict(msg);
    throw StorageError(msg);
}

bool is_contention(int rc) {
    int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* v = sqlite3_column_text(stmt, col);
    if (!v) return {};
    return std::string(reinterpret_cast<const char*>(v),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_text(stmt, col);
}

std::optional<uint64_t> column_optional_u64(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return static_cast<uint64_t>(sqlite3_column_int64(stmt, col));
}

nlohmann::json column_json(sqlite3_stmt* stmt, int col) {
    auto parsed = nlohmann::json::parse(column_text(stmt, col), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return nlohmann::json::object();
    return parsed;
}

std::string metadata_text(const nlohmann::json& metadata) {
    if (metadata.is_null()) return "{}";
    if (!metadata.is_object()) {
        throw ValidationError("metadata must be a JSON object");
    }
    return metadata.dump();
}

void bind_text(sqlite3_stmt* stmt, int col, const std::string& value) {
    sqlite3_bind_text(stmt, col, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* stmt, int col, const std::optional<std::string>& value) {
    if (value) {
        bind_text(stmt, col, *value);
    } else {
        sqlite3_bind_null(stmt, col);
    }
}

void bind_optional_u64(sqlite3_stmt* stmt, int col, std::optional<uint64_t> value) {
    if (value) {
        sqlite3_bind_int64(stmt, col, static_cast<int64_t>(*value));
    } else {
        sqlite3_bind_null(stmt, col);
    }
}

Transaction::Transaction(sqlite3* db) : db_(db) {
    exec_sql(db_, "BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (!done_) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}

void Transaction::commit() {
    exec_sql(db_, "COMMIT;");
    done_ = true;
}

} // namespace engram
