#include "sqlite_memory_store.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../sqlite_db.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

static engram::MemoryStoreRegistrar reg_sqlite_memory("sqlite",
    [](const engram::Config& config) {
        return std::make_unique<engram::SqliteMemoryStore>(
            config.memory_db_path(), config.store.busy_timeout_ms);
    });

namespace engram {

static constexpr const char* kLongTermColumns =
    "memory_id, user_id, session_id, key, value, memory_type, importance,"
    " created_at, updated_at, accessed_at, access_count, expires_at, metadata";

static constexpr const char* kShortTermColumns =
    "memory_id, session_id, key, value, memory_type, created_at, expires_at, metadata";

// A row is live while expires_at is unset or not yet passed.
static constexpr const char* kLiveClause = "(expires_at IS NULL OR expires_at >= ?)";

SqliteMemoryStore::SqliteMemoryStore(const std::string& path,
                                     uint32_t busy_timeout_ms,
                                     Clock& clock)
    : path_(path), clock_(clock) {
    db_ = open_database(path_, busy_timeout_ms);
    try {
        init_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteMemoryStore::~SqliteMemoryStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteMemoryStore::init_schema() {
    exec_sql(db_,
        "CREATE TABLE IF NOT EXISTS long_term_memory ("
        "  memory_id    TEXT PRIMARY KEY,"
        "  user_id      TEXT NOT NULL,"
        "  session_id   TEXT,"
        "  key          TEXT NOT NULL,"
        "  value        TEXT NOT NULL,"
        "  memory_type  TEXT NOT NULL,"
        "  importance   REAL NOT NULL,"
        "  created_at   INTEGER NOT NULL,"
        "  updated_at   INTEGER NOT NULL,"
        "  accessed_at  INTEGER NOT NULL,"
        "  access_count INTEGER NOT NULL DEFAULT 0,"
        "  expires_at   INTEGER,"
        "  metadata     TEXT NOT NULL DEFAULT '{}'"
        ");");

    exec_sql(db_,
        "CREATE TABLE IF NOT EXISTS short_term_memory ("
        "  memory_id   TEXT PRIMARY KEY,"
        "  session_id  TEXT NOT NULL,"
        "  key         TEXT NOT NULL,"
        "  value       TEXT NOT NULL,"
        "  memory_type TEXT NOT NULL,"
        "  created_at  INTEGER NOT NULL,"
        "  expires_at  INTEGER,"
        "  metadata    TEXT NOT NULL DEFAULT '{}'"
        ");");

    // Pairs are stored with memory_id_1 < memory_id_2
    exec_sql(db_,
        "CREATE TABLE IF NOT EXISTS memory_associations ("
        "  memory_id_1      TEXT NOT NULL,"
        "  memory_id_2      TEXT NOT NULL,"
        "  association_type TEXT NOT NULL,"
        "  strength         REAL NOT NULL,"
        "  created_at       INTEGER NOT NULL,"
        "  UNIQUE (memory_id_1, memory_id_2, association_type)"
        ");");

    exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_ltm_user ON long_term_memory(user_id);");
    exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_stm_session ON short_term_memory(session_id);");
    exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_stm_expires ON short_term_memory(expires_at);");
    exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_assoc_2 ON memory_associations(memory_id_2);");
}

// Helper: read a LongTermMemory from a statement selecting kLongTermColumns.
static LongTermMemory long_term_from_stmt(sqlite3_stmt* stmt) {
    LongTermMemory m;
    m.memory_id    = column_text(stmt, 0);
    m.user_id      = column_text(stmt, 1);
    m.session_id   = column_optional_text(stmt, 2);
    m.key          = column_text(stmt, 3);
    m.value        = column_text(stmt, 4);
    m.memory_type  = long_term_type_from_string(column_text(stmt, 5));
    m.importance   = sqlite3_column_double(stmt, 6);
    m.created_at   = static_cast<uint64_t>(sqlite3_column_int64(stmt, 7));
    m.updated_at   = static_cast<uint64_t>(sqlite3_column_int64(stmt, 8));
    m.accessed_at  = static_cast<uint64_t>(sqlite3_column_int64(stmt, 9));
    m.access_count = static_cast<uint32_t>(sqlite3_column_int64(stmt, 10));
    m.expires_at   = column_optional_u64(stmt, 11);
    m.metadata     = column_json(stmt, 12);
    return m;
}

// Helper: read a ShortTermMemory from a statement selecting kShortTermColumns.
static ShortTermMemory short_term_from_stmt(sqlite3_stmt* stmt) {
    ShortTermMemory m;
    m.memory_id   = column_text(stmt, 0);
    m.session_id  = column_text(stmt, 1);
    m.key         = column_text(stmt, 2);
    m.value       = column_text(stmt, 3);
    m.memory_type = short_term_type_from_string(column_text(stmt, 4));
    m.created_at  = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
    m.expires_at  = column_optional_u64(stmt, 6);
    m.metadata    = column_json(stmt, 7);
    return m;
}

static uint32_t count_rows(sqlite3* db, const std::string& sql,
                           const std::string& id, uint64_t now) {
    StmtGuard g;
    prepare(db, sql.c_str(), g);
    bind_text(g.stmt, 1, id);
    sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(now));
    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_ROW) throw_sqlite(db, rc, "count");
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

std::optional<LongTermMemory> SqliteMemoryStore::find_long_term(const std::string& memory_id) {
    std::string sql = std::string("SELECT ") + kLongTermColumns +
                      " FROM long_term_memory WHERE memory_id = ?;";
    StmtGuard g;
    prepare(db_, sql.c_str(), g);
    bind_text(g.stmt, 1, memory_id);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return long_term_from_stmt(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "find_long_term");
    return std::nullopt;
}

std::optional<ShortTermMemory> SqliteMemoryStore::find_short_term(const std::string& memory_id) {
    std::string sql = std::string("SELECT ") + kShortTermColumns +
                      " FROM short_term_memory WHERE memory_id = ?;";
    StmtGuard g;
    prepare(db_, sql.c_str(), g);
    bind_text(g.stmt, 1, memory_id);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return short_term_from_stmt(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "find_short_term");
    return std::nullopt;
}

bool SqliteMemoryStore::memory_exists(const std::string& memory_id) {
    StmtGuard g;
    prepare(db_,
        "SELECT 1 FROM long_term_memory WHERE memory_id = ?1"
        " UNION ALL SELECT 1 FROM short_term_memory WHERE memory_id = ?1 LIMIT 1;", g);
    bind_text(g.stmt, 1, memory_id);
    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "memory_exists");
    return false;
}

std::string SqliteMemoryStore::store_long_term(const std::string& user_id,
                                               const std::optional<std::string>& session_id,
                                               const std::string& key,
                                               const std::string& value,
                                               LongTermType type,
                                               double importance,
                                               std::optional<double> ttl_hours,
                                               const nlohmann::json& metadata) {
    if (user_id.empty()) throw ValidationError("long-term memory needs a user_id");
    if (key.empty()) throw ValidationError("memory key must not be empty");
    if (ttl_hours && !(*ttl_hours > 0.0 && std::isfinite(*ttl_hours))) {
        throw ValidationError("ttl_hours must be positive");
    }
    double clamped = clamp_importance(importance);
    std::string meta = metadata_text(metadata);

    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = clock_.now_ms();
    std::optional<uint64_t> expires_at;
    if (ttl_hours) expires_at = expiry_after_hours(now, *ttl_hours);

    std::string id = generate_id();

    StmtGuard g;
    std::string sql = std::string("INSERT INTO long_term_memory (") + kLongTermColumns +
                      ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 0, ?, ?);";
    prepare(db_, sql.c_str(), g);
    bind_text(g.stmt, 1, id);
    bind_text(g.stmt, 2, user_id);
    bind_optional_text(g.stmt, 3, session_id);
    bind_text(g.stmt, 4, key);
    bind_text(g.stmt, 5, value);
    bind_text(g.stmt, 6, long_term_type_to_string(type));
    sqlite3_bind_double(g.stmt, 7, clamped);
    sqlite3_bind_int64(g.stmt, 8, static_cast<int64_t>(now));
    sqlite3_bind_int64(g.stmt, 9, static_cast<int64_t>(now));
    sqlite3_bind_int64(g.stmt, 10, static_cast<int64_t>(now));
    bind_optional_u64(g.stmt, 11, expires_at);
    bind_text(g.stmt, 12, meta);

    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "store_long_term");
    return id;
}

std::string SqliteMemoryStore::store_short_term(const std::string& session_id,
                                                const std::string& key,
                                                const std::string& value,
                                                ShortTermType type,
                                                double ttl_hours,
                                                const nlohmann::json& metadata) {
    if (session_id.empty()) throw ValidationError("short-term memory needs a session_id");
    if (key.empty()) throw ValidationError("memory key must not be empty");
    if (!(ttl_hours > 0.0 && std::isfinite(ttl_hours))) {
        throw ValidationError("ttl_hours must be positive");
    }
    std::string meta = metadata_text(metadata);

    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = clock_.now_ms();
    std::string id = generate_id();

    StmtGuard g;
    std::string sql = std::string("INSERT INTO short_term_memory (") + kShortTermColumns +
                      ") VALUES (?, ?, ?, ?, ?, ?, ?, ?);";
    prepare(db_, sql.c_str(), g);
    bind_text(g.stmt, 1, id);
    bind_text(g.stmt, 2, session_id);
    bind_text(g.stmt, 3, key);
    bind_text(g.stmt, 4, value);
    bind_text(g.stmt, 5, short_term_type_to_string(type));
    sqlite3_bind_int64(g.stmt, 6, static_cast<int64_t>(now));
    sqlite3_bind_int64(g.stmt, 7, static_cast<int64_t>(expiry_after_hours(now, ttl_hours)));
    bind_text(g.stmt, 8, meta);

    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "store_short_term");
    return id;
}

std::vector<LongTermMemory> SqliteMemoryStore::retrieve_long_term(const std::string& user_id,
                                                                  uint32_t top_k) {
    if (top_k == 0) return {};

    std::lock_guard<std::mutex> lock(mutex_);

    // Select and touch under one write lock so the counts handed back are
    // exactly what was committed.
    Transaction tx(db_);
    uint64_t now = clock_.now_ms();

    std::vector<LongTermMemory> results;
    {
        std::string sql = std::string("SELECT ") + kLongTermColumns +
                          " FROM long_term_memory WHERE user_id = ? AND " + kLiveClause +
                          " ORDER BY importance DESC, accessed_at DESC, rowid DESC LIMIT ?;";
        StmtGuard g;
        prepare(db_, sql.c_str(), g);
        bind_text(g.stmt, 1, user_id);
        sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(now));
        sqlite3_bind_int64(g.stmt, 3, static_cast<int64_t>(top_k));

        int rc = sqlite3_step(g.stmt);
        while (rc == SQLITE_ROW) {
            results.push_back(long_term_from_stmt(g.stmt));
            rc = sqlite3_step(g.stmt);
        }
        if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "retrieve_long_term");
    }

    StmtGuard upd;
    prepare(db_,
        "UPDATE long_term_memory SET accessed_at = ?, access_count = access_count + 1"
        " WHERE memory_id = ?;", upd);
    for (auto& m : results) {
        sqlite3_reset(upd.stmt);
        sqlite3_bind_int64(upd.stmt, 1, static_cast<int64_t>(now));
        bind_text(upd.stmt, 2, m.memory_id);
        int rc = sqlite3_step(upd.stmt);
        if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "retrieve_long_term: touch");
        m.accessed_at = now;
        m.access_count += 1;
    }

    tx.commit();
    return results;
}

std::vector<ShortTermMemory> SqliteMemoryStore::retrieve_short_term(const std::string& session_id,
                                                                    uint32_t top_n) {
    if (top_n == 0) return {};

    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT ") + kShortTermColumns +
                      " FROM short_term_memory WHERE session_id = ? AND " + kLiveClause +
                      " ORDER BY created_at DESC, rowid DESC LIMIT ?;";
    StmtGuard g;
    prepare(db_, sql.c_str(), g);
    bind_text(g.stmt, 1, session_id);
    sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(clock_.now_ms()));
    sqlite3_bind_int64(g.stmt, 3, static_cast<int64_t>(top_n));

    std::vector<ShortTermMemory> results;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        results.push_back(short_term_from_stmt(g.stmt));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "retrieve_short_term");
    return results;
}

void SqliteMemoryStore::associate(const std::string& memory_id_1,
                                  const std::string& memory_id_2,
                                  const std::string& association_type,
                                  double strength) {
    if (memory_id_1.empty() || memory_id_2.empty()) {
        throw ValidationError("association endpoints must not be empty");
    }
    if (memory_id_1 == memory_id_2) {
        throw ValidationError("a memory cannot be associated with itself");
    }
    if (association_type.empty()) {
        throw ValidationError("association_type must not be empty");
    }
    if (!std::isfinite(strength) || strength < 0.0 || strength > 1.0) {
        throw ValidationError("strength must be within [0, 1]");
    }

    // Unordered pair: (a, b) and (b, a) are the same association
    const std::string& low = std::min(memory_id_1, memory_id_2);
    const std::string& high = std::max(memory_id_1, memory_id_2);

    std::lock_guard<std::mutex> lock(mutex_);

    Transaction tx(db_);

    if (!memory_exists(memory_id_1)) throw NotFoundError("memory not found: " + memory_id_1);
    if (!memory_exists(memory_id_2)) throw NotFoundError("memory not found: " + memory_id_2);

    StmtGuard g;
    prepare(db_,
        "INSERT INTO memory_associations"
        " (memory_id_1, memory_id_2, association_type, strength, created_at)"
        " VALUES (?, ?, ?, ?, ?)"
        " ON CONFLICT (memory_id_1, memory_id_2, association_type)"
        " DO UPDATE SET strength = excluded.strength, created_at = excluded.created_at;", g);
    bind_text(g.stmt, 1, low);
    bind_text(g.stmt, 2, high);
    bind_text(g.stmt, 3, association_type);
    sqlite3_bind_double(g.stmt, 4, strength);
    sqlite3_bind_int64(g.stmt, 5, static_cast<int64_t>(clock_.now_ms()));
    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "associate");

    tx.commit();
}

uint32_t SqliteMemoryStore::purge_expired_short_term() {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t cutoff = clock_.now_ms();

    StmtGuard g;
    prepare(db_,
        "DELETE FROM short_term_memory WHERE expires_at IS NOT NULL AND expires_at < ?;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<int64_t>(cutoff));
    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "purge_expired_short_term");

    auto purged = static_cast<uint32_t>(sqlite3_changes(db_));
    if (purged > 0) {
        std::cerr << "[memory_store] Purged " << purged << " expired short-term memories\n";
    }
    return purged;
}

std::vector<RelatedMemory> SqliteMemoryStore::associated_memories(
    const std::string& memory_id,
    const std::optional<std::string>& association_type,
    double min_strength) {

    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql =
        "SELECT memory_id_1, memory_id_2, association_type, strength, created_at"
        " FROM memory_associations"
        " WHERE (memory_id_1 = ?1 OR memory_id_2 = ?1) AND strength >= ?2";
    if (association_type) sql += " AND association_type = ?3";
    sql += " ORDER BY strength DESC, rowid DESC;";

    std::vector<MemoryAssociation> links;
    {
        StmtGuard g;
        prepare(db_, sql.c_str(), g);
        bind_text(g.stmt, 1, memory_id);
        sqlite3_bind_double(g.stmt, 2, min_strength);
        if (association_type) bind_text(g.stmt, 3, *association_type);

        int rc = sqlite3_step(g.stmt);
        while (rc == SQLITE_ROW) {
            MemoryAssociation a;
            a.memory_id_1 = column_text(g.stmt, 0);
            a.memory_id_2 = column_text(g.stmt, 1);
            a.association_type = column_text(g.stmt, 2);
            a.strength = sqlite3_column_double(g.stmt, 3);
            a.created_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 4));
            links.push_back(std::move(a));
            rc = sqlite3_step(g.stmt);
        }
        if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "associated_memories");
    }

    uint64_t now = clock_.now_ms();
    std::vector<RelatedMemory> results;
    for (auto& link : links) {
        const std::string& other =
            link.memory_id_1 == memory_id ? link.memory_id_2 : link.memory_id_1;

        RelatedMemory related;
        if (auto ltm = find_long_term(other)) {
            if (is_expired(ltm->expires_at, now)) continue;
            related.long_term = std::move(*ltm);
        } else if (auto stm = find_short_term(other)) {
            if (is_expired(stm->expires_at, now)) continue;
            related.short_term = std::move(*stm);
        } else {
            continue; // dangling endpoint
        }
        related.association = std::move(link);
        results.push_back(std::move(related));
    }
    return results;
}

void SqliteMemoryStore::update_importance(const std::string& memory_id, double importance) {
    double clamped = clamp_importance(importance);

    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_,
        "UPDATE long_term_memory SET importance = ?, updated_at = MAX(updated_at, ?)"
        " WHERE memory_id = ?;", g);
    sqlite3_bind_double(g.stmt, 1, clamped);
    sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(clock_.now_ms()));
    bind_text(g.stmt, 3, memory_id);
    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "update_importance");

    if (sqlite3_changes(db_) == 0) {
        throw NotFoundError("long-term memory not found: " + memory_id);
    }
}

std::optional<LongTermMemory> SqliteMemoryStore::get_long_term(const std::string& memory_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_long_term(memory_id);
}

uint32_t SqliteMemoryStore::count_long_term(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_rows(db_,
        std::string("SELECT COUNT(*) FROM long_term_memory WHERE user_id = ? AND ") +
            kLiveClause + ";",
        user_id, clock_.now_ms());
}

uint32_t SqliteMemoryStore::count_short_term(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_rows(db_,
        std::string("SELECT COUNT(*) FROM short_term_memory WHERE session_id = ? AND ") +
            kLiveClause + ";",
        session_id, clock_.now_ms());
}

} // namespace engram
