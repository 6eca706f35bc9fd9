#include "sqlite_session_store.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../sqlite_db.hpp"
#include "../util.hpp"
#include <iostream>

static engram::SessionStoreRegistrar reg_sqlite_sessions("sqlite",
    [](const engram::Config& config) {
        return std::make_unique<engram::SqliteSessionStore>(
            config.sessions_db_path(), config.store.busy_timeout_ms);
    });

namespace engram {

static constexpr const char* kSessionColumns =
    "session_id, user_id, agent_name, created_at, updated_at, status, metadata";

SqliteSessionStore::SqliteSessionStore(const std::string& path,
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

SqliteSessionStore::~SqliteSessionStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteSessionStore::init_schema() {
    exec_sql(db_,
        "CREATE TABLE IF NOT EXISTS users ("
        "  user_id    TEXT PRIMARY KEY,"
        "  created_at INTEGER NOT NULL,"
        "  metadata   TEXT NOT NULL DEFAULT '{}'"
        ");");

    exec_sql(db_,
        "CREATE TABLE IF NOT EXISTS sessions ("
        "  session_id TEXT PRIMARY KEY,"
        "  user_id    TEXT,"
        "  agent_name TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL,"
        "  status     TEXT NOT NULL DEFAULT 'active',"
        "  metadata   TEXT NOT NULL DEFAULT '{}'"
        ");");

    // Turn numbers are unique per session; a lost numbering race surfaces
    // as a constraint error on insert.
    exec_sql(db_,
        "CREATE TABLE IF NOT EXISTS conversation_turns ("
        "  session_id  TEXT NOT NULL,"
        "  turn_number INTEGER NOT NULL,"
        "  role        TEXT NOT NULL,"
        "  content     TEXT NOT NULL,"
        "  timestamp   INTEGER NOT NULL,"
        "  metadata    TEXT NOT NULL DEFAULT '{}',"
        "  PRIMARY KEY (session_id, turn_number)"
        ");");

    exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_sessions_user_id ON sessions(user_id);");
    exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_sessions_status ON sessions(status);");
}

// Helper: read a Session from a statement selecting kSessionColumns.
static Session session_from_stmt(sqlite3_stmt* stmt) {
    Session s;
    s.session_id = column_text(stmt, 0);
    s.user_id    = column_optional_text(stmt, 1);
    s.agent_name = column_text(stmt, 2);
    s.created_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
    s.updated_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
    s.status     = status_from_string(column_text(stmt, 5));
    s.metadata   = column_json(stmt, 6);
    return s;
}

// Helper: columns session_id, turn_number, role, content, timestamp, metadata.
static ConversationTurn turn_from_stmt(sqlite3_stmt* stmt) {
    ConversationTurn t;
    t.session_id  = column_text(stmt, 0);
    t.turn_number = static_cast<uint32_t>(sqlite3_column_int64(stmt, 1));
    t.role        = role_from_string(column_text(stmt, 2));
    t.content     = column_text(stmt, 3);
    t.timestamp   = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
    t.metadata    = column_json(stmt, 5);
    return t;
}

std::optional<Session> SqliteSessionStore::find_session(const std::string& session_id) {
    std::string sql = std::string("SELECT ") + kSessionColumns +
                      " FROM sessions WHERE session_id = ?;";
    StmtGuard g;
    prepare(db_, sql.c_str(), g);
    bind_text(g.stmt, 1, session_id);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return session_from_stmt(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "get_session");
    return std::nullopt;
}

Session SqliteSessionStore::create_session(const std::optional<std::string>& user_id,
                                           const std::string& agent_name,
                                           const nlohmann::json& metadata) {
    if (trim(agent_name).empty()) {
        throw ValidationError("agent_name must not be empty");
    }
    if (user_id && user_id->empty()) {
        throw ValidationError("user_id must be absent or non-empty");
    }
    std::string meta = metadata_text(metadata);

    std::lock_guard<std::mutex> lock(mutex_);

    Session session;
    session.session_id = generate_id();
    session.user_id = user_id;
    session.agent_name = agent_name;
    session.created_at = clock_.now_ms();
    session.updated_at = session.created_at;
    session.status = SessionStatus::Active;
    session.metadata = metadata.is_null() ? nlohmann::json::object() : metadata;

    Transaction tx(db_);

    // Users are created lazily, the first time a session names them
    if (user_id) {
        StmtGuard ug;
        prepare(db_, "INSERT OR IGNORE INTO users (user_id, created_at) VALUES (?, ?);", ug);
        bind_text(ug.stmt, 1, *user_id);
        sqlite3_bind_int64(ug.stmt, 2, static_cast<int64_t>(session.created_at));
        int rc = sqlite3_step(ug.stmt);
        if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "create_session: user");
    }

    StmtGuard g;
    prepare(db_,
        "INSERT INTO sessions (session_id, user_id, agent_name, created_at, updated_at,"
        " status, metadata) VALUES (?, ?, ?, ?, ?, ?, ?);", g);
    bind_text(g.stmt, 1, session.session_id);
    bind_optional_text(g.stmt, 2, session.user_id);
    bind_text(g.stmt, 3, session.agent_name);
    sqlite3_bind_int64(g.stmt, 4, static_cast<int64_t>(session.created_at));
    sqlite3_bind_int64(g.stmt, 5, static_cast<int64_t>(session.updated_at));
    bind_text(g.stmt, 6, status_to_string(session.status));
    bind_text(g.stmt, 7, meta);
    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "create_session");

    tx.commit();

    std::cerr << "[session_store] Session created: " << session.session_id
              << " user=" << session.user_id.value_or("-")
              << " agent=" << session.agent_name << "\n";
    return session;
}

Session SqliteSessionStore::get_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto session = find_session(session_id);
    if (!session) throw NotFoundError("session not found: " + session_id);
    return *session;
}

uint32_t SqliteSessionStore::next_turn_number(const std::string& session_id) {
    StmtGuard g;
    prepare(db_,
        "SELECT COALESCE(MAX(turn_number), 0) + 1 FROM conversation_turns"
        " WHERE session_id = ?;", g);
    bind_text(g.stmt, 1, session_id);
    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_ROW) throw_sqlite(db_, rc, "append_turn: next number");
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

ConversationTurn SqliteSessionStore::insert_turn(const std::string& session_id,
                                                 uint32_t turn_number,
                                                 TurnRole role,
                                                 const std::string& content,
                                                 const std::string& meta,
                                                 uint64_t timestamp) {
    ConversationTurn turn;
    turn.session_id = session_id;
    turn.turn_number = turn_number;
    turn.role = role;
    turn.content = content;
    turn.timestamp = timestamp;
    turn.metadata = nlohmann::json::parse(meta);

    StmtGuard g;
    prepare(db_,
        "INSERT INTO conversation_turns (session_id, turn_number, role, content,"
        " timestamp, metadata) VALUES (?, ?, ?, ?, ?, ?);", g);
    bind_text(g.stmt, 1, session_id);
    sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(turn_number));
    bind_text(g.stmt, 3, role_to_string(role));
    bind_text(g.stmt, 4, content);
    sqlite3_bind_int64(g.stmt, 5, static_cast<int64_t>(timestamp));
    bind_text(g.stmt, 6, meta);
    int rc = sqlite3_step(g.stmt);
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        throw ConcurrencyConflict("turn " + std::to_string(turn_number) +
                                  " already taken in session " + session_id);
    }
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "append_turn: insert");
    return turn;
}

void SqliteSessionStore::touch_session(const std::string& session_id, uint64_t timestamp) {
    StmtGuard g;
    prepare(db_,
        "UPDATE sessions SET updated_at = MAX(updated_at, ?) WHERE session_id = ?;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<int64_t>(timestamp));
    bind_text(g.stmt, 2, session_id);
    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "append_turn: touch session");
}

// Run `attempt` until it stops losing the turn-number race, at most
// kMaxAppendAttempts times.
template <typename Fn>
static auto retry_on_conflict(const char* op, Fn attempt) -> decltype(attempt()) {
    std::string last_error;
    for (uint32_t n = 1; n <= kMaxAppendAttempts; ++n) {
        try {
            return attempt();
        } catch (const ConcurrencyConflict& e) {
            last_error = e.what();
            std::cerr << "[session_store] " << op << " attempt " << n << "/"
                      << kMaxAppendAttempts << " lost race: " << last_error << "\n";
        }
    }
    throw ConcurrencyConflict(std::string(op) + " gave up after " +
                              std::to_string(kMaxAppendAttempts) +
                              " attempts: " + last_error);
}

ConversationTurn SqliteSessionStore::append_turn(const std::string& session_id,
                                                 TurnRole role,
                                                 const std::string& content,
                                                 const nlohmann::json& metadata) {
    std::string meta = metadata_text(metadata);

    std::lock_guard<std::mutex> lock(mutex_);
    return retry_on_conflict("append_turn", [&]() {
        Transaction tx(db_);
        if (!find_session(session_id)) {
            throw NotFoundError("session not found: " + session_id);
        }
        auto turn = insert_turn(session_id, next_turn_number(session_id), role,
                                content, meta, clock_.now_ms());
        touch_session(session_id, turn.timestamp);
        tx.commit();
        return turn;
    });
}

TurnExchange SqliteSessionStore::append_exchange(const std::string& session_id,
                                                 const std::string& user_content,
                                                 const nlohmann::json& user_metadata,
                                                 const std::string& assistant_content,
                                                 const nlohmann::json& assistant_metadata) {
    std::string user_meta = metadata_text(user_metadata);
    std::string assistant_meta = metadata_text(assistant_metadata);

    std::lock_guard<std::mutex> lock(mutex_);
    return retry_on_conflict("append_exchange", [&]() {
        Transaction tx(db_);
        if (!find_session(session_id)) {
            throw NotFoundError("session not found: " + session_id);
        }
        uint32_t next = next_turn_number(session_id);
        uint64_t now = clock_.now_ms();
        TurnExchange exchange;
        exchange.user = insert_turn(session_id, next, TurnRole::User,
                                    user_content, user_meta, now);
        exchange.assistant = insert_turn(session_id, next + 1, TurnRole::Assistant,
                                         assistant_content, assistant_meta, now);
        touch_session(session_id, now);
        tx.commit();
        return exchange;
    });
}

std::vector<ConversationTurn> SqliteSessionStore::get_history(const std::string& session_id,
                                                              uint32_t limit) {
    if (limit == 0) return {};

    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_,
        "SELECT session_id, turn_number, role, content, timestamp, metadata"
        " FROM conversation_turns WHERE session_id = ?"
        " ORDER BY turn_number DESC LIMIT ?;", g);
    bind_text(g.stmt, 1, session_id);
    sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(limit));

    std::vector<ConversationTurn> turns;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        turns.push_back(turn_from_stmt(g.stmt));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "get_history");
    return turns;
}

std::vector<Session> SqliteSessionStore::query_sessions(
    const std::string& user_id, std::optional<SessionStatus> status_filter) {

    std::string sql = std::string("SELECT ") + kSessionColumns +
                      " FROM sessions WHERE user_id = ?";
    if (status_filter) sql += " AND status = ?";
    sql += " ORDER BY created_at DESC, rowid DESC;";

    StmtGuard g;
    prepare(db_, sql.c_str(), g);
    bind_text(g.stmt, 1, user_id);
    if (status_filter) bind_text(g.stmt, 2, status_to_string(*status_filter));

    std::vector<Session> sessions;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        sessions.push_back(session_from_stmt(g.stmt));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "list_sessions_for_user");
    return sessions;
}

std::vector<Session> SqliteSessionStore::list_sessions_for_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_sessions(user_id, std::nullopt);
}

std::vector<Session> SqliteSessionStore::list_sessions_for_user(const std::string& user_id,
                                                                SessionStatus status_filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_sessions(user_id, status_filter);
}

void SqliteSessionStore::set_status(const std::string& session_id, SessionStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);

    Transaction tx(db_);

    auto current = find_session(session_id);
    if (!current) throw NotFoundError("session not found: " + session_id);

    if (!is_allowed_transition(current->status, status)) {
        throw InvalidTransitionError("session " + session_id + " cannot move from " +
                                     status_to_string(current->status) + " to " +
                                     status_to_string(status));
    }
    if (current->status == status) return;

    StmtGuard g;
    prepare(db_,
        "UPDATE sessions SET status = ?, updated_at = MAX(updated_at, ?)"
        " WHERE session_id = ?;", g);
    bind_text(g.stmt, 1, status_to_string(status));
    sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(clock_.now_ms()));
    bind_text(g.stmt, 3, session_id);
    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "set_status");

    tx.commit();

    std::cerr << "[session_store] Session " << session_id << " "
              << status_to_string(current->status) << " -> "
              << status_to_string(status) << "\n";
}

void SqliteSessionStore::update_metadata(const std::string& session_id,
                                         const nlohmann::json& metadata) {
    std::string meta = metadata_text(metadata);

    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_,
        "UPDATE sessions SET metadata = ?, updated_at = MAX(updated_at, ?)"
        " WHERE session_id = ?;", g);
    bind_text(g.stmt, 1, meta);
    sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(clock_.now_ms()));
    bind_text(g.stmt, 3, session_id);
    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "update_metadata");

    if (sqlite3_changes(db_) == 0) {
        throw NotFoundError("session not found: " + session_id);
    }
}

std::optional<User> SqliteSessionStore::get_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "SELECT user_id, created_at, metadata FROM users WHERE user_id = ?;", g);
    bind_text(g.stmt, 1, user_id);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw_sqlite(db_, rc, "get_user");

    User user;
    user.user_id = column_text(g.stmt, 0);
    user.created_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 1));
    user.metadata = column_json(g.stmt, 2);
    return user;
}

uint32_t SqliteSessionStore::turn_count(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "SELECT COUNT(*) FROM conversation_turns WHERE session_id = ?;", g);
    bind_text(g.stmt, 1, session_id);

    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_ROW) throw_sqlite(db_, rc, "turn_count");
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

std::string SqliteSessionStore::export_transcript(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto session = find_session(session_id);
    if (!session) throw NotFoundError("session not found: " + session_id);

    StmtGuard g;
    prepare(db_,
        "SELECT session_id, turn_number, role, content, timestamp, metadata"
        " FROM conversation_turns WHERE session_id = ?"
        " ORDER BY turn_number ASC;", g);
    bind_text(g.stmt, 1, session_id);

    nlohmann::json turns = nlohmann::json::array();
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        turns.push_back(turn_to_json(turn_from_stmt(g.stmt)));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "export_transcript");

    nlohmann::json doc = {
        {"session", session_to_json(*session)},
        {"turns", turns}
    };
    return doc.dump(2);
}

} // namespace engram
