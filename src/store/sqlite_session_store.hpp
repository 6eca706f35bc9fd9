#pragma once
#include "../session_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace engram {

class SqliteSessionStore : public SessionStore {
public:
    explicit SqliteSessionStore(const std::string& path,
                                uint32_t busy_timeout_ms = 5000,
                                Clock& clock = system_clock());
    ~SqliteSessionStore() override;

    // Non-copyable
    SqliteSessionStore(const SqliteSessionStore&) = delete;
    SqliteSessionStore& operator=(const SqliteSessionStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    Session create_session(const std::optional<std::string>& user_id,
                           const std::string& agent_name,
                           const nlohmann::json& metadata) override;

    Session get_session(const std::string& session_id) override;

    ConversationTurn append_turn(const std::string& session_id,
                                 TurnRole role,
                                 const std::string& content,
                                 const nlohmann::json& metadata) override;

    TurnExchange append_exchange(const std::string& session_id,
                                 const std::string& user_content,
                                 const nlohmann::json& user_metadata,
                                 const std::string& assistant_content,
                                 const nlohmann::json& assistant_metadata) override;

    std::vector<ConversationTurn> get_history(const std::string& session_id,
                                              uint32_t limit) override;

    std::vector<Session> list_sessions_for_user(const std::string& user_id) override;
    std::vector<Session> list_sessions_for_user(const std::string& user_id,
                                                SessionStatus status_filter) override;

    void set_status(const std::string& session_id, SessionStatus status) override;

    void update_metadata(const std::string& session_id,
                         const nlohmann::json& metadata) override;

    std::optional<User> get_user(const std::string& user_id) override;

    uint32_t turn_count(const std::string& session_id) override;

    std::string export_transcript(const std::string& session_id) override;

private:
    void init_schema();
    std::optional<Session> find_session(const std::string& session_id);
    uint32_t next_turn_number(const std::string& session_id);
    ConversationTurn insert_turn(const std::string& session_id, uint32_t turn_number,
                                 TurnRole role, const std::string& content,
                                 const std::string& meta, uint64_t timestamp);
    void touch_session(const std::string& session_id, uint64_t timestamp);
    std::vector<Session> query_sessions(const std::string& user_id,
                                        std::optional<SessionStatus> status_filter);

    sqlite3* db_ = nullptr;
    std::string path_;
    Clock& clock_;
    mutable std::mutex mutex_;
};

} // namespace engram
