#include "session_store.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "plugin.hpp"
#include "util.hpp"

namespace engram {

TurnExchange SessionStore::append_exchange(const std::string& session_id,
                                           const std::string& user_content,
                                           const nlohmann::json& user_metadata,
                                           const std::string& assistant_content,
                                           const nlohmann::json& assistant_metadata) {
    TurnExchange exchange;
    exchange.user = append_turn(session_id, TurnRole::User, user_content, user_metadata);
    exchange.assistant = append_turn(session_id, TurnRole::Assistant,
                                     assistant_content, assistant_metadata);
    return exchange;
}

std::string status_to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Active:    return "active";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Archived:  return "archived";
    }
    return "active";
}

SessionStatus status_from_string(const std::string& s) {
    if (s == "active")    return SessionStatus::Active;
    if (s == "completed") return SessionStatus::Completed;
    if (s == "archived")  return SessionStatus::Archived;
    throw ValidationError("unknown session status: " + s);
}

std::string role_to_string(TurnRole role) {
    switch (role) {
        case TurnRole::User:      return "user";
        case TurnRole::Assistant: return "assistant";
    }
    return "user";
}

TurnRole role_from_string(const std::string& s) {
    if (s == "user")      return TurnRole::User;
    if (s == "assistant") return TurnRole::Assistant;
    throw ValidationError("unknown turn role: " + s);
}

bool is_allowed_transition(SessionStatus from, SessionStatus to) {
    return static_cast<int>(to) >= static_cast<int>(from);
}

nlohmann::json session_to_json(const Session& session) {
    return {
        {"session_id", session.session_id},
        {"user_id", session.user_id ? nlohmann::json(*session.user_id) : nlohmann::json()},
        {"agent_name", session.agent_name},
        {"created_at", format_timestamp(session.created_at)},
        {"updated_at", format_timestamp(session.updated_at)},
        {"status", status_to_string(session.status)},
        {"metadata", session.metadata}
    };
}

nlohmann::json turn_to_json(const ConversationTurn& turn) {
    return {
        {"turn_number", turn.turn_number},
        {"role", role_to_string(turn.role)},
        {"content", turn.content},
        {"timestamp", format_timestamp(turn.timestamp)},
        {"metadata", turn.metadata}
    };
}

std::unique_ptr<SessionStore> create_session_store(const Config& config) {
    return StoreRegistry::instance().create_session_store(config.store.backend, config);
}

} // namespace engram
