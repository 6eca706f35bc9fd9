#pragma once
#include "clock.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace engram {

struct Config; // forward declaration

// Ordered: a session may only move forward through these.
enum class SessionStatus { Active = 0, Completed = 1, Archived = 2 };

enum class TurnRole { User, Assistant };

struct User {
    std::string user_id;
    uint64_t created_at = 0;
    nlohmann::json metadata = nlohmann::json::object();
};

struct Session {
    std::string session_id;
    std::optional<std::string> user_id;   // nullopt = anonymous
    std::string agent_name;
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
    SessionStatus status = SessionStatus::Active;
    nlohmann::json metadata = nlohmann::json::object();
};

struct ConversationTurn {
    std::string session_id;
    uint32_t turn_number = 0;             // 1-based, contiguous per session
    TurnRole role = TurnRole::User;
    std::string content;
    uint64_t timestamp = 0;
    nlohmann::json metadata = nlohmann::json::object();
};

// A user turn and the reply that follows it.
struct TurnExchange {
    ConversationTurn user;
    ConversationTurn assistant;
};

// Bound on internal retries of a lost turn-number race before
// append_turn gives up with ConcurrencyConflict.
constexpr uint32_t kMaxAppendAttempts = 3;

// Durable record of users, sessions and their append-only turn logs.
// Implementations must be safe to call from several threads at once.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual std::string backend_name() const = 0;

    // Create an active session with a fresh id. Creates the user row on first
    // sight of `user_id`. Throws ValidationError if agent_name is empty.
    virtual Session create_session(const std::optional<std::string>& user_id,
                                   const std::string& agent_name,
                                   const nlohmann::json& metadata) = 0;

    // Throws NotFoundError if absent.
    virtual Session get_session(const std::string& session_id) = 0;

    // Append one turn, numbered max(existing)+1, and bump the session's
    // updated_at. Two concurrent appends never share a number.
    // Throws NotFoundError, or ConcurrencyConflict once retries run out.
    virtual ConversationTurn append_turn(const std::string& session_id,
                                         TurnRole role,
                                         const std::string& content,
                                         const nlohmann::json& metadata) = 0;

    // Append a user turn and its reply as turns N and N+1. The default makes
    // two append_turn calls: if the second fails the user turn stays and the
    // error propagates. Transactional backends override it so concurrent
    // writers cannot land between the two.
    virtual TurnExchange append_exchange(const std::string& session_id,
                                         const std::string& user_content,
                                         const nlohmann::json& user_metadata,
                                         const std::string& assistant_content,
                                         const nlohmann::json& assistant_metadata);

    // Most recent `limit` turns, newest first.
    virtual std::vector<ConversationTurn> get_history(const std::string& session_id,
                                                      uint32_t limit) = 0;

    // Sessions owned by a user, newest first.
    virtual std::vector<Session> list_sessions_for_user(const std::string& user_id) = 0;
    virtual std::vector<Session> list_sessions_for_user(const std::string& user_id,
                                                        SessionStatus status_filter) = 0;

    // Move a session forward in its lifecycle. Re-applying the current
    // status is a no-op. Throws InvalidTransitionError on a backwards move.
    virtual void set_status(const std::string& session_id, SessionStatus status) = 0;

    // Replace the session's metadata bag.
    virtual void update_metadata(const std::string& session_id,
                                 const nlohmann::json& metadata) = 0;

    virtual std::optional<User> get_user(const std::string& user_id) = 0;

    virtual uint32_t turn_count(const std::string& session_id) = 0;

    // Session plus every turn in ascending order, as a JSON document.
    virtual std::string export_transcript(const std::string& session_id) = 0;

    // Shorthand for set_status(Completed).
    void close_session(const std::string& session_id) {
        set_status(session_id, SessionStatus::Completed);
    }
};

// String conversions
std::string status_to_string(SessionStatus status);
SessionStatus status_from_string(const std::string& s);   // throws ValidationError
std::string role_to_string(TurnRole role);
TurnRole role_from_string(const std::string& s);          // throws ValidationError

// True when moving from `from` to `to` keeps the lifecycle monotonic.
bool is_allowed_transition(SessionStatus from, SessionStatus to);

// JSON views used by export_transcript and the CLI
nlohmann::json session_to_json(const Session& session);
nlohmann::json turn_to_json(const ConversationTurn& turn);

// Create the configured session store backend via the store registry.
std::unique_ptr<SessionStore> create_session_store(const Config& config);

} // namespace engram
