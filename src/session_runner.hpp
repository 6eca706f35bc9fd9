#pragma once
#include "clock.hpp"
#include "config.hpp"
#include "memory.hpp"
#include "model_client.hpp"
#include "session_store.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace engram {

// Per-request lifecycle. Any stage may end in Failed.
enum class RunStage {
    Idle,
    ResolveSession,
    GatherContext,
    BuildPrompt,
    Invoke,
    Persist,
    Done,
    Failed
};

std::string stage_to_string(RunStage stage);

// Context bounds, fixed per request
constexpr uint32_t kHistoryTurns = 10;
constexpr uint32_t kShortTermContext = 3;
constexpr uint32_t kLongTermContext = 5;

struct RunRequest {
    std::string prompt;
    std::optional<std::string> session_id;
    std::optional<std::string> user_id;
    nlohmann::json additional_context = nlohmann::json::object();
    const std::atomic<bool>* cancelled = nullptr;  // optional, owned by caller
};

struct SessionMetadata {
    std::string session_id;
    uint32_t turn_number = 0;  // number of the assistant turn just written
};

struct MemoriesUsed {
    uint32_t short_term = 0;
    uint32_t long_term = 0;
};

struct RunResponse {
    std::string response_text;
    std::optional<SessionMetadata> session;  // nullopt in session-less mode
    MemoriesUsed memories_used;
};

// Drives one request through ResolveSession -> GatherContext -> BuildPrompt
// -> Invoke -> Persist. Holds no per-request state, so one runner may serve
// concurrent requests. The stores, client and clock must outlive it.
class SessionRunner {
public:
    SessionRunner(SessionStore& sessions,
                  MemoryStore& memories,
                  ModelClient& client,
                  const RunnerConfig& config,
                  Clock& clock = system_clock());

    // Throws NotFoundError for an unknown session_id, ExternalInvocationError
    // when the model fails, times out or the request is cancelled (nothing is
    // persisted then), and store errors raised while persisting turns.
    RunResponse run(const RunRequest& request);

    // Mark a session completed.
    void close_session(const std::string& session_id);

    // Store a user-scoped fact alongside the conversation that produced it.
    std::string remember_long_term(const std::string& user_id,
                                   const std::optional<std::string>& session_id,
                                   const std::string& key,
                                   const std::string& value,
                                   LongTermType type = LongTermType::Fact,
                                   double importance = 0.5);

    // Store a session-scoped note with the configured short-term TTL.
    std::string remember_short_term(const std::string& session_id,
                                    const std::string& key,
                                    const std::string& value,
                                    ShortTermType type = ShortTermType::Context);

    // Stage most recently reached by any run() on this runner.
    RunStage last_stage() const { return last_stage_.load(); }

private:
    std::string invoke_model(const RunRequest& request, const std::string& prompt);

    SessionStore& sessions_;
    MemoryStore& memories_;
    ModelClient& client_;
    RunnerConfig config_;
    Clock& clock_;
    std::atomic<RunStage> last_stage_{RunStage::Idle};
};

} // namespace engram
