#include "session_runner.hpp"
#include "errors.hpp"
#include "prompt.hpp"
#include <algorithm>
#include <future>
#include <iostream>

namespace engram {

// Version of the interaction snapshot stored after each turn pair
static constexpr int kInteractionSchemaVersion = 1;

std::string stage_to_string(RunStage stage) {
    switch (stage) {
        case RunStage::Idle:           return "idle";
        case RunStage::ResolveSession: return "resolve_session";
        case RunStage::GatherContext:  return "gather_context";
        case RunStage::BuildPrompt:    return "build_prompt";
        case RunStage::Invoke:         return "invoke";
        case RunStage::Persist:        return "persist";
        case RunStage::Done:           return "done";
        case RunStage::Failed:         return "failed";
    }
    return "idle";
}

SessionRunner::SessionRunner(SessionStore& sessions,
                             MemoryStore& memories,
                             ModelClient& client,
                             const RunnerConfig& config,
                             Clock& clock)
    : sessions_(sessions), memories_(memories), client_(client),
      config_(config), clock_(clock) {}

static bool is_cancelled(const RunRequest& request) {
    return request.cancelled && request.cancelled->load();
}

std::string SessionRunner::invoke_model(const RunRequest& request, const std::string& prompt) {
    if (is_cancelled(request)) {
        throw ExternalInvocationError("request cancelled before invocation");
    }

    uint64_t started = clock_.now_ms();
    std::string response;
    try {
        response = client_.invoke(prompt, config_.invoke_timeout_ms);
    } catch (const std::exception& e) {
        throw ExternalInvocationError(client_.client_name() + ": " + e.what());
    }

    // A late answer counts as a timeout even if the client ignored its deadline
    if (config_.invoke_timeout_ms > 0) {
        uint64_t now = clock_.now_ms();
        uint64_t elapsed = now > started ? now - started : 0;
        if (elapsed > config_.invoke_timeout_ms) {
            throw ExternalInvocationError(client_.client_name() + ": timed out after " +
                                          std::to_string(elapsed) + " ms");
        }
    }
    if (is_cancelled(request)) {
        throw ExternalInvocationError("request cancelled during invocation");
    }
    return response;
}

RunResponse SessionRunner::run(const RunRequest& request) {
    try {
        // ResolveSession
        last_stage_ = RunStage::ResolveSession;
        std::optional<Session> session;
        if (request.session_id) {
            session = sessions_.get_session(*request.session_id);
        } else if (request.user_id) {
            session = sessions_.create_session(request.user_id, config_.agent_name,
                                               {{"app_name", config_.app_name}});
        }

        std::optional<std::string> user_id = request.user_id;
        if (!user_id && session) user_id = session->user_id;

        // GatherContext
        last_stage_ = RunStage::GatherContext;
        PromptContext ctx;
        ctx.prompt = request.prompt;
        ctx.additional_context = request.additional_context.is_object()
            ? request.additional_context : nlohmann::json::object();

        if (session) {
            const std::string sid = session->session_id;
            auto history = std::async(std::launch::async, [this, sid]() {
                return sessions_.get_history(sid, kHistoryTurns);
            });
            auto short_term = std::async(std::launch::async, [this, sid]() {
                return memories_.retrieve_short_term(sid, kShortTermContext);
            });
            std::future<std::vector<LongTermMemory>> long_term;
            if (user_id) {
                const std::string uid = *user_id;
                long_term = std::async(std::launch::async, [this, uid]() {
                    return memories_.retrieve_long_term(uid, kLongTermContext);
                });
            }

            ctx.history = history.get();
            std::reverse(ctx.history.begin(), ctx.history.end());
            ctx.short_term = short_term.get();
            if (long_term.valid()) ctx.long_term = long_term.get();
        }

        // BuildPrompt
        last_stage_ = RunStage::BuildPrompt;
        std::string prompt = build_prompt(ctx);

        // Invoke
        last_stage_ = RunStage::Invoke;
        RunResponse response;
        response.response_text = invoke_model(request, prompt);
        response.memories_used.short_term = static_cast<uint32_t>(ctx.short_term.size());
        response.memories_used.long_term = static_cast<uint32_t>(ctx.long_term.size());

        if (!session) {
            last_stage_ = RunStage::Done;
            return response;
        }

        // Persist
        last_stage_ = RunStage::Persist;
        const std::string& sid = session->session_id;
        auto exchange = sessions_.append_exchange(sid, request.prompt,
                                                  {{"context", ctx.additional_context}},
                                                  response.response_text,
                                                  {{"model", client_.client_name()}});
        const auto& user_turn = exchange.user;
        const auto& assistant_turn = exchange.assistant;

        nlohmann::json snapshot = {
            {"user_prompt", request.prompt},
            {"assistant_response", response.response_text},
            {"turn_number", user_turn.turn_number}
        };
        try {
            memories_.store_short_term(sid, "turn_" + std::to_string(user_turn.turn_number),
                                       snapshot.dump(), ShortTermType::Event,
                                       config_.short_term_ttl_hours,
                                       {{"schema_version", kInteractionSchemaVersion}});
        } catch (const std::exception& e) {
            std::cerr << "[runner] Failed to record interaction memory for session "
                      << sid << ": " << e.what() << "\n";
        }

        std::cerr << "[runner] Session " << sid << " turns " << user_turn.turn_number
                  << "-" << assistant_turn.turn_number << " recorded\n";

        response.session = SessionMetadata{sid, assistant_turn.turn_number};
        last_stage_ = RunStage::Done;
        return response;
    } catch (...) {
        last_stage_ = RunStage::Failed;
        throw;
    }
}

void SessionRunner::close_session(const std::string& session_id) {
    sessions_.close_session(session_id);
    std::cerr << "[runner] Session closed: " << session_id << "\n";
}

std::string SessionRunner::remember_long_term(const std::string& user_id,
                                              const std::optional<std::string>& session_id,
                                              const std::string& key,
                                              const std::string& value,
                                              LongTermType type,
                                              double importance) {
    return memories_.store_long_term(user_id, session_id, key, value, type, importance,
                                     std::nullopt, nlohmann::json::object());
}

std::string SessionRunner::remember_short_term(const std::string& session_id,
                                               const std::string& key,
                                               const std::string& value,
                                               ShortTermType type) {
    return memories_.store_short_term(session_id, key, value, type,
                                      config_.short_term_ttl_hours,
                                      nlohmann::json::object());
}

} // namespace engram
