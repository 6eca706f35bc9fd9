#include <catch2/catch.hpp>
#include "errors.hpp"
#include "memory/sqlite_memory_store.hpp"
#include "session_runner.hpp"
#include "store/sqlite_session_store.hpp"
#include "test_support.hpp"
#include <functional>
#include <stdexcept>
#include <thread>

using namespace engram;

class MockModelClient : public ModelClient {
public:
    std::string next_response = "mock reply";
    std::vector<std::string> prompts;
    uint32_t last_timeout_ms = 0;
    std::function<void()> during_invoke;  // runs inside invoke, before returning
    bool fail = false;

    std::string invoke(const std::string& prompt, uint32_t timeout_ms) override {
        prompts.push_back(prompt);
        last_timeout_ms = timeout_ms;
        if (during_invoke) during_invoke();
        if (fail) throw std::runtime_error("model unavailable");
        return next_response;
    }

    std::string client_name() const override { return "mock"; }
};

// Two-call exchange path whose assistant append always fails.
class ReplyRejectingSessionStore : public SqliteSessionStore {
public:
    using SqliteSessionStore::SqliteSessionStore;

    ConversationTurn append_turn(const std::string& session_id, TurnRole role,
                                 const std::string& content,
                                 const nlohmann::json& metadata) override {
        if (role == TurnRole::Assistant) throw StorageError("disk full");
        return SqliteSessionStore::append_turn(session_id, role, content, metadata);
    }

    TurnExchange append_exchange(const std::string& session_id,
                                 const std::string& user_content,
                                 const nlohmann::json& user_metadata,
                                 const std::string& assistant_content,
                                 const nlohmann::json& assistant_metadata) override {
        return SessionStore::append_exchange(session_id, user_content, user_metadata,
                                             assistant_content, assistant_metadata);
    }
};

// Exchange writes that keep losing the numbering race.
class ContendedSessionStore : public SqliteSessionStore {
public:
    using SqliteSessionStore::SqliteSessionStore;

    TurnExchange append_exchange(const std::string&, const std::string&,
                                 const nlohmann::json&, const std::string&,
                                 const nlohmann::json&) override {
        throw ConcurrencyConflict("append_exchange gave up after " +
                                  std::to_string(kMaxAppendAttempts) + " attempts");
    }
};

class FailingMemoryStore : public SqliteMemoryStore {
public:
    using SqliteMemoryStore::SqliteMemoryStore;

    std::string store_short_term(const std::string&, const std::string&,
                                 const std::string&, ShortTermType, double,
                                 const nlohmann::json&) override {
        throw StorageError("memory database unavailable");
    }
};

struct RunnerFixture {
    std::string sessions_path = test_db_path("runner_sessions");
    std::string memory_path = test_db_path("runner_memory");
    ManualClock clock;
    SqliteSessionStore sessions{sessions_path, 5000, clock};
    SqliteMemoryStore memories{memory_path, 5000, clock};
    MockModelClient client;
    RunnerConfig config;

    ~RunnerFixture() {
        remove_db(sessions_path);
        remove_db(memory_path);
    }

    SessionRunner runner() { return SessionRunner(sessions, memories, client, config, clock); }
};

static RunRequest request(const std::string& prompt) {
    RunRequest r;
    r.prompt = prompt;
    return r;
}

// ── session resolution ───────────────────────────────────────────

TEST_CASE("SessionRunner: user without session starts one", "[runner]") {
    RunnerFixture f;
    f.config.agent_name = "coordinator";
    f.config.app_name = "festival";
    auto runner = f.runner();

    auto req = request("hello");
    req.user_id = "alice";
    auto resp = runner.run(req);

    REQUIRE(resp.response_text == "mock reply");
    REQUIRE(resp.session.has_value());
    REQUIRE(resp.session->turn_number == 2);

    auto session = f.sessions.get_session(resp.session->session_id);
    REQUIRE(session.user_id.value_or("") == "alice");
    REQUIRE(session.agent_name == "coordinator");
    REQUIRE(session.metadata["app_name"] == "festival");
    REQUIRE(runner.last_stage() == RunStage::Done);
}

TEST_CASE("SessionRunner: session-less mode touches no store", "[runner]") {
    RunnerFixture f;
    auto runner = f.runner();

    auto resp = runner.run(request("just answer"));

    REQUIRE(resp.response_text == "mock reply");
    REQUIRE_FALSE(resp.session.has_value());
    REQUIRE(resp.memories_used.short_term == 0);
    REQUIRE(resp.memories_used.long_term == 0);
    REQUIRE(f.client.prompts.size() == 1);
    REQUIRE(f.client.prompts[0] == "=== Current Request ===\njust answer");
    REQUIRE(f.memories.count_short_term("") == 0);
}

TEST_CASE("SessionRunner: unknown session id is NotFound", "[runner]") {
    RunnerFixture f;
    auto runner = f.runner();

    auto req = request("hi");
    req.session_id = "no-such-session";
    REQUIRE_THROWS_AS(runner.run(req), NotFoundError);
    REQUIRE(f.client.prompts.empty());
    REQUIRE(runner.last_stage() == RunStage::Failed);
}

// ── persistence ──────────────────────────────────────────────────

TEST_CASE("SessionRunner: persists turn pair numbered N and N+1", "[runner]") {
    RunnerFixture f;
    auto runner = f.runner();
    auto s = f.sessions.create_session(std::string("u"), "agent", nlohmann::json::object());
    f.sessions.append_turn(s.session_id, TurnRole::User, "earlier", nlohmann::json::object());
    f.sessions.append_turn(s.session_id, TurnRole::Assistant, "reply", nlohmann::json::object());

    auto req = request("next question");
    req.session_id = s.session_id;
    auto resp = runner.run(req);

    REQUIRE(resp.session->session_id == s.session_id);
    REQUIRE(resp.session->turn_number == 4);

    auto history = f.sessions.get_history(s.session_id, 2);
    REQUIRE(history[0].turn_number == 4);
    REQUIRE(history[0].role == TurnRole::Assistant);
    REQUIRE(history[0].content == "mock reply");
    REQUIRE(history[1].turn_number == 3);
    REQUIRE(history[1].role == TurnRole::User);
    REQUIRE(history[1].content == "next question");
}

TEST_CASE("SessionRunner: records interaction snapshot in short-term memory", "[runner]") {
    RunnerFixture f;
    f.config.short_term_ttl_hours = 2.0;
    auto runner = f.runner();

    auto req = request("what is on today?");
    req.user_id = "u";
    auto resp = runner.run(req);

    auto notes = f.memories.retrieve_short_term(resp.session->session_id, 10);
    REQUIRE(notes.size() == 1);
    REQUIRE(notes[0].key == "turn_1");
    REQUIRE(notes[0].memory_type == ShortTermType::Event);
    REQUIRE(notes[0].metadata.contains("schema_version"));
    REQUIRE(notes[0].expires_at.value_or(0) == notes[0].created_at + hours_to_ms(2.0));

    auto value = nlohmann::json::parse(notes[0].value);
    REQUIRE(value["user_prompt"] == "what is on today?");
    REQUIRE(value["assistant_response"] == "mock reply");
    REQUIRE(value["turn_number"] == 1);
}

TEST_CASE("SessionRunner: runs on a completed session without reopening it", "[runner]") {
    RunnerFixture f;
    auto runner = f.runner();
    auto s = f.sessions.create_session(std::nullopt, "agent", nlohmann::json::object());
    f.sessions.close_session(s.session_id);

    auto req = request("one more thing");
    req.session_id = s.session_id;
    runner.run(req);

    REQUIRE(f.sessions.get_session(s.session_id).status == SessionStatus::Completed);
    REQUIRE(f.sessions.turn_count(s.session_id) == 2);
}

// ── context assembly ─────────────────────────────────────────────

TEST_CASE("SessionRunner: prompt carries history and memories", "[runner]") {
    RunnerFixture f;
    auto runner = f.runner();

    auto first = request("I am vegetarian");
    first.user_id = "alice";
    f.client.next_response = "noted";
    auto resp = runner.run(first);
    std::string sid = resp.session->session_id;

    f.memories.store_long_term("alice", sid, "diet", "vegetarian", LongTermType::Preference,
                               0.9, std::nullopt, nlohmann::json::object());

    auto second = request("suggest lunch");
    second.session_id = sid;
    second.additional_context = {{"city", "Pune"}};
    f.client.next_response = "try thali";
    auto resp2 = runner.run(second);

    const std::string& prompt = f.client.prompts.back();
    auto history_at = prompt.find("=== Previous Conversation ===\nUser: I am vegetarian\n"
                                  "Assistant: noted\n");
    auto facts_at = prompt.find("=== Relevant Context ===\n- diet: vegetarian\n");
    auto notes_at = prompt.find("=== Recent Session Context ===\n- turn_1: ");
    auto extra_at = prompt.find("=== Additional Context ===\n- city: Pune\n");
    auto request_at = prompt.find("=== Current Request ===\nsuggest lunch");

    REQUIRE(history_at != std::string::npos);
    REQUIRE(facts_at != std::string::npos);
    REQUIRE(notes_at != std::string::npos);
    REQUIRE(extra_at != std::string::npos);
    REQUIRE(request_at != std::string::npos);
    REQUIRE(history_at < facts_at);
    REQUIRE(facts_at < notes_at);
    REQUIRE(notes_at < extra_at);
    REQUIRE(extra_at < request_at);

    REQUIRE(resp2.memories_used.long_term == 1);
    REQUIRE(resp2.memories_used.short_term == 1);

    // Surfacing the fact counted as a use
    auto facts = f.memories.retrieve_long_term("alice", 1);
    REQUIRE(facts[0].access_count == 2);
}

TEST_CASE("SessionRunner: context is bounded", "[runner]") {
    RunnerFixture f;
    auto runner = f.runner();
    auto s = f.sessions.create_session(std::string("u"), "agent", nlohmann::json::object());
    for (int i = 1; i <= 14; i++) {
        f.sessions.append_turn(s.session_id, TurnRole::User, "old" + std::to_string(i),
                               nlohmann::json::object());
        f.memories.store_short_term(s.session_id, "n" + std::to_string(i), "v",
                                    ShortTermType::Context, 24.0, nlohmann::json::object());
        f.memories.store_long_term("u", std::nullopt, "f" + std::to_string(i), "v",
                                   LongTermType::Fact, 0.5, std::nullopt,
                                   nlohmann::json::object());
        f.clock.advance(1);
    }

    auto req = request("q");
    req.session_id = s.session_id;
    auto resp = runner.run(req);

    REQUIRE(resp.memories_used.short_term == kShortTermContext);
    REQUIRE(resp.memories_used.long_term == kLongTermContext);

    const std::string& prompt = f.client.prompts.back();
    REQUIRE(prompt.find("User: old4\n") == std::string::npos);
    REQUIRE(prompt.find("User: old5\n") != std::string::npos);
    REQUIRE(prompt.find("User: old5\n") < prompt.find("User: old14\n"));
}

TEST_CASE("SessionRunner: session user feeds long-term lookup", "[runner]") {
    RunnerFixture f;
    auto runner = f.runner();
    auto s = f.sessions.create_session(std::string("bob"), "agent", nlohmann::json::object());
    f.memories.store_long_term("bob", std::nullopt, "likes", "jazz", LongTermType::Preference,
                               0.5, std::nullopt, nlohmann::json::object());

    auto req = request("music tonight?");
    req.session_id = s.session_id;
    auto resp = runner.run(req);

    REQUIRE(resp.memories_used.long_term == 1);
    REQUIRE(f.client.prompts.back().find("- likes: jazz") != std::string::npos);
}

// ── invocation failures ──────────────────────────────────────────

TEST_CASE("SessionRunner: model failure persists nothing", "[runner]") {
    RunnerFixture f;
    auto runner = f.runner();
    auto s = f.sessions.create_session(std::string("u"), "agent", nlohmann::json::object());
    f.client.fail = true;

    auto req = request("hello");
    req.session_id = s.session_id;
    REQUIRE_THROWS_AS(runner.run(req), ExternalInvocationError);

    REQUIRE(f.sessions.turn_count(s.session_id) == 0);
    REQUIRE(f.memories.count_short_term(s.session_id) == 0);
    REQUIRE(f.sessions.get_session(s.session_id).status == SessionStatus::Active);
    REQUIRE(runner.last_stage() == RunStage::Failed);
}

TEST_CASE("SessionRunner: elapsed deadline is a failure", "[runner]") {
    RunnerFixture f;
    f.config.invoke_timeout_ms = 100;
    auto runner = f.runner();
    auto s = f.sessions.create_session(std::string("u"), "agent", nlohmann::json::object());
    f.client.during_invoke = [&f]() { f.clock.advance(250); };

    auto req = request("slow question");
    req.session_id = s.session_id;
    REQUIRE_THROWS_AS(runner.run(req), ExternalInvocationError);

    REQUIRE(f.client.last_timeout_ms == 100);
    REQUIRE(f.sessions.turn_count(s.session_id) == 0);
    REQUIRE(f.memories.count_short_term(s.session_id) == 0);
}

TEST_CASE("SessionRunner: response inside deadline succeeds", "[runner]") {
    RunnerFixture f;
    f.config.invoke_timeout_ms = 100;
    auto runner = f.runner();
    f.client.during_invoke = [&f]() { f.clock.advance(100); };

    auto req = request("quick");
    req.user_id = "u";
    auto resp = runner.run(req);
    REQUIRE(f.sessions.turn_count(resp.session->session_id) == 2);
}

TEST_CASE("SessionRunner: cancellation during invoke persists nothing", "[runner]") {
    RunnerFixture f;
    auto runner = f.runner();
    auto s = f.sessions.create_session(std::string("u"), "agent", nlohmann::json::object());
    std::atomic<bool> cancelled{false};
    f.client.during_invoke = [&cancelled]() { cancelled = true; };

    auto req = request("never mind");
    req.session_id = s.session_id;
    req.cancelled = &cancelled;
    REQUIRE_THROWS_AS(runner.run(req), ExternalInvocationError);
    REQUIRE(f.sessions.turn_count(s.session_id) == 0);
}

TEST_CASE("SessionRunner: cancelled before invoke never calls the model", "[runner]") {
    RunnerFixture f;
    auto runner = f.runner();
    std::atomic<bool> cancelled{true};

    auto req = request("x");
    req.cancelled = &cancelled;
    REQUIRE_THROWS_AS(runner.run(req), ExternalInvocationError);
    REQUIRE(f.client.prompts.empty());
}

// ── concurrency ──────────────────────────────────────────────────

TEST_CASE("SessionRunner: concurrent runs on one session keep numbering", "[runner]") {
    RunnerFixture f;
    auto runner = f.runner();
    auto s = f.sessions.create_session(std::string("u"), "agent", nlohmann::json::object());

    // Each run gets its own client so the mock's bookkeeping is not shared
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&f, &s]() {
            MockModelClient client;
            SessionRunner r(f.sessions, f.memories, client, f.config, f.clock);
            for (int i = 0; i < 5; i++) {
                auto req = request("q");
                req.session_id = s.session_id;
                r.run(req);
            }
        });
    }
    for (auto& th : threads) th.join();

    auto history = f.sessions.get_history(s.session_id, 100);
    REQUIRE(history.size() == 40);
    for (size_t i = 0; i < history.size(); i++) {
        REQUIRE(history[i].turn_number == 40 - i);
        // Oldest first: user turns are odd, each followed by its reply
        auto expected = history[i].turn_number % 2 == 1 ? TurnRole::User : TurnRole::Assistant;
        REQUIRE(history[i].role == expected);
    }
}

// ── persist failures ─────────────────────────────────────────────

TEST_CASE("SessionRunner: failed reply append leaves the user turn", "[runner]") {
    RunnerFixture f;
    ScopedDbPath db("runner_reject");
    ReplyRejectingSessionStore sessions(db.path, 5000, f.clock);
    SessionRunner runner(sessions, f.memories, f.client, f.config, f.clock);
    auto s = sessions.create_session(std::string("u"), "agent", nlohmann::json::object());

    auto req = request("are you there?");
    req.session_id = s.session_id;
    REQUIRE_THROWS_AS(runner.run(req), StorageError);
    REQUIRE(runner.last_stage() == RunStage::Failed);

    auto history = sessions.get_history(s.session_id, 10);
    REQUIRE(history.size() == 1);
    REQUIRE(history[0].turn_number == 1);
    REQUIRE(history[0].role == TurnRole::User);
    REQUIRE(history[0].content == "are you there?");
    REQUIRE(f.memories.count_short_term(s.session_id) == 0);
    REQUIRE(sessions.get_session(s.session_id).status == SessionStatus::Active);
}

TEST_CASE("SessionRunner: interaction memory failure is tolerated", "[runner]") {
    RunnerFixture f;
    ScopedDbPath db("runner_failmem");
    FailingMemoryStore memories(db.path, 5000, f.clock);
    SessionRunner runner(f.sessions, memories, f.client, f.config, f.clock);
    auto s = f.sessions.create_session(std::string("u"), "agent", nlohmann::json::object());

    auto req = request("hi");
    req.session_id = s.session_id;
    auto resp = runner.run(req);

    REQUIRE(resp.response_text == "mock reply");
    REQUIRE(resp.session->turn_number == 2);
    REQUIRE(runner.last_stage() == RunStage::Done);
    auto history = f.sessions.get_history(s.session_id, 10);
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].role == TurnRole::Assistant);
    REQUIRE(history[1].role == TurnRole::User);
}

TEST_CASE("SessionRunner: exhausted append retries surface as conflict", "[runner]") {
    RunnerFixture f;
    ScopedDbPath db("runner_contended");
    ContendedSessionStore sessions(db.path, 5000, f.clock);
    SessionRunner runner(sessions, f.memories, f.client, f.config, f.clock);
    auto s = sessions.create_session(std::string("u"), "agent", nlohmann::json::object());

    auto req = request("hi");
    req.session_id = s.session_id;
    REQUIRE_THROWS_AS(runner.run(req), ConcurrencyConflict);
    REQUIRE(runner.last_stage() == RunStage::Failed);
    REQUIRE(sessions.turn_count(s.session_id) == 0);
    REQUIRE(f.memories.count_short_term(s.session_id) == 0);
}

// ── helpers ──────────────────────────────────────────────────────

TEST_CASE("SessionRunner: close_session completes the session", "[runner]") {
    RunnerFixture f;
    auto runner = f.runner();
    auto s = f.sessions.create_session(std::nullopt, "agent", nlohmann::json::object());

    runner.close_session(s.session_id);
    REQUIRE(f.sessions.get_session(s.session_id).status == SessionStatus::Completed);
}

TEST_CASE("SessionRunner: remember helpers write both tiers", "[runner]") {
    RunnerFixture f;
    f.config.short_term_ttl_hours = 1.0;
    auto runner = f.runner();

    auto ltm = runner.remember_long_term("u", std::string("s1"), "budget", "moderate",
                                         LongTermType::Preference, 0.7);
    auto stm = runner.remember_short_term("s1", "venue", "riverside");

    auto fact = f.memories.get_long_term(ltm);
    REQUIRE(fact.has_value());
    REQUIRE(fact->session_id.value_or("") == "s1");
    REQUIRE(fact->memory_type == LongTermType::Preference);

    auto notes = f.memories.retrieve_short_term("s1", 1);
    REQUIRE(notes.size() == 1);
    REQUIRE(notes[0].memory_id == stm);
    REQUIRE(notes[0].expires_at.value_or(0) == notes[0].created_at + hours_to_ms(1.0));
}

TEST_CASE("stage_to_string: names every stage", "[runner]") {
    REQUIRE(stage_to_string(RunStage::GatherContext) == "gather_context");
    REQUIRE(stage_to_string(RunStage::Failed) == "failed");
}
