#include <catch2/catch.hpp>
#include "prompt.hpp"

using namespace engram;

static ConversationTurn turn(uint32_t n, TurnRole role, const std::string& content) {
    ConversationTurn t;
    t.session_id = "s";
    t.turn_number = n;
    t.role = role;
    t.content = content;
    return t;
}

static LongTermMemory fact(const std::string& key, const std::string& value) {
    LongTermMemory m;
    m.key = key;
    m.value = value;
    return m;
}

static ShortTermMemory note(const std::string& key, const std::string& value) {
    ShortTermMemory m;
    m.key = key;
    m.value = value;
    return m;
}

TEST_CASE("build_prompt: bare prompt has only the request section", "[prompt]") {
    PromptContext ctx;
    ctx.prompt = "What should I pack?";

    REQUIRE(build_prompt(ctx) == "=== Current Request ===\nWhat should I pack?");
}

TEST_CASE("build_prompt: sections appear in fixed order", "[prompt]") {
    PromptContext ctx;
    ctx.history = {turn(1, TurnRole::User, "hi"), turn(2, TurnRole::Assistant, "hello")};
    ctx.long_term = {fact("diet", "vegetarian")};
    ctx.short_term = {note("turn_1", "greeting")};
    ctx.additional_context = {{"city", "Pune"}};
    ctx.prompt = "plan dinner";

    std::string expected =
        "=== Previous Conversation ===\n"
        "User: hi\n"
        "Assistant: hello\n"
        "\n"
        "=== Relevant Context ===\n"
        "- diet: vegetarian\n"
        "\n"
        "=== Recent Session Context ===\n"
        "- turn_1: greeting\n"
        "\n"
        "=== Additional Context ===\n"
        "- city: Pune\n"
        "\n"
        "=== Current Request ===\n"
        "plan dinner";
    REQUIRE(build_prompt(ctx) == expected);
}

TEST_CASE("build_prompt: empty sections are omitted", "[prompt]") {
    PromptContext ctx;
    ctx.long_term = {fact("k", "v")};
    ctx.prompt = "p";

    auto out = build_prompt(ctx);
    REQUIRE(out.find("=== Relevant Context ===") == 0);
    REQUIRE(out.find("Previous Conversation") == std::string::npos);
    REQUIRE(out.find("Recent Session Context") == std::string::npos);
    REQUIRE(out.find("Additional Context") == std::string::npos);
}

TEST_CASE("build_prompt: keeps list order as given", "[prompt]") {
    PromptContext ctx;
    ctx.long_term = {fact("first", "1"), fact("second", "2")};
    ctx.prompt = "p";

    auto out = build_prompt(ctx);
    REQUIRE(out.find("- first: 1") < out.find("- second: 2"));
}

TEST_CASE("build_prompt: non-string context values rendered as JSON", "[prompt]") {
    PromptContext ctx;
    ctx.additional_context = {{"guests", 12}, {"tags", {"a", "b"}}};
    ctx.prompt = "p";

    auto out = build_prompt(ctx);
    REQUIRE(out.find("- guests: 12\n") != std::string::npos);
    REQUIRE(out.find("- tags: [\"a\",\"b\"]\n") != std::string::npos);
}

TEST_CASE("build_prompt: deterministic for equal input", "[prompt]") {
    PromptContext ctx;
    ctx.history = {turn(1, TurnRole::User, "x")};
    ctx.additional_context = {{"b", 1}, {"a", 2}};
    ctx.prompt = "p";

    REQUIRE(build_prompt(ctx) == build_prompt(ctx));
}
