#include "prompt.hpp"
#include <sstream>

namespace engram {

static std::string role_label(TurnRole role) {
    return role == TurnRole::User ? "User" : "Assistant";
}

// Strings print bare; anything else as compact JSON.
static std::string context_value(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

std::string build_prompt(const PromptContext& ctx) {
    std::ostringstream ss;

    if (!ctx.history.empty()) {
        ss << "=== Previous Conversation ===\n";
        for (const auto& turn : ctx.history) {
            ss << role_label(turn.role) << ": " << turn.content << "\n";
        }
        ss << "\n";
    }

    if (!ctx.long_term.empty()) {
        ss << "=== Relevant Context ===\n";
        for (const auto& m : ctx.long_term) {
            ss << "- " << m.key << ": " << m.value << "\n";
        }
        ss << "\n";
    }

    if (!ctx.short_term.empty()) {
        ss << "=== Recent Session Context ===\n";
        for (const auto& m : ctx.short_term) {
            ss << "- " << m.key << ": " << m.value << "\n";
        }
        ss << "\n";
    }

    if (ctx.additional_context.is_object() && !ctx.additional_context.empty()) {
        ss << "=== Additional Context ===\n";
        for (auto it = ctx.additional_context.begin(); it != ctx.additional_context.end(); ++it) {
            ss << "- " << it.key() << ": " << context_value(it.value()) << "\n";
        }
        ss << "\n";
    }

    ss << "=== Current Request ===\n";
    ss << ctx.prompt;

    return ss.str();
}

} // namespace engram
