#pragma once
#include "memory.hpp"
#include "session_store.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace engram {

// Everything gathered for one request before the model is invoked.
struct PromptContext {
    std::vector<ConversationTurn> history;    // oldest first
    std::vector<LongTermMemory> long_term;    // importance desc
    std::vector<ShortTermMemory> short_term;  // newest first
    nlohmann::json additional_context = nlohmann::json::object();
    std::string prompt;
};

// Assemble the enriched prompt. Sections appear in a fixed order
// (history, relevant context, recent session context, additional context,
// current request) and empty sections are left out. Output depends only on
// the input.
std::string build_prompt(const PromptContext& ctx);

} // namespace engram
