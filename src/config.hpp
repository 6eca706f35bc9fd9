#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace engram {

struct StoreConfig {
    std::string backend = "sqlite";
    std::string sessions_path;          // empty = ~/.engram/sessions.db
    std::string memory_path;            // empty = ~/.engram/memory.db
    uint32_t busy_timeout_ms = 5000;
};

struct RunnerConfig {
    std::string agent_name = "assistant";
    std::string app_name = "engram";
    double short_term_ttl_hours = 24.0; // TTL of the per-turn interaction memory
    uint32_t invoke_timeout_ms = 0;     // 0 = no deadline
};

struct Config {
    StoreConfig store;
    RunnerConfig runner;

    // Load from ~/.engram/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse an already-merged JSON document. Unknown or mistyped fields are
    // ignored and keep their defaults.
    static Config from_json(const nlohmann::json& j);

    // Resolved database paths (defaults applied, ~ expanded)
    std::string sessions_db_path() const;
    std::string memory_db_path() const;
};

} // namespace engram
