#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace engram {

nlohmann::json Config::defaults_json() {
    return {
        {"store", {
            {"backend", "sqlite"},
            {"sessions_path", ""},
            {"memory_path", ""},
            {"busy_timeout_ms", 5000}
        }},
        {"runner", {
            {"agent_name", "assistant"},
            {"app_name", "engram"},
            {"short_term_ttl_hours", 24.0},
            {"invoke_timeout_ms", 0}
        }}
    };
}

// Accepts signed and unsigned JSON integers alike, as long as they fit.
static bool is_u32(const nlohmann::json& v) {
    return v.is_number_integer() && v.get<int64_t>() >= 0 &&
           v.get<int64_t>() <= static_cast<int64_t>(UINT32_MAX);
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        if (s.contains("backend") && s["backend"].is_string())
            cfg.store.backend = s["backend"].get<std::string>();
        if (s.contains("sessions_path") && s["sessions_path"].is_string())
            cfg.store.sessions_path = s["sessions_path"].get<std::string>();
        if (s.contains("memory_path") && s["memory_path"].is_string())
            cfg.store.memory_path = s["memory_path"].get<std::string>();
        if (s.contains("busy_timeout_ms") && is_u32(s["busy_timeout_ms"]))
            cfg.store.busy_timeout_ms = s["busy_timeout_ms"].get<uint32_t>();
    }

    if (j.contains("runner") && j["runner"].is_object()) {
        auto& r = j["runner"];
        if (r.contains("agent_name") && r["agent_name"].is_string())
            cfg.runner.agent_name = r["agent_name"].get<std::string>();
        if (r.contains("app_name") && r["app_name"].is_string())
            cfg.runner.app_name = r["app_name"].get<std::string>();
        if (r.contains("short_term_ttl_hours") && r["short_term_ttl_hours"].is_number() &&
            r["short_term_ttl_hours"].get<double>() > 0.0)
            cfg.runner.short_term_ttl_hours = r["short_term_ttl_hours"].get<double>();
        if (r.contains("invoke_timeout_ms") && is_u32(r["invoke_timeout_ms"]))
            cfg.runner.invoke_timeout_ms = r["invoke_timeout_ms"].get<uint32_t>();
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.engram/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("ENGRAM_SESSIONS_DB"))
        cfg.store.sessions_path = v;
    if (const char* v = std::getenv("ENGRAM_MEMORY_DB"))
        cfg.store.memory_path = v;
    if (const char* v = std::getenv("ENGRAM_AGENT_NAME"))
        cfg.runner.agent_name = v;

    return cfg;
}

std::string Config::sessions_db_path() const {
    return expand_home(store.sessions_path.empty() ? "~/.engram/sessions.db"
                                                   : store.sessions_path);
}

std::string Config::memory_db_path() const {
    return expand_home(store.memory_path.empty() ? "~/.engram/memory.db"
                                                 : store.memory_path);
}

} // namespace engram
