#include "config.hpp"
#include "errors.hpp"
#include "memory.hpp"
#include "plugin.hpp"
#include "session_store.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <stdexcept>
#include <vector>

static std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

static void print_usage() {
    auto& registry = engram::StoreRegistry::instance();
    std::cout << "Usage: engram <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  sessions USER [STATUS]   List a user's sessions, newest first\n"
              << "  history SESSION [LIMIT]  Show the most recent turns (default 10)\n"
              << "  export SESSION           Print the full transcript as JSON\n"
              << "  close SESSION            Mark a session completed\n"
              << "  archive SESSION          Mark a session archived\n"
              << "  memories USER [K]        Show a user's top long-term memories (default 5)\n"
              << "  purge                    Delete expired short-term memories\n"
              << "  -h, --help               Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  ENGRAM_SESSIONS_DB       Path of the session database\n"
              << "  ENGRAM_MEMORY_DB         Path of the memory database\n"
              << "  ENGRAM_AGENT_NAME        Agent name recorded on new sessions\n"
              << "\n"
              << "Session store backends: " << join_names(registry.session_store_names()) << "\n"
              << "Memory store backends:  " << join_names(registry.memory_store_names()) << "\n";
}

static uint32_t parse_count(const std::string& s) {
    try {
        size_t pos = 0;
        unsigned long v = std::stoul(s, &pos);
        if (pos == s.size() && v > 0 && v <= 10000) return static_cast<uint32_t>(v);
    } catch (const std::logic_error&) {
        // fall through to the error below
    }
    throw engram::ValidationError("expected a positive count, got '" + s + "'");
}

static void print_session(const engram::Session& s) {
    std::cout << s.session_id << "  " << engram::status_to_string(s.status)
              << "  " << s.agent_name
              << "  created " << engram::format_timestamp(s.created_at)
              << "  updated " << engram::format_timestamp(s.updated_at) << "\n";
}

int main(int argc, char* argv[]) try {
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        print_usage();
        return args.empty() ? 1 : 0;
    }

    const std::string& command = args[0];
    auto need = [&](size_t n) {
        if (args.size() < n + 1) {
            std::cerr << "Missing argument for '" << command << "'\n";
            print_usage();
            return false;
        }
        return true;
    };

    auto config = engram::Config::load();
    auto& registry = engram::StoreRegistry::instance();
    if (!registry.has_session_store(config.store.backend) ||
        !registry.has_memory_store(config.store.backend)) {
        std::cerr << "Unknown store backend '" << config.store.backend << "' (available: "
                  << join_names(registry.session_store_names()) << ")\n";
        return 1;
    }

    if (command == "sessions") {
        if (!need(1)) return 1;
        auto store = engram::create_session_store(config);
        auto sessions = args.size() > 2
            ? store->list_sessions_for_user(args[1], engram::status_from_string(args[2]))
            : store->list_sessions_for_user(args[1]);
        for (const auto& s : sessions) print_session(s);
        if (sessions.empty()) std::cout << "No sessions for " << args[1] << "\n";
    } else if (command == "history") {
        if (!need(1)) return 1;
        uint32_t limit = args.size() > 2 ? parse_count(args[2]) : 10;
        auto store = engram::create_session_store(config);
        store->get_session(args[1]);
        auto turns = store->get_history(args[1], limit);
        // Print oldest first
        for (auto it = turns.rbegin(); it != turns.rend(); ++it) {
            std::cout << "#" << it->turn_number << " [" << engram::role_to_string(it->role)
                      << "] " << engram::format_timestamp(it->timestamp) << "\n"
                      << it->content << "\n\n";
        }
    } else if (command == "export") {
        if (!need(1)) return 1;
        auto store = engram::create_session_store(config);
        std::cout << store->export_transcript(args[1]) << "\n";
    } else if (command == "close" || command == "archive") {
        if (!need(1)) return 1;
        auto store = engram::create_session_store(config);
        auto status = command == "close" ? engram::SessionStatus::Completed
                                         : engram::SessionStatus::Archived;
        store->set_status(args[1], status);
        std::cout << "Session " << args[1] << " is now "
                  << engram::status_to_string(status) << "\n";
    } else if (command == "memories") {
        if (!need(1)) return 1;
        uint32_t k = args.size() > 2 ? parse_count(args[2]) : 5;
        auto store = engram::create_memory_store(config);
        auto memories = store->retrieve_long_term(args[1], k);
        for (const auto& m : memories) {
            std::cout << m.memory_id << "  " << engram::long_term_type_to_string(m.memory_type)
                      << "  importance=" << m.importance
                      << "  uses=" << m.access_count << "\n"
                      << "  " << m.key << ": " << m.value << "\n";
        }
        if (memories.empty()) std::cout << "No memories for " << args[1] << "\n";
    } else if (command == "purge") {
        auto store = engram::create_memory_store(config);
        uint32_t purged = store->purge_expired_short_term();
        std::cout << "Purged " << purged << " expired short-term memories\n";
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        return 1;
    }

    return 0;
} catch (const engram::Error& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
