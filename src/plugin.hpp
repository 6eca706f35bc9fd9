#pragma once
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace engram {

class SessionStore; // forward declaration
class MemoryStore;  // forward declaration

// Factory function types
using SessionStoreFactory = std::function<std::unique_ptr<SessionStore>(const Config& config)>;
using MemoryStoreFactory = std::function<std::unique_ptr<MemoryStore>(const Config& config)>;

// Central registry for self-registering storage backends.
// All methods are thread-safe.
class StoreRegistry {
public:
    static StoreRegistry& instance();

    // Registration
    void register_session_store(const std::string& name, SessionStoreFactory factory);
    void register_memory_store(const std::string& name, MemoryStoreFactory factory);

    // Creation
    std::unique_ptr<SessionStore> create_session_store(const std::string& name,
                                                       const Config& config) const;
    std::unique_ptr<MemoryStore> create_memory_store(const std::string& name,
                                                     const Config& config) const;

    // Query
    std::vector<std::string> session_store_names() const;
    std::vector<std::string> memory_store_names() const;
    bool has_session_store(const std::string& name) const;
    bool has_memory_store(const std::string& name) const;

private:
    StoreRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionStoreFactory> session_stores_;
    std::unordered_map<std::string, MemoryStoreFactory> memory_stores_;
};

// ── Self-registrar helpers (used at file scope in each backend .cpp) ──

struct SessionStoreRegistrar {
    SessionStoreRegistrar(const std::string& name, SessionStoreFactory factory) {
        StoreRegistry::instance().register_session_store(name, std::move(factory));
    }
};

struct MemoryStoreRegistrar {
    MemoryStoreRegistrar(const std::string& name, MemoryStoreFactory factory) {
        StoreRegistry::instance().register_memory_store(name, std::move(factory));
    }
};

} // namespace engram
