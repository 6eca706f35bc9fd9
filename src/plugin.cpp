#include "plugin.hpp"
#include "memory.hpp"
#include "session_store.hpp"
#include <stdexcept>
#include <algorithm>

namespace engram {

StoreRegistry& StoreRegistry::instance() {
    static StoreRegistry registry;
    return registry;
}

void StoreRegistry::register_session_store(const std::string& name, SessionStoreFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_stores_[name] = std::move(factory);
}

void StoreRegistry::register_memory_store(const std::string& name, MemoryStoreFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    memory_stores_[name] = std::move(factory);
}

std::unique_ptr<SessionStore> StoreRegistry::create_session_store(const std::string& name,
                                                                  const Config& config) const {
    SessionStoreFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = session_stores_.find(name);
        if (it == session_stores_.end()) {
            throw std::invalid_argument("Unknown session store backend: " + name);
        }
        factory = it->second;
    }
    return factory(config);
}

std::unique_ptr<MemoryStore> StoreRegistry::create_memory_store(const std::string& name,
                                                                const Config& config) const {
    MemoryStoreFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = memory_stores_.find(name);
        if (it == memory_stores_.end()) {
            throw std::invalid_argument("Unknown memory store backend: " + name);
        }
        factory = it->second;
    }
    return factory(config);
}

std::vector<std::string> StoreRegistry::session_store_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(session_stores_.size());
    for (const auto& [name, _] : session_stores_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> StoreRegistry::memory_store_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(memory_stores_.size());
    for (const auto& [name, _] : memory_stores_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool StoreRegistry::has_session_store(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_stores_.count(name) > 0;
}

bool StoreRegistry::has_memory_store(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return memory_stores_.count(name) > 0;
}

} // namespace engram
