#pragma once
#include "../memory.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace engram {

class SqliteMemoryStore : public MemoryStore {
public:
    explicit SqliteMemoryStore(const std::string& path,
                               uint32_t busy_timeout_ms = 5000,
                               Clock& clock = system_clock());
    ~SqliteMemoryStore() override;

    // Non-copyable
    SqliteMemoryStore(const SqliteMemoryStore&) = delete;
    SqliteMemoryStore& operator=(const SqliteMemoryStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::string store_long_term(const std::string& user_id,
                                const std::optional<std::string>& session_id,
                                const std::string& key,
                                const std::string& value,
                                LongTermType type,
                                double importance,
                                std::optional<double> ttl_hours,
                                const nlohmann::json& metadata) override;

    std::string store_short_term(const std::string& session_id,
                                 const std::string& key,
                                 const std::string& value,
                                 ShortTermType type,
                                 double ttl_hours,
                                 const nlohmann::json& metadata) override;

    std::vector<LongTermMemory> retrieve_long_term(const std::string& user_id,
                                                   uint32_t top_k) override;

    std::vector<ShortTermMemory> retrieve_short_term(const std::string& session_id,
                                                     uint32_t top_n) override;

    void associate(const std::string& memory_id_1,
                   const std::string& memory_id_2,
                   const std::string& association_type,
                   double strength) override;

    uint32_t purge_expired_short_term() override;

    std::vector<RelatedMemory> associated_memories(
        const std::string& memory_id,
        const std::optional<std::string>& association_type,
        double min_strength) override;

    void update_importance(const std::string& memory_id, double importance) override;

    std::optional<LongTermMemory> get_long_term(const std::string& memory_id) override;

    uint32_t count_long_term(const std::string& user_id) override;
    uint32_t count_short_term(const std::string& session_id) override;

private:
    void init_schema();
    std::optional<LongTermMemory> find_long_term(const std::string& memory_id);
    std::optional<ShortTermMemory> find_short_term(const std::string& memory_id);
    bool memory_exists(const std::string& memory_id);

    sqlite3* db_ = nullptr;
    std::string path_;
    Clock& clock_;
    mutable std::mutex mutex_;
};

} // namespace engram
