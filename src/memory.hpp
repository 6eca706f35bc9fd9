#pragma once
#include "clock.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace engram {

struct Config; // forward declaration

enum class LongTermType { Fact, Preference, Skill, Other };
enum class ShortTermType { Context, Event, State, Other };

struct LongTermMemory {
    std::string memory_id;
    std::string user_id;
    std::optional<std::string> session_id;  // provenance only
    std::string key;                        // not unique
    std::string value;                      // opaque payload
    LongTermType memory_type = LongTermType::Fact;
    double importance = 0.5;                // always within [0, 1]
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
    uint64_t accessed_at = 0;
    uint32_t access_count = 0;
    std::optional<uint64_t> expires_at;     // nullopt = never expires
    nlohmann::json metadata = nlohmann::json::object();
};

struct ShortTermMemory {
    std::string memory_id;
    std::string session_id;
    std::string key;
    std::string value;                      // opaque payload
    ShortTermType memory_type = ShortTermType::Context;
    uint64_t created_at = 0;
    std::optional<uint64_t> expires_at;     // nullopt = lives as long as the session
    nlohmann::json metadata = nlohmann::json::object();
};

struct MemoryAssociation {
    std::string memory_id_1;
    std::string memory_id_2;
    std::string association_type;
    double strength = 0.5;
    uint64_t created_at = 0;
};

// One association seen from a given memory, with the other endpoint
// resolved. Exactly one of long_term / short_term is set.
struct RelatedMemory {
    MemoryAssociation association;
    std::optional<LongTermMemory> long_term;
    std::optional<ShortTermMemory> short_term;
};

// Abstract memory backend: long-term (user scoped, ranked by importance),
// short-term (session scoped, expiring) and associations between them.
// Implementations must be safe to call from several threads at once.
class MemoryStore {
public:
    virtual ~MemoryStore() = default;

    virtual std::string backend_name() const = 0;

    // Returns the new memory id. Importance is clamped into [0, 1].
    // Throws ValidationError for empty user/key, NaN importance or
    // a non-positive ttl.
    virtual std::string store_long_term(const std::string& user_id,
                                        const std::optional<std::string>& session_id,
                                        const std::string& key,
                                        const std::string& value,
                                        LongTermType type,
                                        double importance,
                                        std::optional<double> ttl_hours,
                                        const nlohmann::json& metadata) = 0;

    // Returns the new memory id. Throws ValidationError if ttl_hours <= 0.
    virtual std::string store_short_term(const std::string& session_id,
                                         const std::string& key,
                                         const std::string& value,
                                         ShortTermType type,
                                         double ttl_hours,
                                         const nlohmann::json& metadata) = 0;

    // Top `top_k` live memories for a user by importance, then recency of
    // access. Each returned row is marked as accessed (count + 1) and the
    // records carry the updated values.
    virtual std::vector<LongTermMemory> retrieve_long_term(const std::string& user_id,
                                                           uint32_t top_k) = 0;

    // Newest `top_n` live memories for a session. Read-only.
    virtual std::vector<ShortTermMemory> retrieve_short_term(const std::string& session_id,
                                                             uint32_t top_n) = 0;

    // Link two memories. Re-linking the same pair and type updates strength.
    virtual void associate(const std::string& memory_id_1,
                           const std::string& memory_id_2,
                           const std::string& association_type,
                           double strength) = 0;

    // Delete every expired short-term row. Returns the number removed.
    virtual uint32_t purge_expired_short_term() = 0;

    // Live memories linked to `memory_id`, strongest first.
    virtual std::vector<RelatedMemory> associated_memories(
        const std::string& memory_id,
        const std::optional<std::string>& association_type,
        double min_strength) = 0;

    // Throws NotFoundError if no long-term memory has this id.
    virtual void update_importance(const std::string& memory_id, double importance) = 0;

    // Peek without counting as a use. Expired rows are included.
    virtual std::optional<LongTermMemory> get_long_term(const std::string& memory_id) = 0;

    // Live rows only.
    virtual uint32_t count_long_term(const std::string& user_id) = 0;
    virtual uint32_t count_short_term(const std::string& session_id) = 0;
};

// Type string conversions
std::string long_term_type_to_string(LongTermType type);
LongTermType long_term_type_from_string(const std::string& s);   // throws ValidationError
std::string short_term_type_to_string(ShortTermType type);
ShortTermType short_term_type_from_string(const std::string& s); // throws ValidationError

// Clamp into [0, 1]; infinities land on the bounds. Throws ValidationError for NaN.
double clamp_importance(double importance);

// Create the configured memory store backend via the store registry.
std::unique_ptr<MemoryStore> create_memory_store(const Config& config);

} // namespace engram
