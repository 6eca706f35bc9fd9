#include "memory.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "plugin.hpp"
#include <algorithm>
#include <cmath>

namespace engram {

std::string long_term_type_to_string(LongTermType type) {
    switch (type) {
        case LongTermType::Fact:       return "fact";
        case LongTermType::Preference: return "preference";
        case LongTermType::Skill:      return "skill";
        case LongTermType::Other:      return "other";
    }
    return "other";
}

LongTermType long_term_type_from_string(const std::string& s) {
    if (s == "fact")       return LongTermType::Fact;
    if (s == "preference") return LongTermType::Preference;
    if (s == "skill")      return LongTermType::Skill;
    if (s == "other")      return LongTermType::Other;
    throw ValidationError("unknown long-term memory type: " + s);
}

std::string short_term_type_to_string(ShortTermType type) {
    switch (type) {
        case ShortTermType::Context: return "context";
        case ShortTermType::Event:   return "event";
        case ShortTermType::State:   return "state";
        case ShortTermType::Other:   return "other";
    }
    return "other";
}

ShortTermType short_term_type_from_string(const std::string& s) {
    if (s == "context") return ShortTermType::Context;
    if (s == "event")   return ShortTermType::Event;
    if (s == "state")   return ShortTermType::State;
    if (s == "other")   return ShortTermType::Other;
    throw ValidationError("unknown short-term memory type: " + s);
}

double clamp_importance(double importance) {
    if (std::isnan(importance)) {
        throw ValidationError("importance must be a number");
    }
    return std::clamp(importance, 0.0, 1.0);
}

std::unique_ptr<MemoryStore> create_memory_store(const Config& config) {
    return StoreRegistry::instance().create_memory_store(config.store.backend, config);
}

} // namespace engram
