#pragma once
#include <cstdint>
#include <limits>
#include <optional>

namespace engram {

// Source of "now" in epoch milliseconds. Stores and the runner read time
// only through this so tests can step it by hand.
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t now_ms() const = 0;
};

class SystemClock : public Clock {
public:
    uint64_t now_ms() const override;
};

// Process-wide wall clock used when no clock is injected.
Clock& system_clock();

// Largest instant a store column can hold (SQLite INTEGER is signed 64-bit).
constexpr uint64_t kMaxTimestampMs = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

// Convert fractional hours to milliseconds (rounded to nearest), saturating
// at kMaxTimestampMs.
uint64_t hours_to_ms(double hours);

// Expiry instant for a positive TTL. Never equal to `now`, so a tiny TTL
// still yields a row that is alive at the instant it is written. Saturates
// at kMaxTimestampMs.
uint64_t expiry_after_hours(uint64_t now, double ttl_hours);

// True iff an expiry is set and `now` is past it.
inline bool is_expired(std::optional<uint64_t> expires_at, uint64_t now) {
    return expires_at.has_value() && now > *expires_at;
}

inline bool is_fresh(std::optional<uint64_t> expires_at, uint64_t now) {
    return !is_expired(expires_at, now);
}

} // namespace engram
