#include "clock.hpp"
#include "util.hpp"
#include <cmath>

namespace engram {

uint64_t SystemClock::now_ms() const {
    return epoch_millis();
}

Clock& system_clock() {
    static SystemClock clock;
    return clock;
}

uint64_t hours_to_ms(double hours) {
    if (!(hours > 0.0)) return 0;
    double ms = hours * 3600.0 * 1000.0;
    if (ms >= static_cast<double>(kMaxTimestampMs)) return kMaxTimestampMs;
    return static_cast<uint64_t>(std::llround(ms));
}

uint64_t expiry_after_hours(uint64_t now, double ttl_hours) {
    uint64_t ttl = hours_to_ms(ttl_hours);
    if (ttl == 0) ttl = 1;
    if (now >= kMaxTimestampMs || ttl > kMaxTimestampMs - now) return kMaxTimestampMs;
    return now + ttl;
}

} // namespace engram
