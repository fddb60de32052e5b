#include "ksuid/clock.hpp"

#include <chrono>

namespace ksuid {

std::int64_t SystemClock::NowUnixSeconds() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

std::int64_t FixedClock::NowUnixSeconds() {
    return unix_seconds_;
}

}  // namespace ksuid
