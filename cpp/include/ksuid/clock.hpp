#pragma once

#include <cstdint>

namespace ksuid {

// Wall-clock capability, injected so tests can pin the time.
class Clock {
public:
    virtual ~Clock() = default;

    // Seconds since the Unix epoch.
    virtual std::int64_t NowUnixSeconds() = 0;

protected:
    Clock() = default;
    Clock(const Clock&) = default;
    Clock& operator=(const Clock&) = default;
};

class SystemClock final : public Clock {
public:
    SystemClock() = default;

    std::int64_t NowUnixSeconds() override;
};

class FixedClock final : public Clock {
public:
    explicit FixedClock(std::int64_t unix_seconds) : unix_seconds_(unix_seconds) {}

    std::int64_t NowUnixSeconds() override;

private:
    std::int64_t unix_seconds_;
};

}  // namespace ksuid
