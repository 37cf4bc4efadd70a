#pragma once

#include "trustpath/common.hpp"
#include <chrono>
#include <string>
#include <thread>

namespace trustpath {
namespace time {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;
using SteadyClock = std::chrono::steady_clock;

// Current Unix timestamp (seconds since epoch)
uint64_t timestamp_seconds();

// Unix timestamp (seconds) as ISO 8601 UTC with millisecond precision,
// e.g. 2026-01-01T00:00:00.000Z
std::string timestamp_to_iso8601(uint64_t timestamp_seconds);

/**
 * Parse YYYY-MM-DDTHH:MM:SS[.sss]Z into a Unix timestamp (seconds).
 * Fractional seconds are truncated.
 * @throws std::runtime_error on malformed input
 */
uint64_t iso8601_to_timestamp(const std::string& str);

template<typename Rep, typename Period>
inline uint64_t duration_to_milliseconds(const std::chrono::duration<Rep, Period>& duration) {
    return std::chrono::duration_cast<Milliseconds>(duration).count();
}

// Monotonic stopwatch
class Timer {
public:
    Timer() : start_(SteadyClock::now()) {}

    uint64_t elapsed_milliseconds() const {
        return duration_to_milliseconds(SteadyClock::now() - start_);
    }

private:
    SteadyClock::time_point start_;
};

// Query time budget (monotonic). A zero budget never expires.
class Deadline {
public:
    explicit Deadline(uint64_t budget_milliseconds)
        : budget_(Milliseconds(budget_milliseconds))
        , start_(SteadyClock::now()) {}

    bool expired() const {
        if (budget_.count() == 0) return false;
        return (SteadyClock::now() - start_) >= budget_;
    }

    // 0 once expired
    uint64_t remaining_milliseconds() const {
        auto elapsed = SteadyClock::now() - start_;
        if (elapsed >= budget_) return 0;
        return duration_to_milliseconds(budget_ - elapsed);
    }

private:
    Milliseconds budget_;
    SteadyClock::time_point start_;
};

inline void sleep_milliseconds(uint32_t milliseconds) {
    std::this_thread::sleep_for(Milliseconds(milliseconds));
}

} // namespace time
} // namespace trustpath
