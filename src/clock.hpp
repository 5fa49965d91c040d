#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace engram {

// Wall-clock source for record timestamps and expiry checks.
// Injectable so retention behavior is testable without sleeping.
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t now_millis() const = 0;
};

class SystemClock : public Clock {
public:
    uint64_t now_millis() const override;
};

// Process-wide system clock instance.
const Clock& system_clock();

// Monotonic instant after which an external call must give up.
using Deadline = std::chrono::steady_clock::time_point;

inline Deadline deadline_after(std::chrono::milliseconds timeout) {
    return std::chrono::steady_clock::now() + timeout;
}

inline bool deadline_passed(Deadline deadline) {
    return std::chrono::steady_clock::now() >= deadline;
}

// Milliseconds left before the deadline (0 when already passed).
long long millis_remaining(Deadline deadline);

// Milliseconds left for an HTTP timeout, at least 1.
long timeout_millis_for(Deadline deadline);

// Throws DeadlineExceededError naming `what` when the deadline has passed.
void check_deadline(Deadline deadline, const std::string& what);

} // namespace engram
