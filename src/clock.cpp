#include "clock.hpp"
#include "errors.hpp"
#include "util.hpp"

namespace engram {

uint64_t SystemClock::now_millis() const {
    return epoch_millis();
}

const Clock& system_clock() {
    static const SystemClock clock;
    return clock;
}

long long millis_remaining(Deadline deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? left : 0;
}

long timeout_millis_for(Deadline deadline) {
    long long ms = millis_remaining(deadline);
    return ms < 1 ? 1L : static_cast<long>(ms);
}

void check_deadline(Deadline deadline, const std::string& what) {
    if (deadline_passed(deadline)) {
        throw DeadlineExceededError(what + ": deadline exceeded");
    }
}

} // namespace engram
