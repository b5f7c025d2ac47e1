#include "workflow/Clock.hpp"
#include <thread>

namespace sysflow {
namespace workflow {

Clock::TimePoint SystemClock::now() const {
    return std::chrono::time_point_cast<Duration>(std::chrono::steady_clock::now());
}

void SystemClock::sleep(Duration duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

SystemClock& SystemClock::instance() {
    static SystemClock clock;
    return clock;
}

} // namespace workflow
} // namespace sysflow
