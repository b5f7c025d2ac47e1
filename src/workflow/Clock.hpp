#pragma once

#include <chrono>

namespace sysflow {
namespace workflow {

/**
 * Time source and sleep, injected so retry delays can be faked in tests
 */
class Clock {
public:
    using Duration = std::chrono::duration<double>;  // Seconds
    using TimePoint = std::chrono::time_point<std::chrono::steady_clock, Duration>;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
    virtual void sleep(Duration duration) = 0;

    double secondsSince(TimePoint start) const {
        return (now() - start).count();
    }
};

/**
 * Real steady clock, blocking sleep on the calling thread
 */
class SystemClock : public Clock {
public:
    TimePoint now() const override;
    void sleep(Duration duration) override;

    static SystemClock& instance();
};

} // namespace workflow
} // namespace sysflow
