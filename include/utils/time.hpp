#pragma once

#include <chrono>

namespace YangKeys {

/**
 * @brief Wall-clock timer for reporting run durations.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    /**
     * @brief Get elapsed milliseconds since last reset or construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

private:
    TimePoint start_;
};

} // namespace YangKeys
