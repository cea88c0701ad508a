#pragma once

#include <chrono>

namespace MineSpec {

/**
 * @brief Time source used by TTL caches; tests substitute a manual clock.
 */
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

/**
 * @brief Clock that only moves when told to.
 */
class ManualClock : public Clock {
public:
    TimePoint now() const override { return now_; }

    void advance(std::chrono::seconds delta) { now_ += delta; }

private:
    TimePoint now_{};
};

/**
 * @brief Wall timer for run reports.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    double elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

private:
    TimePoint start_;
};

} // namespace MineSpec
