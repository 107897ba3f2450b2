/**
 * @file time.hpp
 * @brief Clock aliases and deadline arithmetic shared by the session, queue and engine.
 *
 * @date 2025
 */
#pragma once
#include <chrono>
#include <functional>

namespace cmdrelay {

    using SteadyClock = std::chrono::steady_clock;
    using TimePoint   = SteadyClock::time_point;

    /**
     * @brief Injectable time source. Components default to steady_clock::now().
     */
    using ClockFn = std::function<TimePoint()>;

    /**
     * @brief Milliseconds elapsed since @p start, as a double.
     */
    inline double elapsedMs(TimePoint start, TimePoint now = SteadyClock::now()) {
        return std::chrono::duration<double, std::milli>(now - start).count();
    }

    /**
     * @brief Time left until @p deadline, clamped at zero.
     */
    inline std::chrono::milliseconds remaining(TimePoint deadline, TimePoint now = SteadyClock::now()) {
        using namespace std::chrono;
        if (now >= deadline) return milliseconds(0);
        return duration_cast<milliseconds>(deadline - now);
    }
}
