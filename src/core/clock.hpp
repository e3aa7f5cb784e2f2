#pragma once
#include <algorithm>
#include <chrono>
#include <thread>

/**
 * @brief Drift-free periodic schedule for polling loops
 *
 * Keeps the next wake time as start + k * period so that the work done
 * inside each tick does not accumulate into the schedule. The clock itself
 * does not sleep; callers wait on next() with whatever primitive lets them
 * be woken early (condition variable, sliced sleep).
 */
struct PeriodicClock {
    using clock = std::chrono::steady_clock;

    std::chrono::nanoseconds period;
    clock::time_point next;

    /**
     * @brief Construct a new Periodic Clock
     * @param p Period between ticks
     */
    explicit PeriodicClock(std::chrono::nanoseconds p)
        : period(p), next(clock::now() + p) {}

    /**
     * @brief Advance the schedule by one period
     *
     * If the caller fell more than a full period behind, the schedule is
     * re-anchored on now instead of bursting through the missed ticks.
     */
    void advance() {
        next += period;
        auto now = clock::now();
        if (next < now) {
            next = now + period;
        }
    }
};

/**
 * @brief Sleep for a total duration in slices, checking an abort predicate
 *
 * The predicate is evaluated before every slice, so an abort condition is
 * observed at most one slice after it becomes true.
 *
 * @param total Total time to wait
 * @param slice Maximum time between predicate checks
 * @param should_abort Returns true to end the wait early
 * @return true if the full duration elapsed, false if aborted
 */
template<class Rep1, class Period1, class Rep2, class Period2, class Pred>
bool sleep_sliced(std::chrono::duration<Rep1, Period1> total,
                  std::chrono::duration<Rep2, Period2> slice,
                  Pred should_abort) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::duration_cast<clock::duration>(total);
    auto step = std::chrono::duration_cast<clock::duration>(slice);
    if (step <= clock::duration::zero()) {
        step = std::chrono::duration_cast<clock::duration>(std::chrono::milliseconds(1));
    }

    while (true) {
        if (should_abort()) {
            return false;
        }
        auto now = clock::now();
        if (now >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::min(step, deadline - now));
    }
}
