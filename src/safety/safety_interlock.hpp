#pragma once
#include "../core/model.hpp"
#include "../store/data_store.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

/**
 * @brief Machine-enable interlock
 *
 * Decides whether the machine may move servos right now. Three conditions
 * are watched:
 * - Machine state: anything other than On blocks
 * - Countdown timer: once its wall-clock end passes, the machine is turned Off.
 *   A timer that expires while the machine is already off is cleared silently
 * - Supply voltage: below the cutoff for a continuous debounce period
 *   (5 s by default), the machine is turned Off
 *
 * The interlock only changes the machine record; putting the servos into
 * safe state is the caller's job. Every transition it causes is reported
 * through the trip callback.
 *
 * evaluate() is called from the scheduler thread and from measurement
 * threads concurrently; the debounce state is guarded by the instance mutex.
 */
class SafetyInterlock {
public:
    /**
     * @brief Interlock decision
     */
    struct Result {
        bool allowed{true};
        std::string reason;   ///< "machine_off", "timer_expired" or "low_voltage" when blocked

        static Result allow() { return Result{true, ""}; }
        static Result block(const std::string& why) { return Result{false, why}; }

        explicit operator bool() const { return allowed; }
    };

    using VoltageSource = std::function<std::optional<double>()>;
    using TripCallback = std::function<void(const std::string& reason)>;

private:
    IDataStore& store_;
    VoltageSource voltage_source_;
    std::chrono::steady_clock::duration debounce_;

    mutable std::mutex mutex_;
    std::optional<std::chrono::steady_clock::time_point> low_voltage_since_;
    TripCallback trip_callback_;
    std::string last_trip_reason_;
    std::atomic<std::uint64_t> total_trips_{0};

public:
    /**
     * @brief Constructor
     * @param store Machine record and settings (cutoff voltage) source
     * @param voltage_source Latest supply-voltage reading, empty if none yet
     * @param debounce Continuous low-voltage time before tripping
     */
    SafetyInterlock(IDataStore& store, VoltageSource voltage_source,
                    std::chrono::steady_clock::duration debounce = std::chrono::seconds(5))
        : store_(store), voltage_source_(std::move(voltage_source)), debounce_(debounce) {}

    /**
     * @brief Evaluate against the current clocks
     */
    Result evaluate() {
        return evaluate_at(std::chrono::steady_clock::now(), std::chrono::system_clock::now());
    }

    /**
     * @brief Evaluate at explicit instants
     * @param now Monotonic time used for the voltage debounce
     * @param wall_now Wall-clock time compared with the timer end
     */
    Result evaluate_at(std::chrono::steady_clock::time_point now,
                       std::chrono::system_clock::time_point wall_now) {
        std::string tripped;
        Result result = Result::allow();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto machine = store_.machine();
            const bool on = machine && machine->machine_state == MachineState::On;
            const bool expired = machine && machine->timer_active && wall_now >= machine->timer_end;

            // An expired timer never outlives its end, whatever the machine state
            if (expired && !on) {
                clear_timer();
            }

            if (!on) {
                low_voltage_since_.reset();
                return Result::block("machine_off");
            }

            if (expired) {
                turn_machine_off(true);
                low_voltage_since_.reset();
                tripped = "timer_expired";
                result = Result::block(tripped);
            } else {
                std::optional<double> voltage;
                if (voltage_source_) voltage = voltage_source_();
                auto settings = store_.settings();

                if (voltage && settings) {
                    if (*voltage < settings->cutoff_voltage) {
                        if (!low_voltage_since_) {
                            low_voltage_since_ = now;
                        } else if (now - *low_voltage_since_ >= debounce_) {
                            turn_machine_off(false);
                            low_voltage_since_.reset();
                            tripped = "low_voltage";
                            result = Result::block(tripped);
                        }
                    } else {
                        // One good sample clears the debounce
                        low_voltage_since_.reset();
                    }
                }
            }

            if (!tripped.empty()) {
                last_trip_reason_ = tripped;
                total_trips_.fetch_add(1);
            }
        }

        if (!tripped.empty()) {
            TripCallback cb;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                cb = trip_callback_;
            }
            if (cb) cb(tripped);
        }
        return result;
    }

    /**
     * @brief Set callback invoked after the interlock turns the machine off
     */
    void set_trip_callback(TripCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        trip_callback_ = std::move(callback);
    }

    /**
     * @brief Check if a low-voltage condition is currently being debounced
     */
    bool low_voltage_pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return low_voltage_since_.has_value();
    }

    std::string last_trip_reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_trip_reason_;
    }

    std::uint64_t get_trip_count() const { return total_trips_.load(); }

private:
    void turn_machine_off(bool clear_timer) {
        store_.update_machine([clear_timer](MachineRecord& m) {
            m.machine_state = MachineState::Off;
            if (clear_timer) {
                m.timer_active = false;
                m.timer_end = std::chrono::system_clock::time_point{};
            }
        });
    }

    void clear_timer() {
        store_.update_machine([](MachineRecord& m) {
            m.timer_active = false;
            m.timer_end = std::chrono::system_clock::time_point{};
        });
    }
};
