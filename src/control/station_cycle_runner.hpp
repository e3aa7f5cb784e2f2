#pragma once
#include "../actuation/actuator_module.hpp"
#include "../actuation/sensor_module.hpp"
#include "../config/hardware_config.hpp"
#include "../core/clock.hpp"
#include "../core/errors.hpp"
#include "../core/model.hpp"
#include "../safety/safety_interlock.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief Timing and geometry of one press/return cycle
 */
struct CycleTiming {
    std::chrono::milliseconds press_duration{500};
    std::chrono::milliseconds return_duration{500};
    std::chrono::milliseconds cycle_duration{1000};   ///< Measurement window
    std::chrono::milliseconds sample_interval{10};    ///< Measurement and safety-check tick
    double press_angle{100.0};
    double return_angle{0.0};

    static CycleTiming from_config(const HardwareConfig& cfg) {
        CycleTiming t;
        t.press_duration = cfg.servo.press_duration;
        t.return_duration = cfg.servo.return_duration;
        t.cycle_duration = cfg.servo.cycle_duration;
        t.sample_interval = cfg.sensors.data_interval;
        t.press_angle = cfg.servo.press_angle;
        t.return_angle = cfg.servo.return_angle;
        return t;
    }
};

/**
 * @brief Drives one station through press, verify and return
 *
 * Motion runs on the calling thread while a measurement thread samples the
 * switch current channel for the full measurement window and keeps the
 * peak. Both sides re-check the interlock every sample tick and share one
 * abort flag, so a block seen by either stops both within a tick. The
 * measurement thread is always joined before a verdict is produced.
 *
 * The runner never mutates the station; apply_verdict() does that on the
 * store's copy.
 */
class StationCycleRunner {
private:
    ActuatorModule& actuator_;
    SensorModule& sensors_;
    SafetyInterlock& interlock_;
    CycleTiming timing_;

    /**
     * @brief Abort signal shared by the motion and measurement sides
     */
    struct AbortSignal {
        std::atomic<bool> raised{false};
        std::mutex mutex;
        std::string reason;

        void raise(const std::string& why) {
            std::lock_guard<std::mutex> lock(mutex);
            if (reason.empty()) reason = why;
            raised.store(true);
        }

        std::string get_reason() {
            std::lock_guard<std::mutex> lock(mutex);
            return reason;
        }
    };

public:
    StationCycleRunner(ActuatorModule& actuator, SensorModule& sensors,
                       SafetyInterlock& interlock, const CycleTiming& timing)
        : actuator_(actuator), sensors_(sensors), interlock_(interlock), timing_(timing) {}

    /**
     * @brief Run one full actuation cycle for a station
     * @param station Station snapshot (only its id is used)
     * @param settings Settings snapshot providing the pass threshold
     * @return Verdict; aborted_reason is set if the interlock interrupted the cycle
     */
    CycleVerdict run_cycle(const Station& station, const SystemSettings& settings) {
        CycleVerdict verdict;
        verdict.station_id = station.id;

        auto gate = interlock_.evaluate();
        if (!gate) {
            verdict.aborted_reason = gate.reason;
            return verdict;
        }

        AbortSignal abort;
        double peak_current = 0.0;

        std::thread measurement([&]() { measure(abort, peak_current); });

        try {
            run_motion(station.id, abort, verdict);
        } catch (...) {
            abort.raise("error");
            measurement.join();
            throw;
        }
        measurement.join();

        verdict.peak_current = peak_current;
        if (abort.raised.load()) {
            verdict.aborted_reason = abort.get_reason();
            std::cout << "StationCycleRunner: station " << station.id << " cycle aborted ("
                      << verdict.aborted_reason << ")" << std::endl;
            actuator_.enter_safe_state();
            return verdict;
        }

        verdict.passed = peak_current >= settings.switch_current_threshold;
        std::cout << "StationCycleRunner: station " << station.id << " peak "
                  << std::fixed << std::setprecision(2) << peak_current << " A -> "
                  << (verdict.passed ? "PASS" : "FAIL") << " (threshold "
                  << settings.switch_current_threshold << " A)" << std::endl;
        return verdict;
    }

    const CycleTiming& timing() const { return timing_; }

private:
    void run_motion(int station_id, AbortSignal& abort, CycleVerdict& verdict) {
        move(station_id, timing_.press_angle, verdict);
        if (!hold(timing_.press_duration, abort)) return;

        auto gate = interlock_.evaluate();
        if (!gate) {
            abort.raise(gate.reason);
            return;
        }

        move(station_id, timing_.return_angle, verdict);
        hold(timing_.return_duration, abort);
    }

    void move(int station_id, double angle, CycleVerdict& verdict) {
        try {
            actuator_.command(station_id, angle);
        } catch (const ActuationError& e) {
            std::cerr << "StationCycleRunner: station " << station_id << " move to "
                      << angle << " deg failed: " << e.what() << std::endl;
            if (verdict.fault.empty()) verdict.fault = e.what();
        }
    }

    // Returns false if the hold was cut short by an abort.
    bool hold(std::chrono::milliseconds duration, AbortSignal& abort) {
        return sleep_sliced(duration, timing_.sample_interval, [&]() {
            if (abort.raised.load()) return true;
            auto gate = interlock_.evaluate();
            if (!gate) {
                abort.raise(gate.reason);
                return true;
            }
            return false;
        });
    }

    void measure(AbortSignal& abort, double& peak_current) {
        const auto end = std::chrono::steady_clock::now() + timing_.cycle_duration;
        while (std::chrono::steady_clock::now() < end) {
            if (abort.raised.load()) return;

            auto gate = interlock_.evaluate();
            if (!gate) {
                abort.raise(gate.reason);
                return;
            }

            auto current = sensors_.latest(kSwitchCurrentChannel);
            if (current) {
                peak_current = std::max(peak_current, *current);
            }
            std::this_thread::sleep_for(timing_.sample_interval);
        }
    }
};
