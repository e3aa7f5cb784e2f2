#pragma once
#include "../actuation/actuator_module.hpp"
#include "../config/hardware_config.hpp"
#include "../core/clock.hpp"
#include "../core/model.hpp"
#include "../core/status.hpp"
#include "../safety/safety_interlock.hpp"
#include "../store/data_store.hpp"
#include "station_cycle_runner.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Top-level actuation control loop
 *
 * Each iteration re-reads settings and stations from the store, asks the
 * interlock whether the machine may run, arms the actuator if needed and
 * cycles every enabled station once in ascending id order, spacing the
 * cycles so the enabled stations together hit cycles_per_minute.
 *
 * Blocked, idle and unconfigured iterations put the actuator into safe
 * state and back off one idle interval. Waits are sliced so that a machine
 * off request or stop() takes effect within one slice.
 */
class ActuationScheduler {
public:
    /**
     * @brief How an iteration ended
     */
    enum class IterationResult {
        Completed,        ///< Every enabled station was cycled
        Aborted,          ///< Interlock interrupted the pass
        Blocked,          ///< Interlock blocked before any motion
        NoStations,       ///< No station enabled
        MissingSettings,  ///< Settings record absent
        NotConnected,     ///< Servo bus unavailable
        ArmFailed,        ///< exit_safe_state() failed
        Stopped           ///< stop() requested mid-pass
    };

    using StatusCallback = std::function<void()>;

private:
    IDataStore& store_;
    SafetyInterlock& interlock_;
    ActuatorModule& actuator_;
    StationCycleRunner& runner_;
    SchedulerConfig cfg_;

    std::atomic<bool> running_{true};
    bool reported_not_connected_{false};
    StatusCallback status_callback_;

    mutable std::mutex stats_mutex_;
    LoopStats stats_;

public:
    ActuationScheduler(IDataStore& store, SafetyInterlock& interlock, ActuatorModule& actuator,
                       StationCycleRunner& runner, const SchedulerConfig& cfg)
        : store_(store), interlock_(interlock), actuator_(actuator), runner_(runner), cfg_(cfg) {}

    /**
     * @brief Run iterations until stop() is called
     *
     * An exception escaping an iteration is logged and costs one idle
     * interval; it never ends the loop.
     */
    void run() {
        std::cout << "ActuationScheduler: started" << std::endl;
        while (running_.load()) {
            try {
                run_iteration();
            } catch (const std::exception& e) {
                std::cerr << "ActuationScheduler: error in iteration: " << e.what() << std::endl;
                idle();
            }
        }
        std::cout << "ActuationScheduler: stopped" << std::endl;
    }

    void stop() { running_.store(false); }
    bool is_running() const { return running_.load(); }

    /**
     * @brief Execute one scheduler iteration
     */
    IterationResult run_iteration() {
        auto settings = store_.settings();
        if (!settings) {
            std::cerr << "ActuationScheduler: SystemSettings not found, retrying" << std::endl;
            count_blocked();
            idle();
            return IterationResult::MissingSettings;
        }

        if (!actuator_.is_connected()) {
            if (!reported_not_connected_) {
                std::cerr << "ActuationScheduler: servo bus not connected, holding machine in safe state"
                          << std::endl;
                reported_not_connected_ = true;
            }
            count_blocked();
            idle();
            return IterationResult::NotConnected;
        }
        reported_not_connected_ = false;

        auto gate = interlock_.evaluate();
        if (!gate) {
            go_safe(gate.reason);
            count_blocked();
            idle();
            return IterationResult::Blocked;
        }

        std::vector<int> enabled_ids;
        for (const auto& s : store_.stations()) {
            if (s.enabled) enabled_ids.push_back(s.id);
        }
        if (enabled_ids.empty()) {
            go_safe("no stations enabled");
            count_blocked();
            idle();
            return IterationResult::NoStations;
        }

        double interval_s = station_interval_seconds(settings->cycles_per_minute, enabled_ids.size());
        std::cout << "ActuationScheduler: pass over " << enabled_ids.size() << " stations, interval "
                  << std::fixed << std::setprecision(2) << interval_s << " s" << std::endl;

        if (actuator_.is_safe() && !actuator_.exit_safe_state()) {
            std::cerr << "ActuationScheduler: could not arm servos, retrying" << std::endl;
            count_blocked();
            idle();
            return IterationResult::ArmFailed;
        }

        for (int id : enabled_ids) {
            if (!running_.load()) return IterationResult::Stopped;

            gate = interlock_.evaluate();
            if (!gate) {
                go_safe(gate.reason);
                return IterationResult::Aborted;
            }

            auto station = store_.station(id);
            if (!station || !station->enabled) continue;
            auto fresh_settings = store_.settings();
            if (fresh_settings) settings = fresh_settings;

            auto cycle_start = std::chrono::steady_clock::now();
            CycleVerdict verdict = runner_.run_cycle(*station, *settings);

            if (verdict.aborted()) {
                {
                    std::lock_guard<std::mutex> lock(stats_mutex_);
                    stats_.aborted_cycles++;
                }
                // The runner has usually parked the servos already; the abort is still news
                if (!go_safe(verdict.aborted_reason)) notify_status();
                return IterationResult::Aborted;
            }

            record_verdict(verdict, *settings);

            auto elapsed = std::chrono::steady_clock::now() - cycle_start;
            auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(interval_s));
            if (elapsed >= interval) {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.interval_overruns++;
                continue;
            }

            std::string wait_block;
            bool waited = sleep_sliced(interval - elapsed, cfg_.wait_slice, [&]() {
                if (!running_.load()) return true;
                auto g = interlock_.evaluate();
                if (!g) {
                    wait_block = g.reason;
                    return true;
                }
                return false;
            });
            if (!waited) {
                if (!running_.load()) return IterationResult::Stopped;
                go_safe(wait_block);
                return IterationResult::Aborted;
            }
        }

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.passes++;
        }
        notify_status();
        return IterationResult::Completed;
    }

    /**
     * @brief Seconds between consecutive station cycles
     *
     * Spreads cycles_per_minute across the enabled stations:
     * 60 / cycles_per_minute / enabled_count.
     */
    static double station_interval_seconds(int cycles_per_minute, std::size_t enabled_count) {
        if (cycles_per_minute <= 0 || enabled_count == 0) return 0.0;
        return 60.0 / cycles_per_minute / static_cast<double>(enabled_count);
    }

    /**
     * @brief Set callback invoked whenever station or safety state changed
     */
    void set_status_callback(StatusCallback callback) { status_callback_ = std::move(callback); }

    LoopStats get_stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        return stats_;
    }

private:
    void record_verdict(const CycleVerdict& verdict, const SystemSettings& settings) {
        bool disabled = false;
        Station updated;
        bool found = store_.update_station(verdict.station_id, [&](Station& s) {
            disabled = apply_verdict(s, verdict, settings);
            updated = s;
        });
        if (!found) {
            std::cerr << "ActuationScheduler: station " << verdict.station_id
                      << " vanished from the store, verdict dropped" << std::endl;
            return;
        }

        if (!verdict.passed) {
            std::cout << "ActuationScheduler: station " << updated.id << " failure "
                      << updated.switch_failures << "/" << settings.switch_failure_threshold << std::endl;
        }
        if (disabled) {
            std::cout << "ActuationScheduler: station " << updated.id
                      << " disabled due to excessive failures" << std::endl;
        }

        HistoryRecord h;
        h.station_id = updated.id;
        h.current_cycles = updated.current_cycles;
        h.switch_failures = updated.switch_failures;
        h.motor_failures = updated.motor_failures;
        h.switch_current = updated.switch_current;
        h.motor_current = updated.motor_current;
        h.cycles_per_minute = settings.cycles_per_minute;
        h.cycle_limit = settings.cycle_limit;
        auto machine = store_.machine();
        if (machine) {
            h.supply_voltage = machine->supply_voltage;
            h.machine_state = machine->machine_state;
        }
        h.timestamp = std::chrono::system_clock::now();
        store_.append_history(h);

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.cycles++;
            if (disabled) stats_.auto_disables++;
        }
        notify_status();
    }

    // Returns true if this call made the transition (and published status).
    bool go_safe(const std::string& reason) {
        if (actuator_.is_safe()) return false;
        std::cout << "ActuationScheduler: " << reason << ", going to safe state" << std::endl;
        if (!actuator_.enter_safe_state()) {
            std::cerr << "ActuationScheduler: safe state reached with servo errors" << std::endl;
        }
        notify_status();
        return true;
    }

    void idle() {
        sleep_sliced(cfg_.idle_interval, cfg_.wait_slice, [this]() { return !running_.load(); });
    }

    void count_blocked() {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.blocked_iterations++;
    }

    void notify_status() {
        if (status_callback_) status_callback_();
    }
};
