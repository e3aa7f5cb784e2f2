#pragma once
#include "../config/hardware_config.hpp"
#include "../core/errors.hpp"
#include "../hw/servo_bus.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief One current-limited servo per station with a fail-safe state machine
 *
 * States:
 * - Armed: every servo configured for current-based position control with
 *   holding torque on; motion commands are accepted
 * - Safe: servos parked at 0 degrees with holding torque removed; motion
 *   commands are refused without touching the bus
 *
 * The module starts Safe and only becomes Armed through a fully successful
 * connect() or exit_safe_state(). Entering Safe is best effort across all
 * servos; leaving it is all-or-nothing. All bus traffic is serialised by
 * the module mutex, so a safe-state sweep always runs to completion.
 */
class ActuatorModule {
public:
    enum class State {
        Armed,
        Safe
    };

private:
    IServoBus& bus_;
    ServoConfig cfg_;
    mutable std::mutex mutex_;
    std::atomic<bool> connected_{false};
    std::atomic<State> state_{State::Safe};

public:
    ActuatorModule(IServoBus& bus, const ServoConfig& cfg) : bus_(bus), cfg_(cfg) {}

    ActuatorModule(const ActuatorModule&) = delete;
    ActuatorModule& operator=(const ActuatorModule&) = delete;

    /**
     * @brief Open the bus and configure every servo
     * @return true if every servo was set up; the module is then Armed
     */
    bool connect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connected_.load()) return true;

        if (!bus_.open()) {
            std::cerr << "ActuatorModule: failed to open servo bus " << bus_.name() << std::endl;
            return false;
        }

        for (const auto& kv : cfg_.servo_ids) {
            if (!setup_servo(static_cast<std::uint8_t>(kv.second))) {
                std::cerr << "ActuatorModule: servo setup failed, releasing bus" << std::endl;
                release_all_torque();
                bus_.close();
                state_.store(State::Safe);
                return false;
            }
        }

        connected_.store(true);
        state_.store(State::Armed);
        std::cout << "ActuatorModule: connected and configured " << cfg_.servo_ids.size()
                  << " servos on " << bus_.name() << std::endl;
        return true;
    }

    /**
     * @brief Remove holding torque from every servo and close the bus
     */
    void disconnect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_.load()) return;
        release_all_torque();
        bus_.close();
        connected_.store(false);
        state_.store(State::Safe);
        std::cout << "ActuatorModule: disconnected" << std::endl;
    }

    /**
     * @brief Move a station's servo to an angle
     * @param station_id Station number
     * @param angle_deg Target angle in degrees; clamped to the servo's range
     * @throws ActuationError if Safe, disconnected, unmapped or not acknowledged
     */
    void command(int station_id, double angle_deg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load() == State::Safe) {
            throw ActuationError("cannot command station " + std::to_string(station_id) +
                                 ": safe state is active");
        }
        if (!connected_.load()) {
            throw ActuationError("cannot command station " + std::to_string(station_id) +
                                 ": servo bus not connected");
        }
        auto it = cfg_.servo_ids.find(station_id);
        if (it == cfg_.servo_ids.end()) {
            throw ActuationError("no servo mapped for station " + std::to_string(station_id));
        }

        auto servo_id = static_cast<std::uint8_t>(it->second);
        std::uint32_t position = degrees_to_position(angle_deg);
        auto r = bus_.write4(servo_id, servo_reg::kGoalPosition, position);
        if (r != IServoBus::CommResult::Success) {
            throw ActuationError("servo " + std::to_string(servo_id) + " goal position write failed: " +
                                 IServoBus::result_to_string(r));
        }
    }

    /**
     * @brief Park every servo and remove holding torque
     *
     * No-op when already Safe. Otherwise commands every servo to 0 degrees,
     * waits the settle duration for mechanical travel, disables torque on
     * every servo and only then reports Safe. A failed write on one servo is
     * logged and the sweep continues with the next.
     *
     * @return true if every write was acknowledged
     */
    bool enter_safe_state() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load() == State::Safe) return true;

        std::cout << "ActuatorModule: entering safe state - parking servos and removing torque" << std::endl;
        bool all_ok = park_and_release();
        state_.store(State::Safe);
        std::cout << "ActuatorModule: safe state reached" << std::endl;
        return all_ok;
    }

    /**
     * @brief Reconfigure every servo for motion
     *
     * No-op when already Armed. Runs the full setup sequence on every servo;
     * the first failure aborts the transition, servos configured so far are
     * parked and de-energised again, and the module stays Safe.
     *
     * @return true if the module is Armed
     */
    bool exit_safe_state() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load() == State::Armed) return true;
        if (!connected_.load()) {
            std::cerr << "ActuatorModule: cannot leave safe state, servo bus not connected" << std::endl;
            return false;
        }

        std::cout << "ActuatorModule: leaving safe state - reconfiguring servos" << std::endl;
        for (const auto& kv : cfg_.servo_ids) {
            if (!setup_servo(static_cast<std::uint8_t>(kv.second))) {
                std::cerr << "ActuatorModule: failed to leave safe state, servo "
                          << kv.second << " not configured" << std::endl;
                park_and_release();
                return false;
            }
        }

        state_.store(State::Armed);
        std::cout << "ActuatorModule: armed, all servos ready" << std::endl;
        return true;
    }

    bool is_connected() const { return connected_.load(); }
    bool is_safe() const { return state_.load() == State::Safe; }
    State state() const { return state_.load(); }

    /**
     * @brief Convert degrees to servo position units
     *
     * Linear over one full turn, clamped to [0, resolution - 1].
     */
    static std::uint32_t degrees_to_position(double degrees) {
        double raw = std::floor(degrees * servo_reg::kPositionResolution / 360.0);
        double clamped = std::max(0.0, std::min(raw, double(servo_reg::kPositionResolution - 1)));
        return static_cast<std::uint32_t>(clamped);
    }

    static double position_to_degrees(std::uint32_t position) {
        return position * 360.0 / servo_reg::kPositionResolution;
    }

    /**
     * @brief Goal current register value for a percentage of the maximum
     */
    static std::uint16_t current_limit_value(double percent) {
        double p = std::max(0.0, std::min(percent, 100.0));
        return static_cast<std::uint16_t>(p * servo_reg::kMaxGoalCurrent / 100.0);
    }

private:
    // Torque must be off to change the operating mode.
    bool setup_servo(std::uint8_t id) {
        auto r = bus_.write1(id, servo_reg::kTorqueEnable, 0);
        if (r != IServoBus::CommResult::Success) {
            std::cerr << "ActuatorModule: failed to disable torque on servo " << int(id) << ": "
                      << IServoBus::result_to_string(r) << std::endl;
            return false;
        }

        r = bus_.write1(id, servo_reg::kOperatingMode, servo_reg::kCurrentBasedPositionMode);
        if (r != IServoBus::CommResult::Success) {
            std::cerr << "ActuatorModule: failed to set operating mode on servo " << int(id) << ": "
                      << IServoBus::result_to_string(r) << std::endl;
            return false;
        }

        r = bus_.write2(id, servo_reg::kGoalCurrent, current_limit_value(cfg_.current_limit_percent));
        if (r != IServoBus::CommResult::Success) {
            std::cerr << "ActuatorModule: failed to set current limit on servo " << int(id) << ": "
                      << IServoBus::result_to_string(r) << std::endl;
            return false;
        }

        r = bus_.write1(id, servo_reg::kTorqueEnable, 1);
        if (r != IServoBus::CommResult::Success) {
            std::cerr << "ActuatorModule: failed to enable torque on servo " << int(id) << ": "
                      << IServoBus::result_to_string(r) << std::endl;
            return false;
        }
        return true;
    }

    // Goal 0 on every servo, settle, then torque off on every servo. Best effort.
    bool park_and_release() {
        bool all_ok = true;
        for (const auto& kv : cfg_.servo_ids) {
            auto servo_id = static_cast<std::uint8_t>(kv.second);
            auto r = bus_.write4(servo_id, servo_reg::kGoalPosition, 0);
            if (r != IServoBus::CommResult::Success) {
                std::cerr << "ActuatorModule: failed to park servo " << int(servo_id) << ": "
                          << IServoBus::result_to_string(r) << std::endl;
                all_ok = false;
            }
        }

        std::this_thread::sleep_for(cfg_.settle_duration);

        if (!release_all_torque()) {
            all_ok = false;
        }
        return all_ok;
    }

    bool release_all_torque() {
        bool all_ok = true;
        for (const auto& kv : cfg_.servo_ids) {
            auto servo_id = static_cast<std::uint8_t>(kv.second);
            auto r = bus_.write1(servo_id, servo_reg::kTorqueEnable, 0);
            if (r != IServoBus::CommResult::Success) {
                std::cerr << "ActuatorModule: failed to disable torque on servo " << int(servo_id)
                          << ": " << IServoBus::result_to_string(r) << std::endl;
                all_ok = false;
            }
        }
        return all_ok;
    }
};
