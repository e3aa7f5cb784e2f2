#pragma once
#include "servo_bus.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

/**
 * @brief Simulated servo bus
 *
 * Models a chain of current-limited position servos behind one port:
 * - Per-servo register file (operating mode, torque, goal current, goal position)
 * - Goal position only taken while torque is enabled, as on real hardware
 * - Unresponsive servos and per-register write failures for fault injection
 * - Write counter for verifying that idempotent transitions touch nothing
 * - Goal listener so a simulated switch can close when its servo presses
 */
class SimServoBus : public IServoBus {
public:
    struct ServoRegisters {
        std::uint8_t operating_mode{0};
        bool torque_enabled{false};
        std::uint16_t goal_current{0};
        std::uint32_t goal_position{0};
        std::uint32_t present_position{0};
    };

    using GoalListener = std::function<void(std::uint8_t id, std::uint32_t position)>;

private:
    mutable std::mutex mutex_;
    std::map<std::uint8_t, ServoRegisters> servos_;
    std::set<std::uint8_t> unresponsive_;
    std::set<std::pair<std::uint8_t, std::uint16_t>> failing_writes_;
    bool open_{false};
    bool fail_open_{false};
    std::atomic<std::uint64_t> write_count_{0};
    GoalListener goal_listener_;
    std::string port_name_;

public:
    /**
     * @brief Construct a bus with the given servo ids attached
     */
    explicit SimServoBus(std::initializer_list<std::uint8_t> ids = {1, 2, 3, 4},
                         const std::string& port_name = "sim://servo-bus")
        : port_name_(port_name) {
        for (auto id : ids) {
            servos_[id] = ServoRegisters{};
        }
    }

    explicit SimServoBus(const std::vector<std::uint8_t>& ids,
                         const std::string& port_name = "sim://servo-bus")
        : port_name_(port_name) {
        for (auto id : ids) {
            servos_[id] = ServoRegisters{};
        }
    }

    bool open() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_open_) return false;
        open_ = true;
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    CommResult write1(std::uint8_t id, std::uint16_t address, std::uint8_t value) override {
        return write(id, address, value);
    }

    CommResult write2(std::uint8_t id, std::uint16_t address, std::uint16_t value) override {
        return write(id, address, value);
    }

    CommResult write4(std::uint8_t id, std::uint16_t address, std::uint32_t value) override {
        return write(id, address, value);
    }

    CommResult read4(std::uint8_t id, std::uint16_t address, std::uint32_t& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) return CommResult::PortClosed;
        auto it = servos_.find(id);
        if (it == servos_.end() || unresponsive_.count(id)) return CommResult::Timeout;
        switch (address) {
            case servo_reg::kGoalPosition: value = it->second.goal_position; break;
            case servo_reg::kPresentPosition: value = it->second.present_position; break;
            case servo_reg::kTorqueEnable: value = it->second.torque_enabled ? 1 : 0; break;
            case servo_reg::kOperatingMode: value = it->second.operating_mode; break;
            case servo_reg::kGoalCurrent: value = it->second.goal_current; break;
            default: return CommResult::HardwareError;
        }
        return CommResult::Success;
    }

    std::string name() const override { return port_name_; }

    // Fault injection

    void set_fail_open(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_open_ = fail;
    }

    void set_unresponsive(std::uint8_t id, bool unresponsive) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (unresponsive) unresponsive_.insert(id);
        else unresponsive_.erase(id);
    }

    void set_write_failure(std::uint8_t id, std::uint16_t address, bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) failing_writes_.insert({id, address});
        else failing_writes_.erase({id, address});
    }

    void set_goal_listener(GoalListener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        goal_listener_ = std::move(listener);
    }

    // Inspection

    std::uint64_t write_count() const { return write_count_.load(); }

    ServoRegisters registers(std::uint8_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servos_.find(id);
        return it == servos_.end() ? ServoRegisters{} : it->second;
    }

private:
    CommResult write(std::uint8_t id, std::uint16_t address, std::uint32_t value) {
        GoalListener listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            write_count_.fetch_add(1);
            if (!open_) return CommResult::PortClosed;
            auto it = servos_.find(id);
            if (it == servos_.end() || unresponsive_.count(id)) return CommResult::Timeout;
            if (failing_writes_.count({id, address})) return CommResult::HardwareError;

            auto& reg = it->second;
            switch (address) {
                case servo_reg::kTorqueEnable:
                    reg.torque_enabled = value != 0;
                    break;
                case servo_reg::kOperatingMode:
                    // Mode is only writable with torque off
                    if (reg.torque_enabled) return CommResult::HardwareError;
                    reg.operating_mode = static_cast<std::uint8_t>(value);
                    break;
                case servo_reg::kGoalCurrent:
                    reg.goal_current = static_cast<std::uint16_t>(value);
                    break;
                case servo_reg::kGoalPosition:
                    if (value >= servo_reg::kPositionResolution) return CommResult::HardwareError;
                    reg.goal_position = value;
                    if (reg.torque_enabled) {
                        reg.present_position = value;
                        listener = goal_listener_;
                    }
                    break;
                default:
                    return CommResult::HardwareError;
            }
        }
        if (listener) {
            listener(id, static_cast<std::uint32_t>(value));
        }
        return CommResult::Success;
    }
};
