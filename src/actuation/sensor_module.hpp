#pragma once
#include "../config/hardware_config.hpp"
#include "../core/clock.hpp"
#include "../hw/voltage_input.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

/// Channel carrying the switch closure current
inline const std::string kSwitchCurrentChannel = "switch_current";
/// Channel carrying the supply voltage watched by the interlock
inline const std::string kSupplyVoltageChannel = "supply_voltage";

/**
 * @brief Last-known readings of every sensing channel
 *
 * Wraps the voltage inputs of the rig and keeps one value per channel,
 * converted to physical units where the channel has a transfer function.
 * Two delivery modes:
 * - Push: each input calls back into the module when its value changes
 * - Pull: a poll thread reads every channel once per data interval
 *
 * latest() never blocks on hardware; it copies whatever was last stored.
 */
class SensorModule {
public:
    using Conversion = std::function<double(double)>;
    using InputMap = std::map<std::string, std::unique_ptr<IVoltageInput>>;

private:
    SensorMode mode_;
    std::chrono::milliseconds interval_;
    InputMap inputs_;
    std::map<std::string, Conversion> conversions_;

    mutable std::mutex readings_mutex_;
    std::map<std::string, double> readings_;

    std::thread poll_thread_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_{false};
    std::atomic<bool> started_{false};
    std::atomic<std::uint64_t> read_errors_{0};

public:
    /**
     * @brief Construct from configuration and the channel inputs
     * @param cfg Sensor mode, interval and per-channel linear conversions
     * @param inputs Channel name -> voltage input; ownership moves to the module
     */
    SensorModule(const SensorConfig& cfg, InputMap inputs)
        : mode_(cfg.mode), interval_(cfg.data_interval), inputs_(std::move(inputs)) {
        for (const auto& kv : cfg.conversions) {
            LinearTransfer t = kv.second;
            conversions_[kv.first] = [t](double v) { return t.apply(v); };
        }
    }

    SensorModule(const SensorModule&) = delete;
    SensorModule& operator=(const SensorModule&) = delete;

    ~SensorModule() { stop(); }

    /**
     * @brief Replace or add the conversion for one channel
     *
     * Must be called before start().
     */
    void set_conversion(const std::string& channel, Conversion conversion) {
        conversions_[channel] = std::move(conversion);
    }

    /**
     * @brief Attach inputs and begin delivering readings
     *
     * An input that fails to attach is logged and left out; the remaining
     * channels still run.
     */
    void start() {
        if (started_.exchange(true)) return;

        for (auto& kv : inputs_) {
            const std::string& channel = kv.first;
            auto& input = kv.second;
            if (!input->open(std::chrono::milliseconds(5000))) {
                std::cerr << "SensorModule: failed to attach " << channel
                          << " on port " << input->port() << std::endl;
                continue;
            }
            std::cout << "SensorModule: " << channel << " attached on port "
                      << input->port() << std::endl;
            if (mode_ == SensorMode::Push) {
                input->set_change_handler([this, channel](double voltage) {
                    on_voltage_change(channel, voltage);
                });
            }
        }

        if (mode_ == SensorMode::Pull) {
            {
                std::lock_guard<std::mutex> lock(stop_mutex_);
                stop_requested_ = false;
            }
            poll_thread_ = std::thread([this]() { poll_loop(); });
            std::cout << "SensorModule: polling every " << interval_.count() << " ms" << std::endl;
        } else {
            std::cout << "SensorModule: running in push mode" << std::endl;
        }
    }

    /**
     * @brief Stop polling and release every input
     *
     * Safe to call when never started and safe to call repeatedly.
     */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(stop_mutex_);
            stop_requested_ = true;
        }
        stop_cv_.notify_all();
        if (poll_thread_.joinable()) {
            poll_thread_.join();
        }

        if (!started_.exchange(false)) return;

        for (auto& kv : inputs_) {
            kv.second->set_change_handler(nullptr);
            if (kv.second->is_open()) {
                kv.second->close();
                std::cout << "SensorModule: " << kv.first << " closed" << std::endl;
            }
        }
    }

    /**
     * @brief Store a raw voltage for a channel, converting it if configured
     *
     * This is the handler capability given to push-mode backends; the poll
     * thread uses the same path.
     */
    void on_voltage_change(const std::string& channel, double voltage) {
        double value = voltage;
        auto it = conversions_.find(channel);
        if (it != conversions_.end()) {
            value = it->second(voltage);
        }
        std::lock_guard<std::mutex> lock(readings_mutex_);
        readings_[channel] = value;
    }

    /**
     * @brief Copy of the last reading per channel (may be empty)
     */
    std::map<std::string, double> latest() const {
        std::lock_guard<std::mutex> lock(readings_mutex_);
        return readings_;
    }

    /**
     * @brief Last reading of one channel, if any was observed
     */
    std::optional<double> latest(const std::string& channel) const {
        std::lock_guard<std::mutex> lock(readings_mutex_);
        auto it = readings_.find(channel);
        if (it == readings_.end()) return std::nullopt;
        return it->second;
    }

    SensorMode mode() const { return mode_; }
    bool is_running() const { return started_.load(); }
    std::uint64_t read_errors() const { return read_errors_.load(); }

private:
    void poll_loop() {
        PeriodicClock clk(interval_);
        while (true) {
            for (auto& kv : inputs_) {
                if (!kv.second->is_open()) continue;
                try {
                    on_voltage_change(kv.first, kv.second->read_voltage());
                } catch (const std::exception& e) {
                    read_errors_.fetch_add(1);
                    std::cerr << "SensorModule: error reading " << kv.first << ": "
                              << e.what() << std::endl;
                }
            }

            std::unique_lock<std::mutex> lock(stop_mutex_);
            if (stop_cv_.wait_until(lock, clk.next, [this]() { return stop_requested_; })) {
                return;
            }
            clk.advance();
        }
    }
};
