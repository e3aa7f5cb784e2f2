#pragma once
#include "voltage_input.hpp"
#include "../core/errors.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <utility>

/**
 * @brief Simulated analog voltage input
 *
 * Holds a settable voltage with optional Gaussian noise. set_voltage()
 * plays the role of the physical signal changing: it updates what the next
 * read returns and, like an event-driven hub, notifies the change handler.
 * Open and read failures can be injected.
 */
class SimVoltageInput : public IVoltageInput {
private:
    int port_;
    std::atomic<double> voltage_;
    std::atomic<bool> open_{false};
    std::atomic<bool> fail_open_{false};
    std::atomic<bool> fail_reads_{false};
    std::atomic<double> noise_std_{0.0};   ///< Noise standard deviation (V)
    std::atomic<std::uint64_t> read_count_{0};

    mutable std::mutex mutex_;             ///< Guards handler and generator
    ChangeHandler handler_;
    std::mt19937 gen_{std::random_device{}()};
    std::normal_distribution<double> normal_{0.0, 1.0};

public:
    explicit SimVoltageInput(int port = 0, double initial_voltage = 0.0)
        : port_(port), voltage_(initial_voltage) {}

    bool open(std::chrono::milliseconds) override {
        if (fail_open_.load()) return false;
        open_.store(true);
        return true;
    }

    void close() override { open_.store(false); }

    bool is_open() const override { return open_.load(); }

    double read_voltage() override {
        read_count_.fetch_add(1);
        if (!open_.load()) {
            throw SensorError("voltage input on port " + std::to_string(port_) + " is not open");
        }
        if (fail_reads_.load()) {
            throw SensorError("voltage input on port " + std::to_string(port_) + " read failed");
        }
        return voltage_.load() + noise();
    }

    void set_change_handler(ChangeHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    int port() const override { return port_; }

    /**
     * @brief Change the simulated signal and report it to the handler
     */
    void set_voltage(double v) {
        voltage_.store(v);
        ChangeHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = handler_;
        }
        if (handler && open_.load()) {
            handler(v);
        }
    }

    void set_noise(double std_dev) { noise_std_.store(std_dev); }
    void set_fail_open(bool fail) { fail_open_.store(fail); }
    void set_fail_reads(bool fail) { fail_reads_.store(fail); }
    std::uint64_t read_count() const { return read_count_.load(); }

private:
    double noise() {
        double sd = noise_std_.load();
        if (sd <= 0.0) return 0.0;
        std::lock_guard<std::mutex> lock(mutex_);
        return sd * normal_(gen_);
    }
};
