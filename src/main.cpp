#include <iostream>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <memory>
#include <vector>

#include "config/hardware_config.hpp"
#include "core/errors.hpp"
#include "hw/sim_servo_bus.hpp"
#include "hw/sim_voltage_input.hpp"
#include "actuation/actuator_module.hpp"
#include "actuation/sensor_module.hpp"
#include "store/data_store.hpp"
#include "safety/safety_interlock.hpp"
#include "control/station_cycle_runner.hpp"
#include "control/actuation_scheduler.hpp"
#include "control/api.hpp"
#include "ipc/telemetry_pub.hpp"
#include "ipc/control_rep.hpp"

// Global flag for clean shutdown
std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    (void)signal;
    shutdown_requested.store(true);
}

namespace {

constexpr int kStationCount = 4;
constexpr double kSimSupplyVoltage = 13.2;   // Healthy 12 V lead-acid supply under float charge
constexpr double kSimClosureCurrent = 8.0;   // Current through a closed switch (A)

}  // namespace

int main(int argc, char** argv) {
    std::cout << "Switch Tester - Starting up..." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    HardwareConfig cfg;
    try {
        if (argc > 1) {
            cfg = load_hardware_config(argv[1]);
            std::cout << "Loaded hardware configuration from " << argv[1] << std::endl;
        } else {
            cfg.validate();
            std::cout << "Using built-in hardware configuration" << std::endl;
        }
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    try {
        // Simulated rig: one servo per station, a shared switch-current channel
        // that closes while any servo sits at the press position, and a supply rail.
        std::cout << "Initializing hardware simulation..." << std::endl;
        std::vector<std::uint8_t> servo_ids;
        for (const auto& kv : cfg.servo.servo_ids) {
            servo_ids.push_back(static_cast<std::uint8_t>(kv.second));
        }
        SimServoBus bus(servo_ids);

        SensorModule::InputMap inputs;
        SimVoltageInput* switch_input = nullptr;
        SimVoltageInput* supply_input = nullptr;
        LinearTransfer switch_transfer;
        auto conv = cfg.sensors.conversions.find(kSwitchCurrentChannel);
        if (conv != cfg.sensors.conversions.end()) switch_transfer = conv->second;

        for (const auto& kv : cfg.sensors.ports) {
            double initial = 0.0;
            if (kv.first == kSwitchCurrentChannel) initial = switch_transfer.offset;
            if (kv.first == kSupplyVoltageChannel) initial = kSimSupplyVoltage;
            auto input = std::make_unique<SimVoltageInput>(kv.second, initial);
            if (kv.first == kSwitchCurrentChannel) switch_input = input.get();
            if (kv.first == kSupplyVoltageChannel) supply_input = input.get();
            inputs[kv.first] = std::move(input);
        }
        if (supply_input) supply_input->set_noise(0.02);

        const std::uint32_t press_position = ActuatorModule::degrees_to_position(cfg.servo.press_angle);
        const std::uint32_t return_position = ActuatorModule::degrees_to_position(cfg.servo.return_angle);
        const std::uint32_t closed_above = (press_position + return_position) / 2;
        bus.set_goal_listener([switch_input, switch_transfer, closed_above](std::uint8_t, std::uint32_t position) {
            if (!switch_input) return;
            bool closed = position > closed_above;
            double amps = closed ? kSimClosureCurrent : 0.0;
            switch_input->set_voltage(switch_transfer.offset + switch_transfer.sensitivity * amps);
        });

        MemoryDataStore store;
        store.seed_defaults(kStationCount);

        SensorModule sensors(cfg.sensors, std::move(inputs));
        sensors.start();

        ActuatorModule actuator(bus, cfg.servo);
        if (!actuator.connect()) {
            std::cerr << "Servo bus " << bus.name() << " unavailable, machine held in safe state" << std::endl;
        }

        SafetyInterlock interlock(store, [&sensors]() { return sensors.latest(kSupplyVoltageChannel); });
        StationCycleRunner runner(actuator, sensors, interlock, CycleTiming::from_config(cfg));
        ActuationScheduler scheduler(store, interlock, actuator, runner, cfg.scheduler);
        ControlAPI api(store, actuator, sensors, interlock, &scheduler);

        std::cout << "Setting up IPC..." << std::endl;
        TelemetryPub telemetry_pub(cfg.ipc.telemetry_endpoint);
        ControlRep control_rep(cfg.ipc.control_endpoint);

        if (!telemetry_pub.is_connected()) {
            std::cerr << "Failed to bind telemetry publisher" << std::endl;
            return 1;
        }

        if (!control_rep.is_connected()) {
            std::cerr << "Failed to bind control responder" << std::endl;
            return 1;
        }

        auto publish_status = [&]() { telemetry_pub.send(api.status_snapshot().to_json().dump()); };
        scheduler.set_status_callback(publish_status);
        interlock.set_trip_callback([&](const std::string& reason) {
            std::cout << "Interlock tripped: " << reason << std::endl;
            publish_status();
        });

        std::cout << "System ready! " << kStationCount << " stations, machine off" << std::endl;
        std::cout << "Connect operator interface to:" << std::endl;
        std::cout << "  Status:  " << telemetry_pub.get_bind_address() << std::endl;
        std::cout << "  Control: " << control_rep.get_bind_address() << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;

        std::thread scheduler_thread([&]() {
            try {
                scheduler.run();
            } catch (const std::exception& e) {
                std::cerr << "Scheduler error: " << e.what() << std::endl;
                shutdown_requested.store(true);
            }
        });

        // Serve control commands and keep the machine record's supply reading fresh
        auto last_stats_time = std::chrono::steady_clock::now();
        while (!shutdown_requested.load()) {
            if (control_rep.poll(100)) {
                std::string request = control_rep.recv();
                std::string response = api.handle_command(request);
                if (!control_rep.reply(response)) {
                    std::cerr << "Control reply failed" << std::endl;
                }
                publish_status();
            }

            auto supply = sensors.latest(kSupplyVoltageChannel);
            if (supply) {
                double v = *supply;
                store.update_machine([v](MachineRecord& m) { m.supply_voltage = v; });
            }

            auto now = std::chrono::steady_clock::now();
            if (now - last_stats_time >= std::chrono::seconds(10)) {
                auto stats = scheduler.get_stats();
                std::cout << "Loop stats: " << stats.passes << " passes, "
                          << stats.cycles << " cycles, "
                          << stats.aborted_cycles << " aborted, "
                          << stats.auto_disables << " auto-disabled, "
                          << stats.interval_overruns << " overruns" << std::endl;
                std::cout << api.status_snapshot().to_string() << std::endl;
                last_stats_time = now;
            }
        }

        // Clean shutdown
        std::cout << "\nShutting down..." << std::endl;
        scheduler.stop();
        if (scheduler_thread.joinable()) {
            scheduler_thread.join();
        }
        if (actuator.is_connected() && !actuator.enter_safe_state()) {
            std::cerr << "Safe state not fully reached on shutdown" << std::endl;
        }
        actuator.disconnect();
        sensors.stop();

        std::cout << "Switch Tester stopped" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
