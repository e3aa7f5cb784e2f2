#pragma once
#include "../core/errors.hpp"
#include <chrono>
#include <fstream>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief Linear voltage-to-physical transfer function
 *
 * value = (voltage - offset) / sensitivity
 */
struct LinearTransfer {
    double offset{2.5};          ///< Output voltage at zero input (V)
    double sensitivity{0.0625};  ///< Volts per physical unit

    double apply(double voltage) const { return (voltage - offset) / sensitivity; }
};

/**
 * @brief Servo timing and geometry for the actuation cycle
 */
struct ServoConfig {
    std::chrono::milliseconds press_duration{500};
    std::chrono::milliseconds return_duration{500};
    std::chrono::milliseconds cycle_duration{1000};     ///< Measurement window per station
    std::chrono::milliseconds settle_duration{1000};    ///< Travel time allowed before torque off
    double press_angle{100.0};                          ///< Degrees
    double return_angle{0.0};                           ///< Degrees
    double current_limit_percent{50.0};                 ///< Percent of the servo's max goal current
    std::map<int, int> servo_ids{{1, 1}, {2, 2}, {3, 3}, {4, 4}};  ///< station -> servo id
};

enum class SensorMode {
    Push,   ///< Backend invokes a change handler
    Pull    ///< Poll thread reads every channel on an interval
};

/**
 * @brief Voltage input channels and delivery mode
 */
struct SensorConfig {
    SensorMode mode{SensorMode::Pull};
    std::chrono::milliseconds data_interval{10};
    std::map<std::string, int> ports{{"switch_current", 0}, {"supply_voltage", 1}};
    std::map<std::string, LinearTransfer> conversions{{"switch_current", LinearTransfer{}}};
};

struct SchedulerConfig {
    std::chrono::milliseconds idle_interval{1000};  ///< Back-off when blocked or idle
    std::chrono::milliseconds wait_slice{100};      ///< Interlock poll granularity while waiting
};

struct IpcConfig {
    std::string telemetry_endpoint{"tcp://127.0.0.1:5556"};
    std::string control_endpoint{"tcp://127.0.0.1:5555"};
};

/**
 * @brief Complete hardware configuration for one tester rig
 *
 * Loaded once at startup from a JSON file. Every key is optional; missing
 * keys keep their defaults. Durations are given in seconds (servo) or
 * milliseconds (sensor interval, scheduler) to match the field names.
 */
struct HardwareConfig {
    ServoConfig servo;
    SensorConfig sensors;
    SchedulerConfig scheduler;
    IpcConfig ipc;

    static HardwareConfig from_json(const json& j) {
        HardwareConfig cfg;
        try {
            if (j.contains("servo")) {
                const auto& s = j.at("servo");
                cfg.servo.press_duration = seconds_field(s, "press_duration", cfg.servo.press_duration);
                cfg.servo.return_duration = seconds_field(s, "return_duration", cfg.servo.return_duration);
                cfg.servo.cycle_duration = seconds_field(s, "cycle_duration", cfg.servo.cycle_duration);
                cfg.servo.settle_duration = seconds_field(s, "settle_duration", cfg.servo.settle_duration);
                cfg.servo.press_angle = s.value("default_target_angle", cfg.servo.press_angle);
                cfg.servo.return_angle = s.value("return_angle", cfg.servo.return_angle);
                cfg.servo.current_limit_percent = s.value("current_limit_percent", cfg.servo.current_limit_percent);
                if (s.contains("servo_ids")) {
                    cfg.servo.servo_ids.clear();
                    for (auto it = s.at("servo_ids").begin(); it != s.at("servo_ids").end(); ++it) {
                        cfg.servo.servo_ids[std::stoi(it.key())] = it.value().get<int>();
                    }
                }
            }

            const char* sensor_key = j.contains("sensors") ? "sensors" : "phidgets";
            if (j.contains(sensor_key)) {
                const auto& s = j.at(sensor_key);
                if (s.contains("sensor_mode")) {
                    cfg.sensors.mode = parse_mode(s.at("sensor_mode").get<std::string>());
                }
                cfg.sensors.data_interval = std::chrono::milliseconds(
                    s.value("data_interval", static_cast<long>(cfg.sensors.data_interval.count())));
                if (s.contains("ports")) {
                    cfg.sensors.ports = s.at("ports").get<std::map<std::string, int>>();
                }
                if (s.contains("conversions")) {
                    cfg.sensors.conversions.clear();
                    for (auto it = s.at("conversions").begin(); it != s.at("conversions").end(); ++it) {
                        LinearTransfer t;
                        t.offset = it.value().value("offset", t.offset);
                        t.sensitivity = it.value().value("sensitivity", t.sensitivity);
                        cfg.sensors.conversions[it.key()] = t;
                    }
                }
            }

            if (j.contains("scheduler")) {
                const auto& s = j.at("scheduler");
                cfg.scheduler.idle_interval = std::chrono::milliseconds(
                    s.value("idle_interval_ms", static_cast<long>(cfg.scheduler.idle_interval.count())));
                cfg.scheduler.wait_slice = std::chrono::milliseconds(
                    s.value("wait_slice_ms", static_cast<long>(cfg.scheduler.wait_slice.count())));
            }

            if (j.contains("ipc")) {
                const auto& s = j.at("ipc");
                cfg.ipc.telemetry_endpoint = s.value("telemetry", cfg.ipc.telemetry_endpoint);
                cfg.ipc.control_endpoint = s.value("control", cfg.ipc.control_endpoint);
            }
        } catch (const json::exception& e) {
            throw ConfigError(std::string("invalid hardware configuration: ") + e.what());
        } catch (const std::logic_error& e) {
            throw ConfigError(std::string("invalid hardware configuration: ") + e.what());
        }

        cfg.validate();
        return cfg;
    }

    /**
     * @brief Reject values the actuation loop cannot run with
     * @throws ConfigError naming the offending field
     */
    void validate() const {
        if (servo.servo_ids.empty()) throw ConfigError("servo.servo_ids must not be empty");
        if (servo.current_limit_percent <= 0.0 || servo.current_limit_percent > 100.0)
            throw ConfigError("servo.current_limit_percent must be in (0, 100]");
        if (servo.cycle_duration.count() <= 0) throw ConfigError("servo.cycle_duration must be positive");
        if (sensors.data_interval.count() <= 0) throw ConfigError("sensors.data_interval must be positive");
        if (scheduler.wait_slice.count() <= 0 || scheduler.wait_slice.count() >= 1000)
            throw ConfigError("scheduler.wait_slice_ms must be in (0, 1000)");
        if (scheduler.idle_interval.count() <= 0) throw ConfigError("scheduler.idle_interval_ms must be positive");
        for (const auto& kv : sensors.conversions) {
            if (kv.second.sensitivity == 0.0)
                throw ConfigError("sensors.conversions." + kv.first + ".sensitivity must be non-zero");
        }
    }

    static SensorMode parse_mode(const std::string& name) {
        if (name == "push" || name == "event") return SensorMode::Push;
        if (name == "pull" || name == "polling") return SensorMode::Pull;
        throw ConfigError("unknown sensor_mode: " + name);
    }

private:
    static std::chrono::milliseconds seconds_field(const json& obj, const char* key,
                                                   std::chrono::milliseconds fallback) {
        if (!obj.contains(key)) return fallback;
        double seconds = obj.at(key).get<double>();
        return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0 + 0.5));
    }
};

/**
 * @brief Load and validate a hardware configuration file
 * @throws ConfigError if the file is missing, unparsable or invalid
 */
inline HardwareConfig load_hardware_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open hardware configuration " + path);
    }
    auto j = json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw ConfigError("hardware configuration " + path + " is not a JSON object");
    }
    return HardwareConfig::from_json(j);
}
