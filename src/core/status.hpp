#pragma once
#include "model.hpp"
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief Scheduler loop counters
 */
struct LoopStats {
    std::uint64_t passes{0};            ///< Completed scheduler iterations that ran stations
    std::uint64_t cycles{0};            ///< Completed (non-aborted) station cycles
    std::uint64_t aborted_cycles{0};    ///< Cycles interrupted by the interlock
    std::uint64_t auto_disables{0};     ///< Stations disabled on reaching the failure threshold
    std::uint64_t interval_overruns{0}; ///< Cycles that took longer than their interval
    std::uint64_t blocked_iterations{0}; ///< Iterations spent blocked, idle or unconfigured
};

/**
 * @brief Status snapshot published to the operator interface
 *
 * Built after every scheduler pass, every completed cycle and every safety
 * transition, and on request.
 */
struct StatusSnapshot {
    double t_sec{0.0};                  ///< Seconds since process start
    MachineState machine_state{MachineState::Off};
    bool timer_active{false};
    double timer_remaining_sec{0.0};
    double supply_voltage{0.0};
    bool safe_state{true};              ///< Actuator SafeStateFlag
    bool actuator_connected{false};
    std::string last_trip_reason;       ///< Last interlock-caused transition, if any
    std::vector<Station> stations;
    LoopStats loop;

    json to_json() const {
        json st = json::array();
        for (const auto& s : stations) {
            st.push_back({{"id", s.id},
                          {"enabled", s.enabled},
                          {"current_cycles", s.current_cycles},
                          {"switch_failures", s.switch_failures},
                          {"switch_current", s.switch_current},
                          {"motor_failures", s.motor_failures},
                          {"motor_current", s.motor_current}});
        }
        return {{"t", t_sec},
                {"machine_state", ::to_string(machine_state)},
                {"timer_active", timer_active},
                {"timer_remaining", timer_remaining_sec},
                {"supply_voltage", supply_voltage},
                {"safe_state", safe_state},
                {"connected", actuator_connected},
                {"last_trip", last_trip_reason},
                {"stations", st},
                {"loop", {{"passes", loop.passes},
                          {"cycles", loop.cycles},
                          {"aborted", loop.aborted_cycles},
                          {"auto_disables", loop.auto_disables},
                          {"overruns", loop.interval_overruns},
                          {"blocked", loop.blocked_iterations}}}};
    }

    /**
     * @brief Format snapshot as a one-line summary for the console
     */
    std::string to_string() const {
        char buffer[256];
        int enabled = 0;
        for (const auto& s : stations) {
            if (s.enabled) ++enabled;
        }
        std::snprintf(buffer, sizeof(buffer),
            "Status{t=%.1fs, machine=%s, safe=%s, connected=%s, supply=%.2fV, "
            "enabled=%d/%zu, cycles=%llu, aborted=%llu}",
            t_sec, ::to_string(machine_state).c_str(),
            safe_state ? "yes" : "no", actuator_connected ? "yes" : "no",
            supply_voltage, enabled, stations.size(),
            static_cast<unsigned long long>(loop.cycles),
            static_cast<unsigned long long>(loop.aborted_cycles));
        return std::string(buffer);
    }
};
