#pragma once
#include <chrono>
#include <cstdint>
#include <string>

/**
 * @brief Machine run state as seen by the operator and the interlock
 *
 * Only On permits servo motion. Off and Disabled both demand safe state.
 */
enum class MachineState {
    On,
    Off,
    Disabled
};

inline std::string to_string(MachineState s) {
    switch (s) {
        case MachineState::On: return "on";
        case MachineState::Off: return "off";
        case MachineState::Disabled: return "disabled";
    }
    return "off";
}

/**
 * @brief Parse a machine state name ("on", "off", "disabled")
 * @return false if the name is not recognised; out is left untouched
 */
inline bool parse_machine_state(const std::string& name, MachineState& out) {
    if (name == "on") { out = MachineState::On; return true; }
    if (name == "off") { out = MachineState::Off; return true; }
    if (name == "disabled") { out = MachineState::Disabled; return true; }
    return false;
}

/**
 * @brief One test station: a servo pressing one keyswitch
 */
struct Station {
    int id{0};                       ///< Station number, 1..N
    bool enabled{false};             ///< Scheduler actuates only enabled stations
    std::uint64_t current_cycles{0}; ///< Completed cycle attempts
    std::uint32_t switch_failures{0}; ///< Cycles whose peak current stayed below threshold
    double switch_current{0.0};      ///< Peak current of the last completed cycle (A)
    double motor_current{0.0};       ///< Last motor current reading (A), reported only
    std::uint32_t motor_failures{0}; ///< Motor failure counter, reported only
};

/**
 * @brief Operator settings, re-read by the scheduler every iteration
 */
struct SystemSettings {
    int cycles_per_minute{6};               ///< Aggregate throughput across enabled stations
    double cutoff_voltage{11.1};            ///< Supply voltage below which the interlock debounces
    double switch_current_threshold{5.0};   ///< Peak current at/above this passes (A)
    std::uint32_t switch_failure_threshold{10}; ///< Failures at which a station auto-disables
    double motor_current_threshold{100.0};  ///< Reported only
    std::uint32_t motor_failure_threshold{10}; ///< Reported only
    std::uint64_t cycle_limit{100000};      ///< Reported only
};

/**
 * @brief Machine-wide state record shared with the control surface
 */
struct MachineRecord {
    MachineState machine_state{MachineState::Off};
    bool timer_active{false};
    std::chrono::system_clock::time_point timer_end{};  ///< Wall-clock countdown deadline
    double supply_voltage{0.0};                         ///< Last supply reading (V)
};

/**
 * @brief Outcome of one station cycle
 *
 * Produced once per station per scheduler pass and consumed immediately.
 */
struct CycleVerdict {
    int station_id{0};
    double peak_current{0.0};
    bool passed{false};
    std::string aborted_reason;   ///< Non-empty when the cycle was interrupted
    std::string fault;            ///< Actuation error text for a degraded cycle

    bool aborted() const { return !aborted_reason.empty(); }
    bool degraded() const { return !fault.empty(); }
};

/**
 * @brief One completed cycle as recorded in the history log
 */
struct HistoryRecord {
    int station_id{0};
    std::uint64_t current_cycles{0};
    std::uint32_t switch_failures{0};
    std::uint32_t motor_failures{0};
    double switch_current{0.0};
    double motor_current{0.0};
    int cycles_per_minute{0};
    std::uint64_t cycle_limit{0};
    double supply_voltage{0.0};
    MachineState machine_state{MachineState::Off};
    std::chrono::system_clock::time_point timestamp{};
};

/**
 * @brief Apply a completed cycle's verdict to its station record
 *
 * The cycle counter always advances; the failure counter advances only on a
 * failed verdict. Aborted verdicts leave the station untouched.
 *
 * @return true only on the call that disables the station because its
 *         failure count reached the threshold
 */
inline bool apply_verdict(Station& station, const CycleVerdict& verdict,
                          const SystemSettings& settings) {
    if (verdict.aborted()) {
        return false;
    }

    station.switch_current = verdict.peak_current;
    station.current_cycles += 1;
    if (!verdict.passed) {
        station.switch_failures += 1;
    }

    if (station.enabled && station.switch_failures >= settings.switch_failure_threshold) {
        station.enabled = false;
        return true;
    }
    return false;
}
