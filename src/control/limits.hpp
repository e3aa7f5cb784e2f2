#pragma once
#include "../core/model.hpp"
#include <cstdint>
#include <string>

/**
 * @brief Validation ranges for operator-editable settings
 *
 * Every setting change arriving through the control API is checked here
 * before it reaches the store. The timer ranges bound the countdown the
 * operator may arm.
 */
struct SettingsLimits {
  double cutoff_min{10.5};             ///< Lowest accepted cutoff voltage (V)
  double cutoff_max{13.5};
  double motor_threshold_min{50.0};
  double motor_threshold_max{200.0};
  double switch_threshold_min{0.1};    ///< Lowest accepted switch current threshold (A)
  double switch_threshold_max{50.0};
  std::uint64_t cycle_limit_min{1};
  std::uint64_t cycle_limit_max{1000000};
  std::uint32_t failure_threshold_min{1};
  std::uint32_t failure_threshold_max{1000};
  int cycles_per_minute_min{1};
  int cycles_per_minute_max{12};
  int timer_hours_max{99};
  int timer_minutes_max{59};

  /**
   * @brief Check a complete settings record
   * @param s Candidate settings
   * @param error Set to a description of the first violation
   * @return true if every field is in range
   */
  bool validate(const SystemSettings& s, std::string& error) const {
    if (s.cycles_per_minute < cycles_per_minute_min || s.cycles_per_minute > cycles_per_minute_max) {
      error = "cycles_per_minute out of range";
      return false;
    }
    if (s.cutoff_voltage < cutoff_min || s.cutoff_voltage > cutoff_max) {
      error = "cutoff_voltage out of range";
      return false;
    }
    if (s.switch_current_threshold < switch_threshold_min ||
        s.switch_current_threshold > switch_threshold_max) {
      error = "switch_current_threshold out of range";
      return false;
    }
    if (s.motor_current_threshold < motor_threshold_min ||
        s.motor_current_threshold > motor_threshold_max) {
      error = "motor_current_threshold out of range";
      return false;
    }
    if (s.switch_failure_threshold < failure_threshold_min ||
        s.switch_failure_threshold > failure_threshold_max) {
      error = "switch_failure_threshold out of range";
      return false;
    }
    if (s.motor_failure_threshold < failure_threshold_min ||
        s.motor_failure_threshold > failure_threshold_max) {
      error = "motor_failure_threshold out of range";
      return false;
    }
    if (s.cycle_limit < cycle_limit_min || s.cycle_limit > cycle_limit_max) {
      error = "cycle_limit out of range";
      return false;
    }
    return true;
  }

  // Zero hours and zero minutes is rejected too: the timer would expire at once.
  bool validate_timer(int hours, int minutes, std::string& error) const {
    if (hours < 0 || hours > timer_hours_max) {
      error = "hours out of range";
      return false;
    }
    if (minutes < 0 || minutes > timer_minutes_max) {
      error = "minutes out of range";
      return false;
    }
    if (hours == 0 && minutes == 0) {
      error = "timer duration must be positive";
      return false;
    }
    return true;
  }
};
