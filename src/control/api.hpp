#pragma once
#include "../actuation/actuator_module.hpp"
#include "../actuation/sensor_module.hpp"
#include "../core/model.hpp"
#include "../core/status.hpp"
#include "../safety/safety_interlock.hpp"
#include "../store/data_store.hpp"
#include "actuation_scheduler.hpp"
#include "limits.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief Operator control surface
 *
 * Translates JSON commands into store mutations and builds status
 * snapshots. The API never moves servos itself: switching the machine off
 * only changes the machine record, and the scheduler brings the actuator to
 * safe state on its next interlock check.
 *
 * Supported commands:
 * - {"cmd":"get_status"}
 * - {"cmd":"set_machine_state","state":"on"|"off"|"disabled"}
 * - {"cmd":"set_timer","hours":1,"minutes":30}
 * - {"cmd":"cancel_timer"}
 * - {"cmd":"set_station_enabled","station":2,"enabled":true}
 * - {"cmd":"reset_station","station":2,"current_cycles":0,"switch_failures":0,"motor_failures":0}
 * - {"cmd":"update_settings","cycles_per_minute":6,...}
 * - {"cmd":"get_history","limit":100,"station":2}
 *
 * Replies are {"ok":true,...} or {"ok":false,"error":"..."}.
 */
class ControlAPI {
private:
  IDataStore& store_;
  ActuatorModule& actuator_;
  SensorModule& sensors_;
  SafetyInterlock& interlock_;
  const ActuationScheduler* scheduler_;
  SettingsLimits limits_;
  std::chrono::steady_clock::time_point start_time_;

public:
  static constexpr std::size_t kDefaultHistoryLimit = 100;
  static constexpr std::size_t kMaxHistoryLimit = 10000;

  /**
   * @brief Constructor
   * @param scheduler Source of loop statistics, may be null
   */
  ControlAPI(IDataStore& store, ActuatorModule& actuator, SensorModule& sensors,
             SafetyInterlock& interlock, const ActuationScheduler* scheduler = nullptr,
             const SettingsLimits& limits = SettingsLimits{})
    : store_(store), actuator_(actuator), sensors_(sensors), interlock_(interlock),
      scheduler_(scheduler), limits_(limits), start_time_(std::chrono::steady_clock::now()) {}

  /**
   * @brief Assemble the current status
   */
  StatusSnapshot status_snapshot() const {
    StatusSnapshot snap;
    auto now = std::chrono::steady_clock::now();
    snap.t_sec = std::chrono::duration<double>(now - start_time_).count();
    snap.stations = store_.stations();
    snap.safe_state = actuator_.is_safe();
    snap.actuator_connected = actuator_.is_connected();
    snap.last_trip_reason = interlock_.last_trip_reason();

    auto machine = store_.machine();
    if (machine) {
      snap.machine_state = machine->machine_state;
      snap.timer_active = machine->timer_active;
      snap.supply_voltage = machine->supply_voltage;
      if (machine->timer_active) {
        auto remaining = machine->timer_end - std::chrono::system_clock::now();
        snap.timer_remaining_sec = std::max(0.0, std::chrono::duration<double>(remaining).count());
      }
    }
    auto supply = sensors_.latest(kSupplyVoltageChannel);
    if (supply) snap.supply_voltage = *supply;

    if (scheduler_) snap.loop = scheduler_->get_stats();
    return snap;
  }

  /**
   * @brief Handle one JSON command
   * @param s Raw request text
   * @return JSON reply text
   */
  std::string handle_command(const std::string& s) {
    auto j = json::parse(s, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return error("malformed request");
    if (!j.contains("cmd") || !j["cmd"].is_string()) return error("missing cmd");

    const std::string cmd = j["cmd"].get<std::string>();
    try {
      if (cmd == "get_status") {
        json r = status_snapshot().to_json();
        r["ok"] = true;
        return r.dump();
      } else if (cmd == "set_machine_state") {
        return set_machine_state(j);
      } else if (cmd == "set_timer") {
        return set_timer(j);
      } else if (cmd == "cancel_timer") {
        bool found = store_.update_machine([](MachineRecord& m) {
          m.timer_active = false;
          m.timer_end = std::chrono::system_clock::time_point{};
        });
        if (!found) return error("machine state not found");
        std::cout << "ControlAPI: timer cancelled" << std::endl;
        return ok();
      } else if (cmd == "set_station_enabled") {
        return set_station_enabled(j);
      } else if (cmd == "reset_station") {
        return reset_station(j);
      } else if (cmd == "update_settings") {
        return update_settings(j);
      } else if (cmd == "get_history") {
        return get_history(j);
      }
    } catch (const json::exception& e) {
      return error(std::string("bad argument: ") + e.what());
    }
    return error("unknown command: " + cmd);
  }

private:
  static std::string ok() { return "{\"ok\":true}"; }

  static std::string error(const std::string& what) {
    json r = {{"ok", false}, {"error", what}};
    return r.dump();
  }

  std::string set_machine_state(const json& j) {
    MachineState state;
    if (!parse_machine_state(j.at("state").get<std::string>(), state)) {
      return error("unknown machine state");
    }
    bool found = store_.update_machine([state](MachineRecord& m) { m.machine_state = state; });
    if (!found) return error("machine state not found");
    std::cout << "ControlAPI: machine state set to " << to_string(state) << std::endl;
    return ok();
  }

  std::string set_timer(const json& j) {
    int hours = j.value("hours", 0);
    int minutes = j.value("minutes", 0);
    std::string why;
    if (!limits_.validate_timer(hours, minutes, why)) return error(why);

    auto end = std::chrono::system_clock::now() + std::chrono::hours(hours) + std::chrono::minutes(minutes);
    bool found = store_.update_machine([end](MachineRecord& m) {
      m.timer_active = true;
      m.timer_end = end;
    });
    if (!found) return error("machine state not found");
    std::cout << "ControlAPI: timer set for " << hours << "h " << minutes << "m" << std::endl;
    return ok();
  }

  std::string set_station_enabled(const json& j) {
    int id = j.at("station").get<int>();
    bool enabled = j.at("enabled").get<bool>();
    bool found = store_.update_station(id, [enabled](Station& st) { st.enabled = enabled; });
    if (!found) return error("station not found");
    std::cout << "ControlAPI: station " << id << (enabled ? " enabled" : " disabled") << std::endl;
    return ok();
  }

  std::string reset_station(const json& j) {
    int id = j.at("station").get<int>();
    std::int64_t cycles = j.at("current_cycles").get<std::int64_t>();
    std::int64_t switch_failures = j.at("switch_failures").get<std::int64_t>();
    std::int64_t motor_failures = j.at("motor_failures").get<std::int64_t>();
    if (cycles < 0 || switch_failures < 0 || motor_failures < 0) {
      return error("counters must be non-negative");
    }
    bool found = store_.update_station(id, [&](Station& st) {
      st.current_cycles = static_cast<std::uint64_t>(cycles);
      st.switch_failures = static_cast<std::uint32_t>(switch_failures);
      st.motor_failures = static_cast<std::uint32_t>(motor_failures);
    });
    if (!found) return error("station not found");
    std::cout << "ControlAPI: station " << id << " counters reset" << std::endl;
    return ok();
  }

  // Fields not named in the request keep their stored values.
  std::string update_settings(const json& j) {
    SystemSettings s = store_.settings().value_or(SystemSettings{});
    s.cycles_per_minute = j.value("cycles_per_minute", s.cycles_per_minute);
    s.cutoff_voltage = j.value("cutoff_voltage", s.cutoff_voltage);
    s.switch_current_threshold = j.value("switch_current_threshold", s.switch_current_threshold);
    s.motor_current_threshold = j.value("motor_current_threshold", s.motor_current_threshold);
    s.cycle_limit = signed_field(j, "cycle_limit", s.cycle_limit);
    s.switch_failure_threshold = static_cast<std::uint32_t>(
      signed_field(j, "switch_failure_threshold", s.switch_failure_threshold));
    s.motor_failure_threshold = static_cast<std::uint32_t>(
      signed_field(j, "motor_failure_threshold", s.motor_failure_threshold));

    std::string why;
    if (!limits_.validate(s, why)) return error(why);
    store_.put_settings(s);
    std::cout << "ControlAPI: settings updated" << std::endl;
    return ok();
  }

  // Reads an integer field that must not be negative; a negative value maps to 0,
  // which every range check rejects.
  static std::uint64_t signed_field(const json& j, const char* key, std::uint64_t fallback) {
    if (!j.contains(key)) return fallback;
    std::int64_t v = j.at(key).get<std::int64_t>();
    return v < 0 ? 0 : static_cast<std::uint64_t>(v);
  }

  std::string get_history(const json& j) {
    std::size_t limit = kDefaultHistoryLimit;
    if (j.contains("limit")) {
      std::int64_t requested = j.at("limit").get<std::int64_t>();
      if (requested < 1) return error("limit must be positive");
      limit = std::min<std::size_t>(static_cast<std::size_t>(requested), kMaxHistoryLimit);
    }
    int station_filter = j.value("station", 0);

    json records = json::array();
    auto all = store_.history(station_filter > 0 ? kMaxHistoryLimit : limit);
    std::size_t start = 0;
    if (station_filter > 0) {
      std::vector<HistoryRecord> filtered;
      for (const auto& h : all) {
        if (h.station_id == station_filter) filtered.push_back(h);
      }
      all.swap(filtered);
      if (all.size() > limit) start = all.size() - limit;
    }
    for (std::size_t i = start; i < all.size(); ++i) {
      const auto& h = all[i];
      auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(h.timestamp.time_since_epoch());
      records.push_back({{"station", h.station_id},
                         {"current_cycles", h.current_cycles},
                         {"switch_failures", h.switch_failures},
                         {"motor_failures", h.motor_failures},
                         {"switch_current", h.switch_current},
                         {"motor_current", h.motor_current},
                         {"cycles_per_minute", h.cycles_per_minute},
                         {"cycle_limit", h.cycle_limit},
                         {"supply_voltage", h.supply_voltage},
                         {"machine_state", to_string(h.machine_state)},
                         {"timestamp_ms", static_cast<std::int64_t>(ts.count())}});
    }
    json r = {{"ok", true}, {"history", records}};
    return r.dump();
  }
};
