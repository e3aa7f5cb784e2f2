#include "../src/safety/safety_interlock.hpp"
#include "../src/store/data_store.hpp"
#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Test the machine-enable interlock
 *
 * Drives evaluate_at() with synthetic clocks so debounce edges are exact.
 */
int main() {
    std::cout << "Testing SafetyInterlock..." << std::endl;

    using namespace std::chrono;
    const auto t0 = steady_clock::time_point{} + hours(1);
    const auto w0 = system_clock::now();

    // Test 1: Machine state gate
    {
        std::cout << "Test 1: Machine state gate" << std::endl;
        MemoryDataStore store;
        SafetyInterlock interlock(store, []() { return std::optional<double>(13.0); });

        auto r = interlock.evaluate_at(t0, w0);
        assert(!r && r.reason == "machine_off");   // no machine record

        store.seed_defaults(1);
        r = interlock.evaluate_at(t0, w0);
        assert(!r && r.reason == "machine_off");

        store.update_machine([](MachineRecord& m) { m.machine_state = MachineState::Disabled; });
        assert(!interlock.evaluate_at(t0, w0));

        store.update_machine([](MachineRecord& m) { m.machine_state = MachineState::On; });
        r = interlock.evaluate_at(t0, w0);
        assert(r && r.allowed);
        assert(interlock.get_trip_count() == 0);
        std::cout << "  Machine state gate test passed" << std::endl;
    }

    // Test 2: Timer expiry turns the machine off and clears the timer
    {
        std::cout << "Test 2: Timer expiry" << std::endl;
        MemoryDataStore store;
        store.seed_defaults(1);
        store.update_machine([&](MachineRecord& m) {
            m.machine_state = MachineState::On;
            m.timer_active = true;
            m.timer_end = w0 + minutes(30);
        });
        SafetyInterlock interlock(store, []() { return std::optional<double>(13.0); });
        std::vector<std::string> trips;
        interlock.set_trip_callback([&](const std::string& why) { trips.push_back(why); });

        assert(interlock.evaluate_at(t0, w0 + minutes(29)));

        auto r = interlock.evaluate_at(t0, w0 + minutes(30));
        assert(!r && r.reason == "timer_expired");
        auto m = store.machine();
        assert(m->machine_state == MachineState::Off);
        assert(!m->timer_active);
        assert(trips.size() == 1 && trips[0] == "timer_expired");
        assert(interlock.last_trip_reason() == "timer_expired");

        // Afterwards the machine is simply off
        r = interlock.evaluate_at(t0, w0 + minutes(31));
        assert(!r && r.reason == "machine_off");
        assert(trips.size() == 1);
        std::cout << "  Timer expiry test passed" << std::endl;
    }

    // Test 3: 4.9 s of low voltage then one good sample does not trip
    {
        std::cout << "Test 3: Low voltage debounce reset" << std::endl;
        MemoryDataStore store;
        store.seed_defaults(1);
        store.update_machine([](MachineRecord& m) { m.machine_state = MachineState::On; });
        double supply = 10.8;
        SafetyInterlock interlock(store, [&supply]() { return std::optional<double>(supply); });

        for (int ms = 0; ms <= 4900; ms += 100) {
            assert(interlock.evaluate_at(t0 + milliseconds(ms), w0));
        }
        assert(interlock.low_voltage_pending());

        supply = 12.6;
        assert(interlock.evaluate_at(t0 + milliseconds(4950), w0));
        assert(!interlock.low_voltage_pending());

        // A fresh low period starts the debounce from zero
        supply = 10.8;
        assert(interlock.evaluate_at(t0 + milliseconds(5000), w0));
        assert(interlock.evaluate_at(t0 + milliseconds(9900), w0));
        assert(store.machine()->machine_state == MachineState::On);
        assert(interlock.get_trip_count() == 0);
        std::cout << "  Debounce reset test passed" << std::endl;
    }

    // Test 4: 5.0 s of continuous low voltage trips
    {
        std::cout << "Test 4: Low voltage trip" << std::endl;
        MemoryDataStore store;
        store.seed_defaults(1);
        store.update_machine([](MachineRecord& m) { m.machine_state = MachineState::On; });
        SafetyInterlock interlock(store, []() { return std::optional<double>(10.8); });
        std::string tripped;
        interlock.set_trip_callback([&](const std::string& why) { tripped = why; });

        assert(interlock.evaluate_at(t0, w0));
        assert(interlock.evaluate_at(t0 + milliseconds(4999), w0));
        auto r = interlock.evaluate_at(t0 + seconds(5), w0);
        assert(!r && r.reason == "low_voltage");
        assert(tripped == "low_voltage");
        assert(store.machine()->machine_state == MachineState::Off);
        assert(interlock.get_trip_count() == 1);
        assert(!interlock.low_voltage_pending());
        std::cout << "  Low voltage trip test passed" << std::endl;
    }

    // Test 5: Missing reading or settings leaves the debounce untouched
    {
        std::cout << "Test 5: Missing inputs" << std::endl;
        MemoryDataStore store;
        store.seed_defaults(1);
        store.update_machine([](MachineRecord& m) { m.machine_state = MachineState::On; });
        std::optional<double> supply = 10.8;
        SafetyInterlock interlock(store, [&supply]() { return supply; });

        assert(interlock.evaluate_at(t0, w0));
        supply.reset();
        assert(interlock.evaluate_at(t0 + seconds(3), w0));
        assert(interlock.low_voltage_pending());

        supply = 10.8;
        auto r = interlock.evaluate_at(t0 + seconds(5), w0);
        assert(!r && r.reason == "low_voltage");

        // Without settings there is no cutoff to compare against
        store.update_machine([](MachineRecord& m) { m.machine_state = MachineState::On; });
        store.clear_settings();
        assert(interlock.evaluate_at(t0 + seconds(6), w0));
        assert(interlock.evaluate_at(t0 + seconds(20), w0));
        std::cout << "  Missing inputs test passed" << std::endl;
    }

    // Test 6: Cutoff follows the settings record
    {
        std::cout << "Test 6: Cutoff from settings" << std::endl;
        MemoryDataStore store;
        store.seed_defaults(1);
        store.update_machine([](MachineRecord& m) { m.machine_state = MachineState::On; });
        SystemSettings s;
        s.cutoff_voltage = 12.0;
        store.put_settings(s);
        SafetyInterlock interlock(store, []() { return std::optional<double>(11.5); });

        assert(interlock.evaluate_at(t0, w0));
        assert(interlock.low_voltage_pending());
        assert(!interlock.evaluate_at(t0 + seconds(5), w0));
        std::cout << "  Cutoff from settings test passed" << std::endl;
    }

    // Test 7: A timer that expires while the machine is off does not survive a restart
    {
        std::cout << "Test 7: Timer expiry while off" << std::endl;
        MemoryDataStore store;
        store.seed_defaults(1);
        store.update_machine([&](MachineRecord& m) {
            m.machine_state = MachineState::On;
            m.timer_active = true;
            m.timer_end = w0 + hours(1);
        });
        SafetyInterlock interlock(store, []() { return std::optional<double>(13.0); });
        std::vector<std::string> trips;
        interlock.set_trip_callback([&](const std::string& why) { trips.push_back(why); });

        assert(interlock.evaluate_at(t0, w0));
        store.update_machine([](MachineRecord& m) { m.machine_state = MachineState::Off; });

        auto r = interlock.evaluate_at(t0, w0 + hours(2));
        assert(!r && r.reason == "machine_off");
        auto m = store.machine();
        assert(m->machine_state == MachineState::Off);
        assert(!m->timer_active);
        assert(trips.empty());
        assert(interlock.get_trip_count() == 0);

        // Switching back on runs normally instead of tripping on the stale end time
        store.update_machine([](MachineRecord& rec) { rec.machine_state = MachineState::On; });
        r = interlock.evaluate_at(t0, w0 + hours(2) + seconds(1));
        assert(r && r.allowed);
        assert(store.machine()->machine_state == MachineState::On);
        assert(trips.empty());
        std::cout << "  Timer expiry while off test passed" << std::endl;
    }

    std::cout << "✅ All SafetyInterlock tests passed!" << std::endl;
    return 0;
}
