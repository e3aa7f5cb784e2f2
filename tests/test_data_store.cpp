#include "../src/store/data_store.hpp"
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

/**
 * @brief Test the in-memory record store and verdict application
 */
int main() {
    std::cout << "Testing MemoryDataStore..." << std::endl;

    // Test 1: Seeded rig
    {
        std::cout << "Test 1: Seed defaults" << std::endl;
        MemoryDataStore store;
        store.seed_defaults(4);
        auto stations = store.stations();
        assert(stations.size() == 4);
        for (std::size_t i = 0; i < stations.size(); ++i) {
            assert(stations[i].id == static_cast<int>(i) + 1);
            assert(!stations[i].enabled);
        }
        assert(store.settings().has_value());
        assert(store.settings()->cycles_per_minute == 6);
        assert(store.machine()->machine_state == MachineState::Off);
        assert(!store.station(5).has_value());
        std::cout << "  Seed test passed" << std::endl;
    }

    // Test 2: Missing records
    {
        std::cout << "Test 2: Missing records" << std::endl;
        MemoryDataStore store;
        assert(store.stations().empty());
        assert(!store.settings().has_value());
        assert(!store.machine().has_value());
        assert(!store.update_station(1, [](Station& s) { s.enabled = true; }));
        assert(!store.update_machine([](MachineRecord& m) { m.machine_state = MachineState::On; }));

        store.seed_defaults(1);
        store.clear_settings();
        store.clear_machine();
        assert(!store.settings().has_value());
        assert(!store.machine().has_value());
        std::cout << "  Missing records test passed" << std::endl;
    }

    // Test 3: Stations listed in ascending id order regardless of insertion
    {
        std::cout << "Test 3: Ascending order" << std::endl;
        MemoryDataStore store;
        for (int id : {3, 1, 2}) {
            Station s;
            s.id = id;
            store.put_station(s);
        }
        auto stations = store.stations();
        assert(stations[0].id == 1 && stations[1].id == 2 && stations[2].id == 3);

        // The id is the key and cannot be rewritten by an update
        store.update_station(2, [](Station& s) { s.id = 9; });
        assert(store.station(2)->id == 2);
        std::cout << "  Ascending order test passed" << std::endl;
    }

    // Test 4: Concurrent updates to one station are not lost
    {
        std::cout << "Test 4: Atomic read-modify-write" << std::endl;
        MemoryDataStore store;
        store.seed_defaults(1);
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&store]() {
                for (int i = 0; i < 1000; ++i) {
                    store.update_station(1, [](Station& s) { s.current_cycles++; });
                }
            });
        }
        for (auto& th : threads) th.join();
        assert(store.station(1)->current_cycles == 4000);
        std::cout << "  Atomic update test passed" << std::endl;
    }

    // Test 5: Bounded history, newest last
    {
        std::cout << "Test 5: History" << std::endl;
        MemoryDataStore store(3);
        for (int i = 1; i <= 5; ++i) {
            HistoryRecord h;
            h.station_id = i;
            store.append_history(h);
        }
        auto all = store.history(10);
        assert(all.size() == 3);
        assert(all.front().station_id == 3);
        assert(all.back().station_id == 5);
        auto last = store.history(1);
        assert(last.size() == 1 && last[0].station_id == 5);
        assert(store.history(0).empty());
        std::cout << "  History test passed" << std::endl;
    }

    // Test 6: Verdict application rules
    {
        std::cout << "Test 6: Verdict application" << std::endl;
        SystemSettings settings;
        settings.switch_failure_threshold = 2;
        Station s;
        s.id = 1;
        s.enabled = true;

        CycleVerdict pass{1, 6.0, true, "", ""};
        CycleVerdict fail{1, 2.0, false, "", ""};
        CycleVerdict aborted{1, 7.0, false, "machine_off", ""};

        assert(!apply_verdict(s, pass, settings));
        assert(s.current_cycles == 1 && s.switch_failures == 0 && s.switch_current == 6.0);

        assert(!apply_verdict(s, aborted, settings));
        assert(s.current_cycles == 1 && s.switch_current == 6.0);

        assert(!apply_verdict(s, fail, settings));
        assert(s.current_cycles == 2 && s.switch_failures == 1 && s.enabled);

        // Reaching the threshold disables exactly once
        assert(apply_verdict(s, fail, settings));
        assert(!s.enabled && s.switch_failures == 2);
        assert(!apply_verdict(s, fail, settings));
        assert(!s.enabled && s.switch_failures == 3 && s.current_cycles == 4);
        std::cout << "  Verdict application test passed" << std::endl;
    }

    // Test 7: Machine state names
    {
        std::cout << "Test 7: Machine state names" << std::endl;
        MachineState m = MachineState::Off;
        assert(parse_machine_state("on", m) && m == MachineState::On);
        assert(parse_machine_state("disabled", m) && m == MachineState::Disabled);
        assert(!parse_machine_state("ON", m) && m == MachineState::Disabled);
        assert(to_string(MachineState::Off) == "off");
        std::cout << "  Machine state names test passed" << std::endl;
    }

    std::cout << "✅ All MemoryDataStore tests passed!" << std::endl;
    return 0;
}
