#include "test_rig.hpp"
#include <cassert>
#include <iostream>

/**
 * @brief Test one station's press, verify and return cycle
 */
int main() {
    std::cout << "Testing StationCycleRunner..." << std::endl;

    // Test 1: Peak at or above threshold passes, below fails
    {
        std::cout << "Test 1: Pass and fail verdicts" << std::endl;
        TestRig rig(2);
        rig.set_closure_current(1, 6.0);   // 2.875 V on the switch channel
        rig.set_closure_current(2, 2.0);   // 2.625 V
        assert(rig.start());
        SystemSettings settings = *rig.store.settings();
        assert(settings.switch_current_threshold == 5.0);

        CycleVerdict v1 = rig.runner->run_cycle(rig.station(1), settings);
        assert(!v1.aborted());
        assert(!v1.degraded());
        assert(v1.station_id == 1);
        assert(v1.peak_current == 6.0);
        assert(v1.passed);

        CycleVerdict v2 = rig.runner->run_cycle(rig.station(2), settings);
        assert(!v2.aborted());
        assert(v2.peak_current == 2.0);
        assert(!v2.passed);

        // The runner leaves station records alone
        assert(rig.station(1).current_cycles == 0);
        assert(rig.station(2).switch_failures == 0);

        // Servo returned, actuator still armed
        assert(rig.bus.registers(2).goal_position == 0);
        assert(!rig.actuator->is_safe());
        std::cout << "  Pass/fail test passed" << std::endl;
    }

    // Test 2: Exactly at threshold passes
    {
        std::cout << "Test 2: Threshold boundary" << std::endl;
        TestRig rig(1);
        rig.set_closure_current(1, 5.0);
        assert(rig.start());
        CycleVerdict v = rig.runner->run_cycle(rig.station(1), *rig.store.settings());
        assert(v.peak_current == 5.0);
        assert(v.passed);
        std::cout << "  Threshold boundary test passed" << std::endl;
    }

    // Test 3: Machine turned off mid-press aborts the cycle into safe state
    {
        std::cout << "Test 3: Machine off mid-press" << std::endl;
        TestRig rig(2);
        assert(rig.start());
        const std::uint32_t press = ActuatorModule::degrees_to_position(rig.cfg.servo.press_angle);
        rig.on_goal = [&rig, press](std::uint8_t, std::uint32_t position) {
            if (position == press) rig.set_machine_state(MachineState::Off);
        };

        auto started = std::chrono::steady_clock::now();
        CycleVerdict v = rig.runner->run_cycle(rig.station(1), *rig.store.settings());
        auto elapsed = std::chrono::steady_clock::now() - started;

        assert(v.aborted());
        assert(v.aborted_reason == "machine_off");
        assert(rig.actuator->is_safe());
        assert(!rig.bus.registers(1).torque_enabled);
        assert(rig.bus.registers(1).goal_position == 0);
        // Cut short: well under press + return, settle included
        assert(elapsed < std::chrono::milliseconds(70));
        assert(rig.station(1).current_cycles == 0);
        std::cout << "  Machine off mid-press test passed" << std::endl;
    }

    // Test 4: Blocked before the cycle starts, nothing moves
    {
        std::cout << "Test 4: Blocked before start" << std::endl;
        TestRig rig(1);
        assert(rig.start());
        rig.set_machine_state(MachineState::Off);
        auto writes = rig.bus.write_count();

        CycleVerdict v = rig.runner->run_cycle(rig.station(1), *rig.store.settings());
        assert(v.aborted());
        assert(v.aborted_reason == "machine_off");
        assert(rig.bus.write_count() == writes);
        std::cout << "  Blocked before start test passed" << std::endl;
    }

    // Test 5: A failed servo write degrades the cycle instead of aborting it
    {
        std::cout << "Test 5: Degraded cycle" << std::endl;
        TestRig rig(1);
        assert(rig.start());
        rig.bus.set_write_failure(1, servo_reg::kGoalPosition, true);

        CycleVerdict v = rig.runner->run_cycle(rig.station(1), *rig.store.settings());
        assert(!v.aborted());
        assert(v.degraded());
        assert(v.peak_current == 0.0);
        assert(!v.passed);
        std::cout << "  Degraded cycle test passed" << std::endl;
    }

    // Test 6: Timing taken from configuration
    {
        std::cout << "Test 6: Cycle timing" << std::endl;
        CycleTiming t = CycleTiming::from_config(fast_config());
        assert(t.press_duration == std::chrono::milliseconds(40));
        assert(t.cycle_duration == std::chrono::milliseconds(80));
        assert(t.sample_interval == std::chrono::milliseconds(5));
        assert(t.press_angle == 100.0);
        assert(t.return_angle == 0.0);
        std::cout << "  Cycle timing test passed" << std::endl;
    }

    std::cout << "✅ All StationCycleRunner tests passed!" << std::endl;
    return 0;
}
