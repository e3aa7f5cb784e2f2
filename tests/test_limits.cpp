#include "../src/control/limits.hpp"
#include <cassert>
#include <iostream>
#include <string>

/**
 * @brief Test operator settings validation
 *
 * Verifies the accepted ranges of every editable setting and of the
 * countdown timer, including both range edges.
 */
int main() {
    std::cout << "Testing SettingsLimits..." << std::endl;

    SettingsLimits limits;
    std::string why;

    // Test 1: Defaults are valid
    {
        std::cout << "Test 1: Default settings accepted" << std::endl;
        SystemSettings s;
        assert(limits.validate(s, why));
        std::cout << "  Default settings test passed" << std::endl;
    }

    // Test 2: Range edges are inclusive
    {
        std::cout << "Test 2: Range edges" << std::endl;
        SystemSettings s;
        s.cutoff_voltage = 10.5;
        s.cycles_per_minute = 12;
        s.switch_current_threshold = 0.1;
        s.motor_current_threshold = 200.0;
        s.switch_failure_threshold = 1;
        s.motor_failure_threshold = 1000;
        s.cycle_limit = 1000000;
        assert(limits.validate(s, why));

        s.cutoff_voltage = 13.5;
        s.cycles_per_minute = 1;
        s.switch_current_threshold = 50.0;
        s.motor_current_threshold = 50.0;
        s.cycle_limit = 1;
        assert(limits.validate(s, why));
        std::cout << "  Range edges test passed" << std::endl;
    }

    // Test 3: Each field rejected just outside its range
    {
        std::cout << "Test 3: Out-of-range fields rejected" << std::endl;
        SystemSettings s;

        s = SystemSettings{};
        s.cutoff_voltage = 10.4;
        assert(!limits.validate(s, why));
        assert(why.find("cutoff_voltage") != std::string::npos);

        s = SystemSettings{};
        s.cutoff_voltage = 13.6;
        assert(!limits.validate(s, why));

        s = SystemSettings{};
        s.cycles_per_minute = 0;
        assert(!limits.validate(s, why));
        assert(why.find("cycles_per_minute") != std::string::npos);

        s = SystemSettings{};
        s.cycles_per_minute = 13;
        assert(!limits.validate(s, why));

        s = SystemSettings{};
        s.switch_current_threshold = 0.05;
        assert(!limits.validate(s, why));

        s = SystemSettings{};
        s.motor_current_threshold = 201.0;
        assert(!limits.validate(s, why));

        s = SystemSettings{};
        s.switch_failure_threshold = 0;
        assert(!limits.validate(s, why));
        assert(why.find("switch_failure_threshold") != std::string::npos);

        s = SystemSettings{};
        s.motor_failure_threshold = 1001;
        assert(!limits.validate(s, why));

        s = SystemSettings{};
        s.cycle_limit = 0;
        assert(!limits.validate(s, why));

        s = SystemSettings{};
        s.cycle_limit = 1000001;
        assert(!limits.validate(s, why));
        std::cout << "  Out-of-range test passed" << std::endl;
    }

    // Test 4: Timer ranges
    {
        std::cout << "Test 4: Timer ranges" << std::endl;
        assert(limits.validate_timer(1, 30, why));
        assert(limits.validate_timer(99, 59, why));
        assert(limits.validate_timer(0, 1, why));
        assert(!limits.validate_timer(100, 0, why));
        assert(!limits.validate_timer(0, 60, why));
        assert(!limits.validate_timer(-1, 10, why));
        assert(!limits.validate_timer(0, 0, why));
        std::cout << "  Timer range test passed" << std::endl;
    }

    std::cout << "✅ All SettingsLimits tests passed!" << std::endl;
    return 0;
}
