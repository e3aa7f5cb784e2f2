#pragma once
#include <cstdint>
#include <string>

/**
 * @brief Control table of the current-limited position servos on the bus
 *
 * Addresses follow the Dynamixel X-series (protocol 2.0) layout.
 */
namespace servo_reg {
constexpr std::uint16_t kOperatingMode = 11;
constexpr std::uint16_t kTorqueEnable = 64;
constexpr std::uint16_t kGoalCurrent = 102;
constexpr std::uint16_t kGoalPosition = 116;
constexpr std::uint16_t kPresentPosition = 132;

constexpr std::uint8_t kCurrentBasedPositionMode = 5;
constexpr std::uint32_t kPositionResolution = 4096;  ///< Positions per full turn (0..4095)
constexpr std::uint16_t kMaxGoalCurrent = 1193;      ///< Goal current register value at 100 %
}

/**
 * @brief Byte-level servo bus transport
 *
 * One bus carries every station's servo, addressed by id. Each primitive is
 * a single write (or read) with acknowledgement and reports its outcome
 * instead of throwing, so callers decide whether a failure is fatal.
 */
class IServoBus {
public:
    /**
     * @brief Outcome of one bus transaction
     */
    enum class CommResult {
        Success = 0,     ///< Written and acknowledged
        PortClosed,      ///< Bus not open
        TxFailed,        ///< Packet could not be sent
        Timeout,         ///< No status packet from the servo
        HardwareError    ///< Servo acknowledged with its error bit set
    };

    virtual ~IServoBus() = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    virtual CommResult write1(std::uint8_t id, std::uint16_t address, std::uint8_t value) = 0;
    virtual CommResult write2(std::uint8_t id, std::uint16_t address, std::uint16_t value) = 0;
    virtual CommResult write4(std::uint8_t id, std::uint16_t address, std::uint32_t value) = 0;
    virtual CommResult read4(std::uint8_t id, std::uint16_t address, std::uint32_t& value) = 0;

    /**
     * @brief Port or device name, for logging
     */
    virtual std::string name() const = 0;

    static std::string result_to_string(CommResult r) {
        switch (r) {
            case CommResult::Success: return "SUCCESS";
            case CommResult::PortClosed: return "PORT_CLOSED";
            case CommResult::TxFailed: return "TX_FAILED";
            case CommResult::Timeout: return "TIMEOUT";
            case CommResult::HardwareError: return "HARDWARE_ERROR";
            default: return "INVALID_RESULT";
        }
    }
};
