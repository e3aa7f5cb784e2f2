#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Servo command or transport failure
 *
 * Thrown by ActuatorModule::command() when the module refuses a motion
 * (safe state, not connected, unmapped station) or the bus does not
 * acknowledge the write.
 */
class ActuationError : public std::runtime_error {
public:
    explicit ActuationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Voltage input read/open failure
 */
class SensorError : public std::runtime_error {
public:
    explicit SensorError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Hardware configuration file could not be loaded or is invalid
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};
