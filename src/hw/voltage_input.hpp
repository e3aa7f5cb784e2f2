#pragma once
#include <chrono>
#include <functional>
#include <string>

/**
 * @brief One analog voltage input channel on the sensing hub
 *
 * Supports both delivery styles of the sensing backend:
 * - read_voltage() for polled operation
 * - set_change_handler() for backends that report changes themselves
 *
 * read_voltage() throws SensorError when the channel cannot be read. Backends
 * may also let their driver's own std::exception types through.
 */
class IVoltageInput {
public:
    using ChangeHandler = std::function<void(double voltage)>;

    virtual ~IVoltageInput() = default;

    /**
     * @brief Attach to the hub port
     * @param timeout Maximum time to wait for attachment
     * @return true if the channel is ready
     */
    virtual bool open(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;

    /**
     * @brief Read the present voltage (V)
     */
    virtual double read_voltage() = 0;

    /**
     * @brief Register the handler invoked on every reported change
     *
     * Passing an empty handler unregisters it.
     */
    virtual void set_change_handler(ChangeHandler handler) = 0;

    /**
     * @brief Hub port number this channel is attached to
     */
    virtual int port() const = 0;
};
