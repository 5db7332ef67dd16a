/**
 * @file IPortProbe.hpp
 * @brief Interface for single-port TCP liveness checks.
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace portsy::core {

/**
 * @brief Tests whether something accepts TCP connections on a loopback port.
 *
 * Implementations must be safe to call concurrently for different ports and
 * must return within the given timeout.
 */
class IPortProbe {
public:
    virtual ~IPortProbe() = default;

    /**
     * @brief Attempts one TCP connect to the loopback address.
     * @param port Port to connect to.
     * @param timeout Upper bound for the connect attempt.
     * @return True if the connection was accepted. Timeout, refusal and any
     *         other error all return false.
     */
    virtual bool isOpen(uint16_t port, std::chrono::milliseconds timeout) = 0;
};

} // namespace portsy::core
