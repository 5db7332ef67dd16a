#pragma once

#include "core/services/IPortProbe.hpp"

#include <string>

namespace portsy::infra {

/**
 * @brief TCP connect probe against the loopback interface.
 *
 * Each call runs its own short-lived io_context: an async connect races a
 * steady_timer, and whichever completes first decides the result. The socket
 * is closed before the call returns. Implements core::IPortProbe.
 */
class TcpPortProbe : public core::IPortProbe {
public:
    /**
     * @brief Constructs a probe for the given local address.
     * @param address IPv4 or IPv6 literal to connect to.
     */
    explicit TcpPortProbe(std::string address = "127.0.0.1");

    /**
     * @brief Attempts one TCP connect with a deadline.
     * @param port Port to connect to.
     * @param timeout Connect deadline.
     * @return True if the connection was accepted before the deadline.
     */
    bool isOpen(uint16_t port, std::chrono::milliseconds timeout) override;

private:
    std::string address_;
};

} // namespace portsy::infra
