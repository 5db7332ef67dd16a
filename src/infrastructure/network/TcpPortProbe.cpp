#include "infrastructure/network/TcpPortProbe.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <optional>
#include <utility>

namespace portsy::infra {

TcpPortProbe::TcpPortProbe(std::string address) : address_(std::move(address)) {}

bool TcpPortProbe::isOpen(uint16_t port, std::chrono::milliseconds timeout) {
    try {
        asio::io_context io;
        asio::ip::tcp::socket socket(io);
        asio::steady_timer timer(io);
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address(address_), port);

        std::optional<asio::error_code> connectResult;
        bool timedOut = false;

        timer.expires_after(timeout);
        timer.async_wait([&](const asio::error_code& ec) {
            if (ec || connectResult) {
                return; // Timer cancelled or connect already finished
            }
            timedOut = true;
            asio::error_code ignored;
            socket.close(ignored);
        });

        socket.async_connect(endpoint, [&](const asio::error_code& ec) {
            connectResult = ec;
            timer.cancel();
        });

        io.run();

        asio::error_code ignored;
        socket.close(ignored);

        if (timedOut) {
            spdlog::debug("Port {} timed out after {}ms", port, timeout.count());
            return false;
        }
        return connectResult && !*connectResult;
    } catch (const std::exception& e) {
        spdlog::debug("Port probe error for {}:{} - {}", address_, port, e.what());
        return false;
    }
}

} // namespace portsy::infra
