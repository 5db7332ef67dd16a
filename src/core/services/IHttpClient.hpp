/**
 * @file IHttpClient.hpp
 * @brief Interface for the plain HTTP requests used by route discovery.
 */

#pragma once

#include "core/types/Service.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace portsy::core {

/**
 * @brief HTTP request methods used by route discovery.
 */
enum class HttpMethod : int {
    Get = 0, ///< Full request, headers and body are read
    Head = 1 ///< Headers only
};

/**
 * @brief Outcome of a single HTTP request.
 */
struct HttpResponse {
    bool success{false};        ///< True if a complete status line and headers were received
    int statusCode{0};          ///< HTTP status code (e.g. 200, 404)
    HeaderMap headers;          ///< Response headers as sent by the server
    std::chrono::microseconds elapsed{0}; ///< Time until the response headers were parsed
    std::string errorMessage;   ///< Transport or parse error if the request failed
};

/**
 * @brief Minimal HTTP/1.1 client against loopback services.
 *
 * Each call opens and closes its own connection. Implementations must be safe
 * to call concurrently.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Sends one request to 127.0.0.1:port, following local redirects.
     * @param method GET or HEAD.
     * @param port Target port on the loopback interface.
     * @param path Request target, starting with '/'.
     * @param timeout Deadline for the whole exchange.
     * @return Final response; success is false on timeout, refusal, malformed
     *         reply or too many redirects.
     */
    virtual HttpResponse request(HttpMethod method, uint16_t port, const std::string& path,
                                 std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Converts a method to its request-line token ("GET" or "HEAD").
     */
    static std::string methodToString(HttpMethod method) {
        return method == HttpMethod::Head ? "HEAD" : "GET";
    }
};

} // namespace portsy::core
