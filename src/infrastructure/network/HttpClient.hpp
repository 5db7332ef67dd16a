#pragma once

#include "core/services/IHttpClient.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace portsy::infra {

/**
 * @brief Parsed status line and header block of an HTTP response.
 */
struct ResponseHead {
    int statusCode{0};                         ///< Status code from the status line
    core::HeaderMap headers;                   ///< Header fields, repeated names joined by ", "
    std::optional<size_t> contentLength;       ///< Content-Length, if present and numeric
};

/**
 * @brief Next hop of a redirect on the same loopback service or another local port.
 */
struct RedirectTarget {
    uint16_t port{0};  ///< Port to contact for the next hop
    std::string path;  ///< Request target, starting with '/'

    bool operator==(const RedirectTarget& other) const = default;
};

/**
 * @brief Blocking HTTP/1.1 client built on Asio.
 *
 * Every hop runs on its own io_context with a deadline timer; all hops of one
 * request share the caller's timeout. Requests always send
 * "Connection: close", so no connection outlives the call. Implements
 * core::IHttpClient.
 */
class HttpClient : public core::IHttpClient {
public:
    /**
     * @brief Constructs a client for the given local address.
     * @param address IPv4 or IPv6 literal to connect to.
     * @param maxBodyBytes Upper bound on response body bytes read and discarded.
     */
    explicit HttpClient(std::string address = "127.0.0.1", size_t maxBodyBytes = 1024 * 1024,
                        int maxRedirects = 10);

    /**
     * @brief Sends one request and waits for the final response head.
     *
     * 301, 302, 303, 307 and 308 responses carrying a Location on a local
     * host are followed with the same method. The returned status, headers
     * and elapsed time are those of the last hop. A Location that points off
     * the machine ends the chain at the redirect itself; running out of hops
     * fails the request.
     *
     * A hop counts as answered once a status line and complete header block
     * were received. The body is drained afterwards within the same
     * deadline; a failure while draining does not fail the request.
     *
     * @param method GET or HEAD.
     * @param port Target port.
     * @param path Request target, starting with '/'.
     * @param timeout Deadline for the whole exchange.
     * @return The response.
     */
    core::HttpResponse request(core::HttpMethod method, uint16_t port, const std::string& path,
                               std::chrono::milliseconds timeout) override;

    /**
     * @brief Builds the request bytes.
     */
    static std::string buildRequest(core::HttpMethod method, uint16_t port,
                                    const std::string& path);

    /**
     * @brief Parses a status line and header block.
     * @param head Bytes up to and including the blank line that ends the headers.
     * @return Parsed head, or nullopt if the status line is malformed.
     */
    static std::optional<ResponseHead> parseResponseHead(const std::string& head);

    /**
     * @brief Resolves a Location header against the request that produced it.
     *
     * Accepts absolute paths, paths relative to the current one, and
     * http:// URLs naming localhost, 127.0.0.1 or [::1]. Fragments are
     * dropped and the query string is kept.
     *
     * @param location Location header value.
     * @param port Port of the request that was redirected.
     * @param path Path of the request that was redirected.
     * @return Next hop, or nullopt for https, other hosts and unparsable values.
     */
    static std::optional<RedirectTarget> resolveRedirect(const std::string& location,
                                                         uint16_t port, const std::string& path);

    [[nodiscard]] static bool isRedirect(int statusCode);

private:
    core::HttpResponse send(core::HttpMethod method, uint16_t port, const std::string& path,
                            std::chrono::milliseconds timeout) const;

    std::string address_;
    size_t maxBodyBytes_;
    int maxRedirects_;
};

} // namespace portsy::infra
