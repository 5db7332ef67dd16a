/**
 * @file Service.hpp
 * @brief Service record and registry types produced by a scan run.
 *
 * This file defines the Service structure which represents one open local TCP
 * port, the process that owns it, and the immutable HTTP discovery snapshot
 * attached once route discovery succeeds.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace portsy::core {

/**
 * @brief Response headers keyed by the name the server sent.
 */
using HeaderMap = std::map<std::string, std::string>;

/**
 * @brief Lifecycle state of a Service within one scan run.
 */
enum class ServiceState : int {
    Discovered = 0, ///< Port is open (and attributed unless unattributed ports are kept)
    Probed = 1      ///< HTTP discovery completed and the snapshot is attached
};

/**
 * @brief Owning process of a listening port.
 */
struct ProcessInfo {
    int pid{0};              ///< Process identifier
    std::string name;        ///< Short process name (e.g. "node")
    std::string commandLine; ///< Full command line, arguments joined by spaces

    bool operator==(const ProcessInfo& other) const = default;
};

/**
 * @brief Short fingerprint plus the digest it was cut from.
 */
struct Fingerprint {
    std::string digest; ///< Full lowercase hex digest
    std::string shortId; ///< Prefix used as the clustering key

    bool operator==(const Fingerprint& other) const = default;
};

/**
 * @brief Result of a successful HTTP discovery run against one service.
 *
 * Written once and never modified. Routes, headers, fingerprint and response
 * time are always populated together.
 */
struct ServiceDiscovery {
    std::set<std::string> routes;            ///< Paths that answered with a status below 400
    HeaderMap headers;                       ///< Headers of the root GET response
    Fingerprint fingerprint;                 ///< Signature over headers and routes
    std::chrono::microseconds responseTime{0}; ///< Duration of the root GET request

    /**
     * @brief Returns the response time in milliseconds.
     * @return Response time as fractional milliseconds.
     */
    [[nodiscard]] double responseTimeMs() const {
        return static_cast<double>(responseTime.count()) / 1000.0;
    }

    bool operator==(const ServiceDiscovery& other) const = default;
};

/**
 * @brief A network service found listening on a local TCP port.
 */
class Service {
public:
    Service() = default;

    /**
     * @brief Creates a service for an open port.
     * @param port Local TCP port the service listens on.
     * @param process Owning process, or nullopt when it could not be resolved.
     */
    Service(uint16_t port, std::optional<ProcessInfo> process);

    [[nodiscard]] uint16_t port() const { return port_; }
    [[nodiscard]] const std::string& protocol() const { return protocol_; }

    /**
     * @brief Returns the owning process, if it was resolved.
     */
    [[nodiscard]] const std::optional<ProcessInfo>& process() const { return process_; }

    [[nodiscard]] bool isAttributed() const { return process_.has_value(); }

    /**
     * @brief Returns the process id, or 0 when unattributed.
     */
    [[nodiscard]] int pid() const;

    /**
     * @brief Returns the process name, or an empty string when unattributed.
     */
    [[nodiscard]] std::string processName() const;

    /**
     * @brief Returns the process command line, or an empty string when unattributed.
     */
    [[nodiscard]] std::string processCommandLine() const;

    /**
     * @brief Returns the discovery snapshot, or nullptr before discovery succeeded.
     */
    [[nodiscard]] std::shared_ptr<const ServiceDiscovery> discovery() const { return discovery_; }

    /**
     * @brief Attaches a discovery snapshot.
     *
     * The snapshot replaces any earlier one as a whole; no partially filled
     * state is ever observable.
     *
     * @param discovery Completed discovery result.
     */
    void attachDiscovery(ServiceDiscovery discovery);

    [[nodiscard]] ServiceState state() const;

    /**
     * @brief Returns the confirmed routes (empty until discovery succeeded).
     */
    [[nodiscard]] const std::set<std::string>& routes() const;

    /**
     * @brief Returns the root response headers (empty until discovery succeeded).
     */
    [[nodiscard]] const HeaderMap& headers() const;

    /**
     * @brief Returns the short fingerprint, if discovery succeeded.
     */
    [[nodiscard]] std::optional<std::string> fingerprint() const;

    /**
     * @brief Returns the root request duration, if discovery succeeded.
     */
    [[nodiscard]] std::optional<std::chrono::microseconds> responseTime() const;

    /**
     * @brief Converts a ServiceState enum to a string.
     * @param state The state to convert.
     * @return "Discovered" or "Probed".
     */
    static std::string stateToString(ServiceState state);

private:
    uint16_t port_{0};
    std::string protocol_{"tcp"};
    std::optional<ProcessInfo> process_;
    std::shared_ptr<const ServiceDiscovery> discovery_;
};

/**
 * @brief All services of one scan run keyed by port.
 */
using ServiceRegistry = std::map<uint16_t, Service>;

} // namespace portsy::core
