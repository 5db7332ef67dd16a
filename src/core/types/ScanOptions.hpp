/**
 * @file ScanOptions.hpp
 * @brief Tunables and progress information for the scan and discovery phases.
 */

#pragma once

#include "core/types/PathCatalog.hpp"

#include <chrono>

namespace portsy::core {

/**
 * @brief Settings for the liveness and resolution phases.
 */
struct ScanOptions {
    std::chrono::milliseconds timeout{500}; ///< Connect timeout per port
    int maxWorkers{100};                    ///< Concurrent liveness probes
    bool includeUnattributed{false};        ///< Keep open ports whose owner is unknown
};

/**
 * @brief Settings for HTTP route discovery.
 */
struct DiscoveryOptions {
    std::chrono::milliseconds timeout{2000}; ///< Deadline per HTTP request
    int maxWorkers{10};                      ///< Services probed concurrently
    PathSetMode mode{PathSetMode::Common};   ///< Candidate path set
};

/**
 * @brief Progress information during the liveness phase.
 */
struct ScanProgress {
    int totalPorts{0};   ///< Number of ports to probe
    int scannedPorts{0}; ///< Number of probes finished so far
    int openPorts{0};    ///< Number of open ports found so far

    /**
     * @brief Calculates the completion percentage.
     * @return Percentage of ports probed (0-100).
     */
    [[nodiscard]] double percentComplete() const {
        return totalPorts > 0 ? (static_cast<double>(scannedPorts) / totalPorts) * 100.0 : 0.0;
    }
};

} // namespace portsy::core
