#pragma once

#include "core/services/IPortProbe.hpp"
#include "core/services/IProcessResolver.hpp"
#include "core/types/ScanOptions.hpp"
#include "core/types/ScanTarget.hpp"
#include "core/types/Service.hpp"

#include <chrono>
#include <functional>
#include <vector>

namespace portsy::infra {

/**
 * @brief Builds the service registry for a port range or preset.
 *
 * Runs two phases. The liveness phase probes every candidate port on a wide
 * bounded worker pool; workers only return results and the calling thread
 * collects them. The resolution phase then resolves the owner of each open
 * port one at a time on the calling thread, in ascending port order.
 *
 * Per-port failures never surface as errors: a closed or unreachable port is
 * skipped, and an open port without a resolvable owner is dropped unless
 * unattributed ports are requested.
 */
class ScanCoordinator {
public:
    /**
     * @brief Callback for liveness progress, invoked on the calling thread.
     */
    using ProgressCallback = std::function<void(const core::ScanProgress&)>;

    /**
     * @brief Constructs a coordinator.
     * @param probe Port probe; must be safe for concurrent use.
     * @param resolver Process resolver; only called from the calling thread.
     */
    ScanCoordinator(core::IPortProbe& probe, core::IProcessResolver& resolver);

    /**
     * @brief Scans a target with the given timeout and concurrency.
     * @param target Explicit range or preset.
     * @param timeout Connect timeout per port.
     * @param maxWorkers Concurrent liveness probes.
     * @return Registry of attributed services, keyed by port.
     * @throws core::ScanRequestError for invalid input, before any probe runs.
     */
    core::ServiceRegistry scan(const core::ScanTarget& target, std::chrono::milliseconds timeout,
                               int maxWorkers);

    /**
     * @brief Scans a target with full options.
     * @param target Explicit range or preset.
     * @param options Timeout, concurrency and unattributed-port policy.
     * @param onProgress Optional progress callback.
     * @return Registry of services, keyed by port.
     * @throws core::ScanRequestError for invalid input, before any probe runs.
     */
    core::ServiceRegistry scan(const core::ScanTarget& target, const core::ScanOptions& options,
                               const ProgressCallback& onProgress = {});

    /**
     * @brief Liveness phase: returns the open ports among the candidates.
     * @param ports Distinct candidate ports.
     * @param timeout Connect timeout per port.
     * @param maxWorkers Pool size.
     * @param onProgress Optional progress callback.
     * @return Open ports, ascending.
     */
    std::vector<uint16_t> findOpenPorts(const std::vector<uint16_t>& ports,
                                        std::chrono::milliseconds timeout, int maxWorkers,
                                        const ProgressCallback& onProgress = {});

    /**
     * @brief Resolution phase: builds services for open ports.
     * @param openPorts Ports found open.
     * @param includeUnattributed Keep ports whose owner could not be resolved.
     * @return Registry keyed by port.
     */
    core::ServiceRegistry resolveServices(const std::vector<uint16_t>& openPorts,
                                          bool includeUnattributed);

private:
    static void validate(const core::ScanOptions& options);

    core::IPortProbe& probe_;
    core::IProcessResolver& resolver_;
};

} // namespace portsy::infra
