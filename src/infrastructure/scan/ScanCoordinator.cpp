#include "infrastructure/scan/ScanCoordinator.hpp"

#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <optional>
#include <utility>

namespace portsy::infra {

namespace {

constexpr size_t kLargeScanWarningPorts = 10000;

} // namespace

ScanCoordinator::ScanCoordinator(core::IPortProbe& probe, core::IProcessResolver& resolver)
    : probe_(probe), resolver_(resolver) {}

void ScanCoordinator::validate(const core::ScanOptions& options) {
    if (options.timeout.count() <= 0) {
        throw core::ScanRequestError("Scan timeout must be positive");
    }
    if (options.maxWorkers <= 0) {
        throw core::ScanRequestError("Worker count must be positive");
    }
}

core::ServiceRegistry ScanCoordinator::scan(const core::ScanTarget& target,
                                            std::chrono::milliseconds timeout, int maxWorkers) {
    core::ScanOptions options;
    options.timeout = timeout;
    options.maxWorkers = maxWorkers;
    return scan(target, options);
}

core::ServiceRegistry ScanCoordinator::scan(const core::ScanTarget& target,
                                            const core::ScanOptions& options,
                                            const ProgressCallback& onProgress) {
    validate(options);
    auto ports = target.ports();

    spdlog::info("Scanning {} ({} ports, timeout {}ms, {} workers)", target.describe(),
                 ports.size(), options.timeout.count(), options.maxWorkers);
    if (ports.size() > kLargeScanWarningPorts) {
        spdlog::warn("Scanning {} ports may take several minutes", ports.size());
    }

    auto openPorts = findOpenPorts(ports, options.timeout, options.maxWorkers, onProgress);
    spdlog::info("Liveness phase complete: {} open ports", openPorts.size());

    auto registry = resolveServices(openPorts, options.includeUnattributed);
    spdlog::info("Resolution phase complete: {} services", registry.size());
    return registry;
}

std::vector<uint16_t> ScanCoordinator::findOpenPorts(const std::vector<uint16_t>& ports,
                                                     std::chrono::milliseconds timeout,
                                                     int maxWorkers,
                                                     const ProgressCallback& onProgress) {
    std::vector<uint16_t> openPorts;
    if (ports.empty()) {
        return openPorts;
    }

    auto poolSize = std::min(static_cast<size_t>(maxWorkers), ports.size());
    AsioContext pool(poolSize, "liveness");
    pool.start();

    std::vector<std::pair<uint16_t, std::future<bool>>> pending;
    pending.reserve(ports.size());
    for (uint16_t port : ports) {
        pending.emplace_back(port, pool.submit([this, port, timeout]() {
                                 return probe_.isOpen(port, timeout);
                             }));
    }

    core::ScanProgress progress;
    progress.totalPorts = static_cast<int>(ports.size());

    for (auto& [port, future] : pending) {
        bool open = false;
        try {
            open = future.get();
        } catch (const std::exception& e) {
            spdlog::debug("Probe for port {} failed: {}", port, e.what());
        }

        if (open) {
            openPorts.push_back(port);
            ++progress.openPorts;
        }
        ++progress.scannedPorts;
        if (onProgress) {
            onProgress(progress);
        }
    }

    pool.stop();

    std::sort(openPorts.begin(), openPorts.end());
    return openPorts;
}

core::ServiceRegistry ScanCoordinator::resolveServices(const std::vector<uint16_t>& openPorts,
                                                       bool includeUnattributed) {
    core::ServiceRegistry registry;

    for (uint16_t port : openPorts) {
        std::optional<core::ProcessInfo> process;
        try {
            process = resolver_.resolve(port);
        } catch (const std::exception& e) {
            spdlog::debug("Process lookup for port {} failed: {}", port, e.what());
        }

        if (process) {
            spdlog::debug("Port {} owned by {} (pid {})", port, process->name, process->pid);
            registry.emplace(port, core::Service(port, std::move(process)));
        } else if (includeUnattributed) {
            spdlog::debug("Port {} is open but its owner is unknown", port);
            registry.emplace(port, core::Service(port, std::nullopt));
        } else {
            spdlog::debug("Dropping open port {}: owning process could not be resolved", port);
        }
    }

    return registry;
}

} // namespace portsy::infra
