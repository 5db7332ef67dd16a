#include "infrastructure/discovery/RouteProber.hpp"

#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <utility>

namespace portsy::infra {

namespace {

constexpr int kMissingStatusThreshold = 400;

} // namespace

RouteProber::RouteProber(core::IHttpClient& client, const FingerprintEngine& fingerprints,
                         core::PathCatalog catalog, core::DiscoveryOptions options)
    : client_(client), fingerprints_(fingerprints), options_(options),
      paths_(catalog.paths(options.mode)) {}

std::optional<core::ServiceDiscovery> RouteProber::probe(const core::Service& service) const {
    auto port = service.port();

    auto root = client_.request(core::HttpMethod::Get, port, "/", options_.timeout);
    if (!root.success) {
        spdlog::debug("Root probe failed for port {}: {}", port, root.errorMessage);
        return std::nullopt;
    }

    core::ServiceDiscovery discovery;
    discovery.headers = std::move(root.headers);
    discovery.responseTime = root.elapsed;

    for (const auto& path : paths_) {
        auto response = client_.request(core::HttpMethod::Head, port, path, options_.timeout);
        if (response.success && response.statusCode < kMissingStatusThreshold) {
            discovery.routes.insert(path);
        }
    }

    discovery.fingerprint = fingerprints_.compute(discovery.headers, discovery.routes);

    spdlog::debug("Port {}: {} routes, fingerprint {}", port, discovery.routes.size(),
                  discovery.fingerprint.shortId);
    return discovery;
}

bool RouteProber::discoverRoutes(core::Service& service) const {
    auto discovery = probe(service);
    if (!discovery) {
        return false;
    }
    service.attachDiscovery(std::move(*discovery));
    return true;
}

size_t RouteProber::discoverAll(core::ServiceRegistry& registry) const {
    if (registry.empty()) {
        return 0;
    }

    spdlog::info("Discovering HTTP routes on {} services ({} mode, {} paths)", registry.size(),
                 core::PathCatalog::modeToString(options_.mode), paths_.size());

    auto poolSize = std::min(static_cast<size_t>(std::max(options_.maxWorkers, 1)),
                             registry.size());
    AsioContext pool(poolSize, "discovery");
    pool.start();

    std::vector<std::pair<uint16_t, std::future<std::optional<core::ServiceDiscovery>>>> pending;
    pending.reserve(registry.size());
    for (const auto& [port, service] : registry) {
        const core::Service* target = &service;
        pending.emplace_back(port, pool.submit([this, target]() { return probe(*target); }));
    }

    size_t probed = 0;
    for (auto& [port, future] : pending) {
        try {
            auto discovery = future.get();
            if (discovery) {
                registry.at(port).attachDiscovery(std::move(*discovery));
                ++probed;
            }
        } catch (const std::exception& e) {
            spdlog::debug("Route discovery for port {} failed: {}", port, e.what());
        }
    }

    pool.stop();

    spdlog::info("Route discovery complete: {}/{} services responded over HTTP", probed,
                 registry.size());
    return probed;
}

} // namespace portsy::infra
