#pragma once

#include "core/services/IHttpClient.hpp"
#include "core/types/PathCatalog.hpp"
#include "core/types/ScanOptions.hpp"
#include "core/types/Service.hpp"
#include "infrastructure/crypto/FingerprintEngine.hpp"

#include <optional>
#include <string>
#include <vector>

namespace portsy::infra {

/**
 * @brief Discovers HTTP routes and the fingerprint of local services.
 *
 * For one service: GET the root path, keep its headers and timing, HEAD every
 * candidate path, keep the paths answering below 400, then fingerprint the
 * result. A failed root request abandons discovery for that service and
 * leaves it untouched; a failed path request only marks that path absent.
 */
class RouteProber {
public:
    /**
     * @brief Constructs a prober.
     * @param client HTTP client; must be safe for concurrent use.
     * @param fingerprints Fingerprint engine.
     * @param catalog Candidate path catalog.
     * @param options Request timeout, pool size and path set mode.
     */
    RouteProber(core::IHttpClient& client, const FingerprintEngine& fingerprints,
                core::PathCatalog catalog = core::PathCatalog::defaults(),
                core::DiscoveryOptions options = {});

    /**
     * @brief Probes one service without modifying it.
     * @param service Service to probe.
     * @return Discovery snapshot, or nullopt if the root request failed.
     */
    [[nodiscard]] std::optional<core::ServiceDiscovery> probe(const core::Service& service) const;

    /**
     * @brief Probes one service and attaches the snapshot on success.
     * @param service Service to enrich in place.
     * @return True if discovery completed.
     */
    bool discoverRoutes(core::Service& service) const;

    /**
     * @brief Probes every service of a registry on a bounded worker pool.
     *
     * Workers only return snapshots; they are attached on the calling thread.
     *
     * @param registry Registry to enrich.
     * @return Number of services that were probed successfully.
     */
    size_t discoverAll(core::ServiceRegistry& registry) const;

    [[nodiscard]] const core::DiscoveryOptions& options() const { return options_; }

    /**
     * @brief Returns the candidate paths for the configured mode.
     */
    [[nodiscard]] const std::vector<std::string>& candidatePaths() const { return paths_; }

private:
    core::IHttpClient& client_;
    const FingerprintEngine& fingerprints_;
    core::DiscoveryOptions options_;
    std::vector<std::string> paths_;
};

} // namespace portsy::infra
