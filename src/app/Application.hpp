#pragma once

#include "app/CommandLine.hpp"
#include "core/types/ScanTarget.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/crypto/FingerprintEngine.hpp"
#include "infrastructure/discovery/RouteProber.hpp"
#include "infrastructure/network/HttpClient.hpp"
#include "infrastructure/network/TcpPortProbe.hpp"
#include "infrastructure/process/ProcfsProcessResolver.hpp"
#include "infrastructure/scan/ScanCoordinator.hpp"

#include <memory>

namespace portsy::app {

/**
 * @brief Wires the scan pipeline together and runs it once.
 *
 * scan -> route discovery -> duplicate detection -> table -> optional export.
 */
class Application {
public:
    explicit Application(CliOptions options);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs the pipeline.
     * @return Process exit code.
     * @throws core::ScanRequestError for invalid scan input.
     */
    int run();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::ScanCoordinator& coordinator() { return *coordinator_; }
    infra::RouteProber& routeProber() { return *routeProber_; }

    /**
     * @brief Builds the scan target from the command line.
     */
    [[nodiscard]] core::ScanTarget scanTarget() const;

    /**
     * @brief Effective scan options: configuration overridden by flags.
     */
    [[nodiscard]] core::ScanOptions scanOptions() const;

    /**
     * @brief Effective discovery options: configuration overridden by flags.
     */
    [[nodiscard]] core::DiscoveryOptions discoveryOptions() const;

private:
    void initializeLogging();
    void initializeComponents();

    CliOptions options_;
    std::filesystem::path configDir_;

    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::TcpPortProbe> portProbe_;
    std::unique_ptr<infra::ProcfsProcessResolver> processResolver_;
    std::unique_ptr<infra::HttpClient> httpClient_;
    std::unique_ptr<infra::FingerprintEngine> fingerprintEngine_;
    std::unique_ptr<infra::ScanCoordinator> coordinator_;
    std::unique_ptr<infra::RouteProber> routeProber_;
};

} // namespace portsy::app
