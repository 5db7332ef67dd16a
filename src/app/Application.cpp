#include "app/Application.hpp"

#include "app/ReportPrinter.hpp"
#include "core/analysis/DuplicateClusterer.hpp"
#include "infrastructure/export/ReportWriter.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <iostream>
#include <utility>

namespace portsy::app {

namespace {

constexpr const char* kVersion = "1.0.0";
constexpr int kProgressLogStep = 10;

} // namespace

Application::Application(CliOptions options)
    : options_(std::move(options)),
      configDir_(options_.configDir.value_or(infra::ConfigManager::defaultConfigDir())) {
    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::debug("Application shutting down...");
    spdlog::default_logger()->flush();
}

void Application::initializeLogging() {
    // The config directory holds the log file, so it is created first
    config_ = std::make_unique<infra::ConfigManager>(configDir_);
    auto logPath = config_->logPath();

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(options_.verbose ? spdlog::level::debug : spdlog::level::info);

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("portsy", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::debug("Portsy {} starting...", kVersion);
    spdlog::debug("Config directory: {}", config_->configDir());
    spdlog::debug("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    // Configuration
    if (!config_->load()) {
        spdlog::warn("Continuing with default configuration");
    }

    // Liveness and resolution
    portProbe_ = std::make_unique<infra::TcpPortProbe>();
    processResolver_ = std::make_unique<infra::ProcfsProcessResolver>();
    coordinator_ = std::make_unique<infra::ScanCoordinator>(*portProbe_, *processResolver_);

    // Route discovery
    httpClient_ = std::make_unique<infra::HttpClient>();
    fingerprintEngine_ = std::make_unique<infra::FingerprintEngine>();
    routeProber_ = std::make_unique<infra::RouteProber>(
        *httpClient_, *fingerprintEngine_, config_->pathCatalog(), discoveryOptions());

    spdlog::debug("Application components initialized");
}

core::ScanTarget Application::scanTarget() const {
    if (options_.preset) {
        return core::ScanTarget::preset(*options_.preset);
    }
    return core::ScanTarget::range(options_.startPort, options_.endPort);
}

core::ScanOptions Application::scanOptions() const {
    auto options = config_->config().scan;

    if (options_.timeoutSeconds) {
        // Seconds to milliseconds, rounded up
        options.timeout = std::chrono::milliseconds(
            static_cast<int64_t>(std::ceil(*options_.timeoutSeconds * 1000.0)));
    }
    if (options_.workers) {
        options.maxWorkers = *options_.workers;
    }
    if (options_.includeUnattributed) {
        options.includeUnattributed = true;
    }
    return options;
}

core::DiscoveryOptions Application::discoveryOptions() const {
    auto options = config_->config().discovery;
    if (options_.comprehensiveRoutes) {
        options.mode = core::PathSetMode::Comprehensive;
    }
    return options;
}

int Application::run() {
    auto target = scanTarget();
    auto options = scanOptions();

    if (options_.preset) {
        const auto* preset = core::findPreset(*options_.preset);
        spdlog::info("Running {} scan: {}", *options_.preset,
                     preset ? preset->description : std::string("unknown preset"));
    } else {
        spdlog::info("Scanning ports {}-{}...", options_.startPort, options_.endPort);
    }

    auto scanTime = std::chrono::system_clock::now();
    int lastLogged = 0;
    auto registry = coordinator_->scan(target, options, [&](const core::ScanProgress& progress) {
        int percent = static_cast<int>(progress.percentComplete());
        if (percent >= lastLogged + kProgressLogStep) {
            lastLogged = percent - percent % kProgressLogStep;
            spdlog::debug("Scanned {}/{} ports ({}%), {} open", progress.scannedPorts,
                          progress.totalPorts, percent, progress.openPorts);
        }
    });
    spdlog::info("Found {} services", registry.size());

    if (!options_.noRoutes) {
        routeProber_->discoverAll(registry);
    }

    ReportPrinter::printServices(std::cout, registry);

    std::vector<core::DuplicateGroup> duplicates;
    if (!options_.noDuplicates) {
        duplicates = core::findDuplicates(registry);
        if (!duplicates.empty()) {
            ReportPrinter::printDuplicates(std::cout, duplicates);
        }
    }
    std::cout.flush();

    if (options_.jsonPath) {
        if (!infra::ReportWriter::write(*options_.jsonPath, registry, duplicates, scanTime)) {
            return 1;
        }
    }

    return 0;
}

} // namespace portsy::app
