#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>

namespace portsy::infra {

namespace {

core::PathSetMode modeFromBool(bool comprehensive) {
    return comprehensive ? core::PathSetMode::Comprehensive : core::PathSetMode::Common;
}

// Non-positive values fall back to the default with a warning
template <typename T>
T positiveOr(const nlohmann::json& section, const char* sectionName, const char* key,
             T fallback) {
    T value = section.value(key, fallback);
    if (value <= 0) {
        spdlog::warn("Ignoring {}.{} = {}, using {}", sectionName, key, value, fallback);
        return fallback;
    }
    return value;
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir)
    : configDir_(configDir), configPath_(configDir / "config.json") {
    std::error_code ec;
    std::filesystem::create_directories(configDir_, ec);
    if (ec) {
        spdlog::warn("Cannot create config directory {}: {}", configDir_.string(), ec.message());
    }
}

std::filesystem::path ConfigManager::defaultConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "portsy";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "portsy";
    }
    return std::filesystem::temp_directory_path() / "portsy";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("No config at {}, writing defaults", configPath_.string());
        return save();
    }

    std::ifstream in(configPath_);
    if (!in) {
        spdlog::error("Cannot read {}", configPath_.string());
        return false;
    }

    try {
        fromJson(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid config {}: {}", configPath_.string(), e.what());
        return false;
    }

    spdlog::debug("Config loaded from {}", configPath_.string());
    return true;
}

bool ConfigManager::save() {
    std::ofstream out(configPath_, std::ios::trunc);
    if (!out) {
        spdlog::error("Cannot write {}", configPath_.string());
        return false;
    }

    out << toJson().dump(2) << '\n';
    if (!out) {
        spdlog::error("Write to {} failed", configPath_.string());
        return false;
    }

    spdlog::debug("Config saved to {}", configPath_.string());
    return true;
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Scanner
    j["scanner"]["timeout_ms"] = config_.scan.timeout.count();
    j["scanner"]["max_workers"] = config_.scan.maxWorkers;
    j["scanner"]["include_unattributed"] = config_.scan.includeUnattributed;

    // Discovery
    j["discovery"]["timeout_ms"] = config_.discovery.timeout.count();
    j["discovery"]["max_workers"] = config_.discovery.maxWorkers;
    j["discovery"]["comprehensive"] =
        config_.discovery.mode == core::PathSetMode::Comprehensive;

    // Path overrides
    if (config_.commonPaths) {
        j["paths"]["common"] = *config_.commonPaths;
    }
    if (!config_.frameworkPaths.empty()) {
        j["paths"]["frameworks"] = config_.frameworkPaths;
    }

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    // Scanner
    if (j.contains("scanner")) {
        const auto& s = j["scanner"];
        config_.scan.timeout =
            std::chrono::milliseconds(positiveOr<int64_t>(s, "scanner", "timeout_ms", 500));
        config_.scan.maxWorkers = positiveOr(s, "scanner", "max_workers", 100);
        config_.scan.includeUnattributed = s.value("include_unattributed", false);
    }

    // Discovery
    if (j.contains("discovery")) {
        const auto& d = j["discovery"];
        config_.discovery.timeout =
            std::chrono::milliseconds(positiveOr<int64_t>(d, "discovery", "timeout_ms", 2000));
        config_.discovery.maxWorkers = positiveOr(d, "discovery", "max_workers", 10);
        config_.discovery.mode = modeFromBool(d.value("comprehensive", false));
    }

    // Path overrides
    if (j.contains("paths")) {
        const auto& p = j["paths"];
        if (p.contains("common")) {
            config_.commonPaths = p["common"].get<std::vector<std::string>>();
        }
        if (p.contains("frameworks")) {
            config_.frameworkPaths =
                p["frameworks"].get<std::map<std::string, std::vector<std::string>>>();
        }
    }
}

core::PathCatalog ConfigManager::pathCatalog() const {
    auto catalog = core::PathCatalog::defaults();
    if (config_.commonPaths) {
        catalog.setCommonPaths(*config_.commonPaths);
    }
    for (const auto& [name, paths] : config_.frameworkPaths) {
        catalog.setFrameworkPaths(name, paths);
    }
    return catalog;
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / "portsy.log";
}

} // namespace portsy::infra
