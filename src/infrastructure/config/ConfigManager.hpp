#pragma once

#include "core/types/PathCatalog.hpp"
#include "core/types/ScanOptions.hpp"

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace portsy::infra {

/**
 * @brief User-tunable settings read from config.json.
 *
 * Holds defaults for the liveness scan and route discovery phases plus
 * optional overrides for the candidate path catalog.
 */
struct AppConfig {
    // Liveness and resolution
    core::ScanOptions scan; ///< Scan defaults.

    // Route discovery
    core::DiscoveryOptions discovery; ///< Discovery defaults.

    // Candidate paths
    std::optional<std::vector<std::string>> commonPaths; ///< Replaces the built-in common set.
    std::map<std::string, std::vector<std::string>> frameworkPaths; ///< Added or replaced lists.
};

/**
 * @brief Reads and writes config.json in a per-user directory.
 *
 * The first load writes a file filled with defaults when none exists.
 */
class ConfigManager {
public:
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Populates config() from config.json.
     *
     * Unknown keys are ignored and absent keys keep their defaults.
     * @return false when the file cannot be read or parsed; the error is logged.
     */
    bool load();

    /// Writes config() back out. Returns false and logs on I/O failure.
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Builds the path catalog: built-in lists with configured overrides applied.
     */
    [[nodiscard]] core::PathCatalog pathCatalog() const;

    std::filesystem::path configPath() const { return configPath_; }

    /// <configDir>/portsy.log
    std::filesystem::path logPath() const;

    std::string configDir() const { return configDir_.string(); }

    /**
     * @brief Per-user directory used when --config is not given.
     *
     * $XDG_CONFIG_HOME/portsy if set, else $HOME/.config/portsy, else a
     * directory under the system temp path.
     */
    static std::filesystem::path defaultConfigDir();

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace portsy::infra
