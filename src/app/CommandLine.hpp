#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace portsy::app {

/**
 * @brief Thrown for unknown flags or malformed flag values.
 */
class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Parsed command line.
 *
 * Unset optionals fall back to the loaded configuration, then to built-in
 * defaults.
 */
struct CliOptions {
    std::optional<std::string> preset;   ///< --preset NAME
    int startPort{3000};                 ///< -s/--start-port
    int endPort{9000};                   ///< -e/--end-port
    std::optional<double> timeoutSeconds; ///< -t/--timeout
    std::optional<int> workers;          ///< --workers
    bool comprehensiveRoutes{false};     ///< --comprehensive-routes
    bool noRoutes{false};                ///< --no-routes
    bool noDuplicates{false};            ///< --no-duplicates
    bool includeUnattributed{false};     ///< --include-unattributed
    std::optional<std::filesystem::path> jsonPath;  ///< -j/--json
    std::optional<std::filesystem::path> configDir; ///< --config
    bool listPresets{false};             ///< --list-presets
    bool verbose{false};                 ///< -v/--verbose
    bool help{false};                    ///< -h/--help
};

/**
 * @brief Parses arguments (without the program name).
 * @throws UsageError on unknown flags, missing or malformed values.
 */
CliOptions parseCommandLine(const std::vector<std::string>& args);

/**
 * @brief Parses argc/argv as passed to main().
 */
CliOptions parseCommandLine(int argc, char** argv);

/**
 * @brief Prints flag help.
 */
void printUsage(std::ostream& out, const std::string& program);

} // namespace portsy::app
