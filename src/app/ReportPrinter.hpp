#pragma once

#include "core/types/DuplicateGroup.hpp"
#include "core/types/ScanPreset.hpp"
#include "core/types/Service.hpp"

#include <iosfwd>
#include <set>
#include <string>
#include <vector>

namespace portsy::app {

/**
 * @brief Plain-text rendering of scan results for the terminal.
 */
class ReportPrinter {
public:
    static constexpr size_t kMaxRoutesShown = 3;

    /**
     * @brief Prints the service table, one row per service in port order.
     */
    static void printServices(std::ostream& out, const core::ServiceRegistry& registry);

    /**
     * @brief Prints the duplicate groups in report order.
     */
    static void printDuplicates(std::ostream& out,
                                const std::vector<core::DuplicateGroup>& groups);

    /**
     * @brief Prints the preset catalog.
     */
    static void printPresets(std::ostream& out, const std::vector<core::ScanPreset>& presets);

    /**
     * @brief Summarizes a route set, e.g. "/, /api, /docs (+2 more)".
     */
    static std::string summarizeRoutes(const std::set<std::string>& routes);
};

} // namespace portsy::app
