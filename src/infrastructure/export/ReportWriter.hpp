#pragma once

#include "core/types/DuplicateGroup.hpp"
#include "core/types/Service.hpp"

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace portsy::infra {

/**
 * @brief Serializes a scan report to JSON.
 *
 * Layout:
 * @code
 * { "scan_time": "YYYY-MM-DD HH:MM:SS",
 *   "services": { "<port>": { ... } },
 *   "duplicates": { "<label>": [ports...] } }
 * @endcode
 * Absent values (unattributed owner, incomplete discovery) are written as null.
 */
class ReportWriter {
public:
    /**
     * @brief Converts one service to its JSON object.
     */
    static nlohmann::json serviceToJson(const core::Service& service);

    /**
     * @brief Builds the complete report document.
     * @param registry Enriched registry.
     * @param duplicates Labeled groups from findDuplicates().
     * @param scanTime Time the scan was started.
     */
    static nlohmann::json toJson(const core::ServiceRegistry& registry,
                                 const std::vector<core::DuplicateGroup>& duplicates,
                                 std::chrono::system_clock::time_point scanTime);

    /**
     * @brief Formats a time point as local "YYYY-MM-DD HH:MM:SS".
     */
    static std::string formatScanTime(std::chrono::system_clock::time_point tp);

    /**
     * @brief Writes the report to a file.
     *
     * Strings that are not valid UTF-8 are written with U+FFFD in place of
     * the bad bytes. An existing file is left alone if serialization fails.
     * @return false if the file could not be written; the error is logged.
     */
    static bool write(const std::filesystem::path& path, const core::ServiceRegistry& registry,
                      const std::vector<core::DuplicateGroup>& duplicates,
                      std::chrono::system_clock::time_point scanTime);
};

} // namespace portsy::infra
