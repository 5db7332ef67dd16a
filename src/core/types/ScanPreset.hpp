/**
 * @file ScanPreset.hpp
 * @brief Port ranges and the static catalog of named scan presets.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace portsy::core {

/**
 * @brief Inclusive range of TCP ports.
 *
 * Bounds are kept as plain ints so that out-of-range user input can be
 * represented and rejected by validation instead of silently wrapping.
 */
struct PortSpan {
    int start{0}; ///< First port of the range (inclusive)
    int end{0};   ///< Last port of the range (inclusive)

    /**
     * @brief Checks that both bounds lie in 1..65535 and start <= end.
     */
    [[nodiscard]] bool isValid() const;

    /**
     * @brief Returns the number of ports covered by a valid span.
     */
    [[nodiscard]] int size() const { return isValid() ? end - start + 1 : 0; }

    bool operator==(const PortSpan& other) const = default;
};

/**
 * @brief Immutable named list of port ranges with a human description.
 */
struct ScanPreset {
    std::string name;             ///< Catalog key (e.g. "quick")
    std::vector<PortSpan> ranges; ///< Ranges in catalog order, may overlap
    std::string description;      ///< One-line description for listings
};

/**
 * @brief Returns the static preset catalog in display order.
 */
const std::vector<ScanPreset>& presetCatalog();

/**
 * @brief Looks up a preset by name.
 * @param name Preset name, compared exactly.
 * @return Pointer into the static catalog, or nullptr if the name is unknown.
 */
const ScanPreset* findPreset(std::string_view name);

} // namespace portsy::core
