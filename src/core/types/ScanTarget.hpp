/**
 * @file ScanTarget.hpp
 * @brief Top-level scan request: an explicit port range or a named preset.
 */

#pragma once

#include "core/types/ScanPreset.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace portsy::core {

/**
 * @brief Thrown for structurally invalid scan input.
 *
 * Raised synchronously before any probe is dispatched: unknown preset name,
 * inverted or out-of-bounds range, non-positive timeout or worker count.
 */
class ScanRequestError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief What a scan should cover.
 */
class ScanTarget {
public:
    /**
     * @brief Creates a target for an explicit inclusive range.
     */
    static ScanTarget range(int start, int end);

    /**
     * @brief Creates a target for a named preset from the catalog.
     */
    static ScanTarget preset(std::string name);

    [[nodiscard]] bool isPreset() const { return std::holds_alternative<std::string>(value_); }

    /**
     * @brief Returns the ranges this target covers.
     * @throws ScanRequestError if the preset is unknown or a range is invalid.
     */
    [[nodiscard]] std::vector<PortSpan> spans() const;

    /**
     * @brief Expands the target into the distinct ports to probe, ascending.
     *
     * Overlapping ranges contribute each port once.
     *
     * @throws ScanRequestError if the target is invalid.
     */
    [[nodiscard]] std::vector<uint16_t> ports() const;

    /**
     * @brief Human-readable form, e.g. "3000-9000" or "preset 'quick'".
     */
    [[nodiscard]] std::string describe() const;

private:
    explicit ScanTarget(std::variant<PortSpan, std::string> value) : value_(std::move(value)) {}

    std::variant<PortSpan, std::string> value_;
};

} // namespace portsy::core
