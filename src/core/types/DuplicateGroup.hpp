/**
 * @file DuplicateGroup.hpp
 * @brief Labeled groups of services that look like unintended duplicates.
 */

#pragma once

#include "core/types/Service.hpp"

#include <string>
#include <vector>

namespace portsy::core {

/**
 * @brief Criterion that put services into the same group.
 */
enum class GroupCriterion : int {
    Process = 0,    ///< Same process name
    Fingerprint = 1 ///< Same HTTP fingerprint
};

/**
 * @brief Identifies a duplicate group within one report.
 */
struct GroupLabel {
    GroupCriterion criterion{GroupCriterion::Process}; ///< Grouping criterion
    std::string discriminator; ///< Shared key (process name or short fingerprint)
    int sequence{0};           ///< Disambiguator, increasing across one report

    /**
     * @brief Renders the label, e.g. "process_node_1".
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief Converts a criterion to its label prefix ("process" or "fingerprint").
     */
    static std::string criterionToString(GroupCriterion criterion);

    bool operator==(const GroupLabel& other) const = default;
};

/**
 * @brief Services sharing one criterion key.
 *
 * Members point into the registry the group was built from and are ordered by
 * port. The registry must outlive the group.
 */
struct DuplicateGroup {
    GroupLabel label;                     ///< Group label
    std::vector<const Service*> services; ///< Non-owning, ordered by port

    /**
     * @brief Returns the member ports in group order.
     */
    [[nodiscard]] std::vector<uint16_t> ports() const;
};

} // namespace portsy::core
