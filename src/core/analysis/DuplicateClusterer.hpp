/**
 * @file DuplicateClusterer.hpp
 * @brief Partitions a scan registry into same-process and same-fingerprint groups.
 *
 * The two criteria are independent, non-exclusive views over the registry: a
 * service can appear in a process group and a fingerprint group at once.
 * Membership is exact key equality.
 */

#pragma once

#include "core/types/DuplicateGroup.hpp"
#include "core/types/Service.hpp"

#include <vector>

namespace portsy::core {

/**
 * @brief Groups services sharing a process name.
 *
 * Unattributed services are skipped. Only cells with more than one member are
 * returned, in order of first appearance by port. Sequence numbers in the
 * returned labels are 0; findDuplicates() assigns them.
 *
 * @param registry Registry to partition. Must outlive the returned groups.
 * @return Groups with at least two members.
 */
std::vector<DuplicateGroup> groupByProcess(const ServiceRegistry& registry);

/**
 * @brief Groups services sharing a short fingerprint.
 *
 * Services without a fingerprint are skipped. Same ordering rules as
 * groupByProcess().
 *
 * @param registry Registry to partition. Must outlive the returned groups.
 * @return Groups with at least two members.
 */
std::vector<DuplicateGroup> groupByFingerprint(const ServiceRegistry& registry);

/**
 * @brief Unions process and fingerprint groups into one labeled report.
 *
 * Process groups come first. Sequence numbers start at 1 and increase across
 * both criteria, so every label in the report is unique.
 *
 * @param registry Enriched registry. Must outlive the returned groups.
 * @return Labeled groups in report order.
 */
std::vector<DuplicateGroup> findDuplicates(const ServiceRegistry& registry);

} // namespace portsy::core
