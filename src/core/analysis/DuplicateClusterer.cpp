#include "core/analysis/DuplicateClusterer.hpp"

#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace portsy::core {

namespace {

using KeyFn = std::function<std::optional<std::string>(const Service&)>;

std::vector<DuplicateGroup> partition(const ServiceRegistry& registry, GroupCriterion criterion,
                                      const KeyFn& keyOf) {
    std::vector<DuplicateGroup> cells;
    std::unordered_map<std::string, size_t> index;

    // Registry iterates by ascending port, which fixes both cell and member order
    for (const auto& [port, service] : registry) {
        auto key = keyOf(service);
        if (!key) {
            continue;
        }

        auto it = index.find(*key);
        if (it == index.end()) {
            index.emplace(*key, cells.size());
            DuplicateGroup group;
            group.label.criterion = criterion;
            group.label.discriminator = *key;
            group.services.push_back(&service);
            cells.push_back(std::move(group));
        } else {
            cells[it->second].services.push_back(&service);
        }
    }

    std::vector<DuplicateGroup> groups;
    for (auto& cell : cells) {
        if (cell.services.size() > 1) {
            groups.push_back(std::move(cell));
        }
    }
    return groups;
}

} // namespace

std::vector<DuplicateGroup> groupByProcess(const ServiceRegistry& registry) {
    return partition(registry, GroupCriterion::Process,
                     [](const Service& service) -> std::optional<std::string> {
                         if (!service.isAttributed()) {
                             return std::nullopt;
                         }
                         return service.processName();
                     });
}

std::vector<DuplicateGroup> groupByFingerprint(const ServiceRegistry& registry) {
    return partition(registry, GroupCriterion::Fingerprint,
                     [](const Service& service) { return service.fingerprint(); });
}

std::vector<DuplicateGroup> findDuplicates(const ServiceRegistry& registry) {
    auto groups = groupByProcess(registry);
    auto byFingerprint = groupByFingerprint(registry);
    groups.insert(groups.end(), std::make_move_iterator(byFingerprint.begin()),
                  std::make_move_iterator(byFingerprint.end()));

    int sequence = 0;
    for (auto& group : groups) {
        group.label.sequence = ++sequence;
    }
    return groups;
}

} // namespace portsy::core
