#include "core/types/DuplicateGroup.hpp"

namespace portsy::core {

std::string GroupLabel::criterionToString(GroupCriterion criterion) {
    switch (criterion) {
    case GroupCriterion::Process:
        return "process";
    case GroupCriterion::Fingerprint:
        return "fingerprint";
    }
    return "process";
}

std::string GroupLabel::toString() const {
    return criterionToString(criterion) + "_" + discriminator + "_" + std::to_string(sequence);
}

std::vector<uint16_t> DuplicateGroup::ports() const {
    std::vector<uint16_t> result;
    result.reserve(services.size());
    for (const auto* service : services) {
        result.push_back(service->port());
    }
    return result;
}

} // namespace portsy::core
