#include "core/types/ScanTarget.hpp"

#include <algorithm>
#include <utility>

namespace portsy::core {

ScanTarget ScanTarget::range(int start, int end) {
    return ScanTarget(PortSpan{start, end});
}

ScanTarget ScanTarget::preset(std::string name) {
    return ScanTarget(std::move(name));
}

std::vector<PortSpan> ScanTarget::spans() const {
    if (const auto* name = std::get_if<std::string>(&value_)) {
        const auto* preset = findPreset(*name);
        if (!preset) {
            throw ScanRequestError("Unknown scan preset: '" + *name + "'");
        }
        return preset->ranges;
    }

    const auto& span = std::get<PortSpan>(value_);
    if (span.start > span.end) {
        throw ScanRequestError("Inverted port range: " + std::to_string(span.start) + "-" +
                               std::to_string(span.end));
    }
    if (!span.isValid()) {
        throw ScanRequestError("Port range out of bounds (1-65535): " +
                               std::to_string(span.start) + "-" + std::to_string(span.end));
    }
    return {span};
}

std::vector<uint16_t> ScanTarget::ports() const {
    auto ranges = spans();

    std::vector<uint16_t> result;
    size_t total = 0;
    for (const auto& span : ranges) {
        total += static_cast<size_t>(span.size());
    }
    result.reserve(total);

    for (const auto& span : ranges) {
        for (int port = span.start; port <= span.end; ++port) {
            result.push_back(static_cast<uint16_t>(port));
        }
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

std::string ScanTarget::describe() const {
    if (const auto* name = std::get_if<std::string>(&value_)) {
        return "preset '" + *name + "'";
    }
    const auto& span = std::get<PortSpan>(value_);
    return std::to_string(span.start) + "-" + std::to_string(span.end);
}

} // namespace portsy::core
