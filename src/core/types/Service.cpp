#include "core/types/Service.hpp"

#include <utility>

namespace portsy::core {

namespace {

const std::set<std::string> kNoRoutes;
const HeaderMap kNoHeaders;

} // namespace

Service::Service(uint16_t port, std::optional<ProcessInfo> process)
    : port_(port), process_(std::move(process)) {}

int Service::pid() const {
    return process_ ? process_->pid : 0;
}

std::string Service::processName() const {
    return process_ ? process_->name : std::string{};
}

std::string Service::processCommandLine() const {
    return process_ ? process_->commandLine : std::string{};
}

void Service::attachDiscovery(ServiceDiscovery discovery) {
    discovery_ = std::make_shared<const ServiceDiscovery>(std::move(discovery));
}

ServiceState Service::state() const {
    return discovery_ ? ServiceState::Probed : ServiceState::Discovered;
}

const std::set<std::string>& Service::routes() const {
    return discovery_ ? discovery_->routes : kNoRoutes;
}

const HeaderMap& Service::headers() const {
    return discovery_ ? discovery_->headers : kNoHeaders;
}

std::optional<std::string> Service::fingerprint() const {
    if (!discovery_) {
        return std::nullopt;
    }
    return discovery_->fingerprint.shortId;
}

std::optional<std::chrono::microseconds> Service::responseTime() const {
    if (!discovery_) {
        return std::nullopt;
    }
    return discovery_->responseTime;
}

std::string Service::stateToString(ServiceState state) {
    switch (state) {
    case ServiceState::Discovered:
        return "Discovered";
    case ServiceState::Probed:
        return "Probed";
    }
    return "Discovered";
}

} // namespace portsy::core
