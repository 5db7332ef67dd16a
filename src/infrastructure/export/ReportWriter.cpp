#include "infrastructure/export/ReportWriter.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>

namespace portsy::infra {

nlohmann::json ReportWriter::serviceToJson(const core::Service& service) {
    nlohmann::json j;
    j["port"] = service.port();
    j["protocol"] = service.protocol();

    if (const auto& process = service.process()) {
        j["pid"] = process->pid;
        j["process_name"] = process->name;
        j["process_cmd"] = process->commandLine;
    } else {
        j["pid"] = nullptr;
        j["process_name"] = nullptr;
        j["process_cmd"] = nullptr;
    }

    j["routes"] = nlohmann::json::array();
    for (const auto& route : service.routes()) {
        j["routes"].push_back(route);
    }

    j["headers"] = nlohmann::json::object();
    for (const auto& [name, value] : service.headers()) {
        j["headers"][name] = value;
    }

    if (auto discovery = service.discovery()) {
        j["fingerprint"] = discovery->fingerprint.shortId;
        j["response_time"] = static_cast<double>(discovery->responseTime.count()) / 1e6;
    } else {
        j["fingerprint"] = nullptr;
        j["response_time"] = nullptr;
    }
    return j;
}

nlohmann::json ReportWriter::toJson(const core::ServiceRegistry& registry,
                                    const std::vector<core::DuplicateGroup>& duplicates,
                                    std::chrono::system_clock::time_point scanTime) {
    nlohmann::json j;
    j["scan_time"] = formatScanTime(scanTime);

    j["services"] = nlohmann::json::object();
    for (const auto& [port, service] : registry) {
        j["services"][std::to_string(port)] = serviceToJson(service);
    }

    j["duplicates"] = nlohmann::json::object();
    for (const auto& group : duplicates) {
        j["duplicates"][group.label.toString()] = group.ports();
    }
    return j;
}

std::string ReportWriter::formatScanTime(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return buffer;
}

bool ReportWriter::write(const std::filesystem::path& path, const core::ServiceRegistry& registry,
                         const std::vector<core::DuplicateGroup>& duplicates,
                         std::chrono::system_clock::time_point scanTime) {
    // Headers and command lines are raw bytes; invalid UTF-8 becomes U+FFFD
    std::string text;
    try {
        text = toJson(registry, duplicates, scanTime)
                   .dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to serialize report: {}", e.what());
        return false;
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        spdlog::error("Failed to open report file for writing: {}", path.string());
        return false;
    }

    file << text << '\n';
    if (!file) {
        spdlog::error("Failed to write report to {}", path.string());
        return false;
    }

    spdlog::info("Exported {} services to {}", registry.size(), path.string());
    return true;
}

} // namespace portsy::infra
