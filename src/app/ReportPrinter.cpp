#include "app/ReportPrinter.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace portsy::app {

namespace {

constexpr int kRuleWidth = 110;

std::string rule() {
    return std::string(kRuleWidth, '-');
}

std::string describePorts(const core::ScanPreset& preset) {
    std::ostringstream ss;
    for (size_t i = 0; i < preset.ranges.size(); ++i) {
        if (i > 0) {
            ss << ",";
        }
        const auto& span = preset.ranges[i];
        ss << span.start;
        if (span.end != span.start) {
            ss << "-" << span.end;
        }
    }
    return ss.str();
}

} // namespace

std::string ReportPrinter::summarizeRoutes(const std::set<std::string>& routes) {
    if (routes.empty()) {
        return "-";
    }

    std::string result;
    size_t shown = 0;
    for (const auto& route : routes) {
        if (shown == kMaxRoutesShown) {
            break;
        }
        if (shown > 0) {
            result += ", ";
        }
        result += route;
        ++shown;
    }

    if (routes.size() > kMaxRoutesShown) {
        result += " (+" + std::to_string(routes.size() - kMaxRoutesShown) + " more)";
    }
    return result;
}

void ReportPrinter::printServices(std::ostream& out, const core::ServiceRegistry& registry) {
    out << "\nRunning Services:\n";
    out << rule() << "\n";
    out << std::left << std::setw(8) << "Port" << std::setw(8) << "PID" << std::setw(20)
        << "Process" << std::setw(40) << "Routes" << std::setw(12) << "Fingerprint"
        << "Response Time\n";
    out << rule() << "\n";

    for (const auto& [port, service] : registry) {
        std::string pid = service.isAttributed() ? std::to_string(service.pid()) : "-";
        std::string name = service.isAttributed() ? service.processName() : "-";

        std::string responseTime = "N/A";
        if (auto elapsed = service.responseTime()) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(1)
               << static_cast<double>(elapsed->count()) / 1000.0 << "ms";
            responseTime = ss.str();
        }

        out << std::left << std::setw(8) << port << std::setw(8) << pid << std::setw(20) << name
            << std::setw(40) << summarizeRoutes(service.routes()) << std::setw(12)
            << service.fingerprint().value_or("-") << responseTime << "\n";
    }
}

void ReportPrinter::printDuplicates(std::ostream& out,
                                    const std::vector<core::DuplicateGroup>& groups) {
    out << "\nPotential Duplicate Services:\n";
    for (const auto& group : groups) {
        out << "\n  " << group.label.toString() << ":\n";
        for (const auto* service : group.services) {
            out << "   - Port " << service->port() << ": ";
            if (service->isAttributed()) {
                out << service->processName() << " (PID: " << service->pid() << ")";
            } else {
                out << "unknown process";
            }
            out << "\n";
        }
    }
}

void ReportPrinter::printPresets(std::ostream& out, const std::vector<core::ScanPreset>& presets) {
    out << "\nAvailable Scan Presets:\n";
    for (const auto& preset : presets) {
        out << "  " << std::left << std::setw(10) << preset.name << " - " << preset.description
            << " [" << describePorts(preset) << "]\n";
    }
}

} // namespace portsy::app
