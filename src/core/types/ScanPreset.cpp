#include "core/types/ScanPreset.hpp"

namespace portsy::core {

bool PortSpan::isValid() const {
    return start >= 1 && end <= 65535 && start <= end;
}

const std::vector<ScanPreset>& presetCatalog() {
    static const std::vector<ScanPreset> presets = {
        {"quick", {{3000, 9000}, {8000, 8100}}, "Common dev server ports"},
        {"dev",
         {{3000, 3100}, {4000, 4100}, {5000, 5100}, {8000, 8100}, {9000, 9100}, {8080, 8090}},
         "Extended dev server ranges"},
        {"web",
         {{80, 80},
          {443, 443},
          {8080, 8080},
          {8443, 8443},
          {3000, 3100},
          {8000, 8100},
          {9000, 9100}},
         "Web server ports"},
        {"full", {{1, 65535}}, "Complete port range (slow)"},
        {"services",
         {{21, 25},
          {53, 53},
          {80, 80},
          {110, 110},
          {143, 143},
          {443, 443},
          {993, 993},
          {995, 995},
          {1433, 1433},
          {3306, 3306},
          {5432, 5432},
          {6379, 6379},
          {27017, 27017}},
         "Common service ports"}};
    return presets;
}

const ScanPreset* findPreset(std::string_view name) {
    for (const auto& preset : presetCatalog()) {
        if (preset.name == name) {
            return &preset;
        }
    }
    return nullptr;
}

} // namespace portsy::core
