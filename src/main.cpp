#include "app/Application.hpp"
#include "app/CommandLine.hpp"
#include "app/ReportPrinter.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <utility>

int main(int argc, char* argv[]) {
    portsy::app::CliOptions options;
    try {
        options = portsy::app::parseCommandLine(argc, argv);
    } catch (const portsy::app::UsageError& e) {
        std::cerr << e.what() << "\n\n";
        portsy::app::printUsage(std::cerr, argv[0]);
        return 2;
    }

    if (options.help) {
        portsy::app::printUsage(std::cout, argv[0]);
        return 0;
    }

    if (options.listPresets) {
        portsy::app::ReportPrinter::printPresets(std::cout, portsy::core::presetCatalog());
        return 0;
    }

    try {
        portsy::app::Application app(std::move(options));
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
