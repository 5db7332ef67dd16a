#include <catch2/catch_test_macros.hpp>

#include "app/CommandLine.hpp"

#include <sstream>

using namespace portsy::app;

TEST_CASE("parseCommandLine defaults", "[CommandLine]") {
    auto options = parseCommandLine(std::vector<std::string>{});

    REQUIRE_FALSE(options.preset.has_value());
    REQUIRE(options.startPort == 3000);
    REQUIRE(options.endPort == 9000);
    REQUIRE_FALSE(options.timeoutSeconds.has_value());
    REQUIRE_FALSE(options.workers.has_value());
    REQUIRE_FALSE(options.noRoutes);
    REQUIRE_FALSE(options.noDuplicates);
    REQUIRE_FALSE(options.jsonPath.has_value());
}

TEST_CASE("parseCommandLine flags", "[CommandLine]") {
    SECTION("Short and long forms") {
        auto options = parseCommandLine(
            std::vector<std::string>{"-s", "4000", "--end-port", "4100", "-t", "0.25", "-j",
                                     "out.json", "-v"});

        REQUIRE(options.startPort == 4000);
        REQUIRE(options.endPort == 4100);
        REQUIRE(options.timeoutSeconds == 0.25);
        REQUIRE(parseCommandLine(std::vector<std::string>{"-t", "3600"}).timeoutSeconds == 3600.0);
        REQUIRE(options.jsonPath == std::filesystem::path("out.json"));
        REQUIRE(options.verbose);
    }

    SECTION("Inline values") {
        auto options =
            parseCommandLine(std::vector<std::string>{"--preset=dev", "--workers=16"});

        REQUIRE(options.preset == "dev");
        REQUIRE(options.workers == 16);
    }

    SECTION("Switches") {
        auto options = parseCommandLine(std::vector<std::string>{
            "--comprehensive-routes", "--no-routes", "--no-duplicates", "--include-unattributed",
            "--list-presets", "--help"});

        REQUIRE(options.comprehensiveRoutes);
        REQUIRE(options.noRoutes);
        REQUIRE(options.noDuplicates);
        REQUIRE(options.includeUnattributed);
        REQUIRE(options.listPresets);
        REQUIRE(options.help);
    }

    SECTION("Config directory") {
        auto options = parseCommandLine(std::vector<std::string>{"--config", "/tmp/portsy-cfg"});
        REQUIRE(options.configDir == std::filesystem::path("/tmp/portsy-cfg"));
    }
}

TEST_CASE("parseCommandLine errors", "[CommandLine]") {
    REQUIRE_THROWS_AS(parseCommandLine(std::vector<std::string>{"--bogus"}), UsageError);
    REQUIRE_THROWS_AS(parseCommandLine(std::vector<std::string>{"--preset"}), UsageError);
    REQUIRE_THROWS_AS(parseCommandLine(std::vector<std::string>{"-s", "abc"}), UsageError);
    REQUIRE_THROWS_AS(parseCommandLine(std::vector<std::string>{"-s", "30x"}), UsageError);
    REQUIRE_THROWS_AS(parseCommandLine(std::vector<std::string>{"-t", "fast"}), UsageError);
    REQUIRE_THROWS_AS(parseCommandLine(std::vector<std::string>{"--no-routes=yes"}), UsageError);
    REQUIRE_THROWS_AS(parseCommandLine(std::vector<std::string>{"-t", "0"}), UsageError);
    REQUIRE_THROWS_AS(parseCommandLine(std::vector<std::string>{"-t", "-1"}), UsageError);
    REQUIRE_THROWS_AS(parseCommandLine(std::vector<std::string>{"-t", "1e300"}), UsageError);
    REQUIRE_THROWS_AS(parseCommandLine(std::vector<std::string>{"-t", "nan"}), UsageError);
    REQUIRE_THROWS_AS(parseCommandLine(std::vector<std::string>{"--workers", "0"}), UsageError);
}

TEST_CASE("printUsage lists every flag", "[CommandLine]") {
    std::ostringstream out;
    printUsage(out, "portsy");
    auto text = out.str();

    REQUIRE(text.find("Usage: portsy") != std::string::npos);
    for (const char* flag : {"--preset", "--start-port", "--end-port", "--timeout", "--workers",
                             "--comprehensive-routes", "--no-routes", "--no-duplicates",
                             "--include-unattributed", "--json", "--list-presets", "--config",
                             "--verbose", "--help"}) {
        REQUIRE(text.find(flag) != std::string::npos);
    }
}
