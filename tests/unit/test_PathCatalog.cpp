#include <catch2/catch_test_macros.hpp>

#include "core/types/PathCatalog.hpp"

#include <algorithm>

using namespace portsy::core;

namespace {

bool contains(const std::vector<std::string>& paths, const std::string& path) {
    return std::find(paths.begin(), paths.end(), path) != paths.end();
}

} // namespace

TEST_CASE("PathCatalog defaults", "[PathCatalog]") {
    auto catalog = PathCatalog::defaults();

    SECTION("Common set starts with the root path") {
        auto common = catalog.paths(PathSetMode::Common);
        REQUIRE(common.size() == 20);
        REQUIRE(common.front() == "/");
        REQUIRE(contains(common, "/health"));
        REQUIRE(contains(common, "/graphql"));
    }

    SECTION("Framework lists are present") {
        const auto& frameworks = catalog.frameworks();
        REQUIRE(frameworks.count("flask") == 1);
        REQUIRE(frameworks.count("spring") == 1);
        REQUIRE(frameworks.count("ollama") == 1);
        REQUIRE(frameworks.count("dev_servers") == 1);
    }
}

TEST_CASE("PathCatalog comprehensive set", "[PathCatalog]") {
    auto catalog = PathCatalog::defaults();
    auto all = catalog.paths(PathSetMode::Comprehensive);

    SECTION("Sorted and free of duplicates") {
        REQUIRE(std::is_sorted(all.begin(), all.end()));
        REQUIRE(std::adjacent_find(all.begin(), all.end()) == all.end());
    }

    SECTION("Superset of the common set and every framework list") {
        for (const auto& path : catalog.commonPaths()) {
            REQUIRE(contains(all, path));
        }
        for (const auto& [name, list] : catalog.frameworks()) {
            for (const auto& path : list) {
                REQUIRE(contains(all, path));
            }
        }
    }

    SECTION("Larger than the common set") {
        REQUIRE(all.size() > catalog.commonPaths().size());
        REQUIRE(contains(all, "/actuator/health"));
    }
}

TEST_CASE("PathCatalog overrides", "[PathCatalog]") {
    auto catalog = PathCatalog::defaults();

    SECTION("setCommonPaths replaces the common set") {
        catalog.setCommonPaths({"/", "/custom"});
        REQUIRE(catalog.paths(PathSetMode::Common) == std::vector<std::string>{"/", "/custom"});
    }

    SECTION("setFrameworkPaths adds a new list to the comprehensive set") {
        catalog.setFrameworkPaths("inhouse", {"/internal/ping"});
        REQUIRE(contains(catalog.paths(PathSetMode::Comprehensive), "/internal/ping"));
        REQUIRE_FALSE(contains(catalog.paths(PathSetMode::Common), "/internal/ping"));
    }

    SECTION("Empty catalog yields empty sets") {
        PathCatalog empty;
        REQUIRE(empty.paths(PathSetMode::Common).empty());
        REQUIRE(empty.paths(PathSetMode::Comprehensive).empty());
    }
}

TEST_CASE("PathCatalog modeToString", "[PathCatalog]") {
    REQUIRE(PathCatalog::modeToString(PathSetMode::Common) == "common");
    REQUIRE(PathCatalog::modeToString(PathSetMode::Comprehensive) == "comprehensive");
}
