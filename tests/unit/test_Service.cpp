#include <catch2/catch_test_macros.hpp>

#include "core/types/Service.hpp"

using namespace portsy::core;

namespace {

ServiceDiscovery makeDiscovery() {
    ServiceDiscovery discovery;
    discovery.routes = {"/", "/health"};
    discovery.headers = {{"Server", "uvicorn"}};
    discovery.fingerprint = {"0123456789abcdef", "01234567"};
    discovery.responseTime = std::chrono::microseconds(1500);
    return discovery;
}

} // namespace

TEST_CASE("Service construction", "[Service]") {
    SECTION("Attributed service exposes process fields") {
        Service service(3001, ProcessInfo{555, "dev-server", "dev-server --port 3001"});

        REQUIRE(service.port() == 3001);
        REQUIRE(service.protocol() == "tcp");
        REQUIRE(service.isAttributed());
        REQUIRE(service.pid() == 555);
        REQUIRE(service.processName() == "dev-server");
        REQUIRE(service.processCommandLine() == "dev-server --port 3001");
    }

    SECTION("Unattributed service reports empty process fields") {
        Service service(8080, std::nullopt);

        REQUIRE_FALSE(service.isAttributed());
        REQUIRE(service.pid() == 0);
        REQUIRE(service.processName().empty());
        REQUIRE(service.processCommandLine().empty());
    }
}

TEST_CASE("Service before discovery", "[Service]") {
    Service service(3000, ProcessInfo{1, "node", "node server.js"});

    REQUIRE(service.state() == ServiceState::Discovered);
    REQUIRE(service.discovery() == nullptr);
    REQUIRE(service.routes().empty());
    REQUIRE(service.headers().empty());
    REQUIRE_FALSE(service.fingerprint().has_value());
    REQUIRE_FALSE(service.responseTime().has_value());
}

TEST_CASE("Service attachDiscovery", "[Service]") {
    Service service(3000, ProcessInfo{1, "node", "node server.js"});

    SECTION("Snapshot fields become visible together") {
        service.attachDiscovery(makeDiscovery());

        REQUIRE(service.state() == ServiceState::Probed);
        REQUIRE(service.routes() == std::set<std::string>{"/", "/health"});
        REQUIRE(service.headers().at("Server") == "uvicorn");
        REQUIRE(service.fingerprint() == "01234567");
        REQUIRE(service.responseTime() == std::chrono::microseconds(1500));
        REQUIRE(service.discovery()->responseTimeMs() == 1.5);
    }

    SECTION("Empty route set is a valid discovery") {
        auto discovery = makeDiscovery();
        discovery.routes.clear();
        service.attachDiscovery(discovery);

        REQUIRE(service.state() == ServiceState::Probed);
        REQUIRE(service.routes().empty());
        REQUIRE(service.fingerprint().has_value());
    }

    SECTION("Earlier snapshots stay intact after replacement") {
        service.attachDiscovery(makeDiscovery());
        auto first = service.discovery();

        auto second = makeDiscovery();
        second.routes = {"/docs"};
        service.attachDiscovery(second);

        REQUIRE(first->routes == std::set<std::string>{"/", "/health"});
        REQUIRE(service.routes() == std::set<std::string>{"/docs"});
    }

    SECTION("Copies share the snapshot") {
        service.attachDiscovery(makeDiscovery());
        Service copy = service;

        REQUIRE(copy.discovery() == service.discovery());
    }
}

TEST_CASE("Service stateToString", "[Service]") {
    REQUIRE(Service::stateToString(ServiceState::Discovered) == "Discovered");
    REQUIRE(Service::stateToString(ServiceState::Probed) == "Probed");
}
