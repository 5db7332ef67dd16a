#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace portsy::infra;
using namespace portsy::core;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "portsy_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

    void writeConfig(const nlohmann::json& j) const {
        std::ofstream file(configDir_ / "config.json");
        file << j.dump(2);
    }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "portsy_config_new_test";
        std::filesystem::remove_all(tempPath);

        REQUIRE_FALSE(std::filesystem::exists(tempPath));

        ConfigManager manager(tempPath);

        REQUIRE(std::filesystem::exists(tempPath));
        REQUIRE(std::filesystem::is_directory(tempPath));

        std::filesystem::remove_all(tempPath);
    }

    SECTION("Sets config and log paths") {
        TestConfigDir testDir;
        ConfigManager manager(testDir.path());

        REQUIRE(manager.configPath() == testDir.path() / "config.json");
        REQUIRE(manager.logPath() == testDir.path() / "portsy.log");
        REQUIRE(manager.configDir() == testDir.path().string());
    }
}

TEST_CASE("ConfigManager load operations", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("load creates config file with defaults when file does not exist") {
        ConfigManager manager(testDir.path());

        REQUIRE_FALSE(std::filesystem::exists(manager.configPath()));
        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));
    }

    SECTION("load returns defaults when config file does not exist") {
        ConfigManager manager(testDir.path());
        manager.load();

        const auto& config = manager.config();
        REQUIRE(config.scan.timeout == std::chrono::milliseconds(500));
        REQUIRE(config.scan.maxWorkers == 100);
        REQUIRE(config.scan.includeUnattributed == false);
        REQUIRE(config.discovery.timeout == std::chrono::milliseconds(2000));
        REQUIRE(config.discovery.maxWorkers == 10);
        REQUIRE(config.discovery.mode == PathSetMode::Common);
        REQUIRE_FALSE(config.commonPaths.has_value());
        REQUIRE(config.frameworkPaths.empty());
    }

    SECTION("load reads existing config file") {
        nlohmann::json j;
        j["scanner"]["timeout_ms"] = 250;
        j["scanner"]["max_workers"] = 32;
        j["scanner"]["include_unattributed"] = true;
        j["discovery"]["timeout_ms"] = 5000;
        j["discovery"]["max_workers"] = 4;
        j["discovery"]["comprehensive"] = true;
        j["paths"]["common"] = {"/", "/status"};
        j["paths"]["frameworks"]["inhouse"] = {"/internal/ping"};
        testDir.writeConfig(j);

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());

        const auto& config = manager.config();
        REQUIRE(config.scan.timeout == std::chrono::milliseconds(250));
        REQUIRE(config.scan.maxWorkers == 32);
        REQUIRE(config.scan.includeUnattributed == true);
        REQUIRE(config.discovery.timeout == std::chrono::milliseconds(5000));
        REQUIRE(config.discovery.maxWorkers == 4);
        REQUIRE(config.discovery.mode == PathSetMode::Comprehensive);
        REQUIRE(config.commonPaths == std::vector<std::string>{"/", "/status"});
        REQUIRE(config.frameworkPaths.at("inhouse") == std::vector<std::string>{"/internal/ping"});
    }

    SECTION("load replaces non-positive timeouts and worker counts with defaults") {
        nlohmann::json j;
        j["scanner"]["timeout_ms"] = 0;
        j["scanner"]["max_workers"] = -4;
        j["discovery"]["timeout_ms"] = -1;
        j["discovery"]["max_workers"] = 0;
        testDir.writeConfig(j);

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());

        const auto& config = manager.config();
        REQUIRE(config.scan.timeout == std::chrono::milliseconds(500));
        REQUIRE(config.scan.maxWorkers == 100);
        REQUIRE(config.discovery.timeout == std::chrono::milliseconds(2000));
        REQUIRE(config.discovery.maxWorkers == 10);
    }

    SECTION("load handles partial config with defaults for missing fields") {
        nlohmann::json j;
        j["scanner"]["max_workers"] = 8;
        testDir.writeConfig(j);

        ConfigManager manager(testDir.path());
        manager.load();

        REQUIRE(manager.config().scan.maxWorkers == 8);
        REQUIRE(manager.config().scan.timeout == std::chrono::milliseconds(500));
        REQUIRE(manager.config().discovery.maxWorkers == 10);
    }

    SECTION("load returns false for invalid JSON") {
        std::ofstream file(testDir.path() / "config.json");
        file << "{ invalid json content }}}";
        file.close();

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
    }

    SECTION("load returns false for values of the wrong type") {
        nlohmann::json j;
        j["scanner"]["max_workers"] = "many";
        testDir.writeConfig(j);

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
    }
}

TEST_CASE("ConfigManager save operations", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("save creates config file") {
        ConfigManager manager(testDir.path());

        REQUIRE_FALSE(std::filesystem::exists(manager.configPath()));
        REQUIRE(manager.save());
        REQUIRE(std::filesystem::exists(manager.configPath()));
    }

    SECTION("save persists configuration changes") {
        ConfigManager manager(testDir.path());
        manager.config().scan.timeout = std::chrono::milliseconds(750);
        manager.config().scan.includeUnattributed = true;
        manager.config().discovery.mode = PathSetMode::Comprehensive;
        manager.config().commonPaths = std::vector<std::string>{"/"};
        manager.config().frameworkPaths["inhouse"] = {"/internal"};

        REQUIRE(manager.save());

        ConfigManager manager2(testDir.path());
        REQUIRE(manager2.load());

        REQUIRE(manager2.config().scan.timeout == std::chrono::milliseconds(750));
        REQUIRE(manager2.config().scan.includeUnattributed == true);
        REQUIRE(manager2.config().discovery.mode == PathSetMode::Comprehensive);
        REQUIRE(manager2.config().commonPaths == std::vector<std::string>{"/"});
        REQUIRE(manager2.config().frameworkPaths.at("inhouse") ==
                std::vector<std::string>{"/internal"});
    }

    SECTION("Saved file uses the documented section names") {
        ConfigManager manager(testDir.path());
        manager.save();

        std::ifstream file(manager.configPath());
        auto j = nlohmann::json::parse(file);

        REQUIRE(j["scanner"]["timeout_ms"] == 500);
        REQUIRE(j["scanner"]["max_workers"] == 100);
        REQUIRE(j["discovery"]["timeout_ms"] == 2000);
        REQUIRE(j["discovery"]["comprehensive"] == false);
        REQUIRE_FALSE(j.contains("paths"));
    }
}

TEST_CASE("ConfigManager pathCatalog", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.path());

    SECTION("Without overrides the built-in catalog is used") {
        auto catalog = manager.pathCatalog();
        REQUIRE(catalog.commonPaths() == PathCatalog::defaults().commonPaths());
    }

    SECTION("Overrides are applied") {
        manager.config().commonPaths = std::vector<std::string>{"/", "/only"};
        manager.config().frameworkPaths["flask"] = {"/flask-only"};

        auto catalog = manager.pathCatalog();
        REQUIRE(catalog.paths(PathSetMode::Common) == std::vector<std::string>{"/", "/only"});
        REQUIRE(catalog.frameworks().at("flask") == std::vector<std::string>{"/flask-only"});
        REQUIRE(catalog.frameworks().count("django") == 1);
    }
}

TEST_CASE("ConfigManager defaultConfigDir", "[ConfigManager]") {
    auto dir = ConfigManager::defaultConfigDir();
    REQUIRE(dir.filename() == "portsy");
}
