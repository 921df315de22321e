#include <catch2/catch_test_macros.hpp>
#include "uma/configuration/protocol_config.hpp"

using namespace uma::protocol::configuration;

TEST_CASE("ProtocolConfig - Defaults", "[config]") {
    SECTION("Default advertises 1.0 with 0.3 fallback") {
        auto config = ProtocolConfig::Default();
        REQUIRE(config.GetMajorVersion() == 1);
        REQUIRE(config.GetMinorVersion() == 0);
        REQUIRE(config.GetCurrentVersion() == "1.0");
        REQUIRE(config.GetBackwardCompatibleVersions() == std::vector<std::string>{"0.3"});
    }

    SECTION("Non-expiring keys are refused by default") {
        REQUIRE_FALSE(ProtocolConfig::Default().AllowsNonExpiringKeys());
    }
}

TEST_CASE("ProtocolConfig - Overrides", "[config]") {
    SECTION("WithCurrentVersion leaves the original untouched") {
        const auto base = ProtocolConfig::Default();
        const auto bumped = base.WithCurrentVersion(1, 2);
        REQUIRE(bumped.GetCurrentVersion() == "1.2");
        REQUIRE(base.GetCurrentVersion() == "1.0");
        REQUIRE_FALSE(base == bumped);
    }

    SECTION("WithBackwardCompatibleVersions replaces the list") {
        const auto config = ProtocolConfig::Default().WithBackwardCompatibleVersions({});
        REQUIRE(config.GetBackwardCompatibleVersions().empty());
    }

    SECTION("WithNonExpiringKeysAllowed toggles the flag") {
        const auto config = ProtocolConfig::Default().WithNonExpiringKeysAllowed(true);
        REQUIRE(config.AllowsNonExpiringKeys());
        REQUIRE(config == ProtocolConfig::Default().WithNonExpiringKeysAllowed(true));
    }
}
