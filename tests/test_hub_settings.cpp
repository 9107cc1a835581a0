#include <gtest/gtest.h>
#include "controlhub/config/hub_settings.hpp"
#include "test_helpers.hpp"

#include <filesystem>

namespace scoreboard::controlhub::test {

class HubSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_path = temp.path() / "controlhub.json";

        settings_content = R"({
            "scoreboard_dir": "/opt/nhl-led-scoreboard",
            "target_process": "scoreboard-main",
            "restart_timeout_ms": 45000,
            "supervisor": {
                "host": "10.0.0.5",
                "port": 9002,
                "request_timeout_ms": 2500
            },
            "health_check": {
                "probe": "tcp",
                "host": "127.0.0.1",
                "port": 8081,
                "attempts": 3,
                "interval_ms": 500,
                "max_interval_ms": 2000,
                "timeout_ms": 10000
            },
            "config_store": {
                "max_backups": 3
            },
            "log": {
                "level": "debug",
                "file": "/var/log/controlhub.log"
            }
        })";

        write_text(settings_path, settings_content);
    }

    TempDir temp;
    std::filesystem::path settings_path;
    std::string settings_content;
};

TEST_F(HubSettingsTest, LoadValidSettings) {
    auto result = HubSettings::load_from_file(settings_path);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    const auto& settings = result.value();
    EXPECT_EQ(settings.scoreboard_dir(), std::filesystem::path("/opt/nhl-led-scoreboard"));
    EXPECT_EQ(settings.target_process(), "scoreboard-main");
    EXPECT_EQ(settings.restart_timeout_ms(), 45000u);
    EXPECT_EQ(settings.supervisor().host, "10.0.0.5");
    EXPECT_EQ(settings.supervisor().port, 9002);
    EXPECT_EQ(settings.supervisor().request_timeout_ms, 2500u);
    EXPECT_EQ(settings.health_check().probe, "tcp");
    EXPECT_EQ(settings.health_check().port, 8081);
    EXPECT_EQ(settings.health_check().attempts, 3u);
    EXPECT_EQ(settings.config_store().max_backups, 3u);
    EXPECT_EQ(settings.log().level, "debug");
    EXPECT_EQ(settings.log().file, "/var/log/controlhub.log");
}

TEST_F(HubSettingsTest, MissingFileFallsBackToDefaults) {
    auto result = HubSettings::load_from_file(temp.path() / "absent.json");
    ASSERT_TRUE(result.has_value());

    const auto& settings = result.value();
    EXPECT_EQ(settings.target_process(), "scoreboard");
    EXPECT_EQ(settings.supervisor().port, 9001);
    EXPECT_EQ(settings.health_check().probe, "supervisor");
    EXPECT_EQ(settings.config_store().max_backups, 5u);
    EXPECT_TRUE(settings.scoreboard_dir().is_absolute());
}

TEST_F(HubSettingsTest, MalformedJson) {
    auto result = HubSettings::load_from_string("{ \"target_process\": ");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::CONFIG_INVALID_FORMAT);
}

TEST_F(HubSettingsTest, WrongTypeNamesField) {
    auto result = HubSettings::load_from_string(R"({"supervisor": {"port": "http"}})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_EQ(result.error().field(), "supervisor.port");
}

TEST_F(HubSettingsTest, PortOutOfRange) {
    auto result = HubSettings::load_from_string(R"({"supervisor": {"port": 70000}})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().field(), "supervisor.port");
}

TEST_F(HubSettingsTest, TcpProbeRequiresPort) {
    auto result = HubSettings::load_from_string(R"({"health_check": {"probe": "tcp"}})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().field(), "health_check.port");
}

TEST_F(HubSettingsTest, UnknownProbeRejected) {
    auto result = HubSettings::load_from_string(R"({"health_check": {"probe": "http"}})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().field(), "health_check.probe");
}

TEST_F(HubSettingsTest, BackoffCeilingBelowIntervalRejected) {
    auto result = HubSettings::load_from_string(
        R"({"health_check": {"interval_ms": 4000, "max_interval_ms": 1000}})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().field(), "health_check.max_interval_ms");
}

TEST_F(HubSettingsTest, StableChecksBoundedByAttempts) {
    auto result = HubSettings::load_from_string(R"({"health_check": {"attempts": 2, "stable_checks": 3}})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().field(), "health_check.stable_checks");

    auto zero = HubSettings::load_from_string(R"({"health_check": {"stable_checks": 0}})");
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().field(), "health_check.stable_checks");
}

TEST_F(HubSettingsTest, UnknownLogLevelRejected) {
    auto result = HubSettings::load_from_string(R"({"log": {"level": "verbose"}})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().field(), "log.level");
}

TEST_F(HubSettingsTest, UnknownKeysIgnored) {
    auto result = HubSettings::load_from_string(R"({"target_process": "sb", "colour": "red"})");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->target_process(), "sb");
}

TEST_F(HubSettingsTest, SaveAndReload) {
    HubSettings settings;
    settings.set_scoreboard_dir(temp.path());
    settings.set_target_process("display");
    settings.set_restart_timeout_ms(12000);
    auto health = settings.health_check();
    health.attempts = 9;
    health.stable_checks = 4;
    settings.set_health_check(health);

    const auto saved_path = temp.path() / "saved" / "controlhub.json";
    ASSERT_TRUE(settings.save_to_file(saved_path).has_value());

    auto reloaded = HubSettings::load_from_file(saved_path);
    ASSERT_TRUE(reloaded.has_value()) << reloaded.error().to_string();
    EXPECT_EQ(reloaded->target_process(), "display");
    EXPECT_EQ(reloaded->restart_timeout_ms(), 12000u);
    EXPECT_EQ(reloaded->health_check().attempts, 9u);
    EXPECT_EQ(reloaded->health_check().stable_checks, 4u);
    EXPECT_EQ(reloaded->scoreboard_dir(), settings.scoreboard_dir());
}

TEST_F(HubSettingsTest, PathsDerivedFromScoreboardDir) {
    HubSettings settings;
    settings.set_scoreboard_dir("/srv/scoreboard");
    const auto paths = settings.paths();

    EXPECT_EQ(paths.live_config, std::filesystem::path("/srv/scoreboard/config/config.json"));
    EXPECT_EQ(paths.canonical_config, std::filesystem::path("/srv/scoreboard/config/.controlhub/config.json"));
    EXPECT_EQ(paths.lock_file, std::filesystem::path("/srv/scoreboard/config/.controlhub/transaction.lock"));
    EXPECT_EQ(paths.sample_config, std::filesystem::path("/srv/scoreboard/config/config.json.sample"));
    EXPECT_EQ(paths.plugins_file, std::filesystem::path("/srv/scoreboard/plugins.json"));
    EXPECT_EQ(paths.plugin_root, std::filesystem::path("/srv/scoreboard/plugins"));
    EXPECT_EQ(paths.package_dir, std::filesystem::path("/srv/scoreboard/plugin_packages"));
    EXPECT_EQ(paths.version_file, std::filesystem::path("/srv/scoreboard/VERSION"));

    settings.set_package_dir("/tmp/packages");
    EXPECT_EQ(settings.paths().package_dir, std::filesystem::path("/tmp/packages"));
}

}  // namespace scoreboard::controlhub::test
