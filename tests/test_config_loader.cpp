// =============================================================================
// Unit tests for config_loader.hpp
// Tests: defaults, file loading, wrong types, env overrides
// =============================================================================
#include <gtest/gtest.h>
#include <fstream>
#include <cstdio>
#include <cstdlib>
#include "config_loader.hpp"

using namespace tapshot::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void writeTmpJson(const char* path, const char* content) {
    std::ofstream f(path);
    f << content;
}

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("TAPSHOT_EVENT_DEVICE");
        unsetenv("TAPSHOT_VERBOSE");
    }
    void TearDown() override {
        unsetenv("TAPSHOT_EVENT_DEVICE");
        unsetenv("TAPSHOT_VERBOSE");
    }
};

TEST_F(ConfigLoaderTest, DefaultValues) {
    AppConfig cfg;
    EXPECT_EQ(cfg.device.adb_path,             "adb");
    EXPECT_EQ(cfg.device.backend,              "adb");
    EXPECT_EQ(cfg.device.automation_port,      9008);
    EXPECT_EQ(cfg.capture.output_dir,          "UI_Automated_acquisition");
    EXPECT_EQ(cfg.capture.ledger_file,         "collected_data.json");
    EXPECT_EQ(cfg.capture.wait_after_ms,       400);
    EXPECT_EQ(cfg.capture.mid_delay_ms,        50);
    EXPECT_EQ(cfg.capture.default_duration_ms, 800);
    EXPECT_EQ(cfg.capture.box_width,           4);
    EXPECT_EQ(cfg.listener.queue_capacity,     1000);
    EXPECT_EQ(cfg.listener.stop_grace_ms,      2000);
    EXPECT_EQ(cfg.server.port,                 8001);
    EXPECT_EQ(cfg.log.log_path,                "tapshot.log");
}

TEST_F(ConfigLoaderTest, MissingFileReturnsDefaults) {
    AppConfig cfg = loadConfig("__nonexistent_config_xyz.json", true);
    EXPECT_EQ(cfg.capture.output_dir, "UI_Automated_acquisition");
    EXPECT_EQ(cfg.server.host, "127.0.0.1");
}

TEST_F(ConfigLoaderTest, LoadsSections) {
    const char* path = "__test_tapshot_config.json";
    writeTmpJson(path, R"({
        "device":   {"serial": "emulator-5554", "backend": "u2", "automation_port": 7912},
        "capture":  {"output_dir": "out", "wait_after_ms": 1000},
        "listener": {"event_device": "/dev/input/event2", "final_screenshot": false},
        "server":   {"port": 9100},
        "log":      {"path": "x.log", "level": "debug", "backups": 5}
    })");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.device.serial, "emulator-5554");
    EXPECT_EQ(cfg.device.backend, "u2");
    EXPECT_EQ(cfg.device.automation_port, 7912);
    EXPECT_EQ(cfg.capture.output_dir, "out");
    EXPECT_EQ(cfg.capture.wait_after_ms, 1000);
    EXPECT_EQ(cfg.capture.mid_delay_ms, 50);
    EXPECT_EQ(cfg.listener.event_device, "/dev/input/event2");
    EXPECT_FALSE(cfg.listener.final_screenshot);
    EXPECT_EQ(cfg.server.port, 9100);
    EXPECT_EQ(cfg.log.log_path, "x.log");
    EXPECT_EQ(cfg.log.level, "debug");
    EXPECT_EQ(cfg.log.backups, 5);

    std::remove(path);
}

TEST_F(ConfigLoaderTest, WrongTypeFallsBackToDefault) {
    const char* path = "__test_tapshot_config_type.json";
    writeTmpJson(path, R"({"server": {"port": "not-a-number", "host": "0.0.0.0"}})");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.server.port, 8001);
    EXPECT_EQ(cfg.server.host, "0.0.0.0");

    std::remove(path);
}

TEST_F(ConfigLoaderTest, ParseErrorReturnsDefaults) {
    const char* path = "__test_tapshot_config_bad.json";
    writeTmpJson(path, "{ this is not json");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.capture.ledger_file, "collected_data.json");

    std::remove(path);
}

TEST_F(ConfigLoaderTest, EnvironmentOverrides) {
    setenv("TAPSHOT_EVENT_DEVICE", "/dev/input/event7", 1);
    setenv("TAPSHOT_VERBOSE", "1", 1);

    AppConfig cfg = loadConfig("__nonexistent_config_xyz.json", true);
    EXPECT_EQ(cfg.listener.event_device, "/dev/input/event7");
    EXPECT_EQ(cfg.log.level, "debug");
}

TEST_F(ConfigLoaderTest, VerboseZeroIsIgnored) {
    setenv("TAPSHOT_VERBOSE", "0", 1);

    AppConfig cfg;
    applyEnvOverrides(cfg);
    EXPECT_EQ(cfg.log.level, "info");
}
