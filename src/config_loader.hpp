#pragma once
// =============================================================================
// Tapshot Config Loader
// =============================================================================
// Loads settings from config.json with nlohmann/json
// =============================================================================

#include <string>
#include <fstream>
#include <cstdlib>
#include "tapshot_log.hpp"

#include <nlohmann/json.hpp>

namespace tapshot {
namespace config {

struct DeviceConfig {
    std::string adb_path = "adb";
    std::string serial;                       // empty = adb default device
    std::string backend = "adb";              // "adb" | "u2"
    std::string automation_host = "127.0.0.1";
    int automation_port = 9008;
    int command_timeout_ms = 15000;
    std::string remote_dump_path = "/sdcard/window_dump.xml";
};

struct CaptureConfig {
    std::string output_dir = "UI_Automated_acquisition";
    std::string ledger_file = "collected_data.json";
    int wait_after_ms = 400;
    int mid_delay_ms = 50;
    int default_duration_ms = 800;
    int mid_join_slack_ms = 1500;
    int mid_join_default_ms = 1000;
    int box_width = 4;
};

struct ListenerConfig {
    std::string event_device;                 // empty = autodetect
    int queue_capacity = 1000;
    int stop_grace_ms = 2000;
    bool post_capture = true;
    bool final_screenshot = true;
};

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 8001;
    int max_clients = 4;
};

struct LogConfig {
    std::string log_path = "tapshot.log";
    std::string level = "info";
    long max_bytes = 2 * 1024 * 1024;
    int backups = 2;
};

struct AppConfig {
    DeviceConfig device;
    CaptureConfig capture;
    ListenerConfig listener;
    ServerConfig server;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    try {
        if (j.contains(section) && j[section].contains(key)) {
            return j[section][key].get<T>();
        }
    } catch (const nlohmann::json::exception& e) {
        TLOG_WARN("config", "%s.%s has wrong type, using default (%s)",
                  section.c_str(), key.c_str(), e.what());
    }
    return def;
}

// Environment overrides applied after the file is read.
inline void applyEnvOverrides(AppConfig& config) {
    if (const char* dev = std::getenv("TAPSHOT_EVENT_DEVICE")) {
        if (*dev) config.listener.event_device = dev;
    }
    if (const char* verbose = std::getenv("TAPSHOT_VERBOSE")) {
        if (*verbose && std::string(verbose) != "0") config.log.level = "debug";
    }
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "config.json",
                            bool strict = false) {
    AppConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("config.json");
        if (!file.is_open()) {
            file.open("../config.json");
        }
    }
    if (!file.is_open()) {
        TLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        applyEnvOverrides(config);
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);

        config.device.adb_path = jsonGet<std::string>(j, "device", "adb_path", "adb");
        config.device.serial = jsonGet<std::string>(j, "device", "serial", "");
        config.device.backend = jsonGet<std::string>(j, "device", "backend", "adb");
        config.device.automation_host = jsonGet<std::string>(j, "device", "automation_host", "127.0.0.1");
        config.device.automation_port = jsonGet<int>(j, "device", "automation_port", 9008);
        config.device.command_timeout_ms = jsonGet<int>(j, "device", "command_timeout_ms", 15000);
        config.device.remote_dump_path = jsonGet<std::string>(j, "device", "remote_dump_path", "/sdcard/window_dump.xml");

        config.capture.output_dir = jsonGet<std::string>(j, "capture", "output_dir", "UI_Automated_acquisition");
        config.capture.ledger_file = jsonGet<std::string>(j, "capture", "ledger_file", "collected_data.json");
        config.capture.wait_after_ms = jsonGet<int>(j, "capture", "wait_after_ms", 400);
        config.capture.mid_delay_ms = jsonGet<int>(j, "capture", "mid_delay_ms", 50);
        config.capture.default_duration_ms = jsonGet<int>(j, "capture", "default_duration_ms", 800);
        config.capture.mid_join_slack_ms = jsonGet<int>(j, "capture", "mid_join_slack_ms", 1500);
        config.capture.mid_join_default_ms = jsonGet<int>(j, "capture", "mid_join_default_ms", 1000);
        config.capture.box_width = jsonGet<int>(j, "capture", "box_width", 4);

        config.listener.event_device = jsonGet<std::string>(j, "listener", "event_device", "");
        config.listener.queue_capacity = jsonGet<int>(j, "listener", "queue_capacity", 1000);
        config.listener.stop_grace_ms = jsonGet<int>(j, "listener", "stop_grace_ms", 2000);
        config.listener.post_capture = jsonGet<bool>(j, "listener", "post_capture", true);
        config.listener.final_screenshot = jsonGet<bool>(j, "listener", "final_screenshot", true);

        config.server.host = jsonGet<std::string>(j, "server", "host", "127.0.0.1");
        config.server.port = jsonGet<int>(j, "server", "port", 8001);
        config.server.max_clients = jsonGet<int>(j, "server", "max_clients", 4);

        config.log.log_path = jsonGet<std::string>(j, "log", "path", "tapshot.log");
        config.log.level = jsonGet<std::string>(j, "log", "level", "info");
        config.log.max_bytes = jsonGet<long>(j, "log", "max_bytes", 2 * 1024 * 1024);
        config.log.backups = jsonGet<int>(j, "log", "backups", 2);

    } catch (const nlohmann::json::exception& e) {
        TLOG_ERROR("config", "JSON parse error: %s", e.what());
        AppConfig defaults;
        applyEnvOverrides(defaults);
        return defaults;
    }

    applyEnvOverrides(config);

    TLOG_INFO("config", "Loaded: backend=%s, output_dir=%s, server=%s:%d",
              config.device.backend.c_str(),
              config.capture.output_dir.c_str(),
              config.server.host.c_str(),
              config.server.port);

    return config;
}

} // namespace config
} // namespace tapshot
