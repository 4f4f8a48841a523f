// =============================================================================
// Tapshot - Command Line Entry Point
// =============================================================================
//   tapshot listen [--config F] [--device D] [--reset-ledger] [--verbose]
//   tapshot serve  [--config F] [--host H] [--port P] [--backend adb|u2]
//                  [--reset-ledger] [--verbose]
// =============================================================================
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include "adb_bridge.hpp"
#include "automation_bridge.hpp"
#include "capture_orchestrator.hpp"
#include "click_listener.hpp"
#include "config_loader.hpp"
#include "control_server.hpp"
#include "getevent_reader.hpp"
#include "ledger.hpp"
#include "tapshot_log.hpp"

namespace {

std::atomic<bool> g_stop{false};

void onSignal(int) {
    g_stop = true;
}

struct CliOptions {
    std::string command;
    std::string config_path = "config.json";
    std::string device;
    std::string host;
    int port = -1;
    std::string backend;
    bool reset_ledger = false;
    bool verbose = false;
};

void printUsage() {
    std::fprintf(stderr,
                 "usage:\n"
                 "  tapshot listen [--config F] [--device D] [--reset-ledger] [--verbose]\n"
                 "  tapshot serve  [--config F] [--host H] [--port P] [--backend adb|u2]\n"
                 "                 [--reset-ledger] [--verbose]\n");
}

bool parseArgs(int argc, char* argv[], CliOptions& cli) {
    if (argc < 2) return false;
    cli.command = argv[1];
    if (cli.command != "listen" && cli.command != "serve") return false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        if (arg == "--config") {
            if (!next(cli.config_path)) return false;
        } else if (arg == "--device" && cli.command == "listen") {
            if (!next(cli.device)) return false;
        } else if (arg == "--host" && cli.command == "serve") {
            if (!next(cli.host)) return false;
        } else if (arg == "--port" && cli.command == "serve") {
            std::string p;
            if (!next(p)) return false;
            char* end = nullptr;
            long v = std::strtol(p.c_str(), &end, 10);
            if (p.empty() || *end != '\0' || v < 0 || v > 65535) return false;
            cli.port = static_cast<int>(v);
        } else if (arg == "--backend" && cli.command == "serve") {
            if (!next(cli.backend)) return false;
            if (cli.backend != "adb" && cli.backend != "u2") return false;
        } else if (arg == "--reset-ledger") {
            cli.reset_ledger = true;
        } else if (arg == "--verbose" || arg == "-v") {
            cli.verbose = true;
        } else {
            std::fprintf(stderr, "unknown option: %s\n", arg.c_str());
            return false;
        }
    }
    return true;
}

tapshot::AdbBridgeOptions adbOptions(const tapshot::config::DeviceConfig& dev) {
    tapshot::AdbBridgeOptions o;
    o.adb_path = dev.adb_path;
    o.serial = dev.serial;
    o.timeout_ms = dev.command_timeout_ms;
    o.remote_dump_path = dev.remote_dump_path;
    return o;
}

std::unique_ptr<tapshot::DeviceBridge> makeBridge(const tapshot::config::DeviceConfig& dev) {
    if (dev.backend == "u2") {
        tapshot::AutomationBridgeOptions o;
        o.host = dev.automation_host;
        o.port = dev.automation_port;
        o.timeout_ms = dev.command_timeout_ms;
        return std::make_unique<tapshot::AutomationBridge>(o, adbOptions(dev));
    }
    if (dev.backend != "adb") {
        TLOG_WARN("main", "Unknown backend '%s', using adb", dev.backend.c_str());
    }
    return std::make_unique<tapshot::AdbBridge>(adbOptions(dev));
}

int runListen(const tapshot::config::AppConfig& cfg, tapshot::CaptureOrchestrator& orch) {
    tapshot::AdbBridge adb(adbOptions(cfg.device));

    std::string device = cfg.listener.event_device;
    if (device.empty()) device = tapshot::detectTouchDevice(adb);

    tapshot::GeteventReaderOptions ro;
    ro.command = tapshot::geteventCommand(cfg.device.adb_path, cfg.device.serial, device);
    ro.capacity = static_cast<size_t>(std::max(cfg.listener.queue_capacity, 1));
    ro.stop_grace_ms = cfg.listener.stop_grace_ms;
    tapshot::GeteventReader reader(ro);

    tapshot::ListenerOptions lo;
    lo.wait_after_ms = cfg.capture.wait_after_ms;
    lo.post_capture = cfg.listener.post_capture;
    lo.final_screenshot = cfg.listener.final_screenshot;

    tapshot::ClickListener listener(orch, lo);
    auto r = listener.run(reader, g_stop);
    if (r.is_err()) {
        TLOG_ERROR("main", "Listener failed: %s", tapshot::describe(r.error()).c_str());
        return 1;
    }
    return 0;
}

int runServe(const tapshot::config::AppConfig& cfg, tapshot::CaptureOrchestrator& orch) {
    tapshot::ControlServerOptions so;
    so.host = cfg.server.host;
    so.port = cfg.server.port;
    so.max_clients = cfg.server.max_clients;
    so.defaults.duration_ms = cfg.capture.default_duration_ms;
    so.defaults.wait_after_ms = cfg.capture.wait_after_ms;
    so.defaults.mid_delay_ms = cfg.capture.mid_delay_ms;

    tapshot::ControlServer server(orch, so);
    auto started = server.start();
    if (started.is_err()) {
        TLOG_ERROR("main", "Server failed to start: %s", started.error().message.c_str());
        return 1;
    }

    while (!g_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    server.stop();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions cli;
    if (!parseArgs(argc, argv, cli)) {
        printUsage();
        return 2;
    }

    auto cfg = tapshot::config::loadConfig(cli.config_path, cli.config_path != "config.json");
    if (cli.verbose) cfg.log.level = "debug";
    if (!cli.device.empty()) cfg.listener.event_device = cli.device;
    if (!cli.host.empty()) cfg.server.host = cli.host;
    if (cli.port >= 0) cfg.server.port = cli.port;
    if (!cli.backend.empty()) cfg.device.backend = cli.backend;

    tapshot::log::setLogLevel(tapshot::log::parseLevel(cfg.log.level));
    if (!tapshot::log::openLogFile(cfg.log.log_path.c_str(), cfg.log.max_bytes, cfg.log.backups)) {
        TLOG_WARN("main", "Cannot open log file %s, logging to stderr only",
                  cfg.log.log_path.c_str());
    }
    TLOG_INFO("main", "tapshot %s starting (backend=%s)", cli.command.c_str(),
              cfg.device.backend.c_str());

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    auto bridge = makeBridge(cfg.device);
    auto ready = bridge->checkReady();
    if (ready.is_err()) {
        TLOG_ERROR("main", "Device not ready: %s", ready.error().message.c_str());
        tapshot::log::closeLogFile();
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(cfg.capture.output_dir, ec);
    tapshot::Ledger ledger(
        (std::filesystem::path(cfg.capture.output_dir) / cfg.capture.ledger_file).string());
    if (cli.reset_ledger) {
        auto reset = ledger.reset();
        if (reset.is_err()) {
            TLOG_ERROR("main", "Ledger reset failed: %s", reset.error().message.c_str());
            tapshot::log::closeLogFile();
            return 1;
        }
    }

    tapshot::OrchestratorOptions oo;
    oo.output_dir = cfg.capture.output_dir;
    oo.box_width = cfg.capture.box_width;
    oo.mid_join_slack_ms = cfg.capture.mid_join_slack_ms;
    oo.mid_join_default_ms = cfg.capture.mid_join_default_ms;
    tapshot::CaptureOrchestrator orch(*bridge, ledger, oo);

    int rc = cli.command == "listen" ? runListen(cfg, orch) : runServe(cfg, orch);

    TLOG_INFO("main", "tapshot exiting (%d)", rc);
    tapshot::log::closeLogFile();
    return rc;
}
