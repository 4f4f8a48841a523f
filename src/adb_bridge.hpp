#pragma once
// =============================================================================
// Tapshot - ADB Shell Bridge
// =============================================================================
// DeviceBridge over the adb command line. Every call spawns one adb process
// (`adb [-s serial] ...`) bounded by the configured command timeout.
//
//   dumpHierarchy   shell uiautomator dump <remote>; exec-out cat <remote>
//   screenshot      exec-out screencap -p
//   activity        shell dumpsys activity (mResumedActivity line)
//   actions         shell input tap|swipe|text|keyevent
// =============================================================================

#include <string>
#include <vector>

#include "device_bridge.hpp"
#include "process_runner.hpp"

namespace tapshot {

struct AdbBridgeOptions {
    std::string adb_path = "adb";
    std::string serial;
    int timeout_ms = 15000;
    std::string remote_dump_path = "/sdcard/window_dump.xml";
};

class AdbBridge : public DeviceBridge {
public:
    explicit AdbBridge(AdbBridgeOptions opts);

    std::string name() const override { return "adb"; }

    Result<void> checkReady() override;
    Result<std::string> dumpHierarchy() override;
    Result<std::string> screenshot() override;
    std::string foregroundActivity() override;

    Result<void> tap(int x, int y) override;
    Result<void> longPress(int x, int y, int duration_ms) override;
    Result<void> swipe(int x1, int y1, int x2, int y2, int duration_ms) override;
    Result<void> inputText(const std::string& text) override;
    Result<void> back() override;

    // Runs `adb [-s serial] <args...>`
    Result<ProcessOutput, IoError> run(const std::vector<std::string>& args,
                                       int timeout_ms = -1) const;

    const AdbBridgeOptions& options() const { return opts_; }

private:
    Result<void> runAction(const std::vector<std::string>& args);

    AdbBridgeOptions opts_;
};

// --- output parsers (pure, unit tested) ---

// Extracts "package/activity" from `dumpsys activity` output. A leading '.'
// in the activity is expanded with the package. Empty when nothing matches.
std::string parseForegroundActivity(const std::string& dumpsys_output);

// True when `adb devices` lists at least one entry in state "device".
// On success *serial receives the first ready serial.
bool parseDevicesReady(const std::string& devices_output, std::string* serial = nullptr);

// `input text` encoding: spaces become %s
std::string encodeInputText(const std::string& text);

} // namespace tapshot
