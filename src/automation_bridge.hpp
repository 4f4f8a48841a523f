#pragma once
// =============================================================================
// Tapshot - Automation Server Bridge
// =============================================================================
// DeviceBridge over the uiautomator2 JSON-RPC server running on the device
// (POST http://<host>:<port>/jsonrpc/0). Requires `adb forward` or a device
// reachable over the network.
//
// Text entry and foreground-activity queries have no JSON-RPC equivalent and
// are delegated to an AdbBridge.
// =============================================================================

#include <atomic>
#include <string>

#include <nlohmann/json.hpp>

#include "adb_bridge.hpp"
#include "device_bridge.hpp"

namespace tapshot {

struct AutomationBridgeOptions {
    std::string host = "127.0.0.1";
    int port = 9008;
    int timeout_ms = 15000;
};

class AutomationBridge : public DeviceBridge {
public:
    AutomationBridge(AutomationBridgeOptions opts, AdbBridgeOptions adb_opts);

    std::string name() const override { return "u2"; }

    Result<void> checkReady() override;
    Result<std::string> dumpHierarchy() override;
    Result<std::string> screenshot() override;
    std::string foregroundActivity() override;

    Result<void> tap(int x, int y) override;
    Result<void> longPress(int x, int y, int duration_ms) override;
    Result<void> swipe(int x1, int y1, int x2, int y2, int duration_ms) override;
    Result<void> inputText(const std::string& text) override;
    Result<void> back() override;

private:
    // One JSON-RPC round trip; returns the "result" member.
    Result<nlohmann::json> call(const std::string& method, const nlohmann::json& params);
    Result<void> callAction(const std::string& method, const nlohmann::json& params);

    AutomationBridgeOptions opts_;
    AdbBridge adb_;
    std::atomic<int> next_id_{1};
};

// Standard alphabet, padding optional, whitespace skipped.
// Returns false on any other character.
bool base64Decode(const std::string& in, std::string& out);

} // namespace tapshot
