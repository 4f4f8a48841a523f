#pragma once
// =============================================================================
// Tapshot - Device Bridge
// =============================================================================
// Capability set the capture pipeline needs from one physical device:
// hierarchy dump, screenshot, foreground activity and primitive actions.
//
// Backends:
//   AdbBridge         - `adb shell` / `adb exec-out` commands
//   AutomationBridge  - uiautomator2 JSON-RPC server on the device
//
// All calls are blocking. A bridge that cannot reach its device fails fast
// with ErrorKind::Connection.
// =============================================================================

#include <string>

#include "result.hpp"

namespace tapshot {

class DeviceBridge {
public:
    virtual ~DeviceBridge() = default;

    // Short backend name for logs ("adb", "u2")
    virtual std::string name() const = 0;

    // Connection check; Ok when the device answers.
    virtual Result<void> checkReady() = 0;

    virtual Result<std::string> dumpHierarchy() = 0;

    // Encoded PNG bytes
    virtual Result<std::string> screenshot() = 0;

    // "package/activity", or empty when it cannot be determined
    virtual std::string foregroundActivity() = 0;

    // --- primitive actions ---
    virtual Result<void> tap(int x, int y) = 0;
    virtual Result<void> longPress(int x, int y, int duration_ms) = 0;
    virtual Result<void> swipe(int x1, int y1, int x2, int y2, int duration_ms) = 0;
    virtual Result<void> inputText(const std::string& text) = 0;
    virtual Result<void> back() = 0;
};

} // namespace tapshot
