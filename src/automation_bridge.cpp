// =============================================================================
// Tapshot - Automation Server Bridge Implementation
// =============================================================================
#include "automation_bridge.hpp"
#include "image_annotator.hpp"
#include "tapshot_log.hpp"

#include <httplib.h>

static constexpr const char* TAG = "u2";

using json = nlohmann::json;

namespace tapshot {

namespace {

// u2 swipe advances one step every ~5ms
int stepsFor(int duration_ms) {
    int steps = duration_ms / 5;
    return steps < 1 ? 1 : steps;
}

int base64Value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

bool base64Decode(const std::string& in, std::string& out) {
    out.clear();
    out.reserve(in.size() / 4 * 3);
    uint32_t acc = 0;
    int bits = 0;
    for (char c : in) {
        if (c == '=') break;
        if (c == '\n' || c == '\r' || c == ' ' || c == '\t') continue;
        int v = base64Value(c);
        if (v < 0) return false;
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((acc >> bits) & 0xFF));
        }
    }
    return true;
}

// =============================================================================
// AutomationBridge
// =============================================================================

AutomationBridge::AutomationBridge(AutomationBridgeOptions opts, AdbBridgeOptions adb_opts)
    : opts_(std::move(opts)), adb_(std::move(adb_opts)) {}

Result<json> AutomationBridge::call(const std::string& method, const json& params) {
    httplib::Client cli(opts_.host, opts_.port);
    cli.set_connection_timeout(3, 0);
    cli.set_read_timeout(opts_.timeout_ms / 1000, (opts_.timeout_ms % 1000) * 1000);

    int id = next_id_.fetch_add(1);
    json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params}
    };

    auto res = cli.Post("/jsonrpc/0", request.dump(), "application/json");
    if (!res) {
        std::string msg = "automation server unreachable at " + opts_.host + ":" +
                          std::to_string(opts_.port) + " (" + httplib::to_string(res.error()) + ")";
        TLOG_ERROR(TAG, "%s", msg.c_str());
        return Err<json>(ErrorKind::Connection, msg);
    }
    if (res->status != 200) {
        return Err<json>(ErrorKind::Connection,
                         "HTTP " + std::to_string(res->status) + " from " + method);
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("error") && !body["error"].is_null()) {
            std::string msg = body["error"].value("message", std::string("unknown error"));
            return Err<json>(ErrorKind::Internal, method + ": " + msg);
        }
        if (!body.contains("result")) {
            return Err<json>(ErrorKind::Internal, method + ": response has no result");
        }
        return body["result"];
    } catch (const json::exception& e) {
        return Err<json>(ErrorKind::Internal, method + ": bad JSON-RPC response: " + e.what());
    }
}

Result<void> AutomationBridge::callAction(const std::string& method, const json& params) {
    auto r = call(method, params);
    if (r.is_err()) {
        return Error(ErrorKind::Action, r.error().message);
    }
    if (r.value().is_boolean() && !r.value().get<bool>()) {
        return Error(ErrorKind::Action, method + " returned false");
    }
    return Ok();
}

Result<void> AutomationBridge::checkReady() {
    auto r = call("deviceInfo", json::array());
    if (r.is_err()) {
        return Error(ErrorKind::Connection, r.error().message);
    }
    return Ok();
}

Result<std::string> AutomationBridge::dumpHierarchy() {
    auto r = call("dumpWindowHierarchy", json::array({false, 50}));
    if (r.is_err()) {
        return wrapError(ErrorKind::Capture, "dumpWindowHierarchy", r.error());
    }
    if (!r.value().is_string()) {
        return Err<std::string>(ErrorKind::Capture, "dumpWindowHierarchy returned no text");
    }
    std::string xml = r.value().get<std::string>();
    if (xml.find("<hierarchy") == std::string::npos) {
        return Err<std::string>(ErrorKind::Capture, "hierarchy dump is empty or malformed");
    }
    return xml;
}

Result<std::string> AutomationBridge::screenshot() {
    auto r = call("takeScreenshot", json::array({1, 80}));
    if (r.is_err()) {
        return wrapError(ErrorKind::Capture, "takeScreenshot", r.error());
    }
    if (!r.value().is_string()) {
        return Err<std::string>(ErrorKind::Capture, "takeScreenshot returned no data");
    }

    std::string raw;
    if (!base64Decode(r.value().get<std::string>(), raw) || raw.empty()) {
        return Err<std::string>(ErrorKind::Capture, "takeScreenshot payload is not base64");
    }

    // Server sends JPEG; downstream consumers expect PNG
    auto img = decodeImage(raw);
    if (img.is_err()) {
        return Err<std::string>(ErrorKind::Capture, img.error().message);
    }
    return encodePng(img.value());
}

std::string AutomationBridge::foregroundActivity() {
    return adb_.foregroundActivity();
}

Result<void> AutomationBridge::tap(int x, int y) {
    return callAction("click", json::array({x, y}));
}

Result<void> AutomationBridge::longPress(int x, int y, int duration_ms) {
    return callAction("swipe", json::array({x, y, x, y, stepsFor(duration_ms)}));
}

Result<void> AutomationBridge::swipe(int x1, int y1, int x2, int y2, int duration_ms) {
    return callAction("swipe", json::array({x1, y1, x2, y2, stepsFor(duration_ms)}));
}

Result<void> AutomationBridge::inputText(const std::string& text) {
    return adb_.inputText(text);
}

Result<void> AutomationBridge::back() {
    return callAction("pressKey", json::array({"back"}));
}

} // namespace tapshot
