// =============================================================================
// Tapshot - ADB Shell Bridge Implementation
// =============================================================================
#include "adb_bridge.hpp"
#include "tapshot_log.hpp"

#include <regex>
#include <sstream>

static constexpr const char* TAG = "adb";

namespace tapshot {

namespace {

constexpr size_t MAX_SCREENSHOT_SIZE = 50 * 1024 * 1024;
constexpr int KEYCODE_BACK = 4;

void trimRight(std::string& s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
}

// adb's own wording when the transport to the device is gone
bool deviceUnreachable(const ProcessOutput& out) {
    if (out.exit_code == 0) return false;
    static const std::regex missing(R"(device( '[^']*')? not found)");
    static const char* const kMarkers[] = {
        "no devices/emulators found", "device offline", "device unauthorized", "error: closed",
    };
    const std::string& text = out.err.empty() ? out.out : out.err;
    for (const char* m : kMarkers) {
        if (text.find(m) != std::string::npos) return true;
    }
    return std::regex_search(text, missing);
}

// A missing adb binary or refused transport means no device, not a bad capture.
ErrorKind captureFailureKind(const IoError& e) {
    switch (e.io_kind) {
    case IoError::Kind::NotFound:
    case IoError::Kind::ConnectionRefused:
        return ErrorKind::Connection;
    default:
        return ErrorKind::Capture;
    }
}

} // namespace

// =============================================================================
// Output parsers
// =============================================================================

std::string parseForegroundActivity(const std::string& dumpsys_output) {
    static const std::regex resumed(R"(mResumedActivity:\s*(.*))");
    static const std::regex focused(R"(mFocusedActivity:\s*(.*))");
    static const std::regex component(R"(\s([\w\.]+)/(\.?[\w\.$]+))");

    std::smatch m;
    std::string line;
    if (std::regex_search(dumpsys_output, m, resumed) ||
        std::regex_search(dumpsys_output, m, focused)) {
        line = m[1].str();
    } else {
        return "";
    }
    trimRight(line);

    std::smatch c;
    if (std::regex_search(line, c, component)) {
        std::string pkg = c[1].str();
        std::string act = c[2].str();
        if (!act.empty() && act[0] == '.') act = pkg + act;
        return pkg + "/" + act;
    }
    // Unknown layout: keep the raw record text
    size_t start = line.find_first_not_of(" \t");
    return start == std::string::npos ? "" : line.substr(start);
}

bool parseDevicesReady(const std::string& devices_output, std::string* serial) {
    std::istringstream iss(devices_output);
    std::string line;
    while (std::getline(iss, line)) {
        trimRight(line);
        if (line.empty()) continue;
        if (line.find("List of devices") != std::string::npos) continue;

        size_t tab_pos = line.find('\t');
        if (tab_pos == std::string::npos) continue;
        if (line.substr(tab_pos + 1) == "device") {
            if (serial) *serial = line.substr(0, tab_pos);
            return true;
        }
    }
    return false;
}

std::string encodeInputText(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        if (c == ' ') out += "%s";
        else out += c;
    }
    return out;
}

// =============================================================================
// AdbBridge
// =============================================================================

AdbBridge::AdbBridge(AdbBridgeOptions opts) : opts_(std::move(opts)) {}

Result<ProcessOutput, IoError> AdbBridge::run(const std::vector<std::string>& args,
                                              int timeout_ms) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 3);
    argv.push_back(opts_.adb_path);
    if (!opts_.serial.empty()) {
        argv.push_back("-s");
        argv.push_back(opts_.serial);
    }
    argv.insert(argv.end(), args.begin(), args.end());
    return runProcess(argv, timeout_ms > 0 ? timeout_ms : opts_.timeout_ms);
}

Result<void> AdbBridge::checkReady() {
    auto r = run({"devices"}, 10000);
    if (r.is_err()) {
        return wrapError(ErrorKind::Connection, "adb devices failed", r.error());
    }
    const auto& out = r.value();
    if (out.exit_code != 0) {
        std::string msg = out.err.empty() ? out.out : out.err;
        trimRight(msg);
        return Error(ErrorKind::Connection, msg.empty() ? "adb devices failed" : msg);
    }

    std::string serial;
    if (!parseDevicesReady(out.out, &serial)) {
        return Error(ErrorKind::Connection,
                     "no device ready (check USB, authorization, or 'adb connect')");
    }
    if (!opts_.serial.empty() && out.out.find(opts_.serial + "\tdevice") == std::string::npos) {
        return Error(ErrorKind::Connection, "device " + opts_.serial + " is not ready");
    }
    TLOG_DEBUG(TAG, "Device ready: %s", serial.c_str());
    return Ok();
}

Result<std::string> AdbBridge::dumpHierarchy() {
    auto dump = run({"shell", "uiautomator", "dump", opts_.remote_dump_path});
    if (dump.is_err()) {
        return wrapError(captureFailureKind(dump.error()), "uiautomator dump", dump.error());
    }
    if (dump.value().exit_code != 0) {
        std::string msg = dump.value().err.empty() ? dump.value().out : dump.value().err;
        trimRight(msg);
        ErrorKind kind = deviceUnreachable(dump.value()) ? ErrorKind::Connection : ErrorKind::Capture;
        return Err<std::string>(kind, "uiautomator dump failed: " + msg);
    }

    auto cat = run({"exec-out", "cat", opts_.remote_dump_path});
    if (cat.is_err()) {
        return wrapError(captureFailureKind(cat.error()), "pull hierarchy", cat.error());
    }
    if (deviceUnreachable(cat.value())) {
        std::string msg = cat.value().err;
        trimRight(msg);
        return Err<std::string>(ErrorKind::Connection, "pull hierarchy failed: " + msg);
    }
    std::string xml = std::move(cat.value().out);
    if (cat.value().exit_code != 0 || xml.find("<hierarchy") == std::string::npos) {
        return Err<std::string>(ErrorKind::Capture, "hierarchy dump is empty or malformed");
    }

    TLOG_DEBUG(TAG, "Hierarchy dumped: %zu bytes", xml.size());
    return xml;
}

Result<std::string> AdbBridge::screenshot() {
    auto r = run({"exec-out", "screencap", "-p"});
    if (r.is_err()) {
        return wrapError(captureFailureKind(r.error()), "screencap", r.error());
    }
    auto& out = r.value();
    if (out.exit_code != 0 || out.out.empty()) {
        ErrorKind kind = deviceUnreachable(out) ? ErrorKind::Connection : ErrorKind::Capture;
        trimRight(out.err);
        return Err<std::string>(kind,
                                "screencap failed (exit=" + std::to_string(out.exit_code) + ") " + out.err);
    }
    if (out.out.size() > MAX_SCREENSHOT_SIZE) {
        return Err<std::string>(ErrorKind::Capture, "screenshot exceeds size limit");
    }

    TLOG_DEBUG(TAG, "Screenshot captured: %zu bytes", out.out.size());
    return std::move(out.out);
}

std::string AdbBridge::foregroundActivity() {
    auto r = run({"shell", "dumpsys", "activity"});
    if (r.is_err() || r.value().exit_code != 0) {
        TLOG_WARN(TAG, "dumpsys activity failed");
        return "";
    }
    return parseForegroundActivity(r.value().out);
}

Result<void> AdbBridge::runAction(const std::vector<std::string>& args) {
    auto r = run(args);
    if (r.is_err()) {
        TLOG_ERROR(TAG, "Action failed: %s", r.error().message.c_str());
        return Error(ErrorKind::Action, r.error().message);
    }
    if (r.value().exit_code != 0) {
        std::string msg = r.value().err.empty() ? r.value().out : r.value().err;
        trimRight(msg);
        TLOG_ERROR(TAG, "Action exit=%d: %s", r.value().exit_code, msg.c_str());
        return Error(ErrorKind::Action,
                     "adb exit " + std::to_string(r.value().exit_code) + (msg.empty() ? "" : ": " + msg));
    }
    return Ok();
}

Result<void> AdbBridge::tap(int x, int y) {
    return runAction({"shell", "input", "tap", std::to_string(x), std::to_string(y)});
}

Result<void> AdbBridge::longPress(int x, int y, int duration_ms) {
    // Long press = swipe from same point to same point with duration
    return swipe(x, y, x, y, duration_ms);
}

Result<void> AdbBridge::swipe(int x1, int y1, int x2, int y2, int duration_ms) {
    return runAction({"shell", "input", "swipe",
                      std::to_string(x1), std::to_string(y1),
                      std::to_string(x2), std::to_string(y2),
                      std::to_string(duration_ms)});
}

Result<void> AdbBridge::inputText(const std::string& text) {
    if (text.empty()) return Error(ErrorKind::Action, "empty text");
    return runAction({"shell", "input", "text", shellQuote(encodeInputText(text))});
}

Result<void> AdbBridge::back() {
    return runAction({"shell", "input", "keyevent", std::to_string(KEYCODE_BACK)});
}

} // namespace tapshot
