// =============================================================================
// Tapshot - Click Detector Implementation
// =============================================================================
#include "click_detector.hpp"
#include "tapshot_log.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

static constexpr const char* TAG = "click";

namespace tapshot {

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool isHex4(const std::string& s) {
    return s.size() == 4 && std::all_of(s.begin(), s.end(),
                                        [](unsigned char c) { return std::isxdigit(c) != 0; });
}

const char* typeName(const std::string& hex) {
    if (hex == "0000") return "EV_SYN";
    if (hex == "0001") return "EV_KEY";
    if (hex == "0003") return "EV_ABS";
    return nullptr;
}

const char* codeName(const std::string& hex) {
    if (hex == "014A") return "BTN_TOUCH";
    if (hex == "0145") return "BTN_TOOL_FINGER";
    if (hex == "0035") return "ABS_MT_POSITION_X";
    if (hex == "0036") return "ABS_MT_POSITION_Y";
    if (hex == "002F") return "ABS_MT_SLOT";
    if (hex == "0039") return "ABS_MT_TRACKING_ID";
    if (hex == "0000") return "ABS_X";
    if (hex == "0001") return "ABS_Y";
    return nullptr;
}

int clampInt(int64_t v) {
    if (v > INT32_MAX) return INT32_MAX;
    if (v < INT32_MIN) return INT32_MIN;
    return static_cast<int>(v);
}

} // namespace

// =============================================================================
// Line parsing
// =============================================================================

std::optional<int64_t> decodeEventValue(const std::string& token) {
    std::string v = upper(token);
    if (v == "DOWN") return 1;
    if (v == "UP") return 0;
    if (v == "FFFFFFFF" || v == "0XFFFFFFFF") return -1;

    std::string digits = v;
    if (digits.rfind("0X", 0) == 0) digits = digits.substr(2);
    if (!digits.empty() && digits.size() <= 16 &&
        std::all_of(digits.begin(), digits.end(),
                    [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        try {
            return static_cast<int64_t>(std::stoull(digits, nullptr, 16));
        } catch (const std::exception&) {
            // fall through to decimal
        }
    }
    try {
        size_t used = 0;
        long long d = std::stoll(v, &used, 10);
        if (used == v.size()) return static_cast<int64_t>(d);
    } catch (const std::exception&) {
        // not decimal either
    }
    return std::nullopt;
}

std::optional<RawEvent> parseEventLine(const std::string& line) {
    static const std::regex line_regex(
        R"(^\s*\[\s*\d+\.\d+\]\s+)"                    // timestamp
        R"((?:(/dev/input/event\d+):\s+)?)"            // optional device
        R"((EV_\w+|[0-9a-fA-F]{4})\s+)"                // type
        R"(([A-Za-z0-9_]+|[0-9a-fA-F]{4})\s+)"         // code
        R"((DOWN|UP|0[xX][0-9a-fA-F]+|-?[0-9a-fA-F]+))",  // value
        std::regex::icase);

    std::smatch m;
    if (!std::regex_search(line, m, line_regex)) return std::nullopt;

    auto value = decodeEventValue(m[4].str());
    if (!value) return std::nullopt;

    RawEvent ev;
    ev.device = m[1].str();

    std::string type = upper(m[2].str());
    const char* tname = isHex4(type) ? typeName(type) : nullptr;
    ev.type = tname ? tname : type;

    std::string code = upper(m[3].str());
    const char* cname = isHex4(code) ? codeName(code) : nullptr;
    ev.code = cname ? cname : code;

    ev.value = *value;
    return ev;
}

// =============================================================================
// State machine
// =============================================================================

ClickDetector::Step ClickDetector::feed(const std::string& line) {
    auto ev = parseEventLine(line);
    if (!ev) return Step{};
    return apply(*ev);
}

ClickDetector::Step ClickDetector::release() {
    Step step;
    if (ctx_.active && ctx_.last_x && ctx_.last_y) {
        step.gesture = CompletedGesture{*ctx_.last_x, *ctx_.last_y};
    }
    ctx_.active = false;
    ctx_.tracking_id.reset();
    return step;
}

ClickDetector::Step ClickDetector::apply(const RawEvent& ev) {
    Step step;

    if (ev.type == "EV_ABS") {
        if (ev.code == "ABS_MT_POSITION_X" || ev.code == "ABS_X") {
            ctx_.last_x = clampInt(ev.value);
        } else if (ev.code == "ABS_MT_POSITION_Y" || ev.code == "ABS_Y") {
            ctx_.last_y = clampInt(ev.value);
        } else if (ev.code == "ABS_MT_TRACKING_ID") {
            if (ev.value >= 0) {
                ctx_.tracking_id = clampInt(ev.value);
                if (!ctx_.active) step.down_started = true;
                ctx_.active = true;
            } else {
                step = release();
            }
        }
    } else if (ev.type == "EV_KEY" &&
               (ev.code == "BTN_TOUCH" || ev.code == "BTN_TOOL_FINGER")) {
        if (ev.value == 1) {
            if (!ctx_.active) step.down_started = true;
            ctx_.active = true;
        } else if (ev.value == 0) {
            step = release();
        }
    }

    if (step.gesture) {
        TLOG_DEBUG(TAG, "Gesture at (%d, %d)", step.gesture->x, step.gesture->y);
    }
    return step;
}

} // namespace tapshot
