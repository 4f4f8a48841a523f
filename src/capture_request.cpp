// =============================================================================
// Tapshot - Capture Request Model Implementation
// =============================================================================
#include "capture_request.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace tapshot {

namespace {

std::string lowerTrim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    std::string out = s.substr(b, e - b);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c == '_') c = '-';
    }
    return out;
}

Error invalid(const std::string& msg) {
    return Error(ErrorKind::Validation, msg);
}

// Absent or null -> nothing. Numbers and numeric strings are accepted when
// they fit in an int; anything else is a validation error.
Result<std::optional<int>> optInt(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::optional<int>{};

    const std::string out_of_range = std::string(key) + " is out of range";
    auto fits = [](long long v) {
        return v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
    };

    if (it->is_number_unsigned()) {
        uint64_t v = it->get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<int>::max())) return invalid(out_of_range);
        return std::optional<int>{static_cast<int>(v)};
    }
    if (it->is_number_integer()) {
        int64_t v = it->get<int64_t>();
        if (!fits(v)) return invalid(out_of_range);
        return std::optional<int>{static_cast<int>(v)};
    }
    if (it->is_number_float()) {
        double v = std::trunc(it->get<double>());
        if (!std::isfinite(v) || v < std::numeric_limits<int>::min() ||
            v > std::numeric_limits<int>::max()) {
            return invalid(out_of_range);
        }
        return std::optional<int>{static_cast<int>(v)};
    }
    if (it->is_string()) {
        const std::string s = it->get<std::string>();
        char* end = nullptr;
        errno = 0;
        long long v = std::strtoll(s.c_str(), &end, 10);
        if (!s.empty() && end && *end == '\0') {
            if (errno == ERANGE || !fits(v)) return invalid(out_of_range);
            return std::optional<int>{static_cast<int>(v)};
        }
    }
    return invalid(std::string(key) + " must be an integer");
}

std::string optString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace

const char* actionName(ActionKind kind) {
    switch (kind) {
        case ActionKind::ShortClick: return "short-click";
        case ActionKind::LongClick:  return "long-click";
        case ActionKind::Swipe:      return "swipe";
        case ActionKind::Input:      return "input";
        case ActionKind::Back:       return "back";
        case ActionKind::Final:      return "final";
    }
    return "unknown";
}

std::optional<ActionKind> normalizeActionName(const std::string& name) {
    const std::string t = lowerTrim(name);
    if (t.empty() || t == "tap" || t == "click" || t == "short" || t == "short-click")
        return ActionKind::ShortClick;
    if (t == "long-press" || t == "longclick" || t == "long-click" || t == "press")
        return ActionKind::LongClick;
    if (t == "input" || t == "text" || t == "type") return ActionKind::Input;
    if (t == "swipe") return ActionKind::Swipe;
    if (t == "back" || t == "system-back" || t == "navigate-back") return ActionKind::Back;
    return std::nullopt;
}

const char* directionName(SwipeDirection d) {
    switch (d) {
        case SwipeDirection::Up:    return "up";
        case SwipeDirection::Down:  return "down";
        case SwipeDirection::Left:  return "left";
        case SwipeDirection::Right: return "right";
    }
    return "";
}

std::optional<SwipeDirection> parseDirection(const std::string& name) {
    const std::string t = lowerTrim(name);
    if (t == "up") return SwipeDirection::Up;
    if (t == "down") return SwipeDirection::Down;
    if (t == "left") return SwipeDirection::Left;
    if (t == "right") return SwipeDirection::Right;
    return std::nullopt;
}

ActionKind actionKind(const ActionSpec& spec) {
    switch (spec.index()) {
        case 0: return ActionKind::ShortClick;
        case 1: return ActionKind::LongClick;
        case 2: return ActionKind::Swipe;
        case 3: return ActionKind::Input;
        default: return ActionKind::Back;
    }
}

bool needsTarget(const ActionSpec& spec) {
    return !std::holds_alternative<Back>(spec);
}

Result<void> validateAction(const ActionSpec& spec) {
    if (auto lc = std::get_if<LongClick>(&spec)) {
        if (lc->duration_ms <= 0) return invalid("long-click requires durationMs > 0");
    } else if (auto sw = std::get_if<Swipe>(&spec)) {
        if (sw->duration_ms <= 0) return invalid("swipe requires durationMs > 0");
        if (sw->direction && sw->distance < 0) return invalid("swipe distance must be >= 0");
    } else if (auto in = std::get_if<InputText>(&spec)) {
        if (in->text.empty()) return invalid("text required for input action");
    }
    return Ok();
}

namespace {

int saturate(int64_t v) {
    return static_cast<int>(std::clamp<int64_t>(v, std::numeric_limits<int>::min(),
                                                std::numeric_limits<int>::max()));
}

} // namespace

Point swipeDestination(const Swipe& swipe, Point start) {
    const int64_t x = start.x;
    const int64_t y = start.y;
    if (!swipe.direction) return Point{saturate(x + swipe.dx), saturate(y + swipe.dy)};

    const int64_t d = swipe.distance;
    switch (*swipe.direction) {
        case SwipeDirection::Up:    return Point{start.x, saturate(std::max<int64_t>(0, y - d))};
        case SwipeDirection::Down:  return Point{start.x, saturate(y + d)};
        case SwipeDirection::Left:  return Point{saturate(std::max<int64_t>(0, x - d)), start.y};
        case SwipeDirection::Right: return Point{saturate(x + d), start.y};
    }
    return start;
}

SwipeSummary summarizeSwipe(const Swipe& swipe) {
    SwipeSummary s;
    if (swipe.direction) {
        s.direction = directionName(*swipe.direction);
        s.distance = swipe.distance;
        return s;
    }

    const double len = std::hypot(static_cast<double>(swipe.dx), static_cast<double>(swipe.dy));
    s.distance = saturate(static_cast<int64_t>(std::floor(len)));
    const int64_t adx = std::llabs(static_cast<int64_t>(swipe.dx));
    const int64_t ady = std::llabs(static_cast<int64_t>(swipe.dy));
    if (adx >= ady) {
        if (swipe.dx > 0) s.direction = "right";
        else if (swipe.dx < 0) s.direction = "left";
    } else {
        s.direction = swipe.dy > 0 ? "down" : "up";
    }
    return s;
}

// =============================================================================
// Payload parsing
// =============================================================================

Result<CaptureRequest> parseCaptureRequest(const nlohmann::json& payload,
                                           const RequestDefaults& defaults) {
    if (!payload.is_object()) {
        return Err<CaptureRequest>(ErrorKind::Validation, "request body must be a JSON object");
    }

    const std::string action_raw = optString(payload, "action");
    auto kind = normalizeActionName(action_raw);
    if (!kind) {
        return Err<CaptureRequest>(ErrorKind::Validation, "unknown action: " + action_raw);
    }

    auto duration = TAPSHOT_TRY(optInt(payload, "durationMs"));
    auto wait_after = TAPSHOT_TRY(optInt(payload, "waitAfterMs"));
    auto mid_delay = TAPSHOT_TRY(optInt(payload, "midDelayMs"));
    const int duration_ms = duration.value_or(defaults.duration_ms);

    CaptureRequest req;
    req.wait_after_ms = wait_after.value_or(defaults.wait_after_ms);
    req.mid_delay_ms = mid_delay.value_or(defaults.mid_delay_ms);
    if (req.wait_after_ms < 0 || req.mid_delay_ms < 0) {
        return Err<CaptureRequest>(ErrorKind::Validation, "delays must be >= 0");
    }

    auto mid = payload.find("midCapture");
    if (mid != payload.end() && mid->is_boolean() && mid->get<bool>()) {
        req.timing = CaptureTiming::Mid;
    }

    auto node = payload.find("node");
    if (node != payload.end() && node->is_object()) req.node_hint = *node;

    switch (*kind) {
        case ActionKind::LongClick:
            req.action = LongClick{duration_ms};
            break;
        case ActionKind::Input: {
            auto text = payload.find("text");
            if (text == payload.end() || text->is_null()) {
                req.action = InputText{};
            } else if (text->is_string()) {
                req.action = InputText{text->get<std::string>()};
            } else {
                req.action = InputText{text->dump()};
            }
            break;
        }
        case ActionKind::Swipe: {
            Swipe sw;
            sw.duration_ms = duration_ms;
            auto dir = parseDirection(optString(payload, "direction"));
            auto distance = TAPSHOT_TRY(optInt(payload, "distance"));
            auto dx = TAPSHOT_TRY(optInt(payload, "dx"));
            auto dy = TAPSHOT_TRY(optInt(payload, "dy"));
            if (dir && distance) {
                sw.direction = dir;
                sw.distance = *distance;
            } else if (dx || dy) {
                sw.dx = dx.value_or(0);
                sw.dy = dy.value_or(0);
            } else {
                return Err<CaptureRequest>(ErrorKind::Validation,
                                           "swipe requires direction+distance or dx/dy");
            }
            req.action = sw;
            break;
        }
        case ActionKind::Back:
            req.action = Back{};
            break;
        default:
            req.action = ShortClick{};
            break;
    }

    auto valid = validateAction(req.action);
    if (valid.is_err()) return valid.error();

    if (needsTarget(req.action)) {
        const std::string bounds = optString(payload, "bounds");
        const std::string xpath = optString(payload, "xpath");
        if (!bounds.empty()) {
            const std::string norm = ui::normalize_bounds(bounds);
            if (!ui::parse_bounds(norm)) {
                return Err<CaptureRequest>(ErrorKind::Validation, "invalid bounds format: " + bounds);
            }
            req.query = ui::BoundsQuery{norm};
        } else if (!xpath.empty()) {
            req.query = ui::PathQuery{xpath};
        } else {
            return Err<CaptureRequest>(ErrorKind::Validation, "bounds or xpath required");
        }
    }

    return req;
}

} // namespace tapshot
