#pragma once
// =============================================================================
// Tapshot - Capture Request Model
// =============================================================================
// One capture cycle's input: which node to act on, which action to perform
// and how the post snapshot is timed. Requests from the control plane are
// parsed and validated once here; everything downstream works on the
// already-validated ActionSpec.
// =============================================================================

#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "result.hpp"
#include "ui/node_resolver.hpp"

namespace tapshot {

enum class ActionKind { ShortClick, LongClick, Swipe, Input, Back, Final };

// Ledger spelling: "short-click", "long-click", "swipe", "input", "back", "final"
const char* actionName(ActionKind kind);

// Lower-cases, maps '_' to '-' and resolves aliases (tap, click, long-press,
// text, system-back ...). Empty input means short-click.
std::optional<ActionKind> normalizeActionName(const std::string& name);

enum class SwipeDirection { Up, Down, Left, Right };

const char* directionName(SwipeDirection d);
std::optional<SwipeDirection> parseDirection(const std::string& name);

// --- action variants ---

struct ShortClick {};

struct LongClick {
    int duration_ms = 0;
};

struct Swipe {
    // Either direction + distance, or an explicit offset
    std::optional<SwipeDirection> direction;
    int distance = 0;
    int dx = 0;
    int dy = 0;
    int duration_ms = 0;
};

struct InputText {
    std::string text;
};

struct Back {};

using ActionSpec = std::variant<ShortClick, LongClick, Swipe, InputText, Back>;

ActionKind actionKind(const ActionSpec& spec);

// Checks required fields (durations > 0, non-empty text). Validation error
// otherwise.
Result<void> validateAction(const ActionSpec& spec);

bool needsTarget(const ActionSpec& spec);

// --- swipe geometry ---

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
};

// Direction moves the start along one axis, clamped at 0 for up/left.
// Otherwise start + (dx, dy).
Point swipeDestination(const Swipe& swipe, Point start);

struct SwipeSummary {
    std::optional<std::string> direction;
    int distance = 0;
};

// Direction/distance as recorded in the ledger. For offsets the distance is
// the floor of the Euclidean length and the direction is the dominant axis
// (ties horizontal, none for a zero offset).
SwipeSummary summarizeSwipe(const Swipe& swipe);

// =============================================================================
// Request
// =============================================================================

enum class CaptureTiming { Post, Mid };

struct CaptureRequest {
    std::optional<ui::NodeQuery> query;      // absent for back
    ActionSpec action = ShortClick{};
    CaptureTiming timing = CaptureTiming::Post;
    int wait_after_ms = 400;
    int mid_delay_ms = 50;
    nlohmann::json node_hint = nlohmann::json::object();   // enriches the record only
    std::string origin = "request";

    // false when the action already happened on the device (observed gesture)
    bool perform_action = true;
    bool post_capture = true;
};

struct RequestDefaults {
    int duration_ms = 800;
    int wait_after_ms = 400;
    int mid_delay_ms = 50;
};

// Control-plane payload -> validated request.
// bounds wins over xpath when both are given; an unparsable bounds string is
// a validation error.
Result<CaptureRequest> parseCaptureRequest(const nlohmann::json& payload,
                                           const RequestDefaults& defaults = {});

} // namespace tapshot
