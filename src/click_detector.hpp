#pragma once
// =============================================================================
// Tapshot - Click Detector
// =============================================================================
// Turns `getevent -lt` output lines into completed single-finger gestures.
//
// Line grammar:  [<timestamp>] [<device>: ] <type> <code> <value>
//   type   EV_KEY / EV_ABS / ... or 4 hex digits (0001 = EV_KEY, 0003 = EV_ABS)
//   code   symbolic name or 4 hex digits (014A = BTN_TOUCH, 0035 = ABS_MT_POSITION_X ...)
//   value  DOWN / UP / hex / decimal; ffffffff decodes as -1
//
// State machine (single touch slot only; multi-finger input is not tracked):
//   Idle   --(BTN_TOUCH|BTN_TOOL_FINGER DOWN, or TRACKING_ID >= 0)--> Active
//   Active --(key UP, or TRACKING_ID == -1)--> Idle, emitting (lastX, lastY)
//          when both coordinates are known
// Position codes only update lastX/lastY. Unparseable lines are ignored.
// =============================================================================

#include <cstdint>
#include <optional>
#include <string>

namespace tapshot {

struct RawEvent {
    std::string device;    // "/dev/input/eventN" or empty
    std::string type;      // symbolic, e.g. "EV_ABS"
    std::string code;      // symbolic when known, else upper-case hex
    int64_t value = 0;
};

// Parses and decodes one line; nothing when the grammar or value does not match.
std::optional<RawEvent> parseEventLine(const std::string& line);

// DOWN=1, UP=0, ffffffff=-1, hex, then decimal. Nothing if undecodable.
std::optional<int64_t> decodeEventValue(const std::string& token);

struct TouchContext {
    bool active = false;
    std::optional<int> tracking_id;
    std::optional<int> last_x;
    std::optional<int> last_y;
};

struct CompletedGesture {
    int x = 0;
    int y = 0;

    bool operator==(const CompletedGesture& o) const { return x == o.x && y == o.y; }
};

class ClickDetector {
public:
    enum class State { Idle, Active };

    struct Step {
        std::optional<CompletedGesture> gesture;
        bool down_started = false;
    };

    // Feed one raw line
    Step feed(const std::string& line);

    // Feed one already-decoded event
    Step apply(const RawEvent& ev);

    State state() const { return ctx_.active ? State::Active : State::Idle; }
    const TouchContext& context() const { return ctx_; }

    void reset() { ctx_ = TouchContext{}; }

private:
    Step release();

    TouchContext ctx_;
};

} // namespace tapshot
