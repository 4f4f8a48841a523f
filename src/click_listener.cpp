// =============================================================================
// Tapshot - Click Listener Session Implementation
// =============================================================================
#include "click_listener.hpp"
#include "tapshot_log.hpp"

static constexpr const char* TAG = "listener";

namespace tapshot {

ClickListener::ClickListener(CaptureOrchestrator& orchestrator, ListenerOptions opts)
    : orchestrator_(orchestrator), opts_(opts) {}

void ClickListener::refreshPending() {
    auto snap = orchestrator_.preSnapshot();
    if (snap.is_err()) {
        TLOG_WARN(TAG, "Pre snapshot failed: %s", snap.error().message.c_str());
        pending_.reset();
        return;
    }
    pending_ = std::move(snap).value();
    TLOG_DEBUG(TAG, "Pending snapshot elem_%zu ready", pending_->sequence_id);
}

void ClickListener::handleLine(const std::string& line) {
    auto step = detector_.feed(line);
    if (step.down_started) TLOG_DEBUG(TAG, "Touch down");
    if (step.gesture) onGesture(*step.gesture);
}

void ClickListener::onGesture(const CompletedGesture& g) {
    TLOG_INFO(TAG, "Click at (%d, %d)", g.x, g.y);

    if (!pending_) {
        dropped_++;
        TLOG_WARN(TAG, "No pre snapshot ready, click at (%d, %d) ignored; undo it on the device",
                  g.x, g.y);
    } else {
        CaptureRequest req;
        req.query = ui::PointQuery{g.x, g.y};
        req.action = ShortClick{};
        req.origin = "gesture";
        req.perform_action = false;
        req.post_capture = opts_.post_capture;
        req.wait_after_ms = opts_.wait_after_ms;

        auto report = orchestrator_.captureFrom(*pending_, req);
        if (report.is_ok()) {
            recorded_++;
        } else {
            TLOG_WARN(TAG, "Click at (%d, %d) not recorded: %s", g.x, g.y,
                      describe(report.error()).c_str());
        }
    }

    refreshPending();
}

Result<void> ClickListener::run(GeteventReader& reader, const std::atomic<bool>& stop) {
    TAPSHOT_TRY(reader.start());
    TLOG_INFO(TAG, "Listening for touches (Ctrl+C to stop)");

    refreshPending();
    while (!stop.load()) {
        auto line = reader.pop(opts_.poll_ms);
        if (line) {
            handleLine(*line);
        } else if (reader.finished()) {
            TLOG_WARN(TAG, "Event stream ended");
            break;
        }
    }

    reader.stop();
    TLOG_INFO(TAG, "Stopped: %zu recorded, %zu dropped", recorded_, dropped_);

    if (opts_.final_screenshot) {
        auto saved = orchestrator_.saveFinalScreenshot();
        if (saved.is_err()) {
            TLOG_WARN(TAG, "Final screenshot failed: %s", saved.error().message.c_str());
        }
    }
    return Ok();
}

} // namespace tapshot
