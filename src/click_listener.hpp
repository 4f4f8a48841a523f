#pragma once
// =============================================================================
// Tapshot - Click Listener Session
// =============================================================================
// Continuous capture from physical touches:
//
//   GeteventReader -> ClickDetector -> CaptureOrchestrator::captureFrom()
//
// The "before" state has to exist before the finger lands, so the session
// keeps one pending pre snapshot: taken at start and again after every
// gesture. A gesture arriving with no pending snapshot is dropped.
// The touch itself is the action; nothing is dispatched to the device.
// =============================================================================

#include <atomic>
#include <optional>

#include "capture_orchestrator.hpp"
#include "click_detector.hpp"
#include "getevent_reader.hpp"
#include "result.hpp"

namespace tapshot {

struct ListenerOptions {
    int wait_after_ms = 400;
    bool post_capture = true;
    bool final_screenshot = true;
    int poll_ms = 1000;
};

class ClickListener {
public:
    ClickListener(CaptureOrchestrator& orchestrator, ListenerOptions opts);

    // Starts the reader and consumes it until `stop` is set or the producer
    // goes away. The reader is always stopped before returning.
    Result<void> run(GeteventReader& reader, const std::atomic<bool>& stop);

    // One event line; runs a capture cycle when it completes a gesture.
    void handleLine(const std::string& line);

    // (Re)takes the pending pre snapshot.
    void refreshPending();

    bool hasPending() const { return pending_.has_value(); }
    size_t recorded() const { return recorded_; }
    size_t dropped() const { return dropped_; }

private:
    void onGesture(const CompletedGesture& g);

    CaptureOrchestrator& orchestrator_;
    ListenerOptions opts_;
    ClickDetector detector_;
    std::optional<UiSnapshot> pending_;
    size_t recorded_ = 0;
    size_t dropped_ = 0;
};

} // namespace tapshot
