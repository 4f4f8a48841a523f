#pragma once
// =============================================================================
// Tapshot - Capture Orchestrator
// =============================================================================
// Runs one capture cycle against a DeviceBridge:
//
//   PreCapture -> Resolve -> Annotate -> Act -> PostCapture -> Recorded
//
// The candidate sequence id is the ledger length when the cycle starts and is
// consumed only when the record is appended. PreCapture, Resolve and
// validation failures abort the cycle with no record written. Action failures
// are soft and land in the record. PostCapture failures only leave the post
// fields absent.
//
// Timing of the post snapshot:
//   Post  action runs to completion, then wait_after_ms, then capture
//   Mid   action starts on its own thread, mid_delay_ms later the capture runs
//         while the action may still be in flight, then a bounded join
//         (duration + slack for long-click/swipe, a fixed default otherwise).
//         The action is never re-invoked; its outcome stays observable through
//         CaptureReport::action_outcome.
//
// One cycle at a time: every public entry point takes the cycle mutex, and a
// cycle first waits for an action still running from a previous Mid cycle.
// =============================================================================

#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "capture_request.hpp"
#include "device_bridge.hpp"
#include "ledger.hpp"
#include "result.hpp"
#include "ui/node_resolver.hpp"

namespace tapshot {

struct OrchestratorOptions {
    std::string output_dir = "UI_Automated_acquisition";
    int box_width = 4;
    int mid_join_slack_ms = 1500;
    int mid_join_default_ms = 1000;
};

// Hierarchy dump + screenshot + activity taken at one instant
struct UiSnapshot {
    size_t sequence_id = 0;
    std::string xml_path;
    std::string screenshot_path;
    std::string activity;
    std::string xml;          // dump text
    std::string png;          // screenshot bytes
};

struct CaptureReport {
    size_t sequence_id = 0;
    std::string elem_id;
    std::optional<Point> center;
    ActionKind action = ActionKind::ShortClick;
    CaptureTiming timing = CaptureTiming::Post;
    std::string activity;

    std::string raw_path;
    std::string boxed_path;
    std::string xml_path;
    std::optional<std::string> dest_path;
    std::optional<std::string> dest_xml_path;
    std::optional<std::string> dest_activity;

    std::optional<std::string> action_error;
    // Mid cycles only: completion of the in-flight action
    std::shared_future<Result<void>> action_outcome;

    nlohmann::json record;
};

// Dispatches one primitive action. Short/long click and swipe start at center.
Result<void> dispatchAction(DeviceBridge& bridge, const ActionSpec& action,
                            const std::optional<Point>& center);

class CaptureOrchestrator {
public:
    CaptureOrchestrator(DeviceBridge& bridge, Ledger& ledger, OrchestratorOptions opts = {});
    ~CaptureOrchestrator();

    CaptureOrchestrator(const CaptureOrchestrator&) = delete;
    CaptureOrchestrator& operator=(const CaptureOrchestrator&) = delete;

    DeviceBridge& bridge() { return bridge_; }
    Ledger& ledger() { return ledger_; }
    const OrchestratorOptions& options() const { return opts_; }

    std::string imageDir() const;
    std::string xmlDir() const;

    // Full cycle with a fresh pre snapshot.
    Result<CaptureReport> capture(const CaptureRequest& req);

    // Pre snapshot for the next id, kept by callers that must capture the
    // "before" state ahead of an event they do not control (the listener).
    Result<UiSnapshot> preSnapshot();

    // Full cycle on a snapshot from preSnapshot(). Fails with a Ledger error
    // if the ledger grew since the snapshot was taken.
    Result<CaptureReport> captureFrom(const UiSnapshot& pre, const CaptureRequest& req);

    // Snapshot-only record: action "final", no node, boxed = raw.
    Result<CaptureReport> finalSnapshot();

    // Screenshot to <image dir>/final_screenshot.png; returns the path.
    Result<std::string> saveFinalScreenshot();

    // Blocks until an action left running by a Mid cycle has finished.
    void waitForInflightAction();

private:
    Result<UiSnapshot> takeSnapshot(size_t id);
    Result<CaptureReport> runCycle(const UiSnapshot& pre, const CaptureRequest& req);
    void takePostSnapshot(CaptureReport& report);
    Result<void> writeBoxed(const UiSnapshot& pre, const std::optional<ui::BoundingRect>& rect,
                            const std::string& boxed_path);
    void joinActionThread();

    nlohmann::json buildRecord(const CaptureReport& report, const CaptureRequest& req,
                               const ui::AttributeMap& attrs) const;

    DeviceBridge& bridge_;
    Ledger& ledger_;
    OrchestratorOptions opts_;

    std::mutex cycle_mutex_;
    std::thread action_thread_;
};

// Ledger "node" object: the well-known attributes (null when absent) plus
// every other attribute; hint keys fill in what the resolved node lacks.
nlohmann::json nodeRecord(const ui::AttributeMap& attrs, const nlohmann::json& hint);

// Local time, ISO-8601 with seconds
std::string isoTimestamp();

} // namespace tapshot
