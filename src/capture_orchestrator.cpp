// =============================================================================
// Tapshot - Capture Orchestrator Implementation
// =============================================================================
#include "capture_orchestrator.hpp"
#include "image_annotator.hpp"
#include "tapshot_log.hpp"
#include "ui/ui_hierarchy.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>

static constexpr const char* TAG = "capture";

namespace fs = std::filesystem;

namespace tapshot {

namespace {

std::string absPath(const std::string& p) {
    std::error_code ec;
    fs::path a = fs::absolute(p, ec);
    return ec ? p : a.lexically_normal().string();
}

Result<void> writeText(const std::string& path, const std::string& text) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) return Err<void>(ErrorKind::Capture, "cannot open " + path);
    f << text;
    if (!f) return Err<void>(ErrorKind::Capture, "write failed: " + path);
    return Ok();
}

void sleepMs(int ms) {
    if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

std::string elemId(size_t id) {
    return "elem_" + std::to_string(id);
}

int joinTimeoutMs(const ActionSpec& action, const OrchestratorOptions& opts) {
    if (auto lc = std::get_if<LongClick>(&action)) return lc->duration_ms + opts.mid_join_slack_ms;
    if (auto sw = std::get_if<Swipe>(&action)) return sw->duration_ms + opts.mid_join_slack_ms;
    return opts.mid_join_default_ms;
}

// Outcome of a finished action future as an optional error message
std::optional<std::string> failureOf(std::shared_future<Result<void>>& fut) {
    try {
        const Result<void>& r = fut.get();
        if (r.is_err()) return r.error().message;
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

} // namespace

// =============================================================================
// Action dispatch
// =============================================================================

Result<void> dispatchAction(DeviceBridge& bridge, const ActionSpec& action,
                            const std::optional<Point>& center) {
    if (std::holds_alternative<Back>(action)) return bridge.back();
    if (auto in = std::get_if<InputText>(&action)) return bridge.inputText(in->text);

    if (!center) {
        return Err<void>(ErrorKind::Validation,
                         std::string(actionName(actionKind(action))) + " needs a target");
    }
    if (std::holds_alternative<ShortClick>(action)) return bridge.tap(center->x, center->y);
    if (auto lc = std::get_if<LongClick>(&action)) {
        return bridge.longPress(center->x, center->y, lc->duration_ms);
    }
    const auto& sw = std::get<Swipe>(action);
    Point to = swipeDestination(sw, *center);
    return bridge.swipe(center->x, center->y, to.x, to.y, sw.duration_ms);
}

// =============================================================================
// Record helpers
// =============================================================================

nlohmann::json nodeRecord(const ui::AttributeMap& attrs, const nlohmann::json& hint) {
    auto pick = [&](std::initializer_list<const char*> keys) -> nlohmann::json {
        for (const char* k : keys) {
            auto it = attrs.find(k);
            if (it != attrs.end()) return it->second;
        }
        if (hint.is_object()) {
            for (const char* k : keys) {
                auto it = hint.find(k);
                if (it != hint.end() && !it->is_null()) return *it;
            }
        }
        return nullptr;
    };

    nlohmann::json node = nlohmann::json::object();
    node["bounds"] = pick({"bounds"});
    node["text"] = pick({"text"});
    node["class"] = pick({"class"});
    node["resource-id"] = pick({"resource-id", "resourceId"});
    node["content-desc"] = pick({"content-desc", "contentDescription"});
    node["package"] = pick({"package"});

    for (const auto& [k, v] : attrs) {
        if (!node.contains(k)) node[k] = v;
    }
    if (hint.is_object()) {
        for (auto it = hint.begin(); it != hint.end(); ++it) {
            if (!node.contains(it.key())) node[it.key()] = it.value();
        }
    }
    return node;
}

std::string isoTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return buf;
}

// =============================================================================
// CaptureOrchestrator
// =============================================================================

CaptureOrchestrator::CaptureOrchestrator(DeviceBridge& bridge, Ledger& ledger,
                                         OrchestratorOptions opts)
    : bridge_(bridge), ledger_(ledger), opts_(std::move(opts)) {}

CaptureOrchestrator::~CaptureOrchestrator() {
    joinActionThread();
}

std::string CaptureOrchestrator::imageDir() const {
    return (fs::path(opts_.output_dir) / "image").string();
}

std::string CaptureOrchestrator::xmlDir() const {
    return (fs::path(opts_.output_dir) / "element_xml").string();
}

void CaptureOrchestrator::joinActionThread() {
    if (action_thread_.joinable()) {
        TLOG_DEBUG(TAG, "Waiting for in-flight action");
        action_thread_.join();
    }
}

void CaptureOrchestrator::waitForInflightAction() {
    std::lock_guard<std::mutex> lk(cycle_mutex_);
    joinActionThread();
}

Result<UiSnapshot> CaptureOrchestrator::takeSnapshot(size_t id) {
    std::error_code ec;
    fs::create_directories(imageDir(), ec);
    fs::create_directories(xmlDir(), ec);

    UiSnapshot snap;
    snap.sequence_id = id;
    snap.xml_path = (fs::path(xmlDir()) / (elemId(id) + ".xml")).string();
    snap.screenshot_path = (fs::path(imageDir()) / (elemId(id) + "_raw.png")).string();

    snap.xml = TAPSHOT_TRY(bridge_.dumpHierarchy());
    TAPSHOT_TRY(writeText(snap.xml_path, snap.xml));

    snap.png = TAPSHOT_TRY(bridge_.screenshot());
    TAPSHOT_TRY(writeBytes(snap.screenshot_path, snap.png));

    snap.activity = bridge_.foregroundActivity();
    TLOG_DEBUG(TAG, "Snapshot %zu taken (activity=%s)", id, snap.activity.c_str());
    return snap;
}

Result<UiSnapshot> CaptureOrchestrator::preSnapshot() {
    std::lock_guard<std::mutex> lk(cycle_mutex_);
    joinActionThread();
    size_t id = TAPSHOT_TRY(ledger_.size());
    return takeSnapshot(id);
}

Result<CaptureReport> CaptureOrchestrator::capture(const CaptureRequest& req) {
    std::lock_guard<std::mutex> lk(cycle_mutex_);
    joinActionThread();

    TAPSHOT_TRY(validateAction(req.action));

    size_t id = TAPSHOT_TRY(ledger_.size());
    auto pre = takeSnapshot(id);
    if (pre.is_err()) {
        TLOG_ERROR(TAG, "Pre-capture failed for %s: %s", elemId(id).c_str(),
                   pre.error().message.c_str());
        return pre.error();
    }
    return runCycle(pre.value(), req);
}

Result<CaptureReport> CaptureOrchestrator::captureFrom(const UiSnapshot& pre,
                                                       const CaptureRequest& req) {
    std::lock_guard<std::mutex> lk(cycle_mutex_);
    joinActionThread();

    size_t id = TAPSHOT_TRY(ledger_.size());
    if (id != pre.sequence_id) {
        return Err<CaptureReport>(ErrorKind::Ledger,
                                  "stale snapshot " + elemId(pre.sequence_id) +
                                  ", ledger is at " + std::to_string(id));
    }
    return runCycle(pre, req);
}

Result<void> CaptureOrchestrator::writeBoxed(const UiSnapshot& pre,
                                             const std::optional<ui::BoundingRect>& rect,
                                             const std::string& boxed_path) {
    auto boxed = annotateScreenshot(pre.png, rect, boxed_path, opts_.box_width);
    if (boxed.is_ok()) return boxed;

    TLOG_WARN(TAG, "Drawing box failed (%s), copying raw screenshot",
              boxed.error().message.c_str());
    return writeBytes(boxed_path, pre.png);
}

void CaptureOrchestrator::takePostSnapshot(CaptureReport& report) {
    const std::string id = elemId(report.sequence_id);
    const std::string dest_png = (fs::path(imageDir()) / (id + "_dest.png")).string();
    const std::string dest_xml = (fs::path(xmlDir()) / (id + "_dest.xml")).string();

    auto shot = bridge_.screenshot();
    if (shot.is_ok()) {
        auto w = writeBytes(dest_png, shot.value());
        if (w.is_ok()) {
            report.dest_path = dest_png;
        } else {
            TLOG_WARN(TAG, "Post screenshot not saved for %s: %s", id.c_str(),
                      w.error().message.c_str());
        }
    } else {
        TLOG_WARN(TAG, "Post screenshot failed for %s: %s", id.c_str(),
                  shot.error().message.c_str());
    }

    auto xml = bridge_.dumpHierarchy();
    if (xml.is_ok() && writeText(dest_xml, xml.value()).is_ok()) {
        report.dest_xml_path = dest_xml;
    } else if (xml.is_err()) {
        TLOG_WARN(TAG, "Post hierarchy dump failed for %s: %s", id.c_str(),
                  xml.error().message.c_str());
    }

    report.dest_activity = bridge_.foregroundActivity();
}

Result<CaptureReport> CaptureOrchestrator::runCycle(const UiSnapshot& pre,
                                                    const CaptureRequest& req) {
    TAPSHOT_TRY(validateAction(req.action));

    CaptureReport report;
    report.sequence_id = pre.sequence_id;
    report.elem_id = elemId(pre.sequence_id);
    report.action = actionKind(req.action);
    report.timing = req.timing;
    report.activity = pre.activity;
    report.raw_path = pre.screenshot_path;
    report.xml_path = pre.xml_path;
    report.boxed_path = (fs::path(imageDir()) / (report.elem_id + "_boxed.png")).string();

    // --- Resolve ---
    ui::AttributeMap attrs;
    std::optional<ui::BoundingRect> rect;
    if (needsTarget(req.action)) {
        if (!req.query) {
            return Err<CaptureReport>(ErrorKind::Validation, "bounds or xpath required");
        }
        auto tree = ui::UiHierarchy::parse(pre.xml);
        if (tree.is_err()) {
            TLOG_ERROR(TAG, "Unreadable hierarchy for %s: %s", report.elem_id.c_str(),
                       tree.error().message.c_str());
            return tree.error();
        }
        auto node = ui::resolve(tree.value(), *req.query);
        if (node.is_err()) {
            TLOG_WARN(TAG, "%s", node.error().message.c_str());
            return node.error();
        }
        attrs = node.value().attrs;
        rect = node.value().rect;
        report.center = Point{rect->center_x(), rect->center_y()};
        TLOG_INFO(TAG, "%s: %s -> %s via %s", report.elem_id.c_str(),
                  ui::describe(*req.query).c_str(), rect->str().c_str(),
                  node.value().strategy.c_str());
    }

    // --- Annotate ---
    TAPSHOT_TRY(writeBoxed(pre, rect, report.boxed_path));

    // --- Act + PostCapture ---
    if (!req.perform_action) {
        if (req.post_capture) {
            sleepMs(req.wait_after_ms);
            takePostSnapshot(report);
        }
    } else if (req.timing == CaptureTiming::Mid) {
        std::packaged_task<Result<void>()> task(
            [&bridge = bridge_, action = req.action, center = report.center]() {
                return dispatchAction(bridge, action, center);
            });
        report.action_outcome = task.get_future().share();
        action_thread_ = std::thread(std::move(task));

        sleepMs(req.mid_delay_ms);
        takePostSnapshot(report);

        auto& outcome = report.action_outcome;
        if (outcome.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
            report.action_error = failureOf(outcome);
        }
        int join_ms = joinTimeoutMs(req.action, opts_);
        if (outcome.wait_for(std::chrono::milliseconds(join_ms)) != std::future_status::ready) {
            TLOG_WARN(TAG, "%s: action still running after %d ms", report.elem_id.c_str(), join_ms);
        }
    } else {
        auto acted = dispatchAction(bridge_, req.action, report.center);
        if (acted.is_err()) {
            report.action_error = acted.error().message;
            TLOG_WARN(TAG, "%s: action failed: %s", report.elem_id.c_str(),
                      acted.error().message.c_str());
        }
        if (req.post_capture) {
            sleepMs(req.wait_after_ms);
            takePostSnapshot(report);
        }
    }

    // --- Recorded ---
    report.record = buildRecord(report, req, attrs);
    auto appended = ledger_.append(report.record);
    if (appended.is_err()) {
        TLOG_ERROR(TAG, "Append failed for %s: %s", report.elem_id.c_str(),
                   appended.error().message.c_str());
        return appended.error();
    }

    TLOG_INFO(TAG, "Recorded %s (%s, %s)", report.elem_id.c_str(), actionName(report.action),
              report.action_error ? "action failed" : "ok");
    return report;
}

nlohmann::json CaptureOrchestrator::buildRecord(const CaptureReport& report,
                                                const CaptureRequest& req,
                                                const ui::AttributeMap& attrs) const {
    nlohmann::json rec;
    rec["sequence_id"] = report.sequence_id;
    rec["elem_id"] = report.elem_id;
    rec["time"] = isoTimestamp();
    rec["origin"] = req.origin;

    if (report.action != ActionKind::Back && report.action != ActionKind::Final) {
        // An observed gesture records where the finger was, not the node center
        std::optional<Point> click = report.center;
        if (!req.perform_action && req.query) {
            if (auto p = std::get_if<ui::PointQuery>(&*req.query)) click = Point{p->x, p->y};
        }
        if (click) rec["click"] = {{"x", click->x}, {"y", click->y}};
    }

    rec["node"] = nodeRecord(attrs, req.node_hint);

    rec["images"] = {{"raw", absPath(report.raw_path)}, {"boxed", absPath(report.boxed_path)}};
    if (report.dest_path) rec["images"]["dest"] = absPath(*report.dest_path);

    rec["xml"] = absPath(report.xml_path);
    rec["source_xml"] = absPath(report.xml_path);
    if (report.dest_xml_path) rec["dest_xml"] = absPath(*report.dest_xml_path);

    rec["activity"] = report.activity;
    rec["source_activity"] = report.activity;
    if (report.dest_activity) {
        rec["dest_activity"] = *report.dest_activity;
        if (!report.activity.empty() && !report.dest_activity->empty()) {
            rec["is_activity_jumped"] = report.activity != *report.dest_activity;
        }
    }

    rec["action"] = actionName(report.action);
    rec["capture_timing"] = report.timing == CaptureTiming::Mid ? "mid" : "post";

    if (auto lc = std::get_if<LongClick>(&req.action)) {
        rec["duration"] = lc->duration_ms;
    } else if (auto sw = std::get_if<Swipe>(&req.action)) {
        rec["duration"] = sw->duration_ms;
        SwipeSummary s = summarizeSwipe(*sw);
        rec["swipe_distance"] = s.distance;
        if (s.direction) rec["swipe_direction"] = *s.direction;
        if (!sw->direction) {
            rec["dx"] = sw->dx;
            rec["dy"] = sw->dy;
        }
    } else if (auto in = std::get_if<InputText>(&req.action)) {
        rec["input_text"] = in->text;
    }

    if (report.action_error) rec["action_error"] = *report.action_error;
    return rec;
}

// =============================================================================
// Snapshot-only records
// =============================================================================

Result<CaptureReport> CaptureOrchestrator::finalSnapshot() {
    std::lock_guard<std::mutex> lk(cycle_mutex_);
    joinActionThread();

    size_t id = TAPSHOT_TRY(ledger_.size());
    UiSnapshot pre = TAPSHOT_TRY(takeSnapshot(id));

    CaptureReport report;
    report.sequence_id = id;
    report.elem_id = elemId(id);
    report.action = ActionKind::Final;
    report.activity = pre.activity;
    report.raw_path = pre.screenshot_path;
    report.xml_path = pre.xml_path;
    report.boxed_path = (fs::path(imageDir()) / (report.elem_id + "_boxed.png")).string();
    TAPSHOT_TRY(writeBytes(report.boxed_path, pre.png));

    CaptureRequest req;
    req.action = Back{};      // no payload fields; the record says "final"
    req.origin = "request";

    report.record = buildRecord(report, req, {});
    TAPSHOT_TRY(ledger_.append(report.record));
    TLOG_INFO(TAG, "Recorded final snapshot %s", report.elem_id.c_str());
    return report;
}

Result<std::string> CaptureOrchestrator::saveFinalScreenshot() {
    std::lock_guard<std::mutex> lk(cycle_mutex_);
    joinActionThread();

    std::error_code ec;
    fs::create_directories(imageDir(), ec);
    const std::string path = (fs::path(imageDir()) / "final_screenshot.png").string();

    std::string png = TAPSHOT_TRY(bridge_.screenshot());
    TAPSHOT_TRY(writeBytes(path, png));
    TLOG_INFO(TAG, "Final screenshot saved: %s", path.c_str());
    return path;
}

} // namespace tapshot
