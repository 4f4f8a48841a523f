#pragma once
// =============================================================================
// Tapshot - shared test fixtures
// =============================================================================
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "device_bridge.hpp"
#include "image_annotator.hpp"

namespace tapshot::test {

// mkdtemp directory, removed recursively on destruction
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "tapshot_test_XXXXXX").string();
        if (mkdtemp(tmpl.data())) path_ = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        if (!path_.empty()) std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const {
        return (std::filesystem::path(path_) / name).string();
    }

private:
    std::string path_;
};

inline std::string readFile(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

inline void writeFile(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f << content;
}

// Solid-colour PNG of the given size
inline std::string makePng(int w, int h, uint8_t r = 255, uint8_t g = 255, uint8_t b = 255) {
    RgbaImage img;
    img.w = w;
    img.h = h;
    img.pix.resize(static_cast<size_t>(w) * h * 4);
    for (size_t i = 0; i < img.pix.size(); i += 4) {
        img.pix[i] = r;
        img.pix[i + 1] = g;
        img.pix[i + 2] = b;
        img.pix[i + 3] = 255;
    }
    auto png = encodePng(img);
    return png.is_ok() ? png.value() : std::string();
}

// Two buttons on a 200x200 screen
inline const char* kSampleXml =
    R"(<?xml version='1.0' encoding='UTF-8' standalone='yes' ?>)"
    R"(<hierarchy rotation="0">)"
    R"(<node index="0" text="" class="android.widget.FrameLayout" package="com.example" bounds="[0,0][200,200]">)"
    R"(<node index="0" text="OK" resource-id="com.example:id/ok" class="android.widget.Button" package="com.example" content-desc="" bounds="[10,10][60,60]" />)"
    R"(<node index="1" text="Cancel" resource-id="com.example:id/cancel" class="android.widget.Button" package="com.example" content-desc="" bounds="[100,100][180,150]" />)"
    R"(</node>)"
    R"(</hierarchy>)";

// In-process DeviceBridge recording every call
class FakeBridge : public DeviceBridge {
public:
    std::string xml = kSampleXml;
    std::string png = makePng(200, 200);
    std::vector<std::string> activities{"com.example/com.example.Main"};

    bool fail_dump = false;
    bool fail_screenshot = false;
    bool fail_ready = false;
    bool fail_actions = false;
    int action_delay_ms = 0;

    std::string name() const override { return "fake"; }

    Result<void> checkReady() override {
        if (fail_ready) return Error(ErrorKind::Connection, "no device ready");
        return Ok();
    }

    Result<std::string> dumpHierarchy() override {
        log("dump");
        if (fail_dump) return Err<std::string>(ErrorKind::Capture, "dump failed");
        return xml;
    }

    Result<std::string> screenshot() override {
        log("screenshot");
        {
            std::lock_guard<std::mutex> lk(mutex_);
            finished_at_screenshot_.push_back(finished_.load());
        }
        if (fail_screenshot) return Err<std::string>(ErrorKind::Capture, "screencap failed");
        return png;
    }

    std::string foregroundActivity() override {
        std::lock_guard<std::mutex> lk(mutex_);
        calls_.push_back("activity");
        std::string a = activities.front();
        if (activities.size() > 1) activities.erase(activities.begin());
        return a;
    }

    Result<void> tap(int x, int y) override {
        return act("tap " + std::to_string(x) + " " + std::to_string(y));
    }
    Result<void> longPress(int x, int y, int ms) override {
        return act("long " + std::to_string(x) + " " + std::to_string(y) + " " + std::to_string(ms));
    }
    Result<void> swipe(int x1, int y1, int x2, int y2, int ms) override {
        return act("swipe " + std::to_string(x1) + " " + std::to_string(y1) + " " +
                   std::to_string(x2) + " " + std::to_string(y2) + " " + std::to_string(ms));
    }
    Result<void> inputText(const std::string& text) override { return act("text " + text); }
    Result<void> back() override { return act("back"); }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return calls_;
    }

    std::vector<std::string> actions() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return actions_;
    }

    int actionsFinished() const { return finished_.load(); }

    // actionsFinished() as seen by each screenshot() call, in call order
    std::vector<int> finishedAtScreenshots() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return finished_at_screenshot_;
    }

private:
    void log(const std::string& call) {
        std::lock_guard<std::mutex> lk(mutex_);
        calls_.push_back(call);
    }

    Result<void> act(const std::string& what) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            calls_.push_back(what);
            actions_.push_back(what);
        }
        if (action_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(action_delay_ms));
        }
        finished_++;
        if (fail_actions) return Error(ErrorKind::Action, "injected failure: " + what);
        return Ok();
    }

    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
    std::vector<std::string> actions_;
    std::vector<int> finished_at_screenshot_;
    std::atomic<int> finished_{0};
};

} // namespace tapshot::test
