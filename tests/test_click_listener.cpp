// =============================================================================
// Tapshot - Click Listener Tests
// =============================================================================
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

#include "click_listener.hpp"
#include "test_helpers.hpp"

using namespace tapshot;
using tapshot::test::FakeBridge;
using tapshot::test::TempDir;

namespace fs = std::filesystem;

namespace {

const std::vector<std::string> kTapAt20x40 = {
    "[  100.000001] /dev/input/event2: EV_KEY       BTN_TOUCH            DOWN",
    "[  100.000002] /dev/input/event2: EV_ABS       ABS_MT_POSITION_X    00000014",
    "[  100.000003] /dev/input/event2: EV_ABS       ABS_MT_POSITION_Y    00000028",
    "[  100.000004] /dev/input/event2: EV_SYN       SYN_REPORT           00000000",
    "[  100.080000] /dev/input/event2: EV_KEY       BTN_TOUCH            UP",
};

} // namespace

class ClickListenerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(tmp_.path().empty());
        OrchestratorOptions o;
        o.output_dir = tmp_.file("out");
        ledger_ = std::make_unique<Ledger>(tmp_.file("out/ledger.json"));
        orch_ = std::make_unique<CaptureOrchestrator>(bridge_, *ledger_, o);

        opts_.wait_after_ms = 0;
        opts_.poll_ms = 100;
    }

    void feed(ClickListener& l, const std::vector<std::string>& lines) {
        for (const auto& line : lines) l.handleLine(line);
    }

    TempDir tmp_;
    FakeBridge bridge_;
    std::unique_ptr<Ledger> ledger_;
    std::unique_ptr<CaptureOrchestrator> orch_;
    ListenerOptions opts_;
};

TEST_F(ClickListenerTest, GestureIsRecordedAgainstPendingSnapshot) {
    ClickListener listener(*orch_, opts_);
    listener.refreshPending();
    ASSERT_TRUE(listener.hasPending());

    feed(listener, kTapAt20x40);
    EXPECT_EQ(listener.recorded(), 1u);
    EXPECT_EQ(listener.dropped(), 0u);

    // The touch already happened on the device
    EXPECT_TRUE(bridge_.actions().empty());

    auto records = ledger_->records().value();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["origin"], "gesture");
    EXPECT_EQ(records[0]["action"], "short-click");
    EXPECT_EQ(records[0]["click"]["x"], 20);
    EXPECT_EQ(records[0]["click"]["y"], 40);
    EXPECT_EQ(records[0]["node"]["text"], "OK");

    // A fresh snapshot is waiting for the next touch
    EXPECT_TRUE(listener.hasPending());
    EXPECT_TRUE(fs::exists(tmp_.file("out/element_xml/elem_1.xml")));
}

TEST_F(ClickListenerTest, ConsecutiveGesturesGetConsecutiveIds) {
    ClickListener listener(*orch_, opts_);
    listener.refreshPending();
    feed(listener, kTapAt20x40);
    feed(listener, kTapAt20x40);

    EXPECT_EQ(listener.recorded(), 2u);
    auto records = ledger_->records().value();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1]["elem_id"], "elem_1");
}

TEST_F(ClickListenerTest, GestureWithoutSnapshotIsDropped) {
    ClickListener listener(*orch_, opts_);
    ASSERT_FALSE(listener.hasPending());

    feed(listener, kTapAt20x40);
    EXPECT_EQ(listener.recorded(), 0u);
    EXPECT_EQ(listener.dropped(), 1u);
    EXPECT_EQ(ledger_->size().value(), 0u);
    EXPECT_TRUE(listener.hasPending());
}

TEST_F(ClickListenerTest, FailedPreSnapshotLeavesNothingPending) {
    bridge_.fail_dump = true;
    ClickListener listener(*orch_, opts_);
    listener.refreshPending();
    EXPECT_FALSE(listener.hasPending());

    feed(listener, kTapAt20x40);
    EXPECT_EQ(listener.dropped(), 1u);
    EXPECT_EQ(ledger_->size().value(), 0u);
}

TEST_F(ClickListenerTest, UnresolvableTouchIsSkipped) {
    bridge_.xml =
        R"(<hierarchy rotation="0"><node class="android.widget.Button" bounds="[0,0][10,10]" /></hierarchy>)";
    ClickListener listener(*orch_, opts_);
    listener.refreshPending();

    feed(listener, kTapAt20x40);
    EXPECT_EQ(listener.recorded(), 0u);
    EXPECT_EQ(listener.dropped(), 0u);
    EXPECT_EQ(ledger_->size().value(), 0u);
    EXPECT_TRUE(listener.hasPending());
}

TEST_F(ClickListenerTest, RunConsumesStreamUntilItEnds) {
    std::string script;
    for (const auto& l : kTapAt20x40) script += l + "\n";

    GeteventReaderOptions ro;
    ro.command = {"printf", script};
    GeteventReader reader(ro);

    std::atomic<bool> stop{false};
    ClickListener listener(*orch_, opts_);
    auto r = listener.run(reader, stop);
    ASSERT_TRUE(r.is_ok()) << r.error().message;

    EXPECT_EQ(listener.recorded(), 1u);
    EXPECT_EQ(ledger_->size().value(), 1u);
    EXPECT_TRUE(fs::exists(tmp_.file("out/image/final_screenshot.png")));
}

TEST_F(ClickListenerTest, RunHonoursStopFlag) {
    GeteventReaderOptions ro;
    ro.command = {"sleep", "30"};
    ro.stop_grace_ms = 500;
    GeteventReader reader(ro);

    opts_.final_screenshot = false;
    std::atomic<bool> stop{true};
    ClickListener listener(*orch_, opts_);
    ASSERT_TRUE(listener.run(reader, stop).is_ok());

    EXPECT_EQ(listener.recorded(), 0u);
    EXPECT_FALSE(fs::exists(tmp_.file("out/image/final_screenshot.png")));
}
