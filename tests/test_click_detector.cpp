// =============================================================================
// Tapshot - Click Detector Tests
// =============================================================================
#include <gtest/gtest.h>

#include <vector>

#include "click_detector.hpp"

using namespace tapshot;

namespace {

// Feeds lines and collects every completed gesture
std::vector<CompletedGesture> feedAll(ClickDetector& det, const std::vector<std::string>& lines) {
    std::vector<CompletedGesture> out;
    for (const auto& l : lines) {
        auto step = det.feed(l);
        if (step.gesture) out.push_back(*step.gesture);
    }
    return out;
}

} // namespace

// -----------------------------------------------------------------------------
// Line parsing
// -----------------------------------------------------------------------------

TEST(EventLineTest, SymbolicWithDevice) {
    auto ev = parseEventLine("[   12345.678901] /dev/input/event2: EV_ABS       ABS_MT_POSITION_X    000001f4");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->device, "/dev/input/event2");
    EXPECT_EQ(ev->type, "EV_ABS");
    EXPECT_EQ(ev->code, "ABS_MT_POSITION_X");
    EXPECT_EQ(ev->value, 500);
}

TEST(EventLineTest, SymbolicWithoutDevice) {
    auto ev = parseEventLine("[    3.000100] EV_KEY       BTN_TOUCH            DOWN");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->device, "");
    EXPECT_EQ(ev->code, "BTN_TOUCH");
    EXPECT_EQ(ev->value, 1);
}

TEST(EventLineTest, NumericCodesAreNamed) {
    auto ev = parseEventLine("[ 1.5] /dev/input/event1: 0003 0035 00000064");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->type, "EV_ABS");
    EXPECT_EQ(ev->code, "ABS_MT_POSITION_X");
    EXPECT_EQ(ev->value, 100);

    auto key = parseEventLine("[ 1.6] 0001 014a 00000000");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->type, "EV_KEY");
    EXPECT_EQ(key->code, "BTN_TOUCH");
    EXPECT_EQ(key->value, 0);
}

TEST(EventLineTest, TrackingIdRelease) {
    auto ev = parseEventLine("[ 2.0] EV_ABS ABS_MT_TRACKING_ID ffffffff");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->value, -1);
}

TEST(EventLineTest, RejectsGarbage) {
    EXPECT_FALSE(parseEventLine("add device 1: /dev/input/event2").has_value());
    EXPECT_FALSE(parseEventLine("").has_value());
    EXPECT_FALSE(parseEventLine("EV_KEY BTN_TOUCH DOWN").has_value());   // no timestamp
}

TEST(EventValueTest, Decoding) {
    EXPECT_EQ(decodeEventValue("DOWN"), 1);
    EXPECT_EQ(decodeEventValue("up"), 0);
    EXPECT_EQ(decodeEventValue("ffffffff"), -1);
    EXPECT_EQ(decodeEventValue("0x10"), 16);
    EXPECT_EQ(decodeEventValue("000001a4"), 420);
    EXPECT_EQ(decodeEventValue("-5"), -5);
    EXPECT_FALSE(decodeEventValue("xyz").has_value());
}

// -----------------------------------------------------------------------------
// State machine
// -----------------------------------------------------------------------------

TEST(ClickDetectorTest, KeyDownUpEmitsLastPosition) {
    ClickDetector det;
    auto gestures = feedAll(det, {
        "[ 1.000] /dev/input/event2: EV_KEY BTN_TOUCH DOWN",
        "[ 1.001] /dev/input/event2: EV_ABS ABS_MT_POSITION_X 00000064",
        "[ 1.001] /dev/input/event2: EV_ABS ABS_MT_POSITION_Y 000000c8",
        "[ 1.002] /dev/input/event2: EV_SYN SYN_REPORT 00000000",
        "[ 1.050] /dev/input/event2: EV_ABS ABS_MT_POSITION_X 00000066",
        "[ 1.100] /dev/input/event2: EV_KEY BTN_TOUCH UP",
    });
    ASSERT_EQ(gestures.size(), 1u);
    EXPECT_EQ(gestures[0], (CompletedGesture{102, 200}));
    EXPECT_EQ(det.state(), ClickDetector::State::Idle);
}

TEST(ClickDetectorTest, TrackingIdLifecycle) {
    ClickDetector det;
    auto down = det.feed("[ 1.0] EV_ABS ABS_MT_TRACKING_ID 00000007");
    EXPECT_TRUE(down.down_started);
    EXPECT_EQ(det.state(), ClickDetector::State::Active);
    ASSERT_TRUE(det.context().tracking_id.has_value());
    EXPECT_EQ(*det.context().tracking_id, 7);

    det.feed("[ 1.1] EV_ABS ABS_MT_POSITION_X 0000000a");
    det.feed("[ 1.1] EV_ABS ABS_MT_POSITION_Y 00000014");
    auto up = det.feed("[ 1.2] EV_ABS ABS_MT_TRACKING_ID ffffffff");
    ASSERT_TRUE(up.gesture.has_value());
    EXPECT_EQ(*up.gesture, (CompletedGesture{10, 20}));
    EXPECT_FALSE(det.context().tracking_id.has_value());
}

TEST(ClickDetectorTest, ReleaseWithoutCoordinatesEmitsNothing) {
    ClickDetector det;
    auto gestures = feedAll(det, {
        "[ 1.0] EV_KEY BTN_TOUCH DOWN",
        "[ 1.1] EV_KEY BTN_TOUCH UP",
    });
    EXPECT_TRUE(gestures.empty());
    EXPECT_EQ(det.state(), ClickDetector::State::Idle);
}

TEST(ClickDetectorTest, UpWhileIdleEmitsNothing) {
    ClickDetector det;
    auto gestures = feedAll(det, {
        "[ 1.0] EV_ABS ABS_MT_POSITION_X 00000001",
        "[ 1.0] EV_ABS ABS_MT_POSITION_Y 00000001",
        "[ 1.1] EV_KEY BTN_TOUCH UP",
    });
    EXPECT_TRUE(gestures.empty());
}

TEST(ClickDetectorTest, BothReleaseSignalsEmitOnce) {
    ClickDetector det;
    auto gestures = feedAll(det, {
        "[ 1.0] EV_ABS ABS_MT_TRACKING_ID 00000001",
        "[ 1.0] EV_KEY BTN_TOUCH DOWN",
        "[ 1.0] EV_ABS ABS_MT_POSITION_X 00000032",
        "[ 1.0] EV_ABS ABS_MT_POSITION_Y 00000032",
        "[ 1.1] EV_ABS ABS_MT_TRACKING_ID ffffffff",
        "[ 1.1] EV_KEY BTN_TOUCH UP",
    });
    ASSERT_EQ(gestures.size(), 1u);
    EXPECT_EQ(gestures[0], (CompletedGesture{50, 50}));
}

TEST(ClickDetectorTest, PositionPersistsAcrossGestures) {
    ClickDetector det;
    auto gestures = feedAll(det, {
        "[ 1.0] EV_KEY BTN_TOUCH DOWN",
        "[ 1.0] EV_ABS ABS_MT_POSITION_X 00000010",
        "[ 1.0] EV_ABS ABS_MT_POSITION_Y 00000020",
        "[ 1.1] EV_KEY BTN_TOUCH UP",
        "[ 2.0] EV_KEY BTN_TOUCH DOWN",
        "[ 2.0] EV_ABS ABS_MT_POSITION_Y 00000030",
        "[ 2.1] EV_KEY BTN_TOUCH UP",
    });
    ASSERT_EQ(gestures.size(), 2u);
    EXPECT_EQ(gestures[0], (CompletedGesture{16, 32}));
    EXPECT_EQ(gestures[1], (CompletedGesture{16, 48}));
}

TEST(ClickDetectorTest, IgnoresUnparseableLines) {
    ClickDetector det;
    auto step = det.feed("could not get driver version for /dev/input/mouse0");
    EXPECT_FALSE(step.gesture.has_value());
    EXPECT_FALSE(step.down_started);
    EXPECT_EQ(det.state(), ClickDetector::State::Idle);
}

TEST(ClickDetectorTest, ResetClearsContext) {
    ClickDetector det;
    det.feed("[ 1.0] EV_KEY BTN_TOUCH DOWN");
    det.feed("[ 1.0] EV_ABS ABS_MT_POSITION_X 00000010");
    det.reset();
    EXPECT_EQ(det.state(), ClickDetector::State::Idle);
    EXPECT_FALSE(det.context().last_x.has_value());
}
