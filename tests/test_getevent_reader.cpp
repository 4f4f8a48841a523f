// =============================================================================
// Tapshot - getevent Stream Reader Tests
// =============================================================================
#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "getevent_reader.hpp"

using namespace tapshot;

// -----------------------------------------------------------------------------
// Touch device selection
// -----------------------------------------------------------------------------

static const char* kGeteventPl =
    "add device 1: /dev/input/event0\n"
    "  name:     \"gpio-keys\"\n"
    "  events:\n"
    "    KEY (0001): KEY_VOLUMEDOWN KEY_VOLUMEUP KEY_POWER\n"
    "  input props:\n"
    "    <none>\n"
    "add device 2: /dev/input/event3\n"
    "  name:     \"sec_touchscreen\"\n"
    "  events:\n"
    "    KEY (0001): BTN_TOUCH\n"
    "    ABS (0003): ABS_MT_SLOT : value 0, min 0, max 9\n"
    "                ABS_MT_POSITION_X : value 0, min 0, max 1079\n"
    "                ABS_MT_POSITION_Y : value 0, min 0, max 2399\n"
    "                ABS_MT_TRACKING_ID : value 0, min 0, max 65535\n"
    "  input props:\n"
    "    INPUT_PROP_DIRECT\n"
    "add device 3: /dev/input/event5\n"
    "  name:     \"virtual-pointer\"\n"
    "  events:\n"
    "    ABS (0003): ABS_X : value 0\n"
    "                ABS_Y : value 0\n";

TEST(TouchDeviceTest, PicksHighestScore) {
    EXPECT_EQ(selectTouchDevice(kGeteventPl), "/dev/input/event3");
}

TEST(TouchDeviceTest, FirstWinsOnTie) {
    const char* out =
        "add device 1: /dev/input/event1\n"
        "  name:     \"pad-a\"\n"
        "    ABS (0003): ABS_X ABS_Y\n"
        "add device 2: /dev/input/event2\n"
        "  name:     \"pad-b\"\n"
        "    ABS (0003): ABS_X ABS_Y\n";
    EXPECT_EQ(selectTouchDevice(out), "/dev/input/event1");
}

TEST(TouchDeviceTest, NothingTouchLike) {
    const char* out =
        "add device 1: /dev/input/event0\n"
        "  name:     \"gpio-keys\"\n"
        "    KEY (0001): KEY_POWER\n";
    EXPECT_EQ(selectTouchDevice(out), "");
    EXPECT_EQ(selectTouchDevice(""), "");
}

TEST(GeteventCommandTest, Argv) {
    EXPECT_EQ(geteventCommand("adb", "", ""),
              (std::vector<std::string>{"adb", "shell", "getevent", "-lt"}));
    EXPECT_EQ(geteventCommand("/opt/adb", "R58M", "/dev/input/event3"),
              (std::vector<std::string>{"/opt/adb", "-s", "R58M", "shell", "getevent", "-lt",
                                        "/dev/input/event3"}));
}

// -----------------------------------------------------------------------------
// Reader
// -----------------------------------------------------------------------------

TEST(GeteventReaderTest, DeliversLinesInOrderThenFinishes) {
    GeteventReaderOptions o;
    o.command = {"sh", "-c", "printf 'a\\nb\\nc\\n'"};
    GeteventReader reader(o);
    ASSERT_TRUE(reader.start().is_ok());

    std::vector<std::string> got;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!reader.finished() && std::chrono::steady_clock::now() < deadline) {
        auto line = reader.pop(200);
        if (line) got.push_back(*line);
    }
    EXPECT_EQ(got, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(reader.finished());
    EXPECT_FALSE(reader.pop(10).has_value());
    reader.stop();
}

TEST(GeteventReaderTest, BoundedQueueHoldsBackProducer) {
    GeteventReaderOptions o;
    o.command = {"sh", "-c", "for i in 1 2 3 4 5 6 7 8; do echo $i; done; sleep 5"};
    o.capacity = 2;
    o.stop_grace_ms = 500;
    GeteventReader reader(o);
    ASSERT_TRUE(reader.start().is_ok());

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_LE(reader.queued(), 2u);

    std::vector<std::string> got;
    for (int i = 0; i < 8; ++i) {
        auto line = reader.pop(2000);
        ASSERT_TRUE(line.has_value());
        got.push_back(*line);
    }
    EXPECT_EQ(got.front(), "1");
    EXPECT_EQ(got.back(), "8");
    EXPECT_FALSE(reader.finished());

    reader.stop();
}

TEST(GeteventReaderTest, StopTerminatesProducer) {
    GeteventReaderOptions o;
    o.command = {"sleep", "30"};
    o.stop_grace_ms = 500;
    GeteventReader reader(o);
    ASSERT_TRUE(reader.start().is_ok());

    auto t0 = std::chrono::steady_clock::now();
    reader.stop();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    EXPECT_LT(ms, 5000);
    EXPECT_FALSE(reader.pop(10).has_value());
}
