// =============================================================================
// Tapshot - ADB Bridge Tests
// =============================================================================
// Output parsers, plus the bridge itself driven against a stand-in adb
// script that answers the handful of commands the bridge issues.
// =============================================================================
#include <gtest/gtest.h>
#include <sys/stat.h>

#include "adb_bridge.hpp"
#include "test_helpers.hpp"

using namespace tapshot;
using tapshot::test::TempDir;

// ---------------------------------------------------------------------------
// Parsers
// ---------------------------------------------------------------------------

TEST(AdbParseTest, ForegroundActivityExpandsLeadingDot) {
    const std::string out =
        "ACTIVITY MANAGER ACTIVITIES (dumpsys activity activities)\n"
        "  mResumedActivity: ActivityRecord{3c2e1a u0 com.example.app/.ui.MainActivity t42}\n";
    EXPECT_EQ(parseForegroundActivity(out), "com.example.app/com.example.app.ui.MainActivity");
}

TEST(AdbParseTest, ForegroundActivityFullyQualified) {
    const std::string out =
        "  mResumedActivity: ActivityRecord{1 u0 com.android.settings/com.android.settings.Settings t7}\n";
    EXPECT_EQ(parseForegroundActivity(out), "com.android.settings/com.android.settings.Settings");
}

TEST(AdbParseTest, ForegroundActivityFallsBackToFocused) {
    const std::string out = "  mFocusedActivity: ActivityRecord{9 u0 org.demo/.Home t1}\n";
    EXPECT_EQ(parseForegroundActivity(out), "org.demo/org.demo.Home");
}

TEST(AdbParseTest, ForegroundActivityMissing) {
    EXPECT_EQ(parseForegroundActivity("nothing useful here\n"), "");
}

TEST(AdbParseTest, DevicesReady) {
    std::string serial;
    EXPECT_TRUE(parseDevicesReady("List of devices attached\nemulator-5554\tdevice\n\n", &serial));
    EXPECT_EQ(serial, "emulator-5554");
}

TEST(AdbParseTest, DevicesNotReady) {
    EXPECT_FALSE(parseDevicesReady("List of devices attached\n\n"));
    EXPECT_FALSE(parseDevicesReady("List of devices attached\nR58M\tunauthorized\n"));
    EXPECT_FALSE(parseDevicesReady("List of devices attached\nR58M\toffline\n"));
}

TEST(AdbParseTest, EncodeInputText) {
    EXPECT_EQ(encodeInputText("hello world"), "hello%sworld");
    EXPECT_EQ(encodeInputText("abc"), "abc");
}

// ---------------------------------------------------------------------------
// Bridge against a stand-in adb
// ---------------------------------------------------------------------------

class AdbBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(tmp_.path().empty());
        log_ = tmp_.file("calls.log");
        script_ = tmp_.file("adb");
        writeScript(0);
    }

    void writeScript(int input_exit) {
        std::string s =
            "#!/bin/sh\n"
            "echo \"$*\" >> '" + log_ + "'\n"
            "if [ \"$1\" = \"-s\" ]; then shift 2; fi\n"
            "case \"$*\" in\n"
            "  devices) printf 'List of devices attached\\nemulator-5554\\tdevice\\n' ;;\n"
            "  'shell uiautomator dump /sdcard/window_dump.xml') echo 'UI hierchary dumped' ;;\n"
            "  'exec-out cat /sdcard/window_dump.xml') printf '<hierarchy rotation=\"0\"><node bounds=\"[0,0][1,1]\"/></hierarchy>' ;;\n"
            "  'exec-out screencap -p') printf 'PNGBYTES' ;;\n"
            "  'shell dumpsys activity') printf '  mResumedActivity: ActivityRecord{1 u0 com.example/.Main t3}\\n' ;;\n"
            "  shell\\ input*) exit " + std::to_string(input_exit) + " ;;\n"
            "  *) exit 1 ;;\n"
            "esac\n";
        tapshot::test::writeFile(script_, s);
        chmod(script_.c_str(), 0755);
    }

    AdbBridge makeBridge(const std::string& serial = "") {
        AdbBridgeOptions o;
        o.adb_path = script_;
        o.serial = serial;
        o.timeout_ms = 5000;
        return AdbBridge(o);
    }

    std::string calls() const { return tapshot::test::readFile(log_); }

    TempDir tmp_;
    std::string log_;
    std::string script_;
};

TEST_F(AdbBridgeTest, CheckReady) {
    auto adb = makeBridge();
    EXPECT_TRUE(adb.checkReady().is_ok());
}

TEST_F(AdbBridgeTest, CheckReadyUnknownSerial) {
    auto adb = makeBridge("other-device");
    auto r = adb.checkReady();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Connection);
}

TEST_F(AdbBridgeTest, SerialIsPassed) {
    auto adb = makeBridge("emulator-5554");
    ASSERT_TRUE(adb.tap(1, 2).is_ok());
    EXPECT_NE(calls().find("-s emulator-5554 shell input tap 1 2"), std::string::npos);
}

TEST_F(AdbBridgeTest, SnapshotCommands) {
    auto adb = makeBridge();

    auto xml = adb.dumpHierarchy();
    ASSERT_TRUE(xml.is_ok()) << xml.error().message;
    EXPECT_NE(xml.value().find("<hierarchy"), std::string::npos);

    auto png = adb.screenshot();
    ASSERT_TRUE(png.is_ok());
    EXPECT_EQ(png.value(), "PNGBYTES");

    EXPECT_EQ(adb.foregroundActivity(), "com.example/com.example.Main");
}

TEST_F(AdbBridgeTest, ActionCommandLines) {
    auto adb = makeBridge();
    ASSERT_TRUE(adb.longPress(5, 6, 900).is_ok());
    ASSERT_TRUE(adb.swipe(1, 2, 3, 4, 300).is_ok());
    ASSERT_TRUE(adb.inputText("hi there").is_ok());
    ASSERT_TRUE(adb.back().is_ok());

    const std::string log = calls();
    EXPECT_NE(log.find("shell input swipe 5 6 5 6 900"), std::string::npos);
    EXPECT_NE(log.find("shell input swipe 1 2 3 4 300"), std::string::npos);
    EXPECT_NE(log.find("shell input text 'hi%sthere'"), std::string::npos);
    EXPECT_NE(log.find("shell input keyevent 4"), std::string::npos);
}

TEST_F(AdbBridgeTest, FailedActionIsActionError) {
    writeScript(1);
    auto adb = makeBridge();
    auto r = adb.tap(1, 1);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Action);
}

TEST_F(AdbBridgeTest, DisconnectedDeviceIsConnectionError) {
    tapshot::test::writeFile(script_,
        "#!/bin/sh\n"
        "echo \"adb: device 'emulator-5554' not found\" >&2\n"
        "exit 1\n");
    auto adb = makeBridge("emulator-5554");

    auto xml = adb.dumpHierarchy();
    ASSERT_TRUE(xml.is_err());
    EXPECT_EQ(xml.error().kind, ErrorKind::Connection);

    auto png = adb.screenshot();
    ASSERT_TRUE(png.is_err());
    EXPECT_EQ(png.error().kind, ErrorKind::Connection);
}

TEST_F(AdbBridgeTest, OfflineDeviceIsConnectionError) {
    tapshot::test::writeFile(script_,
        "#!/bin/sh\n"
        "echo 'error: device offline' >&2\n"
        "exit 1\n");
    auto adb = makeBridge();

    auto png = adb.screenshot();
    ASSERT_TRUE(png.is_err());
    EXPECT_EQ(png.error().kind, ErrorKind::Connection);
}

TEST_F(AdbBridgeTest, ScreencapFailureOnDeviceIsCaptureError) {
    tapshot::test::writeFile(script_,
        "#!/bin/sh\n"
        "echo '/system/bin/sh: screencap: not found' >&2\n"
        "exit 1\n");
    auto adb = makeBridge();

    auto png = adb.screenshot();
    ASSERT_TRUE(png.is_err());
    EXPECT_EQ(png.error().kind, ErrorKind::Capture);
}

TEST(AdbBridgeMissingTest, MissingAdbIsConnectionError) {
    AdbBridgeOptions o;
    o.adb_path = "__tapshot_missing_adb__";
    AdbBridge adb(o);
    auto r = adb.checkReady();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Connection);

    auto xml = adb.dumpHierarchy();
    ASSERT_TRUE(xml.is_err());
    EXPECT_EQ(xml.error().kind, ErrorKind::Connection);

    auto png = adb.screenshot();
    ASSERT_TRUE(png.is_err());
    EXPECT_EQ(png.error().kind, ErrorKind::Connection);
}
