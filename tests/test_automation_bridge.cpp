// =============================================================================
// Tapshot - Automation Server Bridge Tests
// =============================================================================
#include <gtest/gtest.h>

#include "automation_bridge.hpp"

using namespace tapshot;

TEST(Base64Test, DecodesPadded) {
    std::string out;
    ASSERT_TRUE(base64Decode("aGVsbG8=", out));
    EXPECT_EQ(out, "hello");
}

TEST(Base64Test, DecodesUnpaddedAndWhitespace) {
    std::string out;
    ASSERT_TRUE(base64Decode("aGVs\nbG8", out));
    EXPECT_EQ(out, "hello");
}

TEST(Base64Test, DecodesBinary) {
    std::string out;
    ASSERT_TRUE(base64Decode("iVBORw0KGgo=", out));
    EXPECT_EQ(out, std::string("\x89PNG\r\n\x1a\n", 8));
}

TEST(Base64Test, RejectsForeignCharacters) {
    std::string out;
    EXPECT_FALSE(base64Decode("aGVs*bG8=", out));
}

TEST(AutomationBridgeTest, UnreachableServerIsConnectionError) {
    AutomationBridgeOptions o;
    o.host = "127.0.0.1";
    o.port = 1;            // nothing listens on a privileged port in the test env
    o.timeout_ms = 1000;
    AdbBridgeOptions adb;
    adb.adb_path = "__tapshot_missing_adb__";

    AutomationBridge bridge(o, adb);
    EXPECT_EQ(bridge.name(), "u2");

    auto ready = bridge.checkReady();
    ASSERT_TRUE(ready.is_err());
    EXPECT_EQ(ready.error().kind, ErrorKind::Connection);

    auto xml = bridge.dumpHierarchy();
    EXPECT_TRUE(xml.is_err());

    auto tap = bridge.tap(10, 10);
    ASSERT_TRUE(tap.is_err());
    EXPECT_EQ(tap.error().kind, ErrorKind::Action);
}
