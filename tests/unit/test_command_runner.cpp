// tests/unit/test_command_runner.cpp
#include <gtest/gtest.h>

#include "infrastructure/command_runner.hpp"

using namespace hotspot::infrastructure;
using namespace std::chrono_literals;

// ==================== Command Formatting Tests ====================

TEST(FormatCommandTest, JoinsArguments)
{
    EXPECT_EQ(format_command({"iptables", "-w", "-t", "nat", "-N", "HOTSPOT_NAT"}), "iptables -w -t nat -N HOTSPOT_NAT");
}

TEST(FormatCommandTest, MasksWifiPassword)
{
    std::string line = format_command({"nmcli", "connection", "add", "type", "wifi", "ifname", "wlan1", "con-name",
                                       "hotspotd-ap", "ssid", "MyHotspot", "wifi-sec.key-mgmt", "wpa-psk",
                                       "wifi-sec.psk", "SuperSecret99"});
    EXPECT_EQ(line.find("SuperSecret99"), std::string::npos);
    EXPECT_NE(line.find("wifi-sec.psk ***"), std::string::npos);
    EXPECT_NE(line.find("ssid MyHotspot"), std::string::npos);
}

TEST(FormatCommandTest, MasksOnlyTheFollowingValue)
{
    EXPECT_EQ(format_command({"tool", "--password", "hunter22", "--verbose"}), "tool --password *** --verbose");
    EXPECT_EQ(format_command({"tool", "--password"}), "tool --password");
}

// ==================== System Runner Tests ====================

TEST(SystemCommandRunnerTest, CapturesOutput)
{
    SystemCommandRunner runner;
    auto result = runner.run({"echo", "hello"}, 2000ms);
    EXPECT_TRUE(result.launched);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "hello\n");
}

TEST(SystemCommandRunnerTest, MissingBinaryIsNotLaunched)
{
    SystemCommandRunner runner;
    auto result = runner.run({"hotspotd-no-such-binary"}, 2000ms);
    EXPECT_FALSE(result.launched);
}

TEST(SystemCommandRunnerTest, HungCommandIsKilled)
{
    SystemCommandRunner runner;
    auto result = runner.run({"sleep", "5"}, 100ms);
    EXPECT_TRUE(result.launched);
    EXPECT_TRUE(result.timed_out);
}
