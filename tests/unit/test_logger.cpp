// tests/unit/test_logger.cpp
#include <gtest/gtest.h>

#include "core/logger.hpp"

#include <cstddef>

using namespace hotspot::core;

// ==================== LogContext Tests ====================

TEST(LogContextTest, FieldsKeepInsertionOrder)
{
    LogContext context;
    context.add("interface", "wlan1").add("rules", std::size_t{6}).add("vpn", true);
    EXPECT_EQ(context.format(), "interface=wlan1 rules=6 vpn=true");
}

TEST(LogContextTest, ValuesWithSpacesAreQuoted)
{
    LogContext context;
    context.add("connection", "Wired connection 1").add("output", "say \"hi\"").add("empty", "");
    EXPECT_EQ(context.format(), "connection=\"Wired connection 1\" output=\"say \\\"hi\\\"\" empty=\"\"");
}

TEST(LogContextTest, SecretsAreRedacted)
{
    LogContext context;
    context.add("ssid", "MyHotspot").add("password", "password123").add("wifi-sec.psk", "password123");
    EXPECT_EQ(context.format(), "ssid=MyHotspot password=*** wifi-sec.psk=***");
}

TEST(LogContextTest, RepeatedKeyOverwrites)
{
    LogContext context;
    context.add("state", "Starting").add("state", "Running");
    EXPECT_EQ(context.format(), "state=Running");
}

// ==================== Level Tests ====================

TEST(LogLevelTest, ParseNames)
{
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("Critical"), LogLevel::CRITICAL);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::WARNING);
}

TEST(LoggerManagerTest, SameNameSameLogger)
{
    auto first = get_logger("test_component");
    auto second = get_logger("test_component");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first->name(), "test_component");
}
