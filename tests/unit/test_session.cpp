// tests/unit/test_session.cpp
#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "core/session.hpp"

using namespace hotspot::core;

namespace
{
    HotspotSession valid_session()
    {
        HotspotSession session;
        session.ssid = "CoffeeShop";
        session.password = "correcthorse";
        session.hotspot_interface = "wlan1";
        return session;
    }

    ErrorKind validation_error(const HotspotSession &session)
    {
        try
        {
            validate_session(session);
        }
        catch (const HotspotError &e)
        {
            return e.kind();
        }
        return ErrorKind::None;
    }
}

// ==================== Validation Tests ====================

TEST(SessionValidationTest, AcceptsValidSession)
{
    EXPECT_NO_THROW(validate_session(valid_session()));
}

TEST(SessionValidationTest, PasswordLengthBounds)
{
    auto session = valid_session();

    session.password = "1234567";
    EXPECT_EQ(validation_error(session), ErrorKind::InvalidConfig);

    session.password = "12345678";
    EXPECT_EQ(validation_error(session), ErrorKind::None);

    session.password = std::string(63, 'x');
    EXPECT_EQ(validation_error(session), ErrorKind::None);

    session.password = std::string(64, 'x');
    EXPECT_EQ(validation_error(session), ErrorKind::InvalidConfig);
}

TEST(SessionValidationTest, SsidLengthBounds)
{
    auto session = valid_session();

    session.ssid = "";
    EXPECT_EQ(validation_error(session), ErrorKind::InvalidConfig);

    session.ssid = std::string(32, 's');
    EXPECT_EQ(validation_error(session), ErrorKind::None);

    session.ssid = std::string(33, 's');
    EXPECT_EQ(validation_error(session), ErrorKind::InvalidConfig);
}

TEST(SessionValidationTest, TimerRange)
{
    auto session = valid_session();

    session.timer_minutes = 0;
    EXPECT_EQ(validation_error(session), ErrorKind::InvalidConfig);

    session.timer_minutes = 1;
    EXPECT_EQ(validation_error(session), ErrorKind::None);

    session.timer_minutes = 120;
    EXPECT_EQ(validation_error(session), ErrorKind::None);

    session.timer_minutes = 121;
    EXPECT_EQ(validation_error(session), ErrorKind::InvalidConfig);
}

TEST(SessionValidationTest, RejectsMalformedMacAndDns)
{
    auto session = valid_session();
    session.mac_filter.addresses = {"aa:bb:cc:dd:ee"};
    EXPECT_EQ(validation_error(session), ErrorKind::InvalidConfig);

    session = valid_session();
    session.dns_override = "dns.example.com";
    EXPECT_EQ(validation_error(session), ErrorKind::InvalidConfig);

    session.dns_override = "9.9.9.9";
    EXPECT_EQ(validation_error(session), ErrorKind::None);
}

// ==================== Helper Tests ====================

TEST(SessionHelpersTest, NormalizeMac)
{
    EXPECT_EQ(normalize_mac("AA-BB-CC-0D-0E-0F"), "aa:bb:cc:0d:0e:0f");
    EXPECT_TRUE(is_valid_mac(normalize_mac("AA-BB-CC-0D-0E-0F")));
    EXPECT_FALSE(is_valid_mac("aabbccddeeff"));
}

TEST(SessionHelpersTest, ParseBand)
{
    EXPECT_EQ(parse_band("g"), Band::TwoPointFourGHz);
    EXPECT_EQ(parse_band("bg"), Band::TwoPointFourGHz);
    EXPECT_EQ(parse_band("a"), Band::FiveGHz);
    EXPECT_FALSE(parse_band("ac").has_value());
    EXPECT_STREQ(band_to_nmcli(Band::FiveGHz), "a");
    EXPECT_STREQ(band_to_nmcli(Band::TwoPointFourGHz), "bg");
}

TEST(SessionHelpersTest, SubnetOf)
{
    EXPECT_EQ(subnet_of("10.42.0.1/24"), "10.42.0.0/24");
    EXPECT_EQ(subnet_of("192.168.12.1/16"), "192.168.0.0/16");
    EXPECT_THROW(subnet_of("10.42.0.1"), HotspotError);
}

// ==================== Error Mapping Tests ====================

TEST(ErrorMappingTest, ExitCodesAreStable)
{
    EXPECT_EQ(exit_code_for(ErrorKind::InvalidConfig), 2);
    EXPECT_EQ(exit_code_for(ErrorKind::ServiceUnavailable), 3);
    EXPECT_EQ(exit_code_for(ErrorKind::DeviceUnreachable), 4);
    EXPECT_EQ(exit_code_for(ErrorKind::NoInternetSource), 5);
    EXPECT_EQ(exit_code_for(ErrorKind::ApplyFailure), 6);
    EXPECT_EQ(exit_code_for(ErrorKind::SessionActive), 7);
    EXPECT_EQ(exit_code_for(ErrorKind::PrivilegeRequired), 8);
    EXPECT_EQ(exit_code_for(BlockReason::RFKillActive), 10);
    EXPECT_EQ(exit_code_for(BlockReason::SingleAdapterLockout), 15);
}

TEST(ErrorMappingTest, BlockedUsesPrimaryReason)
{
    ErrorInfo error{ErrorKind::Blocked, {BlockReason::BandUnsupported}, "no 5GHz"};
    EXPECT_EQ(error.exit_code(), 13);
    EXPECT_EQ(error.code(), "BandUnsupported");
    EXPECT_TRUE(is_overridable(BlockReason::SingleAdapterLockout));
    EXPECT_FALSE(is_overridable(BlockReason::RFKillActive));
}
