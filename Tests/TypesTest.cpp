#include "Core/Hotspot/Errors.hpp"
#include "Core/Hotspot/Types.hpp"

#include <gtest/gtest.h>

namespace
{
    HotspotConfig Valid()
    {
        HotspotConfig c;
        c.ssid       = "Home";
        c.passphrase = "12345678";
        return c;
    }

    // step несёт имя поля
    std::string RejectedField(const HotspotConfig &c)
    {
        try
        {
            ValidateConfig(c);
        }
        catch (const HotspotError &e)
        {
            EXPECT_EQ(e.Code(), ErrorCode::InvalidConfig);
            return e.Step();
        }
        return {};
    }
}

TEST(ValidateConfig, AcceptsDefaultsAndMinimalConfig)
{
    EXPECT_NO_THROW(ValidateConfig(HotspotConfig{}));
    EXPECT_NO_THROW(ValidateConfig(Valid()));
}

TEST(ValidateConfig, SsidLength)
{
    HotspotConfig c = Valid();
    c.ssid.clear();
    EXPECT_EQ(RejectedField(c), "ssid");

    c.ssid = std::string(32, 'x');
    EXPECT_NO_THROW(ValidateConfig(c));
    c.ssid += "x";
    EXPECT_EQ(RejectedField(c), "ssid");
}

TEST(ValidateConfig, Passphrase)
{
    HotspotConfig c = Valid();
    c.passphrase = "1234567";
    EXPECT_EQ(RejectedField(c), "passphrase");

    c.passphrase = std::string(63, 'p');
    EXPECT_NO_THROW(ValidateConfig(c));

    c.passphrase = std::string(64, 'a'); // 64 hex: готовый PSK
    EXPECT_NO_THROW(ValidateConfig(c));

    c.passphrase = std::string(64, 'z');
    EXPECT_EQ(RejectedField(c), "passphrase");

    c.passphrase = "pass\tword";
    EXPECT_EQ(RejectedField(c), "passphrase");
}

TEST(ValidateConfig, ChannelMustMatchBand)
{
    HotspotConfig c = Valid();
    c.channel = 6;
    EXPECT_NO_THROW(ValidateConfig(c));

    c.channel = 36;
    EXPECT_EQ(RejectedField(c), "channel");

    c.band = Band::A;
    EXPECT_NO_THROW(ValidateConfig(c));

    c.channel = 6;
    EXPECT_EQ(RejectedField(c), "channel");

    c.channel = -1;
    EXPECT_EQ(RejectedField(c), "channel");
}

TEST(ValidateConfig, GatewayAndConnectionName)
{
    HotspotConfig c = Valid();
    c.gateway_cidr = "10.42.0.1/24";
    EXPECT_NO_THROW(ValidateConfig(c));

    for (const char *bad : {"10.42.0.1", "10.42.0/24", "10.42.0.256/24", "10.42.0.1/31", "10.42.0.1/", "a.b.c.d/24"})
    {
        c.gateway_cidr = bad;
        EXPECT_EQ(RejectedField(c), "gateway_cidr") << bad;
    }

    c = Valid();
    c.connection_name.clear();
    EXPECT_EQ(RejectedField(c), "connection_name");
}

TEST(Types, NatRuleSetFollowsRoles)
{
    InterfaceRoles roles;
    roles.uplink.name  = "wlan0";
    roles.hotspot.name = "wlan1";

    const NatRuleSet rules = NatRuleSet::From(roles);
    EXPECT_EQ(rules.hotspot_if, "wlan1");
    EXPECT_EQ(rules.uplink_if, "wlan0");
    EXPECT_EQ(rules, (NatRuleSet{"wlan1", "wlan0"}));
}

TEST(Types, BandNames)
{
    EXPECT_EQ(ParseBand("bg"), Band::Bg);
    EXPECT_EQ(ParseBand("a"), Band::A);
    EXPECT_FALSE(ParseBand("5GHz"));
    EXPECT_STREQ(ToString(Band::A), "a");
}

TEST(Errors, HelperErrorsAndResult)
{
    EXPECT_TRUE(IsHelperError(ErrorCode::NatUnavailable));
    EXPECT_TRUE(IsHelperError(ErrorCode::NatApplyFailed));
    EXPECT_FALSE(IsHelperError(ErrorCode::Timeout));

    const Result r = Result::FromError(HotspotError(ErrorCode::NoUplink, "no uplink", "wlan0", "resolve"));
    EXPECT_FALSE(r.IsOk());
    EXPECT_EQ(r.code, ErrorCode::NoUplink);
    EXPECT_EQ(r.message, "no uplink");
    EXPECT_EQ(r.ifname, "wlan0");
    EXPECT_EQ(r.step, "resolve");

    EXPECT_TRUE(Result::Success().IsOk());
}
