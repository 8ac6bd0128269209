#include "Core/Hotspot/Errors.hpp"
#include "Core/Hotspot/RoleResolver.hpp"

#include <gtest/gtest.h>

namespace
{
    NetworkInterface If(const std::string &name, LinkState state, bool default_route = false, bool wifi = true)
    {
        return NetworkInterface{name, wifi, state, default_route};
    }

    ErrorCode ResolveError(const std::vector<NetworkInterface> &ifs, const RoleHints &hints = {})
    {
        try
        {
            RoleResolver::Resolve(ifs, hints);
        }
        catch (const HotspotError &e)
        {
            return e.Code();
        }
        return ErrorCode::Ok;
    }
}

TEST(RoleResolver, UplinkIsDefaultRouteHotspotIsTheOther)
{
    const auto roles = RoleResolver::Resolve({If("wlan0", LinkState::Connected, true),
                                              If("wlan1", LinkState::Down)}, {});
    EXPECT_EQ(roles.uplink.name, "wlan0");
    EXPECT_EQ(roles.hotspot.name, "wlan1");
    EXPECT_NE(roles.uplink.name, roles.hotspot.name);
}

TEST(RoleResolver, InputOrderDoesNotMatter)
{
    const auto roles = RoleResolver::Resolve({If("wlan1", LinkState::Down),
                                              If("wlan0", LinkState::Connected, true)}, {});
    EXPECT_EQ(roles.uplink.name, "wlan0");
    EXPECT_EQ(roles.hotspot.name, "wlan1");
}

TEST(RoleResolver, NeedsTwoWifiInterfaces)
{
    EXPECT_EQ(ResolveError({}), ErrorCode::InsufficientInterfaces);
    EXPECT_EQ(ResolveError({If("wlan0", LinkState::Connected, true)}), ErrorCode::InsufficientInterfaces);
    // ethernet не считается
    EXPECT_EQ(ResolveError({If("wlan0", LinkState::Connected, true),
                            If("eth0", LinkState::Connected, false, false)}),
              ErrorCode::InsufficientInterfaces);
}

TEST(RoleResolver, NoDefaultRouteMeansNoUplink)
{
    EXPECT_EQ(ResolveError({If("wlan0", LinkState::Connected), If("wlan1", LinkState::Down)}),
              ErrorCode::NoUplink);

    // маршрут по умолчанию через ethernet тоже не годится
    EXPECT_EQ(ResolveError({If("eth0", LinkState::Connected, true, false),
                            If("wlan0", LinkState::Down), If("wlan1", LinkState::Down)}),
              ErrorCode::NoUplink);
}

TEST(RoleResolver, PrefersIdleHotspotThenName)
{
    auto roles = RoleResolver::Resolve({If("wlan0", LinkState::Connected, true),
                                        If("wlan1", LinkState::Connected),
                                        If("wlan2", LinkState::Down)}, {});
    EXPECT_EQ(roles.hotspot.name, "wlan2");

    // все заняты - первый по имени
    roles = RoleResolver::Resolve({If("wlan0", LinkState::Connected, true),
                                   If("wlan2", LinkState::Connecting),
                                   If("wlan1", LinkState::ApActive)}, {});
    EXPECT_EQ(roles.hotspot.name, "wlan1");

    // равно свободные - первый по имени
    roles = RoleResolver::Resolve({If("wlx9", LinkState::Down),
                                   If("wlan0", LinkState::Connected, true),
                                   If("wlan3", LinkState::Down)}, {});
    EXPECT_EQ(roles.hotspot.name, "wlan3");
}

TEST(RoleResolver, HintsOverrideHeuristic)
{
    const std::vector<NetworkInterface> ifs = {If("wlan0", LinkState::Connected, true),
                                               If("wlan1", LinkState::Down),
                                               If("wlan2", LinkState::Down)};
    RoleHints hints;
    hints.hotspot = "wlan2";
    const auto roles = RoleResolver::Resolve(ifs, hints);
    EXPECT_EQ(roles.uplink.name, "wlan0");
    EXPECT_EQ(roles.hotspot.name, "wlan2");
}

TEST(RoleResolver, InvalidHints)
{
    const std::vector<NetworkInterface> ifs = {If("wlan0", LinkState::Connected, true),
                                               If("wlan1", LinkState::Down),
                                               If("eth0", LinkState::Connected, false, false)};

    RoleHints missing;
    missing.hotspot = "wlan7";
    EXPECT_EQ(ResolveError(ifs, missing), ErrorCode::InvalidHint);

    RoleHints wired;
    wired.hotspot = "eth0";
    EXPECT_EQ(ResolveError(ifs, wired), ErrorCode::InvalidHint);

    RoleHints same;
    same.uplink  = "wlan0";
    same.hotspot = "wlan0";
    EXPECT_EQ(ResolveError(ifs, same), ErrorCode::InvalidHint);

    RoleHints no_route;
    no_route.uplink = "wlan1";
    EXPECT_EQ(ResolveError(ifs, no_route), ErrorCode::InvalidHint);

    // единственный маршрут по умолчанию отдан под хотспот
    RoleHints stolen;
    stolen.hotspot = "wlan0";
    EXPECT_EQ(ResolveError(ifs, stolen), ErrorCode::InvalidHint);
}

TEST(RoleResolver, ForcedUplinkWithoutDefaultRoute)
{
    const std::vector<NetworkInterface> ifs = {If("wlan0", LinkState::Down),
                                               If("wlan1", LinkState::Connected)};
    RoleHints hints;
    hints.force_uplink = true;
    auto roles = RoleResolver::Resolve(ifs, hints);
    EXPECT_EQ(roles.uplink.name, "wlan1");
    EXPECT_EQ(roles.hotspot.name, "wlan0");

    hints.uplink = "wlan0";
    roles = RoleResolver::Resolve(ifs, hints);
    EXPECT_EQ(roles.uplink.name, "wlan0");
    EXPECT_EQ(roles.hotspot.name, "wlan1");
}
