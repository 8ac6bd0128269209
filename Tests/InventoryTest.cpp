#include "Fakes.hpp"
#include "Core/Hotspot/Inventory.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace
{
    // ListDevices бросает не HotspotError, как сломанный D-Bus
    class BrokenPlatform : public Fakes::FakePlatform
    {
    public:
        std::vector<DeviceInfo> ListDevices() override
        {
            throw std::runtime_error("sd_bus_call: Connection refused");
        }
    };
}

TEST(Inventory, MapsNetworkManagerStates)
{
    EXPECT_EQ(InterfaceInventory::MapDeviceState(100, false), LinkState::Connected);
    EXPECT_EQ(InterfaceInventory::MapDeviceState(100, true), LinkState::ApActive);
    EXPECT_EQ(InterfaceInventory::MapDeviceState(40, false), LinkState::Connecting);
    EXPECT_EQ(InterfaceInventory::MapDeviceState(90, false), LinkState::Connecting);
    EXPECT_EQ(InterfaceInventory::MapDeviceState(30, false), LinkState::Down);
    EXPECT_EQ(InterfaceInventory::MapDeviceState(20, false), LinkState::Down);
    EXPECT_EQ(InterfaceInventory::MapDeviceState(110, false), LinkState::Down);
}

TEST(Inventory, ScanSortsAndMarksDefaultRoute)
{
    Fakes::FakePlatform platform;
    platform.SetDevices({Fakes::Wifi("wlan1"),
                         DeviceInfo{"lo", false, 100, false},
                         Fakes::Wifi("wlan0", Fakes::kNmActivated)},
                        "wlan0");

    InterfaceInventory inventory(platform);
    const auto ifs = inventory.Scan();

    ASSERT_EQ(ifs.size(), 3u);
    EXPECT_EQ(ifs[0].name, "lo");
    EXPECT_EQ(ifs[1].name, "wlan0");
    EXPECT_EQ(ifs[2].name, "wlan1");

    EXPECT_FALSE(ifs[0].wifi);
    EXPECT_TRUE(ifs[1].default_route);
    EXPECT_EQ(ifs[1].state, LinkState::Connected);
    EXPECT_FALSE(ifs[2].default_route);
    EXPECT_EQ(ifs[2].state, LinkState::Down);
}

TEST(Inventory, NoDefaultRoute)
{
    Fakes::FakePlatform platform;
    platform.SetDevices({Fakes::Wifi("wlan0"), Fakes::Wifi("wlan1")}, std::nullopt);

    InterfaceInventory inventory(platform);
    for (const auto &ni : inventory.Scan())
    {
        EXPECT_FALSE(ni.default_route) << ni.name;
    }
}

TEST(Inventory, QueryFailuresBecomePlatformQueryError)
{
    BrokenPlatform broken;
    InterfaceInventory inventory(broken);
    try
    {
        inventory.Scan();
        FAIL() << "Scan must throw";
    }
    catch (const HotspotError &e)
    {
        EXPECT_EQ(e.Code(), ErrorCode::PlatformQueryError);
        EXPECT_EQ(e.Step(), "scan");
    }

    Fakes::FakePlatform platform;
    platform.FailQueries(true);
    InterfaceInventory failing(platform);
    try
    {
        failing.Scan();
        FAIL() << "Scan must throw";
    }
    catch (const HotspotError &e)
    {
        EXPECT_EQ(e.Code(), ErrorCode::PlatformQueryError);
    }
}
