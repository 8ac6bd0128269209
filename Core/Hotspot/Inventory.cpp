#include "Inventory.hpp"
#include "Errors.hpp"
#include "Core/Logger.hpp"

#include <algorithm>
#include <exception>

namespace
{
    // NMDeviceState
    constexpr unsigned kNmStatePrepare     = 40;
    constexpr unsigned kNmStateSecondaries = 90;
    constexpr unsigned kNmStateActivated   = 100;
}

InterfaceInventory::InterfaceInventory(PlatformNetwork &platform)
    : platform_(platform)
{
}

LinkState InterfaceInventory::MapDeviceState(unsigned nm_state, bool ap_mode)
{
    if (nm_state == kNmStateActivated)
    {
        return ap_mode ? LinkState::ApActive : LinkState::Connected;
    }
    if (nm_state >= kNmStatePrepare && nm_state <= kNmStateSecondaries)
    {
        return LinkState::Connecting;
    }
    return LinkState::Down;
}

std::vector<NetworkInterface> InterfaceInventory::Scan() const
{
    std::vector<DeviceInfo>    devices;
    std::optional<std::string> default_if;
    try
    {
        devices    = platform_.ListDevices();
        default_if = platform_.DefaultRouteInterface();
    }
    catch (const HotspotError &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        throw HotspotError(ErrorCode::PlatformQueryError, std::string("inventory scan failed: ") + e.what(), {}, "scan");
    }

    std::vector<NetworkInterface> out;
    out.reserve(devices.size());
    for (const DeviceInfo &d : devices)
    {
        NetworkInterface ni;
        ni.name          = d.name;
        ni.wifi          = d.wifi;
        ni.state         = MapDeviceState(d.nm_state, d.ap_mode);
        ni.default_route = default_if && *default_if == d.name;
        out.push_back(std::move(ni));
    }

    std::sort(out.begin(), out.end(),
              [](const NetworkInterface &a, const NetworkInterface &b) { return a.name < b.name; });

    LOGD("inventory") << "Scan: " << out.size() << " interfaces, default route via "
                      << (default_if ? *default_if : std::string("-"));
    return out;
}
