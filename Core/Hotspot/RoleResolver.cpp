#include "RoleResolver.hpp"
#include "Errors.hpp"
#include "Core/Logger.hpp"

#include <algorithm>

namespace
{
    bool IsBusy(const NetworkInterface &ni)
    {
        return ni.state == LinkState::Connected
            || ni.state == LinkState::Connecting
            || ni.state == LinkState::ApActive;
    }

    const NetworkInterface &RequireHinted(const std::vector<const NetworkInterface *> &wifi,
                                          const std::vector<NetworkInterface>        &all,
                                          const std::string                          &name,
                                          const char                                 *role)
    {
        for (const NetworkInterface *ni : wifi)
        {
            if (ni->name == name) return *ni;
        }
        const bool exists = std::any_of(all.begin(), all.end(),
                                        [&](const NetworkInterface &ni) { return ni.name == name; });
        throw HotspotError(ErrorCode::InvalidHint,
                           std::string(role) + " hint '" + name + "' " +
                               (exists ? "is not WiFi-capable" : "does not exist"),
                           name, "resolve");
    }
}

namespace RoleResolver
{
    InterfaceRoles Resolve(const std::vector<NetworkInterface> &interfaces,
                           const RoleHints                     &hints)
    {
        // по имени: входные данные не обязаны быть отсортированы
        std::vector<const NetworkInterface *> wifi;
        for (const NetworkInterface &ni : interfaces)
        {
            if (ni.wifi) wifi.push_back(&ni);
        }
        std::sort(wifi.begin(), wifi.end(),
                  [](const NetworkInterface *a, const NetworkInterface *b) { return a->name < b->name; });

        if (wifi.size() < 2)
        {
            throw HotspotError(ErrorCode::InsufficientInterfaces,
                               "need two WiFi-capable interfaces, found " + std::to_string(wifi.size()),
                               wifi.empty() ? std::string() : wifi.front()->name, "resolve");
        }

        const NetworkInterface *uplink  = nullptr;
        const NetworkInterface *hotspot = nullptr;

        if (!hints.uplink.empty())
        {
            uplink = &RequireHinted(wifi, interfaces, hints.uplink, "uplink");
            if (!uplink->default_route && !hints.force_uplink)
            {
                throw HotspotError(ErrorCode::InvalidHint,
                                   "uplink hint '" + uplink->name + "' carries no default route",
                                   uplink->name, "resolve");
            }
        }
        if (!hints.hotspot.empty())
        {
            hotspot = &RequireHinted(wifi, interfaces, hints.hotspot, "hotspot");
            if (uplink != nullptr && uplink->name == hotspot->name)
            {
                throw HotspotError(ErrorCode::InvalidHint,
                                   "uplink and hotspot hints name the same interface '" + hotspot->name + "'",
                                   hotspot->name, "resolve");
            }
        }

        if (uplink == nullptr)
        {
            for (const NetworkInterface *ni : wifi)
            {
                if (ni->default_route && ni != hotspot) { uplink = ni; break; }
            }
        }
        if (uplink == nullptr && hints.force_uplink)
        {
            // форсированный uplink без имени: сначала подключённый, иначе первый по имени
            for (const NetworkInterface *ni : wifi)
            {
                if (ni != hotspot && ni->state == LinkState::Connected) { uplink = ni; break; }
            }
            for (const NetworkInterface *ni : wifi)
            {
                if (uplink != nullptr) break;
                if (ni != hotspot) uplink = ni;
            }
        }
        if (uplink == nullptr)
        {
            if (hotspot != nullptr && hotspot->default_route)
            {
                throw HotspotError(ErrorCode::InvalidHint,
                                   "hotspot hint '" + hotspot->name + "' is the only interface with a default route",
                                   hotspot->name, "resolve");
            }
            throw HotspotError(ErrorCode::NoUplink, "no WiFi interface carries a default route", {}, "resolve");
        }

        if (hotspot == nullptr)
        {
            for (const NetworkInterface *ni : wifi)
            {
                if (ni != uplink && !IsBusy(*ni)) { hotspot = ni; break; }
            }
            for (const NetworkInterface *ni : wifi)
            {
                if (hotspot != nullptr) break;
                if (ni != uplink) hotspot = ni;
            }
        }

        LOGI("resolver") << "Roles: uplink=" << uplink->name << " hotspot=" << hotspot->name
                         << (hints.uplink.empty() && hints.hotspot.empty() ? "" : " (hinted)");
        return InterfaceRoles{*uplink, *hotspot};
    }
}
