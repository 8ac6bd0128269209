#pragma once

#include "Platform.hpp"

// NmPlatform.hpp - PlatformNetwork поверх NetworkManager (system D-Bus, sd-bus)
// и таблиц ядра (libnl). AP поднимается как volatile-подключение:
// NM удаляет профиль сам после деактивации.

class NmPlatform : public PlatformNetwork
{
public:
    struct Params
    {
        std::chrono::milliseconds poll_interval{250}; // опрос ActiveConnection.State
    };

    explicit NmPlatform(const Params &params);

    std::vector<DeviceInfo>    ListDevices() override;
    std::optional<std::string> DefaultRouteInterface() override;

    void BringUpAccessPoint(const AccessPointRequest  &request,
                            std::stop_token            st,
                            std::chrono::milliseconds  timeout) override;

    void TearDownAccessPoint(const std::string &ifname,
                             const std::string &connection_name) override;

    bool IsAccessPointUp(const std::string &ifname,
                         const std::string &connection_name) override;

    std::vector<std::string> ListClients(const std::string &ifname) override;

private:
    Params p_;
};
