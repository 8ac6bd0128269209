#pragma once

#include "Types.hpp"

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

/**
 * @file Platform.hpp
 * @brief Граница с сервисом сетевой конфигурации (NetworkManager) и таблицами ядра.
 */

/**
 * @brief Сырые данные об устройстве, как их отдаёт сервис.
 */
struct DeviceInfo
{
    std::string name;
    bool        wifi     = false;
    unsigned    nm_state = 0;     ///< NMDeviceState.
    bool        ap_mode  = false; ///< Wireless.Mode == AP.
};

/**
 * @brief Что поднять на hotspot-интерфейсе.
 */
struct AccessPointRequest
{
    std::string ifname;
    std::string connection_name;
    std::string ssid;
    std::string passphrase;
    Band        band    = Band::Bg;
    int         channel = 0;
    std::string gateway_cidr;
};

/**
 * @brief Платформенные операции. Все методы блокирующие и вызываются с рабочих потоков.
 *
 * Ошибки запросов - HotspotError(PlatformQueryError); ошибки подъёма AP -
 * HotspotError(ActivationFailed | Timeout).
 */
class PlatformNetwork
{
public:
    virtual ~PlatformNetwork() = default;

    virtual std::vector<DeviceInfo> ListDevices() = 0;

    /// Интерфейс маршрута по умолчанию из main-таблицы (IPv4, затем IPv6).
    virtual std::optional<std::string> DefaultRouteInterface() = 0;

    virtual void BringUpAccessPoint(const AccessPointRequest  &request,
                                    std::stop_token            st,
                                    std::chrono::milliseconds  timeout) = 0;

    /// Снять AP-подключение с данным id на интерфейсе; отсутствие - не ошибка.
    virtual void TearDownAccessPoint(const std::string &ifname,
                                     const std::string &connection_name) = 0;

    virtual bool IsAccessPointUp(const std::string &ifname,
                                 const std::string &connection_name) = 0;

    /// IPv4-адреса соседей (клиентов) на интерфейсе.
    virtual std::vector<std::string> ListClients(const std::string &ifname) = 0;
};
