#pragma once

#include "Types.hpp"

#include <vector>

/**
 * @file RoleResolver.hpp
 * @brief Назначение ролей uplink/hotspot двум WiFi-интерфейсам.
 */

namespace RoleResolver
{
    /**
     * @brief Выбрать роли.
     *
     * uplink - WiFi-интерфейс с маршрутом по умолчанию (при равенстве - по имени).
     * hotspot - среди остальных WiFi предпочитаем незанятые (не Connected/Connecting/ApActive),
     * затем по имени по возрастанию. Подсказки переопределяют эвристику, но проверяются.
     *
     * @throws HotspotError InsufficientInterfaces, NoUplink, InvalidHint.
     */
    InterfaceRoles Resolve(const std::vector<NetworkInterface> &interfaces,
                           const RoleHints                     &hints);
}
