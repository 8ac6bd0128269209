#pragma once

#include "Platform.hpp"
#include "Types.hpp"

#include <vector>

// Inventory.hpp - живой список интерфейсов: устройства NM + маршрут по умолчанию.
// Без кэша и побочных эффектов.

class InterfaceInventory
{
public:
    explicit InterfaceInventory(PlatformNetwork &platform);

    // Отсортировано по имени. Бросает HotspotError(PlatformQueryError).
    std::vector<NetworkInterface> Scan() const;

    static LinkState MapDeviceState(unsigned nm_state, bool ap_mode);

private:
    PlatformNetwork &platform_;
};
