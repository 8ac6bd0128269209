#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * @file LinkProbe.hpp
 * @brief Чтение таблиц ядра через libnl: маршрут по умолчанию и соседи.
 */

namespace LinkProbe
{
    /**
     * @brief Имя интерфейса маршрута по умолчанию из main-таблицы.
     * @param family AF_INET или AF_INET6.
     * @return nullopt, если маршрута нет.
     * @throws std::runtime_error если netlink недоступен.
     */
    std::optional<std::string> find_default_oifname(int family);

    /**
     * @brief IPv4-соседи интерфейса (без FAILED/INCOMPLETE/NOARP).
     * @throws std::runtime_error если netlink недоступен.
     */
    std::vector<std::string> list_neighbours_v4(const std::string &ifname);
}
