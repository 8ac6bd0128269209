#pragma once

// NatRules.hpp - протокол привилегированного NAT-помощника и построение
// nft-скриптов для одной пары (hotspot, uplink). Без libnftables: исполнение
// живёт только в самом помощнике.

#include <optional>
#include <string>

namespace NatRules
{
    inline constexpr const char *kNatTable = "hotspot_nat"; // ip
    inline constexpr const char *kFwTable  = "hotspot_fw";  // inet

    enum class Action
    {
        Apply,
        Remove,
        Check,
    };

    // Коды выхода помощника
    enum ExitCode : int
    {
        kExitOk               = 0,
        kExitUsage            = 2,
        kExitInvalidInterface = 3,
        kExitNftFailed        = 4,
        kExitAbsent           = 5, // check: правил нет
        kExitOtherPair        = 6, // check/remove: правила стоят для другой пары
        kExitNftUnavailable   = 7,
    };

    std::optional<Action> ParseAction(const std::string &text);
    const char *ToString(Action action);

    // Грамматика имени интерфейса ядра, суженная до безопасного для nft-скрипта набора.
    bool IsValidIfName(const std::string &name);

    // Метка в comment у каждого правила: "hotspot:<hs>><up>"
    std::string Tag(const std::string &hotspot_if, const std::string &uplink_if);

    // Полный набор одной транзакцией: пересоздаёт обе таблицы.
    std::string BuildApplyScript(const std::string &hotspot_if, const std::string &uplink_if);

    // Удаление обеих таблиц; успешно и когда таблиц нет.
    std::string BuildRemoveScript();

    std::string BuildListCommand(const char *family, const char *table);

    struct InstalledPair
    {
        std::string hotspot_if;
        std::string uplink_if;

        bool operator==(const InstalledPair &other) const = default;
    };

    // Найти метку в выводе "nft list table ..."
    std::optional<InstalledPair> ParseInstalledPair(const std::string &listing);

    // Строка, которую check печатает в stdout, и её разбор на стороне ядра.
    std::string FormatCheckLine(const std::optional<InstalledPair> &pair);
    std::optional<InstalledPair> ParseCheckLine(const std::string &line);
}
