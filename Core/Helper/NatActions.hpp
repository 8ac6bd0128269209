#pragma once

// NatActions.hpp - решения NAT-помощника (apply / remove / check) поверх
// абстрактной системы: nft, интерфейсы, net.ipv4.ip_forward. Реальная
// система (libnftables, /proc, /run) живёт в NatHelper.cpp.

#include "Core/Helper/NatRules.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace NatActions
{
    class System
    {
    public:
        virtual ~System() = default;

        // Скрипт nft одной транзакцией. false - ошибка, текст в LastError().
        virtual bool Run(const std::string &commands) = 0;
        virtual const std::string &LastOutput() const = 0;
        virtual const std::string &LastError() const = 0;

        virtual bool InterfaceExists(const std::string &name) = 0;

        // Текущее значение net.ipv4.ip_forward ("0"/"1")
        virtual std::optional<std::string> ReadForwarding() = 0;
        virtual bool WriteForwarding(const std::string &value) = 0;

        // Значение ip_forward до первого apply; переживает запуск помощника.
        virtual std::optional<std::string> LoadSavedForwarding() = 0;
        virtual bool SaveForwarding(const std::string &value) = 0;
        virtual void ClearSavedForwarding() = 0;
    };

    /**
     * @brief Состояние одной нашей таблицы.
     */
    struct TableState
    {
        bool present = false;
        std::optional<NatRules::InstalledPair> pair; ///< Метка правил; nullopt - таблица без нашей метки.

        // Таблицы нет или в ней правила именно этой пары
        bool AbsentOr(const NatRules::InstalledPair &want) const
        {
            return !present || (pair && *pair == want);
        }
    };

    struct Installed
    {
        TableState nat;
        TableState fw;

        bool Any() const { return nat.present || fw.present; }

        // Пара для строки check: чужая, если такая есть
        std::optional<NatRules::InstalledPair> Reported(const NatRules::InstalledPair &want) const;
    };

    Installed ReadInstalled(System &sys);

    // Ставит правила want, заменяя прежние; ip_forward=1 с запоминанием прежнего значения.
    int Apply(System &sys, const NatRules::InstalledPair &want);

    // Снимает обе таблицы, только если все присутствующие принадлежат want;
    // возвращает ip_forward к сохранённому значению.
    int Remove(System &sys, const NatRules::InstalledPair &want);

    // Печатает строку check в out. 0 - обе таблицы want, 5 - ничего нет, 6 - иначе.
    int Check(System &sys, const NatRules::InstalledPair &want, std::ostream &out);

    int Execute(NatRules::Action action, System &sys, const NatRules::InstalledPair &want, std::ostream &out);
}
