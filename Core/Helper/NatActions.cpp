#include "NatActions.hpp"
#include "Core/Logger.hpp"

#include <ostream>

namespace
{
    NatActions::TableState ReadTable(NatActions::System &sys, const char *family, const char *table)
    {
        NatActions::TableState t;
        if (!sys.Run(NatRules::BuildListCommand(family, table)))
        {
            return t; // таблицы нет
        }
        t.present = true;
        t.pair    = NatRules::ParseInstalledPair(sys.LastOutput());
        return t;
    }

    std::string Describe(const NatActions::TableState &t)
    {
        if (!t.present) return "absent";
        if (!t.pair) return "untagged";
        return NatRules::Tag(t.pair->hotspot_if, t.pair->uplink_if);
    }

    void EnableForwarding(NatActions::System &sys)
    {
        if (!sys.LoadSavedForwarding())
        {
            const auto current = sys.ReadForwarding();
            if (!current)
            {
                LOGW("nathelper") << "ip_forward: current value unreadable, will not restore";
            }
            else if (!sys.SaveForwarding(*current))
            {
                LOGW("nathelper") << "ip_forward: could not save previous value " << *current;
            }
        }
        if (!sys.WriteForwarding("1"))
        {
            LOGW("nathelper") << "ip_forward: could not enable";
        }
    }

    void RestoreForwarding(NatActions::System &sys)
    {
        const auto saved = sys.LoadSavedForwarding();
        if (!saved) return;

        if (!sys.WriteForwarding(*saved))
        {
            LOGW("nathelper") << "ip_forward: could not restore " << *saved << ", kept for next remove";
            return;
        }
        sys.ClearSavedForwarding();
        LOGI("nathelper") << "ip_forward: restored " << *saved;
    }
}

namespace NatActions
{
    std::optional<NatRules::InstalledPair> Installed::Reported(const NatRules::InstalledPair &want) const
    {
        for (const TableState *t : {&nat, &fw})
        {
            if (t->pair && !(*t->pair == want)) return t->pair;
        }
        if (nat.pair) return nat.pair;
        return fw.pair;
    }

    Installed ReadInstalled(System &sys)
    {
        Installed in;
        in.nat = ReadTable(sys, "ip", NatRules::kNatTable);
        in.fw  = ReadTable(sys, "inet", NatRules::kFwTable);
        return in;
    }

    int Apply(System &sys, const NatRules::InstalledPair &want)
    {
        if (!sys.InterfaceExists(want.hotspot_if) || !sys.InterfaceExists(want.uplink_if))
        {
            LOGE("nathelper") << "apply: interface not found hs=" << want.hotspot_if << " up=" << want.uplink_if;
            return NatRules::kExitInvalidInterface;
        }

        const Installed before = ReadInstalled(sys);
        if (!before.nat.AbsentOr(want) || !before.fw.AbsentOr(want))
        {
            LOGW("nathelper") << "apply: replacing nat=" << Describe(before.nat) << " fw=" << Describe(before.fw);
        }

        EnableForwarding(sys);

        if (!sys.Run(NatRules::BuildApplyScript(want.hotspot_if, want.uplink_if)))
        {
            LOGE("nathelper") << "apply: nft batch failed: " << sys.LastError();
            // транзакция откатилась; прежние правила, если были, ещё работают
            if (!before.Any()) RestoreForwarding(sys);
            return NatRules::kExitNftFailed;
        }
        LOGI("nathelper") << "apply: installed " << NatRules::Tag(want.hotspot_if, want.uplink_if);
        return NatRules::kExitOk;
    }

    int Remove(System &sys, const NatRules::InstalledPair &want)
    {
        const Installed before = ReadInstalled(sys);
        if (!before.nat.AbsentOr(want) || !before.fw.AbsentOr(want))
        {
            LOGE("nathelper") << "remove: tables hold nat=" << Describe(before.nat) << " fw=" << Describe(before.fw)
                              << ", not " << NatRules::Tag(want.hotspot_if, want.uplink_if) << "; left in place";
            return NatRules::kExitOtherPair;
        }

        if (before.Any() && !sys.Run(NatRules::BuildRemoveScript()))
        {
            LOGE("nathelper") << "remove: nft batch failed: " << sys.LastError();
            return NatRules::kExitNftFailed;
        }
        RestoreForwarding(sys);

        LOGI("nathelper") << "remove: " << (before.Any() ? "removed " : "nothing installed for ")
                          << NatRules::Tag(want.hotspot_if, want.uplink_if);
        return NatRules::kExitOk;
    }

    int Check(System &sys, const NatRules::InstalledPair &want, std::ostream &out)
    {
        const Installed now = ReadInstalled(sys);
        out << NatRules::FormatCheckLine(now.Reported(want)) << std::endl;

        if (!now.Any()) return NatRules::kExitAbsent;

        const bool complete = now.nat.present && now.fw.present && now.nat.AbsentOr(want) && now.fw.AbsentOr(want);
        return complete ? NatRules::kExitOk : NatRules::kExitOtherPair;
    }

    int Execute(NatRules::Action action, System &sys, const NatRules::InstalledPair &want, std::ostream &out)
    {
        switch (action)
        {
            case NatRules::Action::Apply:  return Apply(sys, want);
            case NatRules::Action::Remove: return Remove(sys, want);
            case NatRules::Action::Check:  return Check(sys, want, out);
        }
        return NatRules::kExitUsage;
    }
}
