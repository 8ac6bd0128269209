#include "NatRules.hpp"

#include <cctype>
#include <sstream>

namespace
{
    constexpr const char *kTagPrefix = "hotspot:";

    // IFNAMSIZ - 1
    constexpr std::size_t kMaxIfNameLen = 15;

    std::string Quote(const std::string &s)
    {
        return "\"" + s + "\"";
    }
}

namespace NatRules
{
    std::optional<Action> ParseAction(const std::string &text)
    {
        if (text == "apply")  return Action::Apply;
        if (text == "remove") return Action::Remove;
        if (text == "check")  return Action::Check;
        return std::nullopt;
    }

    const char *ToString(Action action)
    {
        switch (action)
        {
            case Action::Apply:  return "apply";
            case Action::Remove: return "remove";
            case Action::Check:  return "check";
        }
        return "unknown";
    }

    bool IsValidIfName(const std::string &name)
    {
        if (name.empty() || name.size() > kMaxIfNameLen) return false;
        if (name == "." || name == "..") return false;
        for (unsigned char c : name)
        {
            const bool ok = std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '@' || c == '+';
            if (!ok) return false;
        }
        return true;
    }

    std::string Tag(const std::string &hotspot_if, const std::string &uplink_if)
    {
        return std::string(kTagPrefix) + hotspot_if + ">" + uplink_if;
    }

    std::string BuildApplyScript(const std::string &hotspot_if, const std::string &uplink_if)
    {
        const std::string hs      = Quote(hotspot_if);
        const std::string up      = Quote(uplink_if);
        const std::string comment = " comment " + Quote(Tag(hotspot_if, uplink_if));
        const std::string nat     = std::string("ip ") + kNatTable;
        const std::string fw      = std::string("inet ") + kFwTable;

        std::string cmd;
        // add+delete: удалить, если есть, не падая, если нет
        cmd += "add table " + nat + "\n";
        cmd += "delete table " + nat + "\n";
        cmd += "add table " + fw + "\n";
        cmd += "delete table " + fw + "\n";

        cmd += "add table " + nat + "\n";
        cmd += "add chain " + nat + " postrouting { type nat hook postrouting priority 100 ; policy accept ; }\n";
        cmd += "add rule " + nat + " postrouting iifname " + hs + " oifname " + up + " counter masquerade" + comment + "\n";

        cmd += "add table " + fw + "\n";
        cmd += "add chain " + fw + " forward { type filter hook forward priority 0 ; policy accept ; }\n";
        cmd += "add rule " + fw + " forward iifname " + hs + " oifname " + up + " accept" + comment + "\n";
        cmd += "add rule " + fw + " forward iifname " + up + " oifname " + hs +
               " ct state established,related accept" + comment + "\n";
        return cmd;
    }

    std::string BuildRemoveScript()
    {
        const std::string nat = std::string("ip ") + kNatTable;
        const std::string fw  = std::string("inet ") + kFwTable;

        std::string cmd;
        cmd += "add table " + nat + "\n";
        cmd += "delete table " + nat + "\n";
        cmd += "add table " + fw + "\n";
        cmd += "delete table " + fw + "\n";
        return cmd;
    }

    std::string BuildListCommand(const char *family, const char *table)
    {
        return std::string("list table ") + family + " " + table;
    }

    std::optional<InstalledPair> ParseInstalledPair(const std::string &listing)
    {
        const std::string needle = std::string("comment \"") + kTagPrefix;
        const auto at = listing.find(needle);
        if (at == std::string::npos) return std::nullopt;

        const auto begin = at + needle.size();
        const auto end   = listing.find('"', begin);
        if (end == std::string::npos) return std::nullopt;

        const std::string body = listing.substr(begin, end - begin);
        const auto sep = body.find('>');
        if (sep == std::string::npos) return std::nullopt;

        InstalledPair pair{body.substr(0, sep), body.substr(sep + 1)};
        if (!IsValidIfName(pair.hotspot_if) || !IsValidIfName(pair.uplink_if)) return std::nullopt;
        return pair;
    }

    std::string FormatCheckLine(const std::optional<InstalledPair> &pair)
    {
        if (!pair) return "absent";
        return "installed " + pair->hotspot_if + " " + pair->uplink_if;
    }

    std::optional<InstalledPair> ParseCheckLine(const std::string &line)
    {
        std::istringstream in(line);
        std::string word;
        InstalledPair pair;
        if (!(in >> word) || word != "installed") return std::nullopt;
        if (!(in >> pair.hotspot_if >> pair.uplink_if)) return std::nullopt;
        if (!IsValidIfName(pair.hotspot_if) || !IsValidIfName(pair.uplink_if)) return std::nullopt;
        return pair;
    }
}
