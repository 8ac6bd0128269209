#include "Types.hpp"
#include "Errors.hpp"

#include <cctype>
#include <string>

namespace
{
    bool IsHex(const std::string &s)
    {
        for (unsigned char c : s)
        {
            if (!std::isxdigit(c)) return false;
        }
        return true;
    }

    bool IsPrintableAscii(const std::string &s)
    {
        for (unsigned char c : s)
        {
            if (c < 0x20 || c > 0x7e) return false;
        }
        return true;
    }

    // a.b.c.d/nn
    bool IsCidrV4(const std::string &cidr)
    {
        const auto slash = cidr.find('/');
        if (slash == std::string::npos) return false;

        const std::string addr   = cidr.substr(0, slash);
        const std::string prefix = cidr.substr(slash + 1);
        if (prefix.empty() || prefix.size() > 2) return false;
        for (unsigned char c : prefix)
        {
            if (!std::isdigit(c)) return false;
        }
        const int plen = std::stoi(prefix);
        if (plen < 1 || plen > 30) return false;

        int octets = 0;
        std::size_t pos = 0;
        while (pos <= addr.size())
        {
            const auto dot = addr.find('.', pos);
            const std::string part = addr.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
            if (part.empty() || part.size() > 3) return false;
            for (unsigned char c : part)
            {
                if (!std::isdigit(c)) return false;
            }
            if (std::stoi(part) > 255) return false;
            ++octets;
            if (dot == std::string::npos) break;
            pos = dot + 1;
        }
        return octets == 4;
    }

    [[noreturn]] void Invalid(const std::string &field, const std::string &why)
    {
        throw HotspotError(ErrorCode::InvalidConfig, field + ": " + why, {}, field);
    }
}

void ValidateConfig(const HotspotConfig &config)
{
    if (config.ssid.empty() || config.ssid.size() > 32)
    {
        Invalid("ssid", "must be 1-32 bytes");
    }

    const std::string &psk = config.passphrase;
    const bool hex_key = psk.size() == 64 && IsHex(psk);
    if (!hex_key && (psk.size() < 8 || psk.size() > 63 || !IsPrintableAscii(psk)))
    {
        Invalid("passphrase", "must be 8-63 printable ASCII characters or 64 hex digits");
    }

    if (config.channel < 0)
    {
        Invalid("channel", "must be 0 (auto) or a positive channel number");
    }
    if (config.channel > 0)
    {
        const bool bg_ok = config.channel >= 1 && config.channel <= 14;
        const bool a_ok  = config.channel >= 32 && config.channel <= 177;
        if ((config.band == Band::Bg && !bg_ok) || (config.band == Band::A && !a_ok))
        {
            Invalid("channel", "channel " + std::to_string(config.channel) + " is not valid for band " + ToString(config.band));
        }
    }

    if (config.connection_name.empty())
    {
        Invalid("connection_name", "must not be empty");
    }
    if (!IsCidrV4(config.gateway_cidr))
    {
        Invalid("gateway_cidr", "must look like 192.168.44.1/24");
    }
}

NatRuleSet NatRuleSet::From(const InterfaceRoles &roles)
{
    return NatRuleSet{roles.hotspot.name, roles.uplink.name};
}

const char *ToString(LinkState state)
{
    switch (state)
    {
        case LinkState::Down:       return "down";
        case LinkState::Connecting: return "connecting";
        case LinkState::Connected:  return "connected";
        case LinkState::ApActive:   return "ap-active";
    }
    return "unknown";
}

const char *ToString(HotspotState state)
{
    switch (state)
    {
        case HotspotState::Idle:     return "idle";
        case HotspotState::Starting: return "starting";
        case HotspotState::Active:   return "active";
        case HotspotState::Stopping: return "stopping";
        case HotspotState::Failed:   return "failed";
    }
    return "unknown";
}

const char *ToString(NatStatus status)
{
    switch (status)
    {
        case NatStatus::Disabled:    return "disabled";
        case NatStatus::Pending:     return "pending";
        case NatStatus::Installed:   return "installed";
        case NatStatus::Unavailable: return "unavailable";
        case NatStatus::Failed:      return "failed";
        case NatStatus::Removed:     return "removed";
    }
    return "unknown";
}

const char *ToString(Band band)
{
    return band == Band::A ? "a" : "bg";
}

const char *ToString(DriftKind kind)
{
    switch (kind)
    {
        case DriftKind::InterfaceLost:   return "interface-lost";
        case DriftKind::AccessPointDown: return "access-point-down";
        case DriftKind::NatMismatch:     return "nat-mismatch";
    }
    return "unknown";
}

std::optional<Band> ParseBand(const std::string &text)
{
    if (text == "bg") return Band::Bg;
    if (text == "a")  return Band::A;
    return std::nullopt;
}
