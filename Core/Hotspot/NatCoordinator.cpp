#include "NatCoordinator.hpp"
#include "Errors.hpp"
#include "Core/Logger.hpp"

#include <thread>

namespace
{
    // pkexec: диалог отменён / не авторизован / не удалось исполнить
    constexpr int kPkexecDismissed  = 126;
    constexpr int kPkexecNotAllowed = 127;
}

NatCoordinator::NatCoordinator(NatHelperRunner &runner, const Params &params)
    : runner_(runner)
    , p_(params)
{
    if (p_.remove_retries < 1) p_.remove_retries = 1;
}

std::optional<HotspotError> NatCoordinator::MapOutcome(const HelperOutcome &outcome,
                                                       const NatRuleSet    &rules,
                                                       const char          *step)
{
    const std::string &ifname = rules.hotspot_if;

    if (!outcome.launched)
    {
        return HotspotError(ErrorCode::NatUnavailable, "NAT helper unavailable: " + outcome.error, ifname, step);
    }
    if (outcome.timed_out)
    {
        return HotspotError(ErrorCode::NatApplyFailed, "NAT helper timed out", ifname, step);
    }

    switch (outcome.exit_code)
    {
        case NatRules::kExitOk:
            return std::nullopt;
        case kPkexecDismissed:
        case kPkexecNotAllowed:
            return HotspotError(ErrorCode::NatUnavailable, "NAT helper not authorized", ifname, step);
        case NatRules::kExitNftUnavailable:
            return HotspotError(ErrorCode::NatUnavailable, "nftables unavailable", ifname, step);
        case NatRules::kExitInvalidInterface:
            return HotspotError(ErrorCode::NatApplyFailed,
                                "NAT helper rejected interfaces " + rules.hotspot_if + "/" + rules.uplink_if, ifname, step);
        case NatRules::kExitOtherPair:
            return HotspotError(ErrorCode::NatApplyFailed, "NAT rules belong to another interface pair", ifname, step);
        default:
            break;
    }

    std::string msg = "NAT helper failed with exit code " + std::to_string(outcome.exit_code);
    if (!outcome.error.empty()) msg += " (" + outcome.error + ")";
    return HotspotError(ErrorCode::NatApplyFailed, msg, ifname, step);
}

void NatCoordinator::Apply(const NatRuleSet &rules)
{
    LOGI("nat") << "Apply: " << NatRules::Tag(rules.hotspot_if, rules.uplink_if);
    const HelperOutcome outcome = runner_.Run(NatRules::Action::Apply, rules.hotspot_if, rules.uplink_if, p_.helper_timeout);
    if (auto err = MapOutcome(outcome, rules, "nat-apply"))
    {
        LOGW("nat") << "Apply failed: " << ToString(err->Code()) << ": " << err->what();
        throw *err;
    }
    LOGI("nat") << "Apply: rules installed";
}

void NatCoordinator::Remove(const NatRuleSet &rules)
{
    std::optional<HotspotError> last;
    for (int attempt = 1; attempt <= p_.remove_retries; ++attempt)
    {
        const HelperOutcome outcome = runner_.Run(NatRules::Action::Remove, rules.hotspot_if, rules.uplink_if, p_.helper_timeout);
        last = MapOutcome(outcome, rules, "nat-remove");
        if (!last)
        {
            LOGI("nat") << "Remove: " << NatRules::Tag(rules.hotspot_if, rules.uplink_if) << " removed";
            return;
        }

        LOGW("nat") << "Remove attempt " << attempt << "/" << p_.remove_retries << " failed: " << last->what();
        if (!outcome.launched
            || outcome.exit_code == NatRules::kExitOtherPair
            || outcome.exit_code == NatRules::kExitInvalidInterface)
        {
            break; // повтор не поможет
        }
        if (attempt < p_.remove_retries)
        {
            std::this_thread::sleep_for(p_.retry_delay);
        }
    }
    LOGE("nat") << "Remove: giving up on " << NatRules::Tag(rules.hotspot_if, rules.uplink_if);
    throw *last;
}

NatCheck NatCoordinator::Check(const NatRuleSet &rules)
{
    NatCheck res;
    const HelperOutcome outcome = runner_.Run(NatRules::Action::Check, rules.hotspot_if, rules.uplink_if, p_.helper_timeout);
    if (!outcome.launched || outcome.timed_out)
    {
        return res;
    }

    if (auto pair = NatRules::ParseCheckLine(outcome.output))
    {
        res.installed = NatRuleSet{pair->hotspot_if, pair->uplink_if};
    }

    switch (outcome.exit_code)
    {
        case NatRules::kExitOk:        res.status = NatCheck::Status::Installed; break;
        case NatRules::kExitAbsent:    res.status = NatCheck::Status::Absent;    break;
        case NatRules::kExitOtherPair: res.status = NatCheck::Status::OtherPair; break;
        default:
            LOGD("nat") << "Check: helper exit " << outcome.exit_code;
            res.status = NatCheck::Status::Unknown;
            break;
    }
    return res;
}
