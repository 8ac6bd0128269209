#include "Fakes.hpp"
#include "Core/Hotspot/NatCoordinator.hpp"

#include <gtest/gtest.h>

namespace
{
    const NatRuleSet kRules{"wlan1", "wlan0"};

    NatCoordinator::Params Fast()
    {
        NatCoordinator::Params p;
        p.helper_timeout = std::chrono::milliseconds(1000);
        p.remove_retries = 3;
        p.retry_delay    = std::chrono::milliseconds(1);
        return p;
    }

    ErrorCode Mapped(const HelperOutcome &o)
    {
        const auto err = NatCoordinator::MapOutcome(o, kRules, "nat-apply");
        return err ? err->Code() : ErrorCode::Ok;
    }
}

TEST(NatCoordinator, MapsHelperOutcomes)
{
    HelperOutcome not_launched;
    not_launched.error = "pkexec not found";
    EXPECT_EQ(Mapped(not_launched), ErrorCode::NatUnavailable);

    HelperOutcome timed_out = Fakes::Exited(-1);
    timed_out.timed_out = true;
    EXPECT_EQ(Mapped(timed_out), ErrorCode::NatApplyFailed);

    EXPECT_EQ(Mapped(Fakes::Exited(NatRules::kExitOk)), ErrorCode::Ok);
    EXPECT_EQ(Mapped(Fakes::Exited(126)), ErrorCode::NatUnavailable);
    EXPECT_EQ(Mapped(Fakes::Exited(127)), ErrorCode::NatUnavailable);
    EXPECT_EQ(Mapped(Fakes::Exited(NatRules::kExitNftUnavailable)), ErrorCode::NatUnavailable);
    EXPECT_EQ(Mapped(Fakes::Exited(NatRules::kExitNftFailed)), ErrorCode::NatApplyFailed);
    EXPECT_EQ(Mapped(Fakes::Exited(NatRules::kExitInvalidInterface)), ErrorCode::NatApplyFailed);
    EXPECT_EQ(Mapped(Fakes::Exited(NatRules::kExitUsage)), ErrorCode::NatApplyFailed);

    const auto err = NatCoordinator::MapOutcome(Fakes::Exited(NatRules::kExitNftFailed), kRules, "nat-apply");
    ASSERT_TRUE(err);
    EXPECT_EQ(err->Interface(), "wlan1");
    EXPECT_EQ(err->Step(), "nat-apply");
}

TEST(NatCoordinator, ApplyInstallsRequestedPair)
{
    Fakes::FakeNatRunner runner;
    NatCoordinator nat(runner, Fast());

    nat.Apply(kRules);
    const auto installed = runner.Installed();
    ASSERT_TRUE(installed);
    EXPECT_EQ(installed->hotspot_if, "wlan1");
    EXPECT_EQ(installed->uplink_if, "wlan0");
}

TEST(NatCoordinator, ApplyUnauthorizedThrowsNatUnavailable)
{
    Fakes::FakeNatRunner runner;
    runner.Deny(126);
    NatCoordinator nat(runner, Fast());

    try
    {
        nat.Apply(kRules);
        FAIL() << "Apply must throw";
    }
    catch (const HotspotError &e)
    {
        EXPECT_EQ(e.Code(), ErrorCode::NatUnavailable);
    }
    EXPECT_FALSE(runner.Installed());
}

TEST(NatCoordinator, RemoveRetriesTransientFailures)
{
    Fakes::FakeNatRunner runner;
    runner.Install(NatRules::InstalledPair{"wlan1", "wlan0"});
    runner.FailRemoves(2);
    NatCoordinator nat(runner, Fast());

    EXPECT_NO_THROW(nat.Remove(kRules));
    EXPECT_EQ(runner.Calls(NatRules::Action::Remove), 3);
    EXPECT_FALSE(runner.Installed());
}

TEST(NatCoordinator, RemoveGivesUpAfterRetries)
{
    Fakes::ScriptedRunner runner({Fakes::Exited(NatRules::kExitNftFailed)});
    NatCoordinator nat(runner, Fast());

    try
    {
        nat.Remove(kRules);
        FAIL() << "Remove must throw";
    }
    catch (const HotspotError &e)
    {
        EXPECT_EQ(e.Code(), ErrorCode::NatApplyFailed);
        EXPECT_EQ(e.Step(), "nat-remove");
    }
    EXPECT_EQ(runner.calls, 3);
}

TEST(NatCoordinator, RemoveDoesNotRetryWhenRetryCannotHelp)
{
    Fakes::ScriptedRunner unavailable({HelperOutcome{}});
    NatCoordinator a(unavailable, Fast());
    EXPECT_THROW(a.Remove(kRules), HotspotError);
    EXPECT_EQ(unavailable.calls, 1);

    Fakes::ScriptedRunner other({Fakes::Exited(NatRules::kExitOtherPair)});
    NatCoordinator b(other, Fast());
    EXPECT_THROW(b.Remove(kRules), HotspotError);
    EXPECT_EQ(other.calls, 1);
}

TEST(NatCoordinator, RemoveWhenNothingInstalledSucceeds)
{
    Fakes::FakeNatRunner runner;
    NatCoordinator nat(runner, Fast());
    EXPECT_NO_THROW(nat.Remove(kRules));
}

TEST(NatCoordinator, Check)
{
    Fakes::FakeNatRunner runner;
    NatCoordinator nat(runner, Fast());

    EXPECT_EQ(nat.Check(kRules).status, NatCheck::Status::Absent);

    runner.Install(NatRules::InstalledPair{"wlan1", "wlan0"});
    auto check = nat.Check(kRules);
    EXPECT_EQ(check.status, NatCheck::Status::Installed);
    ASSERT_TRUE(check.installed);
    EXPECT_EQ(*check.installed, kRules);

    runner.Install(NatRules::InstalledPair{"wlan2", "wlan0"});
    check = nat.Check(kRules);
    EXPECT_EQ(check.status, NatCheck::Status::OtherPair);
    ASSERT_TRUE(check.installed);
    EXPECT_EQ(check.installed->hotspot_if, "wlan2");

    runner.SetLaunchable(false);
    EXPECT_EQ(nat.Check(kRules).status, NatCheck::Status::Unknown);
}
