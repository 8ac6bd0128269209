#include "Core/Helper/NatActions.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <utility>

namespace
{
    using NatRules::InstalledPair;

    const InstalledPair kOurs{"wlan1", "wlan0"};
    const InstalledPair kForeign{"wlan1", "wlan9"};

    // Вывод "nft list table" для таблицы с правилами пары
    std::string Listing(const char *family, const char *table, const std::optional<InstalledPair> &pair)
    {
        std::string s = std::string("table ") + family + " " + table + " {\n\tchain c {\n";
        if (pair)
        {
            s += "\t\tiifname \"" + pair->hotspot_if + "\" oifname \"" + pair->uplink_if +
                 "\" accept comment \"" + NatRules::Tag(pair->hotspot_if, pair->uplink_if) + "\"\n";
        }
        s += "\t}\n}\n";
        return s;
    }

    class FakeSystem : public NatActions::System
    {
    public:
        void Seed(const std::optional<InstalledPair> &nat, const std::optional<InstalledPair> &fw)
        {
            nat_ = Listing("ip", NatRules::kNatTable, nat);
            fw_  = Listing("inet", NatRules::kFwTable, fw);
        }

        bool Run(const std::string &commands) override
        {
            output_.clear();
            error_.clear();

            if (commands == NatRules::BuildListCommand("ip", NatRules::kNatTable)) return List(nat_);
            if (commands == NatRules::BuildListCommand("inet", NatRules::kFwTable)) return List(fw_);

            if (commands == NatRules::BuildRemoveScript())
            {
                ++remove_runs;
                if (fail_batches) return Fail();
                nat_.reset();
                fw_.reset();
                return true;
            }

            ++apply_runs;
            if (fail_batches) return Fail();
            const auto pair = NatRules::ParseInstalledPair(commands);
            Seed(pair, pair);
            return true;
        }

        const std::string &LastOutput() const override { return output_; }
        const std::string &LastError() const override { return error_; }

        bool InterfaceExists(const std::string &name) override { return interfaces.count(name) != 0; }

        std::optional<std::string> ReadForwarding() override { return forwarding; }

        bool WriteForwarding(const std::string &value) override
        {
            forwarding = value;
            return true;
        }

        std::optional<std::string> LoadSavedForwarding() override { return saved; }

        bool SaveForwarding(const std::string &value) override
        {
            saved = value;
            return true;
        }

        void ClearSavedForwarding() override { saved.reset(); }

        void DropFw() { fw_.reset(); }

        bool HasNat() const { return nat_.has_value(); }
        bool HasFw() const { return fw_.has_value(); }

        std::set<std::string>      interfaces = {"wlan0", "wlan1", "wlan9"};
        std::string                forwarding = "0";
        std::optional<std::string> saved;
        bool                       fail_batches = false;
        int                        apply_runs   = 0;
        int                        remove_runs  = 0;

    private:
        bool List(const std::optional<std::string> &table)
        {
            if (!table)
            {
                error_ = "Error: No such file or directory";
                return false;
            }
            output_ = *table;
            return true;
        }

        bool Fail()
        {
            error_ = "Error: Could not process rule: Operation not supported";
            return false;
        }

        std::optional<std::string> nat_;
        std::optional<std::string> fw_;
        std::string                output_;
        std::string                error_;
    };

    std::pair<int, std::string> RunCheck(FakeSystem &sys)
    {
        std::ostringstream out;
        const int code = NatActions::Execute(NatRules::Action::Check, sys, kOurs, out);
        return {code, out.str()};
    }
}

TEST(NatActions, ApplyInstallsBothTablesAndEnablesForwarding)
{
    FakeSystem sys;
    EXPECT_EQ(NatActions::Apply(sys, kOurs), NatRules::kExitOk);

    const NatActions::Installed now = NatActions::ReadInstalled(sys);
    ASSERT_TRUE(now.nat.pair);
    ASSERT_TRUE(now.fw.pair);
    EXPECT_EQ(*now.nat.pair, kOurs);
    EXPECT_EQ(*now.fw.pair, kOurs);
    EXPECT_EQ(sys.forwarding, "1");
    EXPECT_EQ(sys.saved, "0");
}

TEST(NatActions, ApplyRejectsMissingInterface)
{
    FakeSystem sys;
    sys.interfaces.erase("wlan0");

    EXPECT_EQ(NatActions::Apply(sys, kOurs), NatRules::kExitInvalidInterface);
    EXPECT_EQ(sys.apply_runs, 0);
    EXPECT_EQ(sys.forwarding, "0");
    EXPECT_FALSE(sys.saved);
}

TEST(NatActions, ApplyReplacesStalePairAndKeepsFirstSavedForwarding)
{
    FakeSystem sys;
    sys.Seed(kForeign, kForeign);
    sys.forwarding = "1";
    sys.saved      = "0";

    EXPECT_EQ(NatActions::Apply(sys, kOurs), NatRules::kExitOk);
    EXPECT_EQ(*NatActions::ReadInstalled(sys).nat.pair, kOurs);
    EXPECT_EQ(sys.saved, "0");
}

TEST(NatActions, FailedApplyOnCleanSystemRestoresForwarding)
{
    FakeSystem sys;
    sys.fail_batches = true;

    EXPECT_EQ(NatActions::Apply(sys, kOurs), NatRules::kExitNftFailed);
    EXPECT_FALSE(sys.HasNat());
    EXPECT_EQ(sys.forwarding, "0");
    EXPECT_FALSE(sys.saved);
}

TEST(NatActions, FailedApplyOverWorkingRulesKeepsForwarding)
{
    FakeSystem sys;
    sys.Seed(kOurs, kOurs);
    sys.forwarding   = "1";
    sys.saved        = "0";
    sys.fail_batches = true;

    EXPECT_EQ(NatActions::Apply(sys, kOurs), NatRules::kExitNftFailed);
    EXPECT_TRUE(sys.HasNat());
    EXPECT_EQ(sys.forwarding, "1");
    EXPECT_EQ(sys.saved, "0");
}

TEST(NatActions, RemoveOwnPairRestoresForwarding)
{
    FakeSystem sys;
    ASSERT_EQ(NatActions::Apply(sys, kOurs), NatRules::kExitOk);

    EXPECT_EQ(NatActions::Remove(sys, kOurs), NatRules::kExitOk);
    EXPECT_FALSE(sys.HasNat());
    EXPECT_FALSE(sys.HasFw());
    EXPECT_EQ(sys.forwarding, "0");
    EXPECT_FALSE(sys.saved);
}

TEST(NatActions, RemoveWithNothingInstalledSucceeds)
{
    FakeSystem sys;
    EXPECT_EQ(NatActions::Remove(sys, kOurs), NatRules::kExitOk);
    EXPECT_EQ(sys.remove_runs, 0);
}

TEST(NatActions, RemoveRefusesForeignPair)
{
    FakeSystem sys;
    sys.Seed(kForeign, kForeign);

    EXPECT_EQ(NatActions::Remove(sys, kOurs), NatRules::kExitOtherPair);
    EXPECT_EQ(sys.remove_runs, 0);
    EXPECT_TRUE(sys.HasNat());
    EXPECT_TRUE(sys.HasFw());
}

TEST(NatActions, RemoveRefusesWhenAnyTableHoldsAnotherPair)
{
    // nat-таблица наша, forward-таблица чужая: не трогаем ни одну
    FakeSystem sys;
    sys.Seed(kOurs, kForeign);

    EXPECT_EQ(NatActions::Remove(sys, kOurs), NatRules::kExitOtherPair);
    EXPECT_EQ(sys.remove_runs, 0);
    EXPECT_TRUE(sys.HasNat());
    EXPECT_TRUE(sys.HasFw());

    sys.Seed(kForeign, kOurs);
    EXPECT_EQ(NatActions::Remove(sys, kOurs), NatRules::kExitOtherPair);
    EXPECT_TRUE(sys.HasFw());
}

TEST(NatActions, RemoveRefusesUntaggedTable)
{
    FakeSystem sys;
    sys.Seed(std::nullopt, kOurs);

    EXPECT_EQ(NatActions::Remove(sys, kOurs), NatRules::kExitOtherPair);
    EXPECT_TRUE(sys.HasNat());
}

TEST(NatActions, RemoveBatchFailureKeepsSavedForwarding)
{
    FakeSystem sys;
    ASSERT_EQ(NatActions::Apply(sys, kOurs), NatRules::kExitOk);
    sys.fail_batches = true;

    EXPECT_EQ(NatActions::Remove(sys, kOurs), NatRules::kExitNftFailed);
    EXPECT_EQ(sys.forwarding, "1");
    EXPECT_EQ(sys.saved, "0");
}

TEST(NatActions, CheckExitCodesAndReportedPair)
{
    FakeSystem sys;
    EXPECT_EQ(RunCheck(sys), (std::pair<int, std::string>{NatRules::kExitAbsent, "absent\n"}));

    sys.Seed(kOurs, kOurs);
    EXPECT_EQ(RunCheck(sys), (std::pair<int, std::string>{NatRules::kExitOk, "installed wlan1 wlan0\n"}));

    // чужая пара попадает в строку, даже если вторая таблица наша
    sys.Seed(kOurs, kForeign);
    EXPECT_EQ(RunCheck(sys), (std::pair<int, std::string>{NatRules::kExitOtherPair, "installed wlan1 wlan9\n"}));

    EXPECT_EQ(sys.apply_runs, 0);
    EXPECT_EQ(sys.remove_runs, 0);
}

TEST(NatActions, CheckReportsPartialPair)
{
    // осталась только nat-таблица
    FakeSystem sys;
    sys.Seed(kOurs, kOurs);
    sys.DropFw();

    EXPECT_EQ(RunCheck(sys), (std::pair<int, std::string>{NatRules::kExitOtherPair, "installed wlan1 wlan0\n"}));
}
