#include "Core/Config.hpp"
#include "Core/Hotspot/Settings.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    ErrorCode ParseError(const std::string &json)
    {
        try
        {
            Settings::ParseHotspotConfig(json);
        }
        catch (const HotspotError &e)
        {
            return e.Code();
        }
        return ErrorCode::Ok;
    }

    class TempDir
    {
    public:
        TempDir()
            : path_(fs::temp_directory_path() / ("hotspot-test-" + std::to_string(::getpid())))
        {
            fs::remove_all(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }

        const fs::path &Path() const { return path_; }

    private:
        fs::path path_;
    };
}

TEST(Config, TypedGetters)
{
    const auto o = Config::ParseObject(R"({"name":"x","n":5,"flag":true,"nothing":null})");
    EXPECT_EQ(Config::RequireString(o, "name"), "x");
    EXPECT_EQ(Config::RequireInt(o, "n"), 5);
    EXPECT_TRUE(Config::RequireBool(o, "flag"));

    EXPECT_EQ(Config::OptionalString(o, "missing", "def"), "def");
    EXPECT_EQ(Config::OptionalInt(o, "nothing", 7), 7);

    EXPECT_THROW(Config::RequireString(o, "n"), std::runtime_error);
    EXPECT_THROW(Config::RequireInt(o, "missing"), std::runtime_error);
    EXPECT_THROW(Config::OptionalBool(o, "name", false), std::runtime_error);
    EXPECT_THROW(Config::ParseObject("[1,2]"), std::runtime_error);
    EXPECT_THROW(Config::ParseObject("{"), std::runtime_error);
}

TEST(Settings, EmptyObjectGivesDefaults)
{
    const HotspotConfig c = Settings::ParseHotspotConfig(std::string("{}"));
    const HotspotConfig d;
    EXPECT_EQ(c.ssid, d.ssid);
    EXPECT_EQ(c.passphrase, d.passphrase);
    EXPECT_EQ(c.band, Band::Bg);
    EXPECT_EQ(c.channel, 0);
    EXPECT_TRUE(c.nat_enabled);
    EXPECT_EQ(c.connection_name, "HotspotForge");
    EXPECT_EQ(c.gateway_cidr, "192.168.44.1/24");
}

TEST(Settings, ParsesAllFields)
{
    const HotspotConfig c = Settings::ParseHotspotConfig(std::string(R"({
        "ssid": "Home", "passphrase": "12345678", "band": "a", "channel": 36,
        "nat_enabled": false, "connection_name": "Cafe", "gateway_cidr": "10.0.0.1/24",
        "hotspot_interface": "wlan1", "uplink_interface": "wlan0", "force_uplink": true
    })"));
    EXPECT_EQ(c.ssid, "Home");
    EXPECT_EQ(c.passphrase, "12345678");
    EXPECT_EQ(c.band, Band::A);
    EXPECT_EQ(c.channel, 36);
    EXPECT_FALSE(c.nat_enabled);
    EXPECT_EQ(c.connection_name, "Cafe");
    EXPECT_EQ(c.gateway_cidr, "10.0.0.1/24");
    EXPECT_EQ(c.hints.hotspot, "wlan1");
    EXPECT_EQ(c.hints.uplink, "wlan0");
    EXPECT_TRUE(c.hints.force_uplink);
}

TEST(Settings, AcceptsLegacyKeys)
{
    const HotspotConfig c = Settings::ParseHotspotConfig(std::string(R"({"password":"oldsecret","gateway_ip":"10.1.1.1/24"})"));
    EXPECT_EQ(c.passphrase, "oldsecret");
    EXPECT_EQ(c.gateway_cidr, "10.1.1.1/24");

    const HotspotConfig migrated = Settings::ParseHotspotConfig(std::string(R"({"internet_interface":"enp3s0"})"));
    EXPECT_EQ(migrated.hints.uplink, "enp3s0");

    // новое имя ключа важнее старого
    const HotspotConfig both = Settings::ParseHotspotConfig(
        std::string(R"({"internet_interface":"enp3s0","uplink_interface":"wlan0"})"));
    EXPECT_EQ(both.hints.uplink, "wlan0");
}

TEST(Settings, RejectsMalformedConfig)
{
    EXPECT_EQ(ParseError("not json"), ErrorCode::InvalidConfig);
    EXPECT_EQ(ParseError(R"({"band":"6ghz"})"), ErrorCode::InvalidConfig);
    EXPECT_EQ(ParseError(R"({"channel":"six"})"), ErrorCode::InvalidConfig);
    EXPECT_EQ(ParseError(R"({"nat_enabled":1})"), ErrorCode::InvalidConfig);
}

TEST(Settings, Params)
{
    const HotspotParams p = Settings::ParseParams(Config::ParseObject(R"({
        "op_timeout_ms": 1000, "helper_timeout_ms": 2000, "nat_remove_retries": 5,
        "reconcile_interval_ms": 750, "watch_netlink": false,
        "helper_path": "/opt/hotspot/helper", "log_to_file": false
    })"));
    EXPECT_EQ(p.controller.op_timeout, std::chrono::milliseconds(1000));
    EXPECT_EQ(p.nat.helper_timeout, std::chrono::milliseconds(2000));
    EXPECT_EQ(p.nat.remove_retries, 5);
    EXPECT_EQ(p.reconciler.interval, std::chrono::milliseconds(750));
    EXPECT_FALSE(p.reconciler.watch_netlink);
    EXPECT_EQ(p.helper.helper_path, "/opt/hotspot/helper");
    EXPECT_EQ(p.helper.pkexec_path, "/usr/bin/pkexec");
    EXPECT_FALSE(p.log.to_file);

    EXPECT_THROW(Settings::ParseParams(Config::ParseObject(R"({"op_timeout_ms": 0})")), std::runtime_error);
}

TEST(Settings, SessionJsonOmitsPassphrase)
{
    HotspotSession s;
    s.id                 = 3;
    s.config.ssid        = "Home";
    s.config.passphrase  = "supersecret";
    s.roles.uplink.name  = "wlan0";
    s.roles.hotspot.name = "wlan1";
    s.state              = HotspotState::Active;
    s.nat                = NatStatus::Installed;
    s.clients            = {"192.168.44.23"};

    const std::string json = boost::json::serialize(Settings::ToJson(s));
    EXPECT_EQ(json.find("supersecret"), std::string::npos);

    const boost::json::object o = Settings::ToJson(s);
    EXPECT_EQ(o.at("state").as_string(), "active");
    EXPECT_EQ(o.at("nat").as_string(), "installed");
    EXPECT_EQ(o.at("roles").as_object().at("hotspot").as_string(), "wlan1");
    EXPECT_EQ(o.at("clients").as_array().size(), 1u);
}

TEST(Settings, EventJsonCarriesError)
{
    HotspotController::Event ev;
    ev.kind    = HotspotController::EventKind::StateChanged;
    ev.from    = HotspotState::Active;
    ev.to      = HotspotState::Failed;
    ev.code    = ErrorCode::Drift;
    ev.ifname  = "wlan1";
    ev.step    = "reconcile";
    ev.message = "hotspot interface lost";

    const boost::json::object o = Settings::ToJson(ev);
    EXPECT_EQ(o.at("event").as_string(), "state");
    EXPECT_EQ(o.at("from").as_string(), "active");
    EXPECT_EQ(o.at("state").as_string(), "failed");
    const auto &err = o.at("error").as_object();
    EXPECT_EQ(err.at("code").as_string(), "Drift");
    EXPECT_EQ(err.at("interface").as_string(), "wlan1");
    EXPECT_EQ(err.at("message").as_string(), "hotspot interface lost");
}

TEST(Settings, SaveThenLoad)
{
    TempDir dir;
    const std::string path = (dir.Path() / "nested" / "config.json").string();

    HotspotConfig c;
    c.ssid          = "Cafe";
    c.passphrase    = "0123456789";
    c.band          = Band::A;
    c.channel       = 44;
    c.hints.hotspot = "wlan2";
    Settings::SaveHotspotConfig(path, c);

    const auto perms = fs::status(path).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);

    const HotspotConfig loaded = Settings::LoadHotspotConfig(path);
    EXPECT_EQ(loaded.ssid, "Cafe");
    EXPECT_EQ(loaded.passphrase, "0123456789");
    EXPECT_EQ(loaded.band, Band::A);
    EXPECT_EQ(loaded.channel, 44);
    EXPECT_EQ(loaded.hints.hotspot, "wlan2");
}

TEST(Settings, SavedFileIsOwnerOnlyFromCreation)
{
    TempDir dir;
    fs::create_directories(dir.Path());
    const fs::path path = dir.Path() / "config.json";

    // оставшийся от прерванной записи tmp с широкими правами
    const fs::path stale = path.string() + ".tmp";
    std::ofstream(stale) << "{}";
    fs::permissions(stale, fs::perms::all);

    const mode_t old_mask = ::umask(0);
    HotspotConfig c;
    c.passphrase = "0123456789";
    Settings::SaveHotspotConfig(path.string(), c);
    ::umask(old_mask);

    EXPECT_EQ(fs::status(path).permissions(), fs::perms::owner_read | fs::perms::owner_write);
    EXPECT_FALSE(fs::exists(stale));
    EXPECT_EQ(Settings::LoadHotspotConfig(path.string()).passphrase, "0123456789");
}

TEST(Settings, LoadFallsBackToDefaults)
{
    TempDir dir;
    EXPECT_EQ(Settings::LoadHotspotConfig((dir.Path() / "missing.json").string()).ssid, HotspotConfig{}.ssid);

    fs::create_directories(dir.Path());
    const fs::path broken = dir.Path() / "broken.json";
    std::ofstream(broken) << "{ ssid: ";
    EXPECT_EQ(Settings::LoadHotspotConfig(broken.string()).ssid, HotspotConfig{}.ssid);
}
