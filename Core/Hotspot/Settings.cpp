#include "Settings.hpp"
#include "Errors.hpp"
#include "Core/Config.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    std::chrono::milliseconds Ms(const boost::json::object &o, std::string_view key, std::chrono::milliseconds def)
    {
        return std::chrono::milliseconds(Config::OptionalInt(o, key, static_cast<int>(def.count())));
    }

    boost::json::array Strings(const std::vector<std::string> &v)
    {
        boost::json::array a;
        for (const std::string &s : v) a.emplace_back(s);
        return a;
    }

    boost::json::object RolesJson(const InterfaceRoles &roles)
    {
        boost::json::object o;
        o["uplink"]  = roles.uplink.name;
        o["hotspot"] = roles.hotspot.name;
        return o;
    }

    const char *EventKindName(HotspotController::EventKind kind)
    {
        switch (kind)
        {
            case HotspotController::EventKind::StateChanged:     return "state";
            case HotspotController::EventKind::NatStatusChanged: return "nat";
            case HotspotController::EventKind::Drift:            return "drift";
            case HotspotController::EventKind::ClientsChanged:   return "clients";
        }
        return "unknown";
    }
}

namespace Settings
{
    HotspotConfig ParseHotspotConfig(const boost::json::object &o)
    {
        HotspotConfig c;
        try
        {
            c.ssid = Config::OptionalString(o, "ssid", c.ssid);
            // ранние версии писали "password"
            c.passphrase = Config::OptionalString(o, "passphrase", Config::OptionalString(o, "password", c.passphrase));

            const std::string band = Config::OptionalString(o, "band", ToString(c.band));
            const std::optional<Band> parsed = ParseBand(band);
            if (!parsed)
            {
                throw HotspotError(ErrorCode::InvalidConfig, "band: must be \"bg\" or \"a\"", {}, "band");
            }
            c.band = *parsed;

            c.channel         = Config::OptionalInt(o, "channel", c.channel);
            c.nat_enabled     = Config::OptionalBool(o, "nat_enabled", c.nat_enabled);
            c.connection_name = Config::OptionalString(o, "connection_name", c.connection_name);
            c.gateway_cidr    = Config::OptionalString(o, "gateway_cidr", Config::OptionalString(o, "gateway_ip", c.gateway_cidr));

            c.hints.hotspot      = Config::OptionalString(o, "hotspot_interface", c.hints.hotspot);
            // в старом формате uplink назывался "internet_interface"
            c.hints.uplink       = Config::OptionalString(o, "uplink_interface",
                                                          Config::OptionalString(o, "internet_interface", c.hints.uplink));
            c.hints.force_uplink = Config::OptionalBool(o, "force_uplink", c.hints.force_uplink);
        }
        catch (const HotspotError &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            throw HotspotError(ErrorCode::InvalidConfig, e.what(), {}, "parse");
        }
        return c;
    }

    HotspotConfig ParseHotspotConfig(const std::string &text)
    {
        boost::json::object o;
        try
        {
            o = Config::ParseObject(text);
        }
        catch (const std::exception &e)
        {
            throw HotspotError(ErrorCode::InvalidConfig, e.what(), {}, "parse");
        }
        return ParseHotspotConfig(o);
    }

    boost::json::object ToJson(const HotspotConfig &c)
    {
        boost::json::object o;
        o["ssid"]              = c.ssid;
        o["passphrase"]        = c.passphrase;
        o["band"]              = ToString(c.band);
        o["channel"]           = c.channel;
        o["nat_enabled"]       = c.nat_enabled;
        o["connection_name"]   = c.connection_name;
        o["gateway_cidr"]      = c.gateway_cidr;
        o["hotspot_interface"] = c.hints.hotspot;
        o["uplink_interface"]  = c.hints.uplink;
        o["force_uplink"]      = c.hints.force_uplink;
        return o;
    }

    HotspotParams ParseParams(const boost::json::object &o)
    {
        HotspotParams p;

        p.controller.op_timeout  = Ms(o, "op_timeout_ms", p.controller.op_timeout);
        p.controller.nat_timeout = Ms(o, "nat_timeout_ms", p.controller.nat_timeout);

        p.nat.helper_timeout = Ms(o, "helper_timeout_ms", p.nat.helper_timeout);
        p.nat.remove_retries = Config::OptionalInt(o, "nat_remove_retries", p.nat.remove_retries);
        p.nat.retry_delay    = Ms(o, "nat_retry_delay_ms", p.nat.retry_delay);

        p.reconciler.interval      = Ms(o, "reconcile_interval_ms", p.reconciler.interval);
        p.reconciler.debounce      = Ms(o, "debounce_ms", p.reconciler.debounce);
        p.reconciler.watch_netlink = Config::OptionalBool(o, "watch_netlink", p.reconciler.watch_netlink);

        p.helper.helper_path = Config::OptionalString(o, "helper_path", p.helper.helper_path);
        p.helper.pkexec_path = Config::OptionalString(o, "pkexec_path", p.helper.pkexec_path);

        p.log.directory  = Config::OptionalString(o, "log_dir", p.log.directory);
        p.log.to_file    = Config::OptionalBool(o, "log_to_file", p.log.to_file);
        p.log.to_console = Config::OptionalBool(o, "log_to_console", p.log.to_console);

        if (p.controller.op_timeout.count() <= 0 || p.nat.helper_timeout.count() <= 0)
        {
            throw std::runtime_error("config: timeouts must be positive");
        }
        return p;
    }

    boost::json::object ToJson(const HotspotSession &s)
    {
        boost::json::object o;
        o["id"]         = s.id;
        o["state"]      = ToString(s.state);
        o["ssid"]       = s.config.ssid;
        o["band"]       = ToString(s.config.band);
        o["channel"]    = s.config.channel;
        o["roles"]      = RolesJson(s.roles);
        o["nat"]        = ToString(s.nat);
        o["started_at"] = std::chrono::duration_cast<std::chrono::seconds>(s.started_at.time_since_epoch()).count();
        o["clients"]    = Strings(s.clients);
        if (!s.failure.empty()) o["failure"] = s.failure;
        return o;
    }

    boost::json::object ToJson(const HotspotController::Event &ev)
    {
        boost::json::object o;
        o["event"] = EventKindName(ev.kind);
        o["from"]  = ToString(ev.from);
        o["state"] = ToString(ev.to);
        o["nat"]   = ToString(ev.nat);
        if (ev.code != ErrorCode::Ok)
        {
            boost::json::object err;
            err["code"]      = ToString(ev.code);
            err["interface"] = ev.ifname;
            err["step"]      = ev.step;
            err["message"]   = ev.message;
            o["error"] = std::move(err);
        }
        if (ev.drift)
        {
            o["drift"] = ToString(ev.drift->kind);
        }
        if (ev.kind == HotspotController::EventKind::ClientsChanged)
        {
            o["clients"] = Strings(ev.clients);
        }
        return o;
    }

    boost::json::object ToJson(const Result &r)
    {
        boost::json::object o;
        o["code"]    = ToString(r.code);
        o["message"] = r.message;
        if (!r.ifname.empty()) o["interface"] = r.ifname;
        if (!r.step.empty())   o["step"]      = r.step;
        return o;
    }

    std::string DefaultConfigPath()
    {
        fs::path base;
        if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        {
            base = xdg;
        }
        else if (const char *home = std::getenv("HOME"); home && *home)
        {
            base = fs::path(home) / ".config";
        }
        else
        {
            base = ".";
        }
        return (base / "hotspot-forge" / "config.json").string();
    }

    HotspotConfig LoadHotspotConfig(const std::string &path)
    {
        std::ifstream in(path);
        if (!in)
        {
            LOGI("settings") << "No config at " << path << ", using defaults";
            return HotspotConfig{};
        }

        std::stringstream ss;
        ss << in.rdbuf();
        try
        {
            return ParseHotspotConfig(ss.str());
        }
        catch (const HotspotError &e)
        {
            LOGW("settings") << "Ignoring invalid config " << path << ": " << e.what();
            return HotspotConfig{};
        }
    }

    void SaveHotspotConfig(const std::string &path, const HotspotConfig &config)
    {
        const fs::path target(path);
        std::error_code ec;
        if (target.has_parent_path())
        {
            fs::create_directories(target.parent_path(), ec);
            if (ec)
            {
                throw std::runtime_error("cannot create " + target.parent_path().string() + ": " + ec.message());
            }
        }

        const fs::path tmp = target.string() + ".tmp";
        const std::string text = boost::json::serialize(ToJson(config)) + "\n";
        {
            // пароль внутри: файл сразу создаётся только для владельца
            if (::unlink(tmp.c_str()) != 0 && errno != ENOENT)
            {
                throw std::runtime_error("cannot remove stale " + tmp.string() + ": " + std::strerror(errno));
            }
            const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
            if (fd < 0)
            {
                throw std::runtime_error("cannot write " + tmp.string() + ": " + std::strerror(errno));
            }
            std::size_t off = 0;
            while (off < text.size())
            {
                const ssize_t n = ::write(fd, text.data() + off, text.size() - off);
                if (n < 0 && errno == EINTR) continue;
                if (n <= 0)
                {
                    const int err = errno;
                    ::close(fd);
                    ::unlink(tmp.c_str());
                    throw std::runtime_error("write failed: " + tmp.string() + ": " + std::strerror(err));
                }
                off += static_cast<std::size_t>(n);
            }
            ::close(fd);
        }

        fs::rename(tmp, target, ec);
        if (ec)
        {
            throw std::runtime_error("cannot replace " + path + ": " + ec.message());
        }
        LOGI("settings") << "Saved config to " << path;
    }
}
