#include "NmPlatform.hpp"
#include "Errors.hpp"
#include "LinkProbe.hpp"
#include "Core/Logger.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <arpa/inet.h>
#include <sys/socket.h>

#include <systemd/sd-bus.h>

namespace
{
    constexpr const char *kNmService   = "org.freedesktop.NetworkManager";
    constexpr const char *kNmPath      = "/org/freedesktop/NetworkManager";
    constexpr const char *kNmIface     = "org.freedesktop.NetworkManager";
    constexpr const char *kDeviceIface = "org.freedesktop.NetworkManager.Device";
    constexpr const char *kWifiIface   = "org.freedesktop.NetworkManager.Device.Wireless";
    constexpr const char *kActiveIface = "org.freedesktop.NetworkManager.Connection.Active";

    // NMDeviceType
    constexpr std::uint32_t kDeviceTypeWifi     = 2;
    constexpr std::uint32_t kDeviceTypeLoopback = 32;
    // NM80211Mode
    constexpr std::uint32_t kWifiModeAp = 3;
    // NMActiveConnectionState
    constexpr std::uint32_t kAcActivated    = 2;
    constexpr std::uint32_t kAcDeactivating = 3;
    constexpr std::uint32_t kAcDeactivated  = 4;

    std::string Errno(int rc)
    {
        return std::strerror(-rc);
    }

    struct Bus
    {
        sd_bus *b {nullptr};
        Bus()
        {
            int rc = sd_bus_open_system(&b);
            if (rc < 0)
            {
                throw HotspotError(ErrorCode::PlatformQueryError, "sd_bus_open_system: " + Errno(rc), {}, "dbus");
            }
        }
        ~Bus() { if (b) sd_bus_flush_close_unref(b); }
        Bus(const Bus&)            = delete;
        Bus& operator=(const Bus&) = delete;
    };

    struct Msg
    {
        sd_bus_message *m {nullptr};
        ~Msg() { if (m) sd_bus_message_unref(m); }
    };

    struct BusError
    {
        sd_bus_error e = SD_BUS_ERROR_NULL;
        ~BusError() { sd_bus_error_free(&e); }

        std::string Text(int rc) const
        {
            return e.message ? std::string(e.message) : Errno(rc);
        }
    };

    // ---------- чтение свойств ----------

    std::string GetString(Bus &bus, const std::string &path, const char *iface, const char *prop)
    {
        BusError err;
        char *val = nullptr;
        int rc = sd_bus_get_property_string(bus.b, kNmService, path.c_str(), iface, prop, &err.e, &val);
        if (rc < 0)
        {
            throw HotspotError(ErrorCode::PlatformQueryError,
                               std::string("read ") + prop + ": " + err.Text(rc), {}, "dbus");
        }
        std::string out = val ? val : "";
        std::free(val);
        return out;
    }

    std::uint32_t GetU32(Bus &bus, const std::string &path, const char *iface, const char *prop)
    {
        BusError err;
        std::uint32_t val = 0;
        int rc = sd_bus_get_property_trivial(bus.b, kNmService, path.c_str(), iface, prop, &err.e, 'u', &val);
        if (rc < 0)
        {
            throw HotspotError(ErrorCode::PlatformQueryError,
                               std::string("read ") + prop + ": " + err.Text(rc), {}, "dbus");
        }
        return val;
    }

    std::string GetObjectPath(Bus &bus, const std::string &path, const char *iface, const char *prop)
    {
        BusError err;
        Msg reply;
        int rc = sd_bus_get_property(bus.b, kNmService, path.c_str(), iface, prop, &err.e, &reply.m, "o");
        if (rc < 0)
        {
            throw HotspotError(ErrorCode::PlatformQueryError,
                               std::string("read ") + prop + ": " + err.Text(rc), {}, "dbus");
        }
        const char *p = nullptr;
        rc = sd_bus_message_read(reply.m, "o", &p);
        if (rc < 0)
        {
            throw HotspotError(ErrorCode::PlatformQueryError, std::string("parse ") + prop + ": " + Errno(rc), {}, "dbus");
        }
        return p ? p : "/";
    }

    std::optional<std::string> DevicePath(Bus &bus, const std::string &ifname)
    {
        BusError err;
        Msg reply;
        int rc = sd_bus_call_method(bus.b, kNmService, kNmPath, kNmIface, "GetDeviceByIpIface",
                                    &err.e, &reply.m, "s", ifname.c_str());
        if (rc < 0)
        {
            LOGD("nm") << "GetDeviceByIpIface(" << ifname << "): " << err.Text(rc);
            return std::nullopt;
        }
        const char *p = nullptr;
        if (sd_bus_message_read(reply.m, "o", &p) < 0 || !p)
        {
            return std::nullopt;
        }
        return std::string(p);
    }

    std::optional<std::string> ActiveConnectionOf(Bus &bus, const std::string &device_path)
    {
        const std::string ac = GetObjectPath(bus, device_path, kDeviceIface, "ActiveConnection");
        if (ac.empty() || ac == "/") return std::nullopt;
        return ac;
    }

    void Deactivate(Bus &bus, const std::string &active_path)
    {
        BusError err;
        Msg reply;
        int rc = sd_bus_call_method(bus.b, kNmService, kNmPath, kNmIface, "DeactivateConnection",
                                    &err.e, &reply.m, "o", active_path.c_str());
        if (rc < 0)
        {
            throw HotspotError(ErrorCode::ActivationFailed, "DeactivateConnection: " + err.Text(rc), {}, "ap-down");
        }
    }

    // ---------- построение a{sa{sv}} ----------

    void Check(int rc, const char *what)
    {
        if (rc < 0)
        {
            throw HotspotError(ErrorCode::ActivationFailed, std::string("build settings (") + what + "): " + Errno(rc),
                               {}, "ap-settings");
        }
    }

    void OpenGroup(sd_bus_message *m, const char *name)
    {
        Check(sd_bus_message_open_container(m, 'e', "sa{sv}"), name);
        Check(sd_bus_message_append(m, "s", name), name);
        Check(sd_bus_message_open_container(m, 'a', "{sv}"), name);
    }

    void CloseGroup(sd_bus_message *m, const char *name)
    {
        Check(sd_bus_message_close_container(m), name);
        Check(sd_bus_message_close_container(m), name);
    }

    void AppendBytes(sd_bus_message *m, const char *key, const std::string &bytes)
    {
        Check(sd_bus_message_open_container(m, 'e', "sv"), key);
        Check(sd_bus_message_append(m, "s", key), key);
        Check(sd_bus_message_open_container(m, 'v', "ay"), key);
        Check(sd_bus_message_append_array(m, 'y', bytes.data(), bytes.size()), key);
        Check(sd_bus_message_close_container(m), key);
        Check(sd_bus_message_close_container(m), key);
    }

    void AppendAddressData(sd_bus_message *m, const std::string &cidr)
    {
        const auto slash = cidr.find('/');
        const std::string addr = cidr.substr(0, slash);
        const std::uint32_t prefix = static_cast<std::uint32_t>(std::stoul(cidr.substr(slash + 1)));

        Check(sd_bus_message_open_container(m, 'e', "sv"), "address-data");
        Check(sd_bus_message_append(m, "s", "address-data"), "address-data");
        Check(sd_bus_message_open_container(m, 'v', "aa{sv}"), "address-data");
        Check(sd_bus_message_open_container(m, 'a', "a{sv}"), "address-data");
        Check(sd_bus_message_open_container(m, 'a', "{sv}"), "address-data");
        Check(sd_bus_message_append(m, "{sv}", "address", "s", addr.c_str()), "address");
        Check(sd_bus_message_append(m, "{sv}", "prefix", "u", prefix), "prefix");
        Check(sd_bus_message_close_container(m), "address-data");
        Check(sd_bus_message_close_container(m), "address-data");
        Check(sd_bus_message_close_container(m), "address-data");
        Check(sd_bus_message_close_container(m), "address-data");
    }

    void AppendApSettings(sd_bus_message *m, const AccessPointRequest &r)
    {
        Check(sd_bus_message_open_container(m, 'a', "{sa{sv}}"), "settings");

        OpenGroup(m, "connection");
        Check(sd_bus_message_append(m, "{sv}", "id", "s", r.connection_name.c_str()), "id");
        Check(sd_bus_message_append(m, "{sv}", "type", "s", "802-11-wireless"), "type");
        Check(sd_bus_message_append(m, "{sv}", "interface-name", "s", r.ifname.c_str()), "interface-name");
        Check(sd_bus_message_append(m, "{sv}", "autoconnect", "b", 0), "autoconnect");
        CloseGroup(m, "connection");

        OpenGroup(m, "802-11-wireless");
        AppendBytes(m, "ssid", r.ssid);
        Check(sd_bus_message_append(m, "{sv}", "mode", "s", "ap"), "mode");
        Check(sd_bus_message_append(m, "{sv}", "band", "s", ToString(r.band)), "band");
        if (r.channel > 0)
        {
            Check(sd_bus_message_append(m, "{sv}", "channel", "u", static_cast<std::uint32_t>(r.channel)), "channel");
        }
        CloseGroup(m, "802-11-wireless");

        OpenGroup(m, "802-11-wireless-security");
        Check(sd_bus_message_append(m, "{sv}", "key-mgmt", "s", "wpa-psk"), "key-mgmt");
        Check(sd_bus_message_append(m, "{sv}", "proto", "as", 1, "rsn"), "proto");
        Check(sd_bus_message_append(m, "{sv}", "pairwise", "as", 1, "ccmp"), "pairwise");
        Check(sd_bus_message_append(m, "{sv}", "group", "as", 1, "ccmp"), "group");
        Check(sd_bus_message_append(m, "{sv}", "psk", "s", r.passphrase.c_str()), "psk");
        CloseGroup(m, "802-11-wireless-security");

        OpenGroup(m, "ipv4");
        Check(sd_bus_message_append(m, "{sv}", "method", "s", "shared"), "ipv4.method");
        AppendAddressData(m, r.gateway_cidr);
        CloseGroup(m, "ipv4");

        OpenGroup(m, "ipv6");
        Check(sd_bus_message_append(m, "{sv}", "method", "s", "disabled"), "ipv6.method");
        CloseGroup(m, "ipv6");

        Check(sd_bus_message_close_container(m), "settings");
    }

    // Снять подключение с нашим id; ошибки только логируем
    void DeactivateQuietly(Bus &bus, const std::string &active_path)
    {
        try
        {
            Deactivate(bus, active_path);
        }
        catch (const HotspotError &e)
        {
            LOGW("nm") << "Cleanup deactivate failed: " << e.what();
        }
    }
}

NmPlatform::NmPlatform(const Params &params)
    : p_(params)
{
}

std::vector<DeviceInfo> NmPlatform::ListDevices()
{
    Bus bus;
    BusError err;
    Msg reply;
    int rc = sd_bus_call_method(bus.b, kNmService, kNmPath, kNmIface, "GetDevices", &err.e, &reply.m, nullptr);
    if (rc < 0)
    {
        throw HotspotError(ErrorCode::PlatformQueryError, "NetworkManager GetDevices: " + err.Text(rc), {}, "scan");
    }

    char **paths = nullptr;
    rc = sd_bus_message_read_strv(reply.m, &paths);
    if (rc < 0)
    {
        throw HotspotError(ErrorCode::PlatformQueryError, "GetDevices reply: " + Errno(rc), {}, "scan");
    }

    std::vector<std::string> device_paths;
    for (char **p = paths; p && *p; ++p)
    {
        device_paths.emplace_back(*p);
        std::free(*p);
    }
    std::free(paths);

    std::vector<DeviceInfo> out;
    for (const std::string &path : device_paths)
    {
        const std::uint32_t type = GetU32(bus, path, kDeviceIface, "DeviceType");
        if (type == kDeviceTypeLoopback) continue;

        DeviceInfo d;
        d.name     = GetString(bus, path, kDeviceIface, "Interface");
        d.nm_state = GetU32(bus, path, kDeviceIface, "State");
        d.wifi     = (type == kDeviceTypeWifi);
        if (d.wifi)
        {
            d.ap_mode = GetU32(bus, path, kWifiIface, "Mode") == kWifiModeAp;
        }
        if (!d.name.empty()) out.push_back(std::move(d));
    }
    return out;
}

std::optional<std::string> NmPlatform::DefaultRouteInterface()
{
    try
    {
        if (auto v4 = LinkProbe::find_default_oifname(AF_INET)) return v4;
        return LinkProbe::find_default_oifname(AF_INET6);
    }
    catch (const std::runtime_error &e)
    {
        throw HotspotError(ErrorCode::PlatformQueryError, std::string("route table: ") + e.what(), {}, "scan");
    }
}

std::vector<std::string> NmPlatform::ListClients(const std::string &ifname)
{
    try
    {
        return LinkProbe::list_neighbours_v4(ifname);
    }
    catch (const std::runtime_error &e)
    {
        throw HotspotError(ErrorCode::PlatformQueryError, std::string("neighbour table: ") + e.what(), ifname, "clients");
    }
}

bool NmPlatform::IsAccessPointUp(const std::string &ifname, const std::string &connection_name)
{
    Bus bus;
    const std::optional<std::string> dev = DevicePath(bus, ifname);
    if (!dev) return false;

    const std::optional<std::string> ac = ActiveConnectionOf(bus, *dev);
    if (!ac) return false;

    return GetString(bus, *ac, kActiveIface, "Id") == connection_name
        && GetU32(bus, *ac, kActiveIface, "State") == kAcActivated
        && GetU32(bus, *dev, kWifiIface, "Mode") == kWifiModeAp;
}

void NmPlatform::TearDownAccessPoint(const std::string &ifname, const std::string &connection_name)
{
    Bus bus;
    const std::optional<std::string> dev = DevicePath(bus, ifname);
    if (!dev)
    {
        LOGI("nm") << "TearDown: " << ifname << " is gone, nothing to deactivate";
        return;
    }

    const std::optional<std::string> ac = ActiveConnectionOf(bus, *dev);
    if (!ac || GetString(bus, *ac, kActiveIface, "Id") != connection_name)
    {
        LOGD("nm") << "TearDown: no '" << connection_name << "' on " << ifname;
        return;
    }

    Deactivate(bus, *ac);
    LOGI("nm") << "TearDown: deactivated '" << connection_name << "' on " << ifname;
}

void NmPlatform::BringUpAccessPoint(const AccessPointRequest  &request,
                                    std::stop_token            st,
                                    std::chrono::milliseconds  timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    Bus bus;

    const std::optional<std::string> dev = DevicePath(bus, request.ifname);
    if (!dev)
    {
        throw HotspotError(ErrorCode::ActivationFailed, "device is not managed by NetworkManager",
                           request.ifname, "lookup-device");
    }

    // висящее подключение с тем же id от прошлого запуска
    if (const std::optional<std::string> stale = ActiveConnectionOf(bus, *dev))
    {
        if (GetString(bus, *stale, kActiveIface, "Id") == request.connection_name)
        {
            LOGI("nm") << "BringUp: deactivating stale '" << request.connection_name << "'";
            DeactivateQuietly(bus, *stale);
        }
    }

    Msg m;
    int rc = sd_bus_message_new_method_call(bus.b, &m.m, kNmService, kNmPath, kNmIface, "AddAndActivateConnection2");
    if (rc < 0)
    {
        throw HotspotError(ErrorCode::ActivationFailed, "new method call: " + Errno(rc), request.ifname, "ap-settings");
    }
    AppendApSettings(m.m, request);
    Check(sd_bus_message_append(m.m, "oo", dev->c_str(), "/"), "device");
    Check(sd_bus_message_open_container(m.m, 'a', "{sv}"), "options");
    Check(sd_bus_message_append(m.m, "{sv}", "persist", "s", "volatile"), "persist");
    Check(sd_bus_message_close_container(m.m), "options");

    BusError err;
    Msg reply;
    rc = sd_bus_call(bus.b, m.m, 0, &err.e, &reply.m);
    if (rc < 0)
    {
        throw HotspotError(ErrorCode::ActivationFailed, "AddAndActivateConnection2: " + err.Text(rc),
                           request.ifname, "ap-activate");
    }

    const char *conn_path   = nullptr;
    const char *active_path = nullptr;
    rc = sd_bus_message_read(reply.m, "oo", &conn_path, &active_path);
    if (rc < 0 || !active_path)
    {
        throw HotspotError(ErrorCode::ActivationFailed, "AddAndActivateConnection2 reply: " + Errno(rc),
                           request.ifname, "ap-activate");
    }
    const std::string active = active_path;
    LOGI("nm") << "BringUp: activating '" << request.connection_name << "' on " << request.ifname << " (" << active << ")";

    while (true)
    {
        std::uint32_t state = 0;
        try
        {
            state = GetU32(bus, active, kActiveIface, "State");
        }
        catch (const HotspotError &e)
        {
            // объект исчезает, когда активация сорвалась
            throw HotspotError(ErrorCode::ActivationFailed, std::string("activation aborted: ") + e.what(),
                               request.ifname, "ap-activate");
        }

        if (state == kAcActivated)
        {
            LOGI("nm") << "BringUp: access point '" << request.ssid << "' is up on " << request.ifname;
            return;
        }
        if (state == kAcDeactivating || state == kAcDeactivated)
        {
            throw HotspotError(ErrorCode::ActivationFailed,
                               "NetworkManager deactivated the access point (state " + std::to_string(state) + ")",
                               request.ifname, "ap-activate");
        }

        if (st.stop_requested() || std::chrono::steady_clock::now() >= deadline)
        {
            DeactivateQuietly(bus, active);
            throw HotspotError(ErrorCode::Timeout, "access point did not come up in time", request.ifname, "ap-activate");
        }
        std::this_thread::sleep_for(p_.poll_interval);
    }
}
