#include "Hotspot.hpp"
#include "HotspotController.hpp"
#include "Inventory.hpp"
#include "NatCoordinator.hpp"
#include "NatHelperRunner.hpp"
#include "NmPlatform.hpp"
#include "Settings.hpp"
#include "StatusReconciler.hpp"
#include "Core/Config.hpp"
#include "Core/Logger.hpp"

#include <algorithm>
#include <cstring>
#include <future>
#include <optional>
#include <mutex>
#include <string>

namespace
{
    struct HotspotHandle
    {
        explicit HotspotHandle(const HotspotParams &p)
            : log(p.log)
            , platform(p.platform)
            , runner(p.helper)
            , nat(runner, p.nat)
            , inventory(platform)
            , controller(inventory, platform, nat, p.controller)
            , reconciler(controller, inventory, platform, nat, p.reconciler)
        {
            reconciler.Start();
        }

        ~HotspotHandle()
        {
            reconciler.Stop();
        }

        Logger::Guard      log;
        NmPlatform         platform;
        PkexecHelperRunner runner;
        NatCoordinator     nat;
        InterfaceInventory inventory;
        HotspotController  controller;
        StatusReconciler   reconciler;

        std::mutex  result_mu;
        std::string last_result = "{}";
    };

    HotspotHandle *AsHandle(void *h)
    {
        return static_cast<HotspotHandle *>(h);
    }

    int32_t CopyOut(const std::string &s, char *buf, int32_t size)
    {
        const int32_t need = static_cast<int32_t>(s.size() + 1);
        if (buf != nullptr && size > 0)
        {
            const std::size_t n = std::min<std::size_t>(s.size(), static_cast<std::size_t>(size - 1));
            std::memcpy(buf, s.data(), n);
            buf[n] = '\0';
        }
        return need;
    }

    int32_t Finish(HotspotHandle *h, const Result &r)
    {
        {
            std::lock_guard<std::mutex> lk(h->result_mu);
            h->last_result = boost::json::serialize(Settings::ToJson(r));
        }
        return static_cast<int32_t>(r.code);
    }

    // future от контроллера; исключения не выпускаем через C-границу
    int32_t Await(HotspotHandle *h, std::future<Result> f)
    {
        try
        {
            return Finish(h, f.get());
        }
        catch (const std::exception &e)
        {
            LOGE("api") << "Call aborted: " << e.what();
            return Finish(h, Result::FromError(HotspotError(ErrorCode::Busy, e.what(), {}, "api")));
        }
    }
}

EXPORT void *Hotspot_Create(const char *params_json)
{
    try
    {
        boost::json::object o;
        if (params_json != nullptr && *params_json != '\0')
        {
            o = Config::ParseObject(params_json);
        }
        return new HotspotHandle(Settings::ParseParams(o));
    }
    catch (const std::exception &e)
    {
        LOGE("api") << "Hotspot_Create failed: " << e.what();
        return nullptr;
    }
}

EXPORT void Hotspot_Destroy(void *handle)
{
    delete AsHandle(handle);
}

EXPORT int32_t Hotspot_Activate(void *handle, const char *config_json)
{
    HotspotHandle *h = AsHandle(handle);
    if (h == nullptr) return -1;

    HotspotConfig config;
    try
    {
        config = Settings::ParseHotspotConfig(std::string(config_json ? config_json : "{}"));
    }
    catch (const HotspotError &e)
    {
        return Finish(h, Result::FromError(e));
    }
    return Await(h, h->controller.Activate(config));
}

EXPORT int32_t Hotspot_Deactivate(void *handle)
{
    HotspotHandle *h = AsHandle(handle);
    if (h == nullptr) return -1;
    return Await(h, h->controller.Deactivate());
}

EXPORT int32_t Hotspot_Reset(void *handle)
{
    HotspotHandle *h = AsHandle(handle);
    if (h == nullptr) return -1;
    return Await(h, h->controller.Reset());
}

EXPORT int32_t Hotspot_State(void *handle)
{
    HotspotHandle *h = AsHandle(handle);
    if (h == nullptr) return -1;
    return static_cast<int32_t>(h->controller.State());
}

EXPORT int32_t Hotspot_Snapshot(void *handle, char *buf, int32_t size)
{
    HotspotHandle *h = AsHandle(handle);
    if (h == nullptr) return -1;

    const std::optional<HotspotSession> s = h->controller.Snapshot();
    boost::json::object o;
    if (s)
    {
        o = Settings::ToJson(*s);
    }
    else
    {
        o["state"] = ToString(h->controller.State());
    }
    return CopyOut(boost::json::serialize(o), buf, size);
}

EXPORT int32_t Hotspot_LastResult(void *handle, char *buf, int32_t size)
{
    HotspotHandle *h = AsHandle(handle);
    if (h == nullptr) return -1;
    std::lock_guard<std::mutex> lk(h->result_mu);
    return CopyOut(h->last_result, buf, size);
}

EXPORT int32_t Hotspot_Subscribe(void *handle, HotspotEventFn fn, void *user)
{
    HotspotHandle *h = AsHandle(handle);
    if (h == nullptr || fn == nullptr) return -1;

    return h->controller.Subscribe([fn, user](const HotspotController::Event &ev)
                                   {
                                       const std::string json = boost::json::serialize(Settings::ToJson(ev));
                                       fn(json.c_str(), user);
                                   });
}

EXPORT int32_t Hotspot_Unsubscribe(void *handle, int32_t id)
{
    HotspotHandle *h = AsHandle(handle);
    if (h == nullptr) return -1;
    h->controller.Unsubscribe(id);
    return 0;
}
