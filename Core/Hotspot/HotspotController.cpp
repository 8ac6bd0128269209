#include "HotspotController.hpp"
#include "RoleResolver.hpp"
#include "Core/Logger.hpp"

#include <exception>

namespace
{
    HotspotError AsError(std::exception_ptr ep,
                         ErrorCode          fallback,
                         const std::string &ifname,
                         const std::string &step)
    {
        try
        {
            std::rethrow_exception(ep);
        }
        catch (const HotspotError &e)
        {
            return HotspotError(e.Code(), e.what(),
                                e.Interface().empty() ? ifname : e.Interface(),
                                e.Step().empty() ? step : e.Step());
        }
        catch (const std::exception &e)
        {
            return HotspotError(fallback, e.what(), ifname, step);
        }
        catch (...)
        {
            return HotspotError(fallback, "unknown error", ifname, step);
        }
    }

    Result BusyResult(const std::string &why, const char *step)
    {
        return Result::FromError(HotspotError(ErrorCode::Busy, why, {}, step));
    }
}

HotspotController::HotspotController(InterfaceInventory &inventory,
                                     PlatformNetwork    &platform,
                                     NatCoordinator     &nat,
                                     const Params       &params)
    : inventory_(inventory)
    , platform_(platform)
    , nat_(nat)
    , p_(params)
{
}

HotspotController::~HotspotController()
{
    loop_.Stop();
    // управляющий поток и рабочие остановлены, состояние больше не меняется
    ReleaseOnShutdown_();
}

// ---- публичный интерфейс ----

std::future<Result> HotspotController::Activate(const HotspotConfig &config)
{
    auto p = std::make_shared<std::promise<Result>>();
    auto f = p->get_future();
    loop_.Post([this, config, p] { DoActivate_(config, p); });
    return f;
}

std::future<Result> HotspotController::Deactivate()
{
    auto p = std::make_shared<std::promise<Result>>();
    auto f = p->get_future();
    loop_.Post([this, p] { DoDeactivate_(p); });
    return f;
}

std::future<Result> HotspotController::Reset()
{
    auto p = std::make_shared<std::promise<Result>>();
    auto f = p->get_future();
    loop_.Post([this, p] { DoReset_(p); });
    return f;
}

void HotspotController::ReportDrift(std::uint64_t session_id, const DriftReport &drift)
{
    loop_.Post([this, session_id, drift] { DoReportDrift_(session_id, drift); });
}

void HotspotController::UpdateClients(std::uint64_t session_id, std::vector<std::string> clients)
{
    loop_.Post([this, session_id, clients = std::move(clients)]() mutable
               {
                   DoUpdateClients_(session_id, std::move(clients));
               });
}

HotspotState HotspotController::State() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

std::optional<HotspotSession> HotspotController::Snapshot() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return session_;
}

bool HotspotController::TransitionPending() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return pending_;
}

int HotspotController::Subscribe(Listener listener)
{
    std::lock_guard<std::mutex> lk(listeners_mu_);
    const int id = ++next_listener_id_;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void HotspotController::Unsubscribe(int id)
{
    std::lock_guard<std::mutex> lk(listeners_mu_);
    listeners_.erase(id);
}

// ---- управляющий поток ----

void HotspotController::DoActivate_(const HotspotConfig &config, Promise p)
{
    if (pending_ || state_ != HotspotState::Idle)
    {
        LOGW("controller") << "Activate rejected: state=" << ToString(state_) << (pending_ ? " (transition pending)" : "");
        p->set_value(BusyResult(std::string("hotspot is ") + ToString(state_) +
                                (pending_ ? " with a transition in progress" : ""), "activate"));
        return;
    }

    try
    {
        ValidateConfig(config);
    }
    catch (const HotspotError &e)
    {
        LOGW("controller") << "Activate: invalid config: " << e.what();
        p->set_value(Result::FromError(e));
        return;
    }

    SetPending_(true);
    auto roles = std::make_shared<InterfaceRoles>();
    loop_.Dispatch("resolve",
                   [this, hints = config.hints, roles](std::stop_token)
                   {
                       *roles = RoleResolver::Resolve(inventory_.Scan(), hints);
                   },
                   p_.op_timeout,
                   [this, config, roles, p](std::exception_ptr ep)
                   {
                       if (stop_deferred_)
                       {
                           // Deactivate пришёл во время резолва: в Starting не входим
                           stop_deferred_ = false;
                           SetPending_(false);
                           LOGI("controller") << "Activate cancelled by deactivate before start";
                           p->set_value(BusyResult("activation cancelled by deactivate", "activate"));
                           ResolveWaiters_(Result::Success("stopped"));
                           return;
                       }
                       if (ep)
                       {
                           SetPending_(false);
                           const HotspotError e = AsError(ep, ErrorCode::PlatformQueryError, {}, "resolve");
                           LOGW("controller") << "Activate: " << ToString(e.Code()) << ": " << e.what();
                           p->set_value(Result::FromError(e));
                           return;
                       }
                       BeginStarting_(config, *roles);
                       p->set_value(Result::Success("starting on " + roles->hotspot.name));
                   });
}

void HotspotController::BeginStarting_(const HotspotConfig &config, const InterfaceRoles &roles)
{
    HotspotSession s;
    s.id         = ++next_session_id_;
    s.config     = config;
    s.roles      = roles;
    s.state      = HotspotState::Idle;
    s.started_at = std::chrono::system_clock::now();
    s.nat        = config.nat_enabled ? NatStatus::Pending : NatStatus::Disabled;
    {
        std::lock_guard<std::mutex> lk(mu_);
        session_ = s;
    }
    Transition_(HotspotState::Starting, true);

    AccessPointRequest req;
    req.ifname          = roles.hotspot.name;
    req.connection_name = config.connection_name;
    req.ssid            = config.ssid;
    req.passphrase      = config.passphrase;
    req.band            = config.band;
    req.channel         = config.channel;
    req.gateway_cidr    = config.gateway_cidr;

    loop_.Dispatch("ap-up",
                   [this, req](std::stop_token st) { platform_.BringUpAccessPoint(req, st, p_.op_timeout); },
                   p_.op_timeout,
                   [this, hs = roles.hotspot.name](std::exception_ptr ep)
                   {
                       if (ep)
                       {
                           Fail_(AsError(ep, ErrorCode::ActivationFailed, hs, "ap-up"));
                           return;
                       }

                       // следующий шаг (NAT или остановка) начинается без окна "Active и ничего в полёте"
                       Transition_(HotspotState::Active, stop_deferred_ || session_->config.nat_enabled);
                       if (stop_deferred_)
                       {
                           BeginStop_();
                           return;
                       }
                       if (session_->config.nat_enabled)
                       {
                           ApplyNat_();
                       }
                   });
}

void HotspotController::ApplyNat_()
{
    const NatRuleSet rules = NatRuleSet::From(session_->roles);
    nat_dirty_ = rules;
    SetPending_(true);

    loop_.Dispatch("nat-apply",
                   [this, rules](std::stop_token) { nat_.Apply(rules); },
                   p_.nat_timeout,
                   [this, rules](std::exception_ptr ep)
                   {
                       if (!ep)
                       {
                           SetNat_(NatStatus::Installed);
                       }
                       else
                       {
                           const HotspotError e = AsError(ep, ErrorCode::NatApplyFailed, rules.hotspot_if, "nat-apply");
                           if (e.Code() == ErrorCode::NatUnavailable)
                           {
                               nat_dirty_.reset(); // помощник не запускался
                               SetNat_(NatStatus::Unavailable, e);
                           }
                           else
                           {
                               SetNat_(NatStatus::Failed, e);
                           }
                       }

                       if (stop_deferred_)
                       {
                           BeginStop_();
                           return;
                       }
                       SetPending_(false);
                   });
}

void HotspotController::DoDeactivate_(Promise p)
{
    switch (state_)
    {
        case HotspotState::Idle:
            if (pending_)
            {
                LOGI("controller") << "Deactivate deferred until role resolution completes";
                waiters_.push_back(p);
                stop_deferred_ = true;
                return;
            }
            p->set_value(Result::Success("already idle"));
            return;

        case HotspotState::Stopping:
            p->set_value(BusyResult("hotspot is already stopping", "deactivate"));
            return;

        case HotspotState::Failed:
            DoReset_(p);
            return;

        case HotspotState::Starting:
        case HotspotState::Active:
            waiters_.push_back(p);
            if (pending_)
            {
                LOGI("controller") << "Deactivate deferred until " << ToString(state_) << " step completes";
                stop_deferred_ = true;
                return;
            }
            BeginStop_();
            return;
    }
}

void HotspotController::BeginStop_()
{
    stop_deferred_ = false;
    Transition_(HotspotState::Stopping, true);

    RemoveNat_([this](std::optional<HotspotError> nat_err)
               {
                   TearDownAp_([this, nat_err](std::optional<HotspotError> ap_err)
                               {
                                   {
                                       std::lock_guard<std::mutex> lk(mu_);
                                       session_.reset();
                                   }
                                   Transition_(HotspotState::Idle, false);

                                   if (nat_err)
                                   {
                                       ResolveWaiters_(Result::FromError(*nat_err));
                                   }
                                   else if (ap_err)
                                   {
                                       ResolveWaiters_(Result::FromError(*ap_err));
                                   }
                                   else
                                   {
                                       ResolveWaiters_(Result::Success("stopped"));
                                   }
                               });
               });
}

void HotspotController::Fail_(const HotspotError &reason)
{
    LOGE("controller") << "Session failed: " << ToString(reason.Code()) << ": " << reason.what()
                       << " (if=" << reason.Interface() << ", step=" << reason.Step() << ")";
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (session_) session_->failure = reason.what();
    }
    // Ничего не оставляем: снимаем NAT и AP сразу, Reset лишь подтверждает
    Transition_(HotspotState::Failed, true, reason);
    RemoveNat_([this](std::optional<HotspotError>)
               {
                   TearDownAp_([this](std::optional<HotspotError> ap_err)
                               {
                                   if (ap_err)
                                   {
                                       LOGW("controller") << "Teardown after failure: " << ap_err->what();
                                   }
                                   if (stop_deferred_)
                                   {
                                       stop_deferred_ = false;
                                       FinishReset_();
                                       return;
                                   }
                                   SetPending_(false);
                               });
               });
}

void HotspotController::DoReset_(Promise p)
{
    if (state_ == HotspotState::Idle && !pending_)
    {
        p->set_value(Result::Success("nothing to reset"));
        return;
    }
    if (state_ != HotspotState::Failed)
    {
        p->set_value(BusyResult(std::string("reset is only valid in failed state, hotspot is ") + ToString(state_), "reset"));
        return;
    }

    waiters_.push_back(p);
    if (pending_)
    {
        stop_deferred_ = true; // дождаться очистки после сбоя
        return;
    }
    FinishReset_();
}

void HotspotController::FinishReset_()
{
    SetPending_(true);
    RemoveNat_([this](std::optional<HotspotError> nat_err)
               {
                   {
                       std::lock_guard<std::mutex> lk(mu_);
                       session_.reset();
                   }
                   Transition_(HotspotState::Idle, false);
                   ResolveWaiters_(nat_err ? Result::FromError(*nat_err) : Result::Success("reset"));
               });
}

void HotspotController::DoReportDrift_(std::uint64_t session_id, const DriftReport &drift)
{
    Event ev;
    ev.kind    = EventKind::Drift;
    ev.from    = state_;
    ev.to      = state_;
    ev.code    = ErrorCode::Drift;
    ev.ifname  = drift.ifname;
    ev.step    = "reconcile";
    ev.message = drift.detail;
    ev.drift   = drift;
    Emit_(ev);

    if (!session_ || session_->id != session_id || state_ != HotspotState::Active || pending_)
    {
        LOGD("controller") << "Drift ignored (" << ToString(drift.kind) << "): session moved on";
        return;
    }

    if (drift.installed && !(nat_dirty_ && *nat_dirty_ == *drift.installed))
    {
        // в наших таблицах правила чужой пары: снимаем именно их
        nat_dirty_ = drift.installed;
    }
    Fail_(HotspotError(ErrorCode::Drift, drift.detail, drift.ifname, "reconcile"));
}

void HotspotController::DoUpdateClients_(std::uint64_t session_id, std::vector<std::string> clients)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!session_ || session_->id != session_id || session_->clients == clients) return;
        session_->clients = clients;
    }

    Event ev;
    ev.kind    = EventKind::ClientsChanged;
    ev.from    = state_;
    ev.to      = state_;
    ev.clients = std::move(clients);
    Emit_(ev);
}

// ---- шаги ----

void HotspotController::ReleaseOnShutdown_()
{
    if (nat_dirty_)
    {
        const NatRuleSet rules = *nat_dirty_;
        LOGI("controller") << "Shutdown: removing NAT " << NatRules::Tag(rules.hotspot_if, rules.uplink_if);
        try
        {
            nat_.Remove(rules);
            nat_dirty_.reset();
        }
        catch (const std::exception &e)
        {
            LOGE("controller") << "Shutdown: NAT rules for " << rules.hotspot_if << ">" << rules.uplink_if
                               << " may remain: " << e.what();
        }
    }

    if (session_)
    {
        const std::string hs = session_->roles.hotspot.name;
        LOGI("controller") << "Shutdown: tearing down access point on " << hs;
        try
        {
            platform_.TearDownAccessPoint(hs, session_->config.connection_name);
        }
        catch (const std::exception &e)
        {
            LOGE("controller") << "Shutdown: access point on " << hs << " may remain: " << e.what();
        }
        std::lock_guard<std::mutex> lk(mu_);
        session_.reset();
        state_   = HotspotState::Idle;
        pending_ = false;
    }
}

void HotspotController::RemoveNat_(Next next)
{
    if (!nat_dirty_)
    {
        next(std::nullopt);
        return;
    }

    const NatRuleSet rules = *nat_dirty_;
    loop_.Dispatch("nat-remove",
                   [this, rules](std::stop_token) { nat_.Remove(rules); },
                   p_.nat_timeout,
                   [this, rules, next = std::move(next)](std::exception_ptr ep)
                   {
                       if (!ep)
                       {
                           nat_dirty_.reset();
                           if (session_ && session_->nat != NatStatus::Disabled)
                           {
                               SetNat_(NatStatus::Removed);
                           }
                           next(std::nullopt);
                           return;
                       }
                       const HotspotError e = AsError(ep, ErrorCode::NatApplyFailed, rules.hotspot_if, "nat-remove");
                       LOGE("controller") << "NAT rules for " << rules.hotspot_if << ">" << rules.uplink_if
                                          << " may remain: " << e.what();
                       if (session_) SetNat_(NatStatus::Failed, e);
                       next(e);
                   });
}

void HotspotController::TearDownAp_(Next next)
{
    if (!session_)
    {
        next(std::nullopt);
        return;
    }

    const std::string hs   = session_->roles.hotspot.name;
    const std::string conn = session_->config.connection_name;
    loop_.Dispatch("ap-down",
                   [this, hs, conn](std::stop_token) { platform_.TearDownAccessPoint(hs, conn); },
                   p_.op_timeout,
                   [hs, next = std::move(next)](std::exception_ptr ep)
                   {
                       if (!ep)
                       {
                           next(std::nullopt);
                           return;
                       }
                       next(AsError(ep, ErrorCode::ActivationFailed, hs, "ap-down"));
                   });
}

void HotspotController::Transition_(HotspotState to, bool pending, const std::optional<HotspotError> &why)
{
    const HotspotState from = state_;
    {
        std::lock_guard<std::mutex> lk(mu_);
        state_   = to;
        pending_ = pending;
        if (session_) session_->state = to;
    }
    LOGI("controller") << "State " << ToString(from) << " -> " << ToString(to)
                       << (why ? std::string(": ") + why->what() : std::string());

    Event ev;
    ev.kind = EventKind::StateChanged;
    ev.from = from;
    ev.to   = to;
    if (session_) ev.nat = session_->nat;
    if (why)
    {
        ev.code    = why->Code();
        ev.ifname  = why->Interface();
        ev.step    = why->Step();
        ev.message = why->what();
    }
    Emit_(ev);
}

void HotspotController::SetNat_(NatStatus status, const std::optional<HotspotError> &why)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!session_) return;
        session_->nat = status;
    }
    LOGI("controller") << "NAT " << ToString(status) << (why ? std::string(": ") + why->what() : std::string());

    Event ev;
    ev.kind = EventKind::NatStatusChanged;
    ev.from = state_;
    ev.to   = state_;
    ev.nat  = status;
    if (why)
    {
        ev.code    = why->Code();
        ev.ifname  = why->Interface();
        ev.step    = why->Step();
        ev.message = why->what();
    }
    Emit_(ev);
}

void HotspotController::SetPending_(bool pending)
{
    std::lock_guard<std::mutex> lk(mu_);
    pending_ = pending;
}

void HotspotController::ResolveWaiters_(const Result &result)
{
    std::vector<Promise> waiters;
    waiters.swap(waiters_);
    for (const Promise &p : waiters)
    {
        p->set_value(result);
    }
}

void HotspotController::Emit_(const Event &event)
{
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lk(listeners_mu_);
        for (const auto &[id, fn] : listeners_) listeners.push_back(fn);
    }
    for (const Listener &fn : listeners)
    {
        try
        {
            fn(event);
        }
        catch (const std::exception &e)
        {
            LOGE("controller") << "Listener exception: " << e.what();
        }
    }
}
