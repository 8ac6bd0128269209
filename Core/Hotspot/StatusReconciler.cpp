#include "StatusReconciler.hpp"
#include "Errors.hpp"
#include "Core/Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <netlink/errno.h>
#include <netlink/handlers.h>
#include <netlink/msg.h>
#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <linux/rtnetlink.h>

namespace
{
    using Clock = std::chrono::steady_clock;

    class EventFd
    {
    public:
        EventFd()
            : fd_(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC))
        {
            if (fd_ < 0)
            {
                throw std::runtime_error(std::string("eventfd: ") + std::strerror(errno));
            }
        }

        ~EventFd() { ::close(fd_); }

        EventFd(const EventFd&)            = delete;
        EventFd& operator=(const EventFd&) = delete;

        int Fd() const { return fd_; }

        void Signal()
        {
            const std::uint64_t one = 1;
            if (::write(fd_, &one, sizeof(one)) < 0 && errno != EAGAIN)
            {
                LOGD("reconciler") << "eventfd write failed errno=" << errno;
            }
        }

        // Счётчик eventfd читается целиком за один read
        void Drain()
        {
            std::uint64_t val = 0;
            while (::read(fd_, &val, sizeof(val)) < 0 && errno == EINTR) {}
        }

    private:
        int fd_;
    };

    // Подписка на изменения линков, адресов и маршрутов
    class NlEvents
    {
    public:
        NlEvents(nl_recvmsg_msg_cb_t on_msg, void *arg)
        {
            sk_ = nl_socket_alloc();
            if (!sk_) throw std::runtime_error("nl_socket_alloc failed");

            int err = nl_connect(sk_, NETLINK_ROUTE);
            if (err == 0)
            {
                err = nl_socket_add_memberships(sk_, RTNLGRP_LINK, RTNLGRP_IPV4_IFADDR,
                                                RTNLGRP_IPV4_ROUTE, RTNLGRP_IPV6_ROUTE, 0);
            }
            if (err != 0)
            {
                nl_socket_free(sk_);
                throw std::runtime_error(std::string("netlink subscribe: ") + nl_geterror(err));
            }

            nl_socket_disable_seq_check(sk_);
            nl_socket_modify_cb(sk_, NL_CB_VALID, NL_CB_CUSTOM, on_msg, arg);
            nl_socket_set_nonblocking(sk_);
        }

        ~NlEvents()
        {
            nl_close(sk_);
            nl_socket_free(sk_);
        }

        NlEvents(const NlEvents&)            = delete;
        NlEvents& operator=(const NlEvents&) = delete;

        int Fd() const { return nl_socket_get_fd(sk_); }

        void Receive()
        {
            const int rc = nl_recvmsgs_default(sk_);
            if (rc < 0 && rc != -NLE_AGAIN)
            {
                LOGD("reconciler") << "nl_recvmsgs: " << nl_geterror(rc);
            }
        }

    private:
        nl_sock *sk_ = nullptr;
    };

    int OnNlMessage(nl_msg *, void *arg)
    {
        static_cast<StatusReconciler *>(arg)->Kick();
        return NL_OK;
    }

    int MsUntil(Clock::time_point t)
    {
        const auto ms = std::chrono::ceil<std::chrono::milliseconds>(t - Clock::now()).count();
        return ms > 0 ? static_cast<int>(ms) : 0;
    }
}

struct StatusReconciler::Watch
{
    EventFd                   stop;
    EventFd                   kick;
    std::unique_ptr<NlEvents> nl; // nullptr: только периодическая сверка
};

StatusReconciler::StatusReconciler(HotspotController  &controller,
                                   InterfaceInventory &inventory,
                                   PlatformNetwork    &platform,
                                   NatCoordinator     &nat,
                                   const Params       &params)
    : controller_(controller)
    , inventory_(inventory)
    , platform_(platform)
    , nat_(nat)
    , p_(params)
{
    if (p_.interval.count() <= 0) p_.interval = std::chrono::milliseconds(2000);
    if (p_.debounce.count() < 0)  p_.debounce = std::chrono::milliseconds(0);
}

StatusReconciler::~StatusReconciler()
{
    Stop();
}

bool StatusReconciler::IsRunning() const
{
    return thread_.joinable();
}

void StatusReconciler::Kick()
{
    if (watch_) watch_->kick.Signal();
}

void StatusReconciler::Start()
{
    if (thread_.joinable()) return;

    try
    {
        watch_ = std::make_unique<Watch>();
    }
    catch (const std::exception &e)
    {
        LOGE("reconciler") << "Start failed: " << e.what();
        return;
    }

    if (p_.watch_netlink)
    {
        try
        {
            watch_->nl = std::make_unique<NlEvents>(&OnNlMessage, this);
        }
        catch (const std::exception &e)
        {
            LOGW("reconciler") << e.what() << ", periodic checks only";
        }
    }

    thread_ = std::jthread([this](std::stop_token st) { ThreadLoop_(st); });
    LOGD("reconciler") << "Armed (interval=" << p_.interval.count() << " ms, debounce=" << p_.debounce.count()
                       << " ms, netlink=" << (watch_->nl ? "on" : "off") << ")";
}

void StatusReconciler::Stop()
{
    if (thread_.joinable())
    {
        thread_.request_stop();
        watch_->stop.Signal();
        thread_.join();
        LOGD("reconciler") << "Stopped";
    }
    watch_.reset();
}

std::vector<DriftReport> StatusReconciler::CheckOnce()
{
    std::lock_guard<std::mutex> lk(check_mu_);

    const std::optional<HotspotSession> snap = controller_.Snapshot();
    if (!snap || snap->state != HotspotState::Active || controller_.TransitionPending())
    {
        return {};
    }

    std::vector<NetworkInterface> interfaces;
    try
    {
        interfaces = inventory_.Scan();
    }
    catch (const HotspotError &e)
    {
        LOGW("reconciler") << "Scan failed, pass skipped: " << e.what();
        return {};
    }

    const std::string &hs = snap->roles.hotspot.name;
    std::vector<DriftReport> drifts;

    const bool present = std::any_of(interfaces.begin(), interfaces.end(),
                                     [&](const NetworkInterface &ni) { return ni.name == hs; });
    if (!present)
    {
        drifts.push_back(DriftReport{DriftKind::InterfaceLost, hs, "hotspot interface lost", std::nullopt});
    }
    else
    {
        bool up = true;
        try
        {
            up = platform_.IsAccessPointUp(hs, snap->config.connection_name);
        }
        catch (const HotspotError &e)
        {
            LOGW("reconciler") << "AP state query failed: " << e.what();
        }
        if (!up)
        {
            drifts.push_back(DriftReport{DriftKind::AccessPointDown, hs, "access point dropped", std::nullopt});
        }
    }

    // check только для установленного NAT: без авторизации pkexec спросил бы пароль
    if (snap->nat == NatStatus::Installed)
    {
        const NatRuleSet want  = NatRuleSet::From(snap->roles);
        const NatCheck   check = nat_.Check(want);
        if (check.status == NatCheck::Status::Absent)
        {
            drifts.push_back(DriftReport{DriftKind::NatMismatch, hs, "NAT rules missing", std::nullopt});
        }
        else if (check.status == NatCheck::Status::OtherPair)
        {
            std::string detail = "NAT rules installed for another pair";
            if (check.installed && !(*check.installed == want))
            {
                detail = "NAT rules installed for " + check.installed->hotspot_if + ">" + check.installed->uplink_if;
            }
            drifts.push_back(DriftReport{DriftKind::NatMismatch, hs, detail, check.installed});
        }
    }

    if (drifts.empty())
    {
        try
        {
            controller_.UpdateClients(snap->id, platform_.ListClients(hs));
        }
        catch (const HotspotError &e)
        {
            LOGD("reconciler") << "Client list unavailable: " << e.what();
        }
        return drifts;
    }

    for (const DriftReport &d : drifts)
    {
        LOGW("reconciler") << "Drift " << ToString(d.kind) << " on " << d.ifname << ": " << d.detail;
        controller_.ReportDrift(snap->id, d);
    }
    return drifts;
}

void StatusReconciler::ThreadLoop_(std::stop_token st)
{
    Watch &w = *watch_;
    auto next_pass = Clock::now() + p_.interval;
    std::optional<Clock::time_point> last_kick; // сверка через debounce после последнего события

    while (!st.stop_requested())
    {
        Clock::time_point wake = next_pass;
        if (last_kick) wake = std::min(wake, *last_kick + p_.debounce);

        pollfd pfds[3] = {
            {w.stop.Fd(), POLLIN, 0},
            {w.kick.Fd(), POLLIN, 0},
            {w.nl ? w.nl->Fd() : -1, POLLIN, 0},
        };
        const int rc = ::poll(pfds, 3, MsUntil(wake));
        if (rc < 0)
        {
            if (errno == EINTR) continue;
            LOGE("reconciler") << "poll failed errno=" << errno;
            break;
        }
        if (pfds[0].revents & POLLIN) break;

        if (pfds[2].revents & POLLIN)
        {
            w.nl->Receive(); // OnNlMessage -> Kick()
        }
        if (pfds[1].revents & POLLIN)
        {
            w.kick.Drain();
            last_kick = Clock::now();
        }

        const auto now = Clock::now();
        const bool due = now >= next_pass || (last_kick && now >= *last_kick + p_.debounce);
        if (!due) continue;

        last_kick.reset();
        try
        {
            CheckOnce();
        }
        catch (const std::exception &e)
        {
            LOGE("reconciler") << "Check failed: " << e.what();
        }
        next_pass = Clock::now() + p_.interval;
    }
    LOGD("reconciler") << "Thread exiting";
}
