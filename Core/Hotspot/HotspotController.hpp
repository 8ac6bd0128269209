#pragma once

#include "ControlLoop.hpp"
#include "Errors.hpp"
#include "Inventory.hpp"
#include "NatCoordinator.hpp"
#include "Platform.hpp"
#include "Types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @file HotspotController.hpp
 * @brief Машина состояний хотспота: Idle → Starting → Active → Stopping → Idle, Failed.
 *
 * Все переходы выполняются на одном управляющем потоке. Запросы к платформе и
 * помощнику уходят на рабочие потоки с таймаутом, их завершение возвращается
 * в управляющий поток.
 */
class HotspotController
{
public:
    struct Params
    {
        std::chrono::milliseconds op_timeout{30000};  ///< Скан+резолв, подъём/снятие AP.
        std::chrono::milliseconds nat_timeout{60000}; ///< Один шаг NAT вместе с повторами.
    };

    enum class EventKind
    {
        StateChanged,
        NatStatusChanged,
        Drift,
        ClientsChanged,
    };

    /**
     * @brief Событие для наблюдателей. Вызывается на управляющем потоке.
     */
    struct Event
    {
        EventKind                  kind = EventKind::StateChanged;
        HotspotState               from = HotspotState::Idle;
        HotspotState               to   = HotspotState::Idle;
        NatStatus                  nat  = NatStatus::Disabled;
        ErrorCode                  code = ErrorCode::Ok;
        std::string                ifname;
        std::string                step;
        std::string                message;
        std::optional<DriftReport> drift;
        std::vector<std::string>   clients;
    };

    using Listener = std::function<void(const Event &)>;

    HotspotController(InterfaceInventory &inventory,
                      PlatformNetwork    &platform,
                      NatCoordinator     &nat,
                      const Params       &params);

    /**
     * @brief Останавливает поток и синхронно снимает то, что осталось в системе:
     * NAT (с повторами помощника) и AP. Время ограничено таймаутами помощника и платформы.
     */
    ~HotspotController();

    HotspotController(const HotspotController&)            = delete;
    HotspotController& operator=(const HotspotController&) = delete;

    /**
     * @brief Запустить хотспот.
     *
     * Future завершается, когда решено, входим ли в Starting: Ok - вошли,
     * иначе InvalidConfig / InsufficientInterfaces / NoUplink / InvalidHint /
     * PlatformQueryError / Busy, состояние остаётся Idle. Дальнейший ход - через события.
     */
    std::future<Result> Activate(const HotspotConfig &config);

    /**
     * @brief Остановить. Idle - сразу Ok. Во время резолва ролей или Starting - отложенная
     * остановка (активация, не дошедшая до Starting, отменяется с Busy).
     * Future завершается после возврата в Idle.
     */
    std::future<Result> Deactivate();

    /**
     * @brief Failed → Idle. Сначала гарантированно снимает NAT (с повторами).
     */
    std::future<Result> Reset();

    /// Вход для сверщика состояния; устаревшие отчёты (другая сессия, переход в полёте) игнорируются.
    void ReportDrift(std::uint64_t session_id, const DriftReport &drift);
    void UpdateClients(std::uint64_t session_id, std::vector<std::string> clients);

    HotspotState                  State() const;
    std::optional<HotspotSession> Snapshot() const;
    bool                          TransitionPending() const;

    int  Subscribe(Listener listener);
    void Unsubscribe(int id);

private:
    using Promise = std::shared_ptr<std::promise<Result>>;
    using Next    = std::function<void(std::optional<HotspotError>)>;

    void DoActivate_(const HotspotConfig &config, Promise p);
    void DoDeactivate_(Promise p);
    void DoReset_(Promise p);
    void DoReportDrift_(std::uint64_t session_id, const DriftReport &drift);
    void DoUpdateClients_(std::uint64_t session_id, std::vector<std::string> clients);

    void BeginStarting_(const HotspotConfig &config, const InterfaceRoles &roles);
    void ApplyNat_();
    void BeginStop_();
    void Fail_(const HotspotError &reason);
    void FinishReset_();

    void RemoveNat_(Next next);
    void ReleaseOnShutdown_();
    void TearDownAp_(Next next);

    // state_ и pending_ меняются под одним захватом mu_
    void Transition_(HotspotState to, bool pending, const std::optional<HotspotError> &why = std::nullopt);
    void SetNat_(NatStatus status, const std::optional<HotspotError> &why = std::nullopt);
    void SetPending_(bool pending);
    void ResolveWaiters_(const Result &result);
    void Emit_(const Event &event);

private:
    InterfaceInventory &inventory_;
    PlatformNetwork    &platform_;
    NatCoordinator     &nat_;
    Params              p_;

    // Читаются с любых потоков, пишутся только с управляющего
    mutable std::mutex            mu_;
    HotspotState                  state_   = HotspotState::Idle;
    bool                          pending_ = false;
    std::optional<HotspotSession> session_;

    // Только управляющий поток
    std::uint64_t             next_session_id_ = 0;
    bool                      stop_deferred_   = false;
    std::vector<Promise>      waiters_;        ///< Ждут возврата в Idle.
    std::optional<NatRuleSet> nat_dirty_;      ///< Правила, которые могут стоять в системе.

    mutable std::mutex         listeners_mu_;
    std::map<int, Listener>    listeners_;
    int                        next_listener_id_ = 0;

    ControlLoop loop_;
};
