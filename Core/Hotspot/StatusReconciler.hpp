#pragma once

// StatusReconciler.hpp - сверяет живое состояние (интерфейсы, AP, NAT) с сессией
// контроллера: периодически и по событиям netlink (link/addr/route, с debounce).
// Сам ничего не чинит: расхождения уходят в HotspotController::ReportDrift.

#include "HotspotController.hpp"
#include "Inventory.hpp"
#include "NatCoordinator.hpp"
#include "Platform.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

class StatusReconciler
{
public:
    struct Params
    {
        std::chrono::milliseconds interval{2000};
        std::chrono::milliseconds debounce{500};
        bool                      watch_netlink = true;
    };

    StatusReconciler(HotspotController  &controller,
                     InterfaceInventory &inventory,
                     PlatformNetwork    &platform,
                     NatCoordinator     &nat,
                     const Params       &params);

    ~StatusReconciler();

    StatusReconciler(const StatusReconciler&)            = delete;
    StatusReconciler& operator=(const StatusReconciler&) = delete;
    StatusReconciler(StatusReconciler&&)                 = delete;
    StatusReconciler& operator=(StatusReconciler&&)      = delete;

    // Запустить фоновый поток
    void Start();

    // Остановить поток и освободить ресурсы
    void Stop();

    // Внеочередная сверка (коалесцируется по debounce)
    void Kick();

    bool IsRunning() const;

    // Один проход сверки; найденное уже отправлено контроллеру.
    std::vector<DriftReport> CheckOnce();

private:
    struct Watch; // eventfd остановки и kick, netlink-подписка

    void ThreadLoop_(std::stop_token st);

private:
    HotspotController  &controller_;
    InterfaceInventory &inventory_;
    PlatformNetwork    &platform_;
    NatCoordinator     &nat_;
    Params              p_;

    std::mutex check_mu_;

    std::unique_ptr<Watch> watch_;
    std::jthread           thread_;
};
