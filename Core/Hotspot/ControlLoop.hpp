#pragma once

// ControlLoop.hpp - единственный управляющий поток: очередь задач, таймеры
// и вынос блокирующей работы на рабочие потоки с таймаутом.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

class ControlLoop
{
public:
    using Task = std::function<void()>;
    using Work = std::function<void(std::stop_token)>;
    // Вызывается на управляющем потоке ровно один раз; nullptr - успех.
    using Done = std::function<void(std::exception_ptr)>;

    ControlLoop();
    ~ControlLoop();

    ControlLoop(const ControlLoop&)            = delete;
    ControlLoop& operator=(const ControlLoop&) = delete;

    // Потокобезопасно
    void Post(Task task);
    void PostAfter(std::chrono::milliseconds delay, Task task);

    // work уходит на рабочий поток; по таймауту done получает HotspotError(Timeout),
    // а работе запрашивается stop. Поздний результат отбрасывается.
    void Dispatch(const std::string        &step,
                  Work                      work,
                  std::chrono::milliseconds timeout,
                  Done                      done);

    bool IsLoopThread() const;

    // Остановить поток; задачи в очереди отбрасываются, рабочие дожидаются.
    void Stop();

private:
    struct Flight
    {
        std::atomic<bool> settled{false};
        std::atomic<bool> finished{false};
    };
    struct Worker
    {
        std::shared_ptr<Flight> flight;
        std::jthread            thread;
    };

    void ThreadLoop_(std::stop_token st);
    void ReapWorkers_();
    void Wake_();

private:
    mutable std::mutex mu_;
    std::deque<Task>   tasks_;
    std::multimap<std::chrono::steady_clock::time_point, Task> timers_;
    bool               stopped_ = false;

    std::list<Worker> workers_; // только с управляющего потока
    int               wake_fd_ = -1;
    std::jthread      thread_;
};
