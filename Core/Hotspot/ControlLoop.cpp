#include "ControlLoop.hpp"
#include "Errors.hpp"
#include "Core/Logger.hpp"

#include <cerrno>
#include <stdexcept>

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace
{
    void DrainEventFd(int fd)
    {
        std::uint64_t val = 0;
        while (true)
        {
            const ssize_t rc = ::read(fd, &val, sizeof(val));
            if (rc < 0 && errno == EINTR) continue;
            return; // EAGAIN, 0 или одно значение: eventfd отдаёт счётчик целиком
        }
    }
}

ControlLoop::ControlLoop()
{
    wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0)
    {
        throw std::runtime_error("ControlLoop: eventfd create failed");
    }
    thread_ = std::jthread([this](std::stop_token st) { ThreadLoop_(st); });
}

ControlLoop::~ControlLoop()
{
    Stop();
    if (wake_fd_ >= 0)
    {
        ::close(wake_fd_);
        wake_fd_ = -1;
    }
}

bool ControlLoop::IsLoopThread() const
{
    return std::this_thread::get_id() == thread_.get_id();
}

void ControlLoop::Wake_()
{
    std::uint64_t one = 1;
    (void)::write(wake_fd_, &one, sizeof(one)); // переполнение счётчика не страшно
}

void ControlLoop::Post(Task task)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopped_) return;
        tasks_.push_back(std::move(task));
    }
    Wake_();
}

void ControlLoop::PostAfter(std::chrono::milliseconds delay, Task task)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopped_) return;
        timers_.emplace(std::chrono::steady_clock::now() + delay, std::move(task));
    }
    Wake_();
}

void ControlLoop::Dispatch(const std::string        &step,
                           Work                      work,
                           std::chrono::milliseconds timeout,
                           Done                      done)
{
    if (!IsLoopThread())
    {
        Post([this, step, work = std::move(work), timeout, done = std::move(done)]() mutable
             {
                 Dispatch(step, std::move(work), timeout, std::move(done));
             });
        return;
    }

    auto flight   = std::make_shared<Flight>();
    auto done_ptr = std::make_shared<Done>(std::move(done));

    Worker &w = workers_.emplace_back();
    w.flight  = flight;
    w.thread  = std::jthread([this, flight, done_ptr, work = std::move(work)](std::stop_token st)
                             {
                                 std::exception_ptr ep;
                                 try
                                 {
                                     work(st);
                                 }
                                 catch (...)
                                 {
                                     ep = std::current_exception(); // передаём в done
                                 }
                                 Post([flight, done_ptr, ep]
                                      {
                                          if (!flight->settled.exchange(true)) (*done_ptr)(ep);
                                      });
                                 flight->finished.store(true);
                                 Wake_();
                             });

    std::stop_source ss = w.thread.get_stop_source();
    PostAfter(timeout, [flight, done_ptr, ss, step, timeout]() mutable
              {
                  if (flight->settled.exchange(true)) return;
                  ss.request_stop();
                  LOGW("loop") << step << ": no result after " << timeout.count() << " ms";
                  (*done_ptr)(std::make_exception_ptr(
                      HotspotError(ErrorCode::Timeout, step + " timed out", {}, step)));
              });
}

void ControlLoop::ReapWorkers_()
{
    for (auto it = workers_.begin(); it != workers_.end();)
    {
        if (it->flight->finished.load())
        {
            it->thread.join();
            it = workers_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void ControlLoop::ThreadLoop_(std::stop_token st)
{
    LOGD("loop") << "Thread started";
    while (!st.stop_requested())
    {
        ReapWorkers_();

        std::deque<Task> ready;
        int timeout_ms = -1;
        {
            std::lock_guard<std::mutex> lk(mu_);
            ready.swap(tasks_);

            const auto now = std::chrono::steady_clock::now();
            while (!timers_.empty() && timers_.begin()->first <= now)
            {
                ready.push_back(std::move(timers_.begin()->second));
                timers_.erase(timers_.begin());
            }
            if (!timers_.empty())
            {
                const auto wait = std::chrono::ceil<std::chrono::milliseconds>(timers_.begin()->first - now);
                timeout_ms = static_cast<int>(wait.count());
            }
        }

        if (!ready.empty())
        {
            for (Task &task : ready)
            {
                if (st.stop_requested()) break;
                try
                {
                    task();
                }
                catch (const std::exception &e)
                {
                    LOGE("loop") << "Task exception: " << e.what();
                }
            }
            continue;
        }

        pollfd pfd{wake_fd_, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, timeout_ms);
        if (rc < 0 && errno != EINTR)
        {
            LOGE("loop") << "poll failed errno=" << errno;
            break;
        }
        if (rc > 0)
        {
            DrainEventFd(wake_fd_);
        }
    }
    LOGD("loop") << "Thread exiting";
}

void ControlLoop::Stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopped_) return;
        stopped_ = true;
        tasks_.clear();
        timers_.clear();
    }

    if (thread_.joinable())
    {
        thread_.request_stop();
        Wake_();
        thread_.join();
    }

    for (Worker &w : workers_)
    {
        w.thread.request_stop();
    }
    workers_.clear(); // jthread join
    LOGD("loop") << "Stopped";
}
