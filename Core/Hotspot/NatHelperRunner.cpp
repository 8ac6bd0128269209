#include "NatHelperRunner.hpp"
#include "Core/Logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
    using Clock = std::chrono::steady_clock;

    int MsLeft(Clock::time_point deadline)
    {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        return left > 0 ? static_cast<int>(left) : 0;
    }

    // waitpid с дедлайном; false - процесс ещё жив
    bool WaitUntil(pid_t pid, int &status, Clock::time_point deadline)
    {
        while (true)
        {
            const pid_t rc = ::waitpid(pid, &status, WNOHANG);
            if (rc == pid) return true;
            if (rc < 0 && errno != EINTR) return true; // уже собран
            if (Clock::now() >= deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    // false - процесс пережил SIGKILL (root-потомок pkexec не даёт себя убить)
    bool Terminate(pid_t pid, int &status, std::chrono::milliseconds grace)
    {
        if (::kill(pid, SIGTERM) != 0)
        {
            LOGW("nat") << "helper SIGTERM failed errno=" << errno;
        }
        if (WaitUntil(pid, status, Clock::now() + grace)) return true;

        if (::kill(pid, SIGKILL) != 0)
        {
            LOGW("nat") << "helper SIGKILL failed errno=" << errno;
        }
        return WaitUntil(pid, status, Clock::now() + grace);
    }
}

PkexecHelperRunner::PkexecHelperRunner(const Params &params)
    : p_(params)
{
}

PkexecHelperRunner::~PkexecHelperRunner()
{
    ReapOrphans_();
    std::lock_guard<std::mutex> lk(orphans_mu_);
    for (pid_t pid : orphans_)
    {
        LOGW("nat") << "helper pid=" << pid << " still running, left to init";
    }
}

std::size_t PkexecHelperRunner::OrphanCount() const
{
    std::lock_guard<std::mutex> lk(orphans_mu_);
    return orphans_.size();
}

void PkexecHelperRunner::ReapOrphans_()
{
    std::lock_guard<std::mutex> lk(orphans_mu_);
    for (auto it = orphans_.begin(); it != orphans_.end();)
    {
        int status = 0;
        const pid_t rc = ::waitpid(*it, &status, WNOHANG);
        if (rc == *it || (rc < 0 && errno != EINTR))
        {
            LOGD("nat") << "helper pid=" << *it << " reaped";
            it = orphans_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

HelperOutcome PkexecHelperRunner::Run(NatRules::Action           action,
                                      const std::string         &hotspot_if,
                                      const std::string         &uplink_if,
                                      std::chrono::milliseconds  timeout)
{
    HelperOutcome out;
    ReapOrphans_();

    if (::access(p_.helper_path.c_str(), X_OK) != 0)
    {
        out.error = "helper not found: " + p_.helper_path;
        LOGW("nat") << out.error;
        return out;
    }

    const bool elevated = ::geteuid() == 0;
    if (!elevated && ::access(p_.pkexec_path.c_str(), X_OK) != 0)
    {
        out.error = "pkexec not found: " + p_.pkexec_path;
        LOGW("nat") << out.error;
        return out;
    }

    std::vector<std::string> args;
    if (!elevated) args.push_back(p_.pkexec_path);
    args.push_back(p_.helper_path);
    args.push_back(NatRules::ToString(action));
    args.push_back(hotspot_if);
    args.push_back(uplink_if);

    std::vector<char *> argv;
    for (std::string &a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    int pipefd[2] = {-1, -1};
    if (::pipe2(pipefd, O_CLOEXEC) != 0)
    {
        out.error = std::string("pipe2 failed: ") + std::strerror(errno);
        LOGE("nat") << out.error;
        return out;
    }

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        out.error = std::string("fork failed: ") + std::strerror(errno);
        LOGE("nat") << out.error;
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return out;
    }

    if (pid == 0)
    {
        // дочерний: только async-signal-safe вызовы
        ::dup2(pipefd[1], STDOUT_FILENO);
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(pipefd[1]);
    out.launched = true;
    LOGD("nat") << "helper started pid=" << pid << " action=" << NatRules::ToString(action)
                << " hs=" << hotspot_if << " up=" << uplink_if;

    const Clock::time_point deadline = Clock::now() + timeout;
    char buf[512];
    bool eof = false;
    while (!eof)
    {
        const int left = MsLeft(deadline);
        if (left == 0) break;

        pollfd pfd{pipefd[0], POLLIN, 0};
        const int rc = ::poll(&pfd, 1, left);
        if (rc < 0)
        {
            if (errno == EINTR) continue;
            LOGE("nat") << "poll on helper output failed errno=" << errno;
            break;
        }
        if (rc == 0) break;

        const ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n > 0)
        {
            out.output.append(buf, static_cast<std::size_t>(n));
        }
        else if (n == 0 || errno != EINTR)
        {
            eof = true;
        }
    }
    ::close(pipefd[0]);

    int status = 0;
    if (!WaitUntil(pid, status, deadline))
    {
        LOGW("nat") << "helper pid=" << pid << " exceeded " << timeout.count() << " ms, killing";
        if (!Terminate(pid, status, p_.kill_grace))
        {
            LOGE("nat") << "helper pid=" << pid << " survived SIGKILL, will be reaped later";
            std::lock_guard<std::mutex> lk(orphans_mu_);
            orphans_.push_back(pid);
        }
        out.timed_out = true;
        return out;
    }

    if (WIFEXITED(status))
    {
        out.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        out.error = "helper killed by signal " + std::to_string(WTERMSIG(status));
    }
    LOGD("nat") << "helper pid=" << pid << " exit=" << out.exit_code;
    return out;
}
