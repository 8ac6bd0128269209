#pragma once

#include "Core/Helper/NatRules.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

/**
 * @file NatHelperRunner.hpp
 * @brief Запуск привилегированного NAT-помощника как отдельного процесса.
 */

/**
 * @brief Итог одного запуска помощника.
 */
struct HelperOutcome
{
    bool        launched  = false; ///< Процесс стартовал (бинарники на месте, fork/exec прошли).
    bool        timed_out = false; ///< Не уложился в таймаут и был убит.
    int         exit_code = -1;    ///< Код выхода, если процесс завершился сам.
    std::string output;            ///< stdout помощника.
    std::string error;             ///< Почему не запустился.
};

class NatHelperRunner
{
public:
    virtual ~NatHelperRunner() = default;

    virtual HelperOutcome Run(NatRules::Action           action,
                              const std::string         &hotspot_if,
                              const std::string         &uplink_if,
                              std::chrono::milliseconds  timeout) = 0;
};

/**
 * @brief Запуск через pkexec (или напрямую, если мы уже root).
 */
class PkexecHelperRunner : public NatHelperRunner
{
public:
    struct Params
    {
        std::string helper_path = "/usr/local/libexec/hotspot-nat-helper";
        std::string pkexec_path = "/usr/bin/pkexec";
        std::chrono::milliseconds kill_grace{500}; ///< Ожидание после SIGTERM и после SIGKILL.
    };

    explicit PkexecHelperRunner(const Params &params);
    ~PkexecHelperRunner() override;

    PkexecHelperRunner(const PkexecHelperRunner&)            = delete;
    PkexecHelperRunner& operator=(const PkexecHelperRunner&) = delete;

    HelperOutcome Run(NatRules::Action           action,
                      const std::string         &hotspot_if,
                      const std::string         &uplink_if,
                      std::chrono::milliseconds  timeout) override;

    /// Убитые по таймауту процессы, которые ещё не удалось собрать.
    std::size_t OrphanCount() const;

private:
    void ReapOrphans_();

private:
    Params p_;

    mutable std::mutex orphans_mu_;
    std::vector<pid_t> orphans_;
};
