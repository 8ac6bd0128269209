#pragma once

#include "Errors.hpp"
#include "NatHelperRunner.hpp"
#include "Types.hpp"

#include <chrono>
#include <optional>

/**
 * @file NatCoordinator.hpp
 * @brief Решает, какие NAT-правила нужны, и запрашивает их у помощника.
 *
 * Сам nftables не трогает. Ошибки - HotspotError(NatUnavailable | NatApplyFailed).
 */

/**
 * @brief Результат проверки установленных правил.
 */
struct NatCheck
{
    enum class Status
    {
        Installed, ///< Стоят ровно для запрошенной пары.
        Absent,
        OtherPair, ///< Стоят для другой пары (или неполный набор).
        Unknown,   ///< Помощник недоступен или ответил ошибкой.
    };

    Status                    status = Status::Unknown;
    std::optional<NatRuleSet> installed;
};

class NatCoordinator
{
public:
    struct Params
    {
        std::chrono::milliseconds helper_timeout{15000}; ///< На один запуск помощника.
        int                       remove_retries = 3;    ///< Попыток снять правила.
        std::chrono::milliseconds retry_delay{300};
    };

    NatCoordinator(NatHelperRunner &runner, const Params &params);

    NatCoordinator(const NatCoordinator&)            = delete;
    NatCoordinator& operator=(const NatCoordinator&) = delete;

    void Apply(const NatRuleSet &rules);

    // С повторами; после исчерпания - бросает последнюю ошибку.
    void Remove(const NatRuleSet &rules);

    NatCheck Check(const NatRuleSet &rules);

    // Перевод итога запуска в ошибку; nullopt - успех.
    static std::optional<HotspotError> MapOutcome(const HelperOutcome &outcome,
                                                  const NatRuleSet    &rules,
                                                  const char          *step);

private:
    NatHelperRunner &runner_;
    Params           p_;
};
