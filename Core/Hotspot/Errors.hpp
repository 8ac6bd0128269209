#pragma once

#include <stdexcept>
#include <string>

/**
 * @file Errors.hpp
 * @brief Таксономия ошибок ядра хотспота и значение результата публичных вызовов.
 */

enum class ErrorCode : int
{
    Ok                     = 0,
    InsufficientInterfaces = 1,
    NoUplink               = 2,
    InvalidHint            = 3,
    InvalidConfig          = 4,
    Busy                   = 5,
    PlatformQueryError     = 6,
    ActivationFailed       = 7,
    NatUnavailable         = 8,  ///< HelperError: помощник не запущен или не авторизован.
    NatApplyFailed         = 9,  ///< HelperError: помощник отработал с ошибкой.
    Timeout                = 10,
    Drift                  = 11,
};

const char *ToString(ErrorCode code);

/**
 * @brief Относится ли код к ошибкам привилегированного NAT-помощника.
 */
bool IsHelperError(ErrorCode code);

/**
 * @brief Исключение ядра: код, интерфейс, к которому относится ошибка, и шаг.
 */
class HotspotError : public std::runtime_error
{
public:
    HotspotError(ErrorCode          code,
                 const std::string &message,
                 std::string        ifname = {},
                 std::string        step   = {});

    ErrorCode          Code() const noexcept { return code_; }
    const std::string &Interface() const noexcept { return ifname_; }
    const std::string &Step() const noexcept { return step_; }

private:
    ErrorCode   code_;
    std::string ifname_;
    std::string step_;
};

/**
 * @brief Результат публичного вызова контроллера.
 */
struct Result
{
    ErrorCode   code = ErrorCode::Ok;
    std::string message;
    std::string ifname;
    std::string step;

    bool IsOk() const noexcept { return code == ErrorCode::Ok; }

    static Result Success(std::string message = {});
    static Result FromError(const HotspotError &e);
};
