#include "Errors.hpp"

#include <utility>

const char *ToString(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::Ok:                     return "Ok";
        case ErrorCode::InsufficientInterfaces: return "InsufficientInterfaces";
        case ErrorCode::NoUplink:               return "NoUplink";
        case ErrorCode::InvalidHint:            return "InvalidHint";
        case ErrorCode::InvalidConfig:          return "InvalidConfig";
        case ErrorCode::Busy:                   return "Busy";
        case ErrorCode::PlatformQueryError:     return "PlatformQueryError";
        case ErrorCode::ActivationFailed:       return "ActivationFailed";
        case ErrorCode::NatUnavailable:         return "NatUnavailable";
        case ErrorCode::NatApplyFailed:         return "NatApplyFailed";
        case ErrorCode::Timeout:                return "Timeout";
        case ErrorCode::Drift:                  return "Drift";
    }
    return "Unknown";
}

bool IsHelperError(ErrorCode code)
{
    return code == ErrorCode::NatUnavailable || code == ErrorCode::NatApplyFailed;
}

HotspotError::HotspotError(ErrorCode          code,
                           const std::string &message,
                           std::string        ifname,
                           std::string        step)
    : std::runtime_error(message)
    , code_(code)
    , ifname_(std::move(ifname))
    , step_(std::move(step))
{
}

Result Result::Success(std::string message)
{
    Result r;
    r.message = std::move(message);
    return r;
}

Result Result::FromError(const HotspotError &e)
{
    Result r;
    r.code    = e.Code();
    r.message = e.what();
    r.ifname  = e.Interface();
    r.step    = e.Step();
    return r;
}
