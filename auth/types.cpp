#include "auth/types.hpp"

#include <array>
#include <utility>

namespace auth
{

namespace
{

constexpr std::array reason_names{
    std::pair{AttemptReason::Success, std::string_view("success")},
    std::pair{AttemptReason::WrongMpin, std::string_view("wrong_mpin")},
    std::pair{AttemptReason::AccountLocked, std::string_view("account_locked")},
    std::pair{AttemptReason::FraudDetected, std::string_view("fraud_detected")},
    std::pair{AttemptReason::OtpFailed, std::string_view("otp_failed")},
    std::pair{AttemptReason::InvalidData, std::string_view("invalid_data")},
};

}

std::string_view to_string(AttemptReason r)
{
    for (const auto& [code, name] : reason_names)
    {
        if (code == r)
        {
            return name;
        }
    }
    return "invalid_data";
}

std::string_view to_string(RiskFlag f)
{
    switch (f)
    {
        case RiskFlag::FirstLogin:      return "first_login";
        case RiskFlag::NewIp:           return "new_ip";
        case RiskFlag::NewDevice:       return "new_device";
        case RiskFlag::RapidAttempts:   return "rapid_attempts";
        case RiskFlag::HighFailureRate: return "high_failure_rate";
        case RiskFlag::UnusualHour:     return "unusual_hour";
        case RiskFlag::DetectionError:  return "detection_error";
    }
    return "detection_error";
}

std::string_view to_string(RiskAction a)
{
    switch (a)
    {
        case RiskAction::Allow: return "allow";
        case RiskAction::Warn:  return "warn";
        case RiskAction::Block: return "block";
    }
    return "allow";
}

std::optional<AttemptReason> parse_reason(std::string_view s)
{
    for (const auto& [code, name] : reason_names)
    {
        if (name == s)
        {
            return code;
        }
    }
    return std::nullopt;
}

}
