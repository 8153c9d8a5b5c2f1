#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace auth
{

using timestamp_t = std::chrono::system_clock::time_point;
using Clock = std::function<timestamp_t()>;

[[nodiscard]] inline Clock system_clock()
{
    return [] { return std::chrono::system_clock::now(); };
}

[[nodiscard]] inline int64_t to_unix_ms(timestamp_t tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] inline timestamp_t from_unix_ms(int64_t ms)
{
    return timestamp_t(std::chrono::duration_cast<timestamp_t::duration>(std::chrono::milliseconds(ms)));
}

enum class AttemptReason : uint8_t
{
    Success,
    WrongMpin,
    AccountLocked,
    FraudDetected,
    OtpFailed,
    InvalidData,
};

enum class RiskFlag : uint8_t
{
    FirstLogin,
    NewIp,
    NewDevice,
    RapidAttempts,
    HighFailureRate,
    UnusualHour,
    DetectionError,
};

enum class RiskAction : uint8_t
{
    Allow,
    Warn,
    Block,
};

using risk_flags_t = std::vector<RiskFlag>;

[[nodiscard]] std::string_view to_string(AttemptReason r);
[[nodiscard]] std::string_view to_string(RiskFlag f);
[[nodiscard]] std::string_view to_string(RiskAction a);

[[nodiscard]] std::optional<AttemptReason> parse_reason(std::string_view s);

}
