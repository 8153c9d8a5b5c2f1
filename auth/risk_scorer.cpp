#include "auth/risk_scorer.hpp"
#include "logger/logger.hpp"

#include <algorithm>
#include <ranges>
#include <unordered_set>
#include <string>

namespace auth
{

bool RiskAssessment::has(RiskFlag f) const
{
    return std::ranges::find(flags, f) != flags.end();
}

RiskScorer::RiskScorer(AttemptLedger& l, Options o)
    : ledger(l)
    , opts(o)
{
}

RiskScorer::RiskScorer(AttemptLedger& l)
    : RiskScorer(l, Options{})
{
}

RiskAction RiskScorer::action_for(int score)
{
    if (score > warn_ceiling)
    {
        return RiskAction::Block;
    }
    if (score > allow_ceiling)
    {
        return RiskAction::Warn;
    }
    return RiskAction::Allow;
}

RiskAssessment RiskScorer::fallback()
{
    return RiskAssessment{10, {RiskFlag::DetectionError}, RiskAction::Allow};
}

int RiskScorer::local_hour(timestamp_t now) const
{
    auto local = std::chrono::floor<std::chrono::minutes>(now) + opts.utc_offset;
    auto since_midnight = local - std::chrono::floor<std::chrono::days>(local);
    return static_cast<int>(std::chrono::duration_cast<std::chrono::hours>(since_midnight).count());
}

RiskAssessment RiskScorer::score(std::string_view phone,
                                 std::string_view current_ip,
                                 std::string_view current_fingerprint,
                                 timestamp_t now) const
{
    auto history = ledger.get().recent_for(phone, now - opts.history_window, opts.history_limit);
    if (!history)
    {
        LOG_ERROR("Fraud detection error for {}: {}", mask_phone(phone), history.error());
        return fallback();
    }
    return evaluate(*history, current_ip, current_fingerprint, now);
}

RiskAssessment RiskScorer::evaluate(const std::vector<AttemptRecord>& history,
                                    std::string_view current_ip,
                                    std::string_view current_fingerprint,
                                    timestamp_t now) const
{
    RiskAssessment out;
    auto add = [&out](RiskFlag f, int points)
    {
        out.flags.push_back(f);
        out.score += points;
    };

    if (history.empty())
    {
        add(RiskFlag::FirstLogin, first_login_points);
    }
    else
    {
        std::unordered_set<std::string_view> known_ips;
        std::unordered_set<std::string_view> known_fps;
        for (const auto& a : history | std::views::filter(&AttemptRecord::success))
        {
            known_ips.insert(a.ip);
            known_fps.insert(a.fingerprint);
        }

        if (!known_ips.empty() && !known_ips.contains(current_ip))
        {
            add(RiskFlag::NewIp, new_ip_points);
        }

        if (!known_fps.empty() && !known_fps.contains(current_fingerprint))
        {
            add(RiskFlag::NewDevice, new_device_points);
        }

        auto rapid_since = now - opts.rapid_window;
        auto rapid = std::ranges::count_if(history, [&](const AttemptRecord& a) { return a.timestamp >= rapid_since; });
        if (static_cast<size_t>(rapid) > rapid_attempts_threshold)
        {
            add(RiskFlag::RapidAttempts, rapid_attempts_points);
        }

        // failed / total > 1/2, kept in integers
        auto failed = std::ranges::count_if(history, [](const AttemptRecord& a) { return !a.success; });
        if (failed * 2 > static_cast<std::ptrdiff_t>(history.size()))
        {
            add(RiskFlag::HighFailureRate, high_failure_points);
        }
    }

    if (int hour = local_hour(now); hour >= 2 && hour <= 5)
    {
        add(RiskFlag::UnusualHour, unusual_hour_points);
    }

    out.score = std::clamp(out.score, 0, 100);
    out.action = action_for(out.score);
    return out;
}

}
