#pragma once

#include "auth/attempt_ledger.hpp"
#include "auth/types.hpp"

#include <chrono>
#include <functional>
#include <string_view>

namespace auth
{

struct RiskAssessment
{
    int score = 0;
    risk_flags_t flags;
    RiskAction action = RiskAction::Allow;

    [[nodiscard]] bool has(RiskFlag f) const;
};

/**
 * Additive point model over an identity's recent attempt history.
 *
 *   first_login        +5   (empty history; other history rules skipped)
 *   new_ip             +20  (ip unseen among successful attempts)
 *   new_device         +25  (fingerprint unseen among successful attempts)
 *   rapid_attempts     +30  (more than 3 attempts inside the rapid window)
 *   high_failure_rate  +15  (failures are more than half of history)
 *   unusual_hour       +10  (local hour in [2, 5])
 *
 * Score is clamped to [0, 100]; <= 30 allow, <= 60 warn, otherwise block.
 */
class RiskScorer
{
public:
    struct Options
    {
        std::chrono::hours history_window{24 * 30};
        size_t history_limit = 50;
        std::chrono::seconds rapid_window{5 * 60};
        std::chrono::minutes utc_offset{0};
    };

    static constexpr int first_login_points = 5;
    static constexpr int new_ip_points = 20;
    static constexpr int new_device_points = 25;
    static constexpr int rapid_attempts_points = 30;
    static constexpr int high_failure_points = 15;
    static constexpr int unusual_hour_points = 10;
    static constexpr size_t rapid_attempts_threshold = 3;

    static constexpr int allow_ceiling = 30;
    static constexpr int warn_ceiling = 60;

    RiskScorer(AttemptLedger& ledger, Options opts);
    explicit RiskScorer(AttemptLedger& ledger);

    [[nodiscard]] RiskAssessment score(std::string_view phone,
                                       std::string_view current_ip,
                                       std::string_view current_fingerprint,
                                       timestamp_t now) const;

    // Scores a history that was already fetched; history is newest first.
    [[nodiscard]] RiskAssessment evaluate(const std::vector<AttemptRecord>& history,
                                          std::string_view current_ip,
                                          std::string_view current_fingerprint,
                                          timestamp_t now) const;

    [[nodiscard]] static RiskAction action_for(int score);
    [[nodiscard]] static RiskAssessment fallback();

    [[nodiscard]] const Options& options() const { return opts; }

private:
    [[nodiscard]] int local_hour(timestamp_t now) const;

    std::reference_wrapper<AttemptLedger> ledger;
    Options opts;
};

}
