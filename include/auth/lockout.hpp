#pragma once

#include "auth/identity_record.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace auth
{

/**
 * Unlocked(failures) / Locked(until) transitions over a LockoutState value.
 * The machine holds no per-identity state; callers persist the result.
 */
class LockoutStateMachine
{
public:
    static constexpr uint32_t default_max_failures = 5;
    static constexpr std::chrono::seconds default_duration{30 * 60};

    struct Gate
    {
        bool locked = false;
        std::optional<timestamp_t> until;
        LockoutState state;      // state to persist if `changed`
        bool changed = false;    // an expired lock was cleared
    };

    explicit LockoutStateMachine(uint32_t max_failures = default_max_failures,
                                 std::chrono::seconds duration = default_duration);

    [[nodiscard]] Gate check(const LockoutState& st, timestamp_t now) const;
    [[nodiscard]] LockoutState on_failure(const LockoutState& st, timestamp_t now) const;
    [[nodiscard]] LockoutState on_success(const LockoutState& st) const;

    [[nodiscard]] static bool is_locked(const LockoutState& st, timestamp_t now)
    {
        return st.locked_until.has_value() && now < *st.locked_until;
    }

    [[nodiscard]] uint32_t attempts_remaining(const LockoutState& st) const;

    [[nodiscard]] uint32_t max_failures() const { return max_fail; }
    [[nodiscard]] std::chrono::seconds duration() const { return lock_for; }

private:
    uint32_t max_fail;
    std::chrono::seconds lock_for;
};

}
