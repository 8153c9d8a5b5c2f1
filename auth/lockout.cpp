#include "auth/lockout.hpp"

#include <algorithm>

namespace auth
{

LockoutStateMachine::LockoutStateMachine(uint32_t max_failures, std::chrono::seconds duration)
    : max_fail(std::max<uint32_t>(max_failures, 1))
    , lock_for(duration)
{
}

LockoutStateMachine::Gate LockoutStateMachine::check(const LockoutState& st, timestamp_t now) const
{
    if (!st.locked_until)
    {
        return Gate{false, std::nullopt, st, false};
    }

    if (now < *st.locked_until)
    {
        return Gate{true, st.locked_until, st, false};
    }

    return Gate{false, std::nullopt, LockoutState{}, true};
}

LockoutState LockoutStateMachine::on_failure(const LockoutState& st, timestamp_t now) const
{
    // An expired lock counts as Unlocked(0).
    uint32_t base = st.locked_until ? 0 : st.failures;
    uint32_t next = base + 1;

    if (next >= max_fail)
    {
        return LockoutState{0, now + lock_for};
    }
    return LockoutState{next, std::nullopt};
}

LockoutState LockoutStateMachine::on_success(const LockoutState&) const
{
    return LockoutState{};
}

uint32_t LockoutStateMachine::attempts_remaining(const LockoutState& st) const
{
    if (st.locked_until)
    {
        return 0;
    }
    return st.failures >= max_fail ? 0 : max_fail - st.failures;
}

}
