#include <catch2/catch_test_macros.hpp>

#include "auth/lockout.hpp"
#include "test_support.hpp"

using auth::LockoutState;
using auth::LockoutStateMachine;
using namespace std::chrono_literals;

TEST_CASE("Failures count up until the threshold locks")
{
    LockoutStateMachine m;
    auto now = test_support::noon();
    LockoutState st;

    for (uint32_t i = 1; i < 5; ++i)
    {
        st = m.on_failure(st, now);
        CHECK(st.failures == i);
        CHECK_FALSE(st.locked_until.has_value());
        CHECK(m.attempts_remaining(st) == 5 - i);
    }

    st = m.on_failure(st, now);
    CHECK(st.failures == 0);
    REQUIRE(st.locked_until.has_value());
    CHECK(*st.locked_until == now + 30min);
    CHECK(m.attempts_remaining(st) == 0);
}

TEST_CASE("Success resets to Unlocked(0) from any count")
{
    LockoutStateMachine m;
    LockoutState st{3, std::nullopt};
    CHECK(m.on_success(st) == LockoutState{});
}

TEST_CASE("Locked gate rejects until expiry")
{
    LockoutStateMachine m;
    auto now = test_support::noon();
    LockoutState st{0, now + 30min};

    auto gate = m.check(st, now + 29min);
    CHECK(gate.locked);
    CHECK(gate.until == st.locked_until);
    CHECK_FALSE(gate.changed);
    CHECK(LockoutStateMachine::is_locked(st, now + 29min));
}

TEST_CASE("Expired lock reads as Unlocked(0)")
{
    LockoutStateMachine m;
    auto now = test_support::noon();
    LockoutState st{0, now};

    auto gate = m.check(st, now);
    CHECK_FALSE(gate.locked);
    CHECK(gate.changed);
    CHECK(gate.state == LockoutState{});

    // A failure right after expiry starts again from one.
    auto next = m.on_failure(st, now + 1s);
    CHECK(next.failures == 1);
    CHECK_FALSE(next.locked_until.has_value());
}

TEST_CASE("Unlocked state passes the gate unchanged")
{
    LockoutStateMachine m;
    LockoutState st{2, std::nullopt};
    auto gate = m.check(st, test_support::noon());
    CHECK_FALSE(gate.locked);
    CHECK_FALSE(gate.changed);
    CHECK(gate.state == st);
}

TEST_CASE("Threshold and duration are configurable")
{
    LockoutStateMachine m(3, 10min);
    auto now = test_support::noon();

    auto st = m.on_failure(m.on_failure(LockoutState{}, now), now);
    CHECK(m.attempts_remaining(st) == 1);

    st = m.on_failure(st, now);
    REQUIRE(st.locked_until.has_value());
    CHECK(*st.locked_until == now + 10min);
    CHECK(m.max_failures() == 3);
}
