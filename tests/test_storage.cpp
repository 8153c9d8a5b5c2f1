#include <catch2/catch_test_macros.hpp>

#include "storage/sqlite_store.hpp"
#include "auth/attempt_ledger.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using auth::AttemptReason;
using auth::AttemptRecord;
using auth::LockoutState;

namespace
{

struct StoreFixture
{
    storage::Database db = storage::Database::open(":memory:").value();
    storage::SqliteIdentityStore identities{db};
    storage::SqliteAttemptStore attempts{db};
    auth::timestamp_t now = test_support::noon();

    StoreFixture()
    {
        REQUIRE(identities.init_schema().has_value());
        REQUIRE(attempts.init_schema().has_value());
    }

    auth::NewIdentity identity(std::string phone, bool with_device = true)
    {
        auth::NewIdentity n{std::move(phone), std::string(128, 'a'), std::string(64, 'b'), std::nullopt, now};
        if (with_device)
        {
            n.device = auth::DeviceBinding{"dev-1", "Mozilla/5.0", now, true};
        }
        return n;
    }

    AttemptRecord row(std::string phone, bool ok, auth::timestamp_t at, std::string fp = "dev-1")
    {
        return AttemptRecord{std::move(phone), "10.0.0.1", std::move(fp), "ua", ok,
                             ok ? AttemptReason::Success : AttemptReason::WrongMpin, 0, at};
    }
};

}

TEST_CASE_METHOD(StoreFixture, "Identity create and find round-trip")
{
    auto created = identities.create(identity("9876543210"));
    REQUIRE(created.has_value());
    CHECK(created->id > 0);

    auto found = identities.find("9876543210");
    REQUIRE(found.has_value());
    REQUIRE(found->has_value());

    const auto& rec = **found;
    CHECK(rec.id == created->id);
    CHECK(rec.mpin_hash == std::string(128, 'a'));
    CHECK(rec.mpin_salt == std::string(64, 'b'));
    CHECK(rec.lockout == LockoutState{});
    CHECK(rec.created_at == now);
    CHECK_FALSE(rec.last_login.has_value());
    REQUIRE(rec.devices.size() == 1);
    CHECK(rec.devices[0].fingerprint == "dev-1");
    CHECK(rec.devices[0].trusted);
}

TEST_CASE_METHOD(StoreFixture, "Unknown phone finds nothing")
{
    auto found = identities.find("1111111111");
    REQUIRE(found.has_value());
    CHECK_FALSE(found->has_value());
}

TEST_CASE_METHOD(StoreFixture, "Duplicate phone is a conflict and keeps the first row")
{
    REQUIRE(identities.create(identity("9876543210")).has_value());

    auto dup = identity("9876543210", false);
    dup.mpin_hash = std::string(128, 'c');
    auto second = identities.create(dup);
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error().code == storage::StoreError::errc::Conflict);

    auto found = identities.find("9876543210");
    REQUIRE(found.has_value());
    REQUIRE(found->has_value());
    CHECK((*found)->mpin_hash == std::string(128, 'a'));

    // The failed insert left no transaction open.
    CHECK(identities.create(identity("1234567890")).has_value());
}

TEST_CASE_METHOD(StoreFixture, "Lockout compare-and-swap detects a lost race")
{
    auto rec = identities.create(identity("9876543210"));
    REQUIRE(rec.has_value());

    LockoutState one{1, std::nullopt};
    auto ok = identities.compare_and_swap_lockout(rec->id, LockoutState{}, one);
    REQUIRE(ok.has_value());
    CHECK(*ok);

    // A writer still holding the old value loses.
    auto stale = identities.compare_and_swap_lockout(rec->id, LockoutState{}, LockoutState{1, std::nullopt});
    REQUIRE(stale.has_value());
    CHECK_FALSE(*stale);

    LockoutState locked{0, now + 30min};
    auto lock = identities.compare_and_swap_lockout(rec->id, one, locked);
    REQUIRE(lock.has_value());
    CHECK(*lock);

    auto found = identities.find("9876543210");
    REQUIRE(found.has_value());
    REQUIRE(found->has_value());
    CHECK((*found)->lockout == locked);

    auto clear = identities.compare_and_swap_lockout(rec->id, locked, LockoutState{});
    REQUIRE(clear.has_value());
    CHECK(*clear);
}

TEST_CASE_METHOD(StoreFixture, "Device upsert adds new and refreshes known devices")
{
    auto rec = identities.create(identity("9876543210"));
    REQUIRE(rec.has_value());

    REQUIRE(identities.upsert_device(rec->id, {"dev-1", "Firefox", now + 1h, true}).has_value());
    REQUIRE(identities.upsert_device(rec->id, {"dev-2", "Chrome", now + 2h, true}).has_value());

    auto found = identities.find("9876543210");
    REQUIRE(found.has_value());
    REQUIRE(found->has_value());

    const auto& devices = (*found)->devices;
    REQUIRE(devices.size() == 2);
    CHECK(devices[0].fingerprint == "dev-2");
    CHECK(devices[1].fingerprint == "dev-1");
    CHECK(devices[1].user_agent == "Firefox");
    CHECK(devices[1].last_used == now + 1h);
}

TEST_CASE_METHOD(StoreFixture, "Last login and listing")
{
    auto a = identities.create(identity("9876543210"));
    auto b = identities.create(identity("1234567890", false));
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());

    REQUIRE(identities.touch_last_login(b->id, now + 5min).has_value());

    auto all = identities.list();
    REQUIRE(all.has_value());
    REQUIRE(all->size() == 2);
    CHECK((*all)[0].phone == "9876543210");
    CHECK((*all)[0].devices.size() == 1);
    CHECK((*all)[1].last_login == now + 5min);
    CHECK((*all)[1].mpin_hash.empty());
}

TEST_CASE_METHOD(StoreFixture, "Attempt query is newest first, windowed and limited")
{
    REQUIRE(attempts.append(row("9876543210", true, now - 3h)).has_value());
    REQUIRE(attempts.append(row("9876543210", false, now - 1h)).has_value());
    REQUIRE(attempts.append(row("9876543210", false, now - 2h)).has_value());
    REQUIRE(attempts.append(row("1234567890", true, now - 1h)).has_value());
    REQUIRE(attempts.append(row("9876543210", true, now - 40h)).has_value());

    auto rows = attempts.query("9876543210", now - 24h, 50);
    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 3);
    CHECK((*rows)[0].timestamp == now - 1h);
    CHECK((*rows)[1].timestamp == now - 2h);
    CHECK((*rows)[2].timestamp == now - 3h);
    CHECK((*rows)[0].reason == AttemptReason::WrongMpin);

    auto limited = attempts.query("9876543210", now - 24h, 2);
    REQUIRE(limited.has_value());
    CHECK(limited->size() == 2);
}

TEST_CASE_METHOD(StoreFixture, "Ledger fills in unknown fingerprints and clamps scores")
{
    auth::AttemptLedger ledger(attempts);

    auto r = row("9876543210", true, now, "");
    r.risk_score = 140;
    ledger.record(r);

    auto rows = ledger.recent_for("9876543210", now - 1h, 10);
    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 1);
    CHECK((*rows)[0].fingerprint == "unknown");
    CHECK((*rows)[0].risk_score == 100);
}

TEST_CASE_METHOD(StoreFixture, "Ledger purge honours the retention window")
{
    auth::AttemptLedger ledger(attempts);
    CHECK(ledger.retention() == std::chrono::seconds(90 * 24h));

    ledger.record(row("9876543210", true, now - std::chrono::days(91)));
    ledger.record(row("9876543210", true, now - std::chrono::days(89)));
    ledger.record(row("9876543210", false, now));

    auto removed = ledger.purge_expired(now);
    REQUIRE(removed.has_value());
    CHECK(*removed == 1);

    auto rows = ledger.recent_for("9876543210", now - std::chrono::days(365), 50);
    REQUIRE(rows.has_value());
    CHECK(rows->size() == 2);
}

TEST_CASE("Ledger record survives a failing store")
{
    struct BrokenStore : storage::AttemptStore
    {
        int appends = 0;

        storage::store_result<void> append(const AttemptRecord&) override
        {
            ++appends;
            return std::unexpected(storage::StoreError{storage::StoreError::errc::Unavailable, "read-only"});
        }
        storage::store_result<std::vector<AttemptRecord>> query(std::string_view, auth::timestamp_t, size_t) override
        {
            return std::unexpected(storage::StoreError{storage::StoreError::errc::Unavailable, "read-only"});
        }
        storage::store_result<size_t> purge_before(auth::timestamp_t) override
        {
            return std::unexpected(storage::StoreError{storage::StoreError::errc::Unavailable, "read-only"});
        }
    };

    BrokenStore store;
    auth::AttemptLedger ledger(store);

    ledger.record(AttemptRecord{"9876543210", "ip", "fp", "ua", true, AttemptReason::Success, 0, test_support::noon()});
    CHECK(store.appends == 1);
    CHECK_FALSE(ledger.recent_for("9876543210", test_support::noon(), 10).has_value());
    CHECK_FALSE(ledger.purge_expired(test_support::noon()).has_value());
}

TEST_CASE_METHOD(StoreFixture, "Removing an identity drops its devices")
{
    auto created = identities.create(identity("9876543210"));
    REQUIRE(created.has_value());

    REQUIRE(identities.remove(created->id).has_value());

    auto found = identities.find("9876543210");
    REQUIRE(found.has_value());
    CHECK_FALSE(found->has_value());

    {
        auto lk = db.lock();
        auto stmt = db.prepare("SELECT COUNT(*) FROM devices;");
        REQUIRE(stmt);
        REQUIRE(sqlite3_step(stmt.get()) == SQLITE_ROW);
        CHECK(sqlite3_column_int(stmt.get(), 0) == 0);
    }

    CHECK(identities.remove(created->id).has_value());
    CHECK(identities.create(identity("9876543210")).has_value());
}
