#include "storage/sqlite_store.hpp"
#include "logger/logger.hpp"

#include <format>

namespace storage
{

using auth::to_unix_ms;
using auth::from_unix_ms;

namespace
{

StoreError unavailable(Database& db, std::string_view what)
{
    return StoreError{StoreError::errc::Unavailable, std::format("{}: {}", what, db.errmsg())};
}

std::string column_text(sqlite3_stmt* stmt, int col)
{
    const auto* txt = sqlite3_column_text(stmt, col);
    return txt ? std::string(reinterpret_cast<const char*>(txt)) : std::string{};
}

std::optional<auth::timestamp_t> column_time(sqlite3_stmt* stmt, int col)
{
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL)
    {
        return std::nullopt;
    }
    return from_unix_ms(sqlite3_column_int64(stmt, col));
}

void bind_text(sqlite3_stmt* stmt, int idx, std::string_view sv)
{
    sqlite3_bind_text(stmt, idx, sv.data(), static_cast<int>(sv.size()), SQLITE_TRANSIENT);
}

void bind_time(sqlite3_stmt* stmt, int idx, const std::optional<auth::timestamp_t>& tp)
{
    if (tp)
    {
        sqlite3_bind_int64(stmt, idx, to_unix_ms(*tp));
    }
    else
    {
        sqlite3_bind_null(stmt, idx);
    }
}

bool is_constraint(int rc)
{
    return (rc & 0xFF) == SQLITE_CONSTRAINT;
}

}

std::expected<Database, std::string> Database::open(std::string_view db_path)
{
    sqlite3* handle = nullptr;
    int rc = sqlite3_open(std::string(db_path).c_str(), &handle);
    if (rc != SQLITE_OK)
    {
        std::string err = handle ? sqlite3_errmsg(handle) : "out of memory";
        sqlite3_close(handle);
        return std::unexpected(err);
    }

    Database db(handle);

    sqlite3_busy_timeout(handle, 5000);
    if (!db.exec("PRAGMA journal_mode=WAL;") ||
        !db.exec("PRAGMA synchronous=NORMAL;") ||
        !db.exec("PRAGMA foreign_keys=ON;"))
    {
        return std::unexpected(std::format("Failed to configure database: {}", db.errmsg()));
    }

    return db;
}

Database::Database(sqlite3* handle)
    : db(handle)
    , mtx(std::make_unique<std::mutex>())
{
}

Database::~Database()
{
    if (db)
    {
        sqlite3_close(db);
    }
}

Database::Database(Database&& other) noexcept
    : db(other.db)
    , mtx(std::move(other.mtx))
{
    other.db = nullptr;
}

Database& Database::operator=(Database&& other) noexcept
{
    if (this != &other)
    {
        if (db) sqlite3_close(db);
        db = other.db;
        mtx = std::move(other.mtx);
        other.db = nullptr;
    }
    return *this;
}

Database::stmt_ptr Database::prepare(std::string_view sql)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr) != SQLITE_OK)
    {
        return stmt_ptr(nullptr, sqlite3_finalize);
    }
    return stmt_ptr(stmt, sqlite3_finalize);
}

bool Database::exec(const char* sql)
{
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, std::addressof(err));
    if (err)
    {
        sqlite3_free(err);
    }
    return rc == SQLITE_OK;
}

std::string Database::errmsg() const
{
    return db ? sqlite3_errmsg(db) : "database closed";
}

SqliteIdentityStore::SqliteIdentityStore(Database& database)
    : db(database)
{
}

std::expected<void, std::string> SqliteIdentityStore::init_schema()
{
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS identities (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            phone TEXT NOT NULL UNIQUE,
            mpin_hash TEXT NOT NULL,
            mpin_salt TEXT NOT NULL,
            failed_attempts INTEGER NOT NULL DEFAULT 0,
            locked_until INTEGER,
            created_at INTEGER NOT NULL,
            last_login INTEGER
        );

        CREATE TABLE IF NOT EXISTS devices (
            identity_id INTEGER NOT NULL REFERENCES identities(id) ON DELETE CASCADE,
            fingerprint TEXT NOT NULL,
            user_agent TEXT NOT NULL DEFAULT '',
            last_used INTEGER NOT NULL,
            trusted INTEGER NOT NULL DEFAULT 1,
            PRIMARY KEY (identity_id, fingerprint)
        ) WITHOUT ROWID;
    )";

    auto lk = db.get().lock();
    if (!db.get().exec(sql))
    {
        return std::unexpected(std::format("Failed to create identity schema: {}", db.get().errmsg()));
    }
    return {};
}

store_result<std::optional<auth::IdentityRecord>> SqliteIdentityStore::find(std::string_view phone)
{
    auto lk = db.get().lock();
    auto stmt = db.get().prepare(
        "SELECT id, phone, mpin_hash, mpin_salt, failed_attempts, locked_until, created_at, last_login "
        "FROM identities WHERE phone = ?;");
    if (!stmt)
    {
        return std::unexpected(unavailable(db, "find identity"));
    }

    bind_text(stmt.get(), 1, phone);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE)
    {
        return std::optional<auth::IdentityRecord>{};
    }
    if (rc != SQLITE_ROW)
    {
        return std::unexpected(unavailable(db, "find identity"));
    }

    auth::IdentityRecord rec;
    rec.id = sqlite3_column_int64(stmt.get(), 0);
    rec.phone = column_text(stmt.get(), 1);
    rec.mpin_hash = column_text(stmt.get(), 2);
    rec.mpin_salt = column_text(stmt.get(), 3);
    rec.lockout.failures = static_cast<uint32_t>(sqlite3_column_int(stmt.get(), 4));
    rec.lockout.locked_until = column_time(stmt.get(), 5);
    rec.created_at = column_time(stmt.get(), 6).value_or(auth::timestamp_t{});
    rec.last_login = column_time(stmt.get(), 7);
    stmt.reset();
    lk.unlock();

    auto devices = load_devices(rec.id);
    if (!devices)
    {
        return std::unexpected(devices.error());
    }
    rec.devices = std::move(*devices);
    return std::optional<auth::IdentityRecord>(std::move(rec));
}

store_result<auth::IdentityRecord> SqliteIdentityStore::create(const auth::NewIdentity& identity)
{
    auto lk = db.get().lock();
    if (!db.get().exec("BEGIN IMMEDIATE;"))
    {
        return std::unexpected(unavailable(db, "begin transaction"));
    }

    auto rollback = [&](StoreError err) -> store_result<auth::IdentityRecord>
    {
        if (!db.get().exec("ROLLBACK;"))
        {
            LOG_ERROR("Rollback failed: {}", db.get().errmsg());
        }
        return std::unexpected(std::move(err));
    };

    auto stmt = db.get().prepare(
        "INSERT INTO identities (phone, mpin_hash, mpin_salt, failed_attempts, locked_until, created_at) "
        "VALUES (?, ?, ?, 0, NULL, ?);");
    if (!stmt)
    {
        return rollback(unavailable(db, "create identity"));
    }

    bind_text(stmt.get(), 1, identity.phone);
    bind_text(stmt.get(), 2, identity.mpin_hash);
    bind_text(stmt.get(), 3, identity.mpin_salt);
    sqlite3_bind_int64(stmt.get(), 4, to_unix_ms(identity.created_at));

    int rc = sqlite3_step(stmt.get());
    stmt.reset();
    if (is_constraint(rc))
    {
        return rollback(StoreError{StoreError::errc::Conflict, "phone already registered"});
    }
    if (rc != SQLITE_DONE)
    {
        return rollback(unavailable(db, "create identity"));
    }

    auth::IdentityRecord rec;
    rec.id = sqlite3_last_insert_rowid(db.get().handle());
    rec.phone = identity.phone;
    rec.mpin_hash = identity.mpin_hash;
    rec.mpin_salt = identity.mpin_salt;
    rec.created_at = identity.created_at;

    if (identity.device)
    {
        auto dev = db.get().prepare(
            "INSERT INTO devices (identity_id, fingerprint, user_agent, last_used, trusted) VALUES (?, ?, ?, ?, ?);");
        if (!dev)
        {
            return rollback(unavailable(db, "bind device"));
        }
        sqlite3_bind_int64(dev.get(), 1, rec.id);
        bind_text(dev.get(), 2, identity.device->fingerprint);
        bind_text(dev.get(), 3, identity.device->user_agent);
        sqlite3_bind_int64(dev.get(), 4, to_unix_ms(identity.device->last_used));
        sqlite3_bind_int(dev.get(), 5, identity.device->trusted ? 1 : 0);
        rc = sqlite3_step(dev.get());
        dev.reset();
        if (rc != SQLITE_DONE)
        {
            return rollback(unavailable(db, "bind device"));
        }
        rec.devices.push_back(*identity.device);
    }

    if (!db.get().exec("COMMIT;"))
    {
        return rollback(unavailable(db, "commit identity"));
    }
    return rec;
}

store_result<bool> SqliteIdentityStore::compare_and_swap_lockout(
    int64_t id,
    const auth::LockoutState& expected,
    const auth::LockoutState& desired)
{
    auto lk = db.get().lock();
    auto stmt = db.get().prepare(
        "UPDATE identities SET failed_attempts = ?, locked_until = ? "
        "WHERE id = ? AND failed_attempts = ? AND locked_until IS ?;");
    if (!stmt)
    {
        return std::unexpected(unavailable(db, "update lockout"));
    }

    sqlite3_bind_int(stmt.get(), 1, static_cast<int>(desired.failures));
    bind_time(stmt.get(), 2, desired.locked_until);
    sqlite3_bind_int64(stmt.get(), 3, id);
    sqlite3_bind_int(stmt.get(), 4, static_cast<int>(expected.failures));
    bind_time(stmt.get(), 5, expected.locked_until);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return std::unexpected(unavailable(db, "update lockout"));
    }
    return sqlite3_changes(db.get().handle()) == 1;
}

store_result<void> SqliteIdentityStore::upsert_device(int64_t id, const auth::DeviceBinding& device)
{
    auto lk = db.get().lock();
    auto stmt = db.get().prepare(
        "INSERT INTO devices (identity_id, fingerprint, user_agent, last_used, trusted) VALUES (?, ?, ?, ?, ?) "
        "ON CONFLICT(identity_id, fingerprint) DO UPDATE SET "
        "user_agent = excluded.user_agent, last_used = excluded.last_used;");
    if (!stmt)
    {
        return std::unexpected(unavailable(db, "upsert device"));
    }

    sqlite3_bind_int64(stmt.get(), 1, id);
    bind_text(stmt.get(), 2, device.fingerprint);
    bind_text(stmt.get(), 3, device.user_agent);
    sqlite3_bind_int64(stmt.get(), 4, to_unix_ms(device.last_used));
    sqlite3_bind_int(stmt.get(), 5, device.trusted ? 1 : 0);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return std::unexpected(unavailable(db, "upsert device"));
    }
    return {};
}

store_result<void> SqliteIdentityStore::touch_last_login(int64_t id, auth::timestamp_t when)
{
    auto lk = db.get().lock();
    auto stmt = db.get().prepare("UPDATE identities SET last_login = ? WHERE id = ?;");
    if (!stmt)
    {
        return std::unexpected(unavailable(db, "update last login"));
    }

    sqlite3_bind_int64(stmt.get(), 1, to_unix_ms(when));
    sqlite3_bind_int64(stmt.get(), 2, id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return std::unexpected(unavailable(db, "update last login"));
    }
    return {};
}

store_result<void> SqliteIdentityStore::remove(int64_t id)
{
    auto lk = db.get().lock();
    auto stmt = db.get().prepare("DELETE FROM identities WHERE id = ?;");
    if (!stmt)
    {
        return std::unexpected(unavailable(db, "remove identity"));
    }

    sqlite3_bind_int64(stmt.get(), 1, id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return std::unexpected(unavailable(db, "remove identity"));
    }
    return {};
}

store_result<std::vector<auth::IdentityRecord>> SqliteIdentityStore::list()
{
    std::vector<auth::IdentityRecord> out;
    {
        auto lk = db.get().lock();
        auto stmt = db.get().prepare(
            "SELECT id, phone, failed_attempts, locked_until, created_at, last_login "
            "FROM identities ORDER BY id;");
        if (!stmt)
        {
            return std::unexpected(unavailable(db, "list identities"));
        }

        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            auth::IdentityRecord rec;
            rec.id = sqlite3_column_int64(stmt.get(), 0);
            rec.phone = column_text(stmt.get(), 1);
            rec.lockout.failures = static_cast<uint32_t>(sqlite3_column_int(stmt.get(), 2));
            rec.lockout.locked_until = column_time(stmt.get(), 3);
            rec.created_at = column_time(stmt.get(), 4).value_or(auth::timestamp_t{});
            rec.last_login = column_time(stmt.get(), 5);
            out.push_back(std::move(rec));
        }
        if (rc != SQLITE_DONE)
        {
            return std::unexpected(unavailable(db, "list identities"));
        }
    }

    for (auto& rec : out)
    {
        auto devices = load_devices(rec.id);
        if (!devices)
        {
            return std::unexpected(devices.error());
        }
        rec.devices = std::move(*devices);
    }
    return out;
}

store_result<std::vector<auth::DeviceBinding>> SqliteIdentityStore::load_devices(int64_t id)
{
    auto lk = db.get().lock();
    auto stmt = db.get().prepare(
        "SELECT fingerprint, user_agent, last_used, trusted FROM devices "
        "WHERE identity_id = ? ORDER BY last_used DESC;");
    if (!stmt)
    {
        return std::unexpected(unavailable(db, "load devices"));
    }

    sqlite3_bind_int64(stmt.get(), 1, id);

    std::vector<auth::DeviceBinding> devices;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
    {
        auth::DeviceBinding d;
        d.fingerprint = column_text(stmt.get(), 0);
        d.user_agent = column_text(stmt.get(), 1);
        d.last_used = from_unix_ms(sqlite3_column_int64(stmt.get(), 2));
        d.trusted = sqlite3_column_int(stmt.get(), 3) != 0;
        devices.push_back(std::move(d));
    }
    if (rc != SQLITE_DONE)
    {
        return std::unexpected(unavailable(db, "load devices"));
    }
    return devices;
}

SqliteAttemptStore::SqliteAttemptStore(Database& database)
    : db(database)
{
}

std::expected<void, std::string> SqliteAttemptStore::init_schema()
{
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS login_attempts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            phone TEXT NOT NULL,
            ip TEXT NOT NULL,
            fingerprint TEXT NOT NULL DEFAULT 'unknown',
            user_agent TEXT NOT NULL DEFAULT '',
            success INTEGER NOT NULL,
            reason TEXT NOT NULL,
            risk_score INTEGER NOT NULL DEFAULT 0 CHECK (risk_score BETWEEN 0 AND 100),
            ts_ms INTEGER NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_attempts_phone_ts ON login_attempts(phone, ts_ms);
        CREATE INDEX IF NOT EXISTS idx_attempts_ts ON login_attempts(ts_ms);
    )";

    auto lk = db.get().lock();
    if (!db.get().exec(sql))
    {
        return std::unexpected(std::format("Failed to create attempt schema: {}", db.get().errmsg()));
    }
    return {};
}

store_result<void> SqliteAttemptStore::append(const AttemptRecord& attempt)
{
    auto lk = db.get().lock();
    auto stmt = db.get().prepare(
        "INSERT INTO login_attempts (phone, ip, fingerprint, user_agent, success, reason, risk_score, ts_ms) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    if (!stmt)
    {
        return std::unexpected(unavailable(db, "append attempt"));
    }

    bind_text(stmt.get(), 1, attempt.phone);
    bind_text(stmt.get(), 2, attempt.ip);
    bind_text(stmt.get(), 3, attempt.fingerprint);
    bind_text(stmt.get(), 4, attempt.user_agent);
    sqlite3_bind_int(stmt.get(), 5, attempt.success ? 1 : 0);
    bind_text(stmt.get(), 6, auth::to_string(attempt.reason));
    sqlite3_bind_int(stmt.get(), 7, attempt.risk_score);
    sqlite3_bind_int64(stmt.get(), 8, to_unix_ms(attempt.timestamp));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return std::unexpected(unavailable(db, "append attempt"));
    }
    return {};
}

store_result<std::vector<AttemptRecord>> SqliteAttemptStore::query(
    std::string_view phone,
    auth::timestamp_t since,
    size_t limit)
{
    auto lk = db.get().lock();
    auto stmt = db.get().prepare(
        "SELECT phone, ip, fingerprint, user_agent, success, reason, risk_score, ts_ms FROM login_attempts "
        "WHERE phone = ? AND ts_ms >= ? ORDER BY ts_ms DESC, id DESC LIMIT ?;");
    if (!stmt)
    {
        return std::unexpected(unavailable(db, "query attempts"));
    }

    bind_text(stmt.get(), 1, phone);
    sqlite3_bind_int64(stmt.get(), 2, to_unix_ms(since));
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(limit));

    std::vector<AttemptRecord> rows;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
    {
        AttemptRecord a;
        a.phone = column_text(stmt.get(), 0);
        a.ip = column_text(stmt.get(), 1);
        a.fingerprint = column_text(stmt.get(), 2);
        a.user_agent = column_text(stmt.get(), 3);
        a.success = sqlite3_column_int(stmt.get(), 4) != 0;
        a.reason = auth::parse_reason(column_text(stmt.get(), 5)).value_or(auth::AttemptReason::InvalidData);
        a.risk_score = sqlite3_column_int(stmt.get(), 6);
        a.timestamp = from_unix_ms(sqlite3_column_int64(stmt.get(), 7));
        rows.push_back(std::move(a));
    }
    if (rc != SQLITE_DONE)
    {
        return std::unexpected(unavailable(db, "query attempts"));
    }
    return rows;
}

store_result<size_t> SqliteAttemptStore::purge_before(auth::timestamp_t cutoff)
{
    auto lk = db.get().lock();
    auto stmt = db.get().prepare("DELETE FROM login_attempts WHERE ts_ms < ?;");
    if (!stmt)
    {
        return std::unexpected(unavailable(db, "purge attempts"));
    }

    sqlite3_bind_int64(stmt.get(), 1, to_unix_ms(cutoff));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return std::unexpected(unavailable(db, "purge attempts"));
    }
    return static_cast<size_t>(sqlite3_changes(db.get().handle()));
}

}
