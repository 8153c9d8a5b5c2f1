#pragma once

#include "storage/stores.hpp"

#include <sqlite3.h>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace storage
{

class Database
{
public:
    using stmt_ptr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

    [[nodiscard]] static std::expected<Database, std::string> open(std::string_view db_path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] std::unique_lock<std::mutex> lock() { return std::unique_lock<std::mutex>(*mtx); }

    // Caller holds lock()
    [[nodiscard]] stmt_ptr prepare(std::string_view sql);
    [[nodiscard]] bool exec(const char* sql);
    [[nodiscard]] std::string errmsg() const;
    [[nodiscard]] sqlite3* handle() { return db; }

private:
    explicit Database(sqlite3* db);
    sqlite3* db;
    std::unique_ptr<std::mutex> mtx;
};

class SqliteIdentityStore : public IdentityStore
{
public:
    explicit SqliteIdentityStore(Database& db);

    [[nodiscard]] std::expected<void, std::string> init_schema();

    [[nodiscard]] store_result<std::optional<auth::IdentityRecord>> find(std::string_view phone) override;
    [[nodiscard]] store_result<auth::IdentityRecord> create(const auth::NewIdentity& identity) override;
    [[nodiscard]] store_result<bool> compare_and_swap_lockout(
        int64_t id,
        const auth::LockoutState& expected,
        const auth::LockoutState& desired) override;
    [[nodiscard]] store_result<void> upsert_device(int64_t id, const auth::DeviceBinding& device) override;
    [[nodiscard]] store_result<void> touch_last_login(int64_t id, auth::timestamp_t when) override;
    [[nodiscard]] store_result<void> remove(int64_t id) override;
    [[nodiscard]] store_result<std::vector<auth::IdentityRecord>> list() override;

private:
    [[nodiscard]] store_result<std::vector<auth::DeviceBinding>> load_devices(int64_t id);

    std::reference_wrapper<Database> db;
};

class SqliteAttemptStore : public AttemptStore
{
public:
    explicit SqliteAttemptStore(Database& db);

    [[nodiscard]] std::expected<void, std::string> init_schema();

    [[nodiscard]] store_result<void> append(const AttemptRecord& attempt) override;
    [[nodiscard]] store_result<std::vector<AttemptRecord>> query(
        std::string_view phone,
        auth::timestamp_t since,
        size_t limit) override;
    [[nodiscard]] store_result<size_t> purge_before(auth::timestamp_t cutoff) override;

private:
    std::reference_wrapper<Database> db;
};

}
