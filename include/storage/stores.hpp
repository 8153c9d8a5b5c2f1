#pragma once

#include "auth/identity_record.hpp"
#include "auth/types.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace storage
{

struct StoreError
{
    enum class errc
    {
        Conflict,       // unique key already taken
        Unavailable,    // backend failure
    };

    errc code;
    std::string detail;
};

template<class T>
using store_result = std::expected<T, StoreError>;

struct AttemptRecord
{
    std::string phone;
    std::string ip;
    std::string fingerprint;
    std::string user_agent;
    bool success = false;
    auth::AttemptReason reason = auth::AttemptReason::Success;
    int risk_score = 0;
    auth::timestamp_t timestamp;
};

class IdentityStore
{
public:
    virtual ~IdentityStore() = default;

    [[nodiscard]] virtual store_result<std::optional<auth::IdentityRecord>> find(std::string_view phone) = 0;
    [[nodiscard]] virtual store_result<auth::IdentityRecord> create(const auth::NewIdentity& identity) = 0;

    // Writes `desired` only if the stored lockout fields still equal `expected`.
    // Returns false on a lost race.
    [[nodiscard]] virtual store_result<bool> compare_and_swap_lockout(
        int64_t id,
        const auth::LockoutState& expected,
        const auth::LockoutState& desired) = 0;

    [[nodiscard]] virtual store_result<void> upsert_device(int64_t id, const auth::DeviceBinding& device) = 0;
    [[nodiscard]] virtual store_result<void> touch_last_login(int64_t id, auth::timestamp_t when) = 0;

    // Drops the identity and its device bindings. Removing an unknown id succeeds.
    [[nodiscard]] virtual store_result<void> remove(int64_t id) = 0;
    [[nodiscard]] virtual store_result<std::vector<auth::IdentityRecord>> list() = 0;
};

class AttemptStore
{
public:
    virtual ~AttemptStore() = default;

    [[nodiscard]] virtual store_result<void> append(const AttemptRecord& attempt) = 0;

    // Most recent first, at most `limit` rows with timestamp >= since.
    [[nodiscard]] virtual store_result<std::vector<AttemptRecord>> query(
        std::string_view phone,
        auth::timestamp_t since,
        size_t limit) = 0;

    [[nodiscard]] virtual store_result<size_t> purge_before(auth::timestamp_t cutoff) = 0;
};

}
