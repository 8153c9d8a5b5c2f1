#include "auth/attempt_ledger.hpp"
#include "logger/logger.hpp"

#include <algorithm>

namespace auth
{

AttemptLedger::AttemptLedger(storage::AttemptStore& st, std::chrono::seconds retention)
    : store(st)
    , keep_for(retention)
{
}

void AttemptLedger::record(const AttemptRecord& attempt)
{
    AttemptRecord row = attempt;
    row.risk_score = std::clamp(row.risk_score, 0, 100);
    if (row.fingerprint.empty())
    {
        row.fingerprint = "unknown";
    }

    if (auto res = store.get().append(row); !res)
    {
        LOG_ERROR("Failed to record login attempt for {} ({}): {}",
                  mask_phone(row.phone), to_string(row.reason), res.error().detail);
    }
}

std::expected<std::vector<AttemptRecord>, std::string> AttemptLedger::recent_for(
    std::string_view phone,
    timestamp_t since,
    size_t limit)
{
    auto rows = store.get().query(phone, since, limit);
    if (!rows)
    {
        return std::unexpected(rows.error().detail);
    }

    // Stores may return rows in insertion order; the contract is newest first.
    std::ranges::stable_sort(*rows, std::ranges::greater{}, &AttemptRecord::timestamp);
    if (rows->size() > limit)
    {
        rows->resize(limit);
    }
    return std::move(*rows);
}

std::expected<size_t, std::string> AttemptLedger::purge_expired(timestamp_t now)
{
    auto removed = store.get().purge_before(now - keep_for);
    if (!removed)
    {
        return std::unexpected(removed.error().detail);
    }
    if (*removed > 0)
    {
        LOG_INFO("Purged {} login attempts older than {} days", *removed,
                 std::chrono::duration_cast<std::chrono::hours>(keep_for).count() / 24);
    }
    return *removed;
}

}
