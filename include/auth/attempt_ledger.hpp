#pragma once

#include "storage/stores.hpp"
#include "auth/types.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace auth
{

using AttemptRecord = storage::AttemptRecord;

class AttemptLedger
{
public:
    static constexpr std::chrono::hours default_retention{24 * 90};

    explicit AttemptLedger(storage::AttemptStore& store,
                           std::chrono::seconds retention = default_retention);

    // Never throws and never fails the caller; a lost write is logged.
    void record(const AttemptRecord& attempt);

    [[nodiscard]] std::expected<std::vector<AttemptRecord>, std::string> recent_for(
        std::string_view phone,
        timestamp_t since,
        size_t limit);

    [[nodiscard]] std::expected<size_t, std::string> purge_expired(timestamp_t now);

    [[nodiscard]] std::chrono::seconds retention() const { return keep_for; }

private:
    std::reference_wrapper<storage::AttemptStore> store;
    std::chrono::seconds keep_for;
};

}
