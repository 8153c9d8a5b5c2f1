#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace auth
{

/**
 * One mutex per key, created on first use and dropped when the last holder
 * or waiter releases it. Distinct keys never contend beyond the short
 * table lookup.
 */
class KeyedMutex
{
    struct Slot
    {
        std::mutex mtx;
        size_t users = 0;
    };

public:
    class Guard
    {
    public:
        Guard(KeyedMutex& owner, std::string key, Slot& slot);
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&&) = delete;

    private:
        KeyedMutex* owner;
        std::string key;
        Slot* slot;
    };

    KeyedMutex() = default;
    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    [[nodiscard]] Guard lock(std::string_view key);

    // Number of keys currently held or waited on.
    [[nodiscard]] size_t active() const;

private:
    void release(const std::string& key, Slot& slot);

    mutable std::mutex table_mtx;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots;
};

}
