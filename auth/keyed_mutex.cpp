#include "auth/keyed_mutex.hpp"

#include <utility>

namespace auth
{

KeyedMutex::Guard::Guard(KeyedMutex& owner, std::string key, Slot& slot)
    : owner(&owner)
    , key(std::move(key))
    , slot(&slot)
{
}

KeyedMutex::Guard::Guard(Guard&& other) noexcept
    : owner(std::exchange(other.owner, nullptr))
    , key(std::move(other.key))
    , slot(std::exchange(other.slot, nullptr))
{
}

KeyedMutex::Guard::~Guard()
{
    if (owner && slot)
    {
        owner->release(key, *slot);
    }
}

KeyedMutex::Guard KeyedMutex::lock(std::string_view key)
{
    Slot* slot = nullptr;
    {
        std::lock_guard lk(table_mtx);
        auto& entry = slots[std::string(key)];
        if (!entry)
        {
            entry = std::make_unique<Slot>();
        }
        ++entry->users;
        slot = entry.get();
    }

    // The slot cannot be erased while users > 0.
    slot->mtx.lock();
    return Guard(*this, std::string(key), *slot);
}

void KeyedMutex::release(const std::string& key, Slot& slot)
{
    slot.mtx.unlock();

    std::lock_guard lk(table_mtx);
    if (--slot.users == 0)
    {
        slots.erase(key);
    }
}

size_t KeyedMutex::active() const
{
    std::lock_guard lk(table_mtx);
    return slots.size();
}

}
