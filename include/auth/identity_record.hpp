#pragma once

#include "auth/types.hpp"

#include <string>
#include <cstdint>
#include <optional>
#include <vector>

namespace auth
{

struct DeviceBinding
{
    std::string fingerprint;
    std::string user_agent;
    timestamp_t last_used;
    bool trusted = true;
};

struct LockoutState
{
    uint32_t failures = 0;
    std::optional<timestamp_t> locked_until;

    bool operator==(const LockoutState&) const = default;
};

struct IdentityRecord
{
    int64_t id = 0;
    std::string phone;
    std::string mpin_hash;
    std::string mpin_salt;
    std::vector<DeviceBinding> devices;
    LockoutState lockout;
    timestamp_t created_at;
    std::optional<timestamp_t> last_login;

    [[nodiscard]] const DeviceBinding* find_device(std::string_view fingerprint) const
    {
        for (const auto& d : devices)
        {
            if (d.fingerprint == fingerprint)
            {
                return &d;
            }
        }
        return nullptr;
    }
};

// Fields supplied at registration; the store assigns the id.
struct NewIdentity
{
    std::string phone;
    std::string mpin_hash;
    std::string mpin_salt;
    std::optional<DeviceBinding> device;
    timestamp_t created_at;
};

}
