#pragma once

#include "auth/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace auth
{

enum class AuthErrc : uint8_t
{
    InvalidPhone,
    InvalidPinFormat,
    InvalidCiphertext,
    AlreadyRegistered,
    NotFound,
    AccountLocked,
    RiskBlocked,
    WrongCredential,
    StorageUnavailable,
};

[[nodiscard]] std::string_view to_string(AuthErrc code);

struct AuthError
{
    AuthErrc code;
    std::string message;
    std::optional<timestamp_t> locked_until;    // AccountLocked
    risk_flags_t flags;                         // RiskBlocked
    std::optional<uint32_t> attempts_remaining; // WrongCredential

    [[nodiscard]] bool is_invalid_input() const
    {
        return code == AuthErrc::InvalidPhone
            || code == AuthErrc::InvalidPinFormat
            || code == AuthErrc::InvalidCiphertext;
    }

    [[nodiscard]] static AuthError make(AuthErrc code, std::string message)
    {
        return AuthError{code, std::move(message), std::nullopt, {}, std::nullopt};
    }
};

}
