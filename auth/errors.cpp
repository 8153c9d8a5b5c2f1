#include "auth/errors.hpp"

namespace auth
{

std::string_view to_string(AuthErrc code)
{
    switch (code)
    {
        case AuthErrc::InvalidPhone:       return "invalid_phone";
        case AuthErrc::InvalidPinFormat:   return "invalid_pin_format";
        case AuthErrc::InvalidCiphertext:  return "invalid_ciphertext";
        case AuthErrc::AlreadyRegistered:  return "already_registered";
        case AuthErrc::NotFound:           return "not_found";
        case AuthErrc::AccountLocked:      return "account_locked";
        case AuthErrc::RiskBlocked:        return "risk_blocked";
        case AuthErrc::WrongCredential:    return "wrong_credential";
        case AuthErrc::StorageUnavailable: return "storage_unavailable";
    }
    return "storage_unavailable";
}

}
