#include "auth/credential_engine.hpp"
#include "auth/credential_hasher.hpp"
#include "auth/phone.hpp"
#include "crypto/utils.hpp"
#include "logger/logger.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace auth
{

namespace
{

constexpr int max_cas_rounds = 8;
constexpr std::string_view unknown_fingerprint = "unknown";

AuthError storage_error(std::string_view what, const storage::StoreError& e)
{
    LOG_ERROR("{}: {}", what, e.detail);
    return AuthError::make(AuthErrc::StorageUnavailable, "Service temporarily unavailable");
}

std::string join_flags(const risk_flags_t& flags)
{
    std::string out;
    for (auto f : flags)
    {
        if (!out.empty())
        {
            out += ',';
        }
        out += to_string(f);
    }
    return out;
}

}

CredentialEngine::CredentialEngine(storage::IdentityStore& identities,
                                   AttemptLedger& ledger,
                                   RiskScorer& scorer,
                                   const crypto::TransportDecryptor& decryptor,
                                   LockoutStateMachine lockout,
                                   SessionIssuer& sessions,
                                   ThreadPool& cpu_pool,
                                   Clock clock)
    : identities(identities)
    , ledger(ledger)
    , scorer(scorer)
    , decryptor(decryptor)
    , machine(lockout)
    , sessions(sessions)
    , cpu_pool(cpu_pool)
    , clock(std::move(clock))
{
}

std::expected<Session, AuthError> CredentialEngine::register_identity(const RegisterRequest& req)
{
    auto phone = normalize_phone(req.phone);
    if (!phone)
    {
        return std::unexpected(AuthError::make(AuthErrc::InvalidPhone, phone.error()));
    }

    auto guard = locks.lock(*phone);

    auto existing = identities.get().find(*phone);
    if (!existing)
    {
        return std::unexpected(storage_error("Identity lookup failed", existing.error()));
    }
    if (*existing)
    {
        return std::unexpected(AuthError::make(AuthErrc::AlreadyRegistered,
                                               "User already registered. Please login instead."));
    }

    auto pin = decrypt_pin(req.encrypted_pin);
    if (!pin)
    {
        return std::unexpected(pin.error());
    }

    if (!check_mpin(*pin))
    {
        crypto::secure_clear(*pin);
        return std::unexpected(AuthError::make(AuthErrc::InvalidPinFormat, "MPIN must be exactly 4 or 6 digits"));
    }

    auto salt = CredentialHasher::new_salt();
    if (!salt)
    {
        crypto::secure_clear(*pin);
        LOG_ERROR("Salt generation failed: {}", salt.error());
        return std::unexpected(AuthError::make(AuthErrc::StorageUnavailable, "Service temporarily unavailable"));
    }

    auto digest = CredentialHasher::hash(*pin, *salt);
    crypto::secure_clear(*pin);
    if (!digest)
    {
        LOG_ERROR("Credential hashing failed: {}", digest.error());
        return std::unexpected(AuthError::make(AuthErrc::StorageUnavailable, "Service temporarily unavailable"));
    }

    auto now = clock();
    NewIdentity fresh{*phone, std::move(*digest), std::move(*salt), std::nullopt, now};
    if (!req.fingerprint.empty())
    {
        fresh.device = DeviceBinding{req.fingerprint, req.user_agent, now, true};
    }

    auto created = identities.get().create(fresh);
    if (!created)
    {
        if (created.error().code == storage::StoreError::errc::Conflict)
        {
            return std::unexpected(AuthError::make(AuthErrc::AlreadyRegistered,
                                                   "User already registered. Please login instead."));
        }
        return std::unexpected(storage_error("Identity insert failed", created.error()));
    }

    auto token = sessions.get().issue(created->id, created->phone);
    if (!token)
    {
        // Undo the insert so a retry does not hit AlreadyRegistered.
        if (auto undone = identities.get().remove(created->id); !undone)
        {
            LOG_ERROR("Could not roll back registration for {}: {}", mask_phone(*phone), undone.error().detail);
        }
        return std::unexpected(AuthError::make(AuthErrc::StorageUnavailable, "Service temporarily unavailable"));
    }

    LoginRequest as_attempt{*phone, {}, req.fingerprint, req.ip, req.user_agent};
    record(*phone, as_attempt, true, AttemptReason::Success, 0, now);

    LOG_INFO("Registered identity {} for {}", created->id, mask_phone(*phone));
    return Session{std::move(*token), std::move(*created)};
}

std::expected<LoginSuccess, AuthError> CredentialEngine::login(const LoginRequest& req)
{
    auto phone = normalize_phone(req.phone);
    if (!phone)
    {
        return std::unexpected(AuthError::make(AuthErrc::InvalidPhone, phone.error()));
    }

    auto guard = locks.lock(*phone);
    auto now = clock();

    auto rec = load(*phone);
    if (!rec)
    {
        return std::unexpected(rec.error());
    }

    auto gate = machine.check(rec->lockout, now);
    if (gate.locked)
    {
        record(*phone, req, false, AttemptReason::AccountLocked, 0, now);

        auto until = std::chrono::floor<std::chrono::seconds>(*gate.until);
        AuthError err = AuthError::make(AuthErrc::AccountLocked,
            std::format("Account locked due to too many failed attempts. Try again after {:%H:%M:%S} UTC.", until));
        err.locked_until = gate.until;
        return std::unexpected(std::move(err));
    }

    if (gate.changed)
    {
        // Lock expired; continue as Unlocked(0)
        auto cleared = apply_lockout(*rec, [&](const LockoutState& st)
        {
            return machine.check(st, now).state;
        });
        if (!cleared)
        {
            record(*phone, req, false, AttemptReason::InvalidData, 0, now);
            return std::unexpected(cleared.error());
        }
        LOG_INFO("Lock expired for {}", mask_phone(*phone));
    }

    std::string_view fingerprint = req.fingerprint.empty() ? unknown_fingerprint : std::string_view(req.fingerprint);
    auto risk = scorer.get().score(*phone, req.ip, fingerprint, now);

    if (risk.action == RiskAction::Block)
    {
        record(*phone, req, false, AttemptReason::FraudDetected, risk.score, now);
        LOG_WARN("Login blocked for {}: score {} [{}]", mask_phone(*phone), risk.score, join_flags(risk.flags));

        AuthError err = AuthError::make(AuthErrc::RiskBlocked,
                                        "Suspicious activity detected. Please verify via OTP again.");
        err.flags = risk.flags;
        return std::unexpected(std::move(err));
    }

    if (risk.action == RiskAction::Warn)
    {
        LOG_WARN("Elevated login risk for {}: score {} [{}]", mask_phone(*phone), risk.score, join_flags(risk.flags));
    }

    auto pin = decrypt_pin(req.encrypted_pin);
    if (!pin)
    {
        record(*phone, req, false, AttemptReason::InvalidData, risk.score, now);
        return std::unexpected(pin.error());
    }

    auto verified = cpu_pool.get().submit([&pin, &rec]
    {
        return CredentialHasher::verify(*pin, rec->mpin_hash, rec->mpin_salt);
    });
    crypto::secure_clear(*pin);

    if (!verified)
    {
        LOG_ERROR("Credential verification could not run: {}", verified.error());
        record(*phone, req, false, AttemptReason::InvalidData, risk.score, now);
        return std::unexpected(AuthError::make(AuthErrc::StorageUnavailable, "Service temporarily unavailable"));
    }

    if (!*verified)
    {
        auto failed = apply_lockout(*rec, [&](const LockoutState& st)
        {
            // Another process may have locked the identity meanwhile.
            return LockoutStateMachine::is_locked(st, now) ? st : machine.on_failure(st, now);
        });
        record(*phone, req, false, AttemptReason::WrongMpin, risk.score, now);
        if (!failed)
        {
            return std::unexpected(failed.error());
        }

        uint32_t remaining = machine.attempts_remaining(rec->lockout);
        if (remaining == 0)
        {
            LOG_WARN("Identity {} locked after {} failed attempts", mask_phone(*phone), machine.max_failures());
        }

        AuthError err = AuthError::make(AuthErrc::WrongCredential, remaining > 0
            ? std::format("Incorrect MPIN. {} attempts remaining.", remaining)
            : std::format("Incorrect MPIN. Account has been locked for {} minutes.",
                          std::chrono::duration_cast<std::chrono::minutes>(machine.duration()).count()));
        err.attempts_remaining = remaining;
        if (rec->lockout.locked_until)
        {
            err.locked_until = rec->lockout.locked_until;
        }
        return std::unexpected(std::move(err));
    }

    auto reset = apply_lockout(*rec, [&](const LockoutState& st) { return machine.on_success(st); });
    if (!reset)
    {
        record(*phone, req, false, AttemptReason::InvalidData, risk.score, now);
        return std::unexpected(reset.error());
    }

    if (!req.fingerprint.empty())
    {
        const auto* known = rec->find_device(req.fingerprint);
        DeviceBinding device{req.fingerprint, req.user_agent, now, known ? known->trusted : true};
        if (auto res = identities.get().upsert_device(rec->id, device); !res)
        {
            LOG_ERROR("Device binding update failed for {}: {}", mask_phone(*phone), res.error().detail);
        }
        else if (!known)
        {
            rec->devices.push_back(device);
        }
        else
        {
            auto it = std::ranges::find(rec->devices, req.fingerprint, &DeviceBinding::fingerprint);
            it->last_used = now;
            it->user_agent = req.user_agent;
        }
    }

    if (auto res = identities.get().touch_last_login(rec->id, now); !res)
    {
        LOG_ERROR("Last login update failed for {}: {}", mask_phone(*phone), res.error().detail);
    }
    else
    {
        rec->last_login = now;
    }

    auto token = sessions.get().issue(rec->id, rec->phone);
    if (!token)
    {
        record(*phone, req, false, AttemptReason::InvalidData, risk.score, now);
        return std::unexpected(AuthError::make(AuthErrc::StorageUnavailable, "Service temporarily unavailable"));
    }

    record(*phone, req, true, AttemptReason::Success, risk.score, now);
    LOG_INFO("Login succeeded for {} (risk {})", mask_phone(*phone), risk.score);

    return LoginSuccess{Session{std::move(*token), std::move(*rec)}, std::move(risk)};
}

std::expected<std::optional<IdentityRecord>, AuthError> CredentialEngine::lookup(std::string_view raw_phone)
{
    auto phone = normalize_phone(raw_phone);
    if (!phone)
    {
        return std::unexpected(AuthError::make(AuthErrc::InvalidPhone, phone.error()));
    }

    auto found = identities.get().find(*phone);
    if (!found)
    {
        return std::unexpected(storage_error("Identity lookup failed", found.error()));
    }
    return std::move(*found);
}

std::expected<bool, AuthError> CredentialEngine::unlock(std::string_view raw_phone)
{
    auto phone = normalize_phone(raw_phone);
    if (!phone)
    {
        return std::unexpected(AuthError::make(AuthErrc::InvalidPhone, phone.error()));
    }

    auto guard = locks.lock(*phone);
    auto rec = load(*phone);
    if (!rec)
    {
        return std::unexpected(rec.error());
    }

    bool was_set = rec->lockout != LockoutState{};
    if (auto res = apply_lockout(*rec, [](const LockoutState&) { return LockoutState{}; }); !res)
    {
        return std::unexpected(res.error());
    }

    if (was_set)
    {
        LOG_INFO("Lockout cleared for {} by operator", mask_phone(*phone));
    }
    return was_set;
}

std::expected<IdentityRecord, AuthError> CredentialEngine::load(const std::string& phone)
{
    auto found = identities.get().find(phone);
    if (!found)
    {
        return std::unexpected(storage_error("Identity lookup failed", found.error()));
    }
    if (!*found)
    {
        return std::unexpected(AuthError::make(AuthErrc::NotFound, "User not found. Please register first."));
    }
    return std::move(**found);
}

std::expected<void, AuthError> CredentialEngine::apply_lockout(IdentityRecord& rec, const transition_fn& next)
{
    for (int round = 0; round < max_cas_rounds; ++round)
    {
        auto desired = next(rec.lockout);
        if (desired == rec.lockout)
        {
            return {};
        }

        auto swapped = identities.get().compare_and_swap_lockout(rec.id, rec.lockout, desired);
        if (!swapped)
        {
            return std::unexpected(storage_error("Lockout update failed", swapped.error()));
        }
        if (*swapped)
        {
            rec.lockout = desired;
            return {};
        }

        // Lost the race to another writer: reload and reapply the same transition.
        auto fresh = load(rec.phone);
        if (!fresh)
        {
            return std::unexpected(fresh.error());
        }
        rec.lockout = fresh->lockout;
    }

    LOG_ERROR("Lockout update for {} kept conflicting", mask_phone(rec.phone));
    return std::unexpected(AuthError::make(AuthErrc::StorageUnavailable, "Service temporarily unavailable"));
}

std::expected<std::string, AuthError> CredentialEngine::decrypt_pin(std::string_view ciphertext)
{
    auto out = cpu_pool.get().submit([this, ciphertext]
    {
        return decryptor.get().decrypt(ciphertext);
    });

    if (!out)
    {
        LOG_ERROR("Decryption could not run: {}", out.error());
        return std::unexpected(AuthError::make(AuthErrc::StorageUnavailable, "Service temporarily unavailable"));
    }
    if (!*out)
    {
        return std::unexpected(AuthError::make(AuthErrc::InvalidCiphertext,
                                               std::string(crypto::DecryptionError::message())));
    }
    return std::move(**out);
}

void CredentialEngine::record(const std::string& phone, const LoginRequest& req, bool success,
                              AttemptReason reason, int risk_score, timestamp_t now)
{
    ledger.get().record(AttemptRecord{
        phone,
        req.ip,
        req.fingerprint,
        req.user_agent,
        success,
        reason,
        risk_score,
        now
    });
}

}
