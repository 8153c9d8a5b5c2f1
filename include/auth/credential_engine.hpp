#pragma once

#include "auth/attempt_ledger.hpp"
#include "auth/errors.hpp"
#include "auth/identity_record.hpp"
#include "auth/keyed_mutex.hpp"
#include "auth/lockout.hpp"
#include "auth/risk_scorer.hpp"
#include "auth/session_issuer.hpp"
#include "crypto/transport_decryptor.hpp"
#include "storage/stores.hpp"
#include "threadpool/threadpool.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace auth
{

struct RegisterRequest
{
    std::string phone;
    std::string encrypted_pin;
    std::string fingerprint;
    std::string ip;
    std::string user_agent;
};

struct LoginRequest
{
    std::string phone;
    std::string encrypted_pin;
    std::string fingerprint;
    std::string ip;
    std::string user_agent;
};

struct Session
{
    std::string token;
    IdentityRecord identity;
};

struct LoginSuccess
{
    Session session;
    RiskAssessment risk;
};

/**
 * Register and login orchestration.
 *
 * Every request for one phone runs under that phone's KeyedMutex slot; the
 * lockout fields are additionally written through the store's
 * compare-and-swap so several processes can share one database.
 */
class CredentialEngine
{
public:
    CredentialEngine(storage::IdentityStore& identities,
                     AttemptLedger& ledger,
                     RiskScorer& scorer,
                     const crypto::TransportDecryptor& decryptor,
                     LockoutStateMachine lockout,
                     SessionIssuer& sessions,
                     ThreadPool& cpu_pool,
                     Clock clock = system_clock());

    [[nodiscard]] std::expected<Session, AuthError> register_identity(const RegisterRequest& req);
    [[nodiscard]] std::expected<LoginSuccess, AuthError> login(const LoginRequest& req);

    // nullopt when the phone has no credential yet
    [[nodiscard]] std::expected<std::optional<IdentityRecord>, AuthError> lookup(std::string_view phone);

    // Operator reset to Unlocked(0). Returns whether anything changed.
    [[nodiscard]] std::expected<bool, AuthError> unlock(std::string_view phone);

    [[nodiscard]] const LockoutStateMachine& lockout() const { return machine; }

private:
    using transition_fn = std::function<LockoutState(const LockoutState&)>;

    [[nodiscard]] std::expected<IdentityRecord, AuthError> load(const std::string& phone);
    [[nodiscard]] std::expected<void, AuthError> apply_lockout(IdentityRecord& rec, const transition_fn& next);
    [[nodiscard]] std::expected<std::string, AuthError> decrypt_pin(std::string_view ciphertext);

    void record(const std::string& phone, const LoginRequest& req, bool success,
                AttemptReason reason, int risk_score, timestamp_t now);

    std::reference_wrapper<storage::IdentityStore> identities;
    std::reference_wrapper<AttemptLedger> ledger;
    std::reference_wrapper<RiskScorer> scorer;
    std::reference_wrapper<const crypto::TransportDecryptor> decryptor;
    LockoutStateMachine machine;
    std::reference_wrapper<SessionIssuer> sessions;
    std::reference_wrapper<ThreadPool> cpu_pool;
    Clock clock;
    KeyedMutex locks;
};

}
