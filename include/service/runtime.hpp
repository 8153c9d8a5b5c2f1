#pragma once

#include "auth/attempt_ledger.hpp"
#include "auth/credential_engine.hpp"
#include "auth/risk_scorer.hpp"
#include "auth/session_issuer.hpp"
#include "crypto/key_custodian.hpp"
#include "crypto/transport_decryptor.hpp"
#include "service/auth_service.hpp"
#include "service/config.hpp"
#include "storage/sqlite_store.hpp"
#include "threadpool/threadpool.hpp"

#include <expected>
#include <memory>
#include <string>

namespace service
{

/**
 * Owns every component of one engine instance, built from a Config.
 * Members are declared in dependency order so destruction runs leaf-last.
 */
class Runtime
{
    struct Token
    {
        explicit Token() = default;
    };

public:
    [[nodiscard]] static std::expected<std::unique_ptr<Runtime>, std::string> create(
        const Config& cfg,
        auth::Clock clock = auth::system_clock());

    // Only create() can name Token.
    Runtime(Token, storage::Database db, crypto::KeyCustodian keys, std::string secret,
            const Config& cfg, auth::Clock clock);

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    [[nodiscard]] AuthService& service() { return *svc; }
    [[nodiscard]] auth::CredentialEngine& engine() { return *eng; }
    [[nodiscard]] auth::AttemptLedger& ledger() { return *attempts; }
    [[nodiscard]] storage::IdentityStore& identities() { return *id_store; }
    [[nodiscard]] const crypto::KeyCustodian& keys() const { return custodian; }
    [[nodiscard]] const auth::SessionIssuer& sessions() const { return *issuer; }
    [[nodiscard]] const auth::Clock& clock() const { return clk; }

private:
    [[nodiscard]] std::expected<void, std::string> init_schema();

    auth::Clock clk;
    storage::Database db;
    crypto::KeyCustodian custodian;
    ThreadPool pool;
    std::unique_ptr<storage::SqliteIdentityStore> id_store;
    std::unique_ptr<storage::SqliteAttemptStore> attempt_store;
    std::unique_ptr<auth::AttemptLedger> attempts;
    std::unique_ptr<auth::RiskScorer> scorer;
    std::unique_ptr<crypto::TransportDecryptor> decryptor;
    std::unique_ptr<auth::JwtSessionIssuer> issuer;
    std::unique_ptr<auth::CredentialEngine> eng;
    std::unique_ptr<AuthService> svc;
};

}
