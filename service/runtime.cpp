#include "service/runtime.hpp"
#include "logger/logger.hpp"

#include <format>

namespace service
{

std::expected<std::unique_ptr<Runtime>, std::string> Runtime::create(const Config& cfg, auth::Clock clock)
{
    auto db = storage::Database::open(cfg.storage().db_path);
    if (!db)
    {
        return std::unexpected(std::format("Failed to open {}: {}", cfg.storage().db_path, db.error()));
    }

    auto keys = crypto::KeyCustodian::open(cfg.keys().dir, static_cast<int>(cfg.keys().rsa_bits));
    if (!keys)
    {
        return std::unexpected(keys.error());
    }

    std::string secret = cfg.session().secret;
    if (secret.empty())
    {
        auto generated = auth::JwtSessionIssuer::random_secret();
        if (!generated)
        {
            return std::unexpected(generated.error());
        }
        secret = std::move(*generated);
        LOG_WARN("No session secret configured; tokens will not survive a restart");
    }

    auto rt = std::make_unique<Runtime>(Token{}, std::move(*db), std::move(*keys), std::move(secret), cfg, std::move(clock));
    if (auto res = rt->init_schema(); !res)
    {
        return std::unexpected(res.error());
    }

    LOG_INFO("Engine ready: db={}, keys={}, {} cpu threads",
             cfg.storage().db_path, cfg.keys().dir, rt->pool.size());
    return rt;
}

Runtime::Runtime(Token, storage::Database database, crypto::KeyCustodian keys, std::string secret,
                 const Config& cfg, auth::Clock clock)
    : clk(std::move(clock))
    , db(std::move(database))
    , custodian(std::move(keys))
    , pool(cfg.engine().cpu_threads)
{
    id_store = std::make_unique<storage::SqliteIdentityStore>(db);
    attempt_store = std::make_unique<storage::SqliteAttemptStore>(db);
    attempts = std::make_unique<auth::AttemptLedger>(*attempt_store, cfg.storage().attempt_retention);

    const auto& rc = cfg.risk();
    scorer = std::make_unique<auth::RiskScorer>(*attempts, auth::RiskScorer::Options{
        std::chrono::duration_cast<std::chrono::hours>(rc.history_window),
        rc.history_limit,
        rc.rapid_window,
        rc.utc_offset
    });

    decryptor = std::make_unique<crypto::TransportDecryptor>(custodian);

    const auto& sc = cfg.session();
    issuer = std::make_unique<auth::JwtSessionIssuer>(std::move(secret),
        auth::JwtSessionIssuer::Options{sc.ttl, sc.issuer, sc.audience}, clk);

    eng = std::make_unique<auth::CredentialEngine>(
        *id_store,
        *attempts,
        *scorer,
        *decryptor,
        auth::LockoutStateMachine(cfg.lockout().max_failures, cfg.lockout().duration),
        *issuer,
        pool,
        clk);

    svc = std::make_unique<AuthService>(*eng, custodian, *issuer);
}

std::expected<void, std::string> Runtime::init_schema()
{
    if (auto res = id_store->init_schema(); !res)
    {
        return std::unexpected(std::format("Identity schema: {}", res.error()));
    }
    if (auto res = attempt_store->init_schema(); !res)
    {
        return std::unexpected(std::format("Attempt schema: {}", res.error()));
    }
    return {};
}

}
