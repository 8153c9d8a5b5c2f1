#pragma once

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <cstdint>
#include <chrono>

namespace json = boost::json;

/**
 * Engine configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    struct KeysCfg
    {
        std::string dir = ".keys";
        uint32_t rsa_bits = 2048;
    };

    struct StorageCfg
    {
        std::string db_path = "mpin.db";
        std::chrono::days attempt_retention{90};
    };

    struct LockoutCfg
    {
        uint32_t max_failures = 5;
        std::chrono::seconds duration{1800};
    };

    struct RiskCfg
    {
        std::chrono::days history_window{30};
        size_t history_limit = 50;
        std::chrono::seconds rapid_window{300};
        std::chrono::minutes utc_offset{0};
    };

    struct SessionCfg
    {
        std::string secret = "";    // empty: random per process
        std::chrono::seconds ttl{900};
        std::string issuer = "SmartBank";
        std::string audience = "smartbank-app";
    };

    struct EngineCfg
    {
        size_t cpu_threads = 0;
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath);
    [[nodiscard]] static Config load_defaults();
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath);

    [[nodiscard]] const KeysCfg& keys() const { return key; }
    [[nodiscard]] const StorageCfg& storage() const { return store; }
    [[nodiscard]] const LockoutCfg& lockout() const { return lock; }
    [[nodiscard]] const RiskCfg& risk() const { return rsk; }
    [[nodiscard]] const SessionCfg& session() const { return sess; }
    [[nodiscard]] const EngineCfg& engine() const { return eng; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

private:
    KeysCfg key;
    StorageCfg store;
    LockoutCfg lock;
    RiskCfg rsk;
    SessionCfg sess;
    EngineCfg eng;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};
