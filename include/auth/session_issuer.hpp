#pragma once

#include "auth/types.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace auth
{

struct SessionClaims
{
    int64_t identity_id = 0;
    std::string phone;
    timestamp_t issued_at;
    timestamp_t expires_at;
};

class SessionIssuer
{
public:
    virtual ~SessionIssuer() = default;

    [[nodiscard]] virtual std::expected<std::string, std::string> issue(int64_t identity_id, std::string_view phone) = 0;

    // nullopt for anything expired, forged or malformed.
    [[nodiscard]] virtual std::optional<SessionClaims> verify(std::string_view token) const = 0;
};

/**
 * HS256 JWT sessions. Tokens carry sub (identity id), phone, userId, iat,
 * exp, iss and aud.
 */
class JwtSessionIssuer : public SessionIssuer
{
public:
    static constexpr std::chrono::seconds default_ttl{15 * 60};
    static constexpr const char* default_issuer = "SmartBank";
    static constexpr const char* default_audience = "smartbank-app";

    struct Options
    {
        std::chrono::seconds ttl = default_ttl;
        std::string issuer = default_issuer;
        std::string audience = default_audience;
    };

    JwtSessionIssuer(std::string secret, Options opts, Clock clock = system_clock());

    [[nodiscard]] std::expected<std::string, std::string> issue(int64_t identity_id, std::string_view phone) override;
    [[nodiscard]] std::optional<SessionClaims> verify(std::string_view token) const override;

    // 32 random bytes, hex encoded; used when no secret is configured.
    [[nodiscard]] static std::expected<std::string, std::string> random_secret();

private:
    std::string secret;
    Options opts;
    Clock clock;
};

}
