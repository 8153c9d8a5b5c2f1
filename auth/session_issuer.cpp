#include "auth/session_issuer.hpp"
#include "logger/logger.hpp"

#include <jwt-cpp/traits/boost-json/traits.h>
#include <sodium.h>
#include <array>
#include <charconv>

namespace auth
{

namespace
{

using json_traits = jwt::traits::boost_json;
using claim_t = jwt::basic_claim<json_traits>;

// Adapts the injected auth::Clock to jwt-cpp's clock concept.
struct issuer_clock
{
    Clock fn;

    [[nodiscard]] jwt::date now() const
    {
        return std::chrono::time_point_cast<std::chrono::seconds>(fn());
    }
};

}

JwtSessionIssuer::JwtSessionIssuer(std::string secret, Options opts, Clock clock)
    : secret(std::move(secret))
    , opts(std::move(opts))
    , clock(std::move(clock))
{
}

std::expected<std::string, std::string> JwtSessionIssuer::issue(int64_t identity_id, std::string_view phone)
{
    auto now = std::chrono::time_point_cast<std::chrono::seconds>(clock());
    try
    {
        return jwt::create<json_traits>()
            .set_type("JWT")
            .set_issuer(opts.issuer)
            .set_audience(opts.audience)
            .set_subject(std::to_string(identity_id))
            .set_payload_claim("userId", claim_t(boost::json::value(identity_id)))
            .set_payload_claim("phone", claim_t(std::string(phone)))
            .set_issued_at(now)
            .set_expires_at(now + opts.ttl)
            .sign(jwt::algorithm::hs256{secret});
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Session token signing failed: {}", e.what());
        return std::unexpected("Failed to issue session");
    }
}

std::optional<SessionClaims> JwtSessionIssuer::verify(std::string_view token) const
{
    try
    {
        auto decoded = jwt::decode<json_traits>(std::string(token));

        jwt::verify<issuer_clock, json_traits>(issuer_clock{clock})
            .allow_algorithm(jwt::algorithm::hs256{secret})
            .with_issuer(opts.issuer)
            .with_audience(opts.audience)
            .verify(decoded);

        auto sub = decoded.get_subject();
        SessionClaims claims;
        auto [ptr, ec] = std::from_chars(sub.data(), sub.data() + sub.size(), claims.identity_id);
        if (ec != std::errc{} || ptr != sub.data() + sub.size())
        {
            return std::nullopt;
        }

        claims.phone = decoded.get_payload_claim("phone").as_string();
        claims.issued_at = decoded.get_issued_at();
        claims.expires_at = decoded.get_expires_at();
        return claims;
    }
    catch (const std::exception& e)
    {
        LOG_DEBUG("Session token rejected: {}", e.what());
        return std::nullopt;
    }
}

std::expected<std::string, std::string> JwtSessionIssuer::random_secret()
{
    if (sodium_init() < 0)
    {
        return std::unexpected("Failed to initialize libsodium");
    }

    std::array<unsigned char, 32> raw;
    randombytes_buf(raw.data(), raw.size());

    std::string hex(raw.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
    hex.pop_back();
    sodium_memzero(raw.data(), raw.size());
    return hex;
}

}
