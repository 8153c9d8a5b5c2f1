#pragma once

#include "auth/credential_engine.hpp"
#include "auth/session_issuer.hpp"
#include "crypto/key_custodian.hpp"

#include <boost/json.hpp>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace service
{

namespace json = boost::json;

struct Response
{
    unsigned status = 200;
    json::object body;
};

/**
 * Inbound facade over CredentialEngine.
 *
 * Requests are JSON objects routed by their "action" field:
 *   public-key, verify-otp, register, login, verify-token, logout
 * Responses carry the HTTP-equivalent status and a body with at least
 * "success" and "message".
 */
class AuthService
{
public:
    AuthService(auth::CredentialEngine& engine,
                const crypto::KeyCustodian& keys,
                const auth::SessionIssuer& sessions);

    [[nodiscard]] Response handle(const json::object& request);

    [[nodiscard]] Response public_key() const;
    // Either a provider OTP token or demo mode must vouch for the phone.
    [[nodiscard]] Response lookup(std::string_view phone, std::string_view otp_token, bool demo_mode);
    [[nodiscard]] Response register_identity(const auth::RegisterRequest& req);
    [[nodiscard]] Response login(const auth::LoginRequest& req);
    [[nodiscard]] Response verify_token(std::string_view token) const;
    [[nodiscard]] Response logout() const;

    [[nodiscard]] static unsigned status_for(auth::AuthErrc code);
    [[nodiscard]] static json::object identity_json(const auth::IdentityRecord& rec);
    [[nodiscard]] static json::array flags_json(const auth::risk_flags_t& flags);
    [[nodiscard]] static std::string iso8601(auth::timestamp_t tp);

private:
    using Handler = std::function<Response(AuthService&, const json::object&)>;

    [[nodiscard]] static Response error_response(const auth::AuthError& err);

    std::reference_wrapper<auth::CredentialEngine> engine;
    std::reference_wrapper<const crypto::KeyCustodian> keys;
    std::reference_wrapper<const auth::SessionIssuer> sessions;
    std::unordered_map<std::string, Handler> hdls;
};

}
