#include "service/auth_service.hpp"
#include "auth/phone.hpp"
#include "fundamentals/json_utils.hpp"

#include <format>

using namespace json_utils;

namespace service
{

namespace
{

template<class Request>
std::expected<Request, std::string> read_credentials(const json::object& request)
{
    auto phone = extract_str(request, "phone");
    auto pin = extract_str(request, "encryptedMpin");
    if (!phone || !pin || phone->empty() || pin->empty())
    {
        return std::unexpected("Phone and encrypted MPIN are required");
    }

    return Request{
        std::move(*phone),
        std::move(*pin),
        optional_str(request, "fingerprint"),
        optional_str(request, "ip"),
        optional_str(request, "userAgent")
    };
}

}

AuthService::AuthService(auth::CredentialEngine& engine,
                         const crypto::KeyCustodian& keys,
                         const auth::SessionIssuer& sessions)
    : engine(engine)
    , keys(keys)
    , sessions(sessions)
    , hdls{
        {"public-key", [](AuthService& s, const json::object&) { return s.public_key(); }},
        {"verify-otp", [](AuthService& s, const json::object& r)
        {
            return s.lookup(optional_str(r, "phone"), optional_str(r, "firebaseToken"), optional_bool(r, "demoMode"));
        }},
        {"register", [](AuthService& s, const json::object& r)
        {
            auto req = read_credentials<auth::RegisterRequest>(r);
            return req ? s.register_identity(*req) : Response{400, result_msg(false, req.error())};
        }},
        {"login", [](AuthService& s, const json::object& r)
        {
            auto req = read_credentials<auth::LoginRequest>(r);
            return req ? s.login(*req) : Response{400, result_msg(false, req.error())};
        }},
        {"verify-token", [](AuthService& s, const json::object& r) { return s.verify_token(optional_str(r, "token")); }},
        {"logout", [](AuthService& s, const json::object&) { return s.logout(); }},
    }
{
}

Response AuthService::handle(const json::object& request)
{
    auto action = extract_str(request, "action");
    if (!action)
    {
        return Response{400, result_msg(false, action.error())};
    }

    auto it = hdls.find(*action);
    if (it == hdls.end())
    {
        return Response{404, result_msg(false, std::format("Unknown action: {}", *action))};
    }
    return it->second(*this, request);
}

Response AuthService::public_key() const
{
    return Response{200, json::object{
        {"success", true},
        {"publicKey", keys.get().public_key_pem()}
    }};
}

Response AuthService::lookup(std::string_view phone, std::string_view otp_token, bool demo_mode)
{
    if (phone.empty())
    {
        return Response{400, result_msg(false, "Phone number is required")};
    }

    auto normalized = auth::normalize_phone(phone);
    if (!normalized)
    {
        return Response{400, result_msg(false, "Invalid phone number format")};
    }

    if (!demo_mode && otp_token.empty())
    {
        return Response{400, result_msg(false, "Firebase token is required for OTP verification")};
    }

    auto found = engine.get().lookup(*normalized);
    if (!found)
    {
        return error_response(found.error());
    }

    bool is_new = !found->has_value();
    auto body = result_msg(true, is_new
        ? "OTP verified. Please set up your MPIN."
        : "OTP verified. Please enter your MPIN.");
    body["isNewUser"] = is_new;
    body["phone"] = *normalized;
    return Response{200, std::move(body)};
}

Response AuthService::register_identity(const auth::RegisterRequest& req)
{
    auto session = engine.get().register_identity(req);
    if (!session)
    {
        return error_response(session.error());
    }

    auto body = result_msg(true, "Registration successful! Welcome to SmartBank.");
    body["token"] = session->token;
    body["user"] = identity_json(session->identity);
    return Response{201, std::move(body)};
}

Response AuthService::login(const auth::LoginRequest& req)
{
    auto ok = engine.get().login(req);
    if (!ok)
    {
        return error_response(ok.error());
    }

    auto body = result_msg(true, "Login successful! Welcome back.");
    body["token"] = ok->session.token;
    body["user"] = identity_json(ok->session.identity);
    body["riskScore"] = ok->risk.score;
    body["riskFlags"] = flags_json(ok->risk.flags);
    return Response{200, std::move(body)};
}

Response AuthService::verify_token(std::string_view token) const
{
    if (token.empty())
    {
        return Response{400, result_msg(false, "Token required")};
    }

    auto claims = sessions.get().verify(token);
    if (!claims)
    {
        return Response{401, result_msg(false, "Invalid or expired token")};
    }

    auto unix_sec = [](auth::timestamp_t tp)
    {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    };

    return Response{200, json::object{
        {"success", true},
        {"user", json::object{
            {"userId", claims->identity_id},
            {"phone", claims->phone},
            {"iat", unix_sec(claims->issued_at)},
            {"exp", unix_sec(claims->expires_at)},
        }},
    }};
}

Response AuthService::logout() const
{
    // Tokens are stateless; the client discards its copy.
    return Response{200, result_msg(true, "Logged out successfully")};
}

unsigned AuthService::status_for(auth::AuthErrc code)
{
    using auth::AuthErrc;
    switch (code)
    {
        case AuthErrc::InvalidPhone:
        case AuthErrc::InvalidPinFormat:
        case AuthErrc::InvalidCiphertext:  return 400;
        case AuthErrc::WrongCredential:    return 401;
        case AuthErrc::RiskBlocked:        return 403;
        case AuthErrc::NotFound:           return 404;
        case AuthErrc::AlreadyRegistered:  return 409;
        case AuthErrc::AccountLocked:      return 423;
        case AuthErrc::StorageUnavailable: return 503;
    }
    return 503;
}

Response AuthService::error_response(const auth::AuthError& err)
{
    auto body = result_msg(false, err.message);

    switch (err.code)
    {
        case auth::AuthErrc::InvalidCiphertext:
            // One generic text for every decrypt failure
            body["message"] = "Invalid encrypted data";
            break;
        case auth::AuthErrc::AccountLocked:
            if (err.locked_until)
            {
                body["lockedUntil"] = iso8601(*err.locked_until);
            }
            break;
        case auth::AuthErrc::RiskBlocked:
            body["requireOtpReverify"] = true;
            body["riskFlags"] = flags_json(err.flags);
            break;
        case auth::AuthErrc::WrongCredential:
            body["attemptsRemaining"] = err.attempts_remaining.value_or(0);
            break;
        default:
            break;
    }

    return Response{status_for(err.code), std::move(body)};
}

json::object AuthService::identity_json(const auth::IdentityRecord& rec)
{
    json::array devices;
    for (const auto& d : rec.devices)
    {
        devices.push_back(json::object{
            {"fingerprint", d.fingerprint},
            {"userAgent", d.user_agent},
            {"lastUsed", iso8601(d.last_used)},
            {"trusted", d.trusted},
        });
    }

    json::object out{
        {"id", rec.id},
        {"phone", rec.phone},
        {"devices", std::move(devices)},
        {"createdAt", iso8601(rec.created_at)},
    };
    out["lastLogin"] = rec.last_login ? json::value(iso8601(*rec.last_login)) : json::value(nullptr);
    return out;
}

json::array AuthService::flags_json(const auth::risk_flags_t& flags)
{
    json::array out;
    for (auto f : flags)
    {
        out.emplace_back(auth::to_string(f));
    }
    return out;
}

std::string AuthService::iso8601(auth::timestamp_t tp)
{
    return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::milliseconds>(tp));
}

}
