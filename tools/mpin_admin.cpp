#include "service/runtime.hpp"
#include "service/config.hpp"
#include "auth/phone.hpp"
#include "fundamentals/json_utils.hpp"
#include "logger/logger.hpp"

#include <boost/json.hpp>
#include <charconv>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace json = boost::json;

namespace
{

void print_usage(const char* prog)
{
    std::println("Usage: {} [--config <file>] <command> [args]", prog);
    std::println("Commands:");
    std::println("  pubkey                                       Print the transport public key (PEM)");
    std::println("  encrypt <pin>                                Encrypt a PIN under the public key");
    std::println("  register <phone> <ciphertext> [fingerprint]  Register an identity");
    std::println("  login <phone> <ciphertext> <ip> [fingerprint]");
    std::println("                                               Run a login attempt");
    std::println("  list                                         List identities and lock state");
    std::println("  unlock <phone>                               Clear lock and failure counter");
    std::println("  history <phone> [n]                          Show recent login attempts");
    std::println("  purge                                        Drop attempts past retention");
    std::println("  verify-token <token>                         Check a session token");
}

int emit(const service::Response& resp)
{
    json::object out = resp.body;
    out["status"] = resp.status;
    std::println("{}", json::serialize(out));
    return resp.status < 300 ? 0 : 1;
}

int emit_error(std::string_view msg)
{
    std::println("{}", json::serialize(json_utils::result_msg(false, msg)));
    return 1;
}

int cmd_pubkey(service::Runtime& rt)
{
    std::print("{}", rt.keys().public_key_pem());
    return 0;
}

int cmd_encrypt(service::Runtime& rt, std::string_view pin)
{
    auto blob = crypto::TransportDecryptor::encrypt(rt.keys().public_key_pem(), pin);
    if (!blob)
    {
        return emit_error("Encryption failed");
    }
    std::println("{}", *blob);
    return 0;
}

int cmd_register(service::Runtime& rt, std::string_view phone, std::string_view blob, std::string_view fp)
{
    auth::RegisterRequest req{std::string(phone), std::string(blob), std::string(fp), "127.0.0.1", "mpin_admin"};
    return emit(rt.service().register_identity(req));
}

int cmd_login(service::Runtime& rt, std::string_view phone, std::string_view blob, std::string_view ip, std::string_view fp)
{
    auth::LoginRequest req{std::string(phone), std::string(blob), std::string(fp), std::string(ip), "mpin_admin"};
    return emit(rt.service().login(req));
}

int cmd_list(service::Runtime& rt)
{
    auto rows = rt.identities().list();
    if (!rows)
    {
        LOG_ERROR("Identity listing failed: {}", rows.error().detail);
        return emit_error("Service temporarily unavailable");
    }

    auto now = rt.clock()();
    json::array out;
    for (const auto& rec : *rows)
    {
        auto item = service::AuthService::identity_json(rec);
        item["failedAttempts"] = rec.lockout.failures;
        item["locked"] = auth::LockoutStateMachine::is_locked(rec.lockout, now);
        if (rec.lockout.locked_until)
        {
            item["lockedUntil"] = service::AuthService::iso8601(*rec.lockout.locked_until);
        }
        out.push_back(std::move(item));
    }
    std::println("{}", json::serialize(json::object{{"success", true}, {"identities", std::move(out)}}));
    return 0;
}

int cmd_unlock(service::Runtime& rt, std::string_view phone)
{
    auto res = rt.engine().unlock(phone);
    if (!res)
    {
        return emit_error(res.error().message);
    }
    return emit(service::Response{200, json_utils::result_msg(true, *res ? "Identity unlocked" : "Identity was not locked")});
}

int cmd_history(service::Runtime& rt, std::string_view raw_phone, size_t limit)
{
    auto phone = auth::normalize_phone(raw_phone);
    if (!phone)
    {
        return emit_error(phone.error());
    }

    auto now = rt.clock()();
    auto rows = rt.ledger().recent_for(*phone, now - rt.ledger().retention(), limit);
    if (!rows)
    {
        LOG_ERROR("History query failed: {}", rows.error());
        return emit_error("Service temporarily unavailable");
    }

    json::array out;
    for (const auto& a : *rows)
    {
        out.push_back(json::object{
            {"timestamp", service::AuthService::iso8601(a.timestamp)},
            {"ip", a.ip},
            {"fingerprint", a.fingerprint},
            {"userAgent", a.user_agent},
            {"success", a.success},
            {"reason", auth::to_string(a.reason)},
            {"riskScore", a.risk_score},
        });
    }
    std::println("{}", json::serialize(json::object{{"success", true}, {"attempts", std::move(out)}}));
    return 0;
}

int cmd_purge(service::Runtime& rt)
{
    auto removed = rt.ledger().purge_expired(rt.clock()());
    if (!removed)
    {
        LOG_ERROR("Purge failed: {}", removed.error());
        return emit_error("Service temporarily unavailable");
    }
    std::println("{}", json::serialize(json::object{{"success", true}, {"removed", *removed}}));
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string_view> args(argv + 1, argv + argc);
    std::string config_path = "mpin_config.json";

    if (args.size() >= 2 && args[0] == "--config")
    {
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty())
    {
        print_usage(argv[0]);
        return 1;
    }

    auto config = Config::load_or_defaults(config_path);

    // stdout carries command output; log lines go to the configured file only.
    const auto& log_cfg = config.logging();
    if (auto result = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, false); !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
        return 1;
    }

    auto rt_res = service::Runtime::create(config);
    if (!rt_res)
    {
        std::println(stderr, "Failed to start engine: {}", rt_res.error());
        Logger::shutdown();
        return 1;
    }
    auto& rt = **rt_res;

    auto cmd = args[0];
    auto n = args.size();
    int rc = 1;

    if (cmd == "pubkey" && n == 1)
    {
        rc = cmd_pubkey(rt);
    }
    else if (cmd == "encrypt" && n == 2)
    {
        rc = cmd_encrypt(rt, args[1]);
    }
    else if (cmd == "register" && (n == 3 || n == 4))
    {
        rc = cmd_register(rt, args[1], args[2], n == 4 ? args[3] : "");
    }
    else if (cmd == "login" && (n == 4 || n == 5))
    {
        rc = cmd_login(rt, args[1], args[2], args[3], n == 5 ? args[4] : "");
    }
    else if (cmd == "list" && n == 1)
    {
        rc = cmd_list(rt);
    }
    else if (cmd == "unlock" && n == 2)
    {
        rc = cmd_unlock(rt, args[1]);
    }
    else if (cmd == "history" && (n == 2 || n == 3))
    {
        size_t limit = 20;
        if (n == 3)
        {
            auto [ptr, ec] = std::from_chars(args[2].data(), args[2].data() + args[2].size(), limit);
            if (ec != std::errc{} || limit == 0)
            {
                print_usage(argv[0]);
                Logger::shutdown();
                return 1;
            }
        }
        rc = cmd_history(rt, args[1], limit);
    }
    else if (cmd == "purge" && n == 1)
    {
        rc = cmd_purge(rt);
    }
    else if (cmd == "verify-token" && n == 2)
    {
        rc = emit(rt.service().verify_token(args[1]));
    }
    else
    {
        print_usage(argv[0]);
    }

    Logger::shutdown();
    return rc;
}
