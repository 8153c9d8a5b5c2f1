#include <catch2/catch_test_macros.hpp>

#include "service/runtime.hpp"
#include "test_support.hpp"

#include <fstream>
#include <tuple>

using service::Response;
using test_support::FakeClock;
using test_support::encrypt_pin;
using namespace std::chrono_literals;

namespace
{

struct ServiceFixture
{
    test_support::TempDir tmp;
    FakeClock clk;
    std::unique_ptr<service::Runtime> rt;

    ServiceFixture()
    {
        std::ignore = test_support::shared_keys();

        auto path = tmp.get() / "config.json";
        {
            std::ofstream f(path);
            f << std::format(R"({{
                "keys": {{ "dir": "{}" }},
                "storage": {{ "db_path": ":memory:" }},
                "session": {{ "secret": "service-test-secret-service-test" }},
                "engine": {{ "cpu_threads": 2 }}
            }})", test_support::shared_key_dir().get().string());
        }

        auto cfg = Config::load(path.string());
        REQUIRE(cfg.has_value());
        auto created = service::Runtime::create(*cfg, clk.fn());
        REQUIRE(created.has_value());
        rt = std::move(*created);
    }

    Response call(json::object req)
    {
        return rt->service().handle(req);
    }

    Response enroll(std::string_view pin = "4821")
    {
        return call({{"action", "register"}, {"phone", "9876543210"}, {"encryptedMpin", encrypt_pin(pin)},
                     {"fingerprint", "dev-1"}, {"ip", "10.0.0.1"}, {"userAgent", "Mozilla/5.0"}});
    }

    Response attempt(std::string_view pin, std::string_view ip = "10.0.0.1", std::string_view fp = "dev-1")
    {
        return call({{"action", "login"}, {"phone", "9876543210"}, {"encryptedMpin", encrypt_pin(pin)},
                     {"fingerprint", fp}, {"ip", ip}, {"userAgent", "Mozilla/5.0"}});
    }
};

std::string message(const Response& r)
{
    return std::string(r.body.at("message").as_string());
}

}

TEST_CASE_METHOD(ServiceFixture, "Routing by action")
{
    auto missing = call({{"phone", "9876543210"}});
    CHECK(missing.status == 400);
    CHECK(missing.body.at("success").as_bool() == false);

    auto unknown = call({{"action", "transfer"}});
    CHECK(unknown.status == 404);

    auto wrong_type = call({{"action", 7}});
    CHECK(wrong_type.status == 400);
}

TEST_CASE_METHOD(ServiceFixture, "Public key is served as PEM")
{
    auto r = call({{"action", "public-key"}});
    CHECK(r.status == 200);
    CHECK(r.body.at("publicKey").as_string() == test_support::shared_keys().public_key_pem());
}

TEST_CASE_METHOD(ServiceFixture, "OTP lookup reports whether the phone is new")
{
    auto fresh = call({{"action", "verify-otp"}, {"phone", "+91 98765 43210"}, {"demoMode", true}});
    CHECK(fresh.status == 200);
    CHECK(fresh.body.at("isNewUser").as_bool());
    CHECK(fresh.body.at("phone").as_string() == "919876543210");

    REQUIRE(enroll().status == 201);
    auto known = call({{"action", "verify-otp"}, {"phone", "9876543210"}, {"firebaseToken", "eyJhbGciOi.otp"}});
    CHECK(known.status == 200);
    CHECK_FALSE(known.body.at("isNewUser").as_bool());

    auto empty = call({{"action", "verify-otp"}});
    CHECK(empty.status == 400);
    CHECK(message(empty) == "Phone number is required");

    auto bad = call({{"action", "verify-otp"}, {"phone", "12"}});
    CHECK(bad.status == 400);
    CHECK(message(bad) == "Invalid phone number format");
}

TEST_CASE_METHOD(ServiceFixture, "OTP lookup needs a provider token outside demo mode")
{
    auto bare = call({{"action", "verify-otp"}, {"phone", "9876543210"}});
    CHECK(bare.status == 400);
    CHECK(message(bare) == "Firebase token is required for OTP verification");
    CHECK_FALSE(bare.body.contains("isNewUser"));

    auto off = call({{"action", "verify-otp"}, {"phone", "9876543210"}, {"demoMode", false}, {"firebaseToken", ""}});
    CHECK(off.status == 400);

    auto demo = call({{"action", "verify-otp"}, {"phone", "9876543210"}, {"demoMode", true}});
    CHECK(demo.status == 200);
    CHECK(demo.body.at("isNewUser").as_bool());
}

TEST_CASE_METHOD(ServiceFixture, "Register returns a session and the public identity")
{
    auto r = enroll();
    REQUIRE(r.status == 201);
    CHECK(r.body.at("success").as_bool());
    CHECK(r.body.at("token").is_string());

    const auto& user = r.body.at("user").as_object();
    CHECK(user.at("phone").as_string() == "9876543210");
    CHECK(user.at("createdAt").as_string() == "2024-03-01T12:00:00.000Z");
    CHECK(user.at("lastLogin").is_null());
    CHECK_FALSE(user.contains("mpinHash"));
    REQUIRE(user.at("devices").as_array().size() == 1);
    CHECK(user.at("devices").as_array()[0].as_object().at("fingerprint").as_string() == "dev-1");

    auto dup = enroll("1111");
    CHECK(dup.status == 409);
}

TEST_CASE_METHOD(ServiceFixture, "Register input errors map to 400")
{
    auto no_pin = call({{"action", "register"}, {"phone", "9876543210"}});
    CHECK(no_pin.status == 400);
    CHECK(message(no_pin) == "Phone and encrypted MPIN are required");

    auto bad_blob = call({{"action", "register"}, {"phone", "9876543210"}, {"encryptedMpin", "AAAA"}});
    CHECK(bad_blob.status == 400);
    CHECK(message(bad_blob) == "Invalid encrypted data");

    auto bad_pin = enroll("123");
    CHECK(bad_pin.status == 400);
    CHECK(message(bad_pin) == "MPIN must be exactly 4 or 6 digits");
}

TEST_CASE_METHOD(ServiceFixture, "Login outcomes and their statuses")
{
    auto unknown = attempt("4821");
    CHECK(unknown.status == 404);

    REQUIRE(enroll().status == 201);

    auto wrong = attempt("0000");
    CHECK(wrong.status == 401);
    CHECK(wrong.body.at("attemptsRemaining").as_uint64() == 4);

    auto ok = attempt("4821");
    REQUIRE(ok.status == 200);
    CHECK(ok.body.at("riskScore").as_int64() == 0);
    CHECK(ok.body.at("riskFlags").as_array().empty());
    CHECK(ok.body.at("user").as_object().at("lastLogin").as_string() == "2024-03-01T12:00:00.000Z");

    auto token = std::string(ok.body.at("token").as_string());
    auto verified = call({{"action", "verify-token"}, {"token", token}});
    CHECK(verified.status == 200);
    const auto& user = verified.body.at("user").as_object();
    CHECK(user.at("phone").as_string() == "9876543210");
    CHECK(user.at("exp").as_int64() - user.at("iat").as_int64() == 900);
}

TEST_CASE_METHOD(ServiceFixture, "Locked identities answer 423 with the unlock time")
{
    REQUIRE(enroll().status == 201);
    for (int i = 0; i < 5; ++i)
    {
        CHECK(attempt("0000").status == 401);
    }

    auto locked = attempt("4821");
    CHECK(locked.status == 423);
    CHECK(locked.body.at("lockedUntil").as_string() == "2024-03-01T12:30:00.000Z");
}

TEST_CASE_METHOD(ServiceFixture, "Blocked logins ask for OTP re-verification")
{
    REQUIRE(enroll().status == 201);
    for (int i = 0; i < 3; ++i)
    {
        REQUIRE(attempt("4821").status == 200);
    }

    auto blocked = attempt("4821", "203.0.113.7", "dev-2");
    CHECK(blocked.status == 403);
    CHECK(blocked.body.at("requireOtpReverify").as_bool());
    CHECK(blocked.body.at("riskFlags").as_array().size() == 3);
}

TEST_CASE_METHOD(ServiceFixture, "Token checks")
{
    CHECK(call({{"action", "verify-token"}}).status == 400);
    CHECK(call({{"action", "verify-token"}, {"token", "nope"}}).status == 401);

    auto r = enroll();
    REQUIRE(r.status == 201);
    auto token = std::string(r.body.at("token").as_string());

    clk.advance(16min);
    auto expired = call({{"action", "verify-token"}, {"token", token}});
    CHECK(expired.status == 401);
    CHECK(message(expired) == "Invalid or expired token");
}

TEST_CASE_METHOD(ServiceFixture, "Logout always succeeds")
{
    auto r = call({{"action", "logout"}});
    CHECK(r.status == 200);
    CHECK(r.body.at("success").as_bool());
}

TEST_CASE("Error codes map to HTTP-style statuses")
{
    using auth::AuthErrc;
    using service::AuthService;
    CHECK(AuthService::status_for(AuthErrc::InvalidPhone) == 400);
    CHECK(AuthService::status_for(AuthErrc::WrongCredential) == 401);
    CHECK(AuthService::status_for(AuthErrc::RiskBlocked) == 403);
    CHECK(AuthService::status_for(AuthErrc::NotFound) == 404);
    CHECK(AuthService::status_for(AuthErrc::AlreadyRegistered) == 409);
    CHECK(AuthService::status_for(AuthErrc::AccountLocked) == 423);
    CHECK(AuthService::status_for(AuthErrc::StorageUnavailable) == 503);
}
