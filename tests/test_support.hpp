#pragma once

#include "auth/types.hpp"
#include "crypto/key_custodian.hpp"
#include "crypto/transport_decryptor.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <format>

namespace test_support
{

using namespace std::chrono_literals;

// 2024-03-01 12:00:00 UTC, well clear of the unusual-hour band.
inline auth::timestamp_t noon()
{
    return std::chrono::sys_days{std::chrono::year{2024} / std::chrono::March / 1} + 12h;
}

class FakeClock
{
public:
    explicit FakeClock(auth::timestamp_t start = noon())
        : now(std::make_shared<std::atomic<auth::timestamp_t>>(start))
    {
    }

    [[nodiscard]] auth::Clock fn() const
    {
        return [p = now] { return p->load(); };
    }

    [[nodiscard]] auth::timestamp_t get() const { return now->load(); }
    void set(auth::timestamp_t tp) { now->store(tp); }
    void advance(std::chrono::system_clock::duration d) { now->store(now->load() + d); }

private:
    std::shared_ptr<std::atomic<auth::timestamp_t>> now;
};

class TempDir
{
public:
    TempDir()
    {
        std::random_device rd;
        path = std::filesystem::temp_directory_path() / std::format("mpin_test_{:08x}{:08x}", rd(), rd());
        std::filesystem::create_directories(path);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& get() const { return path; }

private:
    std::filesystem::path path;
};

// RSA generation is slow; one key pair serves every test in the binary.
inline const TempDir& shared_key_dir()
{
    static TempDir dir;
    return dir;
}

inline const crypto::KeyCustodian& shared_keys()
{
    static crypto::KeyCustodian keys = []
    {
        auto res = crypto::KeyCustodian::open(shared_key_dir().get());
        if (!res)
        {
            throw std::runtime_error(res.error());
        }
        return std::move(*res);
    }();
    return keys;
}

inline std::string encrypt_pin(std::string_view pin)
{
    auto blob = crypto::TransportDecryptor::encrypt(shared_keys().public_key_pem(), pin);
    if (!blob)
    {
        throw std::runtime_error("encrypt failed");
    }
    return *blob;
}

}
