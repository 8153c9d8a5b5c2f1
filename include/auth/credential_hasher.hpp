#pragma once

#include <string>
#include <string_view>
#include <expected>
#include <cstdint>

namespace auth
{

/**
 * Salted SHA-512 digest of an MPIN.
 * digest = hex(SHA-512(salt_hex || pin)); comparison is constant time.
 */
class CredentialHasher
{
public:
    static constexpr size_t salt_len = 32;
    static constexpr size_t digest_len = 64;
    static constexpr size_t salt_hex_len = salt_len * 2;
    static constexpr size_t digest_hex_len = digest_len * 2;

    [[nodiscard]] static std::expected<std::string, std::string> new_salt();
    [[nodiscard]] static std::expected<std::string, std::string> hash(std::string_view pin, std::string_view salt);
    [[nodiscard]] static bool verify(std::string_view pin, std::string_view digest, std::string_view salt);
};

// Exactly 4 or 6 ASCII digits, nothing else.
[[nodiscard]] bool check_mpin(std::string_view pin);

}
