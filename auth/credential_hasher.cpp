#include "auth/credential_hasher.hpp"

#include <sodium.h>
#include <array>
#include <algorithm>
#include <ranges>
#include <span>

namespace auth
{

namespace
{

using raw_digest_t = std::array<unsigned char, CredentialHasher::digest_len>;

bool sha512_salted(std::string_view pin, std::string_view salt, raw_digest_t& out)
{
    crypto_hash_sha512_state st;
    if (crypto_hash_sha512_init(&st) != 0)
    {
        return false;
    }
    bool ok = crypto_hash_sha512_update(&st, reinterpret_cast<const unsigned char*>(salt.data()), salt.size()) == 0
        && crypto_hash_sha512_update(&st, reinterpret_cast<const unsigned char*>(pin.data()), pin.size()) == 0
        && crypto_hash_sha512_final(&st, out.data()) == 0;
    sodium_memzero(&st, sizeof(st));
    return ok;
}

std::string to_hex(std::span<const unsigned char> bin)
{
    std::string hex(bin.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bin.data(), bin.size());
    hex.pop_back();
    return hex;
}

}

std::expected<std::string, std::string> CredentialHasher::new_salt()
{
    if (sodium_init() < 0)
    {
        return std::unexpected("Failed to initialize libsodium");
    }

    std::array<unsigned char, salt_len> salt;
    randombytes_buf(salt.data(), salt.size());
    return to_hex(salt);
}

std::expected<std::string, std::string> CredentialHasher::hash(std::string_view pin, std::string_view salt)
{
    if (sodium_init() < 0)
    {
        return std::unexpected("Failed to initialize libsodium");
    }

    raw_digest_t digest;
    if (!sha512_salted(pin, salt, digest))
    {
        return std::unexpected("Failed to hash credential");
    }

    auto hex = to_hex(digest);
    sodium_memzero(digest.data(), digest.size());
    return hex;
}

bool CredentialHasher::verify(std::string_view pin, std::string_view digest, std::string_view salt)
{
    if (sodium_init() < 0)
    {
        return false;
    }

    raw_digest_t computed;
    if (!sha512_salted(pin, salt, computed))
    {
        return false;
    }

    // A malformed stored digest still goes through the full compare against zeros.
    raw_digest_t stored{};
    size_t stored_len = 0;
    bool decoded = digest.size() == digest_hex_len
        && sodium_hex2bin(stored.data(), stored.size(), digest.data(), digest.size(),
                          nullptr, &stored_len, nullptr) == 0
        && stored_len == digest_len;

    bool equal = sodium_memcmp(computed.data(), stored.data(), digest_len) == 0;
    sodium_memzero(computed.data(), computed.size());
    return decoded && equal;
}

bool check_mpin(std::string_view pin)
{
    if (pin.size() != 4 && pin.size() != 6)
    {
        return false;
    }
    return std::ranges::all_of(pin, [](char c) { return c >= '0' && c <= '9'; });
}

}
