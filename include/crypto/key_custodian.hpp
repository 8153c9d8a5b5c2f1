#pragma once
#include "crypto/utils.hpp"

#include <openssl/evp.h>
#include <concepts>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>

namespace crypto
{

/**
 * Owner of the deployment's RSA transport key pair.
 *
 * The pair is generated on first use and persisted as <dir>/public.pem (SPKI)
 * and <dir>/private.pem (PKCS#8, mode 0600); later runs load it. The private
 * key is only reachable through with_private_key().
 */
class KeyCustodian
{
public:
    static constexpr int min_bits = 2048;
    static constexpr const char* public_file = "public.pem";
    static constexpr const char* private_file = "private.pem";

    [[nodiscard]] static std::expected<KeyCustodian, std::string> open(
        const std::filesystem::path& dir,
        int bits = min_bits
    );

    KeyCustodian(const KeyCustodian&) = delete;
    KeyCustodian& operator=(const KeyCustodian&) = delete;
    KeyCustodian(KeyCustodian&&) noexcept = default;
    KeyCustodian& operator=(KeyCustodian&&) noexcept = default;

    [[nodiscard]] const std::string& public_key_pem() const { return pub_pem; }
    [[nodiscard]] bool generated() const { return fresh; }

    template<std::invocable<EVP_PKEY*> Fn>
    decltype(auto) with_private_key(Fn&& fn) const
    {
        return std::invoke(std::forward<Fn>(fn), pkey.get());
    }

private:
    KeyCustodian(pkey_ptr key, std::string pem, bool generated);

    static std::expected<pkey_ptr, std::string> generate(int bits);
    static std::expected<pkey_ptr, std::string> load(const std::filesystem::path& priv_path);
    static std::expected<std::string, std::string> export_public(EVP_PKEY* key);
    static std::expected<void, std::string> persist(EVP_PKEY* key, const std::filesystem::path& dir);

    pkey_ptr pkey;
    std::string pub_pem;
    bool fresh = false;
};

} // namespace crypto
