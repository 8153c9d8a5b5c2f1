#include "crypto/key_custodian.hpp"
#include "logger/logger.hpp"

#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <fcntl.h>
#include <unistd.h>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace crypto
{

KeyCustodian::KeyCustodian(pkey_ptr key, std::string pem, bool generated)
    : pkey(std::move(key))
    , pub_pem(std::move(pem))
    , fresh(generated)
{
}

std::expected<KeyCustodian, std::string> KeyCustodian::open(const fs::path& dir, int bits)
{
    if (bits < min_bits)
    {
        return std::unexpected(std::format("RSA modulus must be at least {} bits", min_bits));
    }

    auto priv_path = dir / private_file;
    auto pub_path = dir / public_file;

    std::error_code ec;
    bool have_priv = fs::exists(priv_path, ec);
    bool have_pub = fs::exists(pub_path, ec);

    if (have_priv && have_pub)
    {
        auto key = load(priv_path);
        if (!key)
        {
            return std::unexpected(key.error());
        }

        auto pem = export_public(key->get());
        if (!pem)
        {
            return std::unexpected(pem.error());
        }

        bio_ptr bio(BIO_new_file(pub_path.c_str(), "r"), BIO_free_all);
        pkey_ptr stored_pub(bio ? PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr) : nullptr, EVP_PKEY_free);
        if (!stored_pub || EVP_PKEY_eq(stored_pub.get(), key->get()) != 1)
        {
            return std::unexpected(std::format("{} does not match {}", pub_path.string(), priv_path.string()));
        }

        LOG_INFO("RSA key pair loaded from {}", dir.string());
        return KeyCustodian(std::move(*key), std::move(*pem), false);
    }

    if (have_priv || have_pub)
    {
        return std::unexpected(std::format("Incomplete key pair in {}; refusing to overwrite", dir.string()));
    }

    auto key = generate(bits);
    if (!key)
    {
        return std::unexpected(key.error());
    }

    if (auto res = persist(key->get(), dir); !res)
    {
        return std::unexpected(res.error());
    }

    auto pem = export_public(key->get());
    if (!pem)
    {
        return std::unexpected(pem.error());
    }

    LOG_INFO("New RSA-{} key pair generated in {}", bits, dir.string());
    return KeyCustodian(std::move(*key), std::move(*pem), true);
}

std::expected<pkey_ptr, std::string> KeyCustodian::generate(int bits)
{
    pkey_ctx_ptr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), EVP_PKEY_CTX_free);
    if (!ctx)
    {
        return std::unexpected("Failed to allocate key generation context");
    }

    if (EVP_PKEY_keygen_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) != 1)
    {
        return std::unexpected("Failed to configure RSA key generation");
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1)
    {
        return std::unexpected("RSA key generation failed");
    }
    return pkey_ptr(raw, EVP_PKEY_free);
}

std::expected<pkey_ptr, std::string> KeyCustodian::load(const fs::path& priv_path)
{
    bio_ptr bio(BIO_new_file(priv_path.c_str(), "r"), BIO_free_all);
    if (!bio)
    {
        return std::unexpected(std::format("Failed to open {}", priv_path.string()));
    }

    pkey_ptr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free);
    if (!key)
    {
        return std::unexpected(std::format("Failed to parse {}", priv_path.string()));
    }

    if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA)
    {
        return std::unexpected(std::format("{} is not an RSA key", priv_path.string()));
    }

    if (EVP_PKEY_bits(key.get()) < min_bits)
    {
        return std::unexpected(std::format("{} is weaker than {} bits", priv_path.string(), min_bits));
    }
    return key;
}

std::expected<std::string, std::string> KeyCustodian::export_public(EVP_PKEY* key)
{
    bio_ptr bio(BIO_new(BIO_s_mem()), BIO_free_all);
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key) != 1)
    {
        return std::unexpected("Failed to export public key");
    }

    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    if (len <= 0 || !data)
    {
        return std::unexpected("Failed to export public key");
    }
    return std::string(data, static_cast<size_t>(len));
}

std::expected<void, std::string> KeyCustodian::persist(EVP_PKEY* key, const fs::path& dir)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        return std::unexpected(std::format("Failed to create {}: {}", dir.string(), ec.message()));
    }

    auto priv_path = dir / private_file;
    auto pub_path = dir / public_file;

    // Create the private file with owner-only permissions before any key bytes are written.
    int fd = ::open(priv_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
    if (fd < 0)
    {
        return std::unexpected(std::format("Failed to create {}", priv_path.string()));
    }
    ::close(fd);

    {
        bio_ptr bio(BIO_new_file(priv_path.c_str(), "w"), BIO_free_all);
        if (!bio || PEM_write_bio_PKCS8PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr) != 1)
        {
            fs::remove(priv_path, ec);
            return std::unexpected(std::format("Failed to write {}", priv_path.string()));
        }
    }

    {
        bio_ptr bio(BIO_new_file(pub_path.c_str(), "w"), BIO_free_all);
        if (!bio || PEM_write_bio_PUBKEY(bio.get(), key) != 1)
        {
            fs::remove(priv_path, ec);
            fs::remove(pub_path, ec);
            return std::unexpected(std::format("Failed to write {}", pub_path.string()));
        }
    }

    return {};
}

} // namespace crypto
