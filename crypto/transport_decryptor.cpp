#include "crypto/transport_decryptor.hpp"
#include "crypto/utils.hpp"
#include "fundamentals/base64.hpp"

#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/err.h>
#include <vector>

namespace crypto
{

namespace
{

bool set_oaep_sha256(EVP_PKEY_CTX* ctx)
{
    return EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) == 1
        && EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) == 1
        && EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) == 1;
}

}

TransportDecryptor::TransportDecryptor(const KeyCustodian& custodian)
    : keys(custodian)
{
}

std::expected<std::string, DecryptionError> TransportDecryptor::decrypt(std::string_view ciphertext_b64) const
{
    auto blob = base64::decode(ciphertext_b64);
    if (!blob || blob->empty())
    {
        return std::unexpected(DecryptionError{});
    }

    std::vector<uint8_t> plain;
    bool ok = keys.get().with_private_key([&](EVP_PKEY* key) -> bool
    {
        pkey_ctx_ptr ctx(EVP_PKEY_CTX_new(key, nullptr), EVP_PKEY_CTX_free);
        if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) != 1 || !set_oaep_sha256(ctx.get()))
        {
            return false;
        }

        size_t out_len = 0;
        if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, blob->data(), blob->size()) != 1)
        {
            return false;
        }

        plain.resize(out_len);
        if (EVP_PKEY_decrypt(ctx.get(), plain.data(), &out_len, blob->data(), blob->size()) != 1)
        {
            return false;
        }
        plain.resize(out_len);
        return true;
    });

    // Drop OpenSSL's queued diagnostics so nothing downstream can surface them.
    ERR_clear_error();

    if (!ok)
    {
        secure_clear(plain);
        return std::unexpected(DecryptionError{});
    }

    std::string pin(plain.begin(), plain.end());
    secure_clear(plain);
    return pin;
}

std::optional<std::string> TransportDecryptor::encrypt(std::string_view public_pem, std::string_view plaintext)
{
    bio_ptr bio(BIO_new_mem_buf(public_pem.data(), static_cast<int>(public_pem.size())), BIO_free_all);
    if (!bio)
    {
        return std::nullopt;
    }

    pkey_ptr pub(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free);
    if (!pub)
    {
        ERR_clear_error();
        return std::nullopt;
    }

    pkey_ctx_ptr ctx(EVP_PKEY_CTX_new(pub.get(), nullptr), EVP_PKEY_CTX_free);
    if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) != 1 || !set_oaep_sha256(ctx.get()))
    {
        ERR_clear_error();
        return std::nullopt;
    }

    const auto* in = reinterpret_cast<const unsigned char*>(plaintext.data());
    size_t out_len = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, in, plaintext.size()) != 1)
    {
        ERR_clear_error();
        return std::nullopt;
    }

    std::vector<uint8_t> out(out_len);
    if (EVP_PKEY_encrypt(ctx.get(), out.data(), &out_len, in, plaintext.size()) != 1)
    {
        ERR_clear_error();
        return std::nullopt;
    }
    out.resize(out_len);
    return base64::encode(out);
}

} // namespace crypto
