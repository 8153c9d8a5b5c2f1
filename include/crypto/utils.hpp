#pragma once
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <cstddef>
#include <memory>

namespace crypto
{

template<class T>
void secure_clear(T& cont)
{
    if constexpr (requires { cont.data(); cont.size(); })
    {
        OPENSSL_cleanse(cont.data(), cont.size());
    }
    else
    {
        OPENSSL_cleanse(std::addressof(cont), sizeof(cont));
    }
}

using pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using pkey_ctx_ptr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using bio_ptr = std::unique_ptr<BIO, decltype(&BIO_free_all)>;

} // namespace crypto
