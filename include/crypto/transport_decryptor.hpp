#pragma once
#include "crypto/key_custodian.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace crypto
{

// Every decrypt failure collapses into this one value.
struct DecryptionError
{
    [[nodiscard]] static constexpr std::string_view message() { return "Decryption failed - invalid encrypted data"; }
};

/**
 * RSA-OAEP (SHA-256 digest, SHA-256 MGF1) decryption of a base64 PIN blob.
 */
class TransportDecryptor
{
public:
    explicit TransportDecryptor(const KeyCustodian& custodian);

    [[nodiscard]] std::expected<std::string, DecryptionError> decrypt(std::string_view ciphertext_b64) const;

    // Client side of the exchange: OAEP-encrypt under an SPKI PEM public key, base64 encoded.
    [[nodiscard]] static std::optional<std::string> encrypt(std::string_view public_pem, std::string_view plaintext);

private:
    std::reference_wrapper<const KeyCustodian> keys;
};

} // namespace crypto
