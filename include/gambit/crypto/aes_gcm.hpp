#pragma once
#include "gambit/core/result.hpp"
#include "gambit/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace gambit::crypto {

/**
 * AES-256-GCM (OpenSSL EVP).
 *
 * Stateless primitive: the caller owns nonce uniqueness per key. Envelope
 * encryption gets its nonces from encryption::NonceGenerator and uses a fresh
 * message key per envelope.
 *
 * Output layout of Encrypt: ciphertext || 16-byte tag.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
