#include "gambit/crypto/aes_gcm.hpp"
#include "gambit/crypto/sodium_interop.hpp"
#include "gambit/core/constants.hpp"
#include "gambit/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
#include <string>
namespace gambit::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;

    using BytesResult = Result<std::vector<uint8_t>, ProtocolFailure>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[kOpenSslErrorBufferBytes];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    BytesResult OpenSslError(const char* step) {
        return BytesResult::Err(
            ProtocolFailure::Generic(compat::format("{}: {}", step, GetOpenSSLError())));
    }

    Result<Unit, ProtocolFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != kAesKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("AES-256-GCM key must be {} bytes, got {}",
                                   kAesKeyBytes, key.size())));
        }
        if (nonce.size() != kAesGcmNonceBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("AES-GCM nonce must be {} bytes, got {}",
                                   kAesGcmNonceBytes, nonce.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    /// Cipher selection, IV length, key/nonce and AAD for either direction.
    bool PrepareContext(
        EVP_CIPHER_CTX* ctx,
        const bool encrypting,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data) {
        const int enc = encrypting ? 1 : 0;
        if (EVP_CipherInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) != OpenSSL::SUCCESS) {
            return false;
        }
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
            return false;
        }
        if (EVP_CipherInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data(), enc) != OpenSSL::SUCCESS) {
            return false;
        }
        if (!associated_data.empty()) {
            int outlen = 0;
            if (EVP_CipherUpdate(ctx, nullptr, &outlen, associated_data.data(),
                       static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
                return false;
            }
        }
        return true;
    }
}

Result<std::vector<uint8_t>, ProtocolFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto valid = ValidateKeyAndNonce(key, nonce); valid.IsErr()) {
        return BytesResult::Err(std::move(valid).UnwrapErr());
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return OpenSslError("Failed to create cipher context");
    }
    if (!PrepareContext(ctx.get(), true, key, nonce, associated_data)) {
        return OpenSslError("Failed to initialize AES-256-GCM encryption");
    }
    std::vector<uint8_t> output(plaintext.size() + kAesGcmTagBytes);
    int ciphertext_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return OpenSslError("Encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return OpenSslError("Encryption finalization failed");
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(kAesGcmTagBytes),
                            output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return OpenSslError("Failed to get authentication tag");
    }
    output.resize(static_cast<size_t>(ciphertext_len) + kAesGcmTagBytes);
    return BytesResult::Ok(std::move(output));
}

Result<std::vector<uint8_t>, ProtocolFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto valid = ValidateKeyAndNonce(key, nonce); valid.IsErr()) {
        return BytesResult::Err(std::move(valid).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < kAesGcmTagBytes) {
        return BytesResult::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                               ciphertext_with_tag.size(), kAesGcmTagBytes)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                             ciphertext_with_tag.end());

    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return OpenSslError("Failed to create cipher context");
    }
    if (!PrepareContext(ctx.get(), false, key, nonce, associated_data)) {
        return OpenSslError("Failed to initialize AES-256-GCM decryption");
    }
    std::vector<uint8_t> output(ciphertext_len);
    int plaintext_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return OpenSslError("Decryption failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(kAesGcmTagBytes), tag.data()) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return OpenSslError("Failed to set authentication tag");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return BytesResult::Err(
            ProtocolFailure::DecryptionFailed(
                "Authentication tag verification failed - data may have been tampered with"));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return BytesResult::Ok(std::move(output));
}
}
