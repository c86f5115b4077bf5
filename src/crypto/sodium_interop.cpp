#include "gambit/crypto/sodium_interop.hpp"
#include "gambit/crypto/sodium_secure_memory_handle.hpp"

#include <cstring>

namespace gambit::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

void SodiumInterop::SecureWipe(std::span<uint8_t> buffer) noexcept {
    if (buffer.empty()) {
        return;
    }
    if (buffer.size() <= kSmallBufferThreshold) {
        WipeSmallBuffer(buffer);
        return;
    }
    // sodium_memzero needs no sodium_init().
    sodium_memzero(buffer.data(), buffer.size());
}

void SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) noexcept {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                std::string(ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED) + ": " +
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    return Result<bool, SodiumFailure>::Ok(sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

// ============================================================================
// Key Generation and Agreement
// ============================================================================

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;

    auto sk_handle_result = SecureMemoryHandle::Allocate(kX25519PrivateKeyBytes);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> pk_bytes(kX25519PublicKeyBytes);
    auto derive_result = sk_handle.WithWriteAccess([&pk_bytes](std::span<uint8_t> secret) {
        randombytes_buf(secret.data(), secret.size());
        return crypto_scalarmult_base(pk_bytes.data(), secret.data()) == 0;
    });
    if (derive_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    if (!derive_result.Unwrap()) {
        return KeyPairResult::Err(
            ProtocolFailure::DeriveKey(
                "Failed to derive " + std::string(key_purpose) + " public key"));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateEd25519KeyPair() {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;

    auto sk_handle_result = SecureMemoryHandle::Allocate(kEd25519SecretKeyBytes);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> pk(kEd25519PublicKeyBytes);
    auto keypair_result = sk_handle.WithWriteAccess([&pk](std::span<uint8_t> secret) {
        return crypto_sign_keypair(pk.data(), secret.data()) == 0;
    });
    if (keypair_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(keypair_result.UnwrapErr()));
    }
    if (!keypair_result.Unwrap()) {
        return KeyPairResult::Err(
            ProtocolFailure::KeyGeneration("Failed to generate Ed25519 key pair"));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk)));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::SignDetached(
    const SecureMemoryHandle& secret_key,
    std::span<const uint8_t> message) {

    if (secret_key.Size() != kEd25519SecretKeyBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Ed25519 secret key has incorrect size"));
    }

    std::vector<uint8_t> signature(kEd25519SignatureBytes);
    auto sign_result = secret_key.WithReadAccess([&](std::span<const uint8_t> secret) {
        return crypto_sign_detached(signature.data(), nullptr,
                                    message.data(), message.size(),
                                    secret.data()) == 0;
    });
    if (sign_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(sign_result.UnwrapErr()));
    }
    if (!sign_result.Unwrap()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::KeyGeneration("Failed to sign message"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(signature));
}

bool SodiumInterop::VerifyDetached(
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {

    if (public_key.size() != kEd25519PublicKeyBytes ||
        signature.size() != kEd25519SignatureBytes) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(),
                                       message.data(), message.size(),
                                       public_key.data()) == 0;
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::ScalarMult(
    const SecureMemoryHandle& secret_key,
    std::span<const uint8_t> peer_public_key) {

    if (secret_key.Size() != kX25519PrivateKeyBytes ||
        peer_public_key.size() != kX25519PublicKeyBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("X25519 agreement requires 32-byte keys"));
    }

    std::vector<uint8_t> shared(kX25519SharedSecretBytes);
    auto dh_result = secret_key.WithReadAccess([&](std::span<const uint8_t> secret) {
        return crypto_scalarmult(shared.data(), secret.data(), peer_public_key.data()) == 0;
    });
    if (dh_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(dh_result.UnwrapErr()));
    }
    if (!dh_result.Unwrap()) {
        SecureWipe(std::span<uint8_t>(shared));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::PeerPubKey("X25519 agreement produced an all-zero secret"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(shared));
}

// ============================================================================
// Random Number Generation and Encoding
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

uint32_t SodiumInterop::GenerateRandomUInt32(bool ensure_non_zero) {
    uint32_t value;
    do {
        value = randombytes_random();
    } while (ensure_non_zero && value == 0);

    return value;
}

std::string SodiumInterop::ToHex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.resize(data.size() * 2);
    return hex;
}

std::string SodiumInterop::ToBase64(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), variant);
    std::string encoded(encoded_len, '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
    // encoded_len counts the terminating NUL
    encoded.resize(std::strlen(encoded.c_str()));
    return encoded;
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::FromBase64(std::string_view text) {
    std::vector<uint8_t> decoded(text.size());
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          text.data(), text.size(),
                          " \r\n\t", &decoded_len, &end,
                          sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0 ||
        end != text.data() + text.size()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decode("Invalid base64 text"));
    }
    decoded.resize(decoded_len);
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(decoded));
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace gambit::crypto
