#pragma once

#include "gambit/core/result.hpp"
#include "gambit/core/failures.hpp"
#include "gambit/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gambit::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium
 *
 * Every other crypto type in the library goes through this class, so
 * Initialize() must succeed once per process before any key is created.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, large ones with
     * sodium_memzero. Usable before Initialize().
     */
    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Key Generation and Agreement
    // ========================================================================

    /**
     * @brief Generate an X25519 key pair
     *
     * @param key_purpose Used in error messages only
     * @return Ok((secret handle, public key)) or Err
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Generate an Ed25519 signing key pair
     *
     * @return Ok((secret handle, public key)) or Err
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateEd25519KeyPair();

    /// Detached Ed25519 signature of `message` with the secret key held in `secret_key`.
    static Result<std::vector<uint8_t>, ProtocolFailure> SignDetached(
        const SecureMemoryHandle& secret_key,
        std::span<const uint8_t> message);

    static bool VerifyDetached(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);

    /**
     * @brief X25519 agreement between our secret and a peer public key
     *
     * Fails when libsodium reports an all-zero shared secret.
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> ScalarMult(
        const SecureMemoryHandle& secret_key,
        std::span<const uint8_t> peer_public_key);

    // ========================================================================
    // Random Number Generation and Encoding
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static uint32_t GenerateRandomUInt32(bool ensure_non_zero = false);

    static std::string ToHex(std::span<const uint8_t> data);

    /// URL-safe base64 without padding.
    static std::string ToBase64(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, ProtocolFailure> FromBase64(std::string_view text);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guarded memory with sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;


private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static void WipeSmallBuffer(std::span<uint8_t> buffer) noexcept;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace gambit::crypto
