#pragma once
#include "gambit/core/result.hpp"
#include "gambit/core/failures.hpp"
#include "gambit/crypto/sodium_secure_memory_handle.hpp"
#include "wire/key_bundle.pb.h"
#include <cstdint>
#include <span>
#include <vector>

namespace gambit::encryption {

using crypto::SecureMemoryHandle;

/// Root secret agreed with one peer plus the side of the identity ordering we landed on.
struct SharedRoot {
    SecureMemoryHandle root_key;
    bool local_is_low = false;
};

/**
 * Long-term identity of one endpoint.
 *
 * Holds an Ed25519 signing key, an X25519 identity key and an X25519 signed
 * pre-key whose public part is signed by the Ed25519 key. Secrets never
 * leave guarded memory except for the duration of an agreement.
 */
class IdentityKeys {
public:
    [[nodiscard]] static Result<IdentityKeys, ProtocolFailure> Create();

    [[nodiscard]] std::vector<uint8_t> GetIdentityEd25519PublicCopy() const;
    [[nodiscard]] std::vector<uint8_t> GetIdentityX25519PublicCopy() const;
    [[nodiscard]] std::vector<uint8_t> GetSignedPreKeyPublicCopy() const;
    [[nodiscard]] uint32_t GetRegistrationId() const noexcept { return registration_id_; }

    [[nodiscard]] proto::wire::KeyBundle CreatePublicBundle() const;

    /**
     * Structural and cryptographic checks on a peer bundle: version, key
     * sizes, X25519 key validity and the pre-key signature. Does not check
     * for reflection; that needs our own identity (see DeriveSharedRoot).
     */
    [[nodiscard]] static Result<Unit, ProtocolFailure> ValidateRemoteBundle(
        const proto::wire::KeyBundle& remote_bundle);

    /**
     * Four X25519 agreements ordered by identity key so both sides compute
     * the same root independently:
     *   DH(id_low, id_high) || DH(spk_low, spk_high) || DH(id_low, spk_high) || DH(spk_low, id_high)
     * The root is HKDF(dh, salt = id_low || id_high).
     */
    [[nodiscard]] Result<SharedRoot, ProtocolFailure> DeriveSharedRoot(
        const proto::wire::KeyBundle& remote_bundle) const;

    IdentityKeys(IdentityKeys&&) noexcept = default;
    IdentityKeys& operator=(IdentityKeys&&) noexcept = default;
    IdentityKeys(const IdentityKeys&) = delete;
    IdentityKeys& operator=(const IdentityKeys&) = delete;
    ~IdentityKeys() = default;

private:
    IdentityKeys() = default;

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Agree(
        const SecureMemoryHandle& local_secret,
        std::span<const uint8_t> remote_public);

    SecureMemoryHandle identity_ed25519_secret_key_handle_;
    std::vector<uint8_t> identity_ed25519_public_;
    SecureMemoryHandle identity_x25519_secret_key_handle_;
    std::vector<uint8_t> identity_x25519_public_;
    uint32_t signed_pre_key_id_ = 0;
    SecureMemoryHandle signed_pre_key_secret_key_handle_;
    std::vector<uint8_t> signed_pre_key_public_;
    std::vector<uint8_t> signed_pre_key_signature_;
    uint32_t registration_id_ = 0;
};

}
