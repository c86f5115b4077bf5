#include "gambit/encryption/identity_keys.hpp"
#include "gambit/crypto/sodium_interop.hpp"
#include "gambit/crypto/hkdf.hpp"
#include "gambit/security/dh_validator.hpp"
#include "gambit/core/constants.hpp"
#include "gambit/core/format.hpp"
#include "gambit/debug/session_logger.hpp"
#include <algorithm>
#include <cstring>

namespace gambit::encryption {
using crypto::SodiumInterop;
using crypto::Hkdf;
using security::DhValidator;

namespace {
    std::span<const uint8_t> AsBytes(const std::string& field) {
        return {reinterpret_cast<const uint8_t*>(field.data()), field.size()};
    }

    std::string ToField(const std::vector<uint8_t>& bytes) {
        return {bytes.begin(), bytes.end()};
    }

    Result<Unit, ProtocolFailure> RequireSize(
        const std::string& field,
        const size_t expected,
        const char* name) {
        if (field.size() != expected) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("Key bundle {} must be {} bytes, got {}", name, expected, field.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

Result<IdentityKeys, ProtocolFailure> IdentityKeys::Create() {
    IdentityKeys keys;

    auto ed_result = SodiumInterop::GenerateEd25519KeyPair();
    if (ed_result.IsErr()) {
        return Result<IdentityKeys, ProtocolFailure>::Err(std::move(ed_result).UnwrapErr());
    }
    auto [ed_secret, ed_public] = std::move(ed_result).Unwrap();
    keys.identity_ed25519_secret_key_handle_ = std::move(ed_secret);
    keys.identity_ed25519_public_ = std::move(ed_public);

    auto id_result = SodiumInterop::GenerateX25519KeyPair(kPurposeIdentityX25519);
    if (id_result.IsErr()) {
        return Result<IdentityKeys, ProtocolFailure>::Err(std::move(id_result).UnwrapErr());
    }
    auto [id_secret, id_public] = std::move(id_result).Unwrap();
    keys.identity_x25519_secret_key_handle_ = std::move(id_secret);
    keys.identity_x25519_public_ = std::move(id_public);

    auto spk_result = SodiumInterop::GenerateX25519KeyPair(kPurposeSignedPreKey);
    if (spk_result.IsErr()) {
        return Result<IdentityKeys, ProtocolFailure>::Err(std::move(spk_result).UnwrapErr());
    }
    auto [spk_secret, spk_public] = std::move(spk_result).Unwrap();
    keys.signed_pre_key_secret_key_handle_ = std::move(spk_secret);
    keys.signed_pre_key_public_ = std::move(spk_public);
    keys.signed_pre_key_id_ = SodiumInterop::GenerateRandomUInt32(true);

    auto signature_result = SodiumInterop::SignDetached(
        keys.identity_ed25519_secret_key_handle_, keys.signed_pre_key_public_);
    if (signature_result.IsErr()) {
        return Result<IdentityKeys, ProtocolFailure>::Err(std::move(signature_result).UnwrapErr());
    }
    keys.signed_pre_key_signature_ = std::move(signature_result).Unwrap();
    keys.registration_id_ = SodiumInterop::GenerateRandomUInt32(true);

    GAMBIT_LOG_KEY(debug::Side::Unknown, "IDENTITY", "x25519_identity_public", keys.identity_x25519_public_);
    return Result<IdentityKeys, ProtocolFailure>::Ok(std::move(keys));
}

std::vector<uint8_t> IdentityKeys::GetIdentityEd25519PublicCopy() const {
    return identity_ed25519_public_;
}

std::vector<uint8_t> IdentityKeys::GetIdentityX25519PublicCopy() const {
    return identity_x25519_public_;
}

std::vector<uint8_t> IdentityKeys::GetSignedPreKeyPublicCopy() const {
    return signed_pre_key_public_;
}

proto::wire::KeyBundle IdentityKeys::CreatePublicBundle() const {
    proto::wire::KeyBundle bundle;
    bundle.set_version(kBundleVersion);
    bundle.set_registration_id(registration_id_);
    bundle.set_identity_ed25519(ToField(identity_ed25519_public_));
    bundle.set_identity_x25519(ToField(identity_x25519_public_));
    bundle.set_signed_pre_key_id(signed_pre_key_id_);
    bundle.set_signed_pre_key_public(ToField(signed_pre_key_public_));
    bundle.set_signed_pre_key_signature(ToField(signed_pre_key_signature_));
    return bundle;
}

Result<Unit, ProtocolFailure> IdentityKeys::ValidateRemoteBundle(
    const proto::wire::KeyBundle& remote_bundle) {

    if (remote_bundle.version() != kBundleVersion) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Unsupported key bundle version {}", remote_bundle.version())));
    }
    if (auto r = RequireSize(remote_bundle.identity_ed25519(), kEd25519PublicKeyBytes, "identity_ed25519");
        r.IsErr()) {
        return r;
    }
    if (auto r = RequireSize(remote_bundle.identity_x25519(), kX25519PublicKeyBytes, "identity_x25519");
        r.IsErr()) {
        return r;
    }
    if (auto r = RequireSize(remote_bundle.signed_pre_key_public(), kX25519PublicKeyBytes, "signed_pre_key_public");
        r.IsErr()) {
        return r;
    }
    if (auto r = RequireSize(remote_bundle.signed_pre_key_signature(), kEd25519SignatureBytes,
                             "signed_pre_key_signature");
        r.IsErr()) {
        return r;
    }
    if (auto r = DhValidator::ValidateX25519PublicKey(AsBytes(remote_bundle.identity_x25519())); r.IsErr()) {
        return r;
    }
    if (auto r = DhValidator::ValidateX25519PublicKey(AsBytes(remote_bundle.signed_pre_key_public())); r.IsErr()) {
        return r;
    }
    if (!SodiumInterop::VerifyDetached(
            AsBytes(remote_bundle.identity_ed25519()),
            AsBytes(remote_bundle.signed_pre_key_public()),
            AsBytes(remote_bundle.signed_pre_key_signature()))) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Handshake(std::string(ErrorMessages::SIGNED_PRE_KEY_FAILED)));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ProtocolFailure> IdentityKeys::Agree(
    const SecureMemoryHandle& local_secret,
    std::span<const uint8_t> remote_public) {
    return SodiumInterop::ScalarMult(local_secret, remote_public);
}

Result<SharedRoot, ProtocolFailure> IdentityKeys::DeriveSharedRoot(
    const proto::wire::KeyBundle& remote_bundle) const {

    if (auto valid = ValidateRemoteBundle(remote_bundle); valid.IsErr()) {
        return Result<SharedRoot, ProtocolFailure>::Err(std::move(valid).UnwrapErr());
    }

    const auto remote_id = AsBytes(remote_bundle.identity_x25519());
    const auto remote_spk = AsBytes(remote_bundle.signed_pre_key_public());
    const int order = std::memcmp(identity_x25519_public_.data(), remote_id.data(), kX25519PublicKeyBytes);
    const bool same_signing_key = remote_bundle.identity_ed25519() == ToField(identity_ed25519_public_);
    if (order == 0 || same_signing_key) {
        return Result<SharedRoot, ProtocolFailure>::Err(
            ProtocolFailure::Handshake(std::string(ErrorMessages::REFLECTION_ATTACK)));
    }
    const bool local_is_low = order < 0;

    // The cross terms swap roles so that (low.id x high.spk) and (low.spk x high.id)
    // come out identical on both sides.
    const SecureMemoryHandle& cross_one_secret = local_is_low
        ? identity_x25519_secret_key_handle_ : signed_pre_key_secret_key_handle_;
    const std::span<const uint8_t> cross_one_public = local_is_low ? remote_spk : remote_id;
    const SecureMemoryHandle& cross_two_secret = local_is_low
        ? signed_pre_key_secret_key_handle_ : identity_x25519_secret_key_handle_;
    const std::span<const uint8_t> cross_two_public = local_is_low ? remote_id : remote_spk;

    struct Agreement {
        const SecureMemoryHandle& secret;
        std::span<const uint8_t> remote;
    };
    const Agreement agreements[kBootstrapDhCount] = {
        {identity_x25519_secret_key_handle_, remote_id},
        {signed_pre_key_secret_key_handle_, remote_spk},
        {cross_one_secret, cross_one_public},
        {cross_two_secret, cross_two_public},
    };

    std::vector<uint8_t> dh_results;
    dh_results.reserve(kBootstrapDhCount * kX25519SharedSecretBytes);
    for (const auto& agreement : agreements) {
        auto dh = Agree(agreement.secret, agreement.remote);
        if (dh.IsErr()) {
            SodiumInterop::SecureWipe(dh_results);
            return Result<SharedRoot, ProtocolFailure>::Err(std::move(dh).UnwrapErr());
        }
        auto shared = std::move(dh).Unwrap();
        dh_results.insert(dh_results.end(), shared.begin(), shared.end());
        SodiumInterop::SecureWipe(shared);
    }

    std::vector<uint8_t> salt;
    salt.reserve(2 * kX25519PublicKeyBytes);
    if (local_is_low) {
        salt.insert(salt.end(), identity_x25519_public_.begin(), identity_x25519_public_.end());
        salt.insert(salt.end(), remote_id.begin(), remote_id.end());
    } else {
        salt.insert(salt.end(), remote_id.begin(), remote_id.end());
        salt.insert(salt.end(), identity_x25519_public_.begin(), identity_x25519_public_.end());
    }

    auto root_result = Hkdf::DeriveKeyBytes(
        dh_results, kRootKeyBytes, salt,
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(kBootstrapInfo.data()),
                                 kBootstrapInfo.size()));
    SodiumInterop::SecureWipe(dh_results);
    if (root_result.IsErr()) {
        return Result<SharedRoot, ProtocolFailure>::Err(std::move(root_result).UnwrapErr());
    }
    auto root_bytes = std::move(root_result).Unwrap();
    auto handle_result = SecureMemoryHandle::FromBytes(root_bytes);
    SodiumInterop::SecureWipe(root_bytes);
    if (handle_result.IsErr()) {
        return Result<SharedRoot, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }

    SharedRoot shared_root;
    shared_root.root_key = std::move(handle_result).Unwrap();
    shared_root.local_is_low = local_is_low;
    return Result<SharedRoot, ProtocolFailure>::Ok(std::move(shared_root));
}

}
