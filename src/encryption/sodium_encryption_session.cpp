#include "gambit/encryption/sodium_encryption_session.hpp"
#include "gambit/crypto/sodium_interop.hpp"
#include "gambit/crypto/aes_gcm.hpp"
#include "gambit/crypto/hkdf.hpp"
#include "gambit/core/constants.hpp"
#include "gambit/core/format.hpp"
#include "gambit/debug/session_logger.hpp"

namespace gambit::encryption {
using crypto::SodiumInterop;
using crypto::AesGcm;
using crypto::Hkdf;

namespace {
    using BytesResult = Result<std::vector<uint8_t>, ProtocolFailure>;

    std::span<const uint8_t> AsBytes(const std::string& field) {
        return {reinterpret_cast<const uint8_t*>(field.data()), field.size()};
    }

    /// HKDF-expand a secret that lives in guarded memory without copying it out.
    BytesResult ExpandFromHandle(
        const SecureMemoryHandle& key,
        const std::string_view info,
        const size_t output_size) {
        auto access = key.WithReadAccess([&](std::span<const uint8_t> secret) {
            return Hkdf::DeriveKeyBytes(secret, output_size, info);
        });
        if (access.IsErr()) {
            return BytesResult::Err(ProtocolFailure::FromSodiumFailure(access.UnwrapErr()));
        }
        return std::move(access).Unwrap();
    }

    Result<SecureMemoryHandle, ProtocolFailure> IntoHandle(std::vector<uint8_t>& bytes) {
        auto handle = SecureMemoryHandle::FromBytes(bytes);
        SodiumInterop::SecureWipe(bytes);
        if (handle.IsErr()) {
            return Result<SecureMemoryHandle, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        return Result<SecureMemoryHandle, ProtocolFailure>::Ok(std::move(handle).Unwrap());
    }

    Result<SecureMemoryHandle, ProtocolFailure> DeriveHandle(
        const SecureMemoryHandle& key,
        const std::string_view info,
        const size_t output_size) {
        auto bytes = ExpandFromHandle(key, info, output_size);
        if (bytes.IsErr()) {
            return Result<SecureMemoryHandle, ProtocolFailure>::Err(std::move(bytes).UnwrapErr());
        }
        return IntoHandle(bytes.Unwrap());
    }

    std::vector<uint8_t> MetadataAssociatedData(
        std::span<const uint8_t> sender_identity,
        std::span<const uint8_t> receiver_identity) {
        std::vector<uint8_t> ad;
        ad.reserve(sender_identity.size() + receiver_identity.size());
        ad.insert(ad.end(), sender_identity.begin(), sender_identity.end());
        ad.insert(ad.end(), receiver_identity.begin(), receiver_identity.end());
        return ad;
    }

    std::vector<uint8_t> PayloadAssociatedData(
        std::span<const uint8_t> sender_identity,
        std::span<const uint8_t> receiver_identity,
        const uint32_t message_index) {
        auto ad = MetadataAssociatedData(sender_identity, receiver_identity);
        for (size_t i = 0; i < kNonceIndexBytes; ++i) {
            ad.push_back(static_cast<uint8_t>((message_index >> (i * 8)) & 0xFF));
        }
        return ad;
    }

    Result<Unit, ProtocolFailure> RequirePeerId(const std::string_view peer_id) {
        if (peer_id.empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Peer id cannot be empty"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

SodiumEncryptionSession::SodiumEncryptionSession(IdentityKeys identity_keys)
    : identity_keys_(std::move(identity_keys))
    , local_identity_ed25519_(identity_keys_.GetIdentityEd25519PublicCopy())
    , lock_(std::make_unique<std::mutex>()) {
}

Result<std::unique_ptr<SodiumEncryptionSession>, ProtocolFailure> SodiumEncryptionSession::Create() {
    using CreateResult = Result<std::unique_ptr<SodiumEncryptionSession>, ProtocolFailure>;

    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return CreateResult::Err(ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    auto keys_result = IdentityKeys::Create();
    if (keys_result.IsErr()) {
        return CreateResult::Err(std::move(keys_result).UnwrapErr());
    }
    return CreateResult::Ok(std::unique_ptr<SodiumEncryptionSession>(
        new SodiumEncryptionSession(std::move(keys_result).Unwrap())));
}

Result<proto::wire::KeyBundle, ProtocolFailure> SodiumEncryptionSession::ExportBundle() const {
    std::lock_guard guard(*lock_);
    return Result<proto::wire::KeyBundle, ProtocolFailure>::Ok(identity_keys_.CreatePublicBundle());
}

Result<std::unique_ptr<SodiumEncryptionSession::PeerSession>, ProtocolFailure>
SodiumEncryptionSession::BuildPeerSession(const proto::wire::KeyBundle& bundle) const {
    using SessionResult = Result<std::unique_ptr<PeerSession>, ProtocolFailure>;

    auto root_result = identity_keys_.DeriveSharedRoot(bundle);
    if (root_result.IsErr()) {
        return SessionResult::Err(std::move(root_result).UnwrapErr());
    }
    SharedRoot root = std::move(root_result).Unwrap();

    auto header_key = DeriveHandle(root.root_key, kHeaderKeyInfo, kHeaderKeyBytes);
    if (header_key.IsErr()) {
        return SessionResult::Err(std::move(header_key).UnwrapErr());
    }
    auto low_to_high = DeriveHandle(root.root_key, kLowToHighChainInfo, kChainKeyBytes);
    if (low_to_high.IsErr()) {
        return SessionResult::Err(std::move(low_to_high).UnwrapErr());
    }
    auto high_to_low = DeriveHandle(root.root_key, kHighToLowChainInfo, kChainKeyBytes);
    if (high_to_low.IsErr()) {
        return SessionResult::Err(std::move(high_to_low).UnwrapErr());
    }
    auto nonce_generator = NonceGenerator::Create();
    if (nonce_generator.IsErr()) {
        return SessionResult::Err(std::move(nonce_generator).UnwrapErr());
    }

    auto session = std::make_unique<PeerSession>(std::move(nonce_generator).Unwrap());
    session->remote_identity_ed25519.assign(
        bundle.identity_ed25519().begin(), bundle.identity_ed25519().end());
    session->header_key = std::move(header_key).Unwrap();
    if (root.local_is_low) {
        session->sending_chain_key = std::move(low_to_high).Unwrap();
        session->receiving_chain_key = std::move(high_to_low).Unwrap();
    } else {
        session->sending_chain_key = std::move(high_to_low).Unwrap();
        session->receiving_chain_key = std::move(low_to_high).Unwrap();
    }
    return SessionResult::Ok(std::move(session));
}

Result<Unit, ProtocolFailure> SodiumEncryptionSession::ImportBundle(
    std::string_view peer_id,
    const proto::wire::KeyBundle& bundle) {

    if (auto valid = RequirePeerId(peer_id); valid.IsErr()) {
        return valid;
    }
    std::lock_guard guard(*lock_);
    if (peers_.find(peer_id) != peers_.end()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::SESSION_EXISTS)));
    }

    auto session = BuildPeerSession(bundle);
    if (session.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(session).UnwrapErr());
    }
    peers_.emplace(std::string(peer_id), std::move(session).Unwrap());

    GAMBIT_LOG_KEY(debug::Side::Unknown, "BOOTSTRAP", "peer_identity_ed25519",
                   AsBytes(bundle.identity_ed25519()));
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

bool SodiumEncryptionSession::HasSession(std::string_view peer_id) const {
    std::lock_guard guard(*lock_);
    return peers_.find(peer_id) != peers_.end();
}

Result<proto::wire::SecureEnvelope, ProtocolFailure> SodiumEncryptionSession::Encrypt(
    std::string_view peer_id,
    std::span<const uint8_t> plaintext) {
    using EnvelopeResult = Result<proto::wire::SecureEnvelope, ProtocolFailure>;

    std::lock_guard guard(*lock_);
    const auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return EnvelopeResult::Err(
            ProtocolFailure::EncryptionUnavailable(std::string(ErrorMessages::NO_SESSION)));
    }
    PeerSession& session = *it->second;

    const uint32_t message_index = session.next_send_index;
    if (static_cast<uint64_t>(message_index) >= kMaxMessageIndex) {
        return EnvelopeResult::Err(ProtocolFailure::InvalidState("Sending chain exhausted"));
    }

    auto message_key_result = ExpandFromHandle(session.sending_chain_key, kMessageInfo, kMessageKeyBytes);
    if (message_key_result.IsErr()) {
        return EnvelopeResult::Err(std::move(message_key_result).UnwrapErr());
    }
    auto next_chain_result = ExpandFromHandle(session.sending_chain_key, kChainInfo, kChainKeyBytes);
    if (next_chain_result.IsErr()) {
        return EnvelopeResult::Err(std::move(next_chain_result).UnwrapErr());
    }
    std::vector<uint8_t> message_key = std::move(message_key_result).Unwrap();
    std::vector<uint8_t> next_chain = std::move(next_chain_result).Unwrap();

    auto payload_nonce_result = session.nonce_generator.Next(message_index);
    if (payload_nonce_result.IsErr()) {
        SodiumInterop::SecureWipe(message_key);
        SodiumInterop::SecureWipe(next_chain);
        return EnvelopeResult::Err(std::move(payload_nonce_result).UnwrapErr());
    }
    const std::vector<uint8_t> payload_nonce = std::move(payload_nonce_result).Unwrap();

    const auto payload_ad = PayloadAssociatedData(
        local_identity_ed25519_, session.remote_identity_ed25519, message_index);
    auto payload_result = AesGcm::Encrypt(message_key, payload_nonce, plaintext, payload_ad);
    SodiumInterop::SecureWipe(message_key);
    if (payload_result.IsErr()) {
        SodiumInterop::SecureWipe(next_chain);
        return EnvelopeResult::Err(std::move(payload_result).UnwrapErr());
    }

    proto::wire::EnvelopeHeader header;
    header.set_message_index(message_index);
    header.set_payload_nonce(std::string(payload_nonce.begin(), payload_nonce.end()));
    std::string header_bytes;
    if (!header.SerializeToString(&header_bytes)) {
        SodiumInterop::SecureWipe(next_chain);
        return EnvelopeResult::Err(ProtocolFailure::Encode("Failed to serialize envelope header"));
    }

    const auto header_nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
    const auto metadata_ad = MetadataAssociatedData(local_identity_ed25519_, session.remote_identity_ed25519);
    auto header_result = session.header_key.WithReadAccess([&](std::span<const uint8_t> header_key) {
        return AesGcm::Encrypt(header_key, header_nonce, AsBytes(header_bytes), metadata_ad);
    });
    if (header_result.IsErr()) {
        SodiumInterop::SecureWipe(next_chain);
        return EnvelopeResult::Err(ProtocolFailure::FromSodiumFailure(header_result.UnwrapErr()));
    }
    auto encrypted_header = std::move(header_result).Unwrap();
    if (encrypted_header.IsErr()) {
        SodiumInterop::SecureWipe(next_chain);
        return EnvelopeResult::Err(std::move(encrypted_header).UnwrapErr());
    }

    auto next_chain_handle = IntoHandle(next_chain);
    if (next_chain_handle.IsErr()) {
        return EnvelopeResult::Err(std::move(next_chain_handle).UnwrapErr());
    }
    session.sending_chain_key = std::move(next_chain_handle).Unwrap();
    ++session.next_send_index;

    const auto& header_ciphertext = encrypted_header.Unwrap();
    const auto& payload_ciphertext = payload_result.Unwrap();
    proto::wire::SecureEnvelope envelope;
    envelope.set_version(kEnvelopeVersion);
    envelope.set_header_nonce(std::string(header_nonce.begin(), header_nonce.end()));
    envelope.set_encrypted_header(std::string(header_ciphertext.begin(), header_ciphertext.end()));
    envelope.set_encrypted_payload(std::string(payload_ciphertext.begin(), payload_ciphertext.end()));

    GAMBIT_LOG_VALUE(debug::Side::Unknown, "ENCRYPT", "message_index", message_index);
    return EnvelopeResult::Ok(std::move(envelope));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumEncryptionSession::Decrypt(
    std::string_view peer_id,
    const proto::wire::SecureEnvelope& envelope) {

    std::lock_guard guard(*lock_);
    const auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return BytesResult::Err(
            ProtocolFailure::EncryptionUnavailable(std::string(ErrorMessages::NO_SESSION)));
    }
    PeerSession& session = *it->second;

    if (envelope.version() != kEnvelopeVersion) {
        return BytesResult::Err(
            ProtocolFailure::Decode(compat::format("Unsupported envelope version {}", envelope.version())));
    }

    const auto metadata_ad = MetadataAssociatedData(session.remote_identity_ed25519, local_identity_ed25519_);
    auto header_access = session.header_key.WithReadAccess([&](std::span<const uint8_t> header_key) {
        return AesGcm::Decrypt(header_key, AsBytes(envelope.header_nonce()),
                               AsBytes(envelope.encrypted_header()), metadata_ad);
    });
    if (header_access.IsErr()) {
        return BytesResult::Err(ProtocolFailure::FromSodiumFailure(header_access.UnwrapErr()));
    }
    auto header_plaintext = std::move(header_access).Unwrap();
    if (header_plaintext.IsErr()) {
        return header_plaintext;
    }
    const auto& header_bytes = header_plaintext.Unwrap();

    proto::wire::EnvelopeHeader header;
    if (!header.ParseFromArray(header_bytes.data(), static_cast<int>(header_bytes.size()))) {
        return BytesResult::Err(ProtocolFailure::Decode("Failed to parse envelope header"));
    }

    const uint32_t message_index = header.message_index();
    if (message_index < session.next_receive_index) {
        return BytesResult::Err(
            ProtocolFailure::ReplayAttack(
                compat::format("Message index {} already processed (expected {})",
                               message_index, session.next_receive_index)));
    }
    if (message_index > session.next_receive_index) {
        return BytesResult::Err(
            ProtocolFailure::InvalidState(
                compat::format("Message index {} out of order (expected {})",
                               message_index, session.next_receive_index)));
    }

    auto message_key_result = ExpandFromHandle(session.receiving_chain_key, kMessageInfo, kMessageKeyBytes);
    if (message_key_result.IsErr()) {
        return message_key_result;
    }
    auto next_chain_result = ExpandFromHandle(session.receiving_chain_key, kChainInfo, kChainKeyBytes);
    if (next_chain_result.IsErr()) {
        return next_chain_result;
    }
    std::vector<uint8_t> message_key = std::move(message_key_result).Unwrap();
    std::vector<uint8_t> next_chain = std::move(next_chain_result).Unwrap();

    const auto payload_ad = PayloadAssociatedData(
        session.remote_identity_ed25519, local_identity_ed25519_, message_index);
    auto plaintext = AesGcm::Decrypt(
        message_key, AsBytes(header.payload_nonce()), AsBytes(envelope.encrypted_payload()), payload_ad);
    SodiumInterop::SecureWipe(message_key);
    if (plaintext.IsErr()) {
        SodiumInterop::SecureWipe(next_chain);
        return plaintext;
    }

    auto next_chain_handle = IntoHandle(next_chain);
    if (next_chain_handle.IsErr()) {
        return BytesResult::Err(std::move(next_chain_handle).UnwrapErr());
    }
    session.receiving_chain_key = std::move(next_chain_handle).Unwrap();
    ++session.next_receive_index;

    GAMBIT_LOG_VALUE(debug::Side::Unknown, "DECRYPT", "message_index", message_index);
    return plaintext;
}

Result<Unit, ProtocolFailure> SodiumEncryptionSession::ErasePeer(std::string_view peer_id) {
    std::lock_guard guard(*lock_);
    if (const auto it = peers_.find(peer_id); it != peers_.end()) {
        peers_.erase(it);
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

void SodiumEncryptionSession::EraseAll() {
    std::lock_guard guard(*lock_);
    peers_.clear();
}

size_t SodiumEncryptionSession::SessionCount() const {
    std::lock_guard guard(*lock_);
    return peers_.size();
}

}
