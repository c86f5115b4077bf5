#pragma once
#include "gambit/encryption/i_encryption_session.hpp"
#include "gambit/encryption/identity_keys.hpp"
#include "gambit/encryption/nonce.hpp"
#include "gambit/crypto/sodium_secure_memory_handle.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace gambit::encryption {

/**
 * IEncryptionSession over libsodium keys and OpenSSL AES-256-GCM.
 *
 * Bootstrap: both sides exchange KeyBundles; each derives the same root
 * (IdentityKeys::DeriveSharedRoot), then a header key and one symmetric
 * chain per direction. Every message steps its chain:
 *   message_key = HKDF(chain, "Gambit-Msg"), chain' = HKDF(chain, "Gambit-Chain")
 * so a compromised chain key never exposes earlier messages.
 *
 * Receive indices must arrive in order; the transport guarantees ordering,
 * so a gap is treated as tampering rather than buffered.
 */
class SodiumEncryptionSession final : public IEncryptionSession {
public:
    [[nodiscard]] static Result<std::unique_ptr<SodiumEncryptionSession>, ProtocolFailure> Create();

    [[nodiscard]] Result<proto::wire::KeyBundle, ProtocolFailure> ExportBundle() const override;

    [[nodiscard]] Result<Unit, ProtocolFailure> ImportBundle(
        std::string_view peer_id,
        const proto::wire::KeyBundle& bundle) override;

    [[nodiscard]] bool HasSession(std::string_view peer_id) const override;

    [[nodiscard]] Result<proto::wire::SecureEnvelope, ProtocolFailure> Encrypt(
        std::string_view peer_id,
        std::span<const uint8_t> plaintext) override;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        std::string_view peer_id,
        const proto::wire::SecureEnvelope& envelope) override;

    [[nodiscard]] Result<Unit, ProtocolFailure> ErasePeer(std::string_view peer_id) override;

    void EraseAll() override;

    [[nodiscard]] size_t SessionCount() const;

    SodiumEncryptionSession(const SodiumEncryptionSession&) = delete;
    SodiumEncryptionSession& operator=(const SodiumEncryptionSession&) = delete;
    ~SodiumEncryptionSession() override = default;

private:
    struct PeerSession {
        std::vector<uint8_t> remote_identity_ed25519;
        SecureMemoryHandle header_key;
        SecureMemoryHandle sending_chain_key;
        SecureMemoryHandle receiving_chain_key;
        uint32_t next_send_index = 0;
        uint32_t next_receive_index = 0;
        NonceGenerator nonce_generator;

        explicit PeerSession(NonceGenerator generator)
            : nonce_generator(std::move(generator)) {}
    };

    explicit SodiumEncryptionSession(IdentityKeys identity_keys);

    [[nodiscard]] Result<std::unique_ptr<PeerSession>, ProtocolFailure> BuildPeerSession(
        const proto::wire::KeyBundle& bundle) const;

    IdentityKeys identity_keys_;
    std::vector<uint8_t> local_identity_ed25519_;
    std::map<std::string, std::unique_ptr<PeerSession>, std::less<>> peers_;
    mutable std::unique_ptr<std::mutex> lock_;
};

}
