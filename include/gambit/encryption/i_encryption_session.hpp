#pragma once
#include "gambit/core/result.hpp"
#include "gambit/core/failures.hpp"
#include "wire/key_bundle.pb.h"
#include "wire/secure_envelope.pb.h"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace gambit::encryption {

/**
 * Per-peer authenticated encryption used by the game session.
 *
 * Implementations own all key material; the controller only sees bundles,
 * envelopes and plaintext. A session exists for a peer from a successful
 * ImportBundle until ErasePeer or EraseAll.
 */
class IEncryptionSession {
public:
    virtual ~IEncryptionSession() = default;

    [[nodiscard]] virtual Result<proto::wire::KeyBundle, ProtocolFailure> ExportBundle() const = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> ImportBundle(
        std::string_view peer_id,
        const proto::wire::KeyBundle& bundle) = 0;

    [[nodiscard]] virtual bool HasSession(std::string_view peer_id) const = 0;

    [[nodiscard]] virtual Result<proto::wire::SecureEnvelope, ProtocolFailure> Encrypt(
        std::string_view peer_id,
        std::span<const uint8_t> plaintext) = 0;

    [[nodiscard]] virtual Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        std::string_view peer_id,
        const proto::wire::SecureEnvelope& envelope) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> ErasePeer(std::string_view peer_id) = 0;

    virtual void EraseAll() = 0;
};

}
