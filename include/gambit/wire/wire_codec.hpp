#pragma once
#include "gambit/core/result.hpp"
#include "gambit/core/failures.hpp"
#include "gambit/wire/protocol_message.hpp"
#include "wire/game_message.pb.h"
#include "wire/secure_envelope.pb.h"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace gambit::wire {

/// A decoded transport frame: either a plaintext message or an envelope still to be decrypted.
struct DecodedFrame {
    std::variant<ProtocolMessage, proto::wire::SecureEnvelope> body;

    [[nodiscard]] bool IsEnvelope() const noexcept {
        return std::holds_alternative<proto::wire::SecureEnvelope>(body);
    }
};

/**
 * Conversion between ProtocolMessage and the protobuf wire schema.
 *
 * A frame is a serialized WireFrame; its body case is the only thing that
 * distinguishes a plaintext message from an encrypted one.
 */
class WireCodec {
public:
    [[nodiscard]] static proto::wire::GameMessage ToProto(const ProtocolMessage& message);

    [[nodiscard]] static Result<ProtocolMessage, ProtocolFailure> FromProto(
        const proto::wire::GameMessage& message);

    /// GameMessage bytes, the plaintext fed to the encryption session.
    [[nodiscard]] static Result<std::string, ProtocolFailure> SerializeMessage(
        const ProtocolMessage& message);

    [[nodiscard]] static Result<ProtocolMessage, ProtocolFailure> ParseMessage(
        std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<std::string, ProtocolFailure> EncodePlain(
        const ProtocolMessage& message);

    [[nodiscard]] static Result<std::string, ProtocolFailure> EncodeEnvelope(
        const proto::wire::SecureEnvelope& envelope);

    [[nodiscard]] static Result<DecodedFrame, ProtocolFailure> DecodeFrame(
        std::string_view frame,
        size_t max_frame_bytes);

private:
    WireCodec() = delete;
};

}
