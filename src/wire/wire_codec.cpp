#include "gambit/wire/wire_codec.hpp"
#include "gambit/core/constants.hpp"
#include "gambit/core/format.hpp"

namespace gambit::wire {

namespace {
    using Clock = ProtocolMessage::Clock;
    using MessageResult = Result<ProtocolMessage, ProtocolFailure>;
    using StringResult = Result<std::string, ProtocolFailure>;

    void WriteTimestamp(const Clock::time_point at, google::protobuf::Timestamp* out) {
        const auto since_epoch = at.time_since_epoch();
        const auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
        const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);
        out->set_seconds(seconds.count());
        out->set_nanos(static_cast<int32_t>(nanos.count()));
    }

    // google.protobuf.Timestamp bounds: 0001-01-01 to 9999-12-31.
    constexpr int64_t kMinTimestampSeconds = -62'135'596'800;
    constexpr int64_t kMaxTimestampSeconds = 253'402'300'799;
    constexpr int32_t kMaxTimestampNanos = 999'999'999;

    Result<Clock::time_point, ProtocolFailure> ReadTimestamp(const google::protobuf::Timestamp& in) {
        using TimeResult = Result<Clock::time_point, ProtocolFailure>;
        // The clock's tick cannot hold the full Timestamp range; one second of headroom for the nanos.
        const int64_t representable =
            std::chrono::floor<std::chrono::seconds>(Clock::duration::max()).count() - 1;

        if (in.seconds() < kMinTimestampSeconds || in.seconds() > kMaxTimestampSeconds ||
            in.nanos() < 0 || in.nanos() > kMaxTimestampNanos) {
            return TimeResult::Err(ProtocolFailure::Decode(
                compat::format("Timestamp out of range: {}s {}ns", in.seconds(), in.nanos())));
        }
        if (in.seconds() > representable || in.seconds() < -representable) {
            return TimeResult::Err(ProtocolFailure::Decode(
                compat::format("Timestamp not representable: {}s", in.seconds())));
        }
        const auto since_epoch = std::chrono::duration_cast<Clock::duration>(
            std::chrono::seconds(in.seconds())) +
            std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(in.nanos()));
        return TimeResult::Ok(Clock::time_point(since_epoch));
    }

    StringResult Serialize(const google::protobuf::MessageLite& message, const char* what) {
        std::string bytes;
        if (!message.SerializeToString(&bytes)) {
            return StringResult::Err(
                ProtocolFailure::Encode(compat::format("Failed to serialize {}", what)));
        }
        return StringResult::Ok(std::move(bytes));
    }
}

proto::wire::GameMessage WireCodec::ToProto(const ProtocolMessage& message) {
    proto::wire::GameMessage out;
    WriteTimestamp(message.SentAt(), out.mutable_sent_at());

    switch (message.Kind()) {
        case MessageKind::Move:
            out.mutable_move()->set_notation(message.As<MovePayload>()->notation);
            break;
        case MessageKind::Chat:
            out.mutable_chat()->set_text(message.As<ChatPayload>()->text);
            break;
        case MessageKind::Resign:
            out.mutable_resign();
            break;
        case MessageKind::DrawOffer:
            out.mutable_draw_offer();
            break;
        case MessageKind::KeyBundle:
            *out.mutable_key_bundle() = message.As<KeyBundlePayload>()->bundle;
            break;
        case MessageKind::DrawResponse:
            out.mutable_draw_response()->set_accepted(message.As<DrawResponsePayload>()->accepted);
            break;
    }
    return out;
}

Result<ProtocolMessage, ProtocolFailure> WireCodec::FromProto(const proto::wire::GameMessage& message) {
    Clock::time_point sent_at{};
    if (message.has_sent_at()) {
        auto read = ReadTimestamp(message.sent_at());
        if (read.IsErr()) {
            return MessageResult::Err(std::move(read).UnwrapErr());
        }
        sent_at = read.Unwrap();
    }

    switch (message.payload_case()) {
        case proto::wire::GameMessage::kMove:
            if (message.move().notation().empty()) {
                return MessageResult::Err(ProtocolFailure::Decode("Move message without notation"));
            }
            return MessageResult::Ok(ProtocolMessage(MovePayload{message.move().notation()}, sent_at));
        case proto::wire::GameMessage::kChat:
            return MessageResult::Ok(ProtocolMessage(ChatPayload{message.chat().text()}, sent_at));
        case proto::wire::GameMessage::kResign:
            return MessageResult::Ok(ProtocolMessage(ResignPayload{}, sent_at));
        case proto::wire::GameMessage::kDrawOffer:
            return MessageResult::Ok(ProtocolMessage(DrawOfferPayload{}, sent_at));
        case proto::wire::GameMessage::kKeyBundle:
            return MessageResult::Ok(ProtocolMessage(KeyBundlePayload{message.key_bundle()}, sent_at));
        case proto::wire::GameMessage::kDrawResponse:
            return MessageResult::Ok(
                ProtocolMessage(DrawResponsePayload{message.draw_response().accepted()}, sent_at));
        case proto::wire::GameMessage::PAYLOAD_NOT_SET:
            break;
    }
    return MessageResult::Err(ProtocolFailure::Decode("Game message has no payload"));
}

Result<std::string, ProtocolFailure> WireCodec::SerializeMessage(const ProtocolMessage& message) {
    return Serialize(ToProto(message), "game message");
}

Result<ProtocolMessage, ProtocolFailure> WireCodec::ParseMessage(std::span<const uint8_t> bytes) {
    proto::wire::GameMessage message;
    if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return MessageResult::Err(ProtocolFailure::Decode("Failed to parse game message"));
    }
    return FromProto(message);
}

Result<std::string, ProtocolFailure> WireCodec::EncodePlain(const ProtocolMessage& message) {
    proto::wire::WireFrame frame;
    frame.set_version(kWireVersion);
    *frame.mutable_plain() = ToProto(message);
    return Serialize(frame, "plain frame");
}

Result<std::string, ProtocolFailure> WireCodec::EncodeEnvelope(const proto::wire::SecureEnvelope& envelope) {
    proto::wire::WireFrame frame;
    frame.set_version(kWireVersion);
    *frame.mutable_envelope() = envelope;
    return Serialize(frame, "envelope frame");
}

Result<DecodedFrame, ProtocolFailure> WireCodec::DecodeFrame(
    std::string_view frame,
    const size_t max_frame_bytes) {
    using FrameResult = Result<DecodedFrame, ProtocolFailure>;

    if (frame.empty()) {
        return FrameResult::Err(ProtocolFailure::Decode("Empty frame"));
    }
    if (frame.size() > max_frame_bytes) {
        return FrameResult::Err(
            ProtocolFailure::Decode(
                compat::format("Frame of {} bytes exceeds limit of {}", frame.size(), max_frame_bytes)));
    }

    proto::wire::WireFrame wire_frame;
    if (!wire_frame.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
        return FrameResult::Err(ProtocolFailure::Decode("Failed to parse wire frame"));
    }
    if (wire_frame.version() != kWireVersion) {
        return FrameResult::Err(
            ProtocolFailure::Decode(compat::format("Unsupported wire version {}", wire_frame.version())));
    }

    switch (wire_frame.body_case()) {
        case proto::wire::WireFrame::kEnvelope:
            return FrameResult::Ok(DecodedFrame{wire_frame.envelope()});
        case proto::wire::WireFrame::kPlain: {
            auto message = FromProto(wire_frame.plain());
            if (message.IsErr()) {
                return FrameResult::Err(std::move(message).UnwrapErr());
            }
            return FrameResult::Ok(DecodedFrame{std::move(message).Unwrap()});
        }
        case proto::wire::WireFrame::BODY_NOT_SET:
            break;
    }
    return FrameResult::Err(ProtocolFailure::Decode("Wire frame has no body"));
}

}
