#pragma once
#include "wire/key_bundle.pb.h"
#include <chrono>
#include <string>
#include <string_view>
#include <variant>

namespace gambit::wire {

enum class MessageKind {
    Move,
    Chat,
    Resign,
    DrawOffer,
    KeyBundle,
    DrawResponse
};

constexpr std::string_view ToString(const MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Move: return "Move";
        case MessageKind::Chat: return "Chat";
        case MessageKind::Resign: return "Resign";
        case MessageKind::DrawOffer: return "DrawOffer";
        case MessageKind::KeyBundle: return "KeyBundle";
        case MessageKind::DrawResponse: return "DrawResponse";
    }
    return "Unknown";
}

struct MovePayload {
    std::string notation;
};

struct ChatPayload {
    std::string text;
};

struct ResignPayload {};

struct DrawOfferPayload {};

struct KeyBundlePayload {
    proto::wire::KeyBundle bundle;
};

struct DrawResponsePayload {
    bool accepted = false;
};

// Alternative order matches MessageKind.
using MessagePayload = std::variant<
    MovePayload,
    ChatPayload,
    ResignPayload,
    DrawOfferPayload,
    KeyBundlePayload,
    DrawResponsePayload>;

/**
 * One unit of the game protocol. The kind is derived from the payload
 * alternative, so the two cannot disagree.
 */
class ProtocolMessage {
public:
    using Clock = std::chrono::system_clock;

    ProtocolMessage(MessagePayload payload, Clock::time_point sent_at)
        : payload_(std::move(payload)), sent_at_(sent_at) {}

    static ProtocolMessage Move(std::string notation) {
        return {MovePayload{std::move(notation)}, Clock::now()};
    }
    static ProtocolMessage Chat(std::string text) {
        return {ChatPayload{std::move(text)}, Clock::now()};
    }
    static ProtocolMessage Resign() {
        return {ResignPayload{}, Clock::now()};
    }
    static ProtocolMessage DrawOffer() {
        return {DrawOfferPayload{}, Clock::now()};
    }
    static ProtocolMessage KeyBundle(proto::wire::KeyBundle bundle) {
        return {KeyBundlePayload{std::move(bundle)}, Clock::now()};
    }
    static ProtocolMessage DrawResponse(const bool accepted) {
        return {DrawResponsePayload{accepted}, Clock::now()};
    }

    [[nodiscard]] MessageKind Kind() const noexcept {
        return static_cast<MessageKind>(payload_.index());
    }

    /// Everything except key bundles; only these require an active session.
    [[nodiscard]] bool IsApplicationMessage() const noexcept {
        return Kind() != MessageKind::KeyBundle;
    }

    [[nodiscard]] const MessagePayload& Payload() const noexcept { return payload_; }

    template<typename T>
    [[nodiscard]] const T* As() const noexcept {
        return std::get_if<T>(&payload_);
    }

    [[nodiscard]] Clock::time_point SentAt() const noexcept { return sent_at_; }

private:
    MessagePayload payload_;
    Clock::time_point sent_at_;
};

}
