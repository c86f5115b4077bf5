#pragma once

#include <cstddef>
#include <cstdint>

namespace gambit::configuration {

/// How an incoming draw offer is handled
enum class DrawPolicy : uint8_t {
    /// Accept immediately and end the game as a draw
    AutoAccept = 0,

    /// Surface the offer through IGameEventHandler::OnDrawOffered and wait
    /// for GameSessionController::RespondToDraw
    Prompt = 1
};

/// Behavioural switches for one game session
///
/// A value type with constexpr factories and `With...` builders:
///
/// @example
/// ```cpp
/// // Default: auto-accept draws, every application message encrypted
/// auto config = SessionConfig::Default();
///
/// // Let the player decide on draw offers
/// auto config = SessionConfig::Interactive();
///
/// // Interoperate with peers that never finish the key exchange
/// auto config = SessionConfig::LegacyCompatible().WithMaxChatBytes(1024);
/// ```
class SessionConfig {
public:
    static constexpr size_t kDefaultMaxChatBytes = 4096;
    static constexpr size_t kDefaultMaxFrameBytes = 65536;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    [[nodiscard]] static constexpr SessionConfig Default() noexcept {
        return SessionConfig(DrawPolicy::AutoAccept, false, false);
    }

    [[nodiscard]] static constexpr SessionConfig Interactive() noexcept {
        return SessionConfig(DrawPolicy::Prompt, false, false);
    }

    /// Historical behaviour: when no encryption session exists, messages go
    /// out unencrypted (the downgrade is still reported through OnError) and
    /// unencrypted application messages from the peer are accepted.
    [[nodiscard]] static constexpr SessionConfig LegacyCompatible() noexcept {
        return SessionConfig(DrawPolicy::AutoAccept, true, true);
    }

    // =========================================================================
    // Builders
    // =========================================================================

    [[nodiscard]] constexpr SessionConfig WithDrawPolicy(const DrawPolicy policy) const noexcept {
        SessionConfig copy = *this;
        copy.draw_policy_ = policy;
        return copy;
    }

    [[nodiscard]] constexpr SessionConfig WithPlaintextFallback(const bool enabled) const noexcept {
        SessionConfig copy = *this;
        copy.allow_plaintext_fallback_ = enabled;
        return copy;
    }

    [[nodiscard]] constexpr SessionConfig WithPlaintextMessages(const bool accepted) const noexcept {
        SessionConfig copy = *this;
        copy.accept_plaintext_messages_ = accepted;
        return copy;
    }

    [[nodiscard]] constexpr SessionConfig WithMaxChatBytes(const size_t bytes) const noexcept {
        SessionConfig copy = *this;
        copy.max_chat_bytes_ = bytes;
        return copy;
    }

    [[nodiscard]] constexpr SessionConfig WithMaxFrameBytes(const size_t bytes) const noexcept {
        SessionConfig copy = *this;
        copy.max_frame_bytes_ = bytes;
        return copy;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] constexpr DrawPolicy GetDrawPolicy() const noexcept { return draw_policy_; }
    [[nodiscard]] constexpr bool AllowsPlaintextFallback() const noexcept { return allow_plaintext_fallback_; }
    [[nodiscard]] constexpr bool AcceptsPlaintextMessages() const noexcept { return accept_plaintext_messages_; }
    [[nodiscard]] constexpr size_t GetMaxChatBytes() const noexcept { return max_chat_bytes_; }
    [[nodiscard]] constexpr size_t GetMaxFrameBytes() const noexcept { return max_frame_bytes_; }

    [[nodiscard]] constexpr bool operator==(const SessionConfig&) const noexcept = default;

private:
    constexpr SessionConfig(
        const DrawPolicy policy,
        const bool allow_plaintext_fallback,
        const bool accept_plaintext_messages) noexcept
        : draw_policy_(policy)
        , allow_plaintext_fallback_(allow_plaintext_fallback)
        , accept_plaintext_messages_(accept_plaintext_messages) {}

    DrawPolicy draw_policy_;
    bool allow_plaintext_fallback_;
    bool accept_plaintext_messages_;
    size_t max_chat_bytes_ = kDefaultMaxChatBytes;
    size_t max_frame_bytes_ = kDefaultMaxFrameBytes;
};

}
