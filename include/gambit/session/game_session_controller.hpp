#pragma once
#include "gambit/core/result.hpp"
#include "gambit/core/failures.hpp"
#include "gambit/chess/i_chess_rules.hpp"
#include "gambit/configuration/session_config.hpp"
#include "gambit/encryption/i_encryption_session.hpp"
#include "gambit/session/i_game_event_handler.hpp"
#include "gambit/session/session_types.hpp"
#include "gambit/transport/i_transport_channel.hpp"
#include "gambit/wire/protocol_message.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace gambit::session {

/**
 * One end-to-end encrypted chess game between two peers.
 *
 * Owns the local board and drives the session lifecycle:
 *   Uninitialized -> AwaitingTransport -> EncryptionBootstrap -> Active -> Terminated
 *
 * Moves are only accepted when legal against the local board; the remote
 * side is never trusted for legality or for the outcome. Termination
 * (mate, draw, resignation) always runs Cleanup(), which erases all key
 * material for the peer and leaves the controller inert.
 *
 * Public calls and transport callbacks are serialized by one recursive
 * lock, so handler callbacks may call back into the controller.
 */
class GameSessionController final : public transport::ITransportObserver {
public:
    [[nodiscard]] static Result<std::unique_ptr<GameSessionController>, ProtocolFailure> Create(
        std::shared_ptr<transport::ITransportChannel> transport,
        std::shared_ptr<encryption::IEncryptionSession> encryption,
        std::unique_ptr<chess::IChessRules> rules,
        configuration::SessionConfig config = configuration::SessionConfig::Default());

    [[nodiscard]] Result<Unit, ProtocolFailure> Initialize(
        SessionRole role,
        std::string remote_peer_id,
        std::shared_ptr<IGameEventHandler> handler);

    /// Host only. Text form of the transport offer to hand to the joiner.
    [[nodiscard]] Result<std::string, ProtocolFailure> CreateOfferPackage();

    /// Joiner only. Returns the answer text to hand back to the host.
    [[nodiscard]] Result<std::string, ProtocolFailure> AcceptOfferPackage(std::string_view offer_text);

    [[nodiscard]] Result<Unit, ProtocolFailure> AcceptAnswerPackage(std::string_view answer_text);

    /// False when the move was not sent; the reason (if any) goes to OnError.
    bool MakeMove(std::string_view notation);

    [[nodiscard]] Result<Unit, ProtocolFailure> SendChat(std::string_view text);

    Result<Unit, ProtocolFailure> Resign();

    [[nodiscard]] Result<Unit, ProtocolFailure> OfferDraw();

    [[nodiscard]] Result<Unit, ProtocolFailure> RespondToDraw(bool accept);

    void Cleanup();

    [[nodiscard]] std::string GetFen() const;
    [[nodiscard]] std::string GetPgn() const;
    [[nodiscard]] bool IsOurTurn() const;
    [[nodiscard]] SessionState GetState() const;
    [[nodiscard]] EncryptionState GetEncryptionState() const;
    [[nodiscard]] std::optional<GameOutcome> GetOutcome() const;
    [[nodiscard]] std::optional<SessionRole> GetRole() const;
    [[nodiscard]] transport::ConnectionState GetConnectionState() const;

    void OnFrameReceived(std::string_view frame) override;
    void OnConnectionStateChanged(transport::ConnectionState state) override;

    GameSessionController(const GameSessionController&) = delete;
    GameSessionController& operator=(const GameSessionController&) = delete;
    ~GameSessionController() override;

private:
    GameSessionController(
        std::shared_ptr<transport::ITransportChannel> transport,
        std::shared_ptr<encryption::IEncryptionSession> encryption,
        std::unique_ptr<chess::IChessRules> rules,
        configuration::SessionConfig config);

    [[nodiscard]] bool IsLive() const noexcept;
    [[nodiscard]] bool IsOurTurnLocked() const;
    [[nodiscard]] Result<Unit, ProtocolFailure> RequireActive() const;
    [[nodiscard]] Result<Unit, ProtocolFailure> RequireRole(SessionRole role, std::string_view operation) const;

    void BeginBootstrap();
    void TryActivate();

    [[nodiscard]] Result<Unit, ProtocolFailure> SendMessage(const wire::ProtocolMessage& message);

    void Dispatch(const wire::ProtocolMessage& message);
    void HandleRemoteMove(const wire::MovePayload& move);
    void HandleKeyBundle(const wire::KeyBundlePayload& payload);
    void HandleDrawOffer();
    void HandleDrawResponse(const wire::DrawResponsePayload& response);

    void CheckTerminalState();
    void Finish(GameOutcome outcome);

    void ReportError(const ProtocolFailure& failure);
    void ReportTeardown(std::string_view step, const ProtocolFailure& failure);

    std::shared_ptr<transport::ITransportChannel> transport_;
    std::shared_ptr<encryption::IEncryptionSession> encryption_;
    std::unique_ptr<chess::IChessRules> rules_;
    configuration::SessionConfig config_;

    std::shared_ptr<IGameEventHandler> handler_;
    std::optional<SessionRole> role_;
    std::string peer_id_;

    SessionState state_ = SessionState::Uninitialized;
    EncryptionState encryption_state_ = EncryptionState::None;
    std::optional<GameOutcome> outcome_;

    bool session_preexisting_ = false;
    bool bundle_sent_ = false;
    bool peer_bundle_imported_ = false;
    bool outgoing_draw_offer_ = false;
    bool incoming_draw_offer_ = false;
    bool cleaned_up_ = false;

    mutable std::unique_ptr<std::recursive_mutex> lock_;
};

}
