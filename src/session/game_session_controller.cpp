#include "gambit/session/game_session_controller.hpp"
#include "gambit/core/constants.hpp"
#include "gambit/core/format.hpp"
#include "gambit/debug/session_logger.hpp"
#include "gambit/wire/wire_codec.hpp"
#include <span>
#include <type_traits>
#include <variant>

namespace gambit::session {

using configuration::DrawPolicy;
using configuration::SessionConfig;
using transport::ConnectionState;
using transport::SignalingPackage;
using wire::ProtocolMessage;
using wire::WireCodec;

namespace {
    [[maybe_unused]] debug::Side LogSide(const std::optional<SessionRole>& role) {
        if (!role.has_value()) {
            return debug::Side::Unknown;
        }
        return *role == SessionRole::Host ? debug::Side::Host : debug::Side::Joiner;
    }

    GameOutcome OutcomeFor(const chess::TerminalState terminal,
                           const chess::Color side_to_move,
                           const chess::Color local_color) {
        if (terminal == chess::TerminalState::Checkmate) {
            return side_to_move == local_color ? GameOutcome::Loss : GameOutcome::Win;
        }
        return GameOutcome::Draw;
    }
}

Result<std::unique_ptr<GameSessionController>, ProtocolFailure> GameSessionController::Create(
    std::shared_ptr<transport::ITransportChannel> transport,
    std::shared_ptr<encryption::IEncryptionSession> encryption,
    std::unique_ptr<chess::IChessRules> rules,
    SessionConfig config) {
    using CreateResult = Result<std::unique_ptr<GameSessionController>, ProtocolFailure>;

    if (!transport) {
        return CreateResult::Err(ProtocolFailure::InvalidInput("Transport channel is required"));
    }
    if (!encryption) {
        return CreateResult::Err(ProtocolFailure::InvalidInput("Encryption session is required"));
    }
    if (!rules) {
        return CreateResult::Err(ProtocolFailure::InvalidInput("Chess rules are required"));
    }
    return CreateResult::Ok(std::unique_ptr<GameSessionController>(new GameSessionController(
        std::move(transport), std::move(encryption), std::move(rules), config)));
}

GameSessionController::GameSessionController(
    std::shared_ptr<transport::ITransportChannel> transport,
    std::shared_ptr<encryption::IEncryptionSession> encryption,
    std::unique_ptr<chess::IChessRules> rules,
    SessionConfig config)
    : transport_(std::move(transport))
    , encryption_(std::move(encryption))
    , rules_(std::move(rules))
    , config_(config)
    , lock_(std::make_unique<std::recursive_mutex>()) {
}

GameSessionController::~GameSessionController() {
    Cleanup();
}

Result<Unit, ProtocolFailure> GameSessionController::Initialize(
    const SessionRole role,
    std::string remote_peer_id,
    std::shared_ptr<IGameEventHandler> handler) {
    std::lock_guard guard(*lock_);

    if (state_ != SessionState::Uninitialized) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                compat::format("Session cannot be initialized in state {}", ToString(state_))));
    }
    if (remote_peer_id.empty()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Remote peer id must not be empty"));
    }
    if (!handler) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Event handler is required"));
    }

    role_ = role;
    peer_id_ = std::move(remote_peer_id);
    handler_ = std::move(handler);
    rules_->Reset();

    session_preexisting_ = encryption_->HasSession(peer_id_);
    encryption_state_ = session_preexisting_ ? EncryptionState::Established : EncryptionState::None;
    state_ = SessionState::AwaitingTransport;
    transport_->SetObserver(this);

    GAMBIT_LOG_SECTION(LogSide(role_), "SESSION INITIALIZED");
    GAMBIT_LOG_MSG(LogSide(role_), "INIT", compat::format("peer={} encryption={}",
                                                          peer_id_, ToString(encryption_state_)));
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::string, ProtocolFailure> GameSessionController::CreateOfferPackage() {
    std::lock_guard guard(*lock_);

    if (auto check = RequireRole(SessionRole::Host, "create an offer"); check.IsErr()) {
        return Result<std::string, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }
    return transport_->CreateOffer().Bind([](const SignalingPackage& offer) { return offer.Encode(); });
}

Result<std::string, ProtocolFailure> GameSessionController::AcceptOfferPackage(
    std::string_view offer_text) {
    std::lock_guard guard(*lock_);

    if (auto check = RequireRole(SessionRole::Joiner, "accept an offer"); check.IsErr()) {
        return Result<std::string, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }
    auto offer = SignalingPackage::Decode(offer_text);
    if (offer.IsErr()) {
        return Result<std::string, ProtocolFailure>::Err(std::move(offer).UnwrapErr());
    }
    if (offer.Unwrap().kind != SignalingPackage::Kind::Offer) {
        return Result<std::string, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Signaling package is not an offer"));
    }
    return transport_->AcceptOffer(offer.Unwrap())
        .Bind([](const SignalingPackage& answer) { return answer.Encode(); });
}

Result<Unit, ProtocolFailure> GameSessionController::AcceptAnswerPackage(
    std::string_view answer_text) {
    std::lock_guard guard(*lock_);

    if (auto check = RequireRole(SessionRole::Host, "accept an answer"); check.IsErr()) {
        return check;
    }
    auto answer = SignalingPackage::Decode(answer_text);
    if (answer.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(answer).UnwrapErr());
    }
    if (answer.Unwrap().kind != SignalingPackage::Kind::Answer) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Signaling package is not an answer"));
    }
    return transport_->ApplyAnswer(answer.Unwrap());
}

bool GameSessionController::MakeMove(std::string_view notation) {
    std::lock_guard guard(*lock_);

    if (state_ != SessionState::Active || !IsOurTurnLocked()) {
        return false;
    }

    auto validated = rules_->ValidateMove(notation);
    if (validated.IsErr()) {
        ReportError(validated.UnwrapErr());
        return false;
    }
    const chess::AppliedMove move = std::move(validated).Unwrap();

    if (auto sent = SendMessage(ProtocolMessage::Move(move.san)); sent.IsErr()) {
        ReportError(sent.UnwrapErr());
        return false;
    }

    // Applied by UCI so the local board takes exactly the move that was sent.
    if (auto applied = rules_->ApplyMove(move.uci); applied.IsErr()) {
        ReportError(applied.UnwrapErr());
        return false;
    }
    incoming_draw_offer_ = false;

    GAMBIT_LOG_MSG(LogSide(role_), "MOVE", compat::format("local {} -> {}", move.san, rules_->ToFen()));
    CheckTerminalState();
    return true;
}

Result<Unit, ProtocolFailure> GameSessionController::SendChat(std::string_view text) {
    std::lock_guard guard(*lock_);

    if (auto check = RequireActive(); check.IsErr()) {
        return check;
    }
    if (text.empty()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Chat message must not be empty"));
    }
    if (text.size() > config_.GetMaxChatBytes()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Chat message exceeds {} bytes", config_.GetMaxChatBytes())));
    }

    std::string owned(text);
    const auto handler = handler_;
    handler->OnChat(owned, ChatOrigin::Local);
    if (!IsLive()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::NOT_ACTIVE)));
    }
    return SendMessage(ProtocolMessage::Chat(std::move(owned)));
}

Result<Unit, ProtocolFailure> GameSessionController::Resign() {
    std::lock_guard guard(*lock_);

    if (auto check = RequireActive(); check.IsErr()) {
        return check;
    }
    auto sent = SendMessage(ProtocolMessage::Resign());
    Finish(GameOutcome::Loss);
    return sent;
}

Result<Unit, ProtocolFailure> GameSessionController::OfferDraw() {
    std::lock_guard guard(*lock_);

    if (auto check = RequireActive(); check.IsErr()) {
        return check;
    }
    if (outgoing_draw_offer_) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("A draw offer is already outstanding"));
    }
    auto sent = SendMessage(ProtocolMessage::DrawOffer());
    if (sent.IsOk()) {
        outgoing_draw_offer_ = true;
    }
    return sent;
}

Result<Unit, ProtocolFailure> GameSessionController::RespondToDraw(const bool accept) {
    std::lock_guard guard(*lock_);

    if (auto check = RequireActive(); check.IsErr()) {
        return check;
    }
    if (!incoming_draw_offer_) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("No draw offer is pending"));
    }
    auto sent = SendMessage(ProtocolMessage::DrawResponse(accept));
    if (sent.IsErr()) {
        return sent;
    }
    incoming_draw_offer_ = false;
    if (accept) {
        Finish(GameOutcome::Draw);
    }
    return sent;
}

void GameSessionController::Cleanup() {
    std::lock_guard guard(*lock_);

    if (cleaned_up_) {
        return;
    }
    cleaned_up_ = true;
    state_ = SessionState::Terminated;
    GAMBIT_LOG_SECTION(LogSide(role_), "TEARDOWN");

    transport_->SetObserver(nullptr);

    if (auto closed = transport_->Close(); closed.IsErr()) {
        ReportTeardown("close transport", closed.UnwrapErr());
    }

    // Sessions held for other peers by a shared encryption session are left alone.
    if (!peer_id_.empty()) {
        if (auto erased = encryption_->ErasePeer(peer_id_); erased.IsErr()) {
            ReportTeardown("erase peer session", erased.UnwrapErr());
        }
        if (encryption_->HasSession(peer_id_)) {
            ReportTeardown("verify erasure",
                           ProtocolFailure::Teardown("Encryption session still present after erase"));
        }
        encryption_state_ = EncryptionState::Erased;
    }

    rules_->Reset();
    role_.reset();
    outgoing_draw_offer_ = false;
    incoming_draw_offer_ = false;
    handler_.reset();
}

std::string GameSessionController::GetFen() const {
    std::lock_guard guard(*lock_);
    return rules_->ToFen();
}

std::string GameSessionController::GetPgn() const {
    std::lock_guard guard(*lock_);
    return rules_->ToPgn();
}

bool GameSessionController::IsOurTurn() const {
    std::lock_guard guard(*lock_);
    return IsOurTurnLocked();
}

SessionState GameSessionController::GetState() const {
    std::lock_guard guard(*lock_);
    return state_;
}

EncryptionState GameSessionController::GetEncryptionState() const {
    std::lock_guard guard(*lock_);
    return encryption_state_;
}

std::optional<GameOutcome> GameSessionController::GetOutcome() const {
    std::lock_guard guard(*lock_);
    return outcome_;
}

std::optional<SessionRole> GameSessionController::GetRole() const {
    std::lock_guard guard(*lock_);
    return role_;
}

ConnectionState GameSessionController::GetConnectionState() const {
    std::lock_guard guard(*lock_);
    return transport_->GetState();
}

void GameSessionController::OnConnectionStateChanged(const ConnectionState state) {
    std::lock_guard guard(*lock_);

    if (!IsLive()) {
        return;
    }
    GAMBIT_LOG_MSG(LogSide(role_), "CONNECTION", transport::ToString(state));

    const auto handler = handler_;
    handler->OnConnectionChange(state);
    if (!IsLive()) {
        return;
    }

    switch (state) {
        case ConnectionState::Connected:
            if (state_ == SessionState::AwaitingTransport) {
                BeginBootstrap();
            }
            break;
        case ConnectionState::Failed:
            ReportError(ProtocolFailure::Transport("Transport connection failed"));
            break;
        case ConnectionState::Disconnected:
            ReportError(ProtocolFailure::Transport("Peer disconnected"));
            break;
        case ConnectionState::Idle:
        case ConnectionState::Connecting:
            break;
    }
}

void GameSessionController::OnFrameReceived(std::string_view frame) {
    std::lock_guard guard(*lock_);

    if (!IsLive()) {
        return;
    }

    auto decoded = WireCodec::DecodeFrame(frame, config_.GetMaxFrameBytes());
    if (decoded.IsErr()) {
        ReportError(decoded.UnwrapErr());
        return;
    }
    wire::DecodedFrame decoded_frame = std::move(decoded).Unwrap();

    if (!decoded_frame.IsEnvelope()) {
        const auto& message = std::get<ProtocolMessage>(decoded_frame.body);
        if (message.IsApplicationMessage() && !config_.AcceptsPlaintextMessages()) {
            ReportError(ProtocolFailure::IntegrityViolation(
                compat::format("Unencrypted {} message rejected", wire::ToString(message.Kind()))));
            return;
        }
        Dispatch(message);
        return;
    }

    if (!encryption_->HasSession(peer_id_)) {
        ReportError(ProtocolFailure::EncryptionUnavailable(
            "Encrypted frame received before encryption was established"));
        return;
    }
    const auto& envelope = std::get<proto::wire::SecureEnvelope>(decoded_frame.body);
    auto plaintext = encryption_->Decrypt(peer_id_, envelope);
    if (plaintext.IsErr()) {
        ReportError(plaintext.UnwrapErr());
        return;
    }
    auto message = WireCodec::ParseMessage(std::span<const uint8_t>(plaintext.Unwrap()));
    if (message.IsErr()) {
        ReportError(message.UnwrapErr());
        return;
    }
    Dispatch(message.Unwrap());
}

bool GameSessionController::IsLive() const noexcept {
    return state_ != SessionState::Uninitialized && state_ != SessionState::Terminated;
}

bool GameSessionController::IsOurTurnLocked() const {
    return role_.has_value() && rules_->SideToMove() == ColorOf(*role_);
}

Result<Unit, ProtocolFailure> GameSessionController::RequireActive() const {
    if (state_ != SessionState::Active) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::NOT_ACTIVE)));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> GameSessionController::RequireRole(
    const SessionRole role,
    std::string_view operation) const {
    if (state_ != SessionState::AwaitingTransport) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                compat::format("Cannot {} in state {}", operation, ToString(state_))));
    }
    if (role_ != role) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                compat::format("Only the {} can {}", ToString(role), operation)));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

void GameSessionController::BeginBootstrap() {
    state_ = SessionState::EncryptionBootstrap;

    if (session_preexisting_) {
        TryActivate();
        return;
    }

    auto bundle = encryption_->ExportBundle();
    if (bundle.IsErr()) {
        ReportError(bundle.UnwrapErr());
        return;
    }
    auto frame = WireCodec::EncodePlain(ProtocolMessage::KeyBundle(std::move(bundle).Unwrap()));
    if (frame.IsErr()) {
        ReportError(frame.UnwrapErr());
        return;
    }
    if (auto sent = transport_->Send(std::move(frame).Unwrap()); sent.IsErr()) {
        ReportError(sent.UnwrapErr());
        return;
    }
    bundle_sent_ = true;
    if (encryption_state_ == EncryptionState::None) {
        encryption_state_ = EncryptionState::Bootstrapping;
    }
    GAMBIT_LOG_MSG(LogSide(role_), "BOOTSTRAP", "key bundle sent");

    if (config_.AllowsPlaintextFallback() && !peer_bundle_imported_) {
        state_ = SessionState::Active;
        GAMBIT_LOG_MSG(LogSide(role_), "BOOTSTRAP", "active before key exchange (plaintext fallback)");
        return;
    }
    TryActivate();
}

void GameSessionController::TryActivate() {
    const bool ready = session_preexisting_ || (bundle_sent_ && peer_bundle_imported_);
    if (!ready) {
        return;
    }
    encryption_state_ = EncryptionState::Established;
    if (state_ == SessionState::EncryptionBootstrap) {
        state_ = SessionState::Active;
    }
    GAMBIT_LOG_SECTION(LogSide(role_), "SESSION ACTIVE");
}

Result<Unit, ProtocolFailure> GameSessionController::SendMessage(const ProtocolMessage& message) {
    if (encryption_->HasSession(peer_id_)) {
        auto plaintext = WireCodec::SerializeMessage(message);
        if (plaintext.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(plaintext).UnwrapErr());
        }
        const std::string& bytes = plaintext.Unwrap();
        auto envelope = encryption_->Encrypt(
            peer_id_,
            std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()));
        if (envelope.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(envelope).UnwrapErr());
        }
        auto frame = WireCodec::EncodeEnvelope(envelope.Unwrap());
        if (frame.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(frame).UnwrapErr());
        }
        return transport_->Send(std::move(frame).Unwrap());
    }

    if (!config_.AllowsPlaintextFallback()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::EncryptionUnavailable(
                compat::format("{}; {} message not sent",
                               ErrorMessages::NO_SESSION, wire::ToString(message.Kind()))));
    }

    auto frame = WireCodec::EncodePlain(message);
    if (frame.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(frame).UnwrapErr());
    }
    auto sent = transport_->Send(std::move(frame).Unwrap());
    if (sent.IsOk()) {
        ReportError(ProtocolFailure::EncryptionUnavailable(
            compat::format("{} message sent without encryption", wire::ToString(message.Kind()))));
    }
    return sent;
}

void GameSessionController::Dispatch(const ProtocolMessage& message) {
    GAMBIT_LOG_MSG(LogSide(role_), "RECV", wire::ToString(message.Kind()));

    if (message.IsApplicationMessage() && state_ != SessionState::Active) {
        ReportError(ProtocolFailure::InvalidState(
            compat::format("{} message received while {}",
                           wire::ToString(message.Kind()), ToString(state_))));
        return;
    }

    std::visit([this](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, wire::MovePayload>) {
            HandleRemoteMove(payload);
        } else if constexpr (std::is_same_v<T, wire::ChatPayload>) {
            const auto handler = handler_;
            handler->OnChat(payload.text, ChatOrigin::Remote);
        } else if constexpr (std::is_same_v<T, wire::ResignPayload>) {
            Finish(GameOutcome::Win);
        } else if constexpr (std::is_same_v<T, wire::DrawOfferPayload>) {
            HandleDrawOffer();
        } else if constexpr (std::is_same_v<T, wire::KeyBundlePayload>) {
            HandleKeyBundle(payload);
        } else if constexpr (std::is_same_v<T, wire::DrawResponsePayload>) {
            HandleDrawResponse(payload);
        }
    }, message.Payload());
}

void GameSessionController::HandleRemoteMove(const wire::MovePayload& move) {
    if (IsOurTurnLocked()) {
        ReportError(ProtocolFailure::IntegrityViolation(
            compat::format("Opponent sent move '{}' out of turn", move.notation)));
        return;
    }

    auto applied = rules_->ApplyMove(move.notation);
    if (applied.IsErr()) {
        ReportError(ProtocolFailure::IntegrityViolation(
            compat::format("Opponent made illegal move: {}", applied.UnwrapErr().message)));
        return;
    }
    outgoing_draw_offer_ = false;

    GAMBIT_LOG_MSG(LogSide(role_), "MOVE",
                   compat::format("remote {} -> {}", applied.Unwrap().san, rules_->ToFen()));
    const auto handler = handler_;
    handler->OnMove(applied.Unwrap().san);
    if (!IsLive()) {
        return;
    }
    CheckTerminalState();
}

void GameSessionController::HandleKeyBundle(const wire::KeyBundlePayload& payload) {
    if (encryption_->HasSession(peer_id_)) {
        ReportError(ProtocolFailure::ProtocolViolation(
            "Key bundle received after the encryption session was established"));
        return;
    }

    if (auto imported = encryption_->ImportBundle(peer_id_, payload.bundle); imported.IsErr()) {
        ReportError(imported.UnwrapErr());
        return;
    }
    peer_bundle_imported_ = true;
    GAMBIT_LOG_MSG(LogSide(role_), "BOOTSTRAP", "peer key bundle imported");

    if (state_ == SessionState::Active) {
        encryption_state_ = EncryptionState::Established;
        return;
    }
    if (encryption_state_ == EncryptionState::None) {
        encryption_state_ = EncryptionState::Bootstrapping;
    }
    TryActivate();
}

void GameSessionController::HandleDrawOffer() {
    if (config_.GetDrawPolicy() == DrawPolicy::AutoAccept) {
        if (auto sent = SendMessage(ProtocolMessage::DrawResponse(true)); sent.IsErr()) {
            ReportError(sent.UnwrapErr());
            if (!IsLive()) {
                return;
            }
        }
        Finish(GameOutcome::Draw);
        return;
    }

    incoming_draw_offer_ = true;
    const auto handler = handler_;
    handler->OnDrawOffered();
}

void GameSessionController::HandleDrawResponse(const wire::DrawResponsePayload& response) {
    if (!outgoing_draw_offer_) {
        ReportError(ProtocolFailure::ProtocolViolation("Draw response received without an offer"));
        return;
    }
    outgoing_draw_offer_ = false;

    if (response.accepted) {
        Finish(GameOutcome::Draw);
        return;
    }
    const auto handler = handler_;
    handler->OnDrawDeclined();
}

void GameSessionController::CheckTerminalState() {
    const chess::TerminalState terminal = rules_->GetTerminalState();
    if (terminal == chess::TerminalState::Ongoing || !role_.has_value()) {
        return;
    }
    GAMBIT_LOG_MSG(LogSide(role_), "GAME OVER", chess::ToString(terminal));
    Finish(OutcomeFor(terminal, rules_->SideToMove(), ColorOf(*role_)));
}

void GameSessionController::Finish(const GameOutcome outcome) {
    if (!IsLive()) {
        return;
    }
    outcome_ = outcome;
    GAMBIT_LOG_MSG(LogSide(role_), "OUTCOME", ToString(outcome));

    // Held locally: the handler may call Cleanup(), which releases handler_.
    if (const auto handler = handler_) {
        handler->OnGameEnd(outcome);
    }
    Cleanup();
}

void GameSessionController::ReportError(const ProtocolFailure& failure) {
    GAMBIT_LOG_MSG(LogSide(role_), "ERROR",
                   compat::format("{}: {}", ToString(failure.type), failure.message));
    if (const auto handler = handler_) {
        handler->OnError(failure);
    }
}

void GameSessionController::ReportTeardown(std::string_view step, const ProtocolFailure& failure) {
    ReportError(ProtocolFailure::Teardown(
        compat::format("Failed to {}: {}", step, failure.message)));
}

}
