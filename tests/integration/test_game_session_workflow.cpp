#include <catch2/catch_test_macros.hpp>
#include "helpers/loopback_match.hpp"
#include "helpers/recording_event_handler.hpp"
#include "gambit/chess/position.hpp"
#include "gambit/core/constants.hpp"
#include "gambit/crypto/sodium_interop.hpp"
#include "gambit/transport/signaling_package.hpp"

using namespace gambit;
using namespace gambit::session;
using namespace gambit::test_helpers;
using configuration::SessionConfig;
using transport::ConnectionState;

TEST_CASE("GameSession - Construction and initialization", "[session]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto hub = transport::LoopbackHub::Create();
    auto transport_channel = std::make_shared<transport::LoopbackTransport>(hub);
    std::shared_ptr<encryption::IEncryptionSession> encryption =
        encryption::SodiumEncryptionSession::Create().Unwrap();

    SECTION("Every dependency is required") {
        auto no_transport = GameSessionController::Create(
            nullptr, encryption, std::make_unique<chess::StandardChessRules>());
        REQUIRE(no_transport.IsErr());
        REQUIRE(no_transport.UnwrapErr().type == ProtocolFailureType::InvalidInput);

        auto no_encryption = GameSessionController::Create(
            transport_channel, nullptr, std::make_unique<chess::StandardChessRules>());
        REQUIRE(no_encryption.IsErr());

        auto no_rules = GameSessionController::Create(transport_channel, encryption, nullptr);
        REQUIRE(no_rules.IsErr());
        REQUIRE(no_rules.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("Initialize validates its arguments and runs once") {
        auto controller = GameSessionController::Create(
            transport_channel, encryption, std::make_unique<chess::StandardChessRules>()).Unwrap();
        REQUIRE(controller->GetState() == SessionState::Uninitialized);
        REQUIRE_FALSE(controller->IsOurTurn());

        auto handler = std::make_shared<RecordingEventHandler>();
        auto empty_peer = controller->Initialize(SessionRole::Host, "", handler);
        REQUIRE(empty_peer.IsErr());
        REQUIRE(empty_peer.UnwrapErr().type == ProtocolFailureType::InvalidInput);

        auto no_handler = controller->Initialize(SessionRole::Host, "joiner", nullptr);
        REQUIRE(no_handler.IsErr());
        REQUIRE(no_handler.UnwrapErr().type == ProtocolFailureType::InvalidInput);
        REQUIRE(controller->GetState() == SessionState::Uninitialized);

        REQUIRE(controller->Initialize(SessionRole::Host, "joiner", handler).IsOk());
        REQUIRE(controller->GetState() == SessionState::AwaitingTransport);
        REQUIRE(controller->GetEncryptionState() == EncryptionState::None);
        REQUIRE(controller->GetRole() == SessionRole::Host);
        REQUIRE(controller->GetConnectionState() == ConnectionState::Idle);
        REQUIRE(controller->IsOurTurn());

        auto again = controller->Initialize(SessionRole::Joiner, "host", handler);
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == ProtocolFailureType::InvalidState);
        REQUIRE(controller->GetRole() == SessionRole::Host);
    }

    SECTION("Signaling before initialization") {
        auto controller = GameSessionController::Create(
            transport_channel, encryption, std::make_unique<chess::StandardChessRules>()).Unwrap();
        auto offer = controller->CreateOfferPackage();
        REQUIRE(offer.IsErr());
        REQUIRE(offer.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
}

TEST_CASE("GameSession - Connection bootstraps encryption", "[session]") {
    LoopbackMatch match;
    REQUIRE(match.host->GetState() == SessionState::AwaitingTransport);
    REQUIRE_FALSE(match.host->MakeMove("e4"));

    match.Connect();

    for (auto* controller : {match.host.get(), match.joiner.get()}) {
        REQUIRE(controller->GetState() == SessionState::Active);
        REQUIRE(controller->GetEncryptionState() == EncryptionState::Established);
        REQUIRE(controller->GetConnectionState() == ConnectionState::Connected);
    }
    REQUIRE(match.host_encryption->HasSession("joiner"));
    REQUIRE(match.joiner_encryption->HasSession("host"));
    REQUIRE(match.host_events->connection_changes == std::vector{ConnectionState::Connected});
    REQUIRE(match.joiner_events->connection_changes == std::vector{ConnectionState::Connected});
    REQUIRE(match.host_events->errors.empty());
    REQUIRE(match.joiner_events->errors.empty());

    REQUIRE(match.host->IsOurTurn());
    REQUIRE_FALSE(match.joiner->IsOurTurn());
}

TEST_CASE("GameSession - Signaling role and package checks", "[session]") {
    LoopbackMatch match;

    SECTION("Roles") {
        auto joiner_offer = match.joiner->CreateOfferPackage();
        REQUIRE(joiner_offer.IsErr());
        REQUIRE(joiner_offer.UnwrapErr().type == ProtocolFailureType::InvalidState);

        auto offer = match.host->CreateOfferPackage().Unwrap();
        auto host_accept = match.host->AcceptOfferPackage(offer);
        REQUIRE(host_accept.IsErr());
        REQUIRE(host_accept.UnwrapErr().type == ProtocolFailureType::InvalidState);

        auto answer = match.joiner->AcceptOfferPackage(offer).Unwrap();
        auto joiner_apply = match.joiner->AcceptAnswerPackage(answer);
        REQUIRE(joiner_apply.IsErr());
        REQUIRE(joiner_apply.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }

    SECTION("Package kinds and garbage") {
        auto offer = match.host->CreateOfferPackage().Unwrap();

        auto as_answer = match.host->AcceptAnswerPackage(offer);
        REQUIRE(as_answer.IsErr());
        REQUIRE(as_answer.UnwrapErr().type == ProtocolFailureType::InvalidInput);

        auto garbage = match.joiner->AcceptOfferPackage("definitely not a package");
        REQUIRE(garbage.IsErr());
        REQUIRE(garbage.UnwrapErr().type == ProtocolFailureType::Decode);

        transport::SignalingPackage answer_package;
        answer_package.kind = transport::SignalingPackage::Kind::Answer;
        answer_package.session_token.assign(kSessionTokenBytes, 0x11);
        answer_package.endpoint_id = "elsewhere";
        auto wrong_kind = match.joiner->AcceptOfferPackage(answer_package.Encode().Unwrap());
        REQUIRE(wrong_kind.IsErr());
        REQUIRE(wrong_kind.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("No signaling once connected") {
        match.Connect();
        auto offer = match.host->CreateOfferPackage();
        REQUIRE(offer.IsErr());
        REQUIRE(offer.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
}

TEST_CASE("GameSession - Fool's mate", "[session][game]") {
    LoopbackMatch match;
    match.Connect();

    std::string host_pgn;
    std::string joiner_pgn;
    match.host_events->on_game_end = [&](GameOutcome) { host_pgn = match.host->GetPgn(); };
    match.joiner_events->on_game_end = [&](GameOutcome) { joiner_pgn = match.joiner->GetPgn(); };

    match.Play({"f3", "e5", "g4", "Qh4"});

    REQUIRE(match.host_events->moves == std::vector<std::string>{"e5", "Qh4#"});
    REQUIRE(match.joiner_events->moves == std::vector<std::string>{"f3", "g4"});

    REQUIRE(match.host_events->outcomes == std::vector{GameOutcome::Loss});
    REQUIRE(match.joiner_events->outcomes == std::vector{GameOutcome::Win});
    REQUIRE(match.host->GetOutcome() == GameOutcome::Loss);
    REQUIRE(match.joiner->GetOutcome() == GameOutcome::Win);

    REQUIRE(host_pgn == "1. f3 e5 2. g4 Qh4# 0-1");
    REQUIRE(joiner_pgn == host_pgn);

    for (auto* controller : {match.host.get(), match.joiner.get()}) {
        REQUIRE(controller->GetState() == SessionState::Terminated);
        REQUIRE(controller->GetEncryptionState() == EncryptionState::Erased);
        REQUIRE_FALSE(controller->GetRole().has_value());
        REQUIRE(controller->GetFen() == chess::Position::kStartFen);
    }
    REQUIRE_FALSE(match.host_encryption->HasSession("joiner"));
    REQUIRE_FALSE(match.joiner_encryption->HasSession("host"));
    REQUIRE(match.host_events->errors.empty());
    REQUIRE(match.joiner_events->errors.empty());
}

TEST_CASE("GameSession - Move gating", "[session][game]") {
    LoopbackMatch match;
    match.Connect();

    SECTION("Not our turn") {
        REQUIRE_FALSE(match.joiner->MakeMove("e5"));
        REQUIRE_FALSE(match.joiner->MakeMove("e7e5"));
        REQUIRE(match.joiner_events->errors.empty());
        REQUIRE(match.hub->PendingCount() == 0);
    }

    SECTION("Black's move while White is to move") {
        REQUIRE_FALSE(match.host->MakeMove("e7e5"));
        REQUIRE(match.host_events->HasError(ProtocolFailureType::IllegalMove));
        REQUIRE(match.hub->PendingCount() == 0);
        REQUIRE(match.host->GetFen() == chess::Position::kStartFen);
    }

    SECTION("Illegal move is reported and not sent") {
        REQUIRE_FALSE(match.host->MakeMove("e5"));
        REQUIRE(match.host_events->HasError(ProtocolFailureType::IllegalMove));
        REQUIRE(match.hub->PendingCount() == 0);
        REQUIRE(match.host->GetFen() == chess::Position::kStartFen);
        REQUIRE(match.host->IsOurTurn());
    }

    SECTION("Boards stay in step") {
        match.Play({"e4", "c5", "Nf3", "d6", "d4", "cxd4"});
        REQUIRE(match.host->GetFen() == match.joiner->GetFen());
        REQUIRE(match.host->GetPgn() == "1. e4 c5 2. Nf3 d6 3. d4 cxd4");
        REQUIRE(match.host->IsOurTurn());
    }

    SECTION("UCI input is sent as SAN") {
        REQUIRE(match.host->MakeMove("e2e4"));
        match.hub->Pump();
        REQUIRE(match.joiner_events->moves == std::vector<std::string>{"e4"});
        REQUIRE(match.joiner->GetFen() == match.host->GetFen());

        REQUIRE(match.joiner->MakeMove("g8f6"));
        match.hub->Pump();
        REQUIRE(match.host_events->moves == std::vector<std::string>{"Nf6"});
    }
}

TEST_CASE("GameSession - Chat", "[session][chat]") {
    LoopbackMatch match(SessionConfig::Default().WithMaxChatBytes(16));

    auto early = match.host->SendChat("hello");
    REQUIRE(early.IsErr());
    REQUIRE(early.UnwrapErr().type == ProtocolFailureType::InvalidState);

    match.Connect();

    REQUIRE(match.host->SendChat("good luck").IsOk());
    REQUIRE(match.joiner->SendChat("you too").IsOk());
    match.hub->Pump();

    using Chat = std::pair<std::string, ChatOrigin>;
    REQUIRE(match.host_events->chats == std::vector<Chat>{
        {"good luck", ChatOrigin::Local}, {"you too", ChatOrigin::Remote}});
    REQUIRE(match.joiner_events->chats == std::vector<Chat>{
        {"you too", ChatOrigin::Local}, {"good luck", ChatOrigin::Remote}});

    auto empty = match.host->SendChat("");
    REQUIRE(empty.IsErr());
    REQUIRE(empty.UnwrapErr().type == ProtocolFailureType::InvalidInput);

    auto oversized = match.host->SendChat("this is longer than sixteen bytes");
    REQUIRE(oversized.IsErr());
    REQUIRE(oversized.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    REQUIRE(match.host_events->chats.size() == 2);
}

TEST_CASE("GameSession - Resignation", "[session][game]") {
    LoopbackMatch match;
    match.Connect();
    match.Play({"e4"});

    REQUIRE(match.joiner->Resign().IsOk());
    REQUIRE(match.joiner->GetOutcome() == GameOutcome::Loss);
    REQUIRE(match.joiner->GetState() == SessionState::Terminated);

    match.hub->Pump();
    REQUIRE(match.host_events->outcomes == std::vector{GameOutcome::Win});
    REQUIRE(match.host->GetState() == SessionState::Terminated);

    auto after = match.host->Resign();
    REQUIRE(after.IsErr());
    REQUIRE(after.UnwrapErr().type == ProtocolFailureType::InvalidState);
    REQUIRE(match.host_events->outcomes.size() == 1);
}

TEST_CASE("GameSession - Draw offers accepted automatically", "[session][draw]") {
    LoopbackMatch match;
    match.Connect();

    REQUIRE(match.host->OfferDraw().IsOk());
    auto duplicate = match.host->OfferDraw();
    REQUIRE(duplicate.IsErr());
    REQUIRE(duplicate.UnwrapErr().type == ProtocolFailureType::InvalidState);

    match.hub->Pump();

    REQUIRE(match.joiner_events->draw_offers == 0);
    REQUIRE(match.joiner_events->outcomes == std::vector{GameOutcome::Draw});
    REQUIRE(match.host_events->outcomes == std::vector{GameOutcome::Draw});
    REQUIRE(match.host->GetState() == SessionState::Terminated);
    REQUIRE(match.joiner->GetState() == SessionState::Terminated);
}

TEST_CASE("GameSession - Draw offers with a prompt", "[session][draw]") {
    LoopbackMatch match(SessionConfig::Interactive(), SessionConfig::Interactive());
    match.Connect();

    auto nothing_pending = match.joiner->RespondToDraw(true);
    REQUIRE(nothing_pending.IsErr());
    REQUIRE(nothing_pending.UnwrapErr().type == ProtocolFailureType::InvalidState);

    REQUIRE(match.host->OfferDraw().IsOk());
    match.hub->Pump();
    REQUIRE(match.joiner_events->draw_offers == 1);
    REQUIRE(match.joiner->GetState() == SessionState::Active);

    SECTION("Declined") {
        REQUIRE(match.joiner->RespondToDraw(false).IsOk());
        match.hub->Pump();
        REQUIRE(match.host_events->draw_declines == 1);
        REQUIRE(match.host->GetState() == SessionState::Active);
        REQUIRE(match.joiner->GetState() == SessionState::Active);

        // The offer is spent; a new one may be made.
        REQUIRE(match.joiner->RespondToDraw(true).IsErr());
        REQUIRE(match.host->OfferDraw().IsOk());
    }

    SECTION("Accepted") {
        REQUIRE(match.joiner->RespondToDraw(true).IsOk());
        REQUIRE(match.joiner_events->outcomes == std::vector{GameOutcome::Draw});
        match.hub->Pump();
        REQUIRE(match.host_events->outcomes == std::vector{GameOutcome::Draw});
    }

    SECTION("Answering with a move lets the offer lapse") {
        match.Play({"e4", "e5"});
        REQUIRE(match.joiner->RespondToDraw(true).IsErr());
        REQUIRE(match.host->OfferDraw().IsOk());
        match.hub->Pump();
        REQUIRE(match.joiner_events->draw_offers == 2);
    }
}

TEST_CASE("GameSession - Cleanup", "[session][cleanup]") {
    LoopbackMatch match;
    match.Connect();
    match.Play({"d4"});

    match.host->Cleanup();
    REQUIRE(match.host->GetState() == SessionState::Terminated);
    REQUIRE(match.host->GetEncryptionState() == EncryptionState::Erased);
    REQUIRE_FALSE(match.host_encryption->HasSession("joiner"));
    REQUIRE(match.host_transport->GetState() == ConnectionState::Disconnected);
    REQUIRE_FALSE(match.host->GetOutcome().has_value());

    match.host->Cleanup();
    REQUIRE(match.host->GetState() == SessionState::Terminated);
    REQUIRE(match.host_events->errors.empty());

    REQUIRE_FALSE(match.host->MakeMove("e4"));
    REQUIRE(match.host->SendChat("still there?").IsErr());
    REQUIRE(match.host->OfferDraw().IsErr());

    // The peer learns of the disconnect but keeps its own session until it cleans up.
    match.hub->Pump();
    REQUIRE(match.joiner_events->connection_changes.back() == ConnectionState::Disconnected);
    REQUIRE(match.joiner_events->HasError(ProtocolFailureType::Transport));
    REQUIRE(match.joiner->GetState() == SessionState::Active);
    REQUIRE_FALSE(match.joiner->MakeMove("d5"));
    REQUIRE(match.joiner_events->HasError(ProtocolFailureType::Transport));

    match.joiner->Cleanup();
    REQUIRE_FALSE(match.joiner_encryption->HasSession("host"));
}

TEST_CASE("GameSession - Transport failure is reported", "[session][transport]") {
    LoopbackMatch match;
    match.Connect();

    match.host_transport->SimulateFailure();
    match.hub->Pump();

    REQUIRE(match.host_events->connection_changes.back() == ConnectionState::Failed);
    REQUIRE(match.host_events->CountErrors(ProtocolFailureType::Transport) == 1);
    REQUIRE(match.joiner_events->connection_changes.back() == ConnectionState::Disconnected);
    REQUIRE(match.joiner_events->CountErrors(ProtocolFailureType::Transport) == 1);

    REQUIRE_FALSE(match.host->MakeMove("e4"));
    REQUIRE(match.host_events->CountErrors(ProtocolFailureType::Transport) == 2);
    REQUIRE(match.host->GetFen() == chess::Position::kStartFen);
}

TEST_CASE("GameSession - Handlers may call back into the controller", "[session]") {
    LoopbackMatch match;
    match.Connect();

    match.joiner_events->on_chat = [&](const std::string& text, const ChatOrigin origin) {
        if (origin == ChatOrigin::Remote) {
            REQUIRE(match.joiner->SendChat("echo: " + text).IsOk());
        }
    };
    std::string final_fen;
    match.joiner_events->on_game_end = [&](GameOutcome) { final_fen = match.joiner->GetFen(); };

    REQUIRE(match.host->SendChat("ping").IsOk());
    match.hub->Pump();
    REQUIRE(match.host_events->chats.back() == std::pair<std::string, ChatOrigin>{"echo: ping", ChatOrigin::Remote});

    match.Play({"e4"});
    REQUIRE(match.joiner->Resign().IsOk());
    REQUIRE(final_fen == "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq - 0 1");
}
