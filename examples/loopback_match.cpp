/**
 * @file loopback_match.cpp
 * @brief Two encrypted game sessions in one process, playing the fool's mate
 */

#include "gambit/chess/standard_chess_rules.hpp"
#include "gambit/encryption/sodium_encryption_session.hpp"
#include "gambit/session/game_session_controller.hpp"
#include "gambit/transport/loopback_transport.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace gambit;
using namespace gambit::session;

class ConsolePlayer final : public IGameEventHandler {
public:
    explicit ConsolePlayer(std::string name) : name_(std::move(name)) {}

    void OnMove(const std::string& san) override {
        std::cout << "   [" << name_ << "] opponent played " << san << std::endl;
    }
    void OnChat(const std::string& text, ChatOrigin origin) override {
        std::cout << "   [" << name_ << "] " << (origin == ChatOrigin::Local ? "me" : "them")
                  << ": " << text << std::endl;
    }
    void OnGameEnd(GameOutcome outcome) override {
        std::cout << "   [" << name_ << "] game over: " << ToString(outcome) << std::endl;
    }
    void OnConnectionChange(transport::ConnectionState state) override {
        std::cout << "   [" << name_ << "] connection " << transport::ToString(state) << std::endl;
    }
    void OnError(const ProtocolFailure& failure) override {
        std::cerr << "   [" << name_ << "] error " << ToString(failure.type)
                  << ": " << failure.message << std::endl;
    }

private:
    std::string name_;
};

static std::unique_ptr<GameSessionController> MakeController(
    const std::shared_ptr<transport::LoopbackHub>& hub) {
    auto encryption = encryption::SodiumEncryptionSession::Create();
    if (encryption.IsErr()) {
        std::cerr << "Failed to create encryption session: "
                  << encryption.UnwrapErr().message << std::endl;
        return nullptr;
    }
    auto controller = GameSessionController::Create(
        std::make_shared<transport::LoopbackTransport>(hub),
        std::shared_ptr<encryption::IEncryptionSession>(std::move(encryption).Unwrap()),
        std::make_unique<chess::StandardChessRules>());
    if (controller.IsErr()) {
        std::cerr << "Failed to create controller: " << controller.UnwrapErr().message << std::endl;
        return nullptr;
    }
    return std::move(controller).Unwrap();
}

int main() {
    std::cout << "=== Gambit - Loopback Match ===" << std::endl << std::endl;

    auto hub = transport::LoopbackHub::Create();
    auto host = MakeController(hub);
    auto joiner = MakeController(hub);
    if (!host || !joiner) {
        return 1;
    }

    std::cout << "1. Initializing sessions..." << std::endl;
    if (host->Initialize(SessionRole::Host, "joiner", std::make_shared<ConsolePlayer>("white")).IsErr() ||
        joiner->Initialize(SessionRole::Joiner, "host", std::make_shared<ConsolePlayer>("black")).IsErr()) {
        std::cerr << "Failed to initialize sessions" << std::endl;
        return 1;
    }

    std::cout << "2. Exchanging offer and answer..." << std::endl;
    auto offer = host->CreateOfferPackage();
    if (offer.IsErr()) {
        std::cerr << "Offer failed: " << offer.UnwrapErr().message << std::endl;
        return 1;
    }
    auto answer = joiner->AcceptOfferPackage(offer.Unwrap());
    if (answer.IsErr()) {
        std::cerr << "Answer failed: " << answer.UnwrapErr().message << std::endl;
        return 1;
    }
    if (auto applied = host->AcceptAnswerPackage(answer.Unwrap()); applied.IsErr()) {
        std::cerr << "Connect failed: " << applied.UnwrapErr().message << std::endl;
        return 1;
    }
    hub->Pump();
    std::cout << "   host: " << ToString(host->GetState()) << " / "
              << ToString(host->GetEncryptionState()) << std::endl;
    std::cout << "   joiner: " << ToString(joiner->GetState()) << " / "
              << ToString(joiner->GetEncryptionState()) << std::endl;

    std::cout << "3. Playing..." << std::endl;
    if (joiner->SendChat("good luck").IsErr()) {
        return 1;
    }
    hub->Pump();

    const char* moves[] = {"f3", "e5", "g4", "Qh4#"};
    bool white_to_move = true;
    for (const char* move : moves) {
        GameSessionController& mover = white_to_move ? *host : *joiner;
        if (!mover.MakeMove(move)) {
            std::cerr << "Move " << move << " was not sent" << std::endl;
            return 1;
        }
        hub->Pump();
        white_to_move = !white_to_move;
    }

    std::cout << std::endl << "4. Result" << std::endl;
    std::cout << "   host outcome: " << ToString(host->GetOutcome().value_or(GameOutcome::Draw)) << std::endl;
    std::cout << "   joiner outcome: " << ToString(joiner->GetOutcome().value_or(GameOutcome::Draw)) << std::endl;
    std::cout << "   host encryption: " << ToString(host->GetEncryptionState()) << std::endl;
    return 0;
}
