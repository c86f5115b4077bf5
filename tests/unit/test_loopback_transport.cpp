#include <catch2/catch_test_macros.hpp>
#include "gambit/transport/loopback_transport.hpp"
#include "gambit/crypto/sodium_interop.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace gambit;
using namespace gambit::transport;

namespace {
    struct RecordingObserver final : ITransportObserver {
        std::vector<std::string> frames;
        std::vector<ConnectionState> states;

        void OnFrameReceived(std::string_view frame) override { frames.emplace_back(frame); }
        void OnConnectionStateChanged(const ConnectionState state) override { states.push_back(state); }
    };

    struct Pair {
        std::shared_ptr<LoopbackHub> hub = LoopbackHub::Create();
        LoopbackTransport host{hub};
        LoopbackTransport joiner{hub};
        RecordingObserver host_events;
        RecordingObserver joiner_events;

        Pair() {
            REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
            host.SetObserver(&host_events);
            joiner.SetObserver(&joiner_events);
        }

        void Connect() {
            auto offer = host.CreateOffer().Unwrap();
            auto answer = joiner.AcceptOffer(offer).Unwrap();
            REQUIRE(host.ApplyAnswer(answer).IsOk());
            hub->Pump();
        }
    };
}

TEST_CASE("LoopbackTransport - Offer and answer connect both ends", "[transport][loopback]") {
    Pair pair;
    auto offer = pair.host.CreateOffer();
    REQUIRE(offer.IsOk());
    REQUIRE(offer.Unwrap().kind == SignalingPackage::Kind::Offer);
    REQUIRE(offer.Unwrap().session_token.size() == kSessionTokenBytes);
    REQUIRE(pair.host.GetState() == ConnectionState::Connecting);

    // The packages survive the text form used for out-of-band exchange.
    auto offer_text = offer.Unwrap().Encode().Unwrap();
    auto answer = pair.joiner.AcceptOffer(SignalingPackage::Decode(offer_text).Unwrap());
    REQUIRE(answer.IsOk());
    REQUIRE(answer.Unwrap().kind == SignalingPackage::Kind::Answer);
    REQUIRE(answer.Unwrap().session_token == offer.Unwrap().session_token);

    auto answer_text = answer.Unwrap().Encode().Unwrap();
    REQUIRE(pair.host.ApplyAnswer(SignalingPackage::Decode(answer_text).Unwrap()).IsOk());

    // Nothing is delivered until the hub is pumped.
    REQUIRE(pair.host_events.states.empty());
    REQUIRE(pair.hub->Pump() == 2);

    REQUIRE(pair.host.GetState() == ConnectionState::Connected);
    REQUIRE(pair.joiner.GetState() == ConnectionState::Connected);
    REQUIRE(pair.host_events.states == std::vector{ConnectionState::Connected});
    REQUIRE(pair.joiner_events.states == std::vector{ConnectionState::Connected});
}

TEST_CASE("LoopbackTransport - Frames arrive in order", "[transport][loopback]") {
    Pair pair;
    pair.Connect();

    REQUIRE(pair.host.Send("one").IsOk());
    REQUIRE(pair.host.Send("two").IsOk());
    REQUIRE(pair.joiner.Send("reply").IsOk());
    REQUIRE(pair.hub->PendingCount() == 3);
    pair.hub->Pump();

    REQUIRE(pair.joiner_events.frames == std::vector<std::string>{"one", "two"});
    REQUIRE(pair.host_events.frames == std::vector<std::string>{"reply"});
}

TEST_CASE("LoopbackTransport - Pairing errors", "[transport][loopback]") {
    Pair pair;

    SECTION("Send before connecting") {
        auto result = pair.host.Send("early");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Transport);
    }

    SECTION("Second offer from the same endpoint") {
        REQUIRE(pair.host.CreateOffer().IsOk());
        auto again = pair.host.CreateOffer();
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }

    SECTION("Answer passed where an offer is expected") {
        auto offer = pair.host.CreateOffer().Unwrap();
        offer.kind = SignalingPackage::Kind::Answer;
        auto result = pair.joiner.AcceptOffer(offer);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("Offer can only be answered once") {
        LoopbackTransport third(pair.hub);
        auto offer = pair.host.CreateOffer().Unwrap();
        REQUIRE(pair.joiner.AcceptOffer(offer).IsOk());
        auto result = third.AcceptOffer(offer);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Transport);
    }

    SECTION("Answer for a different offer") {
        LoopbackTransport other_host(pair.hub);
        LoopbackTransport other_joiner(pair.hub);
        REQUIRE(pair.host.CreateOffer().IsOk());
        auto foreign_answer = other_joiner.AcceptOffer(other_host.CreateOffer().Unwrap()).Unwrap();
        auto result = pair.host.ApplyAnswer(foreign_answer);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Transport);
    }

    SECTION("Answer without a pending offer") {
        auto offer = pair.host.CreateOffer().Unwrap();
        auto answer = pair.joiner.AcceptOffer(offer).Unwrap();
        auto result = pair.joiner.ApplyAnswer(answer);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
}

TEST_CASE("LoopbackTransport - Close and failure", "[transport][loopback]") {
    Pair pair;
    pair.Connect();

    SECTION("Close notifies the peer") {
        REQUIRE(pair.host.Close().IsOk());
        REQUIRE(pair.host.GetState() == ConnectionState::Disconnected);
        pair.hub->Pump();
        REQUIRE(pair.joiner.GetState() == ConnectionState::Disconnected);
        REQUIRE(pair.joiner_events.states.back() == ConnectionState::Disconnected);
        REQUIRE(pair.joiner.Send("late").IsErr());

        // Closing twice is harmless.
        REQUIRE(pair.host.Close().IsOk());
    }

    SECTION("Frames to a closed endpoint are dropped") {
        REQUIRE(pair.host.Send("in flight").IsOk());
        REQUIRE(pair.joiner.Close().IsOk());
        pair.hub->Pump();
        REQUIRE(pair.joiner_events.frames.empty());
    }

    SECTION("Simulated failure") {
        pair.host.SimulateFailure();
        pair.hub->Pump();
        REQUIRE(pair.host.GetState() == ConnectionState::Failed);
        REQUIRE(pair.host_events.states.back() == ConnectionState::Failed);
        REQUIRE(pair.joiner.GetState() == ConnectionState::Disconnected);
        REQUIRE(pair.host.Send("after failure").IsErr());
    }

    SECTION("Detached observer hears nothing") {
        pair.joiner.SetObserver(nullptr);
        REQUIRE(pair.host.Send("unheard").IsOk());
        pair.hub->Pump();
        REQUIRE(pair.joiner_events.frames.empty());
    }
}
