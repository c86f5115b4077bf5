#pragma once
#include "gambit/core/constants.hpp"
#include "gambit/transport/i_transport_channel.hpp"
#include <string>
#include <vector>

namespace gambit::test_helpers {

using transport::ConnectionState;
using transport::SignalingPackage;

/**
 * ITransportChannel driven by the test: outgoing frames are recorded and
 * inbound events are injected directly into the observer.
 */
class ScriptedTransport : public transport::ITransportChannel {
public:
    Result<SignalingPackage, ProtocolFailure> CreateOffer() override {
        SignalingPackage offer;
        offer.kind = SignalingPackage::Kind::Offer;
        offer.session_token.assign(kSessionTokenBytes, 0x5a);
        offer.endpoint_id = "scripted-host";
        state_ = ConnectionState::Connecting;
        return Result<SignalingPackage, ProtocolFailure>::Ok(std::move(offer));
    }

    Result<SignalingPackage, ProtocolFailure> AcceptOffer(const SignalingPackage& offer) override {
        SignalingPackage answer = offer;
        answer.kind = SignalingPackage::Kind::Answer;
        answer.endpoint_id = "scripted-joiner";
        state_ = ConnectionState::Connecting;
        return Result<SignalingPackage, ProtocolFailure>::Ok(std::move(answer));
    }

    Result<Unit, ProtocolFailure> ApplyAnswer(const SignalingPackage&) override {
        ++answers_applied;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> Send(std::string frame) override {
        if (state_ != ConnectionState::Connected) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Transport(std::string(ErrorMessages::NOT_CONNECTED)));
        }
        if (fail_sends) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Transport("Scripted send failure"));
        }
        sent_frames.push_back(std::move(frame));
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    void SetObserver(transport::ITransportObserver* observer) override {
        observer_ = observer;
    }

    Result<Unit, ProtocolFailure> Close() override {
        ++close_calls;
        state_ = ConnectionState::Disconnected;
        if (fail_close) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Transport("Scripted close failure"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    ConnectionState GetState() const override {
        return state_;
    }

    void ChangeState(const ConnectionState state) {
        state_ = state;
        if (observer_ != nullptr) {
            observer_->OnConnectionStateChanged(state);
        }
    }

    void Inject(const std::string& frame) {
        if (observer_ != nullptr) {
            observer_->OnFrameReceived(frame);
        }
    }

    [[nodiscard]] bool HasObserver() const noexcept { return observer_ != nullptr; }

    std::vector<std::string> sent_frames;
    int close_calls = 0;
    int answers_applied = 0;
    bool fail_sends = false;
    bool fail_close = false;

private:
    ConnectionState state_ = ConnectionState::Idle;
    transport::ITransportObserver* observer_ = nullptr;
};

}
