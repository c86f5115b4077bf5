#pragma once
#include "gambit/core/result.hpp"
#include "gambit/core/failures.hpp"
#include "gambit/transport/connection_state.hpp"
#include "gambit/transport/signaling_package.hpp"
#include <string>
#include <string_view>

namespace gambit::transport {

class ITransportObserver {
public:
    virtual ~ITransportObserver() = default;
    virtual void OnFrameReceived(std::string_view frame) = 0;
    virtual void OnConnectionStateChanged(ConnectionState state) = 0;
};

/**
 * Reliable, ordered, bidirectional frame channel between exactly two peers.
 *
 * Observer callbacks are never invoked from inside Send(); implementations
 * deliver them from their own event source.
 */
class ITransportChannel {
public:
    virtual ~ITransportChannel() = default;

    [[nodiscard]] virtual Result<SignalingPackage, ProtocolFailure> CreateOffer() = 0;

    [[nodiscard]] virtual Result<SignalingPackage, ProtocolFailure> AcceptOffer(
        const SignalingPackage& offer) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> ApplyAnswer(const SignalingPackage& answer) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> Send(std::string frame) = 0;

    /// Pass nullptr to detach.
    virtual void SetObserver(ITransportObserver* observer) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> Close() = 0;

    [[nodiscard]] virtual ConnectionState GetState() const = 0;
};

}
