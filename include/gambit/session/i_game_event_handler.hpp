#pragma once
#include "gambit/core/failures.hpp"
#include "gambit/session/session_types.hpp"
#include "gambit/transport/connection_state.hpp"
#include <string>

namespace gambit::session {

/**
 * Presentation-side port of GameSessionController.
 *
 * Callbacks run on the thread that drove the event (a public call or the
 * transport's delivery) with the controller lock held; calling back into
 * the controller from a callback is allowed.
 */
class IGameEventHandler {
public:
    virtual ~IGameEventHandler() = default;

    /// A remote move was accepted and applied; `san` is the local rules' notation.
    virtual void OnMove(const std::string& san) = 0;
    virtual void OnChat(const std::string& text, ChatOrigin origin) = 0;
    virtual void OnGameEnd(GameOutcome outcome) = 0;
    virtual void OnConnectionChange(transport::ConnectionState state) = 0;
    virtual void OnError(const ProtocolFailure& failure) = 0;

    /// Only raised under DrawPolicy::Prompt; answer with RespondToDraw.
    virtual void OnDrawOffered() {}
    virtual void OnDrawDeclined() {}
};

}
