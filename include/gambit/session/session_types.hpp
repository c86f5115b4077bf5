#pragma once
#include "gambit/chess/types.hpp"
#include <string_view>

namespace gambit::session {

/// Host always plays White and moves first.
enum class SessionRole {
    Host,
    Joiner
};

enum class SessionState {
    Uninitialized,
    AwaitingTransport,
    EncryptionBootstrap,
    Active,
    Terminated
};

enum class EncryptionState {
    None,
    Bootstrapping,
    Established,
    Erased
};

/// Always from the local player's point of view.
enum class GameOutcome {
    Win,
    Loss,
    Draw
};

enum class ChatOrigin {
    Local,
    Remote
};

constexpr chess::Color ColorOf(const SessionRole role) noexcept {
    return role == SessionRole::Host ? chess::Color::White : chess::Color::Black;
}

constexpr std::string_view ToString(const SessionRole role) noexcept {
    return role == SessionRole::Host ? "Host" : "Joiner";
}

constexpr std::string_view ToString(const SessionState state) noexcept {
    switch (state) {
        case SessionState::Uninitialized: return "Uninitialized";
        case SessionState::AwaitingTransport: return "AwaitingTransport";
        case SessionState::EncryptionBootstrap: return "EncryptionBootstrap";
        case SessionState::Active: return "Active";
        case SessionState::Terminated: return "Terminated";
    }
    return "Unknown";
}

constexpr std::string_view ToString(const EncryptionState state) noexcept {
    switch (state) {
        case EncryptionState::None: return "None";
        case EncryptionState::Bootstrapping: return "Bootstrapping";
        case EncryptionState::Established: return "Established";
        case EncryptionState::Erased: return "Erased";
    }
    return "Unknown";
}

constexpr std::string_view ToString(const GameOutcome outcome) noexcept {
    switch (outcome) {
        case GameOutcome::Win: return "Win";
        case GameOutcome::Loss: return "Loss";
        case GameOutcome::Draw: return "Draw";
    }
    return "Unknown";
}

}
