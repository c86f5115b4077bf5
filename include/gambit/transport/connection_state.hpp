#pragma once
#include <string_view>

namespace gambit::transport {

enum class ConnectionState {
    Idle,
    Connecting,
    Connected,
    Disconnected,
    Failed
};

constexpr std::string_view ToString(const ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Idle: return "Idle";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Failed: return "Failed";
    }
    return "Unknown";
}

}
