#pragma once

/**
 * @file session_logger.hpp
 * @brief Diagnostic tracing of session bootstrap, dispatch and teardown.
 *
 * Compiled to no-ops unless GAMBIT_DEBUG_LOG is defined
 * (CMake: -DGAMBIT_DEBUG_LOG=ON). Key material is only ever printed as a
 * short fingerprint of its leading bytes, never in full.
 */

#include "gambit/core/constants.hpp"
#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace gambit::debug {

enum class Side {
    Host,
    Joiner,
    Unknown
};

#ifdef GAMBIT_DEBUG_LOG

inline std::string Fingerprint(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    const size_t shown = data.size() < kFingerprintBytes ? data.size() : kFingerprintBytes;
    std::string result;
    result.reserve(shown * 2 + 16);
    for (size_t i = 0; i < shown; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    result += "..(" + std::to_string(data.size()) + "B)";
    return result;
}

inline const char* SideToString(Side side) {
    switch (side) {
        case Side::Host: return "HOST";
        case Side::Joiner: return "JOINER";
        default: return "UNKNOWN";
    }
}

#define GAMBIT_LOG_KEY(side, operation, key_name, data) \
    do { \
        fprintf(stdout, "[GAMBIT] %s %s %s: %s\n", \
            ::gambit::debug::SideToString(side), \
            operation, \
            key_name, \
            ::gambit::debug::Fingerprint(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define GAMBIT_LOG_VALUE(side, operation, name, value) \
    do { \
        fprintf(stdout, "[GAMBIT] %s %s %s: %s\n", \
            ::gambit::debug::SideToString(side), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define GAMBIT_LOG_MSG(side, operation, message) \
    do { \
        fprintf(stdout, "[GAMBIT] %s %s %s\n", \
            ::gambit::debug::SideToString(side), \
            operation, \
            std::string(message).c_str()); \
        fflush(stdout); \
    } while(0)

#define GAMBIT_LOG_SECTION(side, section_name) \
    do { \
        fprintf(stdout, "[GAMBIT] %s ========== %s ==========\n", \
            ::gambit::debug::SideToString(side), \
            section_name); \
        fflush(stdout); \
    } while(0)

#else // !GAMBIT_DEBUG_LOG

#define GAMBIT_LOG_KEY(side, operation, key_name, data) ((void)0)
#define GAMBIT_LOG_VALUE(side, operation, name, value) ((void)0)
#define GAMBIT_LOG_MSG(side, operation, message) ((void)0)
#define GAMBIT_LOG_SECTION(side, section_name) ((void)0)

#endif // GAMBIT_DEBUG_LOG

} // namespace gambit::debug
