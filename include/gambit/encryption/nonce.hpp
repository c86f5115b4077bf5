#pragma once
#include "gambit/core/failures.hpp"
#include "gambit/core/result.hpp"
#include "gambit/core/constants.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace gambit::encryption {

/**
 * AES-GCM nonce source for one sending direction.
 *
 * Layout: random prefix (4) || counter (4, LE) || message index (4, LE).
 * The counter never repeats for the lifetime of the generator.
 */
class NonceGenerator {
public:
    struct State {
        std::array<uint8_t, kNoncePrefixBytes> prefix{};
        uint64_t counter = 0;
    };

    [[nodiscard]] static Result<NonceGenerator, ProtocolFailure> Create();
    [[nodiscard]] static Result<NonceGenerator, ProtocolFailure> FromState(const State& state);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Next(uint64_t message_index);

    [[nodiscard]] State ExportState() const;

private:
    explicit NonceGenerator(State state);

    State state_{};
};

}
