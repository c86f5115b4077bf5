#include <catch2/catch_test_macros.hpp>
#include "gambit/encryption/nonce.hpp"
#include "gambit/crypto/sodium_interop.hpp"
#include <set>

using namespace gambit;
using namespace gambit::encryption;

TEST_CASE("NonceGenerator - Layout", "[nonce][encryption]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());

    NonceGenerator::State state;
    state.prefix = {0xa1, 0xa2, 0xa3, 0xa4};
    state.counter = 0x0102;
    auto generator = NonceGenerator::FromState(state).Unwrap();

    auto nonce = generator.Next(0x0a0b0c0d);
    REQUIRE(nonce.IsOk());
    const std::vector<uint8_t> expected = {
        0xa1, 0xa2, 0xa3, 0xa4,
        0x02, 0x01, 0x00, 0x00,
        0x0d, 0x0c, 0x0b, 0x0a
    };
    REQUIRE(nonce.Unwrap() == expected);
    REQUIRE(nonce.Unwrap().size() == kAesGcmNonceBytes);
    REQUIRE(generator.ExportState().counter == 0x0103);
}

TEST_CASE("NonceGenerator - Never repeats for the same index", "[nonce][encryption]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto generator = NonceGenerator::Create().Unwrap();

    std::set<std::vector<uint8_t>> seen;
    for (int i = 0; i < 256; ++i) {
        auto nonce = generator.Next(0);
        REQUIRE(nonce.IsOk());
        REQUIRE(seen.insert(nonce.Unwrap()).second);
    }
}

TEST_CASE("NonceGenerator - Limits", "[nonce][encryption]") {
    NonceGenerator::State state;

    SECTION("Counter exhaustion") {
        state.counter = kMaxNonceCounter;
        auto generator = NonceGenerator::FromState(state).Unwrap();
        REQUIRE(generator.Next(1).IsOk());
        auto exhausted = generator.Next(2);
        REQUIRE(exhausted.IsErr());
        REQUIRE(exhausted.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
    SECTION("Restoring a counter past the limit") {
        state.counter = kMaxNonceCounter + 1;
        REQUIRE(NonceGenerator::FromState(state).IsErr());
    }
    SECTION("Message index wider than 32 bits") {
        auto generator = NonceGenerator::FromState(state).Unwrap();
        auto result = generator.Next(kMaxMessageIndex + 1);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
