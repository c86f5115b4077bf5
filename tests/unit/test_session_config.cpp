#include <catch2/catch_test_macros.hpp>
#include "gambit/configuration/session_config.hpp"

using namespace gambit::configuration;

TEST_CASE("SessionConfig - Presets", "[configuration]") {
    SECTION("Default") {
        constexpr auto config = SessionConfig::Default();
        STATIC_REQUIRE(config.GetDrawPolicy() == DrawPolicy::AutoAccept);
        STATIC_REQUIRE_FALSE(config.AllowsPlaintextFallback());
        STATIC_REQUIRE_FALSE(config.AcceptsPlaintextMessages());
        STATIC_REQUIRE(config.GetMaxChatBytes() == SessionConfig::kDefaultMaxChatBytes);
        STATIC_REQUIRE(config.GetMaxFrameBytes() == SessionConfig::kDefaultMaxFrameBytes);
    }

    SECTION("Interactive prompts for draws") {
        const auto config = SessionConfig::Interactive();
        REQUIRE(config.GetDrawPolicy() == DrawPolicy::Prompt);
        REQUIRE_FALSE(config.AllowsPlaintextFallback());
    }

    SECTION("LegacyCompatible allows plaintext both ways") {
        const auto config = SessionConfig::LegacyCompatible();
        REQUIRE(config.AllowsPlaintextFallback());
        REQUIRE(config.AcceptsPlaintextMessages());
        REQUIRE(config.GetDrawPolicy() == DrawPolicy::AutoAccept);
    }
}

TEST_CASE("SessionConfig - Builders return modified copies", "[configuration]") {
    const auto base = SessionConfig::Default();
    const auto tuned = base
        .WithDrawPolicy(DrawPolicy::Prompt)
        .WithMaxChatBytes(280)
        .WithMaxFrameBytes(8192)
        .WithPlaintextMessages(true);

    REQUIRE(tuned.GetDrawPolicy() == DrawPolicy::Prompt);
    REQUIRE(tuned.GetMaxChatBytes() == 280);
    REQUIRE(tuned.GetMaxFrameBytes() == 8192);
    REQUIRE(tuned.AcceptsPlaintextMessages());
    REQUIRE_FALSE(tuned.AllowsPlaintextFallback());

    REQUIRE(base == SessionConfig::Default());
    REQUIRE_FALSE(tuned == base);
    REQUIRE(SessionConfig::Default().WithDrawPolicy(DrawPolicy::Prompt) == SessionConfig::Interactive());
}
