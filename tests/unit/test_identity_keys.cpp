#include <catch2/catch_test_macros.hpp>
#include "gambit/encryption/identity_keys.hpp"
#include "gambit/crypto/sodium_interop.hpp"
#include "gambit/core/constants.hpp"

using namespace gambit;
using namespace gambit::encryption;

TEST_CASE("IdentityKeys - Public bundle", "[identity][encryption]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto keys = IdentityKeys::Create().Unwrap();
    const auto bundle = keys.CreatePublicBundle();

    REQUIRE(bundle.version() == kBundleVersion);
    REQUIRE(bundle.registration_id() == keys.GetRegistrationId());
    REQUIRE(bundle.identity_ed25519().size() == kEd25519PublicKeyBytes);
    REQUIRE(bundle.identity_x25519().size() == kX25519PublicKeyBytes);
    REQUIRE(bundle.signed_pre_key_public().size() == kX25519PublicKeyBytes);
    REQUIRE(bundle.signed_pre_key_signature().size() == kEd25519SignatureBytes);
    REQUIRE(IdentityKeys::ValidateRemoteBundle(bundle).IsOk());
}

TEST_CASE("IdentityKeys - Both sides derive the same root", "[identity][encryption]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto host = IdentityKeys::Create().Unwrap();
    auto joiner = IdentityKeys::Create().Unwrap();

    auto host_root = host.DeriveSharedRoot(joiner.CreatePublicBundle());
    auto joiner_root = joiner.DeriveSharedRoot(host.CreatePublicBundle());
    REQUIRE(host_root.IsOk());
    REQUIRE(joiner_root.IsOk());
    REQUIRE(host_root.Unwrap().local_is_low != joiner_root.Unwrap().local_is_low);

    auto host_bytes = host_root.Unwrap().root_key.ReadBytes(kRootKeyBytes);
    auto joiner_bytes = joiner_root.Unwrap().root_key.ReadBytes(kRootKeyBytes);
    REQUIRE(host_bytes.IsOk());
    REQUIRE(joiner_bytes.IsOk());
    REQUIRE(host_bytes.Unwrap() == joiner_bytes.Unwrap());

    SECTION("A third party derives something else") {
        auto stranger = IdentityKeys::Create().Unwrap();
        auto stranger_root = stranger.DeriveSharedRoot(host.CreatePublicBundle());
        REQUIRE(stranger_root.IsOk());
        auto stranger_bytes = stranger_root.Unwrap().root_key.ReadBytes(kRootKeyBytes);
        REQUIRE(stranger_bytes.Unwrap() != host_bytes.Unwrap());
    }
}

TEST_CASE("IdentityKeys - Rejected bundles", "[identity][encryption][security]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto local = IdentityKeys::Create().Unwrap();
    auto remote = IdentityKeys::Create().Unwrap();
    auto bundle = remote.CreatePublicBundle();

    SECTION("Reflected own bundle") {
        auto result = local.DeriveSharedRoot(local.CreatePublicBundle());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Handshake);
        REQUIRE(result.UnwrapErr().message == ErrorMessages::REFLECTION_ATTACK);
    }
    SECTION("Signature over a different pre-key") {
        auto other = IdentityKeys::Create().Unwrap();
        bundle.set_signed_pre_key_public(other.CreatePublicBundle().signed_pre_key_public());
        auto result = IdentityKeys::ValidateRemoteBundle(bundle);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Handshake);
    }
    SECTION("Corrupted signature") {
        std::string signature = bundle.signed_pre_key_signature();
        signature[5] = static_cast<char>(signature[5] ^ 0x20);
        bundle.set_signed_pre_key_signature(signature);
        REQUIRE(local.DeriveSharedRoot(bundle).IsErr());
    }
    SECTION("Small-order identity key") {
        bundle.set_identity_x25519(std::string(kX25519PublicKeyBytes, '\0'));
        auto result = IdentityKeys::ValidateRemoteBundle(bundle);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::PeerPubKey);
    }
    SECTION("Truncated signing key") {
        bundle.set_identity_ed25519(bundle.identity_ed25519().substr(1));
        auto result = IdentityKeys::ValidateRemoteBundle(bundle);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Unknown version") {
        bundle.set_version(kBundleVersion + 1);
        REQUIRE(IdentityKeys::ValidateRemoteBundle(bundle).IsErr());
    }
}
