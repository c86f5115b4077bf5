#include "gambit/security/dh_validator.hpp"
#include "gambit/core/format.hpp"

namespace gambit::security {

Result<Unit, ProtocolFailure> DhValidator::ValidateX25519PublicKey(
    std::span<const uint8_t> public_key) {

    if (public_key.size() != kX25519PublicKeyBytes) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Invalid X25519 public key size: expected {}, got {}",
                               kX25519PublicKeyBytes, public_key.size())));
    }

    if (HasSmallOrder(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::PeerPubKey("X25519 public key is a small-order point"));
    }

    if (!IsCanonicalFieldElement(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::PeerPubKey("X25519 public key is not a reduced field element"));
    }

    return Result<Unit, ProtocolFailure>::Ok(unit);
}

bool DhValidator::HasSmallOrder(std::span<const uint8_t> public_key) {
    bool found = false;
    for (const auto& point : SMALL_ORDER_POINTS) {
        found |= ConstantTimeEquals(public_key, point);
    }
    return found;
}

bool DhValidator::IsCanonicalFieldElement(std::span<const uint8_t> public_key) {
    // The top bit is ignored by X25519; compare the remaining 255 bits with p
    // from the most significant byte down.
    for (size_t i = kX25519PublicKeyBytes; i-- > 0;) {
        const uint8_t key_byte = i == kX25519PublicKeyBytes - 1
            ? static_cast<uint8_t>(public_key[i] & 0x7f)
            : public_key[i];
        if (key_byte < CURVE_25519_PRIME[i]) {
            return true;
        }
        if (key_byte > CURVE_25519_PRIME[i]) {
            return false;
        }
    }
    return false;
}

bool DhValidator::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return false;
    }
    uint8_t diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= a[i] ^ b[i];
    }
    return diff == 0;
}

}
