#pragma once
#include "gambit/core/result.hpp"
#include "gambit/core/failures.hpp"
#include "gambit/core/constants.hpp"
#include <array>
#include <cstdint>
#include <span>

namespace gambit::security {

/**
 * Validation of peer X25519 public keys before any agreement is performed.
 *
 * Rejects wrong sizes, the known small-order points (which force a
 * predictable shared secret) and encodings that are not reduced modulo
 * 2^255 - 19.
 */
class DhValidator {
public:
    [[nodiscard]] static Result<Unit, ProtocolFailure> ValidateX25519PublicKey(
        std::span<const uint8_t> public_key);

private:
    using Point = std::array<uint8_t, kX25519PublicKeyBytes>;

    static constexpr Point Repeat(const uint8_t first, const uint8_t fill, const uint8_t last) {
        Point point{};
        point[0] = first;
        for (size_t i = 1; i + 1 < point.size(); ++i) {
            point[i] = fill;
        }
        point[point.size() - 1] = last;
        return point;
    }

    static const std::array<Point, 7> SMALL_ORDER_POINTS;

    // 2^255 - 19, little-endian
    static const Point CURVE_25519_PRIME;

    static bool HasSmallOrder(std::span<const uint8_t> public_key);
    static bool IsCanonicalFieldElement(std::span<const uint8_t> public_key);
    static bool ConstantTimeEquals(std::span<const uint8_t> a, std::span<const uint8_t> b);

    DhValidator() = delete;
};

inline constexpr std::array<DhValidator::Point, 7> DhValidator::SMALL_ORDER_POINTS = {{
    Repeat(0x00, 0x00, 0x00),
    Repeat(0x01, 0x00, 0x00),
    {0xe0, 0xeb, 0x7a, 0x7c, 0x3b, 0x41, 0xb8, 0xae, 0x16, 0x56, 0xe3, 0xfa, 0xf1, 0x9f, 0xc4, 0x6a,
     0xda, 0x09, 0x8d, 0xeb, 0x9c, 0x32, 0xb1, 0xfd, 0x86, 0x62, 0x05, 0x16, 0x5f, 0x49, 0xb8, 0x00},
    {0x5f, 0x9c, 0x95, 0xbc, 0xa3, 0x50, 0x8c, 0x24, 0xb1, 0xd0, 0xb1, 0x55, 0x9c, 0x83, 0xef, 0x5b,
     0x04, 0x44, 0x5c, 0xc4, 0x58, 0x1c, 0x8e, 0x86, 0xd8, 0x22, 0x4e, 0xdd, 0xd0, 0x9f, 0x11, 0x57},
    Repeat(0xec, 0xff, 0x7f),
    Repeat(0xed, 0xff, 0x7f),
    Repeat(0xee, 0xff, 0x7f),
}};

// 2^255 - 19, little-endian
inline constexpr DhValidator::Point DhValidator::CURVE_25519_PRIME = Repeat(0xed, 0xff, 0x7f);

}
