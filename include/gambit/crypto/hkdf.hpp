#pragma once

#include "gambit/core/result.hpp"
#include "gambit/core/failures.hpp"

#include <span>
#include <string_view>
#include <vector>
#include <cstdint>

namespace gambit::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) over OpenSSL EVP_KDF
 */
class Hkdf {
public:
    /**
     * @brief Extract-and-expand into `output`
     *
     * @param ikm Input key material, must not be empty
     * @param output Filled with derived bytes (at most MAX_OUTPUT_LEN)
     * @param salt Optional salt
     * @param info Optional context string
     */
    static Result<Unit, ProtocolFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /// Convenience overload for the library's string_view info labels.
    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::string_view info);

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace gambit::crypto
