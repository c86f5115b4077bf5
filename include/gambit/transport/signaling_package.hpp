#pragma once
#include "gambit/core/result.hpp"
#include "gambit/core/failures.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gambit::transport {

/**
 * Connection description exchanged out of band (copy/paste, QR code, ...)
 * before the transport can carry frames.
 *
 * Text form: URL-safe base64 of the protobuf SignalingPackage.
 */
struct SignalingPackage {
    enum class Kind {
        Offer,
        Answer
    };

    Kind kind = Kind::Offer;
    std::vector<uint8_t> session_token;
    std::string endpoint_id;
    std::vector<std::string> candidates;

    [[nodiscard]] Result<std::string, ProtocolFailure> Encode() const;
    [[nodiscard]] static Result<SignalingPackage, ProtocolFailure> Decode(std::string_view text);
};

}
