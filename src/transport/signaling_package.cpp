#include "gambit/transport/signaling_package.hpp"
#include "gambit/crypto/sodium_interop.hpp"
#include "gambit/core/constants.hpp"
#include "gambit/core/format.hpp"
#include "signaling/signaling_package.pb.h"

namespace gambit::transport {
using crypto::SodiumInterop;

Result<std::string, ProtocolFailure> SignalingPackage::Encode() const {
    proto::signaling::SignalingPackage message;
    message.set_kind(kind == Kind::Offer
        ? proto::signaling::SignalingPackage::KIND_OFFER
        : proto::signaling::SignalingPackage::KIND_ANSWER);
    message.set_session_token(std::string(session_token.begin(), session_token.end()));
    message.set_endpoint_id(endpoint_id);
    for (const auto& candidate : candidates) {
        message.add_candidates(candidate);
    }

    std::string bytes;
    if (!message.SerializeToString(&bytes)) {
        return Result<std::string, ProtocolFailure>::Err(
            ProtocolFailure::Encode("Failed to serialize signaling package"));
    }
    return Result<std::string, ProtocolFailure>::Ok(SodiumInterop::ToBase64(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size())));
}

Result<SignalingPackage, ProtocolFailure> SignalingPackage::Decode(std::string_view text) {
    using PackageResult = Result<SignalingPackage, ProtocolFailure>;

    auto bytes = SodiumInterop::FromBase64(text);
    if (bytes.IsErr()) {
        return PackageResult::Err(std::move(bytes).UnwrapErr());
    }
    const auto& raw = bytes.Unwrap();

    proto::signaling::SignalingPackage message;
    if (!message.ParseFromArray(raw.data(), static_cast<int>(raw.size()))) {
        return PackageResult::Err(ProtocolFailure::Decode("Failed to parse signaling package"));
    }

    SignalingPackage package;
    switch (message.kind()) {
        case proto::signaling::SignalingPackage::KIND_OFFER:
            package.kind = Kind::Offer;
            break;
        case proto::signaling::SignalingPackage::KIND_ANSWER:
            package.kind = Kind::Answer;
            break;
        default:
            return PackageResult::Err(ProtocolFailure::Decode("Signaling package has no kind"));
    }
    if (message.session_token().size() != kSessionTokenBytes) {
        return PackageResult::Err(
            ProtocolFailure::Decode(
                compat::format("Session token must be {} bytes, got {}",
                               kSessionTokenBytes, message.session_token().size())));
    }
    if (message.endpoint_id().empty()) {
        return PackageResult::Err(ProtocolFailure::Decode("Signaling package has no endpoint id"));
    }

    package.session_token.assign(message.session_token().begin(), message.session_token().end());
    package.endpoint_id = message.endpoint_id();
    package.candidates.assign(message.candidates().begin(), message.candidates().end());
    return PackageResult::Ok(std::move(package));
}

}
