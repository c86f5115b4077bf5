#include "gambit/encryption/nonce.hpp"
#include "gambit/crypto/sodium_interop.hpp"
#include <algorithm>

namespace gambit::encryption {
    using crypto::SodiumInterop;

    namespace {
        constexpr size_t kNonceSize = kNoncePrefixBytes + kNonceCounterBytes + kNonceIndexBytes;
        static_assert(kNonceSize == kAesGcmNonceBytes, "Nonce layout must match AES-GCM nonce size");

        void WriteLittleEndian(std::vector<uint8_t>& out, const size_t offset, const uint32_t value) {
            for (size_t i = 0; i < 4; ++i) {
                out[offset + i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
            }
        }
    }

    NonceGenerator::NonceGenerator(State state)
        : state_(state) {
    }

    Result<NonceGenerator, ProtocolFailure> NonceGenerator::Create() {
        const auto prefix = SodiumInterop::GetRandomBytes(kNoncePrefixBytes);
        if (prefix.size() != kNoncePrefixBytes) {
            return Result<NonceGenerator, ProtocolFailure>::Err(
                ProtocolFailure::Generic("Failed to generate nonce prefix"));
        }
        State state;
        std::copy(prefix.begin(), prefix.end(), state.prefix.begin());
        return Result<NonceGenerator, ProtocolFailure>::Ok(NonceGenerator(state));
    }

    Result<NonceGenerator, ProtocolFailure> NonceGenerator::FromState(const State& state) {
        if (state.counter > kMaxNonceCounter) {
            return Result<NonceGenerator, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Nonce counter exceeds maximum"));
        }
        return Result<NonceGenerator, ProtocolFailure>::Ok(NonceGenerator(state));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> NonceGenerator::Next(const uint64_t message_index) {
        if (message_index > kMaxMessageIndex) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Message index exceeds nonce encoding limits"));
        }
        if (state_.counter > kMaxNonceCounter) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Nonce counter exhausted"));
        }

        std::vector<uint8_t> nonce(kNonceSize);
        std::copy(state_.prefix.begin(), state_.prefix.end(), nonce.begin());
        WriteLittleEndian(nonce, kNoncePrefixBytes, static_cast<uint32_t>(state_.counter));
        WriteLittleEndian(nonce, kNoncePrefixBytes + kNonceCounterBytes, static_cast<uint32_t>(message_index));

        ++state_.counter;
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(nonce));
    }

    NonceGenerator::State NonceGenerator::ExportState() const {
        return state_;
    }

}
