#pragma once
#include <string>
#include <string_view>
namespace gambit {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class ProtocolFailureType {
    Generic,
    KeyGeneration,
    DeriveKey,
    InvalidInput,
    PeerPubKey,
    Handshake,
    Decode,
    Encode,
    ObjectDisposed,
    ReplayAttack,
    InvalidState,
    Transport,
    IllegalMove,
    IntegrityViolation,
    ProtocolViolation,
    EncryptionUnavailable,
    DecryptionFailed,
    Teardown
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure PeerPubKey(std::string msg) {
        return {ProtocolFailureType::PeerPubKey, std::move(msg)};
    }
    static ProtocolFailure Handshake(std::string msg) {
        return {ProtocolFailureType::Handshake, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure ObjectDisposed(std::string msg) {
        return {ProtocolFailureType::ObjectDisposed, std::move(msg)};
    }
    static ProtocolFailure ReplayAttack(std::string msg) {
        return {ProtocolFailureType::ReplayAttack, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure Transport(std::string msg) {
        return {ProtocolFailureType::Transport, std::move(msg)};
    }
    static ProtocolFailure IllegalMove(std::string msg) {
        return {ProtocolFailureType::IllegalMove, std::move(msg)};
    }
    static ProtocolFailure IntegrityViolation(std::string msg) {
        return {ProtocolFailureType::IntegrityViolation, std::move(msg)};
    }
    static ProtocolFailure ProtocolViolation(std::string msg) {
        return {ProtocolFailureType::ProtocolViolation, std::move(msg)};
    }
    static ProtocolFailure EncryptionUnavailable(std::string msg) {
        return {ProtocolFailureType::EncryptionUnavailable, std::move(msg)};
    }
    static ProtocolFailure DecryptionFailed(std::string msg) {
        return {ProtocolFailureType::DecryptionFailed, std::move(msg)};
    }
    static ProtocolFailure Teardown(std::string msg) {
        return {ProtocolFailureType::Teardown, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};

/// Stable short name for a failure category, used in diagnostics and tests.
constexpr std::string_view ToString(const ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::Generic: return "Generic";
        case ProtocolFailureType::KeyGeneration: return "KeyGeneration";
        case ProtocolFailureType::DeriveKey: return "DeriveKey";
        case ProtocolFailureType::InvalidInput: return "InvalidInput";
        case ProtocolFailureType::PeerPubKey: return "PeerPubKey";
        case ProtocolFailureType::Handshake: return "Handshake";
        case ProtocolFailureType::Decode: return "Decode";
        case ProtocolFailureType::Encode: return "Encode";
        case ProtocolFailureType::ObjectDisposed: return "ObjectDisposed";
        case ProtocolFailureType::ReplayAttack: return "ReplayAttack";
        case ProtocolFailureType::InvalidState: return "InvalidState";
        case ProtocolFailureType::Transport: return "Transport";
        case ProtocolFailureType::IllegalMove: return "IllegalMove";
        case ProtocolFailureType::IntegrityViolation: return "IntegrityViolation";
        case ProtocolFailureType::ProtocolViolation: return "ProtocolViolation";
        case ProtocolFailureType::EncryptionUnavailable: return "EncryptionUnavailable";
        case ProtocolFailureType::DecryptionFailed: return "DecryptionFailed";
        case ProtocolFailureType::Teardown: return "Teardown";
    }
    return "Unknown";
}
}
