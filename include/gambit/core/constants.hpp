#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gambit {

inline constexpr uint32_t kWireVersion = 1;
inline constexpr uint32_t kBundleVersion = 1;
inline constexpr uint32_t kEnvelopeVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;
inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SignatureBytes = 64;

inline constexpr size_t kRootKeyBytes = 32;
inline constexpr size_t kChainKeyBytes = 32;
inline constexpr size_t kMessageKeyBytes = 32;
inline constexpr size_t kHeaderKeyBytes = 32;
inline constexpr size_t kBootstrapDhCount = 4;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

inline constexpr size_t kNoncePrefixBytes = 4;
inline constexpr size_t kNonceCounterBytes = 4;
inline constexpr size_t kNonceIndexBytes = 4;
inline constexpr uint64_t kMaxNonceCounter = 0xFFFFFFFFull;
inline constexpr uint64_t kMaxMessageIndex = 0xFFFFFFFFull;

inline constexpr size_t kSmallBufferThreshold = 1024;
inline constexpr size_t kOpenSslErrorBufferBytes = 256;
inline constexpr size_t kSessionTokenBytes = 16;
inline constexpr size_t kFingerprintBytes = 8;

inline constexpr std::string_view kBootstrapInfo = "Gambit-Bootstrap-v1";
inline constexpr std::string_view kHeaderKeyInfo = "Gambit-HeaderKey";
inline constexpr std::string_view kLowToHighChainInfo = "Gambit-Chain-LowToHigh";
inline constexpr std::string_view kHighToLowChainInfo = "Gambit-Chain-HighToLow";
inline constexpr std::string_view kChainInfo = "Gambit-Chain";
inline constexpr std::string_view kMessageInfo = "Gambit-Msg";

inline constexpr std::string_view kPurposeIdentityX25519 = "identity-x25519";
inline constexpr std::string_view kPurposeSignedPreKey = "signed-pre-key";

struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view REFLECTION_ATTACK = "Potential reflection attack detected - peer echoed our identity key";
    static constexpr std::string_view SIGNED_PRE_KEY_FAILED = "Signed pre-key signature verification failed";
    static constexpr std::string_view SESSION_EXISTS = "Encryption session already established for peer";
    static constexpr std::string_view NO_SESSION = "No encryption session for peer";
    static constexpr std::string_view NOT_CONNECTED = "Transport is not connected";
    static constexpr std::string_view NOT_ACTIVE = "Game session is not active";
};

}
