#include "gambit/crypto/sodium_secure_memory_handle.hpp"
#include "gambit/crypto/sodium_interop.hpp"
#include "gambit/core/constants.hpp"
#include "gambit/core/format.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace gambit::crypto {

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(const size_t size) {
    using HandleResult = Result<SecureMemoryHandle, SodiumFailure>;

    if (!SodiumInterop::IsInitialized()) {
        return HandleResult::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return HandleResult::Err(SodiumFailure::AllocationFailed("Secure allocation of zero bytes"));
    }
    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return HandleResult::Err(
            SodiumFailure::AllocationFailed(
                compat::format("{}{} bytes", ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
    }
    return HandleResult::Ok(SecureMemoryHandle(ptr, size));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::FromBytes(std::span<const uint8_t> data) {
    return Allocate(data.size()).Bind([data](SecureMemoryHandle handle) {
        if (auto written = handle.Write(data); written.IsErr()) {
            return Result<SecureMemoryHandle, SodiumFailure>::Err(std::move(written).UnwrapErr());
        }
        return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(handle));
    });
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Release();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(std::exchange(other.ptr_, nullptr))
    , size_(std::exchange(other.size_, 0)) {
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Release();
        ptr_ = std::exchange(other.ptr_, nullptr);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

void SecureMemoryHandle::Release() noexcept {
    // sodium_free wipes the region before unmapping it.
    if (ptr_ != nullptr) {
        SodiumInterop::FreeSecure(ptr_);
    }
    ptr_ = nullptr;
    size_ = 0;
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }
    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                compat::format("{} ({} into {})", ErrorMessages::DATA_EXCEEDS_BUFFER, data.size(), size_)));
    }

    auto* bytes = static_cast<uint8_t*>(ptr_);
    std::copy(data.begin(), data.end(), bytes);
    std::memset(bytes + data.size(), 0, size_ - data.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(const size_t size) const {
    using BytesResult = Result<std::vector<uint8_t>, SodiumFailure>;

    if (IsInvalid()) {
        return BytesResult::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }
    if (size > size_) {
        return BytesResult::Err(
            SodiumFailure::ReadOperationFailed(
                compat::format("{}{} of {} bytes requested", ErrorMessages::FAILED_TO_READ_SECURE_MEMORY,
                               size, size_)));
    }
    const auto* bytes = static_cast<const uint8_t*>(ptr_);
    return BytesResult::Ok(std::vector<uint8_t>(bytes, bytes + size));
}

}
