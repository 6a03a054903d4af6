#pragma once

#include "digest.hpp"

#include <cstddef>
#include <cstdint>

namespace fd {

bool ensureSodiumReady();

void secureZero(void* ptr, std::size_t numBytes);

// Move-only byte buffer that wipes itself with sodium_memzero on release.
class SecureBuffer {
public:
    SecureBuffer() = default;
    explicit SecureBuffer(const Bytes& bytes);
    ~SecureBuffer();

    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    SecureBuffer(SecureBuffer&& other) noexcept;
    SecureBuffer& operator=(SecureBuffer&& other) noexcept;

    void assign(const Bytes& bytes);
    void wipe();

    std::size_t size() const { return buffer_.size(); }
    bool empty() const { return buffer_.empty(); }
    const std::uint8_t* data() const { return buffer_.data(); }

    Bytes copy() const { return buffer_; }

private:
    Bytes buffer_;
};

// Authority secrets come from libsodium's CSPRNG.
Bytes generateSecret(std::size_t numBytes = 32);

} // namespace fd
