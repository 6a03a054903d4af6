#include "secret.hpp"

#include <stdexcept>
#include <utility>

#include <sodium.h>

namespace fd {

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

void secureZero(void* ptr, std::size_t numBytes) {
    if (ptr == nullptr || numBytes == 0) {
        return;
    }

    sodium_memzero(ptr, numBytes);
}

SecureBuffer::SecureBuffer(const Bytes& bytes)
    : buffer_(bytes) {}

SecureBuffer::~SecureBuffer() {
    wipe();
}

SecureBuffer::SecureBuffer(SecureBuffer&& other) noexcept
    : buffer_(std::move(other.buffer_)) {
    other.buffer_.clear();
}

SecureBuffer& SecureBuffer::operator=(SecureBuffer&& other) noexcept {
    if (this != &other) {
        wipe();
        buffer_ = std::move(other.buffer_);
        other.buffer_.clear();
    }
    return *this;
}

void SecureBuffer::assign(const Bytes& bytes) {
    SecureBuffer replacement(bytes);
    *this = std::move(replacement);
}

void SecureBuffer::wipe() {
    secureZero(buffer_.data(), buffer_.size());
    buffer_.clear();
}

Bytes generateSecret(std::size_t numBytes) {
    if (numBytes == 0) {
        throw std::invalid_argument("secret length must be positive");
    }
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }

    Bytes buffer(numBytes);
    randombytes_buf(buffer.data(), buffer.size());
    return buffer;
}

} // namespace fd
