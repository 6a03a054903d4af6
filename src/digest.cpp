#include "digest.hpp"

#include "picosha2.h"
#include "secret.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <sodium.h>

namespace fd {

namespace {

int hexValue(unsigned char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    return std::tolower(ch) - 'a' + 10;
}

} // namespace

Digest sha256(const Bytes& data) {
    Digest out{};
    picosha2::hash256(data.begin(), data.end(), out.begin(), out.end());
    return out;
}

Digest sha256(const std::string& data) {
    Digest out{};
    picosha2::hash256(data.begin(), data.end(), out.begin(), out.end());
    return out;
}

std::string toHex(const Digest& digest) {
    return picosha2::bytes_to_hex_string(digest.begin(), digest.end());
}

std::string toHex(const Bytes& bytes) {
    return picosha2::bytes_to_hex_string(bytes.begin(), bytes.end());
}

Bytes hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }
    bool allHex = std::all_of(hex.begin(), hex.end(), [](unsigned char ch) {
        return std::isxdigit(ch) != 0;
    });
    if (!allHex) {
        throw std::invalid_argument("hex string contains non-hex characters");
    }

    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexValue(static_cast<unsigned char>(hex[i]));
        int lo = hexValue(static_cast<unsigned char>(hex[i + 1]));
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

Digest digestFromHex(const std::string& hex) {
    Bytes raw = hexToBytes(hex);
    if (raw.size() != kDigestSize) {
        throw std::invalid_argument("digest must decode to 32 bytes");
    }
    Digest out{};
    std::copy(raw.begin(), raw.end(), out.begin());
    return out;
}

Bytes bytesFromString(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

bool digestEquals(const Digest& a, const Digest& b) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    return sodium_memcmp(a.data(), b.data(), kDigestSize) == 0;
}

bool verifyCommitment(const Bytes& secret, const Digest& digest) {
    return digestEquals(sha256(secret), digest);
}

} // namespace fd
