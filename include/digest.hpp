#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fd {

constexpr std::size_t kDigestSize = 32;

using Bytes = std::vector<std::uint8_t>;
using Digest = std::array<std::uint8_t, kDigestSize>;

// SHA-256, the commitment hash and the hash-chain primitive.
Digest sha256(const Bytes& data);
Digest sha256(const std::string& data);

std::string toHex(const Digest& digest);
std::string toHex(const Bytes& bytes);

// Throws std::invalid_argument on odd length or non-hex characters.
Bytes hexToBytes(const std::string& hex);
Digest digestFromHex(const std::string& hex);

Bytes bytesFromString(const std::string& text);

// Constant-time comparison.
bool digestEquals(const Digest& a, const Digest& b);

// True iff sha256(secret) == digest.
bool verifyCommitment(const Bytes& secret, const Digest& digest);

} // namespace fd
