#pragma once

#include "digest.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fd {

using CardId = std::uint32_t;
using Permutation = std::vector<CardId>;

// Loop indices are hashed as 4-byte big-endian integers, so the deck cannot exceed 2^32 cards.
constexpr std::uint64_t kMaxDeckSize = 1ULL << 32;

// Hash-chain step: SHA-256(secret || BE32(index)).
Digest indexDigest(const Bytes& secret, std::uint32_t index);

// Fisher-Yates over [0, deckSize) where the swap partner for position i is
// indexDigest(secret, i) read as a 256-bit big-endian integer, reduced mod (i + 1).
// Throws std::invalid_argument if deckSize exceeds kMaxDeckSize.
Permutation derivePermutation(const Bytes& secret, std::size_t deckSize);

bool isPermutation(const Permutation& sequence, std::size_t deckSize);

// True iff draws is a prefix of derivePermutation(secret, deckSize).
bool verifyDraws(const Bytes& secret, std::size_t deckSize, const std::vector<CardId>& draws);

} // namespace fd
