#include "permutation.hpp"

#include "picosha2.h"

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace mp = boost::multiprecision;

namespace fd {

namespace {

void writeIndex(Bytes& buffer, std::size_t offset, std::uint32_t index) {
    buffer[offset] = static_cast<std::uint8_t>((index >> 24) & 0xff);
    buffer[offset + 1] = static_cast<std::uint8_t>((index >> 16) & 0xff);
    buffer[offset + 2] = static_cast<std::uint8_t>((index >> 8) & 0xff);
    buffer[offset + 3] = static_cast<std::uint8_t>(index & 0xff);
}

std::uint64_t reduceDigest(const Digest& digest, std::uint64_t modulus) {
    mp::uint256_t value = 0;
    mp::import_bits(value, digest.begin(), digest.end());
    mp::uint256_t reduced = value % mp::uint256_t(modulus);
    return reduced.convert_to<std::uint64_t>();
}

} // namespace

Digest indexDigest(const Bytes& secret, std::uint32_t index) {
    Bytes preimage(secret.size() + 4);
    std::copy(secret.begin(), secret.end(), preimage.begin());
    writeIndex(preimage, secret.size(), index);
    return sha256(preimage);
}

Permutation derivePermutation(const Bytes& secret, std::size_t deckSize) {
    if (static_cast<std::uint64_t>(deckSize) > kMaxDeckSize) {
        throw std::invalid_argument("deck size exceeds the 32-bit index encoding");
    }

    Permutation deck(deckSize);
    std::iota(deck.begin(), deck.end(), CardId{ 0 });
    if (deckSize <= 1) {
        return deck;
    }

    // One preimage buffer; only the trailing index bytes change per step.
    Bytes preimage(secret.size() + 4);
    std::copy(secret.begin(), secret.end(), preimage.begin());

    Digest digest{};
    for (std::size_t i = deckSize - 1; i >= 1; --i) {
        writeIndex(preimage, secret.size(), static_cast<std::uint32_t>(i));
        picosha2::hash256(preimage.begin(), preimage.end(), digest.begin(), digest.end());
        auto j = static_cast<std::size_t>(reduceDigest(digest, static_cast<std::uint64_t>(i) + 1));
        std::swap(deck[i], deck[j]);
    }
    return deck;
}

bool isPermutation(const Permutation& sequence, std::size_t deckSize) {
    if (sequence.size() != deckSize) {
        return false;
    }
    std::vector<bool> seen(deckSize, false);
    for (CardId card : sequence) {
        if (card >= deckSize || seen[card]) {
            return false;
        }
        seen[card] = true;
    }
    return true;
}

bool verifyDraws(const Bytes& secret, std::size_t deckSize, const std::vector<CardId>& draws) {
    if (draws.size() > deckSize || static_cast<std::uint64_t>(deckSize) > kMaxDeckSize) {
        return false;
    }
    Permutation expected = derivePermutation(secret, deckSize);
    return std::equal(draws.begin(), draws.end(), expected.begin());
}

} // namespace fd
