#include "digest.hpp"
#include "permutation.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "determinism failure: " << msg << std::endl;
    std::exit(1);
}

void expectPermutation(const std::string& secret, std::size_t deckSize, const fd::Permutation& expected) {
    auto actual = fd::derivePermutation(fd::bytesFromString(secret), deckSize);
    if (actual != expected) {
        fail("derive(\"" + secret + "\", " + std::to_string(deckSize) + ") diverged from the published vector");
    }
}

} // namespace

int main() {
    using namespace fd;

    // Known-answer vectors fix the hash-chain encoding for independent verifiers.
    if (toHex(sha256(bytesFromString("x"))) !=
        "2d711642b726b04401627ca9fbac32f5c8530fb1903cc4db02258717921a4881") {
        fail("sha256(\"x\") mismatch");
    }
    if (toHex(indexDigest(bytesFromString("x"), 3)) !=
        "d041ca9ce840e6906bf781d83bd2f9c9e552b943c10d7ac13014870f35a1d232") {
        fail("index digest must hash secret || big-endian uint32");
    }

    expectPermutation("x", 4, { 1, 0, 3, 2 });
    expectPermutation("fairdeck", 10, { 1, 6, 0, 5, 2, 9, 4, 8, 3, 7 });
    expectPermutation("x",
                      52,
                      { 1,  26, 17, 45, 20, 50, 0,  37, 13, 43, 49, 39, 12, 33, 28, 9,  42, 14,
                        11, 2,  25, 38, 48, 18, 6,  29, 35, 19, 32, 4,  34, 47, 40, 22, 27, 41,
                        10, 15, 51, 3,  21, 46, 7,  44, 24, 5,  16, 30, 23, 36, 31, 8 });

    if (!derivePermutation(bytesFromString("x"), 0).empty()) {
        fail("empty deck must yield an empty permutation");
    }
    if (derivePermutation(bytesFromString("x"), 1) != Permutation{ 0 }) {
        fail("single-card deck must yield [0]");
    }
    if (derivePermutation(Bytes{}, 3).size() != 3) {
        fail("empty secret must still produce a full permutation");
    }

    const std::vector<std::string> secrets{ "", "a", "round-seed", std::string(200, 'z') };
    for (const auto& text : secrets) {
        Bytes secret = bytesFromString(text);
        for (std::size_t n = 0; n <= 64; ++n) {
            auto first = derivePermutation(secret, n);
            auto second = derivePermutation(secret, n);
            if (first != second) {
                fail("derive is not deterministic for deck size " + std::to_string(n));
            }
            if (!isPermutation(first, n)) {
                fail("derive produced an invalid permutation for deck size " + std::to_string(n));
            }
        }
    }

    if (derivePermutation(bytesFromString("a"), 52) == derivePermutation(bytesFromString("b"), 52)) {
        fail("distinct secrets produced the same 52-card order");
    }

    if (isPermutation({ 0, 1, 1 }, 3) || isPermutation({ 0, 1, 3 }, 3) || isPermutation({ 0, 1 }, 3)) {
        fail("isPermutation accepted a non-permutation");
    }

    Bytes secret = bytesFromString("x");
    if (!verifyDraws(secret, 4, { 1, 0 }) || !verifyDraws(secret, 4, {}) || !verifyDraws(secret, 4, { 1, 0, 3, 2 })) {
        fail("verifyDraws rejected a genuine prefix");
    }
    if (verifyDraws(secret, 4, { 0, 1 }) || verifyDraws(secret, 4, { 1, 0, 3, 2, 0 })) {
        fail("verifyDraws accepted a tampered sequence");
    }

    if (sizeof(std::size_t) > 4) {
        bool rejected = false;
        try {
            derivePermutation(secret, static_cast<std::size_t>(kMaxDeckSize + 1));
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        if (!rejected) {
            fail("deck sizes beyond the 32-bit index encoding must be rejected");
        }
    }

    std::cout << "Determinism check passed." << std::endl;
    return 0;
}
