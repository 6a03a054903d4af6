#include "digest.hpp"
#include "permutation.hpp"

#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<fd::CardId> parseDraws(const std::string& csv) {
    std::vector<fd::CardId> draws;
    std::istringstream iss(csv);
    std::string token;
    while (std::getline(iss, token, ',')) {
        if (token.empty()) {
            continue;
        }
        unsigned long long value = std::stoull(token);
        if (value > 0xffffffffULL) {
            throw std::out_of_range("card id out of range: " + token);
        }
        draws.push_back(static_cast<fd::CardId>(value));
    }
    return draws;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: audit_draws <secretHex> <deckSize> [commitmentHex] [draw,draw,...]\n";
        return 1;
    }

    fd::Bytes secret;
    std::size_t deckSize = 0;
    try {
        secret = fd::hexToBytes(argv[1]);
        deckSize = static_cast<std::size_t>(std::stoull(argv[2]));
    } catch (const std::exception& ex) {
        std::cerr << "Invalid argument: " << ex.what() << '\n';
        return 1;
    }
    if (deckSize == 0 || deckSize > fd::kMaxDeckSize) {
        std::cerr << "Deck size must be between 1 and 2^32\n";
        return 1;
    }

    bool ok = true;
    fd::Permutation permutation = fd::derivePermutation(secret, deckSize);
    std::cout << "Commitment (sha256 of secret): " << fd::toHex(fd::sha256(secret)) << '\n';
    std::cout << "Permutation:";
    for (auto card : permutation) {
        std::cout << ' ' << card;
    }
    std::cout << '\n';

    if (argc > 3) {
        try {
            bool bound = fd::verifyCommitment(secret, fd::digestFromHex(argv[3]));
            std::cout << "Commitment check: " << (bound ? "valid" : "INVALID") << '\n';
            ok = ok && bound;
        } catch (const std::exception& ex) {
            std::cerr << "Commitment must be 64 hex characters: " << ex.what() << '\n';
            return 1;
        }
    }

    if (argc > 4) {
        std::vector<fd::CardId> draws;
        try {
            draws = parseDraws(argv[4]);
        } catch (const std::exception& ex) {
            std::cerr << "Draws must be comma-separated card ids: " << ex.what() << '\n';
            return 1;
        }
        bool matches = fd::verifyDraws(secret, deckSize, draws);
        std::cout << "Draw sequence (" << draws.size() << " cards): " << (matches ? "valid" : "INVALID")
                  << '\n';
        ok = ok && matches;
    }

    return ok ? 0 : 2;
}
