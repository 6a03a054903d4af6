#include "deck_config.hpp"

#include "permutation.hpp"
#include "text.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace fd {

namespace {

std::size_t parseDeckSize(const std::string& value) {
    bool digitsOnly = !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
    if (!digitsOnly) {
        throw std::runtime_error("FD_DECK_SIZE must be a positive decimal integer, got \"" + value + "\"");
    }

    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::runtime_error("FD_DECK_SIZE is out of range: " + value);
    }
    if (parsed == 0 || parsed > kMaxDeckSize) {
        throw std::runtime_error("FD_DECK_SIZE must be between 1 and 2^32, got " + value);
    }
    return static_cast<std::size_t>(parsed);
}

} // namespace

DeckConfig loadDeckConfigFromEnv() {
    DeckConfig cfg;

    auto deckEnv = readEnv("FD_DECK_SIZE");
    if (deckEnv) {
        cfg.deckSize = parseDeckSize(*deckEnv);
    }

    auto authorityEnv = readEnv("FD_AUTHORITY");
    if (!authorityEnv) {
        throw std::runtime_error("FD_AUTHORITY must name the round authority");
    }
    cfg.authority = *authorityEnv;
    if (cfg.authority.empty()) {
        throw std::runtime_error("FD_AUTHORITY is empty or whitespace");
    }
    return cfg;
}

} // namespace fd
