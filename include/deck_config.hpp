#pragma once

#include "access_guard.hpp"

#include <cstddef>

namespace fd {

constexpr std::size_t kDefaultDeckSize = 52;

// Construction-time settings; immutable once a session is built from them.
struct DeckConfig {
    std::size_t deckSize = kDefaultDeckSize;
    Principal authority;
};

// Reads FD_DECK_SIZE (optional, positive decimal) and FD_AUTHORITY (required).
// Throws std::runtime_error when a variable is missing or malformed.
DeckConfig loadDeckConfigFromEnv();

} // namespace fd
