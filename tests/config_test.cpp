#include "deck_config.hpp"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

#include <stdlib.h>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "config_test failure: " << msg << std::endl;
    std::exit(1);
}

void setEnv(const char* name, const char* value) {
    if (value == nullptr) {
        unsetenv(name);
    } else {
        setenv(name, value, 1);
    }
}

bool rejects(const std::function<void()>& action) {
    try {
        action();
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    using namespace fd;

    setEnv("FD_DECK_SIZE", nullptr);
    setEnv("FD_AUTHORITY", nullptr);
    if (!rejects([] { loadDeckConfigFromEnv(); })) {
        fail("missing FD_AUTHORITY must be rejected");
    }

    setEnv("FD_AUTHORITY", "   ");
    if (!rejects([] { loadDeckConfigFromEnv(); })) {
        fail("blank FD_AUTHORITY must be rejected");
    }

    setEnv("FD_AUTHORITY", "  dealer-1 \n");
    DeckConfig cfg = loadDeckConfigFromEnv();
    if (cfg.authority != "dealer-1" || cfg.deckSize != kDefaultDeckSize) {
        fail("defaults or trimming wrong");
    }

    setEnv("FD_DECK_SIZE", " 10 ");
    if (loadDeckConfigFromEnv().deckSize != 10) {
        fail("FD_DECK_SIZE not honoured");
    }

    for (const char* bad : { "0", "-4", "ten", "", "12x", "4294967297", "99999999999999999999999" }) {
        setEnv("FD_DECK_SIZE", bad);
        if (!rejects([] { loadDeckConfigFromEnv(); })) {
            fail(std::string("FD_DECK_SIZE=\"") + bad + "\" must be rejected");
        }
    }

    setEnv("FD_DECK_SIZE", nullptr);
    setEnv("FD_AUTHORITY", nullptr);
    std::cout << "config_test passed" << std::endl;
    return 0;
}
