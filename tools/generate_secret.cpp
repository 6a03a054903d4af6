#include "digest.hpp"
#include "secret.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    int count = 1;
    if (argc > 1) {
        char* end = nullptr;
        long parsed = std::strtol(argv[1], &end, 10);
        if (end && *end == '\0' && parsed > 0) {
            count = static_cast<int>(parsed);
        } else {
            std::cerr << "Invalid count provided. Using default of 1.\n";
        }
    }

    try {
        for (int i = 0; i < count; ++i) {
            fd::Bytes secret = fd::generateSecret();
            std::cout << "secret=" << fd::toHex(secret) << " commitment=" << fd::toHex(fd::sha256(secret))
                      << '\n';
            fd::secureZero(secret.data(), secret.size());
        }
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    return 0;
}
