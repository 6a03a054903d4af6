#include "draw_observer.hpp"

#include <ostream>

namespace fd {

StreamObserver::StreamObserver(std::ostream& out)
    : out_(out) {}

void StreamObserver::onCommitted(const Digest& digest) {
    out_ << "[committed] digest=" << toHex(digest) << '\n';
}

void StreamObserver::onRevealed(const Bytes& secret) {
    out_ << "[revealed] secret=" << toHex(secret) << '\n';
}

void StreamObserver::onCardDrawn(const Principal& caller, CardId card) {
    out_ << "[drawn] caller=" << caller << " card=" << card << '\n';
}

} // namespace fd
