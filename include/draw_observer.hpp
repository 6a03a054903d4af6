#pragma once

#include "access_guard.hpp"
#include "digest.hpp"
#include "permutation.hpp"

#include <iosfwd>
#include <memory>

namespace fd {

// Receives round events after the state change is committed, in event order and outside the
// session lock. Implementations may call back into the session; events raised from inside a
// callback are delivered after the current one finishes.
class DrawObserver {
public:
    virtual ~DrawObserver() = default;

    virtual void onCommitted(const Digest& digest) = 0;
    virtual void onRevealed(const Bytes& secret) = 0;
    virtual void onCardDrawn(const Principal& caller, CardId card) = 0;
};

using DrawObserverPtr = std::shared_ptr<DrawObserver>;

// One line per event, for CLIs.
class StreamObserver : public DrawObserver {
public:
    explicit StreamObserver(std::ostream& out);

    void onCommitted(const Digest& digest) override;
    void onRevealed(const Bytes& secret) override;
    void onCardDrawn(const Principal& caller, CardId card) override;

private:
    std::ostream& out_;
};

} // namespace fd
