#pragma once

#include "access_guard.hpp"
#include "commitment_ledger.hpp"
#include "deck_config.hpp"
#include "draw_observer.hpp"
#include "permutation.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace fd {

enum class Phase {
    IDLE,
    COMMITTED,
    REVEALED,
    DRAWING,
    EXHAUSTED
};

const char* toString(Phase phase);

// One round of play. The permutation exists only after a successful reveal.
struct Round {
    CommitmentLedger ledger;
    std::optional<Permutation> permutation;
    std::size_t cursor = 0;
};

// Serialized commit/reveal/draw/reset state machine over a single round.
class DrawSession {
public:
    // Throws std::invalid_argument for a zero or oversized deck or an empty authority.
    explicit DrawSession(const DeckConfig& cfg);

    void commit(const Principal& caller, const Digest& digest);
    void reveal(const Principal& caller, const Bytes& secret);
    CardId draw(const Principal& caller);

    // Allowed only before a commitment or once every card has been drawn.
    void reset(const Principal& caller);

    std::size_t remaining() const;
    Permutation permutation() const;
    Phase phase() const;

    std::optional<Digest> committedDigest() const;
    // Unwiped copy; see CommitmentLedger::disclosedSecret.
    std::optional<Bytes> disclosedSecret() const;
    std::vector<CardId> drawnCards() const;
    std::uint64_t roundNumber() const;

    std::size_t deckSize() const { return deckSize_; }
    const Principal& authority() const { return guard_.authority(); }

    void addObserver(DrawObserverPtr observer);
    void removeObserver(const DrawObserverPtr& observer);

private:
    struct PendingEvent {
        std::function<void(DrawObserver&)> deliver;
        std::vector<DrawObserverPtr> observers;
        std::uint64_t round = 0;
    };

    Phase phaseLocked() const;

    // Caller holds mutex_.
    void enqueueLocked(std::function<void(DrawObserver&)> deliver);
    void deliverPending();

    const std::size_t deckSize_;
    const AccessGuard guard_;

    mutable std::mutex mutex_;
    Round round_;
    std::uint64_t roundNumber_;
    std::vector<DrawObserverPtr> observers_;
    std::deque<PendingEvent> pending_;

    // Serializes delivery so events reach observers in the order they were queued.
    std::mutex deliveryMutex_;
    std::atomic<std::thread::id> deliveringThread_{ std::thread::id() };
};

} // namespace fd
