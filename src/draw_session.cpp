#include "draw_session.hpp"

#include "draw_error.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace fd {

namespace {

std::size_t validatedDeckSize(std::size_t deckSize) {
    if (deckSize == 0) {
        throw std::invalid_argument("deck size must be positive");
    }
    if (static_cast<std::uint64_t>(deckSize) > kMaxDeckSize) {
        throw std::invalid_argument("deck size exceeds the 32-bit index encoding");
    }
    return deckSize;
}

} // namespace

const char* toString(Phase phase) {
    switch (phase) {
    case Phase::IDLE:
        return "Idle";
    case Phase::COMMITTED:
        return "Committed";
    case Phase::REVEALED:
        return "Revealed";
    case Phase::DRAWING:
        return "Drawing";
    case Phase::EXHAUSTED:
        return "Exhausted";
    }
    return "Unknown";
}

DrawSession::DrawSession(const DeckConfig& cfg)
    : deckSize_(validatedDeckSize(cfg.deckSize))
    , guard_(cfg.authority)
    , round_()
    , roundNumber_(1) {}

void DrawSession::commit(const Principal& caller, const Digest& digest) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        guard_.authorize(caller, "commit");
        round_.ledger.commit(digest);
        enqueueLocked([digest](DrawObserver& observer) { observer.onCommitted(digest); });
    }
    deliverPending();
}

void DrawSession::reveal(const Principal& caller, const Bytes& secret) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        guard_.authorize(caller, "reveal");
        round_.permutation = round_.ledger.reveal(secret, deckSize_);
        enqueueLocked([secret](DrawObserver& observer) { observer.onRevealed(secret); });
    }
    deliverPending();
}

CardId DrawSession::draw(const Principal& caller) {
    CardId card = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!round_.permutation) {
            throw DrawError(DrawErrorCode::NOT_REVEALED, "no card can be drawn before the secret is revealed");
        }
        if (round_.cursor >= deckSize_) {
            throw DrawError(DrawErrorCode::DECK_EXHAUSTED, "all cards of this round have been drawn");
        }

        card = (*round_.permutation)[round_.cursor];
        ++round_.cursor;
        enqueueLocked([caller, card](DrawObserver& observer) { observer.onCardDrawn(caller, card); });
    }
    deliverPending();
    return card;
}

void DrawSession::reset(const Principal& caller) {
    std::lock_guard<std::mutex> lock(mutex_);
    guard_.authorize(caller, "reset");
    Phase current = phaseLocked();
    if (current != Phase::IDLE && current != Phase::EXHAUSTED) {
        throw DrawError(DrawErrorCode::ROUND_IN_PROGRESS,
                        std::string("cannot reset a round in phase ") + toString(current) + " with " +
                            std::to_string(deckSize_ - round_.cursor) + " cards left");
    }

    round_ = Round();
    ++roundNumber_;
}

std::size_t DrawSession::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deckSize_ - round_.cursor;
}

Permutation DrawSession::permutation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!round_.permutation) {
        return {};
    }
    return *round_.permutation;
}

Phase DrawSession::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phaseLocked();
}

std::optional<Digest> DrawSession::committedDigest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return round_.ledger.committedDigest();
}

std::optional<Bytes> DrawSession::disclosedSecret() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return round_.ledger.disclosedSecret();
}

std::vector<CardId> DrawSession::drawnCards() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!round_.permutation) {
        return {};
    }
    auto first = round_.permutation->begin();
    return std::vector<CardId>(first, first + static_cast<std::ptrdiff_t>(round_.cursor));
}

std::uint64_t DrawSession::roundNumber() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return roundNumber_;
}

void DrawSession::addObserver(DrawObserverPtr observer) {
    if (!observer) {
        throw std::invalid_argument("observer must not be null");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

void DrawSession::removeObserver(const DrawObserverPtr& observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

Phase DrawSession::phaseLocked() const {
    if (!round_.ledger.hasCommitment()) {
        return Phase::IDLE;
    }
    if (!round_.permutation) {
        return Phase::COMMITTED;
    }
    if (round_.cursor == deckSize_) {
        return Phase::EXHAUSTED;
    }
    return round_.cursor == 0 ? Phase::REVEALED : Phase::DRAWING;
}

void DrawSession::enqueueLocked(std::function<void(DrawObserver&)> deliver) {
    if (observers_.empty()) {
        return;
    }
    pending_.push_back(PendingEvent{ std::move(deliver), observers_, roundNumber_ });
}

void DrawSession::deliverPending() {
    // Runs without mutex_, so observers may call back into the session. Whichever thread holds
    // deliveryMutex_ drains everything queued so far, oldest first; a nested call from an
    // observer leaves its event to that drain.
    if (deliveringThread_.load() == std::this_thread::get_id()) {
        return;
    }
    std::lock_guard<std::mutex> delivery(deliveryMutex_);
    struct DeliveringScope {
        std::atomic<std::thread::id>& owner;
        explicit DeliveringScope(std::atomic<std::thread::id>& o)
            : owner(o) {
            owner.store(std::this_thread::get_id());
        }
        ~DeliveringScope() { owner.store(std::thread::id()); }
    } scope(deliveringThread_);

    while (true) {
        PendingEvent event;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_.empty()) {
                return;
            }
            event = std::move(pending_.front());
            pending_.pop_front();
        }

        // State is already committed; an observer failure must not surface as a failed operation.
        for (const auto& observer : event.observers) {
            try {
                event.deliver(*observer);
            } catch (const std::exception& ex) {
                std::cerr << "fairdeck: observer failed during round " << event.round << ": " << ex.what()
                          << '\n';
            } catch (...) {
                std::cerr << "fairdeck: unknown observer failure during round " << event.round << '\n';
            }
        }
    }
}

} // namespace fd
