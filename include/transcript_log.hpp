#pragma once

#include "draw_observer.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace fd {

// Append-only log of round events. Leaves and interior nodes are hex SHA-256 strings; a node
// without a right sibling is paired with itself.
class TranscriptLog {
public:
    void append(const std::string& event);
    std::string leaf(std::size_t index) const;
    const std::vector<std::string>& leaves() const { return leaves_; }

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;

    static std::string hashEvent(const std::string& event);
    static bool verifyProof(const std::string& leafHash,
                            std::size_t leafIndex,
                            const std::vector<std::string>& proof,
                            const std::string& root);

    std::size_t size() const { return leaves_.size(); }
    void clear();

private:
    static std::string hashPair(const std::string& left, const std::string& right);

    std::vector<std::string> leaves_;
};

std::string committedEvent(const Digest& digest);
std::string revealedEvent(const Bytes& secret);
std::string drawnEvent(const Principal& caller, CardId card);

// Mirrors session events into a TranscriptLog.
class TranscriptRecorder : public DrawObserver {
public:
    void onCommitted(const Digest& digest) override;
    void onRevealed(const Bytes& secret) override;
    void onCardDrawn(const Principal& caller, CardId card) override;

    const TranscriptLog& log() const { return log_; }
    void clear() { log_.clear(); }

private:
    TranscriptLog log_;
};

// Offline reconstruction of a round where a single caller drew the first drawCount cards.
// Throws std::invalid_argument if drawCount exceeds deckSize.
TranscriptLog buildRoundTranscript(const Bytes& secret,
                                   std::size_t deckSize,
                                   std::size_t drawCount,
                                   const Principal& caller);

} // namespace fd
