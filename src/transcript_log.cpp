#include "transcript_log.hpp"

#include "permutation.hpp"

#include <stdexcept>
#include <utility>

namespace fd {

void TranscriptLog::append(const std::string& event) {
    leaves_.push_back(hashEvent(event));
}

std::string TranscriptLog::leaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string TranscriptLog::hashEvent(const std::string& event) {
    return toHex(sha256(event));
}

std::string TranscriptLog::hashPair(const std::string& left, const std::string& right) {
    return toHex(sha256(left + right));
}

std::string TranscriptLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }

    return layer.front();
}

std::vector<std::string> TranscriptLog::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::size_t siblingIndex = (index % 2 == 0) ? index + 1 : index - 1;
        proof.push_back(siblingIndex < layer.size() ? layer[siblingIndex] : layer[index]);

        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
        index /= 2;
    }

    return proof;
}

bool TranscriptLog::verifyProof(const std::string& leafHash,
                                std::size_t leafIndex,
                                const std::vector<std::string>& proof,
                                const std::string& root) {
    if (root.empty()) {
        return false;
    }
    std::string current = leafHash;
    std::size_t index = leafIndex;
    for (const auto& sibling : proof) {
        current = (index % 2 == 0) ? hashPair(current, sibling) : hashPair(sibling, current);
        index /= 2;
    }
    return index == 0 && current == root;
}

void TranscriptLog::clear() {
    leaves_.clear();
}

std::string committedEvent(const Digest& digest) {
    return "committed:" + toHex(digest);
}

std::string revealedEvent(const Bytes& secret) {
    return "revealed:" + toHex(secret);
}

std::string drawnEvent(const Principal& caller, CardId card) {
    return "drawn:" + caller + ":" + std::to_string(card);
}

void TranscriptRecorder::onCommitted(const Digest& digest) {
    log_.append(committedEvent(digest));
}

void TranscriptRecorder::onRevealed(const Bytes& secret) {
    log_.append(revealedEvent(secret));
}

void TranscriptRecorder::onCardDrawn(const Principal& caller, CardId card) {
    log_.append(drawnEvent(caller, card));
}

TranscriptLog buildRoundTranscript(const Bytes& secret,
                                   std::size_t deckSize,
                                   std::size_t drawCount,
                                   const Principal& caller) {
    if (drawCount > deckSize) {
        throw std::invalid_argument("draw count exceeds deck size");
    }

    TranscriptLog log;
    log.append(committedEvent(sha256(secret)));
    log.append(revealedEvent(secret));
    Permutation permutation = derivePermutation(secret, deckSize);
    for (std::size_t i = 0; i < drawCount; ++i) {
        log.append(drawnEvent(caller, permutation[i]));
    }
    return log;
}

} // namespace fd
