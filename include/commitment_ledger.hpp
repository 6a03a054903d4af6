#pragma once

#include "digest.hpp"
#include "permutation.hpp"
#include "secret.hpp"

#include <cstddef>
#include <optional>

namespace fd {

// Holds the committed digest and, once disclosed, the secret bound to it.
class CommitmentLedger {
public:
    // Throws DrawError(ALREADY_COMMITTED) if a digest is already recorded.
    void commit(const Digest& digest);

    // Verifies the binding and derives the deck permutation from the secret.
    // Throws DrawError with NOT_COMMITTED, ALREADY_REVEALED or SEED_MISMATCH; nothing is
    // recorded unless the call returns.
    Permutation reveal(const Bytes& secret, std::size_t deckSize);

    bool hasCommitment() const { return committed_.has_value(); }
    bool isRevealed() const { return revealed_; }

    std::optional<Digest> committedDigest() const { return committed_; }
    // Returns a plain copy for publication and verification. The copy is not wiped; the
    // ledger's own buffer is wiped on clear() and destruction.
    std::optional<Bytes> disclosedSecret() const;

    void clear();

private:
    std::optional<Digest> committed_;
    SecureBuffer secret_;
    bool revealed_ = false;
};

} // namespace fd
