#include "commitment_ledger.hpp"

#include "draw_error.hpp"

namespace fd {

void CommitmentLedger::commit(const Digest& digest) {
    if (committed_) {
        throw DrawError(DrawErrorCode::ALREADY_COMMITTED, "round already holds a commitment");
    }
    committed_ = digest;
}

Permutation CommitmentLedger::reveal(const Bytes& secret, std::size_t deckSize) {
    if (!committed_) {
        throw DrawError(DrawErrorCode::NOT_COMMITTED, "reveal requires a prior commitment");
    }
    if (revealed_) {
        throw DrawError(DrawErrorCode::ALREADY_REVEALED, "secret was already disclosed");
    }
    if (!verifyCommitment(secret, *committed_)) {
        throw DrawError(DrawErrorCode::SEED_MISMATCH,
                        "sha256(secret) does not match committed digest " + toHex(*committed_));
    }

    Permutation permutation = derivePermutation(secret, deckSize);
    secret_.assign(secret);
    revealed_ = true;
    return permutation;
}

std::optional<Bytes> CommitmentLedger::disclosedSecret() const {
    if (!revealed_) {
        return std::nullopt;
    }
    return secret_.copy();
}

void CommitmentLedger::clear() {
    committed_.reset();
    secret_.wipe();
    revealed_ = false;
}

} // namespace fd
