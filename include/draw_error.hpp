#pragma once

#include <stdexcept>
#include <string>

namespace fd {

enum class DrawErrorCode {
    UNAUTHORIZED,
    ALREADY_COMMITTED,
    NOT_COMMITTED,
    ALREADY_REVEALED,
    SEED_MISMATCH,
    NOT_REVEALED,
    DECK_EXHAUSTED,
    ROUND_IN_PROGRESS
};

const char* toString(DrawErrorCode code);

// Precondition violation raised by the session. State is untouched when this is thrown.
class DrawError : public std::runtime_error {
public:
    DrawError(DrawErrorCode code, const std::string& detail);

    DrawErrorCode code() const noexcept { return code_; }

private:
    DrawErrorCode code_;
};

} // namespace fd
