#include "draw_error.hpp"

namespace fd {

namespace {

std::string formatMessage(DrawErrorCode code, const std::string& detail) {
    std::string message = toString(code);
    if (!detail.empty()) {
        message += ": ";
        message += detail;
    }
    return message;
}

} // namespace

const char* toString(DrawErrorCode code) {
    switch (code) {
    case DrawErrorCode::UNAUTHORIZED:
        return "Unauthorized";
    case DrawErrorCode::ALREADY_COMMITTED:
        return "AlreadyCommitted";
    case DrawErrorCode::NOT_COMMITTED:
        return "NotCommitted";
    case DrawErrorCode::ALREADY_REVEALED:
        return "AlreadyRevealed";
    case DrawErrorCode::SEED_MISMATCH:
        return "SeedMismatch";
    case DrawErrorCode::NOT_REVEALED:
        return "NotRevealed";
    case DrawErrorCode::DECK_EXHAUSTED:
        return "DeckExhausted";
    case DrawErrorCode::ROUND_IN_PROGRESS:
        return "RoundInProgress";
    }
    return "Unknown";
}

DrawError::DrawError(DrawErrorCode code, const std::string& detail)
    : std::runtime_error(formatMessage(code, detail))
    , code_(code) {}

} // namespace fd
