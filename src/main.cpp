#include "deck_config.hpp"
#include "digest.hpp"
#include "draw_error.hpp"
#include "draw_observer.hpp"
#include "draw_session.hpp"
#include "secret.hpp"
#include "transcript_log.hpp"

#include <cstddef>
#include <exception>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

using namespace fd;

namespace {

std::string cardLabel(CardId card, std::size_t deckSize) {
    if (deckSize != kDefaultDeckSize) {
        return "#" + std::to_string(card);
    }
    static const char* const kRanks[] = { "A", "2", "3", "4", "5", "6", "7", "8", "9", "10", "J", "Q", "K" };
    static const char* const kSuits[] = { "clubs", "diamonds", "hearts", "spades" };
    return std::string(kRanks[card % 13]) + " of " + kSuits[card / 13];
}

void printReveal(const DrawSession& session, const TranscriptRecorder& recorder) {
    auto digest = session.committedDigest();
    auto secret = session.disclosedSecret();
    std::cout << "\n=== PROVABLY FAIR REVEAL (round " << session.roundNumber() << ") ===\n";
    std::cout << "Deck size: " << session.deckSize() << "\n";
    if (digest) {
        std::cout << "Commitment: " << toHex(*digest) << "\n";
    }
    if (secret) {
        std::cout << "Secret: " << toHex(*secret) << "\n";
        bool ok = verifyCommitment(*secret, *digest) &&
                  verifyDraws(*secret, session.deckSize(), session.drawnCards());
        std::cout << "Recomputed permutation matches draws: " << (ok ? "valid" : "INVALID") << "\n";
    }
    std::cout << "Transcript Merkle root: " << recorder.log().merkleRoot() << "\n";
    std::cout << "Share secret, deck size and draws to let others run audit_draws.\n";
}

} // namespace

int main() {
    DeckConfig cfg;
    try {
        cfg = loadDeckConfigFromEnv();
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        std::cerr << "Set FD_AUTHORITY (and optionally FD_DECK_SIZE) before starting.\n";
        return 1;
    }

    DrawSession session(cfg);
    auto recorder = std::make_shared<TranscriptRecorder>();
    session.addObserver(recorder);
    session.addObserver(std::make_shared<StreamObserver>(std::cout));

    std::cout << "fairdeck: commit-reveal card draws.\n";
    std::cout << "Authority: " << session.authority() << "  deck size: " << session.deckSize() << "\n";
    bool running = true;

    while (running) {
        recorder->clear();
        Bytes secret = generateSecret();
        session.commit(session.authority(), sha256(secret));
        std::cout << "\n----------------------------------------\n";
        std::cout << "Round " << session.roundNumber() << " committed. Publish this digest before play:\n  "
                  << toHex(*session.committedDigest()) << "\n";

        std::cout << "Your player name: ";
        std::string player;
        if (!(std::cin >> player)) {
            return 0;
        }

        session.reveal(session.authority(), secret);
        secureZero(secret.data(), secret.size());
        std::cout << "Secret revealed; the deck order is now fixed.\n";

        while (session.remaining() > 0) {
            std::cout << "\nCards left: " << session.remaining() << ". How many to draw (0 draws the rest): ";
            std::size_t count = 0;
            if (!(std::cin >> count)) {
                return 0;
            }
            if (count == 0 || count > session.remaining()) {
                count = session.remaining();
            }
            for (std::size_t i = 0; i < count; ++i) {
                CardId card = session.draw(player);
                std::cout << "  " << player << " drew " << cardLabel(card, session.deckSize()) << "\n";
            }
        }

        try {
            session.draw(player);
        } catch (const DrawError& err) {
            std::cout << "Further draw refused: " << err.what() << "\n";
        }

        printReveal(session, *recorder);
        session.reset(session.authority());

        std::cout << "\nPlay another round? [y/n]: ";
        std::string answer;
        if (!(std::cin >> answer) || answer.empty() || (answer[0] != 'y' && answer[0] != 'Y')) {
            running = false;
        }
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }

    std::cout << "\nRounds played: " << session.roundNumber() - 1 << "\n";
    return 0;
}
