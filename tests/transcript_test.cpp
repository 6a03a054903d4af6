#include "digest.hpp"
#include "draw_session.hpp"
#include "transcript_log.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "transcript_test failure: " << msg << std::endl;
    std::exit(1);
}

} // namespace

int main() {
    using namespace fd;

    TranscriptLog empty;
    if (!empty.merkleRoot().empty() || !empty.merkleProof(0).empty()) {
        fail("empty transcript must have no root and no proofs");
    }

    TranscriptLog single;
    single.append("only");
    if (single.merkleRoot() != TranscriptLog::hashEvent("only")) {
        fail("single-leaf root must equal the leaf hash");
    }

    TranscriptLog abc;
    abc.append("a");
    abc.append("b");
    abc.append("c");
    if (abc.merkleRoot() != "0bdf27bf7ec894ca7cadfe491ec1a3ece840f117989e8c5e9bd7086467bf6c38") {
        fail("three-leaf root must pair the odd leaf with itself");
    }

    TranscriptLog log;
    for (int i = 0; i < 7; ++i) {
        log.append("event-" + std::to_string(i));
    }
    const std::string root = log.merkleRoot();
    for (std::size_t i = 0; i < log.size(); ++i) {
        auto proof = log.merkleProof(i);
        if (!TranscriptLog::verifyProof(log.leaf(i), i, proof, root)) {
            fail("proof for leaf " + std::to_string(i) + " does not verify");
        }
    }
    auto proof = log.merkleProof(2);
    if (TranscriptLog::verifyProof(log.leaf(3), 2, proof, root)) {
        fail("proof verified for the wrong leaf");
    }
    proof[0] = TranscriptLog::hashEvent("forged");
    if (TranscriptLog::verifyProof(log.leaf(2), 2, proof, root)) {
        fail("tampered proof verified");
    }
    if (!log.leaf(log.size()).empty()) {
        fail("out-of-range leaf must be empty");
    }

    // A live session and the offline reconstruction must agree on the root.
    DeckConfig cfg;
    cfg.deckSize = 6;
    cfg.authority = "house";
    DrawSession session(cfg);
    auto recorder = std::make_shared<TranscriptRecorder>();
    session.addObserver(recorder);

    const Bytes secret = bytesFromString("transcript-round");
    session.commit("house", sha256(secret));
    session.reveal("house", secret);
    for (int i = 0; i < 4; ++i) {
        session.draw("alice");
    }

    TranscriptLog rebuilt = buildRoundTranscript(secret, 6, 4, "alice");
    if (recorder->log().size() != 6 || rebuilt.leaves() != recorder->log().leaves()) {
        fail("recorded transcript differs from the offline reconstruction");
    }
    if (rebuilt.merkleRoot() != recorder->log().merkleRoot()) {
        fail("transcript roots diverged");
    }
    if (recorder->log().leaf(0) != TranscriptLog::hashEvent(committedEvent(sha256(secret)))) {
        fail("first transcript leaf must be the commitment");
    }

    bool overdrawRejected = false;
    try {
        buildRoundTranscript(secret, 6, 7, "alice");
    } catch (const std::invalid_argument&) {
        overdrawRejected = true;
    }
    if (!overdrawRejected) {
        fail("reconstruction must reject more draws than cards");
    }

    recorder->clear();
    if (recorder->log().size() != 0) {
        fail("clear must empty the recorder");
    }

    std::cout << "transcript_test passed" << std::endl;
    return 0;
}
