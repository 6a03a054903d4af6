#include "digest.hpp"
#include "secret.hpp"
#include "text.hpp"
#include "transcript_log.hpp"

#include <sodium.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

struct RoundPublication {
    std::string roundId;
    std::string deploymentId;
    std::string chainId;
    fd::Bytes secret;
    fd::TranscriptLog transcript;
};

// Signed message: deployment[:chain]:round:root.
std::string signingMessage(const RoundPublication& pub) {
    std::string message = pub.deploymentId + ":";
    if (!pub.chainId.empty()) {
        message += pub.chainId + ":";
    }
    return message + pub.roundId + ":" + pub.transcript.merkleRoot();
}

std::string toJson(const RoundPublication& pub, const fd::Bytes& signature, const fd::Bytes& publicKey) {
    std::ostringstream json;
    json << "{\n";
    json << "  \"round_id\": \"" << fd::jsonEscape(pub.roundId) << "\",\n";
    json << "  \"commitment\": \"" << fd::toHex(fd::sha256(pub.secret)) << "\",\n";
    json << "  \"secret\": \"" << fd::toHex(pub.secret) << "\",\n";
    json << "  \"events\": " << pub.transcript.size() << ",\n";
    json << "  \"merkle_root\": \"" << pub.transcript.merkleRoot() << "\",\n";
    json << "  \"deployment_id\": \"" << fd::jsonEscape(pub.deploymentId) << "\",\n";
    if (!pub.chainId.empty()) {
        json << "  \"chain_id\": \"" << fd::jsonEscape(pub.chainId) << "\",\n";
    }
    json << "  \"signature\": \"" << fd::toHex(signature) << "\",\n";
    json << "  \"public_key\": \"" << fd::toHex(publicKey) << "\"\n";
    json << "}\n";
    return json.str();
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 7) {
        std::cerr << "Usage: publish_round <round_id> <secret_hex> <deck_size> <draw_count> <caller> "
                     "<ed25519_secret_key_hex> [output.json]\n";
        std::cerr << "Environment: FD_DEPLOYMENT_ID is required; optional FD_CHAIN_ID adds chain scoping.\n";
        return 1;
    }

    if (!fd::ensureSodiumReady()) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    RoundPublication pub;
    fd::SecureBuffer signingKey;
    try {
        auto deploymentId = fd::readEnv("FD_DEPLOYMENT_ID");
        if (!deploymentId || deploymentId->empty()) {
            throw std::runtime_error("FD_DEPLOYMENT_ID must be set to a non-empty deployment scope; refusing to sign");
        }
        pub.roundId = argv[1];
        pub.deploymentId = *deploymentId;
        pub.chainId = fd::readEnv("FD_CHAIN_ID").value_or("");
        pub.secret = fd::hexToBytes(argv[2]);
        auto deckSize = static_cast<std::size_t>(std::stoull(argv[3]));
        auto drawCount = static_cast<std::size_t>(std::stoull(argv[4]));
        pub.transcript = fd::buildRoundTranscript(pub.secret, deckSize, drawCount, argv[5]);
        signingKey.assign(fd::hexToBytes(argv[6]));
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    if (signingKey.size() != crypto_sign_SECRETKEYBYTES) {
        std::cerr << "Secret key must be " << crypto_sign_SECRETKEYBYTES << " bytes (hex encoded)\n";
        return 1;
    }

    fd::Bytes publicKey(crypto_sign_PUBLICKEYBYTES);
    if (crypto_sign_ed25519_sk_to_pk(publicKey.data(), signingKey.data()) != 0) {
        std::cerr << "Unable to derive public key from secret key\n";
        return 1;
    }

    std::string message = signingMessage(pub);
    fd::Bytes signature(crypto_sign_BYTES);
    unsigned long long sigLen = 0;
    if (crypto_sign_detached(signature.data(),
                             &sigLen,
                             reinterpret_cast<const unsigned char*>(message.data()),
                             message.size(),
                             signingKey.data()) != 0) {
        std::cerr << "Signing failed\n";
        return 1;
    }
    signature.resize(static_cast<std::size_t>(sigLen));

    std::string payload = toJson(pub, signature, publicKey);
    if (argc < 8) {
        std::cout << payload;
        return 0;
    }
    std::ofstream ofs(argv[7]);
    if (!ofs || !(ofs << payload)) {
        std::cerr << "Unable to write output path: " << argv[7] << "\n";
        return 1;
    }
    return 0;
}
