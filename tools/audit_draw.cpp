#include "lottery_numbers.hpp"
#include "vrf_oracle.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 6) {
        std::cerr << "Usage: lf_audit_draw <vrfOutputHex> <vrfProofHex> <publicKeyHex> <requestId> <deploymentId> "
                     "[chainId]\n";
        return 1;
    }

    std::string vrfOutput = argv[1];
    std::string vrfProof = argv[2];
    std::string publicKey = argv[3];
    std::string deploymentId = argv[5];
    std::string chainId = (argc > 6) ? argv[6] : "";
    lf::RequestId requestId = 0;
    try {
        requestId = std::stoull(argv[4]);
    } catch (const std::exception& ex) {
        std::cerr << "Request id must be an unsigned integer: " << ex.what() << '\n';
        return 1;
    }

    std::string alpha;
    try {
        alpha = lf::VrfRandomnessBackend::buildAlpha(deploymentId, chainId, requestId);
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    bool ok = lf::VrfRandomnessBackend::verify(vrfProof, vrfOutput, publicKey, alpha);
    std::cout << "VRF input (alpha): " << alpha << '\n';
    std::cout << "VRF verification: " << (ok ? "valid" : "INVALID") << '\n';
    if (!ok) {
        return 2;
    }

    auto words = lf::VrfRandomnessBackend::expandOutput(vrfOutput, lf::kNumbersPerTicket);
    for (std::size_t i = 0; i < words.size(); ++i) {
        std::cout << "  word[" << i << "] = " << std::hex << words[i] << std::dec << '\n';
    }
    std::cout << "Winning numbers: " << lf::formatNumbers(lf::deriveWinningNumbers(words)) << '\n';
    return 0;
}
