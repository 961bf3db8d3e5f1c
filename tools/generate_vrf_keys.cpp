#include "vrf_oracle.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    std::string seed;
    try {
        seed = (argc > 1) ? std::string(argv[1]) : lf::generateVrfSeed();
        lf::VrfKeyPair keys = lf::deriveVrfKeypairFromSeed(seed);
        std::cout << "seed=" << seed << '\n';
        std::cout << "public=" << keys.publicKeyHex << '\n';
        std::cout << "secret=" << keys.secretKeyHex << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "Unable to derive VRF keys: " << ex.what() << '\n';
        std::cerr << "Usage: lf_generate_vrf_keys [seedHex(64 chars)]\n";
        return 1;
    }
    return 0;
}
