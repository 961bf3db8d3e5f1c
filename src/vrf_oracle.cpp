#include "vrf_oracle.hpp"

#include "errors.hpp"

#include "picosha2.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <sodium.h>

namespace lf {

#ifndef crypto_vrf_PROOFBYTES
#error "libsodium must provide crypto_vrf_* support (version >= 1.0.18)"
#endif

namespace {

constexpr std::string_view kVrfDomainTag = "lucky-five:vrf:v1";

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

std::string bytesToHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::vector<unsigned char> hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }
    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            throw std::invalid_argument("hex string contains a non-hex character");
        }
        out.push_back(static_cast<unsigned char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

std::string buildDeploymentScope(const std::string& deploymentId, const std::string& chainId) {
    if (deploymentId.empty()) {
        throw std::invalid_argument("deploymentId must not be empty for VRF domain separation");
    }
    if (chainId.empty()) {
        return deploymentId;
    }
    return deploymentId + "|" + chainId;
}

} // namespace

VrfRandomnessBackend::VrfRandomnessBackend(std::string secretKeyHex,
                                           std::string publicKeyHex,
                                           std::string deploymentId,
                                           std::string chainId)
    : deploymentId_(std::move(deploymentId))
    , chainId_(std::move(chainId))
    , publicKeyHex_(std::move(publicKeyHex)) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    buildDeploymentScope(deploymentId_, chainId_);

    auto secretBytes = hexToBytes(secretKeyHex);
    secureWipe(secretKeyHex);
    if (secretBytes.size() != crypto_vrf_SECRETKEYBYTES) {
        secureZero(secretBytes.data(), secretBytes.size());
        throw std::invalid_argument("VRF secret key length invalid");
    }
    secretKey_.assign(secretBytes);
    secureZero(secretBytes.data(), secretBytes.size());

    auto publicKey = hexToBytes(publicKeyHex_);
    if (publicKey.size() != crypto_vrf_PUBLICKEYBYTES) {
        throw std::invalid_argument("VRF public key length invalid");
    }
    std::vector<unsigned char> derived(crypto_vrf_PUBLICKEYBYTES);
    crypto_vrf_sk_to_pk(derived.data(), secretKey_.data());
    if (!std::equal(derived.begin(), derived.end(), publicKey.begin())) {
        throw std::invalid_argument("VRF public key does not match the secret key");
    }
}

void VrfRandomnessBackend::submit(RequestId id, std::size_t numValues) {
    pending_[id] = numValues;
}

std::vector<RequestId> VrfRandomnessBackend::pendingIds() const {
    std::vector<RequestId> ids;
    ids.reserve(pending_.size());
    for (const auto& entry : pending_) {
        ids.push_back(entry.first);
    }
    return ids;
}

VrfFulfillment VrfRandomnessBackend::fulfill(RequestId id) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        throw LottoError(ErrorCode::InvalidRequest, "no pending VRF request " + std::to_string(id));
    }

    VrfFulfillment out;
    out.requestId = id;
    out.alpha = buildAlpha(deploymentId_, chainId_, id);

    std::vector<unsigned char> proof(crypto_vrf_PROOFBYTES);
    if (crypto_vrf_prove(proof.data(),
                         secretKey_.data(),
                         reinterpret_cast<const unsigned char*>(out.alpha.data()),
                         out.alpha.size()) != 0) {
        throw std::runtime_error("VRF prove failed");
    }
    std::vector<unsigned char> output(crypto_vrf_OUTPUTBYTES);
    if (crypto_vrf_proof_to_hash(output.data(), proof.data()) != 0) {
        throw std::runtime_error("VRF hash extraction failed");
    }

    out.proofHex = bytesToHex(proof.data(), proof.size());
    out.outputHex = bytesToHex(output.data(), output.size());
    if (!verify(out.proofHex, out.outputHex, publicKeyHex_, out.alpha)) {
        throw std::runtime_error("VRF proof does not verify with the configured public key");
    }
    out.values = expandOutput(out.outputHex, it->second);
    pending_.erase(it);
    return out;
}

std::string VrfRandomnessBackend::buildAlpha(const std::string& deploymentId,
                                             const std::string& chainId,
                                             RequestId id) {
    std::ostringstream oss;
    oss << kVrfDomainTag << "|" << buildDeploymentScope(deploymentId, chainId) << "|" << id;
    return oss.str();
}

bool VrfRandomnessBackend::verify(const std::string& proofHex,
                                  const std::string& outputHex,
                                  const std::string& publicKeyHex,
                                  const std::string& alpha) {
    if (!ensureSodiumReady()) {
        return false;
    }
    try {
        auto proof = hexToBytes(proofHex);
        auto output = hexToBytes(outputHex);
        auto publicKey = hexToBytes(publicKeyHex);
        if (proof.size() != crypto_vrf_PROOFBYTES ||
            output.size() != crypto_vrf_OUTPUTBYTES ||
            publicKey.size() != crypto_vrf_PUBLICKEYBYTES) {
            return false;
        }

        std::vector<unsigned char> recomputed(crypto_vrf_OUTPUTBYTES);
        if (crypto_vrf_verify(recomputed.data(),
                              publicKey.data(),
                              proof.data(),
                              reinterpret_cast<const unsigned char*>(alpha.data()),
                              alpha.size()) != 0) {
            return false;
        }
        return std::equal(recomputed.begin(), recomputed.end(), output.begin());
    } catch (const std::invalid_argument&) {
        return false;
    }
}

std::vector<RandomWord> VrfRandomnessBackend::expandOutput(const std::string& outputHex, std::size_t count) {
    std::vector<RandomWord> words;
    words.reserve(count);
    for (std::size_t counter = 0; counter < count; ++counter) {
        std::string input = outputHex + ":" + std::to_string(counter);
        std::array<unsigned char, 32> digest{};
        picosha2::hash256(input.begin(), input.end(), digest.begin(), digest.end());
        RandomWord word;
        boost::multiprecision::import_bits(word, digest.begin(), digest.end(), 8);
        words.push_back(word);
    }
    return words;
}

VrfKeyPair generateVrfKeypair() {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }

    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    crypto_vrf_keypair(publicKey.data(), secretKey.data());

    VrfKeyPair pair{
        bytesToHex(publicKey.data(), publicKey.size()),
        bytesToHex(secretKey.data(), secretKey.size()),
    };
    secureZero(secretKey.data(), secretKey.size());
    return pair;
}

VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }

    auto seed = hexToBytes(seedHex);
    if (seed.size() != crypto_vrf_SEEDBYTES) {
        throw std::invalid_argument("Seed must decode to crypto_vrf_SEEDBYTES bytes");
    }

    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    if (crypto_vrf_keypair_from_seed(publicKey.data(), secretKey.data(), seed.data()) != 0) {
        secureZero(seed.data(), seed.size());
        throw std::runtime_error("Failed to derive VRF keypair from seed");
    }
    secureZero(seed.data(), seed.size());

    VrfKeyPair pair{
        bytesToHex(publicKey.data(), publicKey.size()),
        bytesToHex(secretKey.data(), secretKey.size()),
    };
    secureZero(secretKey.data(), secretKey.size());
    return pair;
}

std::string generateVrfSeed() {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
    std::vector<unsigned char> seed(crypto_vrf_SEEDBYTES);
    randombytes_buf(seed.data(), seed.size());
    std::string hex = bytesToHex(seed.data(), seed.size());
    secureZero(seed.data(), seed.size());
    return hex;
}

} // namespace lf
