#pragma once

#include "amount.hpp"
#include "randomness_gateway.hpp"
#include "secure_memory.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace lf {

struct VrfKeyPair {
    std::string publicKeyHex;
    std::string secretKeyHex;
};

// Everything an outside auditor needs to recheck one draw.
struct VrfFulfillment {
    RequestId requestId = 0;
    std::string alpha;
    std::string proofHex;
    std::string outputHex;
    std::vector<RandomWord> values;
};

// Plays the oracle with libsodium's ECVRF. Each request id is proven under a
// deployment-scoped alpha, so outputs can neither be chosen nor replayed
// across deployments, and anyone holding the public key can verify them.
class VrfRandomnessBackend : public RandomnessBackend {
public:
    VrfRandomnessBackend(std::string secretKeyHex,
                         std::string publicKeyHex,
                         std::string deploymentId,
                         std::string chainId = {});

    void submit(RequestId id, std::size_t numValues) override;

    // Proves the pending request and forgets it. The caller delivers
    // fulfillment.values to the gateway.
    VrfFulfillment fulfill(RequestId id);

    bool hasPending(RequestId id) const { return pending_.count(id) != 0; }
    std::vector<RequestId> pendingIds() const;
    const std::string& publicKey() const { return publicKeyHex_; }
    const std::string& deploymentId() const { return deploymentId_; }
    const std::string& chainId() const { return chainId_; }

    static std::string buildAlpha(const std::string& deploymentId, const std::string& chainId, RequestId id);
    static bool verify(const std::string& proofHex,
                       const std::string& outputHex,
                       const std::string& publicKeyHex,
                       const std::string& alpha);
    // SHA-256("<outputHex>:<counter>") for counter = 0..count-1.
    static std::vector<RandomWord> expandOutput(const std::string& outputHex, std::size_t count);

private:
    std::string deploymentId_;
    std::string chainId_;
    std::string publicKeyHex_;
    SecretBytes secretKey_;
    std::map<RequestId, std::size_t> pending_;
};

VrfKeyPair generateVrfKeypair();
VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex);
// 32 bytes from libsodium's CSPRNG, hex encoded.
std::string generateVrfSeed();

} // namespace lf
