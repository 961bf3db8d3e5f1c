#include "errors.hpp"
#include "lotto_platform.hpp"
#include "vrf_oracle.hpp"

#include "test_support.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace lf;
using namespace lf::test;

namespace {

std::string fixedSeed() {
    return "000102030405060708090a0b0c0d0e0f000102030405060708090a0b0c0d0e0f";
}

VrfFulfillment proveOnce(const VrfKeyPair& keys, const std::string& deployment, RequestId id) {
    VrfRandomnessBackend backend(keys.secretKeyHex, keys.publicKeyHex, deployment);
    backend.submit(id, 5);
    return backend.fulfill(id);
}

void testSameRequestSameOutput() {
    VrfKeyPair keys = deriveVrfKeypairFromSeed(fixedSeed());
    VrfKeyPair again = deriveVrfKeypairFromSeed(fixedSeed());
    expect(keys.publicKeyHex == again.publicKeyHex, "seeded keypair is deterministic");

    VrfFulfillment first = proveOnce(keys, "test-suite", 7);
    VrfFulfillment second = proveOnce(keys, "test-suite", 7);
    expect(first.outputHex == second.outputHex, "same request id proves to the same output");
    expect(first.values == second.values, "same expanded words");
    expect(first.values.size() == 5, "one word per requested value");
    expect(VrfRandomnessBackend::verify(first.proofHex, first.outputHex, keys.publicKeyHex, first.alpha),
           "proof verifies with the public key");
    expect(deriveWinningNumbers(first.values) == deriveWinningNumbers(second.values), "same draw");
}

void testDomainSeparation() {
    VrfKeyPair keys = deriveVrfKeypairFromSeed(fixedSeed());
    expect(VrfRandomnessBackend::buildAlpha("mainnet", "", 3) != VrfRandomnessBackend::buildAlpha("testnet", "", 3),
           "deployment is part of the alpha");
    expect(VrfRandomnessBackend::buildAlpha("mainnet", "1", 3) != VrfRandomnessBackend::buildAlpha("mainnet", "", 3),
           "chain id is part of the alpha");

    VrfFulfillment mainnet = proveOnce(keys, "mainnet", 1);
    VrfFulfillment testnet = proveOnce(keys, "testnet", 1);
    expect(mainnet.outputHex != testnet.outputHex, "outputs do not replay across deployments");
    expect(!VrfRandomnessBackend::verify(mainnet.proofHex, mainnet.outputHex, keys.publicKeyHex, testnet.alpha),
           "a proof does not verify under another deployment's alpha");
}

void testTamperingFails() {
    VrfKeyPair keys = deriveVrfKeypairFromSeed(fixedSeed());
    VrfKeyPair other = generateVrfKeypair();
    VrfFulfillment f = proveOnce(keys, "test-suite", 2);

    std::string proof = f.proofHex;
    proof[10] = proof[10] == '0' ? '1' : '0';
    expect(!VrfRandomnessBackend::verify(proof, f.outputHex, keys.publicKeyHex, f.alpha), "flipped proof digit");

    std::string output = f.outputHex;
    output[0] = output[0] == 'a' ? 'b' : 'a';
    expect(!VrfRandomnessBackend::verify(f.proofHex, output, keys.publicKeyHex, f.alpha), "forged output");
    expect(!VrfRandomnessBackend::verify(f.proofHex, f.outputHex, other.publicKeyHex, f.alpha), "wrong key");
    expect(!VrfRandomnessBackend::verify("zz", f.outputHex, keys.publicKeyHex, f.alpha), "malformed hex");
}

void testBackendRejectsBadInput() {
    VrfKeyPair keys = deriveVrfKeypairFromSeed(fixedSeed());
    VrfKeyPair other = generateVrfKeypair();
    expectThrows<std::invalid_argument>(
        [&] { VrfRandomnessBackend b(keys.secretKeyHex, other.publicKeyHex, "test-suite"); }, "mismatched keypair");
    expectThrows<std::invalid_argument>(
        [&] { VrfRandomnessBackend b(keys.secretKeyHex, keys.publicKeyHex, ""); }, "empty deployment");
    expectThrows<std::invalid_argument>([&] { deriveVrfKeypairFromSeed("abcd"); }, "short seed");

    VrfRandomnessBackend backend(keys.secretKeyHex, keys.publicKeyHex, "test-suite");
    expectError(ErrorCode::InvalidRequest, [&] { backend.fulfill(99); }, "unknown request id");
    backend.submit(4, 5);
    backend.fulfill(4);
    expectError(ErrorCode::InvalidRequest, [&] { backend.fulfill(4); }, "request proven twice");
}

void testPlatformDrawThroughVrf() {
    VrfKeyPair keys = deriveVrfKeypairFromSeed(fixedSeed());
    PlatformConfig cfg = testConfig();
    auto backend = std::make_shared<VrfRandomnessBackend>(keys.secretKeyHex, keys.publicKeyHex, cfg.deploymentId);
    auto clock = std::make_shared<ManualClock>(kGenesisTime);
    LottoPlatform lotto(cfg, clock, backend);

    lotto.stake("alice", tokens(100));
    lotto.approve("alice", cfg.engineAccount, tokens(100));
    lotto.placeBet("alice", { 1, 2, 3, 4, 5 }, tokens(10));
    clock->set(lotto.roundSnapshot(1).endTime);
    RequestId id = lotto.endRound("keeper");
    expect(backend->hasPending(id), "draw request reached the VRF backend");

    VrfFulfillment f = backend->fulfill(id);
    expectError(ErrorCode::Unauthorized, [&] { lotto.deliverRandomness("alice", id, f.values); },
                "only the coordinator delivers");
    lotto.deliverRandomness(cfg.randomnessCoordinator, id, f.values);

    Round round = lotto.roundSnapshot(1);
    expect(round.drawn && !round.emergencyDrawn, "drawn by the oracle");
    expect(round.winningNumbers == deriveWinningNumbers(f.values), "numbers follow the proven output");
    expect(VrfRandomnessBackend::verify(f.proofHex, f.outputHex, backend->publicKey(),
                                        VrfRandomnessBackend::buildAlpha(cfg.deploymentId, cfg.chainId, id)),
           "draw auditable from public data");
    expect(lotto.outstandingRandomnessRequests() == 0, "request settled");
}

} // namespace

int main() {
    suiteName() = "vrf_determinism_tests";
    testSameRequestSameOutput();
    testDomainSeparation();
    testTamperingFails();
    testBackendRejectsBadInput();
    testPlatformDrawThroughVrf();
    std::cout << "VRF determinism checks passed.\n";
    return 0;
}
