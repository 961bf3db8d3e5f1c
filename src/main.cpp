#include "config.hpp"
#include "errors.hpp"
#include "lotto_platform.hpp"
#include "vrf_oracle.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lf;

namespace {

void printHelp() {
    std::cout << "Commands:\n"
              << "  stake <account> <tokens>          lock tokens for eligibility\n"
              << "  unstake <account> <tokens>\n"
              << "  approve <account> <tokens>        let the engine and gift pool pull tokens\n"
              << "  bet <account> <n1,n2,n3,n4,n5> <tokens>\n"
              << "  advance <seconds>                 move the clock forward\n"
              << "  end                               close the current round and request randomness\n"
              << "  fulfill                           prove and deliver every pending VRF request\n"
              << "  claim <account> <round>           claim every winning bet of the account\n"
              << "  fund <account> <tokens>           add to the gift reserve\n"
              << "  gifts <round>                     distribute gifts for a drawn round\n"
              << "  status <account>\n"
              << "  round [id]\n"
              << "  help | quit\n";
}

void printAccount(const LottoPlatform& platform, const Address& account) {
    AccountSnapshot snap = platform.accountSnapshot(account);
    std::cout << account << ": balance " << formatTokens(snap.balance) << ", available "
              << formatTokens(snap.available) << ", staked " << formatTokens(snap.staked) << ", weight "
              << formatTokens(snap.stakingWeight) << (snap.eligibleForBenefits ? " (eligible)" : "") << "\n";
    std::cout << "  bets " << snap.stats.totalBets << ", wagered " << formatTokens(snap.stats.totalWagered)
              << ", won " << formatTokens(snap.stats.totalWinnings) << ", streak " << snap.stats.consecutiveRounds
              << (snap.stats.eligibleForGift ? " (gift eligible)" : "") << "\n";
}

void printRound(const LottoPlatform& platform, RoundId id) {
    Round r = platform.roundSnapshot(id);
    std::cout << "Round " << r.id << " [" << toString(platform.roundPhase(id)) << "] " << r.startTime << " -> "
              << r.endTime << "\n";
    std::cout << "  bets " << r.betCount << ", volume " << formatTokens(r.totalBetAmount) << ", prize pool "
              << formatTokens(r.totalPrizePool) << ", paid " << formatTokens(r.totalPaidOut) << "\n";
    if (r.drawn) {
        std::cout << "  winning numbers " << formatNumbers(r.winningNumbers)
                  << (r.emergencyDrawn ? " (emergency draw)" : "") << "\n";
    }
}

void fulfillPending(LottoPlatform& platform, VrfRandomnessBackend& vrf) {
    auto ids = vrf.pendingIds();
    if (ids.empty()) {
        std::cout << "No pending randomness requests.\n";
        return;
    }
    for (auto id : ids) {
        VrfFulfillment proof = vrf.fulfill(id);
        platform.deliverRandomness(platform.config().randomnessCoordinator, id, proof.values);

        std::cout << "\n=== VERIFIABLE DRAW REVEAL ===\n";
        std::cout << "Request: " << proof.requestId << "\n";
        std::cout << "VRF public key: " << vrf.publicKey() << "\n";
        std::cout << "VRF input (alpha): " << proof.alpha << "\n";
        std::cout << "VRF proof: " << proof.proofHex << "\n";
        std::cout << "VRF output: " << proof.outputHex << "\n";
        bool ok = VrfRandomnessBackend::verify(proof.proofHex, proof.outputHex, vrf.publicKey(), proof.alpha);
        std::cout << "VRF verification: " << (ok ? "valid" : "INVALID") << "\n";
        std::cout << "Winning numbers: " << formatNumbers(deriveWinningNumbers(proof.values)) << "\n";
        std::cout << "Share pk, proof, output and alpha so others can rerun lf_audit_draw.\n";
    }
}

} // namespace

int main() {
    PlatformConfig cfg;
    cfg.deploymentId = "local-cli";
    cfg.chainId = "offchain";
    try {
        applyEnvironmentOverrides(cfg);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }
    cfg.genesis = {
        { "alice", tokens(10'000) },
        { "bob", tokens(10'000) },
        { "carol", tokens(10'000) },
        { cfg.engineAccount, tokens(1'000'000) },
    };

    auto clock = std::make_shared<ManualClock>(1'700'000'000);
    VrfKeyPair houseKeys = generateVrfKeypair();
    auto vrf = std::make_shared<VrfRandomnessBackend>(houseKeys.secretKeyHex, houseKeys.publicKeyHex,
                                                      cfg.deploymentId, cfg.chainId);
    std::unique_ptr<LottoPlatform> platform;
    try {
        platform = std::make_unique<LottoPlatform>(cfg, clock, vrf);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    std::cout << "Welcome to Lucky Five: pick five of 1-49.\n";
    std::cout << "House VRF public key (commitment): " << vrf->publicKey() << "\n";
    std::cout << "Using deploymentId=" << cfg.deploymentId;
    if (!cfg.chainId.empty()) {
        std::cout << " chainId=" << cfg.chainId;
    }
    std::cout << " (set LF_DEPLOYMENT_ID/LF_CHAIN_ID to override)\n";
    std::cout << "Players alice, bob and carol start with 10000 tokens each.\n";
    printHelp();

    std::string line;
    while (std::cout << "\n> " && std::getline(std::cin, line)) {
        std::istringstream in(line);
        std::string command;
        if (!(in >> command)) {
            continue;
        }
        try {
            if (command == "quit" || command == "exit") {
                break;
            } else if (command == "help") {
                printHelp();
            } else if (command == "stake" || command == "unstake") {
                std::string account;
                std::string amount;
                in >> account >> amount;
                if (command == "stake") {
                    platform->stake(account, parseTokens(amount));
                } else {
                    platform->unstake(account, parseTokens(amount));
                }
                printAccount(*platform, account);
            } else if (command == "approve") {
                std::string account;
                std::string amount;
                in >> account >> amount;
                platform->approve(account, cfg.engineAccount, parseTokens(amount));
                platform->approve(account, cfg.giftAccount, parseTokens(amount));
                std::cout << "Approved.\n";
            } else if (command == "bet") {
                std::string account;
                std::string numbers;
                std::string amount;
                in >> account >> numbers >> amount;
                auto index = platform->placeBet(account, parseNumbers(numbers), parseTokens(amount));
                std::cout << "Bet #" << index << " placed in round " << platform->currentRoundId() << ".\n";
            } else if (command == "advance") {
                Timestamp seconds = 0;
                if (!(in >> seconds)) {
                    std::cout << "Usage: advance <seconds>\n";
                    continue;
                }
                clock->advance(seconds);
                std::cout << "Clock now " << clock->now() << ".\n";
            } else if (command == "end") {
                RequestId id = platform->endRound("console");
                std::cout << "Randomness request " << id << " issued; run 'fulfill' to deliver it.\n";
            } else if (command == "fulfill") {
                fulfillPending(*platform, *vrf);
            } else if (command == "claim") {
                std::string account;
                RoundId roundId = 0;
                in >> account >> roundId;
                std::vector<std::uint64_t> indices;
                for (const auto& b : platform->betsOf(roundId, account)) {
                    indices.push_back(b.index);
                }
                Amount paid = platform->claimWinnings(account, roundId, indices);
                std::cout << "Paid " << formatTokens(paid) << " tokens to " << account << ".\n";
            } else if (command == "fund") {
                std::string account;
                std::string amount;
                in >> account >> amount;
                platform->fundGiftReserve(account, parseTokens(amount));
                std::cout << "Gift reserve: " << formatTokens(platform->giftReserveBalance()) << " (cost per round "
                          << formatTokens(platform->giftCostPerRound()) << ").\n";
            } else if (command == "gifts") {
                RoundId roundId = 0;
                in >> roundId;
                auto recipients = platform->distributeGifts(cfg.owner, roundId);
                std::cout << "Gifts sent to the creator and " << recipients.size() << " player(s).\n";
                for (const auto& recipient : recipients) {
                    std::cout << "  " << recipient << "\n";
                }
            } else if (command == "status") {
                std::string account;
                in >> account;
                printAccount(*platform, account);
            } else if (command == "round") {
                RoundId id = platform->currentRoundId();
                RoundId requested = 0;
                if (in >> requested) {
                    id = requested;
                }
                printRound(*platform, id);
            } else {
                std::cout << "Unknown command. Type 'help'.\n";
            }
        } catch (const LottoError& ex) {
            std::cout << "Rejected (" << toString(ex.category()) << "): " << ex.what() << "\n";
        } catch (const std::invalid_argument& ex) {
            std::cout << "Invalid input: " << ex.what() << "\n";
        } catch (const std::runtime_error& ex) {
            std::cout << "Error: " << ex.what() << "\n";
        }
    }

    std::cout << "\nEvent log Merkle root: " << platform->eventLogRoot() << "\n";
    std::cout << "Thanks for playing.\n";
    return 0;
}
