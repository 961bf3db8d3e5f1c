#include "config.hpp"

#include <cstdlib>
#include <limits>
#include <set>
#include <stdexcept>

namespace lf {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

bool readEnv(const char* name, std::string& out) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return false;
    }
    out = trim(env);
    return true;
}

std::uint64_t parseUnsigned(const char* name, const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(std::string(name) + " must be an unsigned integer, got \"" + text + "\"");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(name) + " is out of range: " + text);
    }
}

} // namespace

void applyEnvironmentOverrides(PlatformConfig& cfg) {
    std::string value;
    if (readEnv("LF_DEPLOYMENT_ID", value) && !value.empty()) {
        cfg.deploymentId = value;
    }
    if (readEnv("LF_CHAIN_ID", value)) {
        cfg.chainId = value;
    }
    if (readEnv("LF_ROUND_DURATION", value)) {
        cfg.round.roundDuration = parseUnsigned("LF_ROUND_DURATION", value);
    }
    if (readEnv("LF_MIN_STAKE_DURATION", value)) {
        cfg.ledger.minStakeDuration = parseUnsigned("LF_MIN_STAKE_DURATION", value);
    }
    if (readEnv("LF_MAX_PAYOUT_PER_ROUND", value)) {
        cfg.round.maxPayoutPerRound = parseTokens(value);
    }
    if (readEnv("LF_HOUSE_EDGE_BPS", value)) {
        std::uint64_t bps = parseUnsigned("LF_HOUSE_EDGE_BPS", value);
        if (bps > std::numeric_limits<std::uint32_t>::max()) {
            throw std::invalid_argument("LF_HOUSE_EDGE_BPS is out of range: " + value);
        }
        cfg.round.houseEdgeBps = static_cast<std::uint32_t>(bps);
    }
}

void validateConfig(const PlatformConfig& cfg) {
    if (cfg.deploymentId.empty()) {
        throw std::invalid_argument("deploymentId must not be empty (set LF_DEPLOYMENT_ID)");
    }
    if (cfg.deploymentId == "default") {
        throw std::invalid_argument(
            "deploymentId cannot be \"default\"; use an environment-specific value such as \"mainnet\"");
    }
    if (cfg.round.roundDuration == 0 || cfg.round.roundDuration > kMaxDuration) {
        throw std::invalid_argument("round duration must be positive and at most " + std::to_string(kMaxDuration) +
                                    " seconds");
    }
    if (cfg.ledger.minStakeDuration == 0 || cfg.ledger.minStakeDuration > kMaxDuration) {
        throw std::invalid_argument("minimum staking duration must be positive and at most " +
                                    std::to_string(kMaxDuration) + " seconds");
    }
    if (cfg.round.drawTimeout > kMaxDuration || cfg.gifts.giftCooldown > kMaxDuration ||
        cfg.admin.timelockDelay > kMaxDuration) {
        throw std::invalid_argument("draw timeout, gift cooldown and timelock delay are capped at " +
                                    std::to_string(kMaxDuration) + " seconds");
    }
    if (cfg.round.houseEdgeBps >= kBasisPoints) {
        throw std::invalid_argument("house edge must be below 10000 basis points");
    }
    if (cfg.round.minBet == 0 || cfg.round.minBet > cfg.round.maxBetPerUserPerRound) {
        throw std::invalid_argument("minimum bet must be positive and within the per-round maximum");
    }
    if (cfg.ledger.minStake == 0 || cfg.ledger.minStake > cfg.ledger.maxStakePerUser) {
        throw std::invalid_argument("minimum stake must be positive and within the per-user maximum");
    }
    if (cfg.ledger.boostFull <= cfg.ledger.boostStart) {
        throw std::invalid_argument("staking boost window must end after it starts");
    }
    if (cfg.round.consecutivePlayRequirement == 0) {
        throw std::invalid_argument("consecutive play requirement must be positive");
    }
    if (cfg.gifts.recipientsPerRound == 0 || cfg.gifts.creatorAmount == 0 || cfg.gifts.userAmount == 0) {
        throw std::invalid_argument("gift settings must be positive");
    }

    const Address* system[] = {
        &cfg.owner, &cfg.engineAccount, &cfg.giftAccount, &cfg.creator, &cfg.randomnessCoordinator,
    };
    std::set<Address> seen;
    for (const Address* account : system) {
        if (account->empty()) {
            throw std::invalid_argument("system account names must not be empty");
        }
        if (!seen.insert(*account).second) {
            throw std::invalid_argument("system account \"" + *account + "\" is used twice");
        }
    }
}

} // namespace lf
