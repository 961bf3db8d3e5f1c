#pragma once

#include "access_control.hpp"
#include "admin_gateway.hpp"
#include "gift_distributor.hpp"
#include "round_engine.hpp"
#include "token_ledger.hpp"

#include <string>
#include <vector>

namespace lf {

struct PlatformConfig {
    LedgerConfig ledger;
    RoundConfig round;
    GiftConfig gifts;
    AdminConfig admin;

    // Domain separation for VRF inputs; "default" is rejected.
    std::string deploymentId = "local";
    std::string chainId;

    Address owner = "lf:owner";
    Address engineAccount = "lf:engine";
    Address giftAccount = "lf:gift-reserve";
    Address creator = "lf:creator";
    // Only this principal may deliver oracle callbacks.
    Address randomnessCoordinator = "lf:vrf-coordinator";

    std::vector<GenesisAllocation> genesis;
};

// LF_DEPLOYMENT_ID, LF_CHAIN_ID, LF_ROUND_DURATION (seconds),
// LF_MIN_STAKE_DURATION (seconds), LF_MAX_PAYOUT_PER_ROUND (tokens),
// LF_HOUSE_EDGE_BPS. Unset variables leave the field alone; malformed values
// throw std::invalid_argument.
void applyEnvironmentOverrides(PlatformConfig& cfg);

// Throws std::invalid_argument naming the first inconsistent setting.
void validateConfig(const PlatformConfig& cfg);

} // namespace lf
