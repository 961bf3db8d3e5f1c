#pragma once

#include "access_control.hpp"
#include "amount.hpp"
#include "clock.hpp"
#include "event_log.hpp"
#include "reentrancy_guard.hpp"
#include "round_engine.hpp"
#include "token_ledger.hpp"

#include <cstdint>
#include <vector>

namespace lf {

struct GiftConfig {
    std::uint32_t recipientsPerRound = 10;
    Amount creatorAmount = tokens(100);
    Amount userAmount = tokens(10);
    // A recipient waits this long (in whole rounds) before the next gift.
    Timestamp giftCooldown = 21 * kDay;
};

// Post-draw rewards for the creator and for players on a consecutive-round
// streak, paid from a reserve held in the gift account.
class GiftDistributor {
public:
    GiftDistributor(GiftConfig cfg,
                    Address giftAccount,
                    Address creator,
                    const Clock& clock,
                    const AccessControl& access,
                    TokenLedger& ledger,
                    RoundEngine& engine,
                    EventLog& log);

    void fundReserve(const Address& funder, const Amount& amount);

    // Recipient selection, when the eligible set is too large, is seeded
    // from the already public winning numbers and the call time. Anyone can
    // precompute it before the call lands; it is not a secure lottery.
    std::vector<Address> distributeGifts(const Address& caller, RoundId roundId);

    void setGiftConfig(const Address& caller,
                       std::uint32_t recipientsPerRound,
                       const Amount& creatorAmount,
                       const Amount& userAmount);
    void withdrawReserve(const Address& to, const Amount& amount);

    Amount reserveBalance() const { return reserve_; }
    Amount costPerRound() const;
    RoundId cooldownRounds() const;
    std::vector<Address> eligibleRecipients(RoundId roundId) const;
    Amount totalDistributed() const { return totalDistributed_; }
    const Address& creator() const { return creator_; }
    const Address& giftAccount() const { return giftAccount_; }
    const GiftConfig& config() const { return cfg_; }

private:
    std::vector<Address> selectRecipients(const Round& round, std::vector<Address> eligible) const;

    GiftConfig cfg_;
    Address giftAccount_;
    Address creator_;
    const Clock& clock_;
    const AccessControl& access_;
    TokenLedger& ledger_;
    RoundEngine& engine_;
    EventLog& log_;
    ReentrancyGuard guard_;

    Amount reserve_;
    Amount totalDistributed_;
};

} // namespace lf
