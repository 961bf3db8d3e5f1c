#pragma once

#include "access_control.hpp"
#include "admin_gateway.hpp"
#include "amount.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "event_log.hpp"
#include "gift_distributor.hpp"
#include "lottery_numbers.hpp"
#include "randomness_gateway.hpp"
#include "round_engine.hpp"
#include "token_ledger.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lf {

struct AccountSnapshot {
    Address account;
    Amount balance;
    Amount available;
    Amount staked;
    Timestamp stakingStartedAt = 0;
    Amount stakingWeight;
    bool eligibleForBenefits = false;
    PlayerStats stats;
};

// Composition root. Every entry point runs under one writer lock, so each
// call sees the state left by the previous one and commits or fails whole.
// The lock is recursive so that a callback re-entering the platform on the
// same thread reaches the component guards and fails with Reentrancy
// instead of deadlocking.
class LottoPlatform {
public:
    LottoPlatform(PlatformConfig cfg, ClockPtr clock, std::shared_ptr<RandomnessBackend> backend);

    LottoPlatform(const LottoPlatform&) = delete;
    LottoPlatform& operator=(const LottoPlatform&) = delete;

    // Token ledger.
    void stake(const Address& account, const Amount& amount);
    void unstake(const Address& account, const Amount& amount);
    Amount emergencyUnstake(const Address& account);
    void transfer(const Address& from, const Address& to, const Amount& amount);
    void transferFrom(const Address& spender, const Address& from, const Address& to, const Amount& amount);
    void approve(const Address& owner, const Address& spender, const Amount& amount);
    void burn(const Address& account, const Amount& amount);
    void authorizedBurnFrom(const Address& caller, const Address& account, const Amount& amount);
    void mint(const Address& caller, const Address& to, const Amount& amount);
    void setAuthorizedBurner(const Address& caller, const Address& account, bool enabled);
    void setAuthorizedTransferor(const Address& caller, const Address& account, bool enabled);

    // Roles.
    void grantRole(const Address& caller, const Address& account, Role role);
    void revokeRole(const Address& caller, const Address& account, Role role);

    // Rounds.
    std::uint64_t placeBet(const Address& bettor, const Numbers& numbers, const Amount& amount);
    RequestId endRound(const Address& caller);
    void deliverRandomness(const Address& caller, RequestId id, const std::vector<RandomWord>& values);
    void emergencyDraw(const Address& caller, RoundId roundId, const Numbers& numbers);
    Amount claimWinnings(const Address& caller, RoundId roundId, const std::vector<std::uint64_t>& betIndices);

    // Gifts.
    void fundGiftReserve(const Address& funder, const Amount& amount);
    std::vector<Address> distributeGifts(const Address& caller, RoundId roundId);
    void setGiftConfig(const Address& caller,
                       std::uint32_t recipientsPerRound,
                       const Amount& creatorAmount,
                       const Amount& userAmount);

    // Administration.
    Timestamp scheduleParameterChange(const Address& caller, TimelockedParam param, const Amount& value);
    void executeParameterChange(const Address& caller, TimelockedParam param, const Amount& value);
    void cancelParameterChange(const Address& caller, TimelockedParam param, const Amount& value);
    void pause(const Address& caller);
    void unpause(const Address& caller);
    void emergencyWithdraw(const Address& caller, WithdrawSource source, const Address& to, const Amount& amount);
    void setEmergencyMode(const Address& caller, bool enabled);

    // Views.
    RoundId currentRoundId() const;
    Round roundSnapshot(RoundId id) const;
    RoundPhase roundPhase(RoundId id) const;
    Bet betSnapshot(RoundId roundId, std::uint64_t index) const;
    std::vector<Bet> betsOf(RoundId roundId, const Address& bettor) const;
    AccountSnapshot accountSnapshot(const Address& account) const;
    Amount claimableWinnings(RoundId roundId, const Address& account) const;
    Amount giftReserveBalance() const;
    Amount giftCostPerRound() const;
    std::size_t outstandingRandomnessRequests() const;
    std::vector<EventEntry> events() const;
    std::string eventLogRoot() const;

    const PlatformConfig& config() const { return cfg_; }
    const Clock& clock() const { return *clock_; }
    const TokenLedger& ledger() const { return ledger_; }
    const RoundEngine& engine() const { return engine_; }
    const GiftDistributor& gifts() const { return gifts_; }
    const AdminGateway& admin() const { return admin_; }
    const RandomnessGateway& randomness() const { return randomness_; }
    const AccessControl& access() const { return access_; }
    const EventLog& eventLog() const { return log_; }

private:
    PlatformConfig cfg_;
    ClockPtr clock_;
    EventLog log_;
    AccessControl access_;
    TokenLedger ledger_;
    RandomnessGateway randomness_;
    RoundEngine engine_;
    GiftDistributor gifts_;
    AdminGateway admin_;
    mutable std::recursive_mutex mutex_;
};

} // namespace lf
