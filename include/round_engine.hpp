#pragma once

#include "access_control.hpp"
#include "amount.hpp"
#include "clock.hpp"
#include "event_log.hpp"
#include "lottery_numbers.hpp"
#include "randomness_gateway.hpp"
#include "reentrancy_guard.hpp"
#include "token_ledger.hpp"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace lf {

struct RoundConfig {
    Timestamp roundDuration = 7 * kDay;
    Amount minBet = tokens(1);
    Amount maxBetPerUserPerRound = tokens(1000);
    std::uint32_t houseEdgeBps = 500;
    Amount maxPayoutPerRound = tokens(1'000'000);
    // Grace period after the round end before an operator may draw by hand.
    Timestamp drawTimeout = kHour;
    std::uint32_t consecutivePlayRequirement = 3;
};

enum class RoundPhase { Open, Closed, AwaitingDraw, Drawn };

const char* toString(RoundPhase phase);

struct Round {
    RoundId id = 0;
    Timestamp startTime = 0;
    Timestamp endTime = 0;
    Numbers winningNumbers;
    bool drawn = false;
    bool drawRequested = false;
    bool emergencyDrawn = false;
    RequestId pendingRequestId = 0;
    Amount totalBetAmount;
    Amount totalPrizePool;
    Amount totalPaidOut;
    std::vector<Address> participants;
    std::uint64_t betCount = 0;
    bool giftsDistributed = false;
};

struct Bet {
    RoundId roundId = 0;
    std::uint64_t index = 0;
    Address bettor;
    Numbers numbers;
    Amount amount;
    Timestamp placedAt = 0;
    std::uint32_t matchCount = 0;
    bool claimed = false;
};

struct PlayerStats {
    std::uint64_t totalBets = 0;
    Amount totalWagered;
    Amount totalWinnings;
    std::uint32_t consecutiveRounds = 0;
    RoundId lastParticipatedRound = 0;
    RoundId lastGiftRound = 0;
    bool eligibleForGift = false;
};

// Owns rounds, bets and per-player statistics. Tokens only move through the
// ledger: bets are pulled from the bettor with transferFrom, winnings are
// paid from the engine account.
class RoundEngine : public RandomnessConsumer {
public:
    RoundEngine(RoundConfig cfg,
                Address engineAccount,
                const Clock& clock,
                const AccessControl& access,
                TokenLedger& ledger,
                RandomnessGateway& randomness,
                EventLog& log);

    std::uint64_t placeBet(const Address& bettor, const Numbers& numbers, const Amount& amount);
    RequestId endRound(const Address& caller);
    void onRandomness(RequestId id, RoundId roundId, const std::vector<RandomWord>& values) override;
    void emergencyDraw(const Address& caller, RoundId roundId, const Numbers& numbers);
    Amount claimWinnings(const Address& caller, RoundId roundId, const std::vector<std::uint64_t>& betIndices);

    // Narrow write interfaces for the gift distributor and the admin gateway.
    void markGiftsDistributed(RoundId roundId);
    void recordGift(const Address& account, RoundId roundId);
    void setMaxPayoutPerRound(const Amount& value);
    void setPaused(bool paused);

    RoundId currentRoundId() const { return rounds_.size(); }
    const Round& round(RoundId id) const;
    bool hasRound(RoundId id) const { return id >= 1 && id <= rounds_.size(); }
    RoundPhase phase(RoundId id) const;
    const Bet& bet(RoundId roundId, std::uint64_t index) const;
    std::vector<Bet> betsOf(RoundId roundId, const Address& bettor) const;
    PlayerStats playerStats(const Address& account) const;
    Amount claimableWinnings(RoundId roundId, const Address& account) const;
    Amount calculatePayout(const Amount& betAmount, std::uint32_t matches) const;
    Amount userRoundTotal(RoundId roundId, const Address& account) const;

    Amount maxPayoutPerRound() const { return cfg_.maxPayoutPerRound; }
    bool paused() const { return paused_; }
    const RoundConfig& config() const { return cfg_; }
    const Address& engineAccount() const { return engineAccount_; }

private:
    struct BetKey {
        RoundId roundId;
        std::uint64_t index;
        bool operator==(const BetKey& other) const { return roundId == other.roundId && index == other.index; }
    };
    struct BetKeyHash {
        std::size_t operator()(const BetKey& key) const;
    };
    using UserRoundKey = std::pair<RoundId, Address>;
    struct UserRoundKeyHash {
        std::size_t operator()(const UserRoundKey& key) const;
    };

    Round& mutableRound(RoundId id);
    void openRound(Timestamp start);
    void settleRound(RoundId roundId, const Numbers& winning, const char* source);
    void updateStreak(PlayerStats& stats, RoundId roundId) const;
    Amount claimedWinningsTotal(const Round& round) const;

    RoundConfig cfg_;
    Address engineAccount_;
    const Clock& clock_;
    const AccessControl& access_;
    TokenLedger& ledger_;
    RandomnessGateway& randomness_;
    EventLog& log_;
    ReentrancyGuard guard_;

    std::vector<Round> rounds_;
    std::unordered_map<BetKey, Bet, BetKeyHash> bets_;
    std::unordered_map<UserRoundKey, Amount, UserRoundKeyHash> userRoundTotals_;
    std::unordered_map<Address, PlayerStats> stats_;
    bool paused_ = false;
};

} // namespace lf
