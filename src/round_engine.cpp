#include "round_engine.hpp"

#include "errors.hpp"

#include <functional>
#include <set>
#include <stdexcept>
#include <string>

namespace lf {

const char* toString(RoundPhase phase) {
    switch (phase) {
    case RoundPhase::Open: return "open";
    case RoundPhase::Closed: return "closed";
    case RoundPhase::AwaitingDraw: return "awaiting-draw";
    case RoundPhase::Drawn: return "drawn";
    }
    return "unknown";
}

std::size_t RoundEngine::BetKeyHash::operator()(const BetKey& key) const {
    std::size_t seed = std::hash<RoundId>()(key.roundId);
    return seed ^ (std::hash<std::uint64_t>()(key.index) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

std::size_t RoundEngine::UserRoundKeyHash::operator()(const UserRoundKey& key) const {
    std::size_t seed = std::hash<RoundId>()(key.first);
    return seed ^ (std::hash<Address>()(key.second) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

RoundEngine::RoundEngine(RoundConfig cfg,
                         Address engineAccount,
                         const Clock& clock,
                         const AccessControl& access,
                         TokenLedger& ledger,
                         RandomnessGateway& randomness,
                         EventLog& log)
    : cfg_(std::move(cfg))
    , engineAccount_(std::move(engineAccount))
    , clock_(clock)
    , access_(access)
    , ledger_(ledger)
    , randomness_(randomness)
    , log_(log) {
    if (engineAccount_.empty()) {
        throw std::invalid_argument("RoundEngine requires an engine account");
    }
    if (cfg_.roundDuration == 0 || cfg_.roundDuration > kMaxDuration || cfg_.drawTimeout > kMaxDuration) {
        throw std::invalid_argument("round duration and draw timeout must be within " +
                                    std::to_string(kMaxDuration) + " seconds");
    }
    if (cfg_.houseEdgeBps >= kBasisPoints) {
        throw std::invalid_argument("house edge must be below 10000 basis points");
    }
    openRound(clock_.now());
}

void RoundEngine::openRound(Timestamp start) {
    Round next;
    next.id = rounds_.size() + 1;
    next.startTime = start;
    next.endTime = start + cfg_.roundDuration;
    rounds_.push_back(next);
    log_.append(start, "round-opened",
                EventFields().add("round", next.id).add("start", next.startTime).add("end", next.endTime));
}

Round& RoundEngine::mutableRound(RoundId id) {
    if (!hasRound(id)) {
        throw LottoError(ErrorCode::RoundNotFound, "round " + std::to_string(id) + " does not exist");
    }
    return rounds_[id - 1];
}

const Round& RoundEngine::round(RoundId id) const {
    if (!hasRound(id)) {
        throw LottoError(ErrorCode::RoundNotFound, "round " + std::to_string(id) + " does not exist");
    }
    return rounds_[id - 1];
}

RoundPhase RoundEngine::phase(RoundId id) const {
    const Round& r = round(id);
    if (r.drawn) {
        return RoundPhase::Drawn;
    }
    if (r.drawRequested) {
        return RoundPhase::AwaitingDraw;
    }
    return clock_.now() < r.endTime ? RoundPhase::Open : RoundPhase::Closed;
}

void RoundEngine::updateStreak(PlayerStats& stats, RoundId roundId) const {
    if (stats.lastParticipatedRound == roundId) {
        return;
    }
    if (stats.lastParticipatedRound != 0 && stats.lastParticipatedRound + 1 == roundId) {
        ++stats.consecutiveRounds;
    } else {
        stats.consecutiveRounds = 1;
    }
    stats.lastParticipatedRound = roundId;
    stats.eligibleForGift = stats.consecutiveRounds >= cfg_.consecutivePlayRequirement;
}

std::uint64_t RoundEngine::placeBet(const Address& bettor, const Numbers& numbers, const Amount& amount) {
    ReentrancyGuard::Scope scope(guard_, "placeBet");
    if (paused_) {
        throw LottoError(ErrorCode::Paused, "betting is paused");
    }
    validateNumbers(numbers);
    if (amount < cfg_.minBet) {
        throw LottoError(ErrorCode::BetTooSmall, "minimum bet is " + formatTokens(cfg_.minBet));
    }
    RoundId roundId = currentRoundId();
    if (phase(roundId) != RoundPhase::Open) {
        throw LottoError(ErrorCode::RoundNotOpen, "round " + std::to_string(roundId) + " is not accepting bets");
    }
    Amount newUserTotal = userRoundTotal(roundId, bettor) + amount;
    if (newUserTotal > cfg_.maxBetPerUserPerRound) {
        throw LottoError(ErrorCode::ExceedsMaxBet, "bets per round are capped at " +
                                                       formatTokens(cfg_.maxBetPerUserPerRound));
    }
    if (ledger_.stakingWeight(bettor) < ledger_.config().minStake) {
        throw LottoError(ErrorCode::NotEligible, "'" + bettor + "' needs a staking weight of at least " +
                                                     formatTokens(ledger_.config().minStake));
    }

    ledger_.transferFrom(engineAccount_, bettor, engineAccount_, amount);

    Round& r = rounds_[roundId - 1];
    Bet placed;
    placed.roundId = roundId;
    placed.index = r.betCount;
    placed.bettor = bettor;
    placed.numbers = numbers;
    placed.amount = amount;
    placed.placedAt = clock_.now();

    bool firstBetThisRound = userRoundTotals_.count({ roundId, bettor }) == 0;
    if (firstBetThisRound) {
        r.participants.push_back(bettor);
    }
    userRoundTotals_[{ roundId, bettor }] = newUserTotal;
    r.totalBetAmount += amount;
    r.totalPrizePool += amount - applyBasisPoints(amount, cfg_.houseEdgeBps);
    ++r.betCount;

    PlayerStats& stats = stats_[bettor];
    ++stats.totalBets;
    stats.totalWagered += amount;
    updateStreak(stats, roundId);

    log_.append(placed.placedAt, "bet-placed",
                EventFields()
                    .add("round", roundId)
                    .add("index", placed.index)
                    .add("bettor", bettor)
                    .add("numbers", formatNumbers(numbers))
                    .add("amount", amount));
    std::uint64_t index = placed.index;
    bets_.emplace(BetKey{ roundId, index }, std::move(placed));
    return index;
}

RequestId RoundEngine::endRound(const Address& caller) {
    ReentrancyGuard::Scope scope(guard_, "endRound");
    RoundId roundId = currentRoundId();
    const Round& r = round(roundId);
    if (r.drawn) {
        throw LottoError(ErrorCode::RoundAlreadyDrawn, "round " + std::to_string(roundId) + " is already drawn");
    }
    if (r.drawRequested) {
        throw LottoError(ErrorCode::DrawAlreadyRequested, "round " + std::to_string(roundId) +
                                                              " is already waiting for randomness");
    }
    if (clock_.now() < r.endTime) {
        throw LottoError(ErrorCode::RoundNotEnded, "round " + std::to_string(roundId) + " ends at " +
                                                       std::to_string(r.endTime));
    }

    RequestId requestId = randomness_.request(roundId, kNumbersPerTicket);
    Round& target = rounds_[roundId - 1];
    target.drawRequested = true;
    target.pendingRequestId = requestId;
    log_.append(clock_.now(), "draw-requested",
                EventFields().add("round", roundId).add("request", requestId).add("by", caller));
    return requestId;
}

void RoundEngine::onRandomness(RequestId id, RoundId roundId, const std::vector<RandomWord>& values) {
    ReentrancyGuard::Scope scope(guard_, "onRandomness");
    const Round& r = round(roundId);
    if (r.drawn) {
        // Settled by emergency draw while the oracle was late.
        log_.append(clock_.now(), "randomness-discarded",
                    EventFields().add("round", roundId).add("request", id));
        return;
    }
    if (!r.drawRequested || r.pendingRequestId != id) {
        throw LottoError(ErrorCode::InvalidRequest, "request " + std::to_string(id) +
                                                        " does not belong to round " + std::to_string(roundId));
    }
    Numbers winning = deriveWinningNumbers(values);
    settleRound(roundId, winning, "vrf");
}

void RoundEngine::emergencyDraw(const Address& caller, RoundId roundId, const Numbers& numbers) {
    ReentrancyGuard::Scope scope(guard_, "emergencyDraw");
    access_.requireRole(caller, Role::Operator);
    const Round& r = round(roundId);
    if (r.drawn) {
        throw LottoError(ErrorCode::RoundAlreadyDrawn, "round " + std::to_string(roundId) + " is already drawn");
    }
    if (clock_.now() <= r.endTime + cfg_.drawTimeout) {
        throw LottoError(ErrorCode::DrawNotTimedOut, "emergency draw allowed after " +
                                                         std::to_string(r.endTime + cfg_.drawTimeout));
    }
    validateNumbers(numbers);
    rounds_[roundId - 1].emergencyDrawn = true;
    settleRound(roundId, numbers, "emergency");
}

void RoundEngine::settleRound(RoundId roundId, const Numbers& winning, const char* source) {
    Round& r = rounds_[roundId - 1];
    r.winningNumbers = winning;
    r.drawn = true;
    for (std::uint64_t i = 0; i < r.betCount; ++i) {
        Bet& b = bets_.at(BetKey{ roundId, i });
        b.matchCount = countMatches(b.numbers, winning);
    }
    Timestamp now = clock_.now();
    log_.append(now, "round-drawn",
                EventFields()
                    .add("round", roundId)
                    .add("numbers", formatNumbers(winning))
                    .add("source", source)
                    .add("bets", r.betCount));
    // push_back below may reallocate; r is not used past this point.
    if (roundId == currentRoundId()) {
        openRound(now);
    }
}

Amount RoundEngine::claimedWinningsTotal(const Round& r) const {
    Amount total;
    for (std::uint64_t i = 0; i < r.betCount; ++i) {
        const Bet& b = bets_.at(BetKey{ r.id, i });
        if (b.claimed && b.matchCount >= 2) {
            total += calculatePayout(b.amount, b.matchCount);
        }
    }
    return total;
}

Amount RoundEngine::claimWinnings(const Address& caller,
                                  RoundId roundId,
                                  const std::vector<std::uint64_t>& betIndices) {
    ReentrancyGuard::Scope scope(guard_, "claimWinnings");
    if (paused_) {
        throw LottoError(ErrorCode::Paused, "claims are paused");
    }
    const Round& r = round(roundId);
    if (!r.drawn) {
        throw LottoError(ErrorCode::NumbersNotDrawn, "round " + std::to_string(roundId) + " is not drawn yet");
    }

    std::set<std::uint64_t> seen;
    std::vector<std::uint64_t> winners;
    Amount payout;
    for (auto index : betIndices) {
        if (index >= r.betCount) {
            continue;
        }
        const Bet& b = bets_.at(BetKey{ roundId, index });
        if (b.bettor != caller) {
            continue;
        }
        if (b.claimed) {
            throw LottoError(ErrorCode::AlreadyClaimed, "bet " + std::to_string(index) + " of round " +
                                                            std::to_string(roundId) + " is already claimed");
        }
        if (b.matchCount < 2) {
            continue;
        }
        if (!seen.insert(index).second) {
            throw LottoError(ErrorCode::AlreadyClaimed, "bet " + std::to_string(index) + " of round " +
                                                            std::to_string(roundId) + " listed twice");
        }
        payout += calculatePayout(b.amount, b.matchCount);
        winners.push_back(index);
    }
    if (payout == 0) {
        throw LottoError(ErrorCode::NoWinnings, "nothing to claim in round " + std::to_string(roundId));
    }
    // Cap covers winnings already paid out this round plus this claim.
    if (claimedWinningsTotal(r) + payout > cfg_.maxPayoutPerRound) {
        throw LottoError(ErrorCode::PayoutExceedsMaximum, "round " + std::to_string(roundId) +
                                                              " payouts are capped at " +
                                                              formatTokens(cfg_.maxPayoutPerRound));
    }

    ledger_.transfer(engineAccount_, caller, payout);

    for (auto index : winners) {
        bets_.at(BetKey{ roundId, index }).claimed = true;
    }
    rounds_[roundId - 1].totalPaidOut += payout;
    stats_[caller].totalWinnings += payout;
    log_.append(clock_.now(), "winnings-claimed",
                EventFields()
                    .add("round", roundId)
                    .add("account", caller)
                    .add("bets", winners.size())
                    .add("amount", payout));
    return payout;
}

void RoundEngine::markGiftsDistributed(RoundId roundId) {
    Round& r = mutableRound(roundId);
    if (r.giftsDistributed) {
        throw LottoError(ErrorCode::GiftsAlreadyDistributed, "gifts for round " + std::to_string(roundId) +
                                                                 " were already distributed");
    }
    r.giftsDistributed = true;
}

void RoundEngine::recordGift(const Address& account, RoundId roundId) {
    stats_[account].lastGiftRound = roundId;
}

void RoundEngine::setMaxPayoutPerRound(const Amount& value) {
    cfg_.maxPayoutPerRound = value;
    log_.append(clock_.now(), "max-payout-updated", EventFields().add("value", value));
}

void RoundEngine::setPaused(bool paused) {
    paused_ = paused;
    log_.append(clock_.now(), paused ? "paused" : "unpaused", EventFields().add("round", currentRoundId()));
}

const Bet& RoundEngine::bet(RoundId roundId, std::uint64_t index) const {
    auto it = bets_.find(BetKey{ roundId, index });
    if (it == bets_.end()) {
        throw LottoError(ErrorCode::BetNotFound, "no bet " + std::to_string(index) + " in round " +
                                                     std::to_string(roundId));
    }
    return it->second;
}

std::vector<Bet> RoundEngine::betsOf(RoundId roundId, const Address& bettor) const {
    std::vector<Bet> out;
    if (!hasRound(roundId)) {
        return out;
    }
    const Round& r = rounds_[roundId - 1];
    for (std::uint64_t i = 0; i < r.betCount; ++i) {
        const Bet& b = bets_.at(BetKey{ roundId, i });
        if (b.bettor == bettor) {
            out.push_back(b);
        }
    }
    return out;
}

PlayerStats RoundEngine::playerStats(const Address& account) const {
    auto it = stats_.find(account);
    return it == stats_.end() ? PlayerStats{} : it->second;
}

Amount RoundEngine::claimableWinnings(RoundId roundId, const Address& account) const {
    Amount total;
    if (!hasRound(roundId) || !rounds_[roundId - 1].drawn) {
        return total;
    }
    for (const auto& b : betsOf(roundId, account)) {
        if (!b.claimed && b.matchCount >= 2) {
            total += calculatePayout(b.amount, b.matchCount);
        }
    }
    return total;
}

Amount RoundEngine::calculatePayout(const Amount& betAmount, std::uint32_t matches) const {
    return lf::calculatePayout(betAmount, matches, cfg_.houseEdgeBps);
}

Amount RoundEngine::userRoundTotal(RoundId roundId, const Address& account) const {
    auto it = userRoundTotals_.find({ roundId, account });
    return it == userRoundTotals_.end() ? Amount(0) : it->second;
}

} // namespace lf
