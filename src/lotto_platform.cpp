#include "lotto_platform.hpp"

#include "errors.hpp"

#include <stdexcept>
#include <utility>

namespace lf {

namespace {

PlatformConfig validated(PlatformConfig cfg) {
    validateConfig(cfg);
    return cfg;
}

const Clock& requireClock(const ClockPtr& clock) {
    if (!clock) {
        throw std::invalid_argument("LottoPlatform requires a clock");
    }
    return *clock;
}

} // namespace

LottoPlatform::LottoPlatform(PlatformConfig cfg, ClockPtr clock, std::shared_ptr<RandomnessBackend> backend)
    : cfg_(validated(std::move(cfg)))
    , clock_(std::move(clock))
    , log_()
    , access_(cfg_.owner, requireClock(clock_), log_)
    , ledger_(cfg_.ledger, *clock_, access_, log_, cfg_.genesis)
    , randomness_(std::move(backend), *clock_, log_)
    , engine_(cfg_.round, cfg_.engineAccount, *clock_, access_, ledger_, randomness_, log_)
    , gifts_(cfg_.gifts, cfg_.giftAccount, cfg_.creator, *clock_, access_, ledger_, engine_, log_)
    , admin_(cfg_.admin, *clock_, access_, ledger_, engine_, gifts_, log_) {
    randomness_.setConsumer(&engine_);
}

void LottoPlatform::stake(const Address& account, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ledger_.stake(account, amount);
}

void LottoPlatform::unstake(const Address& account, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ledger_.unstake(account, amount);
}

Amount LottoPlatform::emergencyUnstake(const Address& account) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return ledger_.emergencyUnstake(account);
}

void LottoPlatform::transfer(const Address& from, const Address& to, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ledger_.transfer(from, to, amount);
}

void LottoPlatform::transferFrom(const Address& spender, const Address& from, const Address& to, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ledger_.transferFrom(spender, from, to, amount);
}

void LottoPlatform::approve(const Address& owner, const Address& spender, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ledger_.approve(owner, spender, amount);
}

void LottoPlatform::burn(const Address& account, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ledger_.burn(account, amount);
}

void LottoPlatform::authorizedBurnFrom(const Address& caller, const Address& account, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ledger_.authorizedBurnFrom(caller, account, amount);
}

void LottoPlatform::mint(const Address& caller, const Address& to, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ledger_.mint(caller, to, amount);
}

void LottoPlatform::setAuthorizedBurner(const Address& caller, const Address& account, bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ledger_.setAuthorizedBurner(caller, account, enabled);
}

void LottoPlatform::setAuthorizedTransferor(const Address& caller, const Address& account, bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ledger_.setAuthorizedTransferor(caller, account, enabled);
}

void LottoPlatform::grantRole(const Address& caller, const Address& account, Role role) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    access_.grantRole(caller, account, role);
}

void LottoPlatform::revokeRole(const Address& caller, const Address& account, Role role) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    access_.revokeRole(caller, account, role);
}

std::uint64_t LottoPlatform::placeBet(const Address& bettor, const Numbers& numbers, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return engine_.placeBet(bettor, numbers, amount);
}

RequestId LottoPlatform::endRound(const Address& caller) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return engine_.endRound(caller);
}

void LottoPlatform::deliverRandomness(const Address& caller, RequestId id, const std::vector<RandomWord>& values) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (caller != cfg_.randomnessCoordinator) {
        throw LottoError(ErrorCode::Unauthorized, "'" + caller + "' is not the randomness coordinator");
    }
    randomness_.deliver(id, values);
}

void LottoPlatform::emergencyDraw(const Address& caller, RoundId roundId, const Numbers& numbers) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    engine_.emergencyDraw(caller, roundId, numbers);
}

Amount LottoPlatform::claimWinnings(const Address& caller,
                                    RoundId roundId,
                                    const std::vector<std::uint64_t>& betIndices) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return engine_.claimWinnings(caller, roundId, betIndices);
}

void LottoPlatform::fundGiftReserve(const Address& funder, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    gifts_.fundReserve(funder, amount);
}

std::vector<Address> LottoPlatform::distributeGifts(const Address& caller, RoundId roundId) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return gifts_.distributeGifts(caller, roundId);
}

void LottoPlatform::setGiftConfig(const Address& caller,
                                  std::uint32_t recipientsPerRound,
                                  const Amount& creatorAmount,
                                  const Amount& userAmount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    gifts_.setGiftConfig(caller, recipientsPerRound, creatorAmount, userAmount);
}

Timestamp LottoPlatform::scheduleParameterChange(const Address& caller, TimelockedParam param, const Amount& value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return admin_.schedule(caller, param, value);
}

void LottoPlatform::executeParameterChange(const Address& caller, TimelockedParam param, const Amount& value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    admin_.execute(caller, param, value);
}

void LottoPlatform::cancelParameterChange(const Address& caller, TimelockedParam param, const Amount& value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    admin_.cancel(caller, param, value);
}

void LottoPlatform::pause(const Address& caller) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    admin_.pause(caller);
}

void LottoPlatform::unpause(const Address& caller) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    admin_.unpause(caller);
}

void LottoPlatform::emergencyWithdraw(const Address& caller,
                                      WithdrawSource source,
                                      const Address& to,
                                      const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    admin_.emergencyWithdraw(caller, source, to, amount);
}

void LottoPlatform::setEmergencyMode(const Address& caller, bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    admin_.setEmergencyMode(caller, enabled);
}

RoundId LottoPlatform::currentRoundId() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return engine_.currentRoundId();
}

Round LottoPlatform::roundSnapshot(RoundId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return engine_.round(id);
}

RoundPhase LottoPlatform::roundPhase(RoundId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return engine_.phase(id);
}

Bet LottoPlatform::betSnapshot(RoundId roundId, std::uint64_t index) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return engine_.bet(roundId, index);
}

std::vector<Bet> LottoPlatform::betsOf(RoundId roundId, const Address& bettor) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return engine_.betsOf(roundId, bettor);
}

AccountSnapshot LottoPlatform::accountSnapshot(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    AccountSnapshot out;
    out.account = account;
    out.balance = ledger_.balanceOf(account);
    out.available = ledger_.availableBalance(account);
    out.staked = ledger_.stakedAmount(account);
    out.stakingStartedAt = ledger_.stakingStartedAt(account);
    out.stakingWeight = ledger_.stakingWeight(account);
    out.eligibleForBenefits = ledger_.isEligibleForBenefits(account);
    out.stats = engine_.playerStats(account);
    return out;
}

Amount LottoPlatform::claimableWinnings(RoundId roundId, const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return engine_.claimableWinnings(roundId, account);
}

Amount LottoPlatform::giftReserveBalance() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return gifts_.reserveBalance();
}

Amount LottoPlatform::giftCostPerRound() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return gifts_.costPerRound();
}

std::size_t LottoPlatform::outstandingRandomnessRequests() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return randomness_.outstandingCount();
}

std::vector<EventEntry> LottoPlatform::events() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return log_.entries();
}

std::string LottoPlatform::eventLogRoot() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return log_.merkleRoot();
}

} // namespace lf
