#include "token_ledger.hpp"

#include "errors.hpp"

#include <stdexcept>
#include <utility>

namespace lf {

namespace {

void requireAddress(const Address& account, const char* what) {
    if (account.empty()) {
        throw LottoError(ErrorCode::InvalidAddress, std::string(what) + " address must not be empty");
    }
}

void requireNonZero(const Amount& amount) {
    if (amount == 0) {
        throw LottoError(ErrorCode::ZeroAmount, "amount must be positive");
    }
}

} // namespace

TokenLedger::TokenLedger(LedgerConfig cfg,
                         const Clock& clock,
                         const AccessControl& access,
                         EventLog& log,
                         const std::vector<GenesisAllocation>& genesis)
    : cfg_(std::move(cfg))
    , clock_(clock)
    , access_(access)
    , log_(log) {
    if (cfg_.boostFull <= cfg_.boostStart) {
        throw std::invalid_argument("staking boost window must end after it starts");
    }
    if (cfg_.minStake > cfg_.maxStakePerUser) {
        throw std::invalid_argument("minimum stake exceeds the per-user maximum");
    }
    for (const auto& allocation : genesis) {
        if (allocation.account.empty()) {
            throw std::invalid_argument("genesis allocation requires an account");
        }
        totalSupply_ += allocation.amount;
        if (totalSupply_ > cfg_.maxSupply) {
            throw std::invalid_argument("genesis allocations exceed the maximum supply");
        }
        accountFor(allocation.account).balance += allocation.amount;
        log_.append(clock_.now(), "genesis",
                    EventFields().add("account", allocation.account).add("amount", allocation.amount));
    }
}

TokenAccount& TokenLedger::accountFor(const Address& account) {
    return accounts_[account];
}

const TokenAccount* TokenLedger::findAccount(const Address& account) const {
    auto it = accounts_.find(account);
    if (it == accounts_.end()) {
        return nullptr;
    }
    return &it->second;
}

Timestamp TokenLedger::stakingAge(const TokenAccount& account) const {
    Timestamp now = clock_.now();
    if (account.staked == 0 || now < account.stakingStartedAt) {
        return 0;
    }
    return now - account.stakingStartedAt;
}

void TokenLedger::stake(const Address& account, const Amount& amount) {
    ReentrancyGuard::Scope scope(guard_, "stake");
    requireAddress(account, "staker");
    requireNonZero(amount);
    if (amount < cfg_.minStake) {
        throw LottoError(ErrorCode::BelowMinimum, "stake below the minimum of " + formatTokens(cfg_.minStake));
    }
    const TokenAccount* existing = findAccount(account);
    Amount available = existing ? existing->balance - existing->staked : Amount(0);
    if (available < amount) {
        throw LottoError(ErrorCode::InsufficientBalance, "available balance " + formatTokens(available) +
                                                             " cannot cover stake " + formatTokens(amount));
    }
    Amount newStake = existing->staked + amount;
    if (newStake > cfg_.maxStakePerUser) {
        throw LottoError(ErrorCode::ExceedsMaximum, "stake would exceed the per-user maximum of " +
                                                        formatTokens(cfg_.maxStakePerUser));
    }
    Amount newTotal = totalStaked_ + amount;

    TokenAccount& acct = accountFor(account);
    acct.staked = newStake;
    acct.stakingStartedAt = clock_.now();
    totalStaked_ = newTotal;
    log_.append(clock_.now(), "staked",
                EventFields().add("account", account).add("amount", amount).add("staked", newStake));
}

void TokenLedger::unstake(const Address& account, const Amount& amount) {
    ReentrancyGuard::Scope scope(guard_, "unstake");
    requireNonZero(amount);
    const TokenAccount* existing = findAccount(account);
    if (existing == nullptr || amount > existing->staked) {
        throw LottoError(ErrorCode::InsufficientStaked, "cannot unstake more than is staked");
    }
    Timestamp now = clock_.now();
    if (!emergencyMode_ && now < existing->stakingStartedAt + cfg_.minStakeDuration) {
        throw LottoError(ErrorCode::DurationNotMet, "minimum staking duration has not elapsed");
    }

    TokenAccount& acct = accountFor(account);
    acct.staked -= amount;
    if (acct.staked == 0) {
        acct.stakingStartedAt = 0;
    }
    totalStaked_ -= amount;
    log_.append(now, "unstaked",
                EventFields().add("account", account).add("amount", amount).add("staked", acct.staked));
}

Amount TokenLedger::emergencyUnstake(const Address& account) {
    ReentrancyGuard::Scope scope(guard_, "emergencyUnstake");
    if (!emergencyMode_) {
        throw LottoError(ErrorCode::EmergencyModeDisabled, "emergency unstake requires emergency mode");
    }
    const TokenAccount* existing = findAccount(account);
    if (existing == nullptr || existing->staked == 0) {
        throw LottoError(ErrorCode::InsufficientStaked, "nothing staked");
    }

    TokenAccount& acct = accountFor(account);
    Amount released = acct.staked;
    acct.staked = 0;
    acct.stakingStartedAt = 0;
    totalStaked_ -= released;
    log_.append(clock_.now(), "emergency-unstaked",
                EventFields().add("account", account).add("amount", released));
    return released;
}

void TokenLedger::checkSpendable(const TokenAccount& account, const Amount& amount, bool mayUseStaked) const {
    if (amount > account.balance) {
        throw LottoError(ErrorCode::InsufficientBalance, "balance " + formatTokens(account.balance) +
                                                             " cannot cover " + formatTokens(amount));
    }
    if (!mayUseStaked && amount > account.balance - account.staked) {
        throw LottoError(ErrorCode::InsufficientTransferable,
                         "transfer would dip into " + formatTokens(account.staked) + " staked tokens");
    }
}

void TokenLedger::moveFunds(const Address& from, const Address& to, const Amount& amount, bool mayUseStaked) {
    requireAddress(from, "sender");
    requireAddress(to, "recipient");
    requireNonZero(amount);
    const TokenAccount* source = findAccount(from);
    if (source == nullptr) {
        throw LottoError(ErrorCode::InsufficientBalance, "'" + from + "' holds no tokens");
    }
    checkSpendable(*source, amount, mayUseStaked);
    if (from == to) {
        log_.append(clock_.now(), "transfer",
                    EventFields().add("from", from).add("to", to).add("amount", amount));
        return;
    }

    const TokenAccount* target = findAccount(to);
    Amount credited = (target ? target->balance : Amount(0)) + amount;

    TokenAccount& src = accountFor(from);
    TokenAccount& dst = accountFor(to);
    src.balance -= amount;
    if (src.staked > src.balance) {
        // Only reachable for authorized movers; the stake shrinks with the balance.
        totalStaked_ -= src.staked - src.balance;
        src.staked = src.balance;
        if (src.staked == 0) {
            src.stakingStartedAt = 0;
        }
    }
    dst.balance = credited;
    log_.append(clock_.now(), "transfer",
                EventFields().add("from", from).add("to", to).add("amount", amount));
}

void TokenLedger::consumeAllowance(const Address& owner, const Address& spender, const Amount& amount) {
    Amount current = allowance(owner, spender);
    if (current < amount) {
        throw LottoError(ErrorCode::InsufficientAllowance, "'" + spender + "' may spend only " +
                                                               formatTokens(current) + " of '" + owner + "'");
    }
    allowances_[owner][spender] = current - amount;
}

void TokenLedger::transfer(const Address& from, const Address& to, const Amount& amount) {
    ReentrancyGuard::Scope scope(guard_, "transfer");
    const TokenAccount* sender = findAccount(from);
    bool authorized = sender != nullptr && sender->authorizedTransferor;
    moveFunds(from, to, amount, authorized);
}

void TokenLedger::transferFrom(const Address& spender,
                               const Address& from,
                               const Address& to,
                               const Amount& amount) {
    ReentrancyGuard::Scope scope(guard_, "transferFrom");
    requireAddress(spender, "spender");
    const TokenAccount* mover = findAccount(spender);
    bool authorized = mover != nullptr && mover->authorizedTransferor;
    if (!authorized && allowance(from, spender) < amount) {
        throw LottoError(ErrorCode::InsufficientAllowance, "'" + spender + "' may spend only " +
                                                               formatTokens(allowance(from, spender)) +
                                                               " of '" + from + "'");
    }
    moveFunds(from, to, amount, authorized);
    if (!authorized) {
        consumeAllowance(from, spender, amount);
    }
}

void TokenLedger::approve(const Address& owner, const Address& spender, const Amount& amount) {
    ReentrancyGuard::Scope scope(guard_, "approve");
    requireAddress(owner, "owner");
    requireAddress(spender, "spender");
    allowances_[owner][spender] = amount;
    log_.append(clock_.now(), "approval",
                EventFields().add("owner", owner).add("spender", spender).add("amount", amount));
}

void TokenLedger::burnFunds(const Address& account, const Amount& amount, bool mayUseStaked) {
    requireAddress(account, "burn");
    requireNonZero(amount);
    const TokenAccount* existing = findAccount(account);
    if (existing == nullptr) {
        throw LottoError(ErrorCode::InsufficientBalance, "'" + account + "' holds no tokens");
    }
    checkSpendable(*existing, amount, mayUseStaked);

    TokenAccount& acct = accountFor(account);
    acct.balance -= amount;
    if (acct.staked > acct.balance) {
        totalStaked_ -= acct.staked - acct.balance;
        acct.staked = acct.balance;
        if (acct.staked == 0) {
            acct.stakingStartedAt = 0;
        }
    }
    totalSupply_ -= amount;
    totalBurned_ += amount;
}

void TokenLedger::burn(const Address& account, const Amount& amount) {
    ReentrancyGuard::Scope scope(guard_, "burn");
    burnFunds(account, amount, false);
    log_.append(clock_.now(), "burned", EventFields().add("account", account).add("amount", amount));
}

void TokenLedger::authorizedBurnFrom(const Address& caller, const Address& account, const Amount& amount) {
    ReentrancyGuard::Scope scope(guard_, "authorizedBurnFrom");
    const TokenAccount* burner = findAccount(caller);
    if (burner == nullptr || !burner->authorizedBurner) {
        throw LottoError(ErrorCode::Unauthorized, "'" + caller + "' is not an authorized burner");
    }
    bool transferor = burner->authorizedTransferor;
    if (!transferor && allowance(account, caller) < amount) {
        throw LottoError(ErrorCode::InsufficientAllowance, "burn exceeds the allowance granted to '" + caller + "'");
    }
    burnFunds(account, amount, transferor);
    if (!transferor) {
        consumeAllowance(account, caller, amount);
    }
    log_.append(clock_.now(), "burned",
                EventFields().add("account", account).add("amount", amount).add("by", caller));
}

void TokenLedger::mint(const Address& caller, const Address& to, const Amount& amount) {
    ReentrancyGuard::Scope scope(guard_, "mint");
    access_.requireRole(caller, Role::Owner);
    requireAddress(to, "recipient");
    requireNonZero(amount);
    Amount newSupply = totalSupply_ + amount;
    if (newSupply > cfg_.maxSupply) {
        throw LottoError(ErrorCode::SupplyCapExceeded, "minting would exceed the maximum supply");
    }
    Amount credited = balanceOf(to) + amount;
    accountFor(to).balance = credited;
    totalSupply_ = newSupply;
    log_.append(clock_.now(), "minted", EventFields().add("to", to).add("amount", amount));
}

void TokenLedger::setAuthorizedBurner(const Address& caller, const Address& account, bool enabled) {
    access_.requireRole(caller, Role::Owner);
    requireAddress(account, "burner");
    accountFor(account).authorizedBurner = enabled;
    log_.append(clock_.now(), "burner-updated",
                EventFields().add("account", account).add("enabled", enabled));
}

void TokenLedger::setAuthorizedTransferor(const Address& caller, const Address& account, bool enabled) {
    access_.requireRole(caller, Role::Owner);
    requireAddress(account, "transferor");
    accountFor(account).authorizedTransferor = enabled;
    log_.append(clock_.now(), "transferor-updated",
                EventFields().add("account", account).add("enabled", enabled));
}

void TokenLedger::setEmergencyMode(const Address& caller, bool enabled) {
    access_.requireRole(caller, Role::Admin);
    if (emergencyMode_ == enabled) {
        return;
    }
    emergencyMode_ = enabled;
    log_.append(clock_.now(), "emergency-mode", EventFields().add("enabled", enabled).add("by", caller));
}

Amount TokenLedger::balanceOf(const Address& account) const {
    const TokenAccount* acct = findAccount(account);
    return acct ? acct->balance : Amount(0);
}

Amount TokenLedger::availableBalance(const Address& account) const {
    const TokenAccount* acct = findAccount(account);
    return acct ? acct->balance - acct->staked : Amount(0);
}

Amount TokenLedger::stakedAmount(const Address& account) const {
    const TokenAccount* acct = findAccount(account);
    return acct ? acct->staked : Amount(0);
}

Timestamp TokenLedger::stakingStartedAt(const Address& account) const {
    const TokenAccount* acct = findAccount(account);
    return acct ? acct->stakingStartedAt : 0;
}

Amount TokenLedger::allowance(const Address& owner, const Address& spender) const {
    auto ownerIt = allowances_.find(owner);
    if (ownerIt == allowances_.end()) {
        return Amount(0);
    }
    auto spenderIt = ownerIt->second.find(spender);
    return spenderIt == ownerIt->second.end() ? Amount(0) : spenderIt->second;
}

TokenAccount TokenLedger::account(const Address& account) const {
    const TokenAccount* acct = findAccount(account);
    return acct ? *acct : TokenAccount{};
}

Amount TokenLedger::stakingWeight(const Address& account) const {
    const TokenAccount* acct = findAccount(account);
    if (acct == nullptr || acct->staked == 0) {
        return Amount(0);
    }
    Timestamp age = stakingAge(*acct);
    if (age <= cfg_.boostStart) {
        return acct->staked;
    }
    if (age >= cfg_.boostFull) {
        return acct->staked * 2;
    }
    Amount bonus = acct->staked * (age - cfg_.boostStart) / (cfg_.boostFull - cfg_.boostStart);
    return acct->staked + bonus;
}

bool TokenLedger::isEligibleForBenefits(const Address& account) const {
    const TokenAccount* acct = findAccount(account);
    if (acct == nullptr || acct->staked < cfg_.minStake) {
        return false;
    }
    return emergencyMode_ || stakingAge(*acct) >= cfg_.minStakeDuration;
}

} // namespace lf
