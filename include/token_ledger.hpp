#pragma once

#include "access_control.hpp"
#include "amount.hpp"
#include "clock.hpp"
#include "event_log.hpp"
#include "reentrancy_guard.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace lf {

struct LedgerConfig {
    Amount minStake = tokens(10);
    Amount maxStakePerUser = tokens(1'000'000);
    Timestamp minStakeDuration = kDay;
    // Staking weight grows linearly from 1x to 2x between these two ages.
    Timestamp boostStart = 7 * kDay;
    Timestamp boostFull = 30 * kDay;
    Amount maxSupply = tokens(1'000'000'000);
};

// balance counts staked tokens; available = balance - staked.
struct TokenAccount {
    Amount balance;
    Amount staked;
    Timestamp stakingStartedAt = 0;
    bool authorizedBurner = false;
    bool authorizedTransferor = false;
};

struct GenesisAllocation {
    Address account;
    Amount amount;
};

class TokenLedger {
public:
    TokenLedger(LedgerConfig cfg,
                const Clock& clock,
                const AccessControl& access,
                EventLog& log,
                const std::vector<GenesisAllocation>& genesis = {});

    void stake(const Address& account, const Amount& amount);
    void unstake(const Address& account, const Amount& amount);
    Amount emergencyUnstake(const Address& account);

    // Ordinary transfers can only move available funds; staked capital is
    // locked unless the mover is an authorized transferor.
    void transfer(const Address& from, const Address& to, const Amount& amount);
    void transferFrom(const Address& spender,
                      const Address& from,
                      const Address& to,
                      const Amount& amount);
    void approve(const Address& owner, const Address& spender, const Amount& amount);

    void burn(const Address& account, const Amount& amount);
    void authorizedBurnFrom(const Address& caller, const Address& account, const Amount& amount);
    void mint(const Address& caller, const Address& to, const Amount& amount);

    void setAuthorizedBurner(const Address& caller, const Address& account, bool enabled);
    void setAuthorizedTransferor(const Address& caller, const Address& account, bool enabled);
    void setEmergencyMode(const Address& caller, bool enabled);

    Amount balanceOf(const Address& account) const;
    Amount availableBalance(const Address& account) const;
    Amount stakedAmount(const Address& account) const;
    Timestamp stakingStartedAt(const Address& account) const;
    Amount allowance(const Address& owner, const Address& spender) const;
    TokenAccount account(const Address& account) const;

    Amount stakingWeight(const Address& account) const;
    bool isEligibleForBenefits(const Address& account) const;

    Amount totalSupply() const { return totalSupply_; }
    Amount totalStaked() const { return totalStaked_; }
    Amount totalBurned() const { return totalBurned_; }
    bool emergencyMode() const { return emergencyMode_; }
    const LedgerConfig& config() const { return cfg_; }

private:
    TokenAccount& accountFor(const Address& account);
    const TokenAccount* findAccount(const Address& account) const;
    Timestamp stakingAge(const TokenAccount& account) const;
    void consumeAllowance(const Address& owner, const Address& spender, const Amount& amount);
    void checkSpendable(const TokenAccount& account, const Amount& amount, bool mayUseStaked) const;
    void moveFunds(const Address& from, const Address& to, const Amount& amount, bool mayUseStaked);
    void burnFunds(const Address& account, const Amount& amount, bool mayUseStaked);

    LedgerConfig cfg_;
    const Clock& clock_;
    const AccessControl& access_;
    EventLog& log_;
    ReentrancyGuard guard_;

    std::unordered_map<Address, TokenAccount> accounts_;
    std::unordered_map<Address, std::unordered_map<Address, Amount>> allowances_;
    Amount totalSupply_;
    Amount totalStaked_;
    Amount totalBurned_;
    bool emergencyMode_ = false;
};

} // namespace lf
