#pragma once

#include "access_control.hpp"
#include "amount.hpp"
#include "clock.hpp"
#include "event_log.hpp"
#include "gift_distributor.hpp"
#include "reentrancy_guard.hpp"
#include "round_engine.hpp"
#include "token_ledger.hpp"

#include <map>
#include <optional>
#include <string>

namespace lf {

struct AdminConfig {
    Timestamp timelockDelay = kDay;
};

enum class TimelockedParam { MaxPayoutPerRound };

enum class WithdrawSource { EngineBankroll, GiftReserve };

const char* toString(TimelockedParam param);
const char* toString(WithdrawSource source);

// Admin-only controls. Sensitive parameters go through schedule -> wait ->
// execute; the operation is identified by SHA-256 of "<param>|<value>".
class AdminGateway {
public:
    AdminGateway(AdminConfig cfg,
                 const Clock& clock,
                 const AccessControl& access,
                 TokenLedger& ledger,
                 RoundEngine& engine,
                 GiftDistributor& gifts,
                 EventLog& log);

    Timestamp schedule(const Address& caller, TimelockedParam param, const Amount& value);
    void execute(const Address& caller, TimelockedParam param, const Amount& value);
    void cancel(const Address& caller, TimelockedParam param, const Amount& value);

    void pause(const Address& caller);
    void unpause(const Address& caller);

    void emergencyWithdraw(const Address& caller, WithdrawSource source, const Address& to, const Amount& amount);
    void setEmergencyMode(const Address& caller, bool enabled);

    std::optional<Timestamp> scheduledAt(TimelockedParam param, const Amount& value) const;
    static std::string operationId(TimelockedParam param, const Amount& value);
    const AdminConfig& config() const { return cfg_; }

private:
    AdminConfig cfg_;
    const Clock& clock_;
    const AccessControl& access_;
    TokenLedger& ledger_;
    RoundEngine& engine_;
    GiftDistributor& gifts_;
    EventLog& log_;
    ReentrancyGuard guard_;

    std::map<std::string, Timestamp> scheduled_;
};

} // namespace lf
