#include "admin_gateway.hpp"

#include "errors.hpp"

#include <string>
#include <utility>

namespace lf {

const char* toString(TimelockedParam param) {
    switch (param) {
    case TimelockedParam::MaxPayoutPerRound: return "max-payout-per-round";
    }
    return "unknown";
}

const char* toString(WithdrawSource source) {
    switch (source) {
    case WithdrawSource::EngineBankroll: return "engine";
    case WithdrawSource::GiftReserve: return "gift-reserve";
    }
    return "unknown";
}

AdminGateway::AdminGateway(AdminConfig cfg,
                           const Clock& clock,
                           const AccessControl& access,
                           TokenLedger& ledger,
                           RoundEngine& engine,
                           GiftDistributor& gifts,
                           EventLog& log)
    : cfg_(std::move(cfg))
    , clock_(clock)
    , access_(access)
    , ledger_(ledger)
    , engine_(engine)
    , gifts_(gifts)
    , log_(log) {}

std::string AdminGateway::operationId(TimelockedParam param, const Amount& value) {
    return EventLog::hash(std::string(toString(param)) + "|" + value.str());
}

Timestamp AdminGateway::schedule(const Address& caller, TimelockedParam param, const Amount& value) {
    ReentrancyGuard::Scope scope(guard_, "schedule");
    access_.requireRole(caller, Role::Admin);
    std::string id = operationId(param, value);
    if (scheduled_.count(id) != 0) {
        throw LottoError(ErrorCode::AlreadyScheduled, std::string(toString(param)) + " change is already scheduled");
    }
    Timestamp executeAt = clock_.now() + cfg_.timelockDelay;
    scheduled_.emplace(id, executeAt);
    log_.append(clock_.now(), "change-scheduled",
                EventFields()
                    .add("operation", id)
                    .add("param", toString(param))
                    .add("value", value)
                    .add("executeAt", executeAt));
    return executeAt;
}

void AdminGateway::execute(const Address& caller, TimelockedParam param, const Amount& value) {
    ReentrancyGuard::Scope scope(guard_, "execute");
    access_.requireRole(caller, Role::Admin);
    std::string id = operationId(param, value);
    auto it = scheduled_.find(id);
    if (it == scheduled_.end()) {
        throw LottoError(ErrorCode::OperationNotScheduled, std::string(toString(param)) + " change was not scheduled");
    }
    if (clock_.now() < it->second) {
        throw LottoError(ErrorCode::TimelockNotReady, "change executable at " + std::to_string(it->second));
    }
    switch (param) {
    case TimelockedParam::MaxPayoutPerRound:
        engine_.setMaxPayoutPerRound(value);
        break;
    }
    scheduled_.erase(it);
    log_.append(clock_.now(), "change-executed",
                EventFields().add("operation", id).add("param", toString(param)).add("value", value));
}

void AdminGateway::cancel(const Address& caller, TimelockedParam param, const Amount& value) {
    ReentrancyGuard::Scope scope(guard_, "cancel");
    access_.requireRole(caller, Role::Admin);
    std::string id = operationId(param, value);
    if (scheduled_.erase(id) == 0) {
        throw LottoError(ErrorCode::OperationNotScheduled, std::string(toString(param)) + " change was not scheduled");
    }
    log_.append(clock_.now(), "change-cancelled", EventFields().add("operation", id).add("by", caller));
}

void AdminGateway::pause(const Address& caller) {
    access_.requireRole(caller, Role::Admin);
    if (engine_.paused()) {
        throw LottoError(ErrorCode::Paused, "already paused");
    }
    engine_.setPaused(true);
}

void AdminGateway::unpause(const Address& caller) {
    access_.requireRole(caller, Role::Admin);
    if (!engine_.paused()) {
        throw LottoError(ErrorCode::NotPaused, "not paused");
    }
    engine_.setPaused(false);
}

void AdminGateway::emergencyWithdraw(const Address& caller,
                                     WithdrawSource source,
                                     const Address& to,
                                     const Amount& amount) {
    ReentrancyGuard::Scope scope(guard_, "emergencyWithdraw");
    access_.requireRole(caller, Role::Admin);
    switch (source) {
    case WithdrawSource::EngineBankroll:
        ledger_.transfer(engine_.engineAccount(), to, amount);
        break;
    case WithdrawSource::GiftReserve:
        gifts_.withdrawReserve(to, amount);
        break;
    }
    log_.append(clock_.now(), "emergency-withdrawal",
                EventFields().add("source", toString(source)).add("to", to).add("amount", amount).add("by", caller));
}

void AdminGateway::setEmergencyMode(const Address& caller, bool enabled) {
    ledger_.setEmergencyMode(caller, enabled);
}

std::optional<Timestamp> AdminGateway::scheduledAt(TimelockedParam param, const Amount& value) const {
    auto it = scheduled_.find(operationId(param, value));
    if (it == scheduled_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace lf
