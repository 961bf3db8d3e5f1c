#include "errors.hpp"

namespace lf {

namespace {

std::string buildMessage(ErrorCode code, const std::string& detail) {
    std::string out = toString(code);
    if (!detail.empty()) {
        out += ": ";
        out += detail;
    }
    return out;
}

} // namespace

const char* toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::ZeroAmount: return "ZeroAmount";
    case ErrorCode::InvalidAddress: return "InvalidAddress";
    case ErrorCode::InvalidNumbers: return "InvalidNumbers";
    case ErrorCode::BetTooSmall: return "BetTooSmall";
    case ErrorCode::InvalidRandomness: return "InvalidRandomness";
    case ErrorCode::BelowMinimum: return "BelowMinimum";
    case ErrorCode::InsufficientBalance: return "InsufficientBalance";
    case ErrorCode::InsufficientTransferable: return "InsufficientTransferable";
    case ErrorCode::InsufficientAllowance: return "InsufficientAllowance";
    case ErrorCode::InsufficientStaked: return "InsufficientStaked";
    case ErrorCode::DurationNotMet: return "DurationNotMet";
    case ErrorCode::NotEligible: return "NotEligible";
    case ErrorCode::EmergencyModeDisabled: return "EmergencyModeDisabled";
    case ErrorCode::InvalidRequest: return "InvalidRequest";
    case ErrorCode::RoundNotFound: return "RoundNotFound";
    case ErrorCode::BetNotFound: return "BetNotFound";
    case ErrorCode::RoundNotOpen: return "RoundNotOpen";
    case ErrorCode::RoundNotEnded: return "RoundNotEnded";
    case ErrorCode::RoundAlreadyDrawn: return "RoundAlreadyDrawn";
    case ErrorCode::DrawAlreadyRequested: return "DrawAlreadyRequested";
    case ErrorCode::DrawNotTimedOut: return "DrawNotTimedOut";
    case ErrorCode::NumbersNotDrawn: return "NumbersNotDrawn";
    case ErrorCode::AlreadyClaimed: return "AlreadyClaimed";
    case ErrorCode::NoWinnings: return "NoWinnings";
    case ErrorCode::GiftsAlreadyDistributed: return "GiftsAlreadyDistributed";
    case ErrorCode::OperationNotScheduled: return "OperationNotScheduled";
    case ErrorCode::AlreadyScheduled: return "AlreadyScheduled";
    case ErrorCode::TimelockNotReady: return "TimelockNotReady";
    case ErrorCode::Paused: return "Paused";
    case ErrorCode::NotPaused: return "NotPaused";
    case ErrorCode::Reentrancy: return "Reentrancy";
    case ErrorCode::ExceedsMaximum: return "ExceedsMaximum";
    case ErrorCode::ExceedsMaxBet: return "ExceedsMaxBet";
    case ErrorCode::PayoutExceedsMaximum: return "PayoutExceedsMaximum";
    case ErrorCode::InsufficientReserve: return "InsufficientReserve";
    case ErrorCode::SupplyCapExceeded: return "SupplyCapExceeded";
    case ErrorCode::Unauthorized: return "Unauthorized";
    }
    return "Unknown";
}

const char* toString(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::Validation: return "validation";
    case ErrorCategory::Eligibility: return "eligibility";
    case ErrorCategory::State: return "state";
    case ErrorCategory::Capacity: return "capacity";
    case ErrorCategory::Authorization: return "authorization";
    }
    return "unknown";
}

ErrorCategory errorCategory(ErrorCode code) {
    switch (code) {
    case ErrorCode::ZeroAmount:
    case ErrorCode::InvalidAddress:
    case ErrorCode::InvalidNumbers:
    case ErrorCode::BetTooSmall:
    case ErrorCode::InvalidRandomness:
        return ErrorCategory::Validation;
    case ErrorCode::BelowMinimum:
    case ErrorCode::InsufficientBalance:
    case ErrorCode::InsufficientTransferable:
    case ErrorCode::InsufficientAllowance:
    case ErrorCode::InsufficientStaked:
    case ErrorCode::DurationNotMet:
    case ErrorCode::NotEligible:
        return ErrorCategory::Eligibility;
    case ErrorCode::ExceedsMaximum:
    case ErrorCode::ExceedsMaxBet:
    case ErrorCode::PayoutExceedsMaximum:
    case ErrorCode::InsufficientReserve:
    case ErrorCode::SupplyCapExceeded:
        return ErrorCategory::Capacity;
    case ErrorCode::Unauthorized:
        return ErrorCategory::Authorization;
    default:
        return ErrorCategory::State;
    }
}

LottoError::LottoError(ErrorCode code, const std::string& detail)
    : std::runtime_error(buildMessage(code, detail))
    , code_(code) {}

} // namespace lf
