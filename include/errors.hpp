#pragma once

#include <stdexcept>
#include <string>

namespace lf {

enum class ErrorCode {
    // validation
    ZeroAmount,
    InvalidAddress,
    InvalidNumbers,
    BetTooSmall,
    InvalidRandomness,
    // eligibility
    BelowMinimum,
    InsufficientBalance,
    InsufficientTransferable,
    InsufficientAllowance,
    InsufficientStaked,
    DurationNotMet,
    NotEligible,
    // state
    EmergencyModeDisabled,
    InvalidRequest,
    RoundNotFound,
    BetNotFound,
    RoundNotOpen,
    RoundNotEnded,
    RoundAlreadyDrawn,
    DrawAlreadyRequested,
    DrawNotTimedOut,
    NumbersNotDrawn,
    AlreadyClaimed,
    NoWinnings,
    GiftsAlreadyDistributed,
    OperationNotScheduled,
    AlreadyScheduled,
    TimelockNotReady,
    Paused,
    NotPaused,
    Reentrancy,
    // capacity
    ExceedsMaximum,
    ExceedsMaxBet,
    PayoutExceedsMaximum,
    InsufficientReserve,
    SupplyCapExceeded,
    // authorization
    Unauthorized,
};

enum class ErrorCategory { Validation, Eligibility, State, Capacity, Authorization };

const char* toString(ErrorCode code);
const char* toString(ErrorCategory category);
ErrorCategory errorCategory(ErrorCode code);

// Every rejected operation throws LottoError before any state is touched.
class LottoError : public std::runtime_error {
public:
    LottoError(ErrorCode code, const std::string& detail);

    ErrorCode code() const { return code_; }
    ErrorCategory category() const { return errorCategory(code_); }

private:
    ErrorCode code_;
};

} // namespace lf
