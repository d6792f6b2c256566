#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace vesting::util {

/*
  Central error types.

  Every ledger failure carries exactly one ErrorReason so callers can
  assert on the condition instead of the message text. The exception
  class picks the category; grpc_error translates categories to status
  codes.
*/

enum class ErrorReason {
  kNotAuthorized,
  kNotBeneficiary,

  kInvalidAddress,
  kInvalidBeneficiary,
  kInvalidAmount,
  kInvalidDuration,
  kInvalidStartTime,
  kEmptyBeneficiariesList,
  kArraysLengthMismatch,

  kInvalidAllocationId,
  kInvalidScheduleId,
  kAllocationBeneficiaryMismatch,
  kAllocationRevoked,

  kAllocationAlreadyRevoked,
  kScheduleRevoked,
  kNoTokensDue,
  kAmountExceedsRemaining,
  kInsufficientAllocation,
  kNothingToRevoke,
  kCannotAddSelf,
  kCannotRemoveSelf,
  kAlreadyPaused,
  kNotPaused,
  kMaxSupplyExceeded,
  kInsufficientBalance,
  kReentrantCall,

  kEnforcedPause,
};

std::string_view ReasonName(ErrorReason reason);

class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorReason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {
  }

  ErrorReason reason() const {
    return reason_;
  }

 private:
  ErrorReason reason_;
};

// Caller lacks the role the operation requires.
class Unauthorized : public LedgerError {
 public:
  Unauthorized(ErrorReason reason, const std::string& msg) : LedgerError(reason, msg) {
  }
};

// Malformed or out-of-range argument.
class InvalidInput : public LedgerError {
 public:
  InvalidInput(ErrorReason reason, const std::string& msg) : LedgerError(reason, msg) {
  }
};

// Id or linked record does not exist or cannot be used.
class InvalidReference : public LedgerError {
 public:
  InvalidReference(ErrorReason reason, const std::string& msg) : LedgerError(reason, msg) {
  }
};

// Record exists but its current state forbids the operation.
class StateConflict : public LedgerError {
 public:
  StateConflict(ErrorReason reason, const std::string& msg) : LedgerError(reason, msg) {
  }
};

class SystemHalted : public LedgerError {
 public:
  explicit SystemHalted(const std::string& msg) : LedgerError(ErrorReason::kEnforcedPause, msg) {
  }
};

} // namespace vesting::util
