#include "errors.hpp"

namespace vesting::util {

std::string_view ReasonName(ErrorReason reason) {
  switch (reason) {
    case ErrorReason::kNotAuthorized:
      return "NotAuthorized";
    case ErrorReason::kNotBeneficiary:
      return "NotBeneficiary";
    case ErrorReason::kInvalidAddress:
      return "InvalidAddress";
    case ErrorReason::kInvalidBeneficiary:
      return "InvalidBeneficiary";
    case ErrorReason::kInvalidAmount:
      return "InvalidAmount";
    case ErrorReason::kInvalidDuration:
      return "InvalidDuration";
    case ErrorReason::kInvalidStartTime:
      return "InvalidStartTime";
    case ErrorReason::kEmptyBeneficiariesList:
      return "EmptyBeneficiariesList";
    case ErrorReason::kArraysLengthMismatch:
      return "ArraysLengthMismatch";
    case ErrorReason::kInvalidAllocationId:
      return "InvalidAllocationId";
    case ErrorReason::kInvalidScheduleId:
      return "InvalidScheduleId";
    case ErrorReason::kAllocationBeneficiaryMismatch:
      return "AllocationBeneficiaryMismatch";
    case ErrorReason::kAllocationRevoked:
      return "AllocationRevoked";
    case ErrorReason::kAllocationAlreadyRevoked:
      return "AllocationAlreadyRevoked";
    case ErrorReason::kScheduleRevoked:
      return "ScheduleRevoked";
    case ErrorReason::kNoTokensDue:
      return "NoTokensDue";
    case ErrorReason::kAmountExceedsRemaining:
      return "AmountExceedsRemaining";
    case ErrorReason::kInsufficientAllocation:
      return "InsufficientAllocation";
    case ErrorReason::kNothingToRevoke:
      return "NothingToRevoke";
    case ErrorReason::kCannotAddSelf:
      return "CannotAddSelf";
    case ErrorReason::kCannotRemoveSelf:
      return "CannotRemoveSelf";
    case ErrorReason::kAlreadyPaused:
      return "AlreadyPaused";
    case ErrorReason::kNotPaused:
      return "NotPaused";
    case ErrorReason::kMaxSupplyExceeded:
      return "MaxSupplyExceeded";
    case ErrorReason::kInsufficientBalance:
      return "InsufficientBalance";
    case ErrorReason::kReentrantCall:
      return "ReentrantCall";
    case ErrorReason::kEnforcedPause:
      return "EnforcedPause";
  }
  return "Unknown";
}

} // namespace vesting::util
