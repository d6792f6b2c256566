#include "proto_convert.hpp"

#include "internal/util/errors.hpp"

namespace vesting::service {

namespace v1 = vesting::ledger::v1;

util::Address ParseCaller(const std::string& text) {
  if (text.empty()) {
    throw util::Unauthorized(util::ErrorReason::kNotAuthorized, "request carries no caller");
  }
  return util::Address::Parse(text);
}

util::Address ParseAddressField(const std::string& text) {
  if (text.empty()) {
    return util::Address();
  }
  return util::Address::Parse(text);
}

util::Amount ParseAmountField(const std::string& text) {
  if (text.empty()) {
    return 0;
  }
  return util::ParseAmount(text);
}

v1::Allocation ToProto(const db::model::AllocationRecord& record) {
  v1::Allocation out;
  out.set_id(record.id);
  out.set_amount(util::ToString(record.amount));
  out.set_beneficiary(record.beneficiary.ToString());
  out.set_revoked(record.revoked);
  out.set_created_at(record.created_at);
  out.set_airdrop_id(record.airdrop_id);
  return out;
}

v1::VestingSchedule ToProto(const db::model::ScheduleRecord& record) {
  v1::VestingSchedule out;
  out.set_id(record.id);
  out.set_beneficiary(record.beneficiary.ToString());
  out.set_total_amount(util::ToString(record.total_amount));
  out.set_start_time(record.start_time);
  out.set_cliff_duration(record.cliff_duration);
  out.set_duration(record.duration);
  out.set_released_amount(util::ToString(record.released_amount));
  out.set_created_at(record.created_at);
  out.set_allocation_id(record.allocation_id);
  out.set_status(ToProto(record.status));
  out.set_revoked(model::IsTerminal(record.status));
  return out;
}

v1::VestingInfo ToProto(const core::VestingInfo& info) {
  v1::VestingInfo out;
  out.set_total_amount(util::ToString(info.total_amount));
  out.set_released_amount(util::ToString(info.released_amount));
  out.set_releasable_amount(util::ToString(info.releasable));
  out.set_status(ToProto(info.status));
  out.set_phase(ToProto(info.phase));
  return out;
}

v1::BeneficiarySummary ToProto(const util::Address& beneficiary, const core::BeneficiarySummary& summary) {
  v1::BeneficiarySummary out;
  out.set_beneficiary(beneficiary.ToString());
  out.set_total_allocated(util::ToString(summary.total_allocated));
  out.set_total_released(util::ToString(summary.total_released));
  out.set_total_unclaimed(util::ToString(summary.total_unclaimed));
  out.set_claimable_now(util::ToString(summary.claimable_now));
  out.set_active_schedules(summary.active_count);
  out.set_completed_schedules(summary.completed_count);
  out.set_revoked_schedules(summary.revoked_count);
  return out;
}

v1::LedgerEvent ToProto(const db::model::EventRecord& record) {
  v1::LedgerEvent out;
  out.set_offset(record.offset);
  // EventKind values line up with the wire enum
  out.set_kind(static_cast<v1::EventKind>(static_cast<int>(record.kind)));
  out.set_subject_id(record.subject_id);
  out.set_beneficiary(record.beneficiary.ToString());
  out.set_amount(util::ToString(record.amount));
  out.set_actor(record.actor.ToString());
  out.set_timestamp(record.timestamp);
  return out;
}

v1::ScheduleStatus ToProto(model::ScheduleStatus status) {
  switch (status) {
    case model::ScheduleStatus::kActive:
      return v1::SCHEDULE_STATUS_ACTIVE;
    case model::ScheduleStatus::kCompleted:
      return v1::SCHEDULE_STATUS_COMPLETED;
    case model::ScheduleStatus::kRevoked:
      return v1::SCHEDULE_STATUS_REVOKED;
  }
  return v1::SCHEDULE_STATUS_UNSPECIFIED;
}

v1::SchedulePhase ToProto(model::SchedulePhase phase) {
  switch (phase) {
    case model::SchedulePhase::kPending:
      return v1::SCHEDULE_PHASE_PENDING;
    case model::SchedulePhase::kVesting:
      return v1::SCHEDULE_PHASE_VESTING;
    case model::SchedulePhase::kFullyVested:
      return v1::SCHEDULE_PHASE_FULLY_VESTED;
    case model::SchedulePhase::kTerminal:
      return v1::SCHEDULE_PHASE_TERMINAL;
  }
  return v1::SCHEDULE_PHASE_UNSPECIFIED;
}

v1::AllocationSync ToProto(core::AllocationSync sync) {
  switch (sync) {
    case core::AllocationSync::kNotLinked:
      return v1::ALLOCATION_SYNC_NOT_LINKED;
    case core::AllocationSync::kReduced:
      return v1::ALLOCATION_SYNC_REDUCED;
    case core::AllocationSync::kSkipped:
      return v1::ALLOCATION_SYNC_SKIPPED;
    case core::AllocationSync::kFailed:
      return v1::ALLOCATION_SYNC_FAILED;
  }
  return v1::ALLOCATION_SYNC_UNSPECIFIED;
}

} // namespace vesting::service
