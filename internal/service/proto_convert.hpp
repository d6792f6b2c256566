#pragma once

#include <string>
#include <vector>

#include "internal/core/ledger_base.hpp"
#include "internal/core/vesting_engine.hpp"
#include "internal/db/model/allocation_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/schedule_record.hpp"
#include "internal/util/errors.hpp"
#include "vesting/ledger/v1/types.pb.h"

namespace vesting::service {

// Wire <-> domain conversions. Parsing throws InvalidInput.

util::Address ParseCaller(const std::string& text);
util::Address ParseAddressField(const std::string& text);
util::Amount  ParseAmountField(const std::string& text);

/*
  Runs parse for a request bound to ledger. If a field is rejected, the
  ledger's pause and role checks run first, so a paused ledger answers
  EnforcedPause and an outsider NotAuthorized whatever the payload holds.
*/
template <typename Fn>
auto ParseGated(core::LedgerBase& ledger, core::Access access, const std::string& caller, Fn&& parse) {
  try {
    return parse();
  } catch (const util::LedgerError&) {
    if (access != core::Access::kAdminAlways) {
      ledger.RequireNotPaused();
    }
    if (access != core::Access::kAnyone) {
      ledger.RequireRole(ParseCaller(caller), access);
    }
    throw;
  }
}

vesting::ledger::v1::Allocation         ToProto(const db::model::AllocationRecord& record);
vesting::ledger::v1::VestingSchedule    ToProto(const db::model::ScheduleRecord& record);
vesting::ledger::v1::VestingInfo        ToProto(const core::VestingInfo& info);
vesting::ledger::v1::BeneficiarySummary ToProto(const util::Address& beneficiary, const core::BeneficiarySummary& summary);
vesting::ledger::v1::LedgerEvent        ToProto(const db::model::EventRecord& record);

vesting::ledger::v1::ScheduleStatus ToProto(model::ScheduleStatus status);
vesting::ledger::v1::SchedulePhase  ToProto(model::SchedulePhase phase);
vesting::ledger::v1::AllocationSync ToProto(core::AllocationSync sync);

} // namespace vesting::service
