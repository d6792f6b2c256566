#include "vesting_service.hpp"

#include <cstdint>
#include <string_view>
#include <utility>

#include "internal/core/vesting_engine.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace vesting::service {

using namespace vesting::ledger::v1;

namespace {

observability::LedgerSpanTags ScheduleTags(std::string_view caller, std::uint64_t schedule_id) {
  return {.ledger = "vesting", .caller = caller, .record = "schedule", .record_id = schedule_id};
}

ReleaseResponse ToReleaseResponse(const core::ClaimResult& result) {
  ReleaseResponse resp;
  resp.set_amount(util::ToString(result.amount));
  resp.set_allocation_sync(ToProto(result.allocation_sync));
  return resp;
}

} // namespace

VestingService::VestingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateVestingScheduleResponse VestingService::CreateVestingSchedule(const CreateVestingScheduleRequest& req) {
  return ObserveRpc("VestingService.CreateVestingSchedule", {.ledger = "vesting", .caller = req.caller()}, [&] {
    util::Address         caller;
    core::ScheduleRequest request;
    ParseGated(*ctx_.vesting, core::Access::kPrivileged, req.caller(), [&] {
      caller               = ParseCaller(req.caller());
      request.beneficiary  = ParseAddressField(req.beneficiary());
      request.total_amount = ParseAmountField(req.total_amount());
    });
    request.start_time     = req.start_time();
    request.cliff_duration = req.cliff_duration();
    request.duration       = req.duration();
    request.allocation_id  = model::AllocationId(req.allocation_id());

    CreateVestingScheduleResponse resp;
    resp.set_schedule_id(ctx_.vesting->CreateVestingSchedule(caller, request).value());
    return resp;
  });
}

ReleaseResponse VestingService::ClaimVestedTokens(const ClaimVestedTokensRequest& req) {
  return ObserveRpc("VestingService.ClaimVestedTokens", ScheduleTags(req.caller(), req.schedule_id()), [&] {
    // only the schedule's beneficiary may claim, which needs the schedule
    const auto caller = ParseGated(*ctx_.vesting, core::Access::kAnyone, req.caller(), [&] { return ParseCaller(req.caller()); });
    return ToReleaseResponse(ctx_.vesting->ClaimVestedTokens(caller, model::ScheduleId(req.schedule_id())));
  });
}

ReleaseResponse VestingService::ManualUnlock(const ManualUnlockRequest& req) {
  return ObserveRpc("VestingService.ManualUnlock", ScheduleTags(req.caller(), req.schedule_id()), [&] {
    const auto [caller, amount] = ParseGated(*ctx_.vesting, core::Access::kPrivileged, req.caller(), [&] {
      return std::make_pair(ParseCaller(req.caller()), ParseAmountField(req.amount()));
    });
    return ToReleaseResponse(ctx_.vesting->ManualUnlock(caller, model::ScheduleId(req.schedule_id()), amount));
  });
}

RevokeScheduleResponse VestingService::RevokeSchedule(const RevokeScheduleRequest& req) {
  return ObserveRpc("VestingService.RevokeSchedule", ScheduleTags(req.caller(), req.schedule_id()), [&] {
    const auto caller = ParseGated(*ctx_.vesting, core::Access::kPrivileged, req.caller(), [&] { return ParseCaller(req.caller()); });

    RevokeScheduleResponse resp;
    resp.set_unvested_amount(util::ToString(ctx_.vesting->RevokeSchedule(caller, model::ScheduleId(req.schedule_id()))));
    return resp;
  });
}

RevokeScheduleResponse VestingService::ForceRevokeSchedule(const RevokeScheduleRequest& req) {
  return ObserveRpc("VestingService.ForceRevokeSchedule", ScheduleTags(req.caller(), req.schedule_id()), [&] {
    const auto caller = ParseGated(*ctx_.vesting, core::Access::kAdmin, req.caller(), [&] { return ParseCaller(req.caller()); });

    RevokeScheduleResponse resp;
    resp.set_unvested_amount(util::ToString(ctx_.vesting->ForceRevokeSchedule(caller, model::ScheduleId(req.schedule_id()))));
    return resp;
  });
}

BatchForceRevokeSchedulesResponse VestingService::BatchForceRevokeSchedules(const BatchForceRevokeSchedulesRequest& req) {
  return ObserveRpc("VestingService.BatchForceRevokeSchedules", {.ledger = "vesting", .caller = req.caller()}, [&] {
    const auto caller = ParseGated(*ctx_.vesting, core::Access::kAdmin, req.caller(), [&] { return ParseCaller(req.caller()); });

    std::vector<model::ScheduleId> ids;
    ids.reserve(req.schedule_ids_size());
    for (const auto id : req.schedule_ids()) {
      ids.emplace_back(id);
    }

    BatchForceRevokeSchedulesResponse resp;
    resp.set_revoked_count(ctx_.vesting->BatchForceRevokeSchedules(caller, ids));
    return resp;
  });
}

GetVestingScheduleResponse VestingService::GetVestingSchedule(const GetVestingScheduleRequest& req) {
  return ObserveRpc("VestingService.GetVestingSchedule", ScheduleTags({}, req.schedule_id()), [&] {
    GetVestingScheduleResponse resp;
    *resp.mutable_schedule() = ToProto(ctx_.vesting->GetSchedule(model::ScheduleId(req.schedule_id())));
    return resp;
  });
}

GetVestingInfoResponse VestingService::GetVestingInfo(const GetVestingInfoRequest& req) {
  return ObserveRpc("VestingService.GetVestingInfo", ScheduleTags({}, req.schedule_id()), [&] {
    GetVestingInfoResponse resp;
    *resp.mutable_info() = ToProto(ctx_.vesting->GetVestingInfo(model::ScheduleId(req.schedule_id())));
    return resp;
  });
}

ListSchedulesResponse VestingService::ListSchedules(const ListSchedulesRequest& req) {
  return ObserveRpc("VestingService.ListSchedules", [&] {
    ListSchedulesResponse resp;
    for (const auto& record : ctx_.vesting->SchedulesForBeneficiary(ParseAddressField(req.beneficiary()))) {
      *resp.add_schedules() = ToProto(record);
    }
    resp.set_total_count(ctx_.vesting->ScheduleCount());
    return resp;
  });
}

GetBeneficiarySummaryResponse VestingService::GetBeneficiarySummary(const GetBeneficiarySummaryRequest& req) {
  return ObserveRpc("VestingService.GetBeneficiarySummary", [&] {
    const auto beneficiary = ParseAddressField(req.beneficiary());

    GetBeneficiarySummaryResponse resp;
    *resp.mutable_summary() = ToProto(beneficiary, ctx_.vesting->SummaryFor(beneficiary));
    return resp;
  });
}

} // namespace vesting::service
