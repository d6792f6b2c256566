#pragma once

#include "service_context.hpp"
#include "vesting/ledger/v1/vesting_service.pb.h"

namespace vesting::service {

class VestingService {
 public:
  explicit VestingService(ServiceContext ctx);

  vesting::ledger::v1::CreateVestingScheduleResponse CreateVestingSchedule(const vesting::ledger::v1::CreateVestingScheduleRequest& req);
  vesting::ledger::v1::ReleaseResponse               ClaimVestedTokens(const vesting::ledger::v1::ClaimVestedTokensRequest& req);
  vesting::ledger::v1::ReleaseResponse               ManualUnlock(const vesting::ledger::v1::ManualUnlockRequest& req);
  vesting::ledger::v1::RevokeScheduleResponse        RevokeSchedule(const vesting::ledger::v1::RevokeScheduleRequest& req);
  vesting::ledger::v1::RevokeScheduleResponse        ForceRevokeSchedule(const vesting::ledger::v1::RevokeScheduleRequest& req);
  vesting::ledger::v1::BatchForceRevokeSchedulesResponse
  BatchForceRevokeSchedules(const vesting::ledger::v1::BatchForceRevokeSchedulesRequest& req);

  vesting::ledger::v1::GetVestingScheduleResponse    GetVestingSchedule(const vesting::ledger::v1::GetVestingScheduleRequest& req);
  vesting::ledger::v1::GetVestingInfoResponse        GetVestingInfo(const vesting::ledger::v1::GetVestingInfoRequest& req);
  vesting::ledger::v1::ListSchedulesResponse         ListSchedules(const vesting::ledger::v1::ListSchedulesRequest& req);
  vesting::ledger::v1::GetBeneficiarySummaryResponse GetBeneficiarySummary(const vesting::ledger::v1::GetBeneficiarySummaryRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace vesting::service
