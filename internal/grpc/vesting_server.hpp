#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "vesting/ledger/v1/vesting_service.grpc.pb.h"
#include "internal/service/vesting_service.hpp"

namespace vesting::grpc {

class VestingServer final : public vesting::ledger::v1::VestingService::Service {
public:
  explicit VestingServer(std::shared_ptr<vesting::service::VestingService> svc);

  ::grpc::Status CreateVestingSchedule(::grpc::ServerContext*,
                     const vesting::ledger::v1::CreateVestingScheduleRequest*,
                     vesting::ledger::v1::CreateVestingScheduleResponse*) override;
  ::grpc::Status ClaimVestedTokens(::grpc::ServerContext*,
                     const vesting::ledger::v1::ClaimVestedTokensRequest*,
                     vesting::ledger::v1::ReleaseResponse*) override;
  ::grpc::Status ManualUnlock(::grpc::ServerContext*,
                     const vesting::ledger::v1::ManualUnlockRequest*,
                     vesting::ledger::v1::ReleaseResponse*) override;
  ::grpc::Status RevokeSchedule(::grpc::ServerContext*,
                     const vesting::ledger::v1::RevokeScheduleRequest*,
                     vesting::ledger::v1::RevokeScheduleResponse*) override;
  ::grpc::Status ForceRevokeSchedule(::grpc::ServerContext*,
                     const vesting::ledger::v1::RevokeScheduleRequest*,
                     vesting::ledger::v1::RevokeScheduleResponse*) override;
  ::grpc::Status BatchForceRevokeSchedules(::grpc::ServerContext*,
                     const vesting::ledger::v1::BatchForceRevokeSchedulesRequest*,
                     vesting::ledger::v1::BatchForceRevokeSchedulesResponse*) override;
  ::grpc::Status GetVestingSchedule(::grpc::ServerContext*,
                     const vesting::ledger::v1::GetVestingScheduleRequest*,
                     vesting::ledger::v1::GetVestingScheduleResponse*) override;
  ::grpc::Status GetVestingInfo(::grpc::ServerContext*,
                     const vesting::ledger::v1::GetVestingInfoRequest*,
                     vesting::ledger::v1::GetVestingInfoResponse*) override;
  ::grpc::Status ListSchedules(::grpc::ServerContext*,
                     const vesting::ledger::v1::ListSchedulesRequest*,
                     vesting::ledger::v1::ListSchedulesResponse*) override;
  ::grpc::Status GetBeneficiarySummary(::grpc::ServerContext*,
                     const vesting::ledger::v1::GetBeneficiarySummaryRequest*,
                     vesting::ledger::v1::GetBeneficiarySummaryResponse*) override;

private:
  std::shared_ptr<vesting::service::VestingService> service_;
};

}
