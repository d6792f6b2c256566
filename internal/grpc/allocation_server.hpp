#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "vesting/ledger/v1/allocation_service.grpc.pb.h"
#include "internal/service/allocation_service.hpp"

namespace vesting::grpc {

class AllocationServer final : public vesting::ledger::v1::AllocationService::Service {
public:
  explicit AllocationServer(std::shared_ptr<vesting::service::AllocationService> svc);

  ::grpc::Status CreateAllocation(::grpc::ServerContext*,
                     const vesting::ledger::v1::CreateAllocationRequest*,
                     vesting::ledger::v1::CreateAllocationResponse*) override;
  ::grpc::Status RevokeAllocation(::grpc::ServerContext*,
                     const vesting::ledger::v1::RevokeAllocationRequest*,
                     vesting::ledger::v1::RevokeAllocationResponse*) override;
  ::grpc::Status ExecuteAirdrop(::grpc::ServerContext*,
                     const vesting::ledger::v1::ExecuteAirdropRequest*,
                     vesting::ledger::v1::ExecuteAirdropResponse*) override;
  ::grpc::Status GetAllocation(::grpc::ServerContext*,
                     const vesting::ledger::v1::GetAllocationRequest*,
                     vesting::ledger::v1::GetAllocationResponse*) override;
  ::grpc::Status ListAllocations(::grpc::ServerContext*,
                     const vesting::ledger::v1::ListAllocationsRequest*,
                     vesting::ledger::v1::ListAllocationsResponse*) override;
  ::grpc::Status AddManager(::grpc::ServerContext*,
                     const vesting::ledger::v1::ManagerRequest*,
                     vesting::ledger::v1::ManagerResponse*) override;
  ::grpc::Status RemoveManager(::grpc::ServerContext*,
                     const vesting::ledger::v1::ManagerRequest*,
                     vesting::ledger::v1::ManagerResponse*) override;
  ::grpc::Status ListManagers(::grpc::ServerContext*,
                     const vesting::ledger::v1::ListManagersRequest*,
                     vesting::ledger::v1::ListManagersResponse*) override;
  ::grpc::Status IsManager(::grpc::ServerContext*,
                     const vesting::ledger::v1::IsManagerRequest*,
                     vesting::ledger::v1::IsManagerResponse*) override;

private:
  std::shared_ptr<vesting::service::AllocationService> service_;
};

}
