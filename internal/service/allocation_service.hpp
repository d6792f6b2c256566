#pragma once

#include "service_context.hpp"
#include "vesting/ledger/v1/allocation_service.pb.h"

namespace vesting::service {

class AllocationService {
 public:
  explicit AllocationService(ServiceContext ctx);

  vesting::ledger::v1::CreateAllocationResponse CreateAllocation(const vesting::ledger::v1::CreateAllocationRequest& req);
  vesting::ledger::v1::RevokeAllocationResponse RevokeAllocation(const vesting::ledger::v1::RevokeAllocationRequest& req);
  vesting::ledger::v1::ExecuteAirdropResponse   ExecuteAirdrop(const vesting::ledger::v1::ExecuteAirdropRequest& req);
  vesting::ledger::v1::GetAllocationResponse    GetAllocation(const vesting::ledger::v1::GetAllocationRequest& req);
  vesting::ledger::v1::ListAllocationsResponse  ListAllocations(const vesting::ledger::v1::ListAllocationsRequest& req);

  vesting::ledger::v1::ManagerResponse      AddManager(const vesting::ledger::v1::ManagerRequest& req);
  vesting::ledger::v1::ManagerResponse      RemoveManager(const vesting::ledger::v1::ManagerRequest& req);
  vesting::ledger::v1::ListManagersResponse ListManagers(const vesting::ledger::v1::ListManagersRequest& req);
  vesting::ledger::v1::IsManagerResponse    IsManager(const vesting::ledger::v1::IsManagerRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace vesting::service
