#include "allocation_service.hpp"

#include <tuple>
#include <utility>

#include "internal/core/allocation_ledger.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace vesting::service {

using namespace vesting::ledger::v1;

AllocationService::AllocationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateAllocationResponse AllocationService::CreateAllocation(const CreateAllocationRequest& req) {
  return ObserveRpc("AllocationService.CreateAllocation", {.ledger = "allocation", .caller = req.caller()}, [&] {
    const auto [caller, beneficiary, amount] = ParseGated(*ctx_.allocations, core::Access::kPrivileged, req.caller(), [&] {
      return std::make_tuple(ParseCaller(req.caller()), ParseAddressField(req.beneficiary()), ParseAmountField(req.amount()));
    });
    const auto id = ctx_.allocations->CreateAllocation(caller, beneficiary, amount);

    CreateAllocationResponse resp;
    resp.set_allocation_id(id.value());
    return resp;
  });
}

RevokeAllocationResponse AllocationService::RevokeAllocation(const RevokeAllocationRequest& req) {
  return ObserveRpc("AllocationService.RevokeAllocation",
                    {.ledger = "allocation", .caller = req.caller(), .record = "allocation", .record_id = req.allocation_id()}, [&] {
    const auto caller =
        ParseGated(*ctx_.allocations, core::Access::kPrivileged, req.caller(), [&] { return ParseCaller(req.caller()); });

    RevokeAllocationResponse resp;
    resp.set_revoked(ctx_.allocations->RevokeAllocation(caller, model::AllocationId(req.allocation_id())));
    return resp;
  });
}

ExecuteAirdropResponse AllocationService::ExecuteAirdrop(const ExecuteAirdropRequest& req) {
  return ObserveRpc("AllocationService.ExecuteAirdrop", {.ledger = "allocation", .caller = req.caller()}, [&] {
    util::Address              caller;
    std::vector<util::Address> beneficiaries;
    std::vector<util::Amount>  amounts;
    ParseGated(*ctx_.allocations, core::Access::kPrivileged, req.caller(), [&] {
      caller = ParseCaller(req.caller());
      beneficiaries.reserve(req.beneficiaries_size());
      for (const auto& beneficiary : req.beneficiaries()) {
        beneficiaries.push_back(ParseAddressField(beneficiary));
      }
      amounts.reserve(req.amounts_size());
      for (const auto& amount : req.amounts()) {
        amounts.push_back(ParseAmountField(amount));
      }
    });

    const auto result = ctx_.allocations->ExecuteAirdrop(caller, beneficiaries, amounts);

    ExecuteAirdropResponse resp;
    resp.set_airdrop_id(result.id.value());
    for (const auto id : result.allocation_ids) {
      resp.add_allocation_ids(id.value());
    }
    resp.set_total_amount(util::ToString(result.total_amount));
    return resp;
  });
}

GetAllocationResponse AllocationService::GetAllocation(const GetAllocationRequest& req) {
  return ObserveRpc("AllocationService.GetAllocation", {.ledger = "allocation", .record = "allocation", .record_id = req.allocation_id()}, [&] {
    GetAllocationResponse resp;
    *resp.mutable_allocation() = ToProto(ctx_.allocations->GetAllocation(model::AllocationId(req.allocation_id())));
    return resp;
  });
}

ListAllocationsResponse AllocationService::ListAllocations(const ListAllocationsRequest& req) {
  return ObserveRpc("AllocationService.ListAllocations", [&] {
    ListAllocationsResponse resp;
    for (const auto& record : ctx_.allocations->AllocationsForBeneficiary(ParseAddressField(req.beneficiary()))) {
      *resp.add_allocations() = ToProto(record);
    }
    resp.set_total_count(ctx_.allocations->AllocationCount());
    return resp;
  });
}

ManagerResponse AllocationService::AddManager(const ManagerRequest& req) {
  return ObserveRpc("AllocationService.AddManager", {.ledger = "allocation", .caller = req.caller()}, [&] {
    const auto [caller, manager] = ParseGated(*ctx_.allocations, core::Access::kPrivileged, req.caller(), [&] {
      return std::make_pair(ParseCaller(req.caller()), ParseAddressField(req.manager()));
    });

    ManagerResponse resp;
    resp.set_changed(ctx_.allocations->AddManager(caller, manager));
    return resp;
  });
}

ManagerResponse AllocationService::RemoveManager(const ManagerRequest& req) {
  return ObserveRpc("AllocationService.RemoveManager", {.ledger = "allocation", .caller = req.caller()}, [&] {
    const auto [caller, manager] = ParseGated(*ctx_.allocations, core::Access::kPrivileged, req.caller(), [&] {
      return std::make_pair(ParseCaller(req.caller()), ParseAddressField(req.manager()));
    });

    ManagerResponse resp;
    resp.set_changed(ctx_.allocations->RemoveManager(caller, manager));
    return resp;
  });
}

ListManagersResponse AllocationService::ListManagers(const ListManagersRequest&) {
  return ObserveRpc("AllocationService.ListManagers", [&] {
    ListManagersResponse resp;
    for (const auto& manager : ctx_.allocations->ListManagers()) {
      resp.add_managers(manager.ToString());
    }
    return resp;
  });
}

IsManagerResponse AllocationService::IsManager(const IsManagerRequest& req) {
  return ObserveRpc("AllocationService.IsManager", [&] {
    IsManagerResponse resp;
    resp.set_is_manager(ctx_.allocations->IsManager(ParseAddressField(req.address())));
    return resp;
  });
}

} // namespace vesting::service
