#include "allocation_server.hpp"

#include "grpc_error.hpp"

namespace vesting::grpc {

using namespace vesting::ledger::v1;

AllocationServer::AllocationServer(std::shared_ptr<vesting::service::AllocationService> svc) : service_(std::move(svc)) {
}

::grpc::Status AllocationServer::CreateAllocation(::grpc::ServerContext*, const CreateAllocationRequest* req, CreateAllocationResponse* resp) {
  try {
    *resp = service_->CreateAllocation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AllocationServer::RevokeAllocation(::grpc::ServerContext*, const RevokeAllocationRequest* req, RevokeAllocationResponse* resp) {
  try {
    *resp = service_->RevokeAllocation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AllocationServer::ExecuteAirdrop(::grpc::ServerContext*, const ExecuteAirdropRequest* req, ExecuteAirdropResponse* resp) {
  try {
    *resp = service_->ExecuteAirdrop(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AllocationServer::GetAllocation(::grpc::ServerContext*, const GetAllocationRequest* req, GetAllocationResponse* resp) {
  try {
    *resp = service_->GetAllocation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AllocationServer::ListAllocations(::grpc::ServerContext*, const ListAllocationsRequest* req, ListAllocationsResponse* resp) {
  try {
    *resp = service_->ListAllocations(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AllocationServer::AddManager(::grpc::ServerContext*, const ManagerRequest* req, ManagerResponse* resp) {
  try {
    *resp = service_->AddManager(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AllocationServer::RemoveManager(::grpc::ServerContext*, const ManagerRequest* req, ManagerResponse* resp) {
  try {
    *resp = service_->RemoveManager(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AllocationServer::ListManagers(::grpc::ServerContext*, const ListManagersRequest* req, ListManagersResponse* resp) {
  try {
    *resp = service_->ListManagers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AllocationServer::IsManager(::grpc::ServerContext*, const IsManagerRequest* req, IsManagerResponse* resp) {
  try {
    *resp = service_->IsManager(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace vesting::grpc
