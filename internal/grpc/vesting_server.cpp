#include "vesting_server.hpp"

#include "grpc_error.hpp"

namespace vesting::grpc {

using namespace vesting::ledger::v1;

VestingServer::VestingServer(std::shared_ptr<vesting::service::VestingService> svc) : service_(std::move(svc)) {
}

::grpc::Status VestingServer::CreateVestingSchedule(::grpc::ServerContext*, const CreateVestingScheduleRequest* req, CreateVestingScheduleResponse* resp) {
  try {
    *resp = service_->CreateVestingSchedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VestingServer::ClaimVestedTokens(::grpc::ServerContext*, const ClaimVestedTokensRequest* req, ReleaseResponse* resp) {
  try {
    *resp = service_->ClaimVestedTokens(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VestingServer::ManualUnlock(::grpc::ServerContext*, const ManualUnlockRequest* req, ReleaseResponse* resp) {
  try {
    *resp = service_->ManualUnlock(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VestingServer::RevokeSchedule(::grpc::ServerContext*, const RevokeScheduleRequest* req, RevokeScheduleResponse* resp) {
  try {
    *resp = service_->RevokeSchedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VestingServer::ForceRevokeSchedule(::grpc::ServerContext*, const RevokeScheduleRequest* req, RevokeScheduleResponse* resp) {
  try {
    *resp = service_->ForceRevokeSchedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VestingServer::BatchForceRevokeSchedules(::grpc::ServerContext*, const BatchForceRevokeSchedulesRequest* req, BatchForceRevokeSchedulesResponse* resp) {
  try {
    *resp = service_->BatchForceRevokeSchedules(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VestingServer::GetVestingSchedule(::grpc::ServerContext*, const GetVestingScheduleRequest* req, GetVestingScheduleResponse* resp) {
  try {
    *resp = service_->GetVestingSchedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VestingServer::GetVestingInfo(::grpc::ServerContext*, const GetVestingInfoRequest* req, GetVestingInfoResponse* resp) {
  try {
    *resp = service_->GetVestingInfo(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VestingServer::ListSchedules(::grpc::ServerContext*, const ListSchedulesRequest* req, ListSchedulesResponse* resp) {
  try {
    *resp = service_->ListSchedules(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VestingServer::GetBeneficiarySummary(::grpc::ServerContext*, const GetBeneficiarySummaryRequest* req, GetBeneficiarySummaryResponse* resp) {
  try {
    *resp = service_->GetBeneficiarySummary(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace vesting::grpc
