#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace vesting::grpc {

using namespace vesting::ledger::v1;

AdminServer::AdminServer(std::shared_ptr<vesting::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Pause(::grpc::ServerContext*, const PauseRequest* req, PauseResponse* resp) {
  try {
    *resp = service_->Pause(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Unpause(::grpc::ServerContext*, const PauseRequest* req, PauseResponse* resp) {
  try {
    *resp = service_->Unpause(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GrantAdmin(::grpc::ServerContext*, const AdminRoleRequest* req, AdminRoleResponse* resp) {
  try {
    *resp = service_->GrantAdmin(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RevokeAdmin(::grpc::ServerContext*, const AdminRoleRequest* req, AdminRoleResponse* resp) {
  try {
    *resp = service_->RevokeAdmin(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Status(::grpc::ServerContext*, const StatusRequest* req, StatusResponse* resp) {
  try {
    *resp = service_->Status(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ReadEvents(::grpc::ServerContext*, const ReadEventsRequest* req, ReadEventsResponse* resp) {
  try {
    *resp = service_->ReadEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::BalanceOf(::grpc::ServerContext*, const BalanceOfRequest* req, BalanceOfResponse* resp) {
  try {
    *resp = service_->BalanceOf(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace vesting::grpc
