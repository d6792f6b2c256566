#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "vesting/ledger/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace vesting::grpc {

class AdminServer final : public vesting::ledger::v1::LedgerAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<vesting::service::AdminService> svc);

  ::grpc::Status Pause(::grpc::ServerContext*,
                     const vesting::ledger::v1::PauseRequest*,
                     vesting::ledger::v1::PauseResponse*) override;
  ::grpc::Status Unpause(::grpc::ServerContext*,
                     const vesting::ledger::v1::PauseRequest*,
                     vesting::ledger::v1::PauseResponse*) override;
  ::grpc::Status GrantAdmin(::grpc::ServerContext*,
                     const vesting::ledger::v1::AdminRoleRequest*,
                     vesting::ledger::v1::AdminRoleResponse*) override;
  ::grpc::Status RevokeAdmin(::grpc::ServerContext*,
                     const vesting::ledger::v1::AdminRoleRequest*,
                     vesting::ledger::v1::AdminRoleResponse*) override;
  ::grpc::Status Status(::grpc::ServerContext*,
                     const vesting::ledger::v1::StatusRequest*,
                     vesting::ledger::v1::StatusResponse*) override;
  ::grpc::Status ReadEvents(::grpc::ServerContext*,
                     const vesting::ledger::v1::ReadEventsRequest*,
                     vesting::ledger::v1::ReadEventsResponse*) override;
  ::grpc::Status BalanceOf(::grpc::ServerContext*,
                     const vesting::ledger::v1::BalanceOfRequest*,
                     vesting::ledger::v1::BalanceOfResponse*) override;

private:
  std::shared_ptr<vesting::service::AdminService> service_;
};

}
