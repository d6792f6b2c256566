#pragma once

#include "service_context.hpp"
#include "vesting/ledger/v1/admin_service.pb.h"

namespace vesting::core {
class LedgerBase;
}

namespace vesting::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  vesting::ledger::v1::PauseResponse      Pause(const vesting::ledger::v1::PauseRequest& req);
  vesting::ledger::v1::PauseResponse      Unpause(const vesting::ledger::v1::PauseRequest& req);
  vesting::ledger::v1::AdminRoleResponse  GrantAdmin(const vesting::ledger::v1::AdminRoleRequest& req);
  vesting::ledger::v1::AdminRoleResponse  RevokeAdmin(const vesting::ledger::v1::AdminRoleRequest& req);
  vesting::ledger::v1::StatusResponse     Status(const vesting::ledger::v1::StatusRequest& req);
  vesting::ledger::v1::ReadEventsResponse ReadEvents(const vesting::ledger::v1::ReadEventsRequest& req);
  vesting::ledger::v1::BalanceOfResponse  BalanceOf(const vesting::ledger::v1::BalanceOfRequest& req);

 private:
  vesting::core::LedgerBase& Ledger(vesting::ledger::v1::LedgerKind kind);

  ServiceContext ctx_;
};

} // namespace vesting::service
