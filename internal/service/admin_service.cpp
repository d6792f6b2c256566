#include "admin_service.hpp"

#include <stdexcept>
#include <string_view>
#include <utility>

#include "internal/core/allocation_ledger.hpp"
#include "internal/core/vesting_engine.hpp"
#include "internal/observability/spans.hpp"
#include "internal/token/token_ledger.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace vesting::service {

using namespace vesting::ledger::v1;

namespace {

std::string_view LedgerTag(LedgerKind kind) {
  switch (kind) {
    case LEDGER_KIND_ALLOCATION:
      return "allocation";
    case LEDGER_KIND_VESTING:
      return "vesting";
    default:
      return {};
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

core::LedgerBase& AdminService::Ledger(LedgerKind kind) {
  switch (kind) {
    case LEDGER_KIND_ALLOCATION:
      return *ctx_.allocations;
    case LEDGER_KIND_VESTING:
      return *ctx_.vesting;
    default:
      throw std::invalid_argument("ledger kind must be ALLOCATION or VESTING");
  }
}

PauseResponse AdminService::Pause(const PauseRequest& req) {
  return ObserveRpc("LedgerAdminService.Pause", {.ledger = LedgerTag(req.ledger()), .caller = req.caller()}, [&] {
    auto& ledger = Ledger(req.ledger());
    ledger.Pause(ParseGated(ledger, core::Access::kAdminAlways, req.caller(), [&] { return ParseCaller(req.caller()); }));

    PauseResponse resp;
    resp.set_paused(true);
    return resp;
  });
}

PauseResponse AdminService::Unpause(const PauseRequest& req) {
  return ObserveRpc("LedgerAdminService.Unpause", {.ledger = LedgerTag(req.ledger()), .caller = req.caller()}, [&] {
    auto& ledger = Ledger(req.ledger());
    ledger.Unpause(ParseGated(ledger, core::Access::kAdminAlways, req.caller(), [&] { return ParseCaller(req.caller()); }));

    PauseResponse resp;
    resp.set_paused(false);
    return resp;
  });
}

AdminRoleResponse AdminService::GrantAdmin(const AdminRoleRequest& req) {
  return ObserveRpc("LedgerAdminService.GrantAdmin", {.ledger = LedgerTag(req.ledger()), .caller = req.caller()}, [&] {
    auto&      ledger            = Ledger(req.ledger());
    const auto [caller, account] = ParseGated(ledger, core::Access::kAdminAlways, req.caller(), [&] {
      return std::make_pair(ParseCaller(req.caller()), ParseAddressField(req.address()));
    });

    AdminRoleResponse resp;
    resp.set_changed(ledger.GrantAdmin(caller, account));
    return resp;
  });
}

AdminRoleResponse AdminService::RevokeAdmin(const AdminRoleRequest& req) {
  return ObserveRpc("LedgerAdminService.RevokeAdmin", {.ledger = LedgerTag(req.ledger()), .caller = req.caller()}, [&] {
    auto&      ledger            = Ledger(req.ledger());
    const auto [caller, account] = ParseGated(ledger, core::Access::kAdminAlways, req.caller(), [&] {
      return std::make_pair(ParseCaller(req.caller()), ParseAddressField(req.address()));
    });

    AdminRoleResponse resp;
    resp.set_changed(ledger.RevokeAdmin(caller, account));
    return resp;
  });
}

StatusResponse AdminService::Status(const StatusRequest&) {
  return ObserveRpc("LedgerAdminService.Status", [&] {
    const auto totals = ctx_.vesting->Totals();

    StatusResponse resp;
    resp.set_allocation_paused(ctx_.allocations->IsPaused());
    resp.set_vesting_paused(ctx_.vesting->IsPaused());
    resp.set_allocation_count(ctx_.allocations->AllocationCount());
    resp.set_schedule_count(ctx_.vesting->ScheduleCount());
    resp.set_total_vested(util::ToString(totals.total_vested));
    resp.set_total_claimed(util::ToString(totals.total_claimed));
    resp.set_total_minted(util::ToString(ctx_.token->TotalMinted()));

    auto& metrics = vesting::observability::Metrics::Instance();
    metrics.SetRecordCount("allocations", resp.allocation_count());
    metrics.SetRecordCount("schedules", resp.schedule_count());
    return resp;
  });
}

ReadEventsResponse AdminService::ReadEvents(const ReadEventsRequest& req) {
  return ObserveRpc("LedgerAdminService.ReadEvents", {.ledger = LedgerTag(req.ledger())}, [&] {
    auto&                        ledger = Ledger(req.ledger());
    std::optional<std::uint64_t> max_events;
    if (req.max_events() > 0) {
      max_events = req.max_events();
    }

    ReadEventsResponse resp;
    for (const auto& event : ledger.ReadEvents(req.start_offset(), max_events)) {
      *resp.add_events() = ToProto(event);
    }
    return resp;
  });
}

BalanceOfResponse AdminService::BalanceOf(const BalanceOfRequest& req) {
  return ObserveRpc("LedgerAdminService.BalanceOf", [&] {
    BalanceOfResponse resp;
    resp.set_balance(util::ToString(ctx_.token->BalanceOf(util::Address::Parse(req.address()))));
    return resp;
  });
}

} // namespace vesting::service
