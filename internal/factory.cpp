#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/core/allocation_ledger.hpp"
#include "internal/core/vesting_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/allocation_server.hpp"
#include "internal/grpc/vesting_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/allocation_service.hpp"
#include "internal/service/vesting_service.hpp"
#include "internal/token/memory_token_ledger.hpp"
#include "internal/util/address.hpp"
#include "internal/util/amount.hpp"
#include "internal/util/time.hpp"
#if VESTING_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if VESTING_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace vesting::factory {

using namespace vesting;

namespace {

enum class LedgerSlot { kAllocation, kVesting };

#if VESTING_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const char* sql : db::sql::kLedgerSchema) {
    sqlite_db->Exec(sql);
  }
  for (const char* sql : db::sql::kSchemaProbes) {
    sqlite_db->Exec(sql);
  }
}
#endif

#if VESTING_DB_POSTGRES
// Runs on a connection of its own: pooled connections prepare statements
// against these tables and cannot exist before them.
void BootstrapPostgresSchema(const std::string& conninfo, const std::string& schema) {
  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);

  tx.exec("CREATE SCHEMA IF NOT EXISTS " + tx.quote_name(schema));
  tx.exec("SET LOCAL search_path TO " + tx.quote_name(schema));
  for (const char* sql : db::sql::kLedgerSchema) {
    tx.exec(sql);
  }
  for (const char* sql : db::sql::kSchemaProbes) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

std::string_view SlotName(LedgerSlot slot) {
  return slot == LedgerSlot::kAllocation ? "allocation" : "vesting";
}

std::shared_ptr<db::Repository> BuildRepository(const vesting::runtime::config::RuntimeConfig& config, LedgerSlot slot) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if VESTING_DB_SQLITE
    const auto& path = slot == LedgerSlot::kAllocation ? database.sqlite().allocation_path() : database.sqlite().vesting_path();
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
    BootstrapSqliteSchema(sqlite_db);
    VESTING_LOG_DEBUG("Ledger repository opened", {observability::StringField("ledger", SlotName(slot)),
                                                   observability::StringField("backend", "sqlite"), observability::StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if VESTING_DB_POSTGRES
    const auto& pg = database.postgres();
    std::string schema = slot == LedgerSlot::kAllocation ? pg.allocation_schema() : pg.vesting_schema();
    if (schema.empty()) {
      schema = slot == LedgerSlot::kAllocation ? "allocation_ledger" : "vesting_ledger";
    }
    BootstrapPostgresSchema(pg.connection_uri(), schema);
    VESTING_LOG_DEBUG("Ledger repository opened", {observability::StringField("ledger", SlotName(slot)),
                                                   observability::StringField("backend", "postgres"), observability::StringField("schema", schema)});
    auto pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), schema, pg.max_connections() == 0 ? 8 : pg.max_connections());
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<token::MemoryTokenLedger> BuildToken(const vesting::runtime::config::LedgerConfig& ledger) {
  if (ledger.token_max_supply().empty()) {
    return std::make_shared<token::MemoryTokenLedger>();
  }
  return std::make_shared<token::MemoryTokenLedger>(util::ParseAmount(ledger.token_max_supply()));
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const vesting::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto admin          = util::Address::Parse(config.ledger().admin_address());
  const auto engine_address = util::Address::Parse(config.ledger().engine_address());

  // ------------------------------------------------------------------
  // Ledgers
  // ------------------------------------------------------------------
  auto clock = std::make_shared<util::SystemClock>();
  auto token = BuildToken(config.ledger());

  auto allocations = std::make_shared<core::AllocationLedger>(BuildRepository(config, LedgerSlot::kAllocation), token, clock);
  auto engine      = std::make_shared<core::VestingEngine>(BuildRepository(config, LedgerSlot::kVesting), allocations, allocations, token,
                                                      clock, engine_address);

  allocations->BootstrapAdmin(admin);
  engine->BootstrapAdmin(admin);

  // The engine reduces and revokes allocations on behalf of schedules.
  if (!allocations->IsManager(engine_address) && allocations->IsAdmin(admin)) {
    allocations->AddManager(admin, engine_address);
  }
  if (!allocations->IsManager(engine_address)) {
    VESTING_LOG_WARN("Vesting engine is not an allocation manager; allocation sync will be skipped",
                     {observability::AddressField("engine_address", engine_address)});
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.allocations = allocations;
  ctx.vesting     = engine;
  ctx.token       = token;

  auto allocation_service = std::make_shared<service::AllocationService>(ctx);
  auto vesting_service    = std::make_shared<service::VestingService>(ctx);
  auto admin_service      = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AllocationServer>(allocation_service));
  app.grpc_services.push_back(std::make_unique<grpc::VestingServer>(vesting_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  app.context = std::move(ctx);
  return app;
}

} // namespace vesting::factory
