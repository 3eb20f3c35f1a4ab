#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/access/access_control.hpp"
#include "internal/core/core_context.hpp"
#include "internal/core/evaluation_engine.hpp"
#include "internal/core/offer_registry.hpp"
#include "internal/core/tender_locks.hpp"
#include "internal/core/tender_registry.hpp"
#include "internal/core/winner_selector.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/access_control_server.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/tender_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/access_control_service.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/tender_service.hpp"
#if TENDER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if TENDER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace tender::factory {

namespace {

#if TENDER_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }
}
#endif

#if TENDER_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const tender::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TENDER_DB_SQLITE
    const auto path = database.sqlite().path().empty() ? std::string("tender.db") : database.sqlite().path();
    auto sqlite_db  = std::make_shared<db::sqlite::SqliteDB>(path, database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    TENDER_LOG_INFO("using sqlite repository", {observability::StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TENDER_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    TENDER_LOG_INFO("using postgres repository", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  TENDER_LOG_WARN("using in-memory repository; state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const tender::runtime::config::RuntimeConfig& config, std::shared_ptr<util::TimeSource> clock) {
  Application app;

  if (!clock) {
    clock = std::make_shared<util::SystemTimeSource>();
  }

  // ------------------------------------------------------------------
  // Store + access control
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  auto access = std::make_shared<access::AccessControl>(app.repository, clock);
  const std::vector<std::string> evaluators(config.access().evaluators().begin(), config.access().evaluators().end());
  if (!access->Bootstrap(config.access().authority(), evaluators)) {
    TENDER_LOG_INFO("existing access state kept", {observability::StringField("authority", access->Authority())});
  }

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  core::CoreContext core_ctx;
  core_ctx.repository = app.repository;
  core_ctx.access     = access;
  core_ctx.locks      = std::make_shared<core::TenderLocks>();
  core_ctx.clock      = clock;

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.tenders     = std::make_shared<core::TenderRegistry>(core_ctx);
  ctx.offers      = std::make_shared<core::OfferRegistry>(core_ctx);
  ctx.evaluations = std::make_shared<core::EvaluationEngine>(core_ctx);
  ctx.winners     = std::make_shared<core::WinnerSelector>(core_ctx);
  ctx.access      = access;
  ctx.repository  = app.repository;

  auto tender_service = std::make_shared<service::TenderService>(ctx);
  auto access_service = std::make_shared<service::AccessControlService>(ctx);
  auto admin_service  = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::TenderServer>(tender_service));
  app.grpc_services.push_back(std::make_unique<grpc::AccessControlServer>(access_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace tender::factory
