#include "internal/factory.hpp"

#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/domain_event.hpp"
#include "internal/geo/distance_model.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/bid_server.hpp"
#include "internal/grpc/package_server.hpp"
#include "internal/grpc/route_server.hpp"
#include "internal/lock/keyed_lock_table.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/bid_service.hpp"
#include "internal/service/package_service.hpp"
#include "internal/service/route_service.hpp"
#include "internal/service/service_context.hpp"
#if ROUTEBID_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ROUTEBID_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace routebid::factory {

using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const routebid::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ROUTEBID_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    ROUTEBID_LOG_INFO("storage ready", {StringField("backend", "sqlite"), StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ROUTEBID_DB_POSTGRES
    const auto& postgres = database.postgres();
    db::postgres::PgRepository::BootstrapSchema(postgres.connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections() == 0 ? 16 : postgres.max_connections());
    ROUTEBID_LOG_INFO("storage ready", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ROUTEBID_LOG_WARN("no database configured, using in-memory storage");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const routebid::runtime::config::RuntimeConfig& config, std::shared_ptr<const util::Clock> clock) {
  Application app;

  // ------------------------------------------------------------------
  // Storage and shared infrastructure
  // ------------------------------------------------------------------
  app.repository  = BuildRepository(config);
  app.eligibility = std::make_shared<identity::EligibilityRegistry>();

  auto locks    = std::make_shared<lock::KeyedLockTable>(config::ToLockOptions(config));
  auto sink     = std::make_shared<events::LoggingEventSink>();
  auto distance = std::make_shared<geo::GreatCircleDistance>();

  // ------------------------------------------------------------------
  // Domain components
  // ------------------------------------------------------------------
  app.ledger    = std::make_shared<bid::BidLedger>(app.repository, locks, app.eligibility, sink, clock);
  app.lifecycle = std::make_shared<lifecycle::PackageLifecycle>(app.repository, locks, app.ledger, sink, clock, config::ToBiddingPolicy(config));
  app.ledger->SetLifecycle(app.lifecycle);

  app.routes    = std::make_shared<route::RouteManager>(app.repository, locks, app.ledger, clock);
  app.matcher   = std::make_shared<match::MatchEngine>(app.repository, distance, clock);
  app.scheduler = std::make_shared<deadline::DeadlineScheduler>(app.lifecycle, app.routes, config::SweepInterval(config));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.lifecycle   = app.lifecycle;
  ctx.ledger      = app.ledger;
  ctx.routes      = app.routes;
  ctx.matcher     = app.matcher;
  ctx.scheduler   = app.scheduler;
  ctx.eligibility = app.eligibility;

  auto package_service = std::make_shared<service::PackageService>(ctx);
  auto bid_service     = std::make_shared<service::BidService>(ctx);
  auto route_service   = std::make_shared<service::RouteService>(ctx);
  auto admin_service   = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::PackageServer>(package_service));
  app.grpc_services.push_back(std::make_unique<grpc::BidServer>(bid_service));
  app.grpc_services.push_back(std::make_unique<grpc::RouteServer>(route_service));
  app.grpc_services.push_back(std::make_unique<grpc::MatchServer>(route_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace routebid::factory
