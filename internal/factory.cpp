#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/approval/approval_orchestrator.hpp"
#include "internal/core/request_lifecycle.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/inventory/inventory_ledger.hpp"
#include "internal/limits/limit_evaluator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/reservation/reservation_manager.hpp"
#include "internal/util/time.hpp"
#if OUTFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if OUTFLOW_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace outflow::factory {

using namespace outflow;

namespace {

constexpr std::uint32_t      kDefaultMaxLevel      = 3;
constexpr const char*        kDefaultProtectedRole = "super_admin";
constexpr std::chrono::hours kDefaultReservationTtl{24};

} // namespace

util::RetryPolicy BuildRetryPolicy(const outflow::runtime::config::RuntimeConfig& config) {
  util::RetryPolicy policy;
  const auto&       retry = config.retry();
  if (retry.max_attempts() > 0) {
    policy.max_attempts = retry.max_attempts();
  }
  if (retry.has_initial_backoff()) {
    policy.initial_backoff = util::FromProto(retry.initial_backoff());
  }
  if (retry.has_max_backoff()) {
    policy.max_backoff = util::FromProto(retry.max_backoff());
  }
  if (retry.multiplier() > 0) {
    policy.multiplier = retry.multiplier();
  }
  return policy;
}

cost::CostRates BuildCostRates(const outflow::runtime::config::RuntimeConfig& config) {
  cost::CostRates rates;
  const auto&     cost = config.cost();
  if (cost.has_labor_rate_per_hour()) rates.labor_rate_per_hour = cost.labor_rate_per_hour();
  if (cost.has_labor_markup_percent()) rates.labor_markup_percent = cost.labor_markup_percent();
  if (cost.has_overhead_percent()) rates.overhead_percent = cost.overhead_percent();
  if (cost.has_tax_percent()) rates.tax_percent = cost.tax_percent();
  return rates;
}

std::shared_ptr<db::Repository> BuildRepository(const outflow::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if OUTFLOW_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.wal_mode = database.sqlite().wal_mode();
    if (database.sqlite().has_busy_timeout()) {
      options.busy_timeout = util::FromProto(database.sqlite().busy_timeout());
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    db::sqlite::BootstrapSchema(*sqlite_db);
    OUTFLOW_LOG_INFO("sqlite repository ready", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if OUTFLOW_DB_POSTGRES
    const auto pool_size = database.postgres().pool_size() > 0 ? database.postgres().pool_size() : 16;
    auto       pool      = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), pool_size);
    db::postgres::BootstrapSchema(*pool);
    OUTFLOW_LOG_INFO("postgres repository ready", {observability::IntField("pool_size", pool_size)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const outflow::runtime::config::RuntimeConfig& config) {
  return Build(config, BuildRepository(config));
}

Application Build(const outflow::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository) {
  Application app;
  app.repository = std::move(repository);

  const auto retry = BuildRetryPolicy(config);

  // ------------------------------------------------------------------
  // Engine components
  // ------------------------------------------------------------------
  const auto max_level = config.approvals().max_level() > 0 ? config.approvals().max_level() : kDefaultMaxLevel;

  std::vector<std::string> protected_roles(config.approvals().protected_roles().begin(), config.approvals().protected_roles().end());
  if (protected_roles.empty()) {
    protected_roles.emplace_back(kDefaultProtectedRole);
  }

  const auto ttl = config.reservations().has_default_ttl() ? util::FromProto(config.reservations().default_ttl())
                                                           : std::chrono::duration_cast<std::chrono::milliseconds>(kDefaultReservationTtl);

  auto ledger       = std::make_shared<inventory::InventoryLedger>(app.repository, retry);
  auto reservations = std::make_shared<reservation::ReservationManager>(app.repository, ledger, ttl);
  auto approvals    = std::make_shared<approval::ApprovalOrchestrator>(app.repository, protected_roles, retry);
  auto limits       = std::make_shared<limits::LimitEvaluator>(app.repository, max_level);
  auto lifecycle    = std::make_shared<core::RequestLifecycle>(app.repository, ledger, reservations, approvals, limits, retry);
  auto cost         = std::make_shared<cost::CostCalculator>(app.repository, BuildCostRates(config), retry);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.context.repository   = app.repository;
  app.context.ledger       = ledger;
  app.context.reservations = reservations;
  app.context.approvals    = approvals;
  app.context.lifecycle    = lifecycle;
  app.context.cost         = cost;

  app.outward_flow_service = std::make_shared<service::OutwardFlowService>(app.context);
  app.admin_service        = std::make_shared<service::AdminService>(app.context);

  return app;
}

} // namespace outflow::factory
