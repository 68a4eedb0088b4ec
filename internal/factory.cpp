#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/allowlist/allowlist_guard.hpp"
#include "internal/allowlist/allowlist_store.hpp"
#include "internal/audit/audit_trail.hpp"
#include "internal/auth/privilege_gate.hpp"
#include "internal/catalog/project_catalog.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/deploy/completion_detector.hpp"
#include "internal/deploy/deploy_lifecycle.hpp"
#include "internal/deploy/deploy_orchestrator.hpp"
#include "internal/deploy/log_classifier.hpp"
#include "internal/deploy/log_follower.hpp"
#include "internal/deploy/log_pointer.hpp"
#include "internal/deploy/status_poller.hpp"
#include "internal/gateway/http_gateway.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/deploy_server.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/notify/webhook_notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/deploy_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "shipyard/v1.hpp"
#if SHIPYARD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SHIPYARD_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace shipyard::factory {

using namespace shipyard;
using shipyard::observability::StringField;

namespace {

#if SHIPYARD_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,service_id,status,started_at_ms,completed_at_ms FROM deploys LIMIT 1;");
  sqlite_db->Exec("SELECT seq,id,at_ms,outcome FROM audit_log LIMIT 1;");
}
#endif

#if SHIPYARD_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto        conn = pool->Acquire();
  pqxx::work  tx(*conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,service_id,status,started_at_ms,completed_at_ms,seq FROM deploys LIMIT 1;");
  tx.exec("SELECT seq,id,at_ms,outcome FROM audit_log LIMIT 1;");
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const shipyard::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SHIPYARD_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigurationError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SHIPYARD_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 8u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::ConfigurationError("postgres backend requested but not enabled at build time");
#endif
  }

  SHIPYARD_LOG_WARN("no database configured, deploy records are kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<notify::Notifier> BuildNotifier(const shipyard::runtime::config::NotificationConfig& config) {
  if (config.webhook_url().empty()) {
    return std::make_shared<notify::LogNotifier>();
  }
  return std::make_shared<notify::WebhookNotifier>(config.webhook_url(), config.username());
}

deploy::LogClassifier BuildClassifier(const shipyard::runtime::config::ClassifierConfig& config) {
  deploy::LogClassifier classifier;
  for (const auto& rule : config.extra_rules()) {
    classifier.AddRule(rule.pattern(), rule.kind(), rule.message());
  }
  return classifier;
}

shipyard::v1::Allowlist SeedFrom(const shipyard::runtime::config::AllowlistSeed& seed) {
  shipyard::v1::Allowlist out;
  out.mutable_repo_paths()->CopyFrom(seed.repo_paths());
  out.mutable_compose_projects()->CopyFrom(seed.compose_projects());
  out.mutable_container_names()->CopyFrom(seed.container_names());
  return out;
}

model::DeployStrategy DefaultStrategy(const std::string& value) {
  auto strategy = model::ParseDeployStrategy(value);
  if (!strategy) {
    throw util::ConfigurationError("unknown default deploy strategy: " + value);
  }
  return *strategy;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const shipyard::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage and audit
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto audit      = std::make_shared<audit::AuditTrail>(repository);
  auto lifecycle  = std::make_shared<deploy::DeployLifecycle>(repository);

  // ------------------------------------------------------------------
  // Remote execution and policy
  // ------------------------------------------------------------------
  const auto& gw      = config.gateway();
  auto        gateway = std::make_shared<gateway::HttpGateway>(gw.url(), gw.token(), std::chrono::milliseconds(gw.timeout_ms()));

  auto allowlist = std::make_shared<allowlist::AllowlistStore>(config.allowlist().path());
  allowlist->Load(SeedFrom(config.allowlist().seed()));
  auto guard = std::make_shared<allowlist::AllowlistGuard>(allowlist, audit);

  auto catalog    = std::make_shared<catalog::StaticProjectCatalog>(config);
  auto privileges = std::make_shared<auth::StaticTokenGate>(config.auth());
  auto notifier   = BuildNotifier(config.notifications());

  // ------------------------------------------------------------------
  // Deploy engine
  // ------------------------------------------------------------------
  const auto& deploy_config = config.deploy();

  deploy::OrchestratorOptions orchestrator_options;
  orchestrator_options.projects_dir     = deploy_config.projects_dir();
  orchestrator_options.log_dir          = deploy_config.log_dir();
  orchestrator_options.default_strategy = DefaultStrategy(deploy_config.default_strategy());

  auto orchestrator =
      std::make_shared<deploy::DeployOrchestrator>(gateway, guard, catalog, lifecycle, notifier, audit, orchestrator_options);

  deploy::DetectorOptions detector_options;
  detector_options.tail_lines         = deploy_config.log_tail_lines();
  detector_options.freshness_window_s = deploy_config.freshness_window_s();

  auto detector = std::make_shared<deploy::CompletionDetector>(gateway, lifecycle, catalog, notifier,
                                                               deploy::LogPointerPolicy(deploy_config.log_dir()),
                                                               BuildClassifier(config.classifier()), detector_options);

  deploy::FollowOptions follow_options;
  follow_options.poll_interval = std::chrono::milliseconds(deploy_config.stream_poll_interval_ms());
  follow_options.max_polls     = deploy_config.stream_max_polls();

  auto follower =
      std::make_shared<deploy::LogFollower>(gateway, deploy::LogPointerPolicy(deploy_config.log_dir()), follow_options);

  if (config.status_poller().interval_ms() > 0) {
    auto poller = std::make_shared<deploy::StatusPoller>(detector, std::chrono::milliseconds(config.status_poller().interval_ms()));
    poller->Start();
    app.background_workers.push_back(poller);
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.orchestrator = orchestrator;
  ctx.detector     = detector;
  ctx.lifecycle    = lifecycle;
  ctx.allowlist    = allowlist;
  ctx.guard        = guard;
  ctx.audit        = audit;
  ctx.privileges   = privileges;
  ctx.gateway      = gateway;
  ctx.catalog      = catalog;
  ctx.follower     = follower;

  auto deploy_service = std::make_shared<service::DeployService>(ctx);
  auto admin_service  = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::DeployServer>(deploy_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  SHIPYARD_LOG_INFO("application built", {StringField("gateway", gw.url()), StringField("log_dir", deploy_config.log_dir())});
  return app;
}

} // namespace shipyard::factory
