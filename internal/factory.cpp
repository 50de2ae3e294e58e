#include "factory.hpp"

#include <absl/time/time.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/chunks/chunk_store.hpp"
#include "internal/command/command_queue.hpp"
#include "internal/command/queued_command_publisher.hpp"
#include "internal/config/engine_settings.hpp"
#include "internal/core/device_locks.hpp"
#include "internal/core/wake_router.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/lineage/lineage_cache.hpp"
#include "internal/lineage/registry_lineage_resolver.hpp"
#include "internal/notify/journal_notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schedule/wake_schedule.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/sweep/chunk_sweeper.hpp"
#if FIELDWAKE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if FIELDWAKE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace fieldwake::factory {

namespace {

// Used when no registry is configured: every device is unknown.
class UnmappedLineageResolver final : public lineage::LineageResolver {
 public:
  std::optional<lineage::DeviceLineage> Resolve(const std::string&) override {
    return std::nullopt;
  }
};

std::shared_ptr<lineage::LineageResolver> BuildLineage(const fieldwake::runtime::config::RuntimeConfig& config,
                                                       const config::EngineSettings& settings) {
  std::shared_ptr<lineage::LineageResolver> inner;
  if (config.lineage().registry_path().empty()) {
    FIELDWAKE_LOG_WARN("no lineage registry configured; every device will be sent back to sleep");
    inner = std::make_shared<UnmappedLineageResolver>();
  } else {
    auto registry = std::make_shared<lineage::RegistryLineageResolver>(config.lineage().registry_path());
    FIELDWAKE_LOG_INFO("lineage registry loaded", {observability::StringField("path", config.lineage().registry_path()),
                                                   observability::IntField("devices", static_cast<int64_t>(registry->DeviceCount()))});
    inner = std::move(registry);
  }
  return std::make_shared<lineage::LineageCache>(std::move(inner), settings.lineage_cache_ttl);
}

} // namespace

void Application::Stop() {
  for (auto& worker : background_workers) {
    worker->Stop();
  }
  if (commands) commands->Shutdown();
}

void ValidateConfig(const fieldwake::runtime::config::RuntimeConfig& config, bool load_registry) {
  const auto settings = config::SettingsFromConfig(config);

  if (!schedule::ParseSchedule(settings.default_schedule)) {
    throw std::runtime_error("schedule.default_expression is not a valid wake schedule: " + settings.default_schedule);
  }
  absl::TimeZone tz;
  if (!absl::LoadTimeZone(settings.default_timezone, &tz)) {
    throw std::runtime_error("schedule.default_timezone is not a known time zone: " + settings.default_timezone);
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("database.sqlite.path must be set");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("database.postgres.connection_uri must be set");
  }
  if (load_registry && !config.lineage().registry_path().empty()) {
    lineage::RegistryLineageResolver registry(config.lineage().registry_path());
    FIELDWAKE_LOG_INFO("lineage registry ok", {observability::StringField("path", config.lineage().registry_path()),
                                               observability::IntField("devices", static_cast<int64_t>(registry.DeviceCount()))});
  }
}

std::shared_ptr<db::Repository> BuildRepository(const fieldwake::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FIELDWAKE_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.wal_mode = database.sqlite().wal_mode();
    auto sqlite_db   = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    db::sqlite::BootstrapSchema(*sqlite_db);
    FIELDWAKE_LOG_INFO("repository", {observability::StringField("backend", "sqlite")});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FIELDWAKE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::BootstrapSchema(*pool);
    FIELDWAKE_LOG_INFO("repository", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  FIELDWAKE_LOG_WARN("no database configured; using the in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const fieldwake::runtime::config::RuntimeConfig& config) {
  // the registry is loaded for real by BuildLineage below
  ValidateConfig(config, false);

  Application app;

  const auto settings = config::SettingsFromConfig(config);

  // ------------------------------------------------------------------
  // Persistence and collaborators
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto notifier   = std::make_shared<notify::JournalNotifier>(repository);
  app.commands    = std::make_shared<command::CommandQueue>(settings.max_queued_commands);

  auto& engine      = app.engine;
  engine.settings   = settings;
  engine.repository = repository;
  engine.chunks     = std::make_shared<chunks::ChunkStore>(repository, settings.fragment_ttl);
  engine.lineage    = BuildLineage(config, settings);
  engine.artifacts  = storage::StorageFactory::Build(config.storage());
  engine.commands   = std::make_shared<command::QueuedCommandPublisher>(app.commands);
  engine.completion = notifier;
  engine.failures   = notifier;
  engine.locks      = std::make_shared<core::DeviceLocks>();

  // ------------------------------------------------------------------
  // Engine and sweeper
  // ------------------------------------------------------------------
  auto router  = std::make_shared<core::WakeRouter>(engine);
  auto sweeper = std::make_shared<sweep::ChunkSweeper>(engine);
  sweeper->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.router     = router;
  ctx.sweeper    = sweeper;
  ctx.commands   = app.commands;
  ctx.chunks     = engine.chunks;
  ctx.repository = repository;

  auto ingest_service = std::make_shared<service::IngestService>(ctx);
  auto admin_service  = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::IngestServer>(ingest_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  // Keep ownership of workers so they live for process lifetime
  app.background_workers.push_back(sweeper);

  FIELDWAKE_LOG_INFO("engine ready", {observability::IntField("fragment_ttl_s", settings.fragment_ttl.count()),
                                      observability::IntField("sweep_interval_s", settings.sweep_interval.count()),
                                      observability::IntField("max_missing_requests", settings.max_missing_requests),
                                      observability::StringField("default_schedule", settings.default_schedule),
                                      observability::StringField("default_timezone", settings.default_timezone)});
  return app;
}

} // namespace fieldwake::factory
