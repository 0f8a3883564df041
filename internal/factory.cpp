#include "factory.hpp"

#include <filesystem>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/coordination_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if BATON_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace baton::factory {

std::shared_ptr<db::Repository> BuildRepository(const baton::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if BATON_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }

    const auto parent = std::filesystem::path(sqlite.path()).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    db::sqlite::SqliteOptions options;
    options.wal_mode = sqlite.wal_mode();
    if (sqlite.busy_timeout_ms() > 0) options.busy_timeout_ms = static_cast<int>(sqlite.busy_timeout_ms());

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), options);
    db::sqlite::BootstrapSqliteSchema(sqlite_db);

    BATON_LOG_INFO("sqlite store opened", {observability::StringField("path", sqlite.path()), observability::BoolField("wal_mode", options.wal_mode),
                                           observability::IntField("busy_timeout_ms", options.busy_timeout_ms)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  BATON_LOG_WARN("using in-memory store; state is lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const baton::runtime::config::RuntimeConfig& config) {
  Application app;

  auto workflow = config.has_workflow() ? workflow::NormalizeWorkflowConfig(config.workflow()) : workflow::DefaultWorkflowConfig();
  workflow::ValidateWorkflowConfig(workflow);

  app.repository  = BuildRepository(config);
  app.store       = std::make_shared<store::CoordinationStore>(app.repository);
  app.configs     = std::make_shared<workflow::SessionConfigCache>(std::move(workflow));
  app.coordinator = std::make_shared<core::Coordinator>(app.store, app.configs);

  service::ServiceContext ctx;
  ctx.store       = app.store;
  ctx.coordinator = app.coordinator;
  app.service     = std::make_shared<service::CoordinationService>(ctx);

  app.grpc_services.push_back(std::make_unique<grpc::CoordinationServer>(app.service));

  return app;
}

} // namespace baton::factory
