#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/upsert_mode.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if CODEGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CODEGRAPH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace codegraph::factory {

std::shared_ptr<db::GraphRepository> BuildRepository(const codegraph::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CODEGRAPH_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    CODEGRAPH_LOG_INFO("Graph store opened", {observability::StringField("backend", "sqlite"), observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::InvalidConfiguration("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CODEGRAPH_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::PgRepository::BootstrapSchema(*pool);
    CODEGRAPH_LOG_INFO("Graph store opened", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::InvalidConfiguration("postgres backend requested but not enabled at build time");
#endif
  }

  CODEGRAPH_LOG_INFO("Graph store opened", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

upsert::UpsertOptions UpsertOptionsFromConfig(const codegraph::runtime::config::RuntimeConfig& config) {
  const auto& upsert = config.upsert();

  upsert::UpsertOptions options;
  options.mode             = model::ParseUpsertMode(upsert.mode());
  options.audit_enabled    = upsert.audit_enabled();
  options.attribute_policy = model::ParseAttributePolicy(upsert.annotation_attribute_policy());
  if (!upsert.source().empty()) options.source = upsert.source();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const codegraph::runtime::config::RuntimeConfig& config) {
  Application app;

  app.repository = BuildRepository(config);
  app.statistics = std::make_shared<upsert::UpsertStatistics>();
  app.engine     = std::make_shared<upsert::UpsertEngine>(app.repository, app.statistics, UpsertOptionsFromConfig(config));
  app.ingestion  = std::make_shared<ingest::IngestionService>(app.engine, ingest::IngestionOptions::FromConfig(config));

  CODEGRAPH_LOG_INFO("Upsert engine ready", {observability::StringField("mode", model::ToString(app.engine->Options().mode)),
                                             observability::BoolField("audit", app.engine->Options().audit_enabled)});
  return app;
}

} // namespace codegraph::factory
