#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/byte_size.hpp"
#if SBOMGRAPH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace sbomgraph::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const sbomgraph::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
    auto repo = std::make_shared<db::sqlite::SqliteRepository>(database.sqlite().path());
    repo->BootstrapSchema();
    SBOMGRAPH_LOG_INFO("database opened", {observability::StringField("backend", "sqlite"),
                                           observability::StringField("path", database.sqlite().path())});
    return repo;
  }

  if (database.has_postgres()) {
#if SBOMGRAPH_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->BootstrapSchema();
    SBOMGRAPH_LOG_INFO("database opened", {observability::StringField("backend", "postgres"),
                                           observability::IntField("max_connections", max_connections),
                                           observability::IntField("open_connections", static_cast<std::int64_t>(pool->LiveConnections()))});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SBOMGRAPH_LOG_WARN("using volatile in-memory database");
  return std::make_shared<db::memory::MemoryRepository>();
}

void RegisterCacheGauges(const std::shared_ptr<analysis::AnalysisService>& analysis) {
  std::weak_ptr<analysis::AnalysisService> weak = analysis;

  observability::Metrics::Instance().RegisterCacheGauges(
      [weak]() -> std::optional<std::uint64_t> {
        auto svc = weak.lock();
        if (!svc) return std::nullopt;
        return svc->CacheSizeUsed();
      },
      [weak]() -> std::optional<std::uint64_t> {
        auto svc = weak.lock();
        if (!svc) return std::nullopt;
        return svc->CacheLen();
      });
}

} // namespace

analysis::AnalysisConfig ToAnalysisConfig(const sbomgraph::runtime::config::AnalysisConfig& config) {
  analysis::AnalysisConfig out;
  if (!config.max_cache_size().empty()) {
    out.max_cache_size = util::ParseByteSize(config.max_cache_size());
  }
  out.concurrency = config.concurrency();
  return out;
}

/*
    Build full application dependency graph
*/
Application Build(const sbomgraph::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Data access
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config.database());

  // ------------------------------------------------------------------
  // Analysis engine
  // ------------------------------------------------------------------
  const auto analysis_config = ToAnalysisConfig(config.analysis());
  app.analysis               = std::make_shared<analysis::AnalysisService>(app.repository, analysis_config);
  RegisterCacheGauges(app.analysis);

  SBOMGRAPH_LOG_INFO("analysis engine ready", {observability::BytesField("max_cache_size", analysis_config.max_cache_size),
                                               observability::IntField("concurrency", static_cast<std::int64_t>(analysis_config.concurrency))});

  if (config.analysis().preload()) {
    app.analysis->LoadAllGraphs();
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.analysis = app.analysis;

  app.graph_service = std::make_shared<service::GraphService>(ctx);

  return app;
}

} // namespace sbomgraph::factory
