#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/graph_repository.hpp"
#include "internal/ingest/ingestion_service.hpp"
#include "internal/upsert/upsert_engine.hpp"
#include "internal/upsert/upsert_statistics.hpp"

namespace codegraph::factory {

/*
  Application

  Owns every long-lived object the CLI uses.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::GraphRepository>       repository;
  std::shared_ptr<upsert::UpsertStatistics>  statistics;
  std::shared_ptr<upsert::UpsertEngine>      engine;
  std::shared_ptr<ingest::IngestionService>  ingestion;
};

/*
  Opens the configured backend and bootstraps its schema.

  The only place that knows concrete backend types. A backend that was
  not compiled in throws util::InvalidConfiguration.
*/
std::shared_ptr<db::GraphRepository> BuildRepository(const codegraph::runtime::config::RuntimeConfig& config);

upsert::UpsertOptions UpsertOptionsFromConfig(const codegraph::runtime::config::RuntimeConfig& config);

Application Build(const codegraph::runtime::config::RuntimeConfig& config);

} // namespace codegraph::factory
