#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/chain/chain_builder.hpp"
#include "internal/db/api/run_archive.hpp"
#include "internal/executor/chain_executor.hpp"
#include "internal/executor/performance_tracker.hpp"
#include "internal/executor/worker_pool.hpp"
#include "internal/registry/plugin_registry.hpp"
#include "internal/state/state_store.hpp"
#include "internal/suggestion/suggestion_engine.hpp"

namespace chainweave::factory {

/*
  Engine

  Owns every long-lived component of one engine instance. The registry is
  shared by the builder, the executor and the suggestion engine.
*/
struct Engine {
  // config after defaults were applied
  chainweave::runtime::config::RuntimeConfig config;

  std::shared_ptr<registry::PluginRegistry>     plugin_registry;
  std::shared_ptr<db::RunArchive>               run_archive;
  std::shared_ptr<state::StateStore>            state_store;
  std::shared_ptr<executor::WorkerPool>         worker_pool;
  std::shared_ptr<executor::PerformanceTracker> performance_tracker;

  std::shared_ptr<chain::ChainBuilder>          chain_builder;
  std::shared_ptr<executor::ChainExecutor>      chain_executor;
  std::shared_ptr<suggestion::SuggestionEngine> suggestion_engine;

  model::ExecutionMode default_mode = model::ExecutionMode::kSequential;

  // fail_fast, timeout and adaptive threshold from the executor section
  executor::RunOptions DefaultRunOptions() const;
};

// Fills unset numeric fields and the default mode. Throws
// util::InvalidArgument for out-of-range values.
chainweave::runtime::config::RuntimeConfig ApplyDefaults(chainweave::runtime::config::RuntimeConfig config);

/*
  Build

  Composition root: the only place that knows concrete archive types.
  Registers every configured plugin and starts the worker pool.
*/
Engine Build(const chainweave::runtime::config::RuntimeConfig& config);

} // namespace chainweave::factory
