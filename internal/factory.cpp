#include "internal/factory.hpp"

#include <algorithm>
#include <string>
#include <thread>

#include "internal/db/memory/memory_run_archive.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_run_archive.hpp"
#include "internal/observability/logging.hpp"
#include "internal/plugin/builtin_plugins.hpp"
#include "internal/util/errors.hpp"

namespace chainweave::factory {

using chainweave::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kDefaultSuggestionResults = 5;
constexpr uint32_t kDefaultAnchorPlugins     = 3;

std::shared_ptr<db::RunArchive> BuildArchive(const RuntimeConfig& config) {
  const auto& store = config.state_store();
  if (store.has_sqlite()) {
    if (store.sqlite().path().empty()) {
      throw util::InvalidArgument("state_store.sqlite.path must be set");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(store.sqlite().path());
    db::sqlite::BootstrapSqliteSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRunArchive>(std::move(sqlite_db));
  }
  if (store.has_memory()) {
    return std::make_shared<db::memory::MemoryRunArchive>();
  }
  return nullptr;
}

} // namespace

executor::RunOptions Engine::DefaultRunOptions() const {
  executor::RunOptions options;
  options.fail_fast                   = config.executor().fail_fast();
  options.per_node_timeout            = std::chrono::milliseconds(config.executor().per_node_timeout_ms());
  options.adaptive_parallel_threshold = config.executor().adaptive_parallel_threshold();
  return options;
}

RuntimeConfig ApplyDefaults(RuntimeConfig config) {
  auto* exec = config.mutable_executor();
  if (exec->worker_threads() == 0) {
    exec->set_worker_threads(std::max(1U, std::thread::hardware_concurrency()));
  }
  if (exec->default_mode().empty()) {
    exec->set_default_mode("sequential");
  }
  if (!model::ParseExecutionMode(exec->default_mode())) {
    throw util::InvalidArgument("unknown executor.default_mode '" + exec->default_mode() + "'");
  }
  if (exec->adaptive_parallel_threshold() == 0) {
    exec->set_adaptive_parallel_threshold(static_cast<uint32_t>(executor::kDefaultAdaptiveParallelThreshold));
  }
  if (exec->performance_history() == 0) {
    exec->set_performance_history(static_cast<uint32_t>(executor::kDefaultPerformanceHistory));
  }

  auto* suggestions = config.mutable_suggestions();
  if (suggestions->max_results() == 0) suggestions->set_max_results(kDefaultSuggestionResults);
  if (suggestions->max_anchor_plugins() == 0) suggestions->set_max_anchor_plugins(kDefaultAnchorPlugins);
  if (suggestions->min_score() < 0.0 || suggestions->min_score() > 1.0) {
    throw util::InvalidArgument("suggestions.min_score must be within [0, 1]");
  }
  return config;
}

/*
    Build full engine dependency graph
*/
Engine Build(const RuntimeConfig& raw_config) {
  Engine engine;
  engine.config      = ApplyDefaults(raw_config);
  const auto& config = engine.config;

  engine.default_mode = *model::ParseExecutionMode(config.executor().default_mode());

  // ------------------------------------------------------------------
  // Plugins
  // ------------------------------------------------------------------
  engine.plugin_registry = std::make_shared<registry::PluginRegistry>();
  for (const auto& plugin_config : config.plugins()) {
    engine.plugin_registry->Register(plugin::DescriptorFromConfig(plugin_config), plugin::MakeBuiltinPlugin(plugin_config));
  }

  // ------------------------------------------------------------------
  // State
  // ------------------------------------------------------------------
  engine.run_archive         = BuildArchive(config);
  engine.state_store         = std::make_shared<state::StateStore>(engine.run_archive);
  engine.performance_tracker = std::make_shared<executor::PerformanceTracker>(config.executor().performance_history());

  // ------------------------------------------------------------------
  // Execution
  // ------------------------------------------------------------------
  engine.worker_pool = std::make_shared<executor::WorkerPool>(config.executor().worker_threads());
  engine.worker_pool->Start();

  engine.chain_builder  = std::make_shared<chain::ChainBuilder>(engine.plugin_registry);
  engine.chain_executor = std::make_shared<executor::ChainExecutor>(engine.plugin_registry, engine.state_store, engine.worker_pool,
                                                                    engine.performance_tracker);

  suggestion::SuggestionOptions suggestion_options;
  suggestion_options.max_results        = config.suggestions().max_results();
  suggestion_options.min_score          = config.suggestions().min_score();
  suggestion_options.max_anchor_plugins = config.suggestions().max_anchor_plugins();
  engine.suggestion_engine =
      std::make_shared<suggestion::SuggestionEngine>(engine.plugin_registry, suggestion_options, engine.performance_tracker);

  CHAINWEAVE_LOG_INFO("Engine ready", {observability::IntField("plugins", static_cast<std::int64_t>(engine.plugin_registry->Size())),
                                       observability::IntField("worker_threads", config.executor().worker_threads()),
                                       observability::StringField("default_mode", config.executor().default_mode()),
                                       observability::BoolField("archive", engine.run_archive != nullptr)});
  return engine;
}

} // namespace chainweave::factory
