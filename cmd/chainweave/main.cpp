#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/executor/chain_executor.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/serialization/chain_codec.hpp"
#include "internal/util/errors.hpp"

using chainweave::factory::Engine;

static void Usage() {
  std::cout << "Usage:\n"
            << "  chainweave <config.yaml> plugins\n"
            << "  chainweave <config.yaml> plan <tag> [--seed tag[=value]]... [--json]\n"
            << "  chainweave <config.yaml> run <tag> [--mode sequential|parallel|adaptive] [--fail-fast] [--seed tag=value]... [--json]\n"
            << "  chainweave <config.yaml> suggest <text...>\n"
            << "  chainweave <config.yaml> history [limit]\n";
}

struct GoalArgs {
  chainweave::model::ChainGoal goal;
  chainweave::model::ValueMap  seeds;

  std::optional<chainweave::model::ExecutionMode> mode;

  bool fail_fast = false;
  bool json      = false;
};

static GoalArgs ParseGoalArgs(int argc, char** argv, int first) {
  GoalArgs args;
  args.goal.required_output_tag = argv[first];

  for (int i = first + 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--fail-fast") {
      args.fail_fast = true;
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--mode" && i + 1 < argc) {
      args.mode = chainweave::model::ParseExecutionMode(argv[++i]);
      if (!args.mode) {
        throw chainweave::util::InvalidArgument(std::string("unsupported mode: ") + argv[i]);
      }
    } else if (arg == "--seed" && i + 1 < argc) {
      const std::string seed = argv[++i];
      const auto        eq   = seed.find('=');
      const auto        tag  = seed.substr(0, eq);
      if (tag.empty()) {
        throw chainweave::util::InvalidArgument("empty seed tag");
      }
      args.goal.seed_inputs.insert(tag);
      if (eq != std::string::npos) {
        args.seeds[tag] = chainweave::model::StringValue(seed.substr(eq + 1));
      }
    } else {
      throw chainweave::util::InvalidArgument("unexpected argument: " + arg);
    }
  }
  return args;
}

static void PrintChain(const chainweave::model::Chain& chain) {
  std::cout << "goal=" << chain.goal.required_output_tag << " fingerprint=" << chain.fingerprint << "\n";
  for (const auto& node : chain.nodes) {
    std::cout << "  " << node.id;
    for (const auto& [tag, producer] : node.resolved_inputs) {
      std::cout << " " << tag << "<-" << producer;
    }
    for (const auto& tag : node.seed_inputs) {
      std::cout << " " << tag << "<-seed";
    }
    std::cout << "\n";
  }
}

static int CmdPlugins(const Engine& engine) {
  for (const auto& d : engine.plugin_registry->List()) {
    std::cout << d.name;
    if (!d.version.empty()) std::cout << "@" << d.version;
    std::cout << " in=[";
    const char* sep = "";
    for (const auto& tag : d.input_types) {
      std::cout << sep << tag;
      sep = ",";
    }
    std::cout << "] out=[";
    sep = "";
    for (const auto& tag : d.output_types) {
      std::cout << sep << tag;
      sep = ",";
    }
    std::cout << "] priority=" << d.chain_priority << " auto_chain=" << (d.auto_chain ? "true" : "false") << "\n";
  }
  return 0;
}

static int CmdPlan(const Engine& engine, const GoalArgs& args) {
  auto chain = engine.chain_builder->Build(args.goal);
  if (args.json) {
    std::cout << chainweave::serialization::ToJson(chainweave::serialization::ToProto(chain), true) << "\n";
  } else {
    PrintChain(chain);
  }
  return 0;
}

static int CmdRun(const Engine& engine, const GoalArgs& args) {
  auto chain = engine.chain_builder->Build(args.goal);

  auto options        = engine.DefaultRunOptions();
  options.fail_fast   = options.fail_fast || args.fail_fast;
  options.seed_values = args.seeds;

  auto run = engine.chain_executor->RunChain(chain, args.mode.value_or(engine.default_mode), options);
  engine.state_store->Cleanup(run.run_id);

  if (args.json) {
    std::cout << chainweave::serialization::ToJson(chainweave::serialization::ToProto(run), true) << "\n";
  } else {
    std::cout << "run=" << run.run_id << " status=" << chainweave::model::ToString(run.status) << "\n";
    for (const auto& node : chain.nodes) {
      const auto& state = run.node_states.at(node.id);
      std::cout << "  " << node.id << " " << chainweave::model::ToString(state.status);
      if (state.error) std::cout << " " << state.error->code << ": " << state.error->message;
      std::cout << "\n";
    }
    if (auto output = chainweave::executor::GoalOutput(run)) {
      std::cout << chain.goal.required_output_tag << " = " << chainweave::model::ValueToString(*output) << "\n";
    }
  }
  return run.status == chainweave::model::RunStatus::kSucceeded ? 0 : 3;
}

static int CmdSuggest(const Engine& engine, int argc, char** argv, int first) {
  std::string text;
  for (int i = first; i < argc; ++i) {
    if (!text.empty()) text += " ";
    text += argv[i];
  }

  const auto suggestions = engine.suggestion_engine->SuggestChains(text);
  if (suggestions.empty()) {
    std::cout << "no suggestions\n";
    return 0;
  }
  for (const auto& s : suggestions) {
    std::cout << "confidence=" << s.confidence << " estimated_ms=" << s.estimated_duration_ms << " ";
    PrintChain(s.chain_sketch);
    for (const auto& reason : s.rationale) {
      std::cout << "    - " << reason << "\n";
    }
  }
  return 0;
}

static int CmdHistory(const Engine& engine, std::size_t limit) {
  if (!engine.run_archive) {
    std::cerr << "no run archive configured\n";
    return 1;
  }
  auto tx = engine.run_archive->Begin();
  for (const auto& record : engine.run_archive->ListRuns(*tx, limit)) {
    std::cout << record.run_id << " " << record.goal_tag << " " << record.mode << " " << record.status
              << " duration_ms=" << (record.ended_at_ms - record.started_at_ms) << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = chainweave::config::ConfigLoader::LoadFromYaml(config_path);
    chainweave::observability::InitializeLogging(config.logging());

    auto engine = chainweave::factory::Build(config);
    int  rc     = 1;

    if (cmd == "plugins") {
      rc = CmdPlugins(engine);
    } else if ((cmd == "plan" || cmd == "run") && argc >= 4) {
      const auto args = ParseGoalArgs(argc, argv, 3);
      rc              = cmd == "plan" ? CmdPlan(engine, args) : CmdRun(engine, args);
    } else if (cmd == "suggest" && argc >= 4) {
      rc = CmdSuggest(engine, argc, argv, 3);
    } else if (cmd == "history") {
      rc = CmdHistory(engine, argc >= 4 ? std::stoul(argv[3]) : 20);
    } else {
      Usage();
    }

    engine.worker_pool->Stop();
    chainweave::observability::ShutdownLogging();
    return rc;
  } catch (const chainweave::util::BuildError& e) {
    CHAINWEAVE_LOG_ERROR("Chain build failed", {chainweave::observability::StringField("tag", e.tag()),
                                                chainweave::observability::StringField("error", e.what())});
  } catch (const std::exception& e) {
    CHAINWEAVE_LOG_ERROR("Fatal error", {chainweave::observability::StringField("error", e.what())});
  }
  chainweave::observability::ShutdownLogging();
  return 2;
}
