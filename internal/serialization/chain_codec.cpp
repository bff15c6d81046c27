#include "internal/serialization/chain_codec.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/json_util.h>

#include "internal/chain/chain_validator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace chainweave::serialization {

namespace {

void FillError(const model::ErrorInfo& error, v1::ErrorInfo* out) {
  out->set_code(error.code);
  out->set_message(error.message);
}

void FillTime(util::TimePoint tp, google::protobuf::Timestamp* out) {
  if (tp == util::TimePoint{}) return;
  *out = util::ToProto(tp);
}

} // namespace

v1::Chain ToProto(const model::Chain& chain) {
  v1::Chain out;

  out.mutable_goal()->set_required_output_tag(chain.goal.required_output_tag);
  for (const auto& tag : chain.goal.seed_inputs) {
    out.mutable_goal()->add_seed_inputs(tag);
  }

  for (const auto& node : chain.nodes) {
    auto* n = out.add_nodes();
    n->set_id(node.id);
    n->set_plugin_name(node.plugin_name);
    for (const auto& [tag, producer] : node.resolved_inputs) {
      (*n->mutable_resolved_inputs())[tag] = producer;
    }
    for (const auto& tag : node.seed_inputs) {
      n->add_seed_inputs(tag);
    }
  }

  for (const auto& edge : chain.edges) {
    auto* e = out.add_edges();
    e->set_producer_node_id(edge.producer_node_id);
    e->set_consumer_node_id(edge.consumer_node_id);
    e->set_tag(edge.tag);
  }

  out.set_goal_node_id(chain.goal_node_id);
  out.set_fingerprint(chain.fingerprint);
  return out;
}

model::Chain FromProto(const v1::Chain& proto) {
  model::Chain chain;

  chain.goal.required_output_tag = proto.goal().required_output_tag();
  chain.goal.seed_inputs.insert(proto.goal().seed_inputs().begin(), proto.goal().seed_inputs().end());

  for (const auto& n : proto.nodes()) {
    model::ChainNode node;
    node.id          = n.id();
    node.plugin_name = n.plugin_name();
    for (const auto& [tag, producer] : n.resolved_inputs()) {
      node.resolved_inputs[tag] = producer;
    }
    node.seed_inputs.insert(n.seed_inputs().begin(), n.seed_inputs().end());
    chain.nodes.push_back(std::move(node));
  }

  for (const auto& e : proto.edges()) {
    chain.edges.push_back(model::ChainEdge{e.producer_node_id(), e.consumer_node_id(), e.tag()});
  }

  chain.goal_node_id = proto.goal_node_id();
  chain.fingerprint  = model::ComputeFingerprint(chain);

  if (!proto.fingerprint().empty() && proto.fingerprint() != chain.fingerprint) {
    throw util::InvalidArgument("chain fingerprint mismatch: expected " + proto.fingerprint() + ", computed " + chain.fingerprint);
  }

  chain::ValidateChain(chain);
  return chain;
}

v1::ExecutionMode ToProto(model::ExecutionMode mode) {
  switch (mode) {
    case model::ExecutionMode::kSequential:
      return v1::EXECUTION_MODE_SEQUENTIAL;
    case model::ExecutionMode::kParallel:
      return v1::EXECUTION_MODE_PARALLEL;
    case model::ExecutionMode::kAdaptive:
      return v1::EXECUTION_MODE_ADAPTIVE;
  }
  return v1::EXECUTION_MODE_UNSPECIFIED;
}

v1::RunStatus ToProto(model::RunStatus status) {
  switch (status) {
    case model::RunStatus::kPending:
      return v1::RUN_STATUS_PENDING;
    case model::RunStatus::kRunning:
      return v1::RUN_STATUS_RUNNING;
    case model::RunStatus::kSucceeded:
      return v1::RUN_STATUS_SUCCEEDED;
    case model::RunStatus::kPartialFailure:
      return v1::RUN_STATUS_PARTIAL_FAILURE;
    case model::RunStatus::kFailed:
      return v1::RUN_STATUS_FAILED;
    case model::RunStatus::kCancelled:
      return v1::RUN_STATUS_CANCELLED;
  }
  return v1::RUN_STATUS_UNSPECIFIED;
}

v1::NodeStatus ToProto(model::NodeStatus status) {
  switch (status) {
    case model::NodeStatus::kPending:
      return v1::NODE_STATUS_PENDING;
    case model::NodeStatus::kRunning:
      return v1::NODE_STATUS_RUNNING;
    case model::NodeStatus::kSucceeded:
      return v1::NODE_STATUS_SUCCEEDED;
    case model::NodeStatus::kFailed:
      return v1::NODE_STATUS_FAILED;
    case model::NodeStatus::kSkipped:
      return v1::NODE_STATUS_SKIPPED;
  }
  return v1::NODE_STATUS_UNSPECIFIED;
}

v1::ChainRun ToProto(const model::ChainRun& run) {
  v1::ChainRun out;
  out.set_run_id(run.run_id);
  if (run.chain) {
    *out.mutable_chain() = ToProto(*run.chain);
  }
  out.set_mode(ToProto(run.mode));
  out.set_status(ToProto(run.status));
  FillTime(run.started_at, out.mutable_started_at());
  FillTime(run.ended_at, out.mutable_ended_at());
  out.set_aborted(run.aborted);
  if (run.error) {
    FillError(*run.error, out.mutable_error());
  }

  auto append = [&out](const std::string& node_id, const model::NodeState& state) {
    auto* n = out.add_node_states();
    n->set_node_id(node_id);
    n->set_status(ToProto(state.status));
    for (const auto& [tag, value] : state.output) {
      (*n->mutable_output())[tag] = value;
    }
    if (state.error) {
      FillError(*state.error, n->mutable_error());
    }
    FillTime(state.started_at, n->mutable_started_at());
    FillTime(state.ended_at, n->mutable_ended_at());
  };

  // chain order when the chain is known
  if (run.chain) {
    for (const auto& node : run.chain->nodes) {
      if (const auto* state = run.FindNode(node.id)) append(node.id, *state);
    }
  } else {
    for (const auto& [node_id, state] : run.node_states) {
      append(node_id, state);
    }
  }
  return out;
}

std::string SerializeChain(const model::Chain& chain) {
  const auto  proto = ToProto(chain);
  std::string out;
  {
    google::protobuf::io::StringOutputStream stream(&out);
    google::protobuf::io::CodedOutputStream  coded(&stream);
    coded.SetSerializationDeterministic(true);
    if (!proto.SerializeToCodedStream(&coded)) {
      throw util::InvalidArgument("failed to serialize chain");
    }
  }
  return out;
}

std::string ToJson(const google::protobuf::Message& message, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = pretty;
  options.preserve_proto_field_names    = true;
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::InvalidArgument("failed to encode " + message.GetTypeName() + " as JSON: " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  auto status                   = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::InvalidArgument("failed to decode " + message->GetTypeName() + " from JSON: " + std::string(status.message()));
  }
}

} // namespace chainweave::serialization
