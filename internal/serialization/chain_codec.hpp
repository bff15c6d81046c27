#pragma once

#include <string>

#include "chainweave/v1.hpp"
#include "internal/model/chain.hpp"
#include "internal/model/chain_run.hpp"

namespace chainweave::serialization {

/*
  Conversions between the in-memory chain model and the
  chainweave.chain.v1 protobuf messages.
*/

v1::Chain ToProto(const model::Chain& chain);

// Validates the decoded chain's structure and, when present, its
// fingerprint. Throws util::InvalidArgument or a util::BuildError.
model::Chain FromProto(const v1::Chain& proto);

v1::ChainRun ToProto(const model::ChainRun& run);

v1::ExecutionMode ToProto(model::ExecutionMode mode);
v1::RunStatus     ToProto(model::RunStatus status);
v1::NodeStatus    ToProto(model::NodeStatus status);

// Deterministic wire bytes; identical chains give identical bytes.
std::string SerializeChain(const model::Chain& chain);

// protobuf JSON mapping; throws util::InvalidArgument on failure
std::string ToJson(const google::protobuf::Message& message, bool pretty = false);
void        FromJson(const std::string& json, google::protobuf::Message* message);

} // namespace chainweave::serialization
