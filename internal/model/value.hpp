#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

namespace chainweave::model {

// Open vocabulary type tag, e.g. "data/raw". Matched by equality only.
using TypeTag = std::string;
using TagSet  = std::set<TypeTag>;

// Values exchanged between plugins, keyed by type tag.
using Value    = google::protobuf::Value;
using ValueMap = std::map<TypeTag, Value>;

Value StringValue(std::string_view text);
Value NumberValue(double number);
Value BoolValue(bool flag);

// Plain rendering for strings/numbers/bools, JSON for everything else.
std::string ValueToString(const Value& value);

bool ValuesEqual(const Value& lhs, const Value& rhs);
bool ValueMapsEqual(const ValueMap& lhs, const ValueMap& rhs);

} // namespace chainweave::model
