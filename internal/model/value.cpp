#include "internal/model/value.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <cmath>
#include <sstream>

namespace chainweave::model {

Value StringValue(std::string_view text) {
  Value value;
  value.set_string_value(std::string(text));
  return value;
}

Value NumberValue(double number) {
  Value value;
  value.set_number_value(number);
  return value;
}

Value BoolValue(bool flag) {
  Value value;
  value.set_bool_value(flag);
  return value;
}

std::string ValueToString(const Value& value) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      return value.string_value();
    case Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    case Value::kNumberValue: {
      const double number = value.number_value();
      if (std::floor(number) == number && std::fabs(number) < 1e15) {
        return std::to_string(static_cast<long long>(number));
      }
      std::ostringstream out;
      out << number;
      return out.str();
    }
    case Value::kNullValue:
    case Value::KIND_NOT_SET:
      return "";
    default:
      break;
  }

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(value, &json).ok()) {
    return "";
  }
  return json;
}

bool ValuesEqual(const Value& lhs, const Value& rhs) {
  return google::protobuf::util::MessageDifferencer::Equals(lhs, rhs);
}

bool ValueMapsEqual(const ValueMap& lhs, const ValueMap& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (auto l = lhs.begin(), r = rhs.begin(); l != lhs.end(); ++l, ++r) {
    if (l->first != r->first || !ValuesEqual(l->second, r->second)) {
      return false;
    }
  }
  return true;
}

} // namespace chainweave::model
