#include "json.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace ainp::util {

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize " + message.GetTypeName() + " to JSON: " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to parse " + message->GetTypeName() + " from JSON: " + std::string(status.message()));
  }
}

std::string ToJsonArray(const std::vector<const google::protobuf::Message*>& messages) {
  std::string out = "[";
  bool        first = true;
  for (const auto* message : messages) {
    if (!first) {
      out += ',';
    }
    first = false;
    out += ToJson(*message);
  }
  out += ']';
  return out;
}

std::vector<std::string> SplitJsonArray(const std::string& json) {
  if (json.empty()) {
    return {};
  }

  google::protobuf::ListValue list;
  FromJson(json, &list);

  std::vector<std::string> elements;
  elements.reserve(list.values_size());
  for (const auto& value : list.values()) {
    elements.push_back(ToJson(value));
  }
  return elements;
}

} // namespace ainp::util
