#pragma once

#include <string>
#include <vector>

#include <google/protobuf/message.h>
#include <google/protobuf/repeated_ptr_field.h>

namespace ainp::util {

/*
  Protobuf <-> JSON helpers for the JSON columns of the store.

  Field names are kept in their proto (snake_case) form so rows stay
  readable from SQL. Parsing ignores unknown fields: rows written by a
  newer build must still load.
*/

std::string ToJson(const google::protobuf::Message& message);
void        FromJson(const std::string& json, google::protobuf::Message* message);

// JSON array of messages, e.g. the negotiation rounds column.
std::string              ToJsonArray(const std::vector<const google::protobuf::Message*>& messages);
std::vector<std::string> SplitJsonArray(const std::string& json);

template <typename T>
std::string RepeatedToJson(const google::protobuf::RepeatedPtrField<T>& items) {
  std::vector<const google::protobuf::Message*> messages;
  messages.reserve(items.size());
  for (const auto& item : items) {
    messages.push_back(&item);
  }
  return ToJsonArray(messages);
}

template <typename T>
void RepeatedFromJson(const std::string& json, google::protobuf::RepeatedPtrField<T>* out) {
  out->Clear();
  for (const auto& element : SplitJsonArray(json)) {
    FromJson(element, out->Add());
  }
}

} // namespace ainp::util
