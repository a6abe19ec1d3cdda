#include <tollbooth/chain/json.hpp>

#include <google/protobuf/util/json_util.h>

namespace tollbooth::chain::json {

google::protobuf::Value string(const std::string_view value) {
  auto out = google::protobuf::Value{};
  out.set_string_value(std::string{value});
  return out;
}

google::protobuf::Value number(const double value) {
  auto out = google::protobuf::Value{};
  out.set_number_value(value);
  return out;
}

google::protobuf::Value boolean(const bool value) {
  auto out = google::protobuf::Value{};
  out.set_bool_value(value);
  return out;
}

google::protobuf::Value null() {
  auto out = google::protobuf::Value{};
  out.set_null_value(google::protobuf::NULL_VALUE);
  return out;
}

google::protobuf::Value list(
    std::initializer_list<google::protobuf::Value> values) {
  auto out = google::protobuf::Value{};
  auto* items = out.mutable_list_value();
  for (const auto& value : values) {
    *items->add_values() = value;
  }
  return out;
}

google::protobuf::Value object(
    std::initializer_list<std::pair<std::string_view, google::protobuf::Value>>
        fields) {
  auto out = google::protobuf::Value{};
  auto* members = out.mutable_struct_value()->mutable_fields();
  for (const auto& [name, value] : fields) {
    (*members)[std::string{name}] = value;
  }
  return out;
}

google::protobuf::ListValue params(
    std::initializer_list<google::protobuf::Value> values) {
  auto out = google::protobuf::ListValue{};
  for (const auto& value : values) {
    *out.add_values() = value;
  }
  return out;
}

bool is_null(const google::protobuf::Value& value) {
  return value.kind_case() == google::protobuf::Value::kNullValue ||
         value.kind_case() == google::protobuf::Value::KIND_NOT_SET;
}

const google::protobuf::Value* field(const google::protobuf::Value& value,
                                     const std::string_view name) {
  if (!value.has_struct_value()) {
    return nullptr;
  }
  const auto& fields = value.struct_value().fields();
  auto it = fields.find(std::string{name});
  if (it == fields.end()) {
    return nullptr;
  }
  return &it->second;
}

std::optional<std::string> string_field(const google::protobuf::Value& value,
                                        const std::string_view name) {
  const auto* member = field(value, name);
  if (member == nullptr || !member->has_string_value()) {
    return std::nullopt;
  }
  return member->string_value();
}

std::optional<double> number_field(const google::protobuf::Value& value,
                                   const std::string_view name) {
  const auto* member = field(value, name);
  if (member == nullptr || !member->has_number_value()) {
    return std::nullopt;
  }
  return member->number_value();
}

std::string to_string(const google::protobuf::Value& value) {
  auto out = std::string{};
  auto status = google::protobuf::util::MessageToJsonString(value, &out);
  if (!status.ok()) {
    return {};
  }
  return out;
}

std::optional<google::protobuf::Value> parse(const std::string_view text) {
  auto out = google::protobuf::Value{};
  auto options = google::protobuf::util::JsonParseOptions{};
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(
      std::string{text}, &out, options);
  if (!status.ok()) {
    return std::nullopt;
  }
  return out;
}

}  // namespace tollbooth::chain::json
