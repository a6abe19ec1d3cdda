#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

// Builders and accessors over google::protobuf::Value, the JSON document model
// of the RPC transport.
namespace tollbooth::chain::json {

google::protobuf::Value string(std::string_view value);
google::protobuf::Value number(double value);
google::protobuf::Value boolean(bool value);
google::protobuf::Value null();
google::protobuf::Value list(std::initializer_list<google::protobuf::Value> values);
google::protobuf::Value object(
    std::initializer_list<std::pair<std::string_view, google::protobuf::Value>>
        fields);

google::protobuf::ListValue params(
    std::initializer_list<google::protobuf::Value> values);

bool is_null(const google::protobuf::Value& value);

const google::protobuf::Value* field(const google::protobuf::Value& value,
                                     std::string_view name);
std::optional<std::string> string_field(const google::protobuf::Value& value,
                                        std::string_view name);
std::optional<double> number_field(const google::protobuf::Value& value,
                                   std::string_view name);

std::string to_string(const google::protobuf::Value& value);
std::optional<google::protobuf::Value> parse(std::string_view text);

}  // namespace tollbooth::chain::json
