#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <string_view>

namespace tollbooth::chain {

/// One JSON-RPC node. `call` returns the response's `result`, or throws
/// chain_unavailable (transport) / json_rpc_error (the node refused).
struct endpoint {
  virtual ~endpoint() = default;

  virtual google::protobuf::Value call(
      std::string_view method,
      const google::protobuf::ListValue& params) = 0;

  virtual const std::string& url() const = 0;
};

}  // namespace tollbooth::chain
