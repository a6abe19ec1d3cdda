#pragma once
#include <tollbooth/chain/endpoint.hpp>
#include <tollbooth/schema/primitives.hpp>

#include <atomic>
#include <string>

namespace tollbooth::chain {

/// JSON-RPC 2.0 over HTTP POST (libcurl).
class http_endpoint final : public endpoint {
 public:
  http_endpoint(std::string url,
                tollbooth::schema::duration_milliseconds_t timeout);

  google::protobuf::Value call(
      std::string_view method,
      const google::protobuf::ListValue& params) override;

  const std::string& url() const override { return url_; }

 private:
  std::string url_;
  tollbooth::schema::duration_milliseconds_t timeout_;
  std::atomic<uint64_t> next_id_{1};
};

/// Builds the request document {"jsonrpc":"2.0","id":..,"method":..,"params":..}.
std::string make_json_rpc_request(uint64_t id,
                                  std::string_view method,
                                  const google::protobuf::ListValue& params);

/// Returns `result`, throws json_rpc_error for an `error` member and
/// chain_unavailable for a body that is not a JSON-RPC response. Server side
/// failures (-32603 internal error, -32005 limit exceeded) count as transient.
google::protobuf::Value parse_json_rpc_response(std::string_view body);

}  // namespace tollbooth::chain
