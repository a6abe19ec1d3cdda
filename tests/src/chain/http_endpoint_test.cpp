#include <gtest/gtest.h>
#include <tollbooth/chain/errors.hpp>
#include <tollbooth/chain/http_endpoint.hpp>
#include <tollbooth/chain/json.hpp>

namespace json = tollbooth::chain::json;
using tollbooth::chain::make_json_rpc_request;
using tollbooth::chain::parse_json_rpc_response;

TEST(http_endpoint, request_is_json_rpc_2) {
  auto body = make_json_rpc_request(
      7, "eth_getTransactionReceipt", json::params({json::string("0xabc")}));
  auto document = json::parse(body);
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ(json::string_field(*document, "jsonrpc"), "2.0");
  EXPECT_EQ(json::number_field(*document, "id"), 7.0);
  EXPECT_EQ(json::string_field(*document, "method"),
            "eth_getTransactionReceipt");
  const auto* params = json::field(*document, "params");
  ASSERT_NE(params, nullptr);
  ASSERT_EQ(params->list_value().values_size(), 1);
  EXPECT_EQ(params->list_value().values(0).string_value(), "0xabc");
}

TEST(http_endpoint, response_result_is_returned) {
  auto result =
      parse_json_rpc_response(R"({"jsonrpc":"2.0","id":1,"result":"0x2a"})");
  EXPECT_EQ(result.string_value(), "0x2a");

  auto empty =
      parse_json_rpc_response(R"({"jsonrpc":"2.0","id":1,"result":null})");
  EXPECT_TRUE(json::is_null(empty));
}

TEST(http_endpoint, node_errors_are_rejections) {
  try {
    parse_json_rpc_response(
        R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"nonce too low"}})");
    FAIL() << "expected json_rpc_error";
  } catch (const tollbooth::chain::json_rpc_error& e) {
    EXPECT_EQ(e.code(), -32000);
    EXPECT_EQ(e.rpc_message(), "nonce too low");
  }
}

TEST(http_endpoint, server_side_errors_are_transient) {
  EXPECT_THROW(
      parse_json_rpc_response(
          R"({"jsonrpc":"2.0","id":1,"error":{"code":-32603,"message":"internal"}})"),
      tollbooth::chain::chain_unavailable);
  EXPECT_THROW(
      parse_json_rpc_response(
          R"({"jsonrpc":"2.0","id":1,"error":{"code":-32005,"message":"limit"}})"),
      tollbooth::chain::chain_unavailable);
}

TEST(http_endpoint, garbage_is_transient) {
  EXPECT_THROW(parse_json_rpc_response("<html>502 Bad Gateway</html>"),
               tollbooth::chain::chain_unavailable);
  EXPECT_THROW(parse_json_rpc_response(R"({"jsonrpc":"2.0","id":1})"),
               tollbooth::chain::chain_unavailable);
  EXPECT_THROW(parse_json_rpc_response(""), tollbooth::chain::chain_unavailable);
}

TEST(http_endpoint, unreachable_host_is_transient) {
  auto endpoint = tollbooth::chain::http_endpoint{"http://127.0.0.1:1", 500};
  EXPECT_THROW(endpoint.call("eth_blockNumber", json::params({})),
               tollbooth::chain::chain_unavailable);
}
