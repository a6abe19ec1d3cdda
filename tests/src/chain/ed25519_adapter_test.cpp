#include <gtest/gtest.h>
#include <tollbooth/chain/ed25519_adapter.hpp>
#include <tollbooth/chain/errors.hpp>
#include <tollbooth/chain/json.hpp>
#include <tollbooth/crypto/verify.hpp>
#include <tollbooth/schema/key/builder.hpp>
#include <tollbooth/testing/fixtures.hpp>
#include <tollbooth/testing/scripted_endpoint.hpp>

using namespace tollbooth::schema;
namespace chain = tollbooth::chain;
namespace json = tollbooth::chain::json;

namespace {

google::protobuf::Value parse(const std::string_view text) {
  return json::parse(text).value_or(json::null());
}

google::protobuf::Value signature_status(const std::string_view entry) {
  return parse(R"({"context":{"slot":1},"value":[)" + std::string{entry} +
               "]}");
}

class ed25519_adapter_test : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!tollbooth::crypto::available()) {
      GTEST_SKIP() << "Ed25519 is not available";
    }
    auto signer = tollbooth::crypto::ed25519_signer::from_seed(
        tollbooth::testing::make_hash(0x50));
    ASSERT_TRUE(signer.has_value());
    facilitator_key = signer->public_key();

    node = std::make_shared<tollbooth::testing::scripted_endpoint>();
    auto pool = std::make_shared<chain::endpoint_pool>(
        "solana-devnet",
        std::vector<std::shared_ptr<chain::endpoint>>{node},
        chain::breaker_options{}, clock.fn());
    adapter = std::make_unique<chain::ed25519_adapter>(
        *signer, std::vector<chain::network_binding>{chain::network_binding{
                     .network = tollbooth::testing::devnet(),
                     .required_confirmations = 2,
                     .pool = pool}});

    payer = tollbooth::testing::make_ed25519_payer(7);
    ASSERT_TRUE(payer.has_value());
    requirement = tollbooth::testing::make_ed25519_requirement(1000);
    authorization = tollbooth::testing::make_ed25519_authorization(
        *payer, requirement, 1000, clock.now_seconds(), 1);
  }

  tollbooth::testing::manual_clock clock;
  bytes_t facilitator_key;
  std::shared_ptr<tollbooth::testing::scripted_endpoint> node;
  std::unique_ptr<chain::ed25519_adapter> adapter;
  std::optional<tollbooth::crypto::ed25519_signer> payer;
  payment_requirement_t requirement;
  payment_authorization_t authorization;
};

}  // namespace

TEST(ed25519_envelope, encode_decode) {
  auto envelope = chain::ed25519_envelope{
      .message = bytes_t{1, 2, 3},
      .payer_signature = bytes_t(64, 0xaa),
      .facilitator_public_key = bytes_t(32, 0xbb),
      .facilitator_signature = bytes_t(64, 0xcc)};
  auto encoded = chain::encode_envelope(envelope);
  ASSERT_EQ(encoded.size(), 4u + 3u + 64u + 32u + 64u);

  auto decoded = chain::decode_envelope(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->message, envelope.message);
  EXPECT_EQ(decoded->payer_signature, envelope.payer_signature);
  EXPECT_EQ(decoded->facilitator_public_key, envelope.facilitator_public_key);
  EXPECT_EQ(decoded->facilitator_signature, envelope.facilitator_signature);

  encoded.pop_back();
  EXPECT_FALSE(chain::decode_envelope(encoded).has_value());
  EXPECT_FALSE(chain::decode_envelope(bytes_t{1, 0}).has_value());
}

TEST_F(ed25519_adapter_test, prepare_cosigns_envelope) {
  auto prepared = adapter->prepare(authorization, requirement);
  auto envelope = chain::decode_envelope(prepared.raw);
  ASSERT_TRUE(envelope.has_value());
  EXPECT_EQ(envelope->payer_signature, authorization.signature);
  EXPECT_EQ(envelope->facilitator_public_key, facilitator_key);
  EXPECT_EQ(prepared.reference, to_base58(envelope->facilitator_signature));

  auto signed_part = tollbooth::schema::key::builder{};
  signed_part.write_prefixed(envelope->message);
  signed_part.write(envelope->payer_signature);
  EXPECT_TRUE(tollbooth::crypto::verify_ed25519(
      signed_part.data, facilitator_key, envelope->facilitator_signature));

  // Same authorization, same bytes, same reference.
  EXPECT_EQ(adapter->prepare(authorization, requirement).reference,
            prepared.reference);
  EXPECT_TRUE(node->calls().empty());
}

TEST_F(ed25519_adapter_test, prepare_rejects_bad_payer_signature) {
  authorization.signature.resize(10);
  EXPECT_THROW(adapter->prepare(authorization, requirement),
               chain::chain_rejected);
}

TEST_F(ed25519_adapter_test, unconfigured_network_is_rejected) {
  auto mainnet = *try_make_network("solana");
  EXPECT_FALSE(adapter->supports(mainnet));
  EXPECT_TRUE(adapter->supports(tollbooth::testing::devnet()));
  requirement.network = mainnet;
  EXPECT_THROW(adapter->estimate_fee(requirement), chain::chain_rejected);
}

TEST_F(ed25519_adapter_test, fee_covers_two_signatures) {
  auto fee = adapter->estimate_fee(requirement);
  EXPECT_EQ(fee.amount, amount_t{10'000});
  EXPECT_EQ(fee.unit, "lamports");
}

TEST_F(ed25519_adapter_test, submit_sends_base64_envelope) {
  auto prepared = adapter->prepare(authorization, requirement);
  node->reply("sendTransaction", json::string(prepared.reference));

  EXPECT_EQ(adapter->submit(requirement.network, prepared), prepared.reference);
  auto calls = node->calls();
  ASSERT_EQ(calls.size(), 1u);
  auto params = json::parse(calls.front().params);
  ASSERT_TRUE(params.has_value());
  ASSERT_EQ(params->list_value().values_size(), 2);
  EXPECT_EQ(params->list_value().values(0).string_value(),
            to_base64(prepared.raw));
  EXPECT_EQ(json::string_field(params->list_value().values(1), "encoding"),
            "base64");
}

TEST_F(ed25519_adapter_test, resubmit_is_idempotent) {
  auto prepared = adapter->prepare(authorization, requirement);
  node->reply("sendTransaction",
              tollbooth::testing::rpc_error{
                  -32002, "Transaction simulation failed: This transaction "
                          "has already been processed"});
  node->reply("sendTransaction",
              tollbooth::testing::rpc_error{-32002, "AlreadyProcessed"});
  EXPECT_EQ(adapter->submit(requirement.network, prepared), prepared.reference);
  EXPECT_EQ(adapter->submit(requirement.network, prepared), prepared.reference);
}

TEST_F(ed25519_adapter_test, submit_errors_propagate) {
  auto prepared = adapter->prepare(authorization, requirement);
  node->reply("sendTransaction", tollbooth::testing::rpc_error{
                                     -32002, "insufficient funds for fee"});
  EXPECT_THROW(adapter->submit(requirement.network, prepared),
               chain::chain_rejected);

  node->reply("sendTransaction", tollbooth::testing::unavailable{});
  EXPECT_THROW(adapter->submit(requirement.network, prepared),
               chain::chain_unavailable);
}

TEST_F(ed25519_adapter_test, status_maps_signature_statuses) {
  const auto& network = requirement.network;
  node->reply("getSignatureStatuses", signature_status("null"));
  node->reply("getSignatureStatuses",
              signature_status(R"({"confirmations":null,"err":{"InstructionError":[0,"Custom"]},"confirmationStatus":"finalized"})"));
  node->reply("getSignatureStatuses",
              signature_status(R"({"confirmations":null,"err":null,"confirmationStatus":"finalized"})"));
  node->reply("getSignatureStatuses",
              signature_status(R"({"confirmations":0,"err":null,"confirmationStatus":"processed"})"));
  node->reply("getSignatureStatuses",
              signature_status(R"({"confirmations":5,"err":null,"confirmationStatus":"confirmed"})"));

  EXPECT_TRUE(std::holds_alternative<chain::tx_not_found>(
      adapter->status(network, "sig")));

  auto failed = adapter->status(network, "sig");
  ASSERT_TRUE(std::holds_alternative<chain::tx_failed>(failed));
  EXPECT_NE(std::get<chain::tx_failed>(failed).reason.find("InstructionError"),
            std::string::npos);

  auto finalized = adapter->status(network, "sig");
  ASSERT_TRUE(std::holds_alternative<chain::tx_confirmed>(finalized));
  EXPECT_EQ(std::get<chain::tx_confirmed>(finalized).confirmations, 2u);

  EXPECT_TRUE(std::holds_alternative<chain::tx_pending>(
      adapter->status(network, "sig")));

  auto confirmed = adapter->status(network, "sig");
  ASSERT_TRUE(std::holds_alternative<chain::tx_confirmed>(confirmed));
  EXPECT_EQ(std::get<chain::tx_confirmed>(confirmed).confirmations, 5u);
}

TEST_F(ed25519_adapter_test, malformed_status_is_transient) {
  node->reply("getSignatureStatuses", parse(R"({"value":[]})"));
  EXPECT_THROW(adapter->status(requirement.network, "sig"),
               chain::chain_unavailable);
}
