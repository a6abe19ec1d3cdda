#include <gtest/gtest.h>
#include <tollbooth/schema/encoding/scale/encoder.hpp>
#include <tollbooth/schema/key/nonce_record.hpp>
#include <tollbooth/schema/key/payment_record.hpp>
#include <tollbooth/testing/fixtures.hpp>

using namespace tollbooth::schema;

namespace {

using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;

payment_record_t make_record() {
  auto requirement = tollbooth::testing::make_ed25519_requirement(1'000'000);
  auto record = payment_record_t{};
  record.status = payment_status::confirming;
  record.requirement = requirement;
  record.authorization.scheme = payment_scheme::exact;
  record.authorization.network = requirement.network;
  record.authorization.payer = tollbooth::testing::make_address(0x01, 32);
  record.authorization.payee = requirement.pay_to;
  record.authorization.amount = 1'000'000;
  record.authorization.valid_after = 100;
  record.authorization.valid_before = 200;
  record.authorization.nonce = tollbooth::testing::make_hash(7);
  record.authorization.signature = bytes_t(64, 0xab);
  record.id = key::make_payment_id(record.authorization);
  record.transaction_ref = "5VERv8NMvzbJMEkV8xnrLkEaWRtSz9CosKDYjCJjBRnb";
  record.prepared = bytes_t{1, 2, 3};
  record.confirmations = 3;
  record.failure_code = error_code::chain_unavailable;
  record.failure_reason = "node unreachable";
  record.attempts = 2;
  record.created_at = 1'700'000'000'000;
  record.updated_at = 1'700'000'001'000;
  record.deadline = 1'700'000'060'000;
  record.fee = amount_t{"340282366920938463463374607431768211456"};
  return record;
}

}  // namespace

TEST(schema_encoding, payment_record_survives_scale) {
  auto encoder = encoder_t{};
  auto record = make_record();
  auto decoded = encoder.try_decode<payment_record_t>(encoder.encode(record));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->id, record.id);
  EXPECT_EQ(decoded->status, record.status);
  EXPECT_EQ(decoded->requirement, record.requirement);
  EXPECT_EQ(decoded->authorization, record.authorization);
  EXPECT_EQ(decoded->transaction_ref, record.transaction_ref);
  EXPECT_EQ(decoded->prepared, record.prepared);
  EXPECT_EQ(decoded->failure_code, record.failure_code);
  EXPECT_EQ(decoded->failure_reason, record.failure_reason);
  EXPECT_EQ(decoded->attempts, record.attempts);
  EXPECT_EQ(decoded->deadline, record.deadline);
  EXPECT_EQ(decoded->fee, record.fee);
}

TEST(schema_encoding, truncated_bytes_do_not_decode) {
  auto encoder = encoder_t{};
  auto bytes = encoder.encode(make_record());
  bytes.resize(bytes.size() / 2);
  EXPECT_FALSE(encoder.try_decode<payment_record_t>(bytes).has_value());
}

TEST(schema_keys, payment_id_depends_on_payer_network_and_nonce_only) {
  auto record = make_record();
  auto other = record.authorization;
  other.amount = 5;
  other.signature = bytes_t(64, 0x01);
  EXPECT_EQ(key::make_payment_id(other), record.id);

  other.nonce = tollbooth::testing::make_hash(8);
  EXPECT_NE(key::make_payment_id(other), record.id);

  other = record.authorization;
  other.network.name = "solana";
  EXPECT_NE(key::make_payment_id(other), record.id);
}

TEST(schema_keys, open_key_recovers_payment_id) {
  auto id = tollbooth::testing::make_hash(3);
  auto open_key = key::make_open_payment_key(id);
  EXPECT_EQ(make_string(open_key).substr(0, key::kOpenPaymentPrefix.size()),
            key::kOpenPaymentPrefix);
  EXPECT_EQ(key::try_payment_id_from_key(open_key), id);
  EXPECT_EQ(key::try_payment_id_from_key(key::make_payment_key(id)), id);
  EXPECT_FALSE(key::try_payment_id_from_key(bytes_t{1, 2, 3}).has_value());
}

TEST(schema_keys, nonce_keys_are_length_prefixed) {
  auto nonce = tollbooth::testing::make_hash(1);
  // ("ab", "c") and ("a", "bc") must not collide.
  auto first = key::make_nonce_key(make_bytes_view(std::string{"ab"}), "c", nonce);
  auto second =
      key::make_nonce_key(make_bytes_view(std::string{"a"}), "bc", nonce);
  EXPECT_NE(first, second);
  EXPECT_EQ(make_string(first).substr(0, key::kNoncePrefix.size()),
            key::kNoncePrefix);
}
