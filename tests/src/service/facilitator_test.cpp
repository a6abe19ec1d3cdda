#include <gtest/gtest.h>
#include <tollbooth/crypto/verify.hpp>
#include <tollbooth/schema/key/payment_record.hpp>
#include <tollbooth/service/facilitator.hpp>
#include <tollbooth/testing/fixtures.hpp>

#include <thread>

using namespace std::chrono_literals;
using namespace tollbooth::schema;
using tollbooth::service::facilitator;
using tollbooth::service::facilitator_options;

namespace {

struct fixed_oracle final : tollbooth::verification::pricing_oracle {
  std::optional<amount_t> quote(const payment_requirement_t&) const override {
    return amount_t{750};
  }
};

class facilitator_test : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!tollbooth::crypto::available()) {
      GTEST_SKIP() << "Ed25519 is not available";
    }
    payer = tollbooth::testing::make_ed25519_payer(7);
    ASSERT_TRUE(payer.has_value());
    adapter = std::make_shared<tollbooth::testing::fake_adapter>(
        std::vector<network_t>{tollbooth::testing::devnet(), devchain()});
    sink = std::make_shared<tollbooth::testing::recording_sink>();
    requirement = tollbooth::testing::make_ed25519_requirement(1000, 900);
    authorization = tollbooth::testing::make_ed25519_authorization(
        *payer, requirement, 1000, clock.now_seconds(), 1);
  }

  static network_t devchain() {
    return network_t{
        .name = "devchain", .family = chain_family::ed25519, .chain_id = 9000};
  }

  std::unique_ptr<facilitator> make_facilitator(
      std::shared_ptr<const tollbooth::verification::pricing_oracle> oracle =
          nullptr,
      facilitator_options options = {}) {
    auto adapters = tollbooth::chain::adapter_set{};
    adapters.add(adapter);
    return std::make_unique<facilitator>(
        tollbooth::testing::open_storage(db.path), adapters, sink, options,
        std::move(oracle), clock.fn(), [](const uint64_t) {});
  }

  tollbooth::testing::scoped_path db{"tollbooth_facilitator"};
  tollbooth::testing::manual_clock clock;
  std::optional<tollbooth::crypto::ed25519_signer> payer;
  std::shared_ptr<tollbooth::testing::fake_adapter> adapter;
  std::shared_ptr<tollbooth::testing::recording_sink> sink;
  payment_requirement_t requirement;
  payment_authorization_t authorization;
};

}  // namespace

TEST_F(facilitator_test, verify_does_not_reserve) {
  auto service = make_facilitator();

  auto first = service->verify(authorization, requirement);
  EXPECT_TRUE(first.valid);
  EXPECT_EQ(first.payer, payer->public_key());
  auto second = service->verify(authorization, requirement);
  EXPECT_TRUE(second.valid);

  auto settled = service->settle(authorization, requirement);
  EXPECT_EQ(settled.error, error_code::none);
  EXPECT_EQ(settled.status, payment_status::submitted);

  auto after = service->verify(authorization, requirement);
  EXPECT_FALSE(after.valid);
  EXPECT_EQ(after.error, error_code::duplicate_authorization);
}

TEST_F(facilitator_test, verify_reports_failures) {
  auto service = make_facilitator();

  auto underpaid = tollbooth::testing::make_ed25519_authorization(
      *payer, requirement, 900, clock.now_seconds(), 2);
  auto result = service->verify(underpaid, requirement);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, error_code::insufficient_amount);
  EXPECT_FALSE(result.payer.has_value());

  auto mainnet = requirement;
  mainnet.network = *try_make_network("solana");
  auto elsewhere = tollbooth::testing::make_ed25519_authorization(
      *payer, mainnet, 1000, clock.now_seconds(), 3);
  EXPECT_EQ(service->verify(elsewhere, mainnet).error,
            error_code::unsupported_network);
}

TEST_F(facilitator_test, payment_lookup_by_id) {
  auto service = make_facilitator();
  auto result = service->settle(authorization, requirement);

  auto record = service->payment(result.payment_id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->status, payment_status::submitted);
  EXPECT_EQ(record->authorization, authorization);
  EXPECT_FALSE(service->payment(tollbooth::testing::make_hash(0xee)).has_value());
}

TEST_F(facilitator_test, supported_kinds_follow_adapters) {
  {
    auto service = make_facilitator();
    auto kinds = service->supported();
    ASSERT_EQ(kinds.size(), 4u);
    EXPECT_EQ(kinds[0].scheme, payment_scheme::exact);
    EXPECT_EQ(kinds[0].network.name, "solana-devnet");
    EXPECT_EQ(kinds[1].scheme, payment_scheme::upto);
  }

  auto priced = make_facilitator(std::make_shared<fixed_oracle>());
  EXPECT_EQ(priced->supported().size(), 6u);
}

TEST_F(facilitator_test, declare_then_lookup) {
  auto service = make_facilitator();
  EXPECT_TRUE(std::holds_alternative<payment_requirement_t>(
      service->declare(requirement)));

  auto other = requirement;
  other.network = devchain();
  EXPECT_TRUE(std::holds_alternative<payment_requirement_t>(
      service->declare(other)));

  EXPECT_EQ(service->lookup("/weather", "").size(), 2u);
  EXPECT_EQ(service->lookup("/weather", "devchain").size(), 1u);
  EXPECT_TRUE(service->lookup("/news", "").empty());

  auto conflicting = requirement;
  conflicting.max_amount_required = 5;
  EXPECT_TRUE(std::holds_alternative<failure>(service->declare(conflicting)));
}

TEST_F(facilitator_test, resolve_network_prefers_configured) {
  auto service = make_facilitator();
  EXPECT_EQ(service->resolve_network("devchain"), devchain());
  EXPECT_EQ(service->resolve_network("solana-devnet"),
            tollbooth::testing::devnet());
  EXPECT_EQ(service->resolve_network("base")->chain_id, 8453u);
  EXPECT_FALSE(service->resolve_network("dogechain").has_value());
}

TEST_F(facilitator_test, background_tasks_settle_payments) {
  auto options = facilitator_options{};
  options.poll_interval = 1ms;
  options.sweep_interval = 1ms;
  auto service = make_facilitator(nullptr, options);
  auto tasks = tollbooth::settlement::scheduler{};

  auto result = service->settle(authorization, requirement);
  ASSERT_TRUE(result.transaction_ref.has_value());
  adapter->set_status(*result.transaction_ref,
                      tollbooth::chain::tx_confirmed{.confirmations = 1});
  service->start(tasks);

  auto settled = false;
  for (auto i = 0; i < 400 && !settled; ++i) {
    std::this_thread::sleep_for(5ms);
    auto record = service->payment(result.payment_id);
    settled = record && record->status == payment_status::settled;
  }
  tasks.stop();
  EXPECT_TRUE(settled);
  EXPECT_EQ(sink->notifications().size(), 1u);
}

TEST_F(facilitator_test, recover_resumes_after_restart) {
  {
    auto service = make_facilitator();
    EXPECT_EQ(service->recover(), 0u);
  }
  auto record = payment_record_t{};
  record.id = key::make_payment_id(authorization);
  record.status = payment_status::reserved;
  record.requirement = requirement;
  record.authorization = authorization;
  record.deadline = clock.now() + 900'000;
  {
    // A reservation left behind by a process that died before submitting.
    auto storage = tollbooth::testing::open_storage(db.path);
    auto ledger = tollbooth::ledger::payment_ledger{storage};
    auto nonces = tollbooth::replay::nonce_store{storage};
    nonces.reserve(authorization.payer, authorization.network.name,
                   authorization.nonce, clock.now());
    ledger.record(record);
  }

  auto service = make_facilitator();
  EXPECT_EQ(service->recover(), 1u);
  EXPECT_EQ(service->payment(record.id)->status, payment_status::submitted);
}

TEST_F(facilitator_test, payments_by_party_newest_first) {
  auto service = make_facilitator();
  auto first = service->settle(authorization, requirement);
  clock.advance(1'000);
  auto later = tollbooth::testing::make_ed25519_authorization(
      *payer, requirement, 1000, clock.now_seconds(), 2);
  auto second = service->settle(later, requirement);

  auto paid = service->payments_by_payer(payer->public_key());
  ASSERT_EQ(paid.size(), 2u);
  EXPECT_EQ(paid[0].id, second.payment_id);
  EXPECT_EQ(paid[1].id, first.payment_id);
  EXPECT_EQ(service->payments_by_payer(payer->public_key(), 1).size(), 1u);

  auto received = service->payments_by_payee(requirement.pay_to);
  ASSERT_EQ(received.size(), 2u);
  EXPECT_EQ(received[0].id, second.payment_id);
  EXPECT_TRUE(
      service->payments_by_payee(tollbooth::testing::make_address(0x44, 32))
          .empty());
}

TEST_F(facilitator_test, declared_requirements_page_and_persist) {
  {
    auto service = make_facilitator();
    for (auto i = 0; i < 12; ++i) {
      auto declared = requirement;
      declared.resource = std::string{"/r"} + (i < 10 ? "0" : "") +
                          std::to_string(i);
      EXPECT_TRUE(std::holds_alternative<payment_requirement_t>(
          service->declare(std::move(declared))));
    }
  }

  auto service = make_facilitator();
  auto first = service->list_requirements(0);
  EXPECT_EQ(first.total, 12u);
  ASSERT_EQ(first.items.size(), 10u);
  EXPECT_EQ(first.items.front().resource, "/r00");
  auto rest = service->list_requirements(10);
  ASSERT_EQ(rest.items.size(), 2u);
  EXPECT_EQ(rest.items.back().resource, "/r11");
  EXPECT_EQ(service->lookup("/r03", "").size(), 1u);
}
