#include <gtest/gtest.h>
#include <tollbooth/replay/nonce_store.hpp>
#include <tollbooth/testing/common.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace tollbooth::schema;
using tollbooth::replay::nonce_store;
using tollbooth::replay::reservation_result;

TEST(nonce_store, reserve_is_write_once) {
  auto db = tollbooth::testing::scoped_path{"tollbooth_nonce_once"};
  auto store = nonce_store{tollbooth::testing::open_storage(db.path)};
  auto payer = tollbooth::testing::make_address(0x10, 32);
  auto nonce = tollbooth::testing::make_hash(1);

  EXPECT_FALSE(store.reserved(payer, "solana-devnet", nonce));
  EXPECT_EQ(store.reserve(payer, "solana-devnet", nonce, 1000),
            reservation_result::reserved);
  EXPECT_EQ(store.reserve(payer, "solana-devnet", nonce, 2000),
            reservation_result::already_reserved);
  EXPECT_TRUE(store.reserved(payer, "solana-devnet", nonce));

  auto record = store.find(payer, "solana-devnet", nonce);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->payer, payer);
  EXPECT_EQ(record->network, "solana-devnet");
  EXPECT_EQ(record->nonce, nonce);
  EXPECT_EQ(record->reserved_at, 1000u);
}

TEST(nonce_store, scope_is_payer_and_network) {
  auto db = tollbooth::testing::scoped_path{"tollbooth_nonce_scope"};
  auto store = nonce_store{tollbooth::testing::open_storage(db.path)};
  auto payer = tollbooth::testing::make_address(0x10, 32);
  auto other_payer = tollbooth::testing::make_address(0x11, 32);
  auto nonce = tollbooth::testing::make_hash(1);

  EXPECT_EQ(store.reserve(payer, "solana-devnet", nonce, 1),
            reservation_result::reserved);
  EXPECT_EQ(store.reserve(payer, "solana", nonce, 1),
            reservation_result::reserved);
  EXPECT_EQ(store.reserve(other_payer, "solana-devnet", nonce, 1),
            reservation_result::reserved);
  EXPECT_EQ(store.reserve(payer, "solana-devnet",
                          tollbooth::testing::make_hash(2), 1),
            reservation_result::reserved);
}

TEST(nonce_store, concurrent_reservations_have_one_winner) {
  auto db = tollbooth::testing::scoped_path{"tollbooth_nonce_race"};
  auto store = nonce_store{tollbooth::testing::open_storage(db.path)};
  auto payer = tollbooth::testing::make_address(0x10, 20);
  auto nonce = tollbooth::testing::make_hash(9);

  auto winners = std::atomic<int>{0};
  auto threads = std::vector<std::thread>{};
  for (auto i = 0; i < 16; ++i) {
    threads.emplace_back([&] {
      if (store.reserve(payer, "base", nonce, 1) ==
          reservation_result::reserved) {
        ++winners;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(winners.load(), 1);
}

TEST(nonce_store, expire_releases_reservation) {
  auto db = tollbooth::testing::scoped_path{"tollbooth_nonce_expire"};
  auto store = nonce_store{tollbooth::testing::open_storage(db.path)};
  auto payer = tollbooth::testing::make_address(0x10, 32);
  auto nonce = tollbooth::testing::make_hash(1);

  ASSERT_EQ(store.reserve(payer, "solana", nonce, 1),
            reservation_result::reserved);
  store.expire(payer, "solana", nonce);
  EXPECT_FALSE(store.reserved(payer, "solana", nonce));
  EXPECT_EQ(store.reserve(payer, "solana", nonce, 2),
            reservation_result::reserved);

  // Expiring something never reserved is harmless.
  store.expire(payer, "solana", tollbooth::testing::make_hash(2));
}

TEST(nonce_store, reservations_survive_reopen) {
  auto db = tollbooth::testing::scoped_path{"tollbooth_nonce_reopen"};
  auto payer = tollbooth::testing::make_address(0x10, 32);
  auto nonce = tollbooth::testing::make_hash(1);
  {
    auto store = nonce_store{tollbooth::testing::open_storage(db.path)};
    ASSERT_EQ(store.reserve(payer, "solana", nonce, 1),
              reservation_result::reserved);
  }
  auto store = nonce_store{tollbooth::testing::open_storage(db.path)};
  EXPECT_TRUE(store.reserved(payer, "solana", nonce));
  EXPECT_EQ(store.reserve(payer, "solana", nonce, 2),
            reservation_result::already_reserved);
}

TEST(nonce_store, reserved_before_filters_by_time) {
  auto db = tollbooth::testing::scoped_path{"tollbooth_nonce_before"};
  auto store = nonce_store{tollbooth::testing::open_storage(db.path)};
  auto payer = tollbooth::testing::make_address(0x10, 32);

  store.reserve(payer, "solana", tollbooth::testing::make_hash(1), 100);
  store.reserve(payer, "solana", tollbooth::testing::make_hash(2), 200);
  store.reserve(payer, "solana", tollbooth::testing::make_hash(3), 300);

  auto stale = store.reserved_before(200);
  ASSERT_EQ(stale.size(), 1u);
  EXPECT_EQ(stale.front().nonce, tollbooth::testing::make_hash(1));
  EXPECT_EQ(store.reserved_before(301).size(), 3u);
  EXPECT_TRUE(store.reserved_before(100).empty());
}

TEST(nonce_store, release_entries_apply_in_batch) {
  auto db = tollbooth::testing::scoped_path{"tollbooth_nonce_batch"};
  auto storage = tollbooth::testing::open_storage(db.path);
  auto store = nonce_store{storage};
  auto payer = tollbooth::testing::make_address(0x10, 32);
  auto nonce = tollbooth::testing::make_hash(1);

  ASSERT_EQ(store.reserve(payer, "solana", nonce, 1),
            reservation_result::reserved);
  storage->apply(store.release_entries(payer, "solana", nonce));
  EXPECT_FALSE(store.reserved(payer, "solana", nonce));
  EXPECT_TRUE(store.reserved_before(2).empty());
}

TEST(nonce_store, unindexed_reservation_stays_consumed) {
  auto db = tollbooth::testing::scoped_path{"tollbooth_nonce_unindex"};
  auto store = nonce_store{tollbooth::testing::open_storage(db.path)};
  auto payer = tollbooth::testing::make_address(0x10, 32);

  for (uint8_t seed = 1; seed <= 50; ++seed) {
    store.reserve(payer, "solana", tollbooth::testing::make_hash(seed), seed);
  }
  for (uint8_t seed = 1; seed <= 49; ++seed) {
    store.unindex(payer, "solana", tollbooth::testing::make_hash(seed));
  }

  auto waiting = store.reserved_before(1000);
  ASSERT_EQ(waiting.size(), 1u);
  EXPECT_EQ(waiting.front().nonce, tollbooth::testing::make_hash(50));
  EXPECT_TRUE(store.reserved(payer, "solana", tollbooth::testing::make_hash(1)));
  EXPECT_EQ(store.reserve(payer, "solana", tollbooth::testing::make_hash(1), 99),
            reservation_result::already_reserved);
  EXPECT_EQ(store.reserved_before(1000).size(), 1u);
}

TEST(nonce_store, reserved_before_orders_across_byte_boundaries) {
  auto db = tollbooth::testing::scoped_path{"tollbooth_nonce_order"};
  auto store = nonce_store{tollbooth::testing::open_storage(db.path)};
  auto payer = tollbooth::testing::make_address(0x10, 32);

  store.reserve(payer, "solana", tollbooth::testing::make_hash(1), 0x1'00);
  store.reserve(payer, "solana", tollbooth::testing::make_hash(2), 0xff);
  store.reserve(payer, "solana", tollbooth::testing::make_hash(3), 0x1'00'00);

  auto stale = store.reserved_before(0x1'01);
  ASSERT_EQ(stale.size(), 2u);
  EXPECT_EQ(stale[0].reserved_at, 0xffu);
  EXPECT_EQ(stale[1].reserved_at, 0x100u);
}
