#include <gtest/gtest.h>
#include <tollbooth/schema/network.hpp>

using namespace tollbooth::schema;

TEST(schema_network, known_networks_resolve) {
  auto base = try_make_network("base-sepolia");
  ASSERT_TRUE(base.has_value());
  EXPECT_EQ(base->family, chain_family::evm);
  EXPECT_EQ(base->chain_id, 84532u);

  auto solana = find_known_network("solana");
  ASSERT_TRUE(solana.has_value());
  EXPECT_EQ(solana->family, chain_family::ed25519);
  EXPECT_EQ(solana->confirmations, 32u);

  EXPECT_FALSE(try_make_network("dogecoin").has_value());
}

TEST(schema_network, evm_addresses_are_20_bytes_of_prefixed_hex) {
  auto address = try_parse_address(
      chain_family::evm, "0x209693Bc6afc0C5328bA36FaF03C514EF312287C");
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(address->size(), 20u);
  EXPECT_EQ(format_address(chain_family::evm, *address),
            "0x209693bc6afc0c5328ba36faf03c514ef312287c");

  EXPECT_FALSE(try_parse_address(chain_family::evm,
                                 "209693Bc6afc0C5328bA36FaF03C514EF312287C")
                   .has_value());
  EXPECT_FALSE(
      try_parse_address(chain_family::evm, "0x209693Bc6afc0C5328bA36FaF03C514E")
          .has_value());
}

TEST(schema_network, ed25519_addresses_are_32_byte_base58_keys) {
  auto key = bytes_t(32, 0x11);
  auto text = format_address(chain_family::ed25519, key);
  auto parsed = try_parse_address(chain_family::ed25519, text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, key);

  EXPECT_FALSE(
      try_parse_address(chain_family::ed25519, to_base58(bytes_t(20, 0x11)))
          .has_value());
  EXPECT_TRUE(is_well_formed_address(chain_family::ed25519, key));
  EXPECT_FALSE(is_well_formed_address(chain_family::evm, key));
}

TEST(schema_network, family_strings_round_trip) {
  EXPECT_EQ(to_string(chain_family::ed25519), "ed25519");
  EXPECT_EQ(try_from_string<chain_family>("evm"), chain_family::evm);
  EXPECT_FALSE(try_from_string<chain_family>("utxo").has_value());
}
