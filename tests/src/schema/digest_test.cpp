#include <gtest/gtest.h>
#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/primitives.hpp>
#include <zkreceipt/testing/common.hpp>

#include <string_view>
#include <unordered_set>

TEST(digest, zero_is_default) {
  auto zero = zkreceipt::schema::digest_t::zero();
  EXPECT_EQ(zero, zkreceipt::schema::digest_t{});
  for (auto byte : zero.bytes()) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(digest, hex_round_trips) {
  auto digest = zkreceipt::testing::make_digest(0);
  EXPECT_EQ(digest.to_hex(),
            "000102030405060708090a0b0c0d0e0f"
            "101112131415161718191a1b1c1d1e1f");
  EXPECT_EQ(zkreceipt::schema::digest_t::try_from_hex(digest.to_hex()),
            digest);
  EXPECT_EQ(zkreceipt::schema::digest_t::try_from_hex("0x" + digest.to_hex()),
            digest);
}

TEST(digest, try_from_hex_rejects_bad_input) {
  EXPECT_FALSE(zkreceipt::schema::digest_t::try_from_hex("zz").has_value());
  EXPECT_FALSE(zkreceipt::schema::digest_t::try_from_hex("0102").has_value());
  EXPECT_FALSE(zkreceipt::schema::digest_t::try_from_hex("abc").has_value());
}

TEST(digest, try_from_bytes_requires_32_bytes) {
  auto short_bytes = zkreceipt::schema::bytes_t(31, 0x01);
  EXPECT_FALSE(
      zkreceipt::schema::digest_t::try_from_bytes(short_bytes).has_value());
  auto exact = zkreceipt::schema::bytes_t(32, 0x01);
  auto digest = zkreceipt::schema::digest_t::try_from_bytes(exact);
  ASSERT_TRUE(digest.has_value());
  EXPECT_EQ(digest->bytes()[31], 0x01);
}

TEST(digest, be_words_are_laid_out_big_endian) {
  auto digest =
      zkreceipt::schema::digest_t::from_be_words({0x01020304, 0, 0, 0, 0, 0,
                                                  0, 0x0a0b0c0d});
  auto bytes = digest.bytes();
  EXPECT_EQ(bytes[0], 0x01);
  EXPECT_EQ(bytes[3], 0x04);
  EXPECT_EQ(bytes[28], 0x0a);
  EXPECT_EQ(bytes[31], 0x0d);
}

TEST(digest, ordering_is_bytewise) {
  auto low = zkreceipt::schema::digest_bytes_t{};
  auto high = zkreceipt::schema::digest_bytes_t{};
  low[1] = 0xFF;
  high[0] = 0x01;
  EXPECT_LT(zkreceipt::schema::digest_t::from_bytes(low),
            zkreceipt::schema::digest_t::from_bytes(high));
  EXPECT_LT(zkreceipt::testing::make_digest(0),
            zkreceipt::testing::make_digest(1));
}

TEST(digest, usable_as_hash_key) {
  auto seen = std::unordered_set<zkreceipt::schema::digest_t>{};
  seen.insert(zkreceipt::testing::make_digest(0));
  seen.insert(zkreceipt::testing::make_digest(0));
  seen.insert(zkreceipt::testing::make_digest(1));
  EXPECT_EQ(seen.size(), 2u);
}

TEST(primitives, le_bytes_of_words) {
  auto words = zkreceipt::schema::words_t{0x04030201, 0x08070605};
  EXPECT_EQ(zkreceipt::schema::make_le_bytes(words),
            (zkreceipt::schema::bytes_t{1, 2, 3, 4, 5, 6, 7, 8}));
}

TEST(primitives, hex_helpers) {
  auto bytes = zkreceipt::schema::bytes_t{0x00, 0xAB, 0x10};
  EXPECT_EQ(zkreceipt::schema::to_hex(bytes), "00ab10");
  EXPECT_EQ(zkreceipt::schema::try_from_hex("0x00AB10"), bytes);
  EXPECT_FALSE(zkreceipt::schema::try_from_hex("0g").has_value());
}
