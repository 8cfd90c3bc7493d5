#include <gtest/gtest.h>
#include <scrip/schema/error_code.hpp>
#include <scrip/schema/primitives.hpp>

#include <limits>
#include <string>

TEST(primitives, make_bytes_copies_string_contents) {
  auto bytes = scrip::schema::make_bytes(std::string_view{"K|1"});
  EXPECT_EQ(bytes, (scrip::schema::bytes_t{'K', '|', '1'}));
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = scrip::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length_and_bad_digits) {
  EXPECT_FALSE(scrip::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(scrip::schema::try_make_hash32(std::string(64, 'g')).has_value());
  EXPECT_FALSE(scrip::schema::try_make_hash32(std::string(63, 'a')).has_value());
}

TEST(primitives, address_hex_round_trips) {
  auto hex = std::string{"00112233445566778899aabbccddeeff01234567"};
  auto address = scrip::schema::try_make_address(hex);
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(scrip::schema::to_hex(*address), hex);
  EXPECT_EQ(scrip::schema::make_address("0x" + hex), *address);
  EXPECT_FALSE(scrip::schema::try_make_address(hex + "00").has_value());
}

TEST(primitives, to_hex_is_lowercase) {
  auto bytes = scrip::schema::bytes_t{0x00, 0xAB, 0xFF};
  EXPECT_EQ(scrip::schema::to_hex(scrip::schema::make_bytes_view(bytes)),
            "00abff");
}

TEST(primitives, try_from_hex_rejects_odd_length_and_bad_digits) {
  EXPECT_FALSE(scrip::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(scrip::schema::try_from_hex("zz").has_value());
  auto prefixed = scrip::schema::try_from_hex("0XaB");
  ASSERT_TRUE(prefixed.has_value());
  EXPECT_EQ(*prefixed, (scrip::schema::bytes_t{0xAB}));
  auto empty = scrip::schema::try_from_hex("");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->empty());
}

TEST(primitives, try_make_amount_parses_decimal_and_hex) {
  EXPECT_EQ(scrip::schema::try_make_amount("150"),
            scrip::schema::amount_t{150});
  EXPECT_EQ(scrip::schema::try_make_amount("0xff"),
            scrip::schema::amount_t{255});
  EXPECT_EQ(scrip::schema::try_make_amount("0"), scrip::schema::amount_t{0});
}

TEST(primitives, try_make_amount_accepts_uint256_max_and_rejects_overflow) {
  auto max = std::numeric_limits<scrip::schema::amount_t>::max();
  auto max_text = scrip::schema::to_string(max);
  EXPECT_EQ(scrip::schema::try_make_amount(max_text), max);
  EXPECT_FALSE(scrip::schema::try_make_amount("0x1" + std::string(64, '0'))
                   .has_value());
  EXPECT_FALSE(scrip::schema::try_make_amount(max_text + "0").has_value());
}

TEST(primitives, try_make_amount_rejects_malformed_text) {
  EXPECT_FALSE(scrip::schema::try_make_amount("").has_value());
  EXPECT_FALSE(scrip::schema::try_make_amount("-1").has_value());
  EXPECT_FALSE(scrip::schema::try_make_amount("12a").has_value());
  EXPECT_FALSE(scrip::schema::try_make_amount("0x").has_value());
}

TEST(primitives, error_code_names) {
  EXPECT_EQ(scrip::schema::to_string(scrip::schema::error_code::ok), "ok");
  EXPECT_EQ(scrip::schema::to_string(scrip::schema::error_code::already_claimed),
            "already_claimed");
  EXPECT_EQ(scrip::schema::to_string(scrip::schema::error_code::credit_failed),
            "credit_failed");
  EXPECT_EQ(scrip::schema::to_string(static_cast<scrip::schema::error_code>(99)),
            "unknown");
}
