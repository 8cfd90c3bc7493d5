#include <gtest/gtest.h>
#include <scrip/crypto/signature.hpp>
#include <scrip/testing/common.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>

namespace {

using scrip::schema::error_code;
using scrip::testing::make_hash;
using scrip::testing::make_private_key;

// secp256k1 group order, big-endian.
constexpr auto kOrder = std::array<uint8_t, 32>{
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFE, 0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48,
    0xA0, 0x3B, 0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41};

// order - s over the 32-byte big-endian s field of the signature.
void negate_s(scrip::schema::recoverable_signature_t& signature) {
  auto borrow = 0;
  for (auto i = 31; i >= 0; --i) {
    auto value = static_cast<int>(kOrder[static_cast<std::size_t>(i)]) -
                 static_cast<int>(signature[32 + static_cast<std::size_t>(i)]) -
                 borrow;
    borrow = value < 0 ? 1 : 0;
    signature[32 + static_cast<std::size_t>(i)] =
        static_cast<uint8_t>(value + (borrow * 256));
  }
}

std::optional<scrip::schema::address_t> recover(
    const scrip::schema::hash32_t& hash,
    const scrip::schema::recoverable_signature_t& signature,
    error_code& error) {
  return scrip::crypto::recover_signer(
      hash, scrip::schema::bytes_view_t{signature.data(), signature.size()},
      error);
}

}  // namespace

TEST(signature, sign_then_recover_yields_signer_address) {
  if (!scrip::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto key = make_private_key(1);
  auto hash = make_hash(0x42);
  auto signature = scrip::crypto::sign(key, hash);
  ASSERT_TRUE(signature.has_value());

  auto error = error_code::signature_recovery_failed;
  auto signer = recover(hash, *signature, error);
  ASSERT_TRUE(signer.has_value());
  EXPECT_EQ(error, error_code::ok);
  EXPECT_EQ(*signer, scrip::crypto::derive_address(key));
}

TEST(signature, sign_emits_low_s_with_ethereum_style_v) {
  if (!scrip::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  for (uint8_t seed = 1; seed < 8; ++seed) {
    auto signature = scrip::crypto::sign(make_private_key(seed), make_hash(seed));
    ASSERT_TRUE(signature.has_value());
    EXPECT_TRUE((*signature)[64] == 27 || (*signature)[64] == 28);
    // High bit of s is clear for every s <= order / 2.
    EXPECT_LT((*signature)[32], 0x80);
  }
}

TEST(signature, raw_recovery_id_is_accepted) {
  if (!scrip::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto key = make_private_key(2);
  auto hash = make_hash(0x10);
  auto signature = scrip::crypto::sign(key, hash);
  ASSERT_TRUE(signature.has_value());
  (*signature)[64] = static_cast<uint8_t>((*signature)[64] - 27);

  auto error = error_code::ok;
  EXPECT_EQ(recover(hash, *signature, error), scrip::crypto::derive_address(key));
}

TEST(signature, recovery_binds_the_message) {
  if (!scrip::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto key = make_private_key(3);
  auto signature = scrip::crypto::sign(key, make_hash(1));
  ASSERT_TRUE(signature.has_value());

  auto error = error_code::ok;
  auto other = recover(make_hash(2), *signature, error);
  if (other.has_value()) {
    EXPECT_NE(*other, scrip::crypto::derive_address(key));
  } else {
    EXPECT_EQ(error, error_code::signature_recovery_failed);
  }
}

TEST(signature, prefixed_digest_is_what_gets_signed) {
  if (!scrip::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto key = make_private_key(4);
  auto hash = make_hash(7);
  auto signature = scrip::crypto::sign(key, hash);
  ASSERT_TRUE(signature.has_value());

  EXPECT_EQ(scrip::crypto::recover_public_key(
                scrip::crypto::to_signed_message_hash(hash), *signature),
            scrip::crypto::derive_public_key(key));
  EXPECT_NE(scrip::crypto::to_signed_message_hash(hash), hash);
}

TEST(signature, wrong_length_is_invalid_format) {
  auto bytes = scrip::schema::bytes_t(64, 1);
  auto error = error_code::ok;
  EXPECT_FALSE(scrip::crypto::recover_signer(
                   make_hash(1), scrip::schema::make_bytes_view(bytes), error)
                   .has_value());
  EXPECT_EQ(error, error_code::invalid_signature_format);
}

TEST(signature, unknown_recovery_byte_is_invalid_format) {
  if (!scrip::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto signature = scrip::crypto::sign(make_private_key(5), make_hash(1));
  ASSERT_TRUE(signature.has_value());
  for (const uint8_t v : {2, 26, 29, 255}) {
    (*signature)[64] = v;
    auto error = error_code::ok;
    EXPECT_FALSE(recover(make_hash(1), *signature, error).has_value());
    EXPECT_EQ(error, error_code::invalid_signature_format);
  }
}

TEST(signature, zero_or_out_of_range_scalars_are_invalid_format) {
  if (!scrip::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto signature = scrip::schema::recoverable_signature_t{};
  signature[40] = 1;
  signature[64] = 27;
  auto error = error_code::ok;
  EXPECT_FALSE(recover(make_hash(1), signature, error).has_value());
  EXPECT_EQ(error, error_code::invalid_signature_format);

  std::copy(std::begin(kOrder), std::end(kOrder), std::begin(signature));
  error = error_code::ok;
  EXPECT_FALSE(recover(make_hash(1), signature, error).has_value());
  EXPECT_EQ(error, error_code::invalid_signature_format);
}

TEST(signature, high_s_is_rejected_as_malleable) {
  if (!scrip::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto hash = make_hash(9);
  auto signature = scrip::crypto::sign(make_private_key(6), hash);
  ASSERT_TRUE(signature.has_value());
  negate_s(*signature);
  (*signature)[64] = (*signature)[64] == 27 ? 28 : 27;

  auto error = error_code::ok;
  EXPECT_FALSE(recover(hash, *signature, error).has_value());
  EXPECT_EQ(error, error_code::invalid_signature_format);
}

TEST(signature, r_without_curve_point_fails_recovery) {
  if (!scrip::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  // Roughly half of all x coordinates have no point on the curve.
  auto failures = 0;
  for (uint8_t x = 1; x < 32; ++x) {
    auto signature = scrip::schema::recoverable_signature_t{};
    signature[31] = x;
    signature[63] = 1;
    signature[64] = 27;
    auto error = error_code::ok;
    auto signer = recover(make_hash(1), signature, error);
    if (!signer.has_value()) {
      EXPECT_EQ(error, error_code::signature_recovery_failed);
      ++failures;
    }
  }
  EXPECT_GT(failures, 0);
}

TEST(signature, derive_address_rejects_zero_key) {
  EXPECT_FALSE(
      scrip::crypto::derive_address(scrip::schema::private_key_t{}).has_value());
}

TEST(signature, generate_private_key_yields_usable_keys) {
  if (!scrip::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto first = scrip::crypto::generate_private_key();
  auto second = scrip::crypto::generate_private_key();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_NE(*first, *second);
  EXPECT_TRUE(scrip::crypto::derive_address(*first).has_value());
}
