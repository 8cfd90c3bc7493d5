#include <gtest/gtest.h>
#include <scrip/blake3/hash.hpp>
#include <scrip/identity/hasher.hpp>
#include <scrip/testing/common.hpp>

#include <set>
#include <string>
#include <vector>

namespace {

using scrip::testing::make_address;
using scrip::testing::make_hash;

}  // namespace

TEST(identity_hasher, certificate_id_is_deterministic) {
  auto delegates = std::vector{make_address(1), make_address(2)};
  auto first = scrip::identity::compute_certificate_id(
      100, make_address(9), delegates, "ipfs://x");
  auto second = scrip::identity::compute_certificate_id(
      100, make_address(9), delegates, "ipfs://x");
  EXPECT_EQ(first, second);
}

TEST(identity_hasher, certificate_id_binds_every_parameter) {
  auto service = make_address(9);
  auto delegates = std::vector{make_address(1), make_address(2)};
  auto reversed = std::vector{make_address(2), make_address(1)};

  auto ids = std::set<scrip::schema::certificate_id_t>{
      scrip::identity::compute_certificate_id(100, service, delegates, "m"),
      scrip::identity::compute_certificate_id(101, service, delegates, "m"),
      scrip::identity::compute_certificate_id(100, make_address(8), delegates,
                                              "m"),
      scrip::identity::compute_certificate_id(100, service, reversed, "m"),
      scrip::identity::compute_certificate_id(100, service, delegates, "n"),
      scrip::identity::compute_certificate_id(100, service, {}, "m"),
  };
  EXPECT_EQ(ids.size(), 6u);
}

TEST(identity_hasher, certificate_id_matches_documented_layout) {
  auto service = make_address(9);
  auto delegate = make_address(1);
  auto metadata = std::string{"ipfs://x"};

  auto material = scrip::schema::bytes_t{};
  auto append = [&](const auto& bytes) {
    material.insert(std::end(material), std::begin(bytes), std::end(bytes));
  };
  append(scrip::identity::kCertificateIdTag);
  auto amount = scrip::schema::bytes_t(32, 0);
  amount[0] = 100;
  append(amount);
  append(service);
  append(scrip::schema::bytes_t{1, 0, 0, 0});
  append(delegate);
  append(scrip::schema::bytes_t{static_cast<uint8_t>(metadata.size()), 0, 0, 0});
  append(metadata);

  auto expected = scrip::blake3::hash(scrip::schema::make_bytes_view(material));
  EXPECT_EQ(scrip::identity::compute_certificate_id(100, service, {delegate},
                                                    metadata),
            expected);
}

TEST(identity_hasher, metadata_length_prevents_field_resplitting) {
  auto service = make_address(9);
  auto a = scrip::identity::compute_certificate_id(1, service, {}, "ab");
  auto b = scrip::identity::compute_certificate_id(1, service, {}, "a");
  EXPECT_NE(a, b);
}

TEST(identity_hasher, redemption_hash_binds_certificate_service_and_holder) {
  auto id = make_hash(1);
  auto base = scrip::identity::compute_redemption_hash(id, make_address(9),
                                                       make_address(3));
  EXPECT_NE(base, scrip::identity::compute_redemption_hash(
                      make_hash(2), make_address(9), make_address(3)));
  EXPECT_NE(base, scrip::identity::compute_redemption_hash(
                      id, make_address(8), make_address(3)));
  EXPECT_NE(base, scrip::identity::compute_redemption_hash(
                      id, make_address(9), make_address(4)));
}

TEST(identity_hasher, condensed_ids_hash_is_order_sensitive) {
  auto forward = std::vector{make_hash(1), make_hash(2)};
  auto backward = std::vector{make_hash(2), make_hash(1)};
  EXPECT_NE(scrip::identity::compute_condensed_ids_hash(forward),
            scrip::identity::compute_condensed_ids_hash(backward));
  EXPECT_EQ(scrip::identity::compute_condensed_ids_hash(forward),
            scrip::identity::compute_condensed_ids_hash(
                std::vector{make_hash(1), make_hash(2)}));
}

TEST(identity_hasher, condensed_redemption_hash_binds_amount) {
  auto ids_hash = scrip::identity::compute_condensed_ids_hash(
      std::vector{make_hash(1), make_hash(2)});
  auto signed_150 = scrip::identity::compute_condensed_redemption_hash(
      ids_hash, 150, make_address(3), make_address(9));
  auto signed_151 = scrip::identity::compute_condensed_redemption_hash(
      ids_hash, 151, make_address(3), make_address(9));
  EXPECT_NE(signed_150, signed_151);
}

TEST(identity_hasher, purposes_never_collide) {
  // A single id batch must not reproduce the single-redemption digest.
  auto id = make_hash(1);
  auto single = scrip::identity::compute_redemption_hash(id, make_address(9),
                                                         make_address(3));
  auto ids = std::vector{id};
  EXPECT_NE(single, scrip::identity::compute_condensed_ids_hash(ids));
}
