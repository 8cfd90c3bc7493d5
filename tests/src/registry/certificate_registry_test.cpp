#include <gtest/gtest.h>
#include <scrip/registry/certificate_registry.hpp>
#include <scrip/testing/common.hpp>

#include <vector>

namespace {

using scrip::testing::make_address;
using scrip::testing::make_hash;

}  // namespace

TEST(certificate_registry, unknown_ids_read_as_absent) {
  auto registry = scrip::registry::certificate_registry{};
  EXPECT_FALSE(registry.contains(make_hash(1)));
  EXPECT_FALSE(registry.find(make_hash(1)).has_value());
  EXPECT_FALSE(registry.amount(make_hash(1)).has_value());
  EXPECT_FALSE(registry.metadata(make_hash(1)).has_value());
  EXPECT_FALSE(registry.is_delegate(make_hash(1), make_address(1)));
}

TEST(certificate_registry, upsert_stores_definition_once) {
  auto registry = scrip::registry::certificate_registry{};
  EXPECT_TRUE(registry.upsert(make_hash(1), 100, "ipfs://x", {make_address(1)}));
  EXPECT_FALSE(registry.upsert(make_hash(1), 999, "other", {make_address(2)}));

  EXPECT_EQ(registry.amount(make_hash(1)), scrip::schema::amount_t{100});
  EXPECT_EQ(registry.metadata(make_hash(1)).value_or(""), "ipfs://x");
  EXPECT_TRUE(registry.is_delegate(make_hash(1), make_address(1)));
  EXPECT_TRUE(registry.is_delegate(make_hash(1), make_address(2)));
  EXPECT_EQ(registry.size(), 1u);
}

TEST(certificate_registry, delegate_sets_are_per_certificate) {
  auto registry = scrip::registry::certificate_registry{};
  registry.upsert(make_hash(1), 100, "", {make_address(1)});
  registry.upsert(make_hash(2), 50, "", {make_address(2)});
  EXPECT_FALSE(registry.is_delegate(make_hash(1), make_address(2)));
  EXPECT_FALSE(registry.is_delegate(make_hash(2), make_address(1)));
}

TEST(certificate_registry, duplicate_delegates_collapse) {
  auto registry = scrip::registry::certificate_registry{};
  registry.upsert(make_hash(1), 1, "", {make_address(1), make_address(1)});
  auto state = registry.find(make_hash(1));
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->delegates.size(), 1u);
  EXPECT_EQ(state->certificate_id, make_hash(1));
}

TEST(certificate_registry, restore_loads_persisted_state) {
  auto registry = scrip::registry::certificate_registry{};
  registry.restore(scrip::schema::certificate_state_t{
      .certificate_id = make_hash(3),
      .amount = 7,
      .metadata = "m",
      .delegates = {make_address(4), make_address(5)}});
  EXPECT_EQ(registry.amount(make_hash(3)), scrip::schema::amount_t{7});
  EXPECT_TRUE(registry.is_delegate(make_hash(3), make_address(5)));
}
