#pragma once

#include <gtest/gtest.h>

#include <scrip/execution/engine.hpp>
#include <scrip/schema/encoding/scale/encoder.hpp>
#include <scrip/schema/primitives.hpp>
#include <scrip/storage/rocksdb/storage.hpp>
#include <scrip/testing/common.hpp>

#include <atomic>
#include <cstddef>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace scrip::testing {

using scale_encoder_t = scrip::schema::encoding::encoder<
    scrip::schema::encoding::scale_encoder_tag>;

inline constexpr uint8_t kAdminSeed = 0xA0;
inline constexpr uint8_t kServiceSeed = 0x5E;

inline scrip::execution::engine_options make_engine_options(
    const bool trust_condensed_amount = false) {
  return scrip::execution::engine_options{
      .service = make_address(kServiceSeed),
      .admin = make_address(kAdminSeed),
      .trust_condensed_amount = trust_condensed_amount};
}

/// Records credits in memory in place of the external ledger.
class credit_recorder final {
 public:
  scrip::execution::credit_fn_t capability() {
    return [this](const scrip::schema::address_t& holder,
                  const scrip::schema::amount_t& amount) {
      auto lock = std::scoped_lock{mutex_};
      ++calls_;
      if (refuse_) {
        return false;
      }
      balances_[holder] += amount;
      return true;
    };
  }

  void refuse(const bool value) {
    auto lock = std::scoped_lock{mutex_};
    refuse_ = value;
  }

  scrip::schema::amount_t balance(
      const scrip::schema::address_t& holder) const {
    auto lock = std::scoped_lock{mutex_};
    auto it = balances_.find(holder);
    return it == std::end(balances_) ? scrip::schema::amount_t{} : it->second;
  }

  std::size_t calls() const {
    auto lock = std::scoped_lock{mutex_};
    return calls_;
  }

 private:
  mutable std::mutex mutex_;
  std::map<scrip::schema::address_t, scrip::schema::amount_t> balances_;
  std::size_t calls_{};
  bool refuse_{false};
};

class engine_fixture final {
 public:
  explicit engine_fixture(const std::string_view db_prefix,
                          const bool trust_condensed_amount = false)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{scrip::storage::make_storage<
            scrip::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_,
                make_engine_options(trust_condensed_amount)} {
    engine_.set_credit(credits_.capability());
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() { remove_path(db_path_); }

  const std::string& db_path() const { return db_path_; }

  scale_encoder_t& encoder() { return encoder_; }

  scrip::storage::storage<scrip::storage::rocksdb_storage_tag>& storage() {
    return storage_;
  }

  scrip::execution::engine& engine() { return engine_; }
  credit_recorder& credits() { return credits_; }

  scrip::schema::address_t admin() const { return make_address(kAdminSeed); }
  scrip::schema::address_t service() const {
    return make_address(kServiceSeed);
  }

  /// Create a certificate type as admin and return its id. A failed create
  /// fails the test and aborts it by throwing.
  scrip::schema::certificate_id_t create(
      const scrip::schema::amount_t& amount,
      const std::vector<scrip::schema::address_t>& delegates,
      const std::string& metadata) {
    auto result =
        engine_.create_certificate_type(admin(), amount, delegates, metadata);
    EXPECT_TRUE(result.ok()) << result.log << ": " << result.info;
    EXPECT_TRUE(result.certificate_id.has_value());
    if (!result.ok() || !result.certificate_id) {
      throw std::runtime_error{"certificate type creation failed: " +
                               result.log};
    }
    return *result.certificate_id;
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  scrip::storage::storage<scrip::storage::rocksdb_storage_tag> storage_;
  credit_recorder credits_;
  scrip::execution::engine engine_;
};

}  // namespace scrip::testing
