#pragma once

#include <scrip/ledger/claim_ledger.hpp>
#include <scrip/registry/certificate_registry.hpp>
#include <scrip/registry/condenser_registry.hpp>
#include <scrip/schema/certificate_state.hpp>
#include <scrip/schema/encoding/scale/encoder.hpp>
#include <scrip/schema/error_code.hpp>
#include <scrip/schema/event.hpp>
#include <scrip/schema/operation_result.hpp>
#include <scrip/schema/primitives.hpp>
#include <scrip/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scrip::execution {

/// Runtime knobs supplied by the hosting executable.
struct engine_options final {
  /// Identity of this service; bound into every certificate id and
  /// redemption hash.
  scrip::schema::address_t service{};
  /// Address accepted by the default admin gate.
  scrip::schema::address_t admin{};
  /// Accept the signed combined amount of a condensed redemption without
  /// comparing it against the registered certificate amounts.
  bool trust_condensed_amount{false};
};

/// Returns true when `caller` may perform administrative operations.
using admin_gate_t =
    std::function<bool(const scrip::schema::address_t& caller)>;

/// External ledger credit. Returns false when the ledger refused; a refusal
/// must leave the ledger unchanged.
using credit_fn_t = std::function<bool(const scrip::schema::address_t& holder,
                                       const scrip::schema::amount_t& amount)>;

/// Certificate redemption state machine.
///
/// Owns the certificate registry, the condenser registry and the claim
/// ledger, persists them through RocksDB and reloads them at construction.
/// Every entry point takes the caller identity explicitly.
class engine final {
 public:
  explicit engine(
      scrip::schema::encoding::encoder<
          scrip::schema::encoding::scale_encoder_tag>& encoder,
      scrip::storage::storage<scrip::storage::rocksdb_storage_tag>& storage,
      engine_options options);

  /// Define (or extend the delegates of) a certificate type. Admin only.
  ///
  /// The id is derived from amount, delegates in the given order, metadata
  /// and the service identity, so identical parameters return the same id.
  scrip::schema::operation_result create_certificate_type(
      const scrip::schema::address_t& caller,
      const scrip::schema::amount_t& amount,
      const std::vector<scrip::schema::address_t>& delegates,
      const std::string& metadata);

  /// Trust `identity` for condensed redemptions. Admin only, idempotent.
  scrip::schema::operation_result add_condenser_delegate(
      const scrip::schema::address_t& caller,
      const scrip::schema::address_t& identity);

  /// Revoke condenser trust. Admin only, idempotent.
  scrip::schema::operation_result remove_condenser_delegate(
      const scrip::schema::address_t& caller,
      const scrip::schema::address_t& identity);

  /// Redeem one certificate for `caller` using a delegate signature over the
  /// redemption hash.
  ///
  /// The claim is committed to storage before the credit capability runs.
  /// The capability is called without the engine lock held; a refusal
  /// rolls the claim back and yields `credit_failed`. Anything else the
  /// capability throws is rethrown after the same rollback.
  scrip::schema::operation_result redeem(
      const scrip::schema::address_t& caller,
      const scrip::schema::bytes_view_t& signature,
      const scrip::schema::certificate_id_t& certificate_id);

  /// Redeem a batch of certificates with one condenser signature over the
  /// ordered id list, the combined amount and the caller. All-or-nothing.
  scrip::schema::operation_result redeem_condensed(
      const scrip::schema::address_t& caller,
      const scrip::schema::bytes_view_t& signature,
      const scrip::schema::amount_t& combined_amount,
      const std::vector<scrip::schema::certificate_id_t>& certificate_ids);

  std::optional<scrip::schema::certificate_state_t> certificate(
      const scrip::schema::certificate_id_t& certificate_id) const;
  std::optional<scrip::schema::amount_t> certificate_amount(
      const scrip::schema::certificate_id_t& certificate_id) const;
  std::optional<std::string> certificate_metadata(
      const scrip::schema::certificate_id_t& certificate_id) const;
  bool certificate_exists(
      const scrip::schema::certificate_id_t& certificate_id) const;
  bool is_delegate(const scrip::schema::certificate_id_t& certificate_id,
                   const scrip::schema::address_t& identity) const;
  bool is_claimed(const scrip::schema::certificate_id_t& certificate_id,
                  const scrip::schema::address_t& holder) const;
  bool is_condenser_delegate(const scrip::schema::address_t& identity) const;
  std::vector<scrip::schema::address_t> condenser_delegates() const;

  /// Return persisted events with sequence numbers in [from, to].
  std::vector<scrip::schema::event_t> events(uint64_t from, uint64_t to) const;

  const engine_options& options() const;

  /// Install the external ledger credit capability.
  void set_credit(credit_fn_t credit);

  /// Replace the default admin gate (caller == options.admin).
  void set_admin_gate(admin_gate_t admin_gate);

 private:
  scrip::schema::operation_result require_admin(
      const scrip::schema::address_t& caller,
      std::string_view codespace) const;

  /// Run the credit capability outside the lock, then either record the
  /// event or roll the claims back.
  scrip::schema::operation_result settle(
      std::unique_lock<std::mutex>& lock,
      const scrip::schema::address_t& holder,
      const scrip::schema::amount_t& amount,
      const std::vector<scrip::schema::certificate_id_t>& certificate_ids,
      std::string_view event_type,
      std::vector<scrip::schema::event_attribute_t> attributes,
      std::string_view codespace);

  /// Assign the next sequence number and stage the event and counter.
  scrip::schema::event_t stage_event(
      std::string_view type,
      std::vector<scrip::schema::event_attribute_t> attributes,
      scrip::storage::write_set& writes);

  /// Undo claims committed ahead of a credit that did not go through.
  void release_claims(
      const scrip::schema::address_t& holder,
      const std::vector<scrip::schema::certificate_id_t>& certificate_ids);

  void stage_claim(const scrip::schema::certificate_id_t& certificate_id,
                   const scrip::schema::address_t& holder,
                   scrip::storage::write_set& writes);

  void load_persisted_state();

  mutable std::mutex mutex_;
  scrip::schema::encoding::encoder<scrip::schema::encoding::scale_encoder_tag>&
      encoder_;
  scrip::storage::storage<scrip::storage::rocksdb_storage_tag>& storage_;
  engine_options options_;
  admin_gate_t admin_gate_;
  credit_fn_t credit_;
  scrip::registry::certificate_registry certificates_;
  scrip::registry::condenser_registry condensers_;
  scrip::ledger::claim_ledger claims_;
  uint64_t next_event_sequence_{1};
};

}  // namespace scrip::execution
