#pragma once

#include <scrip/schema/claim_record.hpp>
#include <scrip/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <set>
#include <span>
#include <utility>

namespace scrip::ledger {

/// Claimed flags per (certificate id, holder). Entries exist only once set;
/// any id is accepted, registered or not.
class claim_ledger final {
 public:
  bool is_claimed(const scrip::schema::certificate_id_t& certificate_id,
                  const scrip::schema::address_t& holder) const;

  /// First id in `certificate_ids` already claimed by `holder`.
  std::optional<scrip::schema::certificate_id_t> first_claimed(
      std::span<const scrip::schema::certificate_id_t> certificate_ids,
      const scrip::schema::address_t& holder) const;

  /// Set the flag; false if it was already set.
  bool claim(const scrip::schema::certificate_id_t& certificate_id,
             const scrip::schema::address_t& holder);

  /// Set every flag or none. False (and no change) if any was already set.
  bool claim_all(
      std::span<const scrip::schema::certificate_id_t> certificate_ids,
      const scrip::schema::address_t& holder);

  /// Undo a claim whose redemption did not complete.
  void release(const scrip::schema::certificate_id_t& certificate_id,
               const scrip::schema::address_t& holder);

  void restore(const scrip::schema::claim_record_t& record);

  std::size_t size() const;

 private:
  std::set<std::pair<scrip::schema::certificate_id_t, scrip::schema::address_t>>
      claims_;
};

}  // namespace scrip::ledger
