#include <scrip/ledger/claim_ledger.hpp>

namespace scrip::ledger {

bool claim_ledger::is_claimed(
    const scrip::schema::certificate_id_t& certificate_id,
    const scrip::schema::address_t& holder) const {
  return claims_.contains({certificate_id, holder});
}

std::optional<scrip::schema::certificate_id_t> claim_ledger::first_claimed(
    std::span<const scrip::schema::certificate_id_t> certificate_ids,
    const scrip::schema::address_t& holder) const {
  for (const auto& certificate_id : certificate_ids) {
    if (is_claimed(certificate_id, holder)) {
      return certificate_id;
    }
  }
  return std::nullopt;
}

bool claim_ledger::claim(const scrip::schema::certificate_id_t& certificate_id,
                         const scrip::schema::address_t& holder) {
  return claims_.emplace(certificate_id, holder).second;
}

bool claim_ledger::claim_all(
    std::span<const scrip::schema::certificate_id_t> certificate_ids,
    const scrip::schema::address_t& holder) {
  if (first_claimed(certificate_ids, holder).has_value()) {
    return false;
  }
  for (const auto& certificate_id : certificate_ids) {
    claims_.emplace(certificate_id, holder);
  }
  return true;
}

void claim_ledger::release(
    const scrip::schema::certificate_id_t& certificate_id,
    const scrip::schema::address_t& holder) {
  claims_.erase({certificate_id, holder});
}

void claim_ledger::restore(const scrip::schema::claim_record_t& record) {
  claims_.emplace(record.certificate_id, record.holder);
}

std::size_t claim_ledger::size() const {
  return claims_.size();
}

}  // namespace scrip::ledger
