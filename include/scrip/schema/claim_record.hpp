#pragma once
#include <scrip/schema/primitives.hpp>

// Schema type: claim record.
// One row per (certificate, holder) that has been redeemed.
namespace scrip::schema {

template <uint16_t Version>
struct claim_record;

template <>
struct claim_record<1> final {
  uint16_t version{1};
  certificate_id_t certificate_id{};
  address_t holder{};
};

using claim_record_t = claim_record<1>;

}  // namespace scrip::schema
