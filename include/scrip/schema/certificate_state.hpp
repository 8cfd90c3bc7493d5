#pragma once
#include <scrip/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: certificate state.
// Persisted certificate type definition; the id is derived from amount,
// delegate list, metadata and service identity at creation time.
namespace scrip::schema {

template <uint16_t Version>
struct certificate_state;

template <>
struct certificate_state<1> final {
  uint16_t version{1};
  certificate_id_t certificate_id{};
  amount_t amount{};
  std::string metadata;
  std::vector<address_t> delegates;
};

using certificate_state_t = certificate_state<1>;

}  // namespace scrip::schema
