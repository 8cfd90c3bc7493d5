#include <scrip/identity/hasher.hpp>
#include <scrip/schema/key/builder.hpp>

namespace scrip::identity {

scrip::schema::certificate_id_t compute_certificate_id(
    const scrip::schema::amount_t& amount,
    const scrip::schema::address_t& service,
    const std::vector<scrip::schema::address_t>& delegates,
    std::string_view metadata) {
  auto material = scrip::schema::key::builder{};
  material.write(kCertificateIdTag).write(amount).write(service);
  material.write(static_cast<uint32_t>(delegates.size()));
  for (const auto& delegate : delegates) {
    material.write(delegate);
  }
  material.write_sized(scrip::schema::make_bytes_view(metadata));
  return material.hash();
}

scrip::schema::hash32_t compute_redemption_hash(
    const scrip::schema::certificate_id_t& certificate_id,
    const scrip::schema::address_t& service,
    const scrip::schema::address_t& holder) {
  return scrip::schema::key::builder{}
      .write(kRedemptionTag)
      .write(certificate_id)
      .write(service)
      .write(holder)
      .hash();
}

scrip::schema::hash32_t compute_condensed_ids_hash(
    std::span<const scrip::schema::certificate_id_t> certificate_ids) {
  auto material = scrip::schema::key::builder{};
  material.data.reserve(kCondensedIdsTag.size() +
                        certificate_ids.size() * 32);
  material.write(kCondensedIdsTag);
  for (const auto& certificate_id : certificate_ids) {
    material.write(certificate_id);
  }
  return material.hash();
}

scrip::schema::hash32_t compute_condensed_redemption_hash(
    const scrip::schema::hash32_t& condensed_ids_hash,
    const scrip::schema::amount_t& combined_amount,
    const scrip::schema::address_t& holder,
    const scrip::schema::address_t& service) {
  return scrip::schema::key::builder{}
      .write(kCondensedRedemptionTag)
      .write(condensed_ids_hash)
      .write(combined_amount)
      .write(holder)
      .write(service)
      .hash();
}

}  // namespace scrip::identity
