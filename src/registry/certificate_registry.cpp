#include <scrip/registry/certificate_registry.hpp>

#include <iterator>

namespace scrip::registry {

bool certificate_registry::upsert(
    const scrip::schema::certificate_id_t& certificate_id,
    const scrip::schema::amount_t& amount,
    const std::string& metadata,
    const std::vector<scrip::schema::address_t>& delegates) {
  auto [it, inserted] = certificates_.try_emplace(certificate_id);
  if (inserted) {
    it->second.amount = amount;
    it->second.metadata = metadata;
  }
  it->second.delegates.insert(std::begin(delegates), std::end(delegates));
  return inserted;
}

void certificate_registry::restore(
    const scrip::schema::certificate_state_t& state) {
  auto& restored = certificates_[state.certificate_id];
  restored.amount = state.amount;
  restored.metadata = state.metadata;
  restored.delegates = std::set<scrip::schema::address_t>{
      std::begin(state.delegates), std::end(state.delegates)};
}

bool certificate_registry::contains(
    const scrip::schema::certificate_id_t& certificate_id) const {
  return certificates_.contains(certificate_id);
}

std::optional<scrip::schema::certificate_state_t> certificate_registry::find(
    const scrip::schema::certificate_id_t& certificate_id) const {
  auto it = certificates_.find(certificate_id);
  if (it == std::end(certificates_)) {
    return std::nullopt;
  }
  return scrip::schema::certificate_state_t{
      .certificate_id = certificate_id,
      .amount = it->second.amount,
      .metadata = it->second.metadata,
      .delegates = std::vector<scrip::schema::address_t>{
          std::begin(it->second.delegates), std::end(it->second.delegates)}};
}

std::optional<scrip::schema::amount_t> certificate_registry::amount(
    const scrip::schema::certificate_id_t& certificate_id) const {
  auto it = certificates_.find(certificate_id);
  if (it == std::end(certificates_)) {
    return std::nullopt;
  }
  return it->second.amount;
}

std::optional<std::string> certificate_registry::metadata(
    const scrip::schema::certificate_id_t& certificate_id) const {
  auto it = certificates_.find(certificate_id);
  if (it == std::end(certificates_)) {
    return std::nullopt;
  }
  return it->second.metadata;
}

bool certificate_registry::is_delegate(
    const scrip::schema::certificate_id_t& certificate_id,
    const scrip::schema::address_t& identity) const {
  auto it = certificates_.find(certificate_id);
  return it != std::end(certificates_) &&
         it->second.delegates.contains(identity);
}

std::size_t certificate_registry::size() const {
  return certificates_.size();
}

}  // namespace scrip::registry
