#include <scrip/registry/condenser_registry.hpp>

#include <iterator>

namespace scrip::registry {

bool condenser_registry::add(const scrip::schema::address_t& identity) {
  return delegates_.insert(identity).second;
}

bool condenser_registry::remove(const scrip::schema::address_t& identity) {
  return delegates_.erase(identity) > 0;
}

bool condenser_registry::contains(
    const scrip::schema::address_t& identity) const {
  return delegates_.contains(identity);
}

std::vector<scrip::schema::address_t> condenser_registry::list() const {
  return {std::begin(delegates_), std::end(delegates_)};
}

}  // namespace scrip::registry
