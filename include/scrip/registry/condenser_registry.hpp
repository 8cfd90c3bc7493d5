#pragma once

#include <scrip/schema/primitives.hpp>
#include <set>
#include <vector>

namespace scrip::registry {

/// Addresses trusted to co-sign condensed redemptions. Separate from every
/// per-certificate delegate set.
class condenser_registry final {
 public:
  /// Returns true when the set changed.
  bool add(const scrip::schema::address_t& identity);
  /// Returns true when the set changed.
  bool remove(const scrip::schema::address_t& identity);

  bool contains(const scrip::schema::address_t& identity) const;
  std::vector<scrip::schema::address_t> list() const;

 private:
  std::set<scrip::schema::address_t> delegates_;
};

}  // namespace scrip::registry
